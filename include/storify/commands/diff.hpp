#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace storify {

struct DiffLine {
    char op;            // ' ' context, '-' removed, '+' added
    std::string text;
    bool missing_newline = false;   // last line of a text without a final '\n'
};

struct DiffHunk {
    size_t old_start = 0;   // 0-based index of the first old line covered
    size_t old_count = 0;
    size_t new_start = 0;
    size_t new_count = 0;
    std::vector<DiffLine> lines;
};

struct DiffText {
    std::vector<std::string> lines;
    bool final_newline = true;      // false when the last line has no '\n'
};

// Split on '\n'; a trailing newline does not produce an empty last line
DiffText split_lines(std::string_view text);

// Line alignment by longest common subsequence, grouped into unified-diff
// hunks with `context` lines around each change. With `ignore_trailing_ws`
// lines compare after trailing whitespace is stripped. A last line without a
// final newline never equals one with it.
// Throws StorageError(SizeLimitExceeded) when the differing region is too
// large for the in-memory alignment table.
std::vector<DiffHunk> compute_hunks(const DiffText& left, const DiffText& right,
                                    size_t context, bool ignore_trailing_ws);

// "--- left", "+++ right" headers then each "@@ -a,b +c,d @@" hunk, with
// "\ No newline at end of file" after a line that lacks one.
// Writes nothing when there are no hunks.
void write_unified_diff(std::ostream& out, const std::string& left_label,
                        const std::string& right_label,
                        const std::vector<DiffHunk>& hunks);

} // namespace storify
