#include "storify/commands/diff.hpp"
#include "storify/commands/text.hpp"
#include "storify/core/error.hpp"

#include <algorithm>
#include <cstdint>

namespace storify {

namespace {

// Upper bound on LCS table cells (4 bytes each)
constexpr uint64_t MAX_ALIGNMENT_CELLS = 64ULL * 1024 * 1024;

struct Op {
    char kind;
    size_t left;   // index into left (valid for ' ' and '-')
    size_t right;  // index into right (valid for ' ' and '+')
};

// Comparison keys. The '\n' marker keeps a last line without a final newline
// apart from every line that has one.
std::vector<std::string> comparison_keys(const DiffText& text, bool ignore_trailing_ws) {
    std::vector<std::string> keys;
    keys.reserve(text.lines.size());
    for (const auto& l : text.lines) keys.push_back(ignore_trailing_ws ? rtrim(l) : l);
    if (!text.final_newline && !keys.empty()) keys.back() += '\n';
    return keys;
}

bool lacks_newline(const DiffText& text, size_t index) {
    return !text.final_newline && index + 1 == text.lines.size();
}

std::string range_text(size_t start, size_t count) {
    if (count == 0) return std::to_string(start) + ",0";
    if (count == 1) return std::to_string(start + 1);
    return std::to_string(start + 1) + "," + std::to_string(count);
}

} // namespace

DiffText split_lines(std::string_view text) {
    DiffText out;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) {
            out.lines.emplace_back(text.substr(pos));
            out.final_newline = false;
            break;
        }
        out.lines.emplace_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return out;
}

std::vector<DiffHunk> compute_hunks(const DiffText& left, const DiffText& right,
                                    size_t context, bool ignore_trailing_ws) {
    std::vector<std::string> lk = comparison_keys(left, ignore_trailing_ws);
    std::vector<std::string> rk = comparison_keys(right, ignore_trailing_ws);
    const std::vector<std::string>* a = &lk;
    const std::vector<std::string>* b = &rk;

    size_t prefix = 0;
    while (prefix < a->size() && prefix < b->size() && (*a)[prefix] == (*b)[prefix]) ++prefix;
    size_t suffix = 0;
    while (suffix < a->size() - prefix && suffix < b->size() - prefix &&
           (*a)[a->size() - 1 - suffix] == (*b)[b->size() - 1 - suffix]) {
        ++suffix;
    }

    size_t n = a->size() - prefix - suffix;
    size_t m = b->size() - prefix - suffix;
    if (static_cast<uint64_t>(n + 1) * (m + 1) > MAX_ALIGNMENT_CELLS) {
        throw StorageError(ErrorKind::SizeLimitExceeded,
                           "files differ in too many lines to align in memory");
    }

    // lcs[i][j] = LCS length of a[prefix+i..] and b[prefix+j..] within the middle
    std::vector<uint32_t> lcs((n + 1) * (m + 1), 0);
    auto at = [&](size_t i, size_t j) -> uint32_t& { return lcs[i * (m + 1) + j]; };
    for (size_t i = n; i-- > 0;) {
        for (size_t j = m; j-- > 0;) {
            if ((*a)[prefix + i] == (*b)[prefix + j]) {
                at(i, j) = at(i + 1, j + 1) + 1;
            } else {
                at(i, j) = std::max(at(i + 1, j), at(i, j + 1));
            }
        }
    }

    std::vector<Op> ops;
    ops.reserve(prefix + n + m + suffix);
    for (size_t k = 0; k < prefix; ++k) ops.push_back({' ', k, k});
    size_t i = 0, j = 0;
    while (i < n || j < m) {
        if (i < n && j < m && (*a)[prefix + i] == (*b)[prefix + j]) {
            ops.push_back({' ', prefix + i, prefix + j});
            ++i;
            ++j;
        } else if (i < n && (j == m || at(i + 1, j) >= at(i, j + 1))) {
            ops.push_back({'-', prefix + i, 0});
            ++i;
        } else {
            ops.push_back({'+', 0, prefix + j});
            ++j;
        }
    }
    for (size_t k = 0; k < suffix; ++k) {
        ops.push_back({' ', a->size() - suffix + k, b->size() - suffix + k});
    }

    // Line positions before each op
    std::vector<size_t> left_pos(ops.size() + 1), right_pos(ops.size() + 1);
    for (size_t k = 0; k < ops.size(); ++k) {
        left_pos[k + 1] = left_pos[k] + (ops[k].kind != '+' ? 1 : 0);
        right_pos[k + 1] = right_pos[k] + (ops[k].kind != '-' ? 1 : 0);
    }

    std::vector<DiffHunk> hunks;
    size_t k = 0;
    while (k < ops.size()) {
        if (ops[k].kind == ' ') {
            ++k;
            continue;
        }
        size_t first_change = k;
        size_t last_change = k;
        size_t scan = k + 1;
        while (scan < ops.size()) {
            if (ops[scan].kind != ' ') {
                if (scan - last_change - 1 > 2 * context) break;
                last_change = scan;
            }
            ++scan;
        }

        size_t begin = first_change > context ? first_change - context : 0;
        size_t end = std::min(ops.size(), last_change + context + 1);

        DiffHunk hunk;
        hunk.old_start = left_pos[begin];
        hunk.new_start = right_pos[begin];
        for (size_t x = begin; x < end; ++x) {
            const Op& op = ops[x];
            switch (op.kind) {
                case ' ':
                    hunk.lines.push_back({' ', left.lines[op.left], lacks_newline(left, op.left)});
                    ++hunk.old_count;
                    ++hunk.new_count;
                    break;
                case '-':
                    hunk.lines.push_back({'-', left.lines[op.left], lacks_newline(left, op.left)});
                    ++hunk.old_count;
                    break;
                default:
                    hunk.lines.push_back({'+', right.lines[op.right],
                                          lacks_newline(right, op.right)});
                    ++hunk.new_count;
                    break;
            }
        }
        hunks.push_back(std::move(hunk));
        k = end;
    }
    return hunks;
}

void write_unified_diff(std::ostream& out, const std::string& left_label,
                        const std::string& right_label,
                        const std::vector<DiffHunk>& hunks) {
    if (hunks.empty()) return;
    out << "--- " << left_label << "\n";
    out << "+++ " << right_label << "\n";
    for (const auto& h : hunks) {
        out << "@@ -" << range_text(h.old_start, h.old_count)
            << " +" << range_text(h.new_start, h.new_count) << " @@\n";
        for (const auto& line : h.lines) {
            out << line.op << line.text << "\n";
            if (line.missing_newline) out << "\\ No newline at end of file\n";
        }
    }
}

} // namespace storify
