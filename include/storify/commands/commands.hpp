#pragma once

#include "storify/core/constants.hpp"
#include "storify/storage/backend.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace storify {

/// Everything a verb needs besides its own options: the backend bound to
/// the effective config, output streams and the interactive hooks.
struct CommandContext {
    StorageBackend& backend;
    std::ostream& out;
    std::ostream& err;

    /// Asks the user a yes/no question; nullptr declines everything.
    std::function<bool(const std::string& prompt)> confirm;

    /// Set by the signal handler; polled between backend calls.
    const std::atomic<bool>* interrupted = nullptr;

    std::string provider;   // provider name shown by stat
    bool verbose = false;

    /// Throws StorageError(Interrupted) once the interrupt flag is set.
    void check_interrupted() const;
};

// ============================================================================
// Listing verbs
// ============================================================================

struct LsOptions {
    std::string path;
    bool long_format = false;
    bool recursive = false;
};

/// One line per entry; the long form adds kind flag, size and mtime.
void cmd_ls(CommandContext& ctx, const LsOptions& options);

struct TreeOptions {
    std::string path;
    std::optional<size_t> max_depth;   // 0 = the root line only
    bool dirs_only = false;
};

void cmd_tree(CommandContext& ctx, const TreeOptions& options);

struct FindOptions {
    std::string path;
    std::optional<std::string> name_glob;
    std::optional<std::string> regex;
    std::optional<EntryKind> kind;
};

/// Streams every entry below `options.path` matching the filters to `emit`.
/// Throws InvalidArgument when both a glob and a regex are given.
void find_entries(StorageBackend& backend, const FindOptions& options,
                  const std::function<void(const Entry&)>& emit,
                  const std::atomic<bool>* interrupted = nullptr);

/// Prints matching paths; returns how many matched.
size_t cmd_find(CommandContext& ctx, const FindOptions& options);

struct GrepOptions {
    std::string pattern;
    std::vector<std::string> paths;
    bool ignore_case = false;
    bool line_numbers = false;
    bool recursive = false;
};

struct GrepResult {
    size_t matches = 0;
    size_t failed_files = 0;   // unreadable candidates, reported and skipped
};

/// Prints matching lines as [path:][line:]text.
GrepResult cmd_grep(CommandContext& ctx, const GrepOptions& options);

struct DuOptions {
    std::string path;
    bool summarize = false;
    bool raw_bytes = false;
};

/// Sum of all file sizes below `path`; `on_dir` receives each directory's
/// cumulative total after its children (post-order).
uint64_t disk_usage(StorageBackend& backend, const std::string& path,
                    const std::function<void(const std::string& dir, uint64_t total)>& on_dir,
                    const std::atomic<bool>* interrupted = nullptr);

uint64_t cmd_du(CommandContext& ctx, const DuOptions& options);

enum class StatFormat {
    Human,
    Json,
    Raw,
};

struct StatOptions {
    std::string path;
    StatFormat format = StatFormat::Human;
};

void cmd_stat(CommandContext& ctx, const StatOptions& options);

// ============================================================================
// Content verbs
// ============================================================================

struct CatOptions {
    std::string path;
    bool force = false;
    uint64_t size_limit_mb = constants::DEFAULT_SIZE_LIMIT_MB;
};

void cmd_cat(CommandContext& ctx, const CatOptions& options);

struct HeadTailOptions {
    std::vector<std::string> paths;
    size_t lines = constants::DEFAULT_HEAD_LINES;
    std::optional<uint64_t> bytes;   // byte mode when set
    bool quiet = false;              // -q: never print headers
    bool verbose = false;            // -v: always print headers
};

void cmd_head(CommandContext& ctx, const HeadTailOptions& options);
void cmd_tail(CommandContext& ctx, const HeadTailOptions& options);

struct DiffOptions {
    std::string left;
    std::string right;
    size_t context = constants::DEFAULT_DIFF_CONTEXT;
    bool ignore_trailing_ws = false;
    uint64_t size_limit_mb = constants::DEFAULT_SIZE_LIMIT_MB;
    bool force = false;
};

/// Prints a unified diff; returns the number of hunks (0 when identical).
size_t cmd_diff(CommandContext& ctx, const DiffOptions& options);

// ============================================================================
// Mutating verbs
// ============================================================================

struct AppendOptions {
    std::string path;
    std::optional<std::string> source_file;   // local file; stdin otherwise
    bool no_create = false;
    bool parents = false;
    std::optional<uint64_t> if_size;
    std::optional<std::string> if_etag;
};

/// Appends the source bytes; returns how many were appended.
uint64_t cmd_append(CommandContext& ctx, const AppendOptions& options, std::istream& stdin_source);

struct RmOptions {
    std::vector<std::string> paths;
    bool recursive = false;
    bool force = false;
};

struct RmResult {
    size_t removed = 0;
    size_t failed = 0;   // objects reported and skipped during a recursive delete
};

/// Children are removed before their parent directory. Declining the
/// confirmation throws Interrupted before anything is deleted.
RmResult cmd_rm(CommandContext& ctx, const RmOptions& options);

void cmd_cp(CommandContext& ctx, const std::string& src, const std::string& dst);
void cmd_mv(CommandContext& ctx, const std::string& src, const std::string& dst);

void cmd_mkdir(CommandContext& ctx, const std::string& path, bool parents);

struct TouchOptions {
    std::string path;
    bool no_create = false;
    bool truncate = false;
    bool parents = false;
};

void cmd_touch(CommandContext& ctx, const TouchOptions& options);

struct TruncateOptions {
    std::string path;
    uint64_t size = 0;
    bool no_create = false;
    bool parents = false;
};

void cmd_truncate(CommandContext& ctx, const TruncateOptions& options);

} // namespace storify
