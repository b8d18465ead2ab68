#include "storify/commands/commands.hpp"
#include "storify/commands/diff.hpp"
#include "storify/commands/glob.hpp"
#include "storify/commands/text.hpp"
#include "storify/core/error.hpp"
#include "storify/core/path.hpp"

#include <algorithm>
#include <regex>
#include <vector>

namespace storify {

namespace {

constexpr uint64_t MEGABYTE = 1024ULL * 1024;

// Copy a read stream to `out`, stopping after `limit` bytes when given
uint64_t pipe_stream(CommandContext& ctx, ReadStream& stream, std::optional<uint64_t> limit) {
    std::vector<char> buf(constants::DEFAULT_STREAM_BUFFER_SIZE);
    uint64_t total = 0;
    while (!limit || total < *limit) {
        ctx.check_interrupted();
        size_t want = buf.size();
        if (limit) want = static_cast<size_t>(std::min<uint64_t>(want, *limit - total));
        size_t n = stream.read(buf.data(), want);
        if (n == 0) break;
        ctx.out.write(buf.data(), static_cast<std::streamsize>(n));
        total += n;
    }
    return total;
}

Entry require_file(StorageBackend& backend, const std::string& p) {
    Entry entry = backend.stat(p);
    if (entry.is_dir()) {
        throw StorageError(ErrorKind::InvalidArgument, "is a directory", path::display(entry.path));
    }
    return entry;
}

// Prints the "==> path <==" separators for head/tail
class HeaderPrinter {
public:
    HeaderPrinter(CommandContext& ctx, const HeadTailOptions& options)
        : ctx_(ctx)
        , enabled_(options.verbose || (options.paths.size() > 1 && !options.quiet)) {}

    void before(const std::string& p) {
        if (!enabled_) return;
        if (!first_) ctx_.out << "\n";
        ctx_.out << "==> " << p << " <==\n";
        first_ = false;
    }

private:
    CommandContext& ctx_;
    bool enabled_;
    bool first_ = true;
};

} // anonymous namespace

// ============================================================================
// cat
// ============================================================================

void cmd_cat(CommandContext& ctx, const CatOptions& options) {
    Entry entry = require_file(ctx.backend, options.path);
    uint64_t limit = options.size_limit_mb * MEGABYTE;
    if (!options.force && entry.size && *entry.size > limit) {
        throw StorageError(ErrorKind::SizeLimitExceeded,
                           "file is larger than " + std::to_string(options.size_limit_mb) +
                           " MB (use -f to print it anyway)", path::display(entry.path));
    }
    auto stream = ctx.backend.open_read(entry.path);
    pipe_stream(ctx, *stream, std::nullopt);
}

// ============================================================================
// head / tail
// ============================================================================

void cmd_head(CommandContext& ctx, const HeadTailOptions& options) {
    HeaderPrinter headers(ctx, options);
    for (const auto& p : options.paths) {
        Entry entry = require_file(ctx.backend, p);
        headers.before(path::display(entry.path));

        if (options.bytes) {
            std::optional<ByteRange> range;
            if (ctx.backend.capabilities().ranged_reads) range = ByteRange{0, *options.bytes};
            auto stream = ctx.backend.open_read(entry.path, range);
            pipe_stream(ctx, *stream, *options.bytes);
            continue;
        }

        auto stream = ctx.backend.open_read(entry.path);
        LineReader reader(*stream);
        std::string line;
        for (size_t n = 0; n < options.lines && reader.next(line); ++n) {
            ctx.check_interrupted();
            ctx.out << line;
            if (reader.last_had_newline()) ctx.out << "\n";
        }
    }
}

void cmd_tail(CommandContext& ctx, const HeadTailOptions& options) {
    HeaderPrinter headers(ctx, options);
    for (const auto& p : options.paths) {
        Entry entry = require_file(ctx.backend, p);
        headers.before(path::display(entry.path));

        if (options.bytes) {
            uint64_t want = *options.bytes;
            if (ctx.backend.capabilities().ranged_reads && entry.size) {
                uint64_t offset = *entry.size > want ? *entry.size - want : 0;
                auto stream = ctx.backend.open_read(entry.path, ByteRange{offset, std::nullopt});
                pipe_stream(ctx, *stream, std::nullopt);
                continue;
            }
            // No ranged reads: stream forward and keep the last `want` bytes
            auto stream = ctx.backend.open_read(entry.path);
            std::string window;
            std::vector<char> buf(constants::DEFAULT_STREAM_BUFFER_SIZE);
            while (size_t n = stream->read(buf.data(), buf.size())) {
                ctx.check_interrupted();
                window.append(buf.data(), n);
                if (window.size() > want) window.erase(0, window.size() - want);
            }
            ctx.out << window;
            continue;
        }

        auto stream = ctx.backend.open_read(entry.path);
        LineReader reader(*stream);
        LineRing ring(options.lines);
        std::string line;
        bool final_newline = true;
        while (reader.next(line)) {
            ctx.check_interrupted();
            final_newline = reader.last_had_newline();
            ring.push(std::move(line));
            line.clear();
        }
        auto lines = ring.lines();
        for (size_t i = 0; i < lines.size(); ++i) {
            ctx.out << lines[i];
            if (i + 1 < lines.size() || final_newline) ctx.out << "\n";
        }
    }
}

// ============================================================================
// grep
// ============================================================================

GrepResult cmd_grep(CommandContext& ctx, const GrepOptions& options) {
    std::regex re = compile_regex(options.pattern, options.ignore_case);
    GrepResult result;
    bool show_path = options.paths.size() > 1 || options.recursive;

    auto search_file = [&](const std::string& file) {
        auto stream = ctx.backend.open_read(file);
        LineReader reader(*stream);
        if (looks_binary(reader.peek(constants::DEFAULT_BINARY_CHECK_SIZE))) {
            ctx.err << "warning: skipping binary or non-UTF-8 file " << path::display(file) << "\n";
            return;
        }
        std::string line;
        size_t line_no = 0;
        while (reader.next(line)) {
            ctx.check_interrupted();
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!std::regex_search(line, re)) continue;
            ++result.matches;
            if (show_path) ctx.out << path::display(file) << ":";
            if (options.line_numbers) ctx.out << line_no << ":";
            ctx.out << line << "\n";
        }
    };

    auto guarded = [&](const std::string& file) {
        try {
            search_file(file);
        } catch (const StorageError& e) {
            if (e.kind() == ErrorKind::Interrupted) throw;
            ctx.err << "warning: " << path::display(file) << ": " << e.describe() << "\n";
            ++result.failed_files;
        }
    };

    for (const auto& p : options.paths) {
        ctx.check_interrupted();
        std::optional<Entry> entry;
        try {
            entry = ctx.backend.stat(p);
        } catch (const StorageError& e) {
            if (e.kind() == ErrorKind::Interrupted) throw;
            ctx.err << "warning: " << p << ": " << e.describe() << "\n";
            ++result.failed_files;
            continue;
        }

        if (!entry->is_dir()) {
            guarded(entry->path);
            continue;
        }
        if (!options.recursive) {
            ctx.err << "warning: " << path::display(entry->path)
                    << " is a directory (use -R to search it)\n";
            continue;
        }
        auto stream = ctx.backend.list(entry->path, true);
        while (auto child = stream->next()) {
            ctx.check_interrupted();
            if (child->is_file()) guarded(child->path);
        }
    }
    return result;
}

// ============================================================================
// diff
// ============================================================================

size_t cmd_diff(CommandContext& ctx, const DiffOptions& options) {
    Entry left = require_file(ctx.backend, options.left);
    Entry right = require_file(ctx.backend, options.right);

    std::optional<uint64_t> limit;
    if (!options.force) {
        limit = options.size_limit_mb * MEGABYTE;
        for (const Entry* e : {&left, &right}) {
            if (e->size && *e->size > *limit) {
                throw StorageError(ErrorKind::SizeLimitExceeded,
                                   "file is larger than the diff size limit of " +
                                   std::to_string(options.size_limit_mb) + " MB (use -f)",
                                   path::display(e->path));
            }
        }
    }

    DiffText left_text = split_lines(ctx.backend.read_all(left.path, limit));
    ctx.check_interrupted();
    DiffText right_text = split_lines(ctx.backend.read_all(right.path, limit));
    ctx.check_interrupted();

    auto hunks = compute_hunks(left_text, right_text, options.context,
                               options.ignore_trailing_ws);
    write_unified_diff(ctx.out, path::display(left.path), path::display(right.path), hunks);
    return hunks.size();
}

} // namespace storify
