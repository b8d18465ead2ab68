#include "storify/commands/commands.hpp"
#include "storify/core/error.hpp"
#include "storify/core/path.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

namespace storify {

namespace {

std::string read_source(const AppendOptions& options, std::istream& stdin_source) {
    if (!options.source_file) {
        return std::string((std::istreambuf_iterator<char>(stdin_source)),
                           std::istreambuf_iterator<char>());
    }
    std::ifstream ifs(*options.source_file, std::ios::binary);
    if (!ifs) {
        throw StorageError(ErrorKind::NotFound, "cannot open local source file",
                           *options.source_file);
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    if (ifs.bad()) {
        throw StorageError(ErrorKind::ProviderError, "error reading local source file",
                           *options.source_file);
    }
    return ss.str();
}

// Create the parent of `p` on backends with a real directory hierarchy
void ensure_parent(StorageBackend& backend, const std::string& p) {
    if (!backend.capabilities().real_directories) return;
    std::string parent = path::parent(p);
    if (!path::is_root(parent)) backend.create_dir(parent, true);
}

std::string strip_quotes(const std::string& etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        return etag.substr(1, etag.size() - 2);
    }
    return etag;
}

// Destination of a cp/mv: into `dst` when it is an existing directory or
// carries a trailing '/', otherwise `dst` itself
std::string copy_target(StorageBackend& backend, const std::string& src, const std::string& dst) {
    bool into = path::is_dir(dst);
    if (!into) {
        auto existing = backend.try_stat(dst);
        into = existing && existing->is_dir();
    }
    if (!into) return dst;
    return path::join(path::as_dir(dst), path::basename(src));
}

void guard_not_root(const std::string& p, const char* verb) {
    if (path::is_root(p)) {
        throw StorageError(ErrorKind::InvalidArgument,
                           std::string("refusing to ") + verb + " the storage root", "/");
    }
}

void copy_tree(CommandContext& ctx, const std::string& src_dir, const std::string& dst_dir) {
    auto& backend = ctx.backend;
    bool real_dirs = backend.capabilities().real_directories;
    if (real_dirs) backend.create_dir(dst_dir, true);

    auto stream = backend.list(src_dir, true);
    while (auto entry = stream->next()) {
        ctx.check_interrupted();
        std::string rel = path::relative_to(entry->path, src_dir);
        std::string target = path::as_dir(dst_dir) + rel;
        if (entry->is_dir()) {
            if (real_dirs) backend.create_dir(target, true);
        } else if (entry->is_file()) {
            backend.copy(entry->path, target);
        }
    }
}

} // anonymous namespace

// ============================================================================
// append
// ============================================================================

uint64_t cmd_append(CommandContext& ctx, const AppendOptions& options, std::istream& stdin_source) {
    std::string target = path::normalize(options.path);
    if (path::is_dir(target)) {
        throw StorageError(ErrorKind::InvalidArgument, "append target must be a file",
                           path::display(target));
    }

    auto existing = ctx.backend.try_stat(target);
    if (existing && existing->is_dir()) {
        throw StorageError(ErrorKind::InvalidArgument, "is a directory", target);
    }
    if (!existing && options.no_create) {
        throw StorageError(ErrorKind::NotFound, "no such file (not created because of -c)", target);
    }
    if (options.if_size) {
        uint64_t current = existing ? existing->size.value_or(0) : 0;
        if (!existing || current != *options.if_size) {
            throw StorageError(ErrorKind::InvalidArgument,
                               "precondition failed: size is " +
                               (existing ? std::to_string(current) : std::string("absent")),
                               target);
        }
    }
    if (options.if_etag) {
        if (!existing || strip_quotes(existing->etag) != strip_quotes(*options.if_etag)) {
            throw StorageError(ErrorKind::InvalidArgument, "precondition failed: etag differs",
                               target);
        }
    }

    std::string data = read_source(options, stdin_source);
    ctx.check_interrupted();

    if (!existing) {
        if (options.parents) ensure_parent(ctx.backend, target);
        ctx.backend.write_all(target, data);
        return data.size();
    }

    if (ctx.backend.capabilities().native_append) {
        if (!data.empty()) ctx.backend.append(target, data);
        return data.size();
    }

    // Rewrite: the old bytes plus the new ones, committed atomically
    std::string combined = ctx.backend.read_all(target);
    combined += data;
    ctx.backend.write_all(target, combined);
    return data.size();
}

// ============================================================================
// rm
// ============================================================================

RmResult cmd_rm(CommandContext& ctx, const RmOptions& options) {
    auto& backend = ctx.backend;
    struct Target {
        Entry entry;
        size_t objects;
    };

    // Validate every operand and count objects before deleting anything
    std::vector<Target> targets;
    size_t total = 0;
    for (const auto& raw : options.paths) {
        std::string p = path::normalize(raw);
        Entry entry;
        if (path::is_root(p)) {
            if (!options.recursive) guard_not_root(p, "remove");
            entry.path = "";
            entry.kind = EntryKind::Directory;
        } else {
            entry = backend.stat(p);
        }

        size_t objects = 1;
        if (entry.is_dir()) {
            if (!options.recursive) {
                throw StorageError(ErrorKind::InvalidArgument, "is a directory (use -R)",
                                   path::display(entry.path));
            }
            if (path::is_root(entry.path)) objects = 0;
            auto stream = backend.list(entry.path, true);
            while (stream->next()) {
                ctx.check_interrupted();
                ++objects;
            }
        }
        total += objects;
        targets.push_back({std::move(entry), objects});
    }

    if (!options.force) {
        std::string prompt = "Delete " + std::to_string(total) + " object(s)? [y/N] ";
        if (!ctx.confirm || !ctx.confirm(prompt)) {
            throw StorageError(ErrorKind::Interrupted, "deletion cancelled; nothing was removed");
        }
    }

    RmResult result;
    bool real_dirs = backend.capabilities().real_directories;
    auto remove_one = [&](const std::string& p, bool is_dir) {
        ctx.check_interrupted();
        try {
            backend.remove(p);
            ++result.removed;
        } catch (const StorageError& e) {
            // Object stores drop implicit directories with their last child
            if (is_dir && !real_dirs && e.kind() == ErrorKind::NotFound) return;
            if (e.kind() == ErrorKind::Interrupted) throw;
            if (!options.recursive) throw;
            ctx.err << "warning: cannot remove " << path::display(p) << ": " << e.describe() << "\n";
            ++result.failed;
        }
    };

    for (const auto& target : targets) {
        if (!target.entry.is_dir()) {
            remove_one(target.entry.path, false);
            continue;
        }

        // Pre-order listing; each directory is removed once the walk leaves it
        std::vector<std::string> open_dirs;
        auto stream = backend.list(target.entry.path, true);
        while (auto entry = stream->next()) {
            ctx.check_interrupted();
            while (!open_dirs.empty() && !entry->path.starts_with(open_dirs.back())) {
                remove_one(open_dirs.back(), true);
                open_dirs.pop_back();
            }
            if (entry->is_dir()) {
                open_dirs.push_back(entry->path);
            } else {
                remove_one(entry->path, false);
            }
        }
        while (!open_dirs.empty()) {
            remove_one(open_dirs.back(), true);
            open_dirs.pop_back();
        }
        if (!path::is_root(target.entry.path)) remove_one(target.entry.path, true);
    }
    return result;
}

// ============================================================================
// cp / mv
// ============================================================================

void cmd_cp(CommandContext& ctx, const std::string& raw_src, const std::string& raw_dst) {
    std::string src = path::normalize(raw_src);
    guard_not_root(src, "copy");
    Entry source = ctx.backend.stat(src);
    std::string target = copy_target(ctx.backend, source.path, path::normalize(raw_dst));

    if (path::as_file(target) == path::as_file(source.path)) {
        throw StorageError(ErrorKind::InvalidArgument, "source and destination are the same",
                           path::display(source.path));
    }

    if (!source.is_dir()) {
        ctx.backend.copy(source.path, path::as_file(target));
        return;
    }

    std::string dst_dir = path::as_dir(target);
    if (dst_dir.starts_with(source.path)) {
        throw StorageError(ErrorKind::InvalidArgument, "cannot copy a directory into itself",
                           path::display(source.path));
    }
    copy_tree(ctx, source.path, dst_dir);
}

void cmd_mv(CommandContext& ctx, const std::string& raw_src, const std::string& raw_dst) {
    std::string src = path::normalize(raw_src);
    guard_not_root(src, "move");
    Entry source = ctx.backend.stat(src);
    std::string target = copy_target(ctx.backend, source.path, path::normalize(raw_dst));
    guard_not_root(target, "replace");

    if (path::as_file(target) == path::as_file(source.path)) {
        throw StorageError(ErrorKind::InvalidArgument, "source and destination are the same",
                           path::display(source.path));
    }

    if (!source.is_dir()) {
        ctx.backend.rename(source.path, path::as_file(target));
        return;
    }

    std::string dst_dir = path::as_dir(target);
    if (dst_dir.starts_with(source.path)) {
        throw StorageError(ErrorKind::InvalidArgument, "cannot move a directory into itself",
                           path::display(source.path));
    }

    if (ctx.backend.capabilities().real_directories) {
        ctx.backend.rename(source.path, dst_dir);
        return;
    }

    copy_tree(ctx, source.path, dst_dir);
    RmOptions rm;
    rm.paths = {source.path};
    rm.recursive = true;
    rm.force = true;
    auto removed = cmd_rm(ctx, rm);
    if (removed.failed > 0) {
        throw StorageError(ErrorKind::ProviderError,
                           "copied, but " + std::to_string(removed.failed) +
                           " source object(s) could not be removed",
                           path::display(source.path));
    }
}

// ============================================================================
// mkdir / touch / truncate
// ============================================================================

void cmd_mkdir(CommandContext& ctx, const std::string& raw_path, bool parents) {
    std::string p = path::normalize(raw_path);
    if (path::is_root(p)) return;
    ctx.backend.create_dir(path::as_dir(p), parents);
}

void cmd_touch(CommandContext& ctx, const TouchOptions& options) {
    std::string p = path::as_file(path::normalize(options.path));
    guard_not_root(p, "touch");

    auto existing = ctx.backend.try_stat(p);
    if (existing) {
        if (existing->is_dir()) {
            if (options.truncate) {
                throw StorageError(ErrorKind::InvalidArgument, "is a directory", existing->path);
            }
            return;
        }
        if (options.truncate && existing->size.value_or(0) > 0) ctx.backend.write_all(p, "");
        return;
    }

    if (options.no_create) return;
    if (options.parents) ensure_parent(ctx.backend, p);
    ctx.backend.write_all(p, "");
}

void cmd_truncate(CommandContext& ctx, const TruncateOptions& options) {
    std::string p = path::as_file(path::normalize(options.path));
    guard_not_root(p, "truncate");

    auto existing = ctx.backend.try_stat(p);
    if (existing && existing->is_dir()) {
        throw StorageError(ErrorKind::InvalidArgument, "is a directory", existing->path);
    }
    if (!existing) {
        if (options.no_create) return;
        if (options.parents) ensure_parent(ctx.backend, p);
    }

    uint64_t keep = existing ? std::min<uint64_t>(existing->size.value_or(0), options.size) : 0;
    std::vector<char> buf(constants::DEFAULT_STREAM_BUFFER_SIZE);

    auto sink = ctx.backend.open_write(p);
    if (keep > 0) {
        auto in = ctx.backend.open_read(p, ByteRange{0, keep});
        uint64_t copied = 0;
        while (copied < keep) {
            ctx.check_interrupted();
            size_t want = static_cast<size_t>(std::min<uint64_t>(buf.size(), keep - copied));
            size_t n = in->read(buf.data(), want);
            if (n == 0) break;
            sink->write(buf.data(), n);
            copied += n;
        }
        if (copied != keep) {
            throw StorageError(ErrorKind::ProviderError, "object shrank while truncating", p);
        }
    }

    std::fill(buf.begin(), buf.end(), '\0');
    uint64_t padding = options.size - keep;
    while (padding > 0) {
        ctx.check_interrupted();
        size_t n = static_cast<size_t>(std::min<uint64_t>(buf.size(), padding));
        sink->write(buf.data(), n);
        padding -= n;
    }
    sink->commit();
}

} // namespace storify
