#include "storify/commands/commands.hpp"
#include "storify/commands/glob.hpp"
#include "storify/commands/text.hpp"
#include "storify/core/error.hpp"
#include "storify/core/path.hpp"
#include "storify/core/time_format.hpp"

#include <iomanip>
#include <regex>
#include <vector>

#include <nlohmann/json.hpp>

namespace storify {

void CommandContext::check_interrupted() const {
    if (interrupted && interrupted->load()) {
        throw StorageError(ErrorKind::Interrupted, "interrupted by user");
    }
}

namespace {

void poll(const std::atomic<bool>* interrupted) {
    if (interrupted && interrupted->load()) {
        throw StorageError(ErrorKind::Interrupted, "interrupted by user");
    }
}

char kind_flag(EntryKind kind) {
    switch (kind) {
        case EntryKind::Directory: return 'd';
        case EntryKind::File: return '-';
        case EntryKind::Other: return '?';
    }
    return '?';
}

std::string listing_time(const Entry& entry) {
    return entry.last_modified ? timefmt::format_listing(*entry.last_modified)
                               : std::string("-").append(18, ' ');
}

// ----------------------------------------------------------------------------
// tree rendering
// ----------------------------------------------------------------------------

struct TreeCounts {
    size_t dirs = 0;
    size_t files = 0;
};

class TreePrinter {
public:
    TreePrinter(CommandContext& ctx, const TreeOptions& options)
        : ctx_(ctx), options_(options) {}

    void print_level(const std::string& dir, const std::string& prefix, size_t depth) {
        if (options_.max_depth && depth > *options_.max_depth) return;

        auto stream = ctx_.backend.list_dir(dir);
        auto current = next_visible(*stream);
        while (current) {
            ctx_.check_interrupted();
            auto following = next_visible(*stream);
            bool last = !following.has_value();

            std::string name = path::basename(current->path);
            if (current->is_dir()) name += "/";
            ctx_.out << prefix << (last ? "└── " : "├── ") << name << "\n";

            if (current->is_dir()) {
                ++counts_.dirs;
                print_level(current->path, prefix + (last ? "    " : "│   "), depth + 1);
            } else {
                ++counts_.files;
            }
            current = std::move(following);
        }
    }

    const TreeCounts& counts() const { return counts_; }

private:
    std::optional<Entry> next_visible(EntryStream& stream) {
        while (auto entry = stream.next()) {
            if (options_.dirs_only && !entry->is_dir()) continue;
            return entry;
        }
        return std::nullopt;
    }

    CommandContext& ctx_;
    const TreeOptions& options_;
    TreeCounts counts_;
};

} // anonymous namespace

// ============================================================================
// ls
// ============================================================================

void cmd_ls(CommandContext& ctx, const LsOptions& options) {
    auto stream = ctx.backend.list(options.path, options.recursive);
    while (auto entry = stream->next()) {
        ctx.check_interrupted();
        if (!options.long_format) {
            ctx.out << path::display(entry->path) << "\n";
            continue;
        }
        ctx.out << kind_flag(entry->kind) << " "
                << std::setw(12) << (entry->size ? std::to_string(*entry->size) : std::string("-"))
                << " " << listing_time(*entry)
                << " " << path::display(entry->path) << "\n";
    }
}

// ============================================================================
// tree
// ============================================================================

void cmd_tree(CommandContext& ctx, const TreeOptions& options) {
    std::string root = path::normalize(options.path);
    if (!path::is_dir(root)) {
        Entry entry = ctx.backend.stat(root);
        if (!entry.is_dir()) {
            ctx.out << path::display(entry.path) << "\n\n0 directories, 1 files\n";
            return;
        }
        root = path::as_dir(root);
    }

    ctx.out << path::display(root) << "\n";
    TreePrinter printer(ctx, options);
    printer.print_level(root, "", 1);
    ctx.out << "\n" << printer.counts().dirs << " directories";
    if (!options.dirs_only) ctx.out << ", " << printer.counts().files << " files";
    ctx.out << "\n";
}

// ============================================================================
// find
// ============================================================================

void find_entries(StorageBackend& backend, const FindOptions& options,
                  const std::function<void(const Entry&)>& emit,
                  const std::atomic<bool>* interrupted) {
    if (options.name_glob && options.regex) {
        throw StorageError(ErrorKind::InvalidArgument, "--name and --regex are mutually exclusive");
    }

    // Both forms are tested against the full path without the directory marker
    std::optional<std::regex> matcher;
    if (options.name_glob) {
        matcher = compile_glob(*options.name_glob);
    } else if (options.regex) {
        matcher = compile_regex(*options.regex);
    }

    std::string base = path::normalize(options.path);
    auto stream = backend.list(base, true);
    while (auto entry = stream->next()) {
        poll(interrupted);
        if (options.kind && entry->kind != *options.kind) continue;
        if (matcher) {
            std::string subject = path::as_file(entry->path);
            bool hit = options.name_glob ? std::regex_match(subject, *matcher)
                                         : std::regex_search(subject, *matcher);
            if (!hit) continue;
        }
        emit(*entry);
    }
}

size_t cmd_find(CommandContext& ctx, const FindOptions& options) {
    size_t count = 0;
    find_entries(ctx.backend, options, [&](const Entry& entry) {
        ctx.out << path::display(entry.path) << "\n";
        ++count;
    }, ctx.interrupted);
    return count;
}

// ============================================================================
// du
// ============================================================================

uint64_t disk_usage(StorageBackend& backend, const std::string& raw_path,
                    const std::function<void(const std::string&, uint64_t)>& on_dir,
                    const std::atomic<bool>* interrupted) {
    std::string root = path::normalize(raw_path);
    if (!path::is_dir(root)) {
        Entry entry = backend.stat(root);
        if (!entry.is_dir()) return entry.size.value_or(0);
        root = path::as_dir(root);
    }

    // Open directories from the root down to the current DFS position
    std::vector<std::pair<std::string, uint64_t>> open_dirs;
    open_dirs.emplace_back(root, 0);

    auto close_top = [&]() {
        auto [dir, total] = open_dirs.back();
        open_dirs.pop_back();
        if (on_dir) on_dir(dir, total);
        if (!open_dirs.empty()) open_dirs.back().second += total;
        return total;
    };

    auto stream = backend.list(root, true);
    while (auto entry = stream->next()) {
        poll(interrupted);
        while (open_dirs.size() > 1 && !entry->path.starts_with(open_dirs.back().first)) {
            close_top();
        }
        if (entry->is_dir()) {
            open_dirs.emplace_back(entry->path, 0);
        } else if (entry->is_file()) {
            open_dirs.back().second += entry->size.value_or(0);
        }
    }

    uint64_t total = 0;
    while (!open_dirs.empty()) total = close_top();
    return total;
}

uint64_t cmd_du(CommandContext& ctx, const DuOptions& options) {
    auto render = [&](uint64_t bytes) {
        return options.raw_bytes ? std::to_string(bytes) : format_size(bytes);
    };

    std::string target = path::normalize(options.path);
    bool printed = false;
    uint64_t total = disk_usage(ctx.backend, target,
        [&](const std::string& dir, uint64_t dir_total) {
            if (options.summarize) return;
            ctx.out << render(dir_total) << "\t" << path::display(dir) << "\n";
            printed = true;
        }, ctx.interrupted);

    if (options.summarize || !printed) {
        ctx.out << render(total) << "\t" << path::display(target) << "\n";
    }
    return total;
}

// ============================================================================
// stat
// ============================================================================

void cmd_stat(CommandContext& ctx, const StatOptions& options) {
    Entry entry = ctx.backend.stat(options.path);
    std::string modified = entry.last_modified ? timefmt::format_iso8601(*entry.last_modified)
                                               : std::string();

    switch (options.format) {
        case StatFormat::Json: {
            nlohmann::json j;
            j["path"] = path::display(entry.path);
            j["type"] = entry_kind_name(entry.kind);
            j["size"] = entry.size ? nlohmann::json(*entry.size) : nlohmann::json(nullptr);
            j["last_modified"] = modified.empty() ? nlohmann::json(nullptr) : nlohmann::json(modified);
            j["etag"] = entry.etag.empty() ? nlohmann::json(nullptr) : nlohmann::json(entry.etag);
            j["content_type"] = entry.content_type.empty() ? nlohmann::json(nullptr)
                                                           : nlohmann::json(entry.content_type);
            j["provider"] = ctx.provider;
            ctx.out << j.dump(2) << "\n";
            break;
        }
        case StatFormat::Raw:
            ctx.out << "path=" << path::display(entry.path) << "\n"
                    << "type=" << entry_kind_name(entry.kind) << "\n"
                    << "size=" << (entry.size ? std::to_string(*entry.size) : std::string()) << "\n"
                    << "last_modified=" << modified << "\n"
                    << "etag=" << entry.etag << "\n"
                    << "content_type=" << entry.content_type << "\n"
                    << "provider=" << ctx.provider << "\n";
            break;
        case StatFormat::Human:
            ctx.out << "  Path: " << path::display(entry.path) << "\n"
                    << "  Type: " << entry_kind_name(entry.kind) << "\n";
            if (entry.size) {
                ctx.out << "  Size: " << *entry.size << " (" << format_size(*entry.size) << ")\n";
            }
            if (!modified.empty()) ctx.out << "  Modified: " << modified << "\n";
            if (!entry.etag.empty()) ctx.out << "  ETag: " << entry.etag << "\n";
            if (!entry.content_type.empty()) ctx.out << "  Content-Type: " << entry.content_type << "\n";
            ctx.out << "  Provider: " << ctx.provider << "\n";
            break;
    }
}

} // namespace storify
