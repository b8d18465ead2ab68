#include "storify/commands/transfer.hpp"
#include "storify/core/path.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <thread>

namespace storify {

namespace {

bool is_local_source(TransferDirection direction) {
    return direction == TransferDirection::Upload;
}

bool is_local_destination(TransferDirection direction) {
    return direction == TransferDirection::Download;
}

std::string local_label(const std::string& p) {
    return "/" + p;
}

// Where `source` lands below `destination`, following cp: an existing
// directory or trailing '/' receives the source by name
std::string destination_root(StorageBackend& backend, const Entry& source,
                             const std::string& destination) {
    bool into = path::is_root(destination) || path::is_dir(destination);
    if (!into) {
        auto existing = backend.try_stat(destination);
        into = existing && existing->is_dir();
    }

    if (!source.is_dir()) {
        return into ? path::as_dir(destination) + path::basename(source.path) : destination;
    }
    if (!into || path::is_root(source.path)) return path::as_dir(destination);
    return path::as_dir(destination) + path::basename(source.path) + "/";
}

DestinationState settle_destination(StorageBackend& backend, const std::string& p) {
    bool atomic = backend.capabilities().atomic_commit;
    try {
        if (!backend.try_stat(p)) return DestinationState::Absent;
    } catch (const StorageError&) {
        // Unknown; report what the backend guarantees
    }
    return atomic ? DestinationState::Unchanged : DestinationState::PartiallyWritten;
}

class TransferRunner {
public:
    TransferRunner(CommandContext& ctx, StorageBackend& source, StorageBackend& destination,
                   TransferMetrics& metrics, size_t total)
        : ctx_(ctx), source_(source), destination_(destination)
        , metrics_(metrics), total_(total) {}

    void run(TransferTask& task) {
        task.status = TransferStatus::Running;
        metrics_.in_flight().Increment();
        {
            ScopedTimer timer(metrics_.task_duration());
            try {
                copy_one(task);
                task.status = TransferStatus::Done;
                metrics_.files_succeeded().Increment();
                bytes_counter(task.direction).Increment(static_cast<double>(task.bytes_done));
            } catch (const StorageError& e) {
                fail(task, e.kind(), e.what());
            } catch (const std::exception& e) {
                fail(task, ErrorKind::ProviderError, e.what());
            }
        }
        metrics_.in_flight().Decrement();
        trace(task);
    }

private:
    CommandContext& ctx_;
    StorageBackend& source_;
    StorageBackend& destination_;
    TransferMetrics& metrics_;
    size_t total_;
    std::mutex output_mutex_;

    void copy_one(TransferTask& task) {
        ctx_.check_interrupted();
        if (destination_.capabilities().real_directories) {
            std::string parent = path::parent(task.destination);
            if (!path::is_root(parent)) destination_.create_dir(parent, true);
        }

        auto in = source_.open_read(task.source);
        auto out = destination_.open_write(task.destination);
        std::vector<char> buf(constants::DEFAULT_STREAM_BUFFER_SIZE);
        while (size_t n = in->read(buf.data(), buf.size())) {
            ctx_.check_interrupted();
            out->write(buf.data(), n);
            task.bytes_done += n;
        }
        out->commit();
    }

    void fail(TransferTask& task, ErrorKind kind, const std::string& message) {
        task.status = TransferStatus::Failed;
        task.error_kind = kind;
        task.error_message = message;
        task.destination_state = settle_destination(destination_, task.destination);
        metrics_.files_failed().Increment();
    }

    prometheus::Counter& bytes_counter(TransferDirection direction) {
        return direction == TransferDirection::Download ? metrics_.download_bytes()
                                                        : metrics_.upload_bytes();
    }

    void trace(const TransferTask& task) {
        if (!ctx_.verbose) return;
        uint64_t finished = metrics_.succeeded() + metrics_.failed();
        std::lock_guard lock(output_mutex_);
        ctx_.err << "[storify] [" << finished << "/" << total_ << "] "
                 << task.source_label() << " -> " << task.destination_label()
                 << (task.status == TransferStatus::Done ? " ok" : " failed") << "\n";
    }
};

} // anonymous namespace

const char* destination_state_text(DestinationState state) {
    switch (state) {
        case DestinationState::Absent: return "destination absent";
        case DestinationState::Unchanged: return "destination unchanged";
        case DestinationState::PartiallyWritten: return "destination may be partially written";
    }
    return "destination state unknown";
}

std::string TransferTask::source_label() const {
    return is_local_source(direction) ? local_label(source) : path::display(source);
}

std::string TransferTask::destination_label() const {
    return is_local_destination(direction) ? local_label(destination) : path::display(destination);
}

std::string local_backend_path(const std::string& local_path) {
    if (local_path.empty()) {
        throw StorageError(ErrorKind::InvalidArgument, "empty local path");
    }
    auto absolute = std::filesystem::absolute(local_path).lexically_normal();
    std::string p = path::normalize(absolute.generic_string());
    if (local_path.back() == '/') p = path::as_dir(p);
    return p;
}

// ============================================================================
// Planning
// ============================================================================

std::vector<TransferTask> plan_transfer(StorageBackend& source_backend, const std::string& source,
                                        StorageBackend& destination_backend,
                                        const std::string& destination,
                                        TransferDirection direction, bool recursive) {
    Entry entry;
    if (path::is_root(source)) {
        entry.path = "";
        entry.kind = EntryKind::Directory;
    } else {
        entry = source_backend.stat(source);
    }

    std::string label = is_local_source(direction) ? local_label(entry.path)
                                                   : path::display(entry.path);
    if (entry.is_dir() && !recursive) {
        throw StorageError(ErrorKind::InvalidArgument, "is a directory (use -R)", label);
    }
    if (!entry.is_dir() && !entry.is_file()) {
        throw StorageError(ErrorKind::InvalidArgument, "not a regular file", label);
    }

    std::string root = destination_root(destination_backend, entry, destination);
    std::vector<TransferTask> tasks;
    auto add = [&](const Entry& file, std::string target) {
        TransferTask task;
        task.source = file.path;
        task.destination = std::move(target);
        task.direction = direction;
        task.bytes_total = file.size.value_or(0);
        tasks.push_back(std::move(task));
    };

    if (!entry.is_dir()) {
        add(entry, path::as_file(root));
        return tasks;
    }

    auto stream = source_backend.list(entry.path, true);
    while (auto child = stream->next()) {
        if (!child->is_file()) continue;
        add(*child, root + path::relative_to(child->path, entry.path));
    }
    return tasks;
}

// ============================================================================
// Execution
// ============================================================================

TransferReport run_transfer(CommandContext& ctx, StorageBackend& source_backend,
                            StorageBackend& destination_backend,
                            std::vector<TransferTask> tasks, size_t concurrency,
                            TransferMetrics& metrics) {
    TransferReport report;
    report.tasks = std::move(tasks);

    if (!report.tasks.empty()) {
        TransferRunner runner(ctx, source_backend, destination_backend, metrics,
                              report.tasks.size());
        std::atomic<size_t> next_task{0};

        auto worker = [&]() {
            while (!(ctx.interrupted && ctx.interrupted->load())) {
                size_t i = next_task.fetch_add(1);
                if (i >= report.tasks.size()) return;
                runner.run(report.tasks[i]);
            }
        };

        size_t workers = std::clamp<size_t>(concurrency, 1, report.tasks.size());
        if (ctx.verbose) {
            ctx.err << "[storify] " << report.tasks.size() << " task(s), "
                    << workers << " worker(s)\n";
        }

        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            threads.emplace_back(worker);
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    }

    for (const auto& task : report.tasks) {
        switch (task.status) {
            case TransferStatus::Done:
                ++report.succeeded;
                report.bytes += task.bytes_done;
                break;
            case TransferStatus::Failed:
                ++report.failed;
                break;
            case TransferStatus::Pending:
            case TransferStatus::Running:
                ++report.not_started;
                break;
        }
    }
    report.interrupted = ctx.interrupted && ctx.interrupted->load();
    return report;
}

TransferReport run_put(CommandContext& ctx, StorageBackend& local, const std::string& local_path,
                       const std::string& remote_path, const TransferOptions& options,
                       TransferMetrics& metrics) {
    auto tasks = plan_transfer(local, local_backend_path(local_path), ctx.backend,
                               path::normalize(remote_path), TransferDirection::Upload,
                               options.recursive);
    return run_transfer(ctx, local, ctx.backend, std::move(tasks), options.concurrency, metrics);
}

TransferReport run_get(CommandContext& ctx, StorageBackend& local, const std::string& remote_path,
                       const std::string& local_path, const TransferOptions& options,
                       TransferMetrics& metrics) {
    auto tasks = plan_transfer(ctx.backend, path::normalize(remote_path), local,
                               local_backend_path(local_path), TransferDirection::Download,
                               true);
    return run_transfer(ctx, ctx.backend, local, std::move(tasks), options.concurrency, metrics);
}

void print_transfer_report(CommandContext& ctx, const TransferReport& report) {
    for (const auto& task : report.tasks) {
        if (task.status != TransferStatus::Failed) continue;
        ctx.err << "failed: " << task.source_label() << " -> " << task.destination_label() << ": "
                << error_kind_name(task.error_kind.value_or(ErrorKind::ProviderError)) << ": "
                << task.error_message;
        if (task.destination_state) {
            ctx.err << " [" << destination_state_text(*task.destination_state) << "]";
        }
        ctx.err << "\n";
    }
    if (report.not_started > 0) {
        ctx.err << "warning: " << report.not_started << " task(s) not started\n";
    }
    ctx.out << report.succeeded << " succeeded, " << report.failed << " failed, "
            << report.bytes << " bytes\n";
}

} // namespace storify
