#pragma once

#include "storify/commands/commands.hpp"
#include "storify/commands/metrics.hpp"
#include "storify/core/constants.hpp"
#include "storify/core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace storify {

enum class TransferDirection {
    Upload,      // local filesystem -> storage
    Download,    // storage -> local filesystem
    IntraCopy,   // storage -> same storage
};

enum class TransferStatus {
    Pending,
    Running,
    Done,
    Failed,
};

/// What a failed task left at its destination.
enum class DestinationState {
    Absent,
    Unchanged,          // atomic commit: any previous object is intact
    PartiallyWritten,   // backend without atomic commit
};

const char* destination_state_text(DestinationState state);

/// One file-level unit of a batch transfer. Paths are normalized backend
/// paths; the local side is a filesystem connector rooted at "/".
struct TransferTask {
    std::string source;
    std::string destination;
    TransferDirection direction = TransferDirection::Upload;
    uint64_t bytes_total = 0;
    uint64_t bytes_done = 0;
    TransferStatus status = TransferStatus::Pending;

    // Set when status == Failed
    std::optional<ErrorKind> error_kind;
    std::string error_message;
    std::optional<DestinationState> destination_state;

    std::string source_label() const;
    std::string destination_label() const;
};

struct TransferOptions {
    bool recursive = false;
    size_t concurrency = constants::DEFAULT_TRANSFER_CONCURRENCY;
};

struct TransferReport {
    std::vector<TransferTask> tasks;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t not_started = 0;   // left Pending by an interrupt
    uint64_t bytes = 0;
    bool interrupted = false;
};

/// Expand a request into one task per file. A directory source requires
/// `recursive`; an empty directory yields no tasks. Copying into an existing
/// directory (or a path with a trailing '/') places the source under it.
std::vector<TransferTask> plan_transfer(StorageBackend& source_backend, const std::string& source,
                                        StorageBackend& destination_backend,
                                        const std::string& destination,
                                        TransferDirection direction, bool recursive);

/// Run the tasks on a bounded pool of worker threads.
///
/// A failing task is recorded and never stops its siblings. An interrupt
/// stops scheduling; tasks already running abort their sink unless they
/// are past commit.
TransferReport run_transfer(CommandContext& ctx, StorageBackend& source_backend,
                            StorageBackend& destination_backend,
                            std::vector<TransferTask> tasks, size_t concurrency,
                            TransferMetrics& metrics);

/// put: `local_path` (on `local`) into ctx.backend at `remote_path`
TransferReport run_put(CommandContext& ctx, StorageBackend& local, const std::string& local_path,
                       const std::string& remote_path, const TransferOptions& options,
                       TransferMetrics& metrics);

/// get: `remote_path` from ctx.backend to `local_path`; always recursive
/// for directories.
TransferReport run_get(CommandContext& ctx, StorageBackend& local, const std::string& remote_path,
                       const std::string& local_path, const TransferOptions& options,
                       TransferMetrics& metrics);

/// Failure lines to ctx.err, then "N succeeded, M failed, B bytes" to ctx.out.
void print_transfer_report(CommandContext& ctx, const TransferReport& report);

/// Local filesystem path as a path for a connector rooted at "/".
std::string local_backend_path(const std::string& local_path);

} // namespace storify
