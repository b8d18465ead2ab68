#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace storify {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Counters for one batch transfer (put/get).
///
/// Workers update the counters as tasks finish; progress and the final
/// summary are read back from them. The registry can be written to a
/// Prometheus textfile for node_exporter pickup.
class TransferMetrics {
public:
    /// @param labels  Constant labels applied to all metrics.
    explicit TransferMetrics(const std::map<std::string, std::string>& labels = {});

    TransferMetrics(const TransferMetrics&) = delete;
    TransferMetrics& operator=(const TransferMetrics&) = delete;

    // --- Counter accessors ---
    prometheus::Counter& files_succeeded() { return *files_succeeded_; }
    prometheus::Counter& files_failed() { return *files_failed_; }
    prometheus::Counter& upload_bytes() { return *upload_bytes_; }
    prometheus::Counter& download_bytes() { return *download_bytes_; }

    prometheus::Gauge& in_flight() { return *in_flight_; }
    prometheus::Histogram& task_duration() { return *task_duration_; }

    uint64_t succeeded() const;
    uint64_t failed() const;
    uint64_t bytes() const;

    /// Serialize the registry to `path` via temp file + rename.
    /// Returns false (after a warning) when the file cannot be written.
    bool write_textfile(const std::filesystem::path& path) const;

private:
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Counter* files_succeeded_;
    prometheus::Counter* files_failed_;
    prometheus::Counter* upload_bytes_;
    prometheus::Counter* download_bytes_;
    prometheus::Gauge* in_flight_;
    prometheus::Histogram* task_duration_;
};

} // namespace storify
