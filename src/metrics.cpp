#include "storify/commands/metrics.hpp"

#include <fstream>
#include <iostream>
#include <prometheus/text_serializer.h>

namespace storify {

TransferMetrics::TransferMetrics(const std::map<std::string, std::string>& labels)
    : registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& files_family = prometheus::BuildCounter()
        .Name("storify_transfer_files_total")
        .Help("Files transferred by put/get")
        .Labels(labels)
        .Register(*registry_);
    files_succeeded_ = &files_family.Add({{"result", "success"}});
    files_failed_ = &files_family.Add({{"result", "failure"}});

    auto& bytes_family = prometheus::BuildCounter()
        .Name("storify_transfer_bytes_total")
        .Help("Bytes committed at the destination")
        .Labels(labels)
        .Register(*registry_);
    upload_bytes_ = &bytes_family.Add({{"direction", "upload"}});
    download_bytes_ = &bytes_family.Add({{"direction", "download"}});

    // --- Gauges ---

    in_flight_ = &prometheus::BuildGauge()
        .Name("storify_transfer_in_flight")
        .Help("Transfer tasks currently running")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    task_duration_ = &prometheus::BuildHistogram()
        .Name("storify_transfer_duration_seconds")
        .Help("Per-file transfer duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

uint64_t TransferMetrics::succeeded() const {
    return static_cast<uint64_t>(files_succeeded_->Value());
}

uint64_t TransferMetrics::failed() const {
    return static_cast<uint64_t>(files_failed_->Value());
}

uint64_t TransferMetrics::bytes() const {
    return static_cast<uint64_t>(upload_bytes_->Value() + download_bytes_->Value());
}

bool TransferMetrics::write_textfile(const std::filesystem::path& path) const {
    auto tmp_path = path;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        std::cerr << "warning: cannot write metrics file " << tmp_path << "\n";
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) {
        std::cerr << "warning: cannot write metrics file " << tmp_path << "\n";
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::cerr << "warning: cannot install metrics file " << path << ": " << ec.message() << "\n";
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

} // namespace storify
