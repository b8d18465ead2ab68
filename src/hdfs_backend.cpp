#include "storify/storage/backend.hpp"
#include "storify/core/constants.hpp"
#include "storify/core/error.hpp"
#include "storify/core/path.hpp"
#include "storify/core/time_format.hpp"
#include "storify/net/http.hpp"
#include "storify/storage/wire.hpp"

#include <nlohmann/json.hpp>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <iostream>
#include <vector>

namespace storify {

namespace {

using json = nlohmann::json;

// ============================================================================
// HdfsStorageBackend - WebHDFS REST connector
// ============================================================================

class HdfsStorageBackend : public StorageBackend {
public:
    struct Config {
        std::string name_node;   // http://host:port of the NameNode
        std::string root_path = "/";
        std::string user;        // user.name for simple auth (may be empty)
        size_t read_chunk_size = constants::DEFAULT_READ_CHUNK_SIZE;
        size_t write_chunk_size = constants::DEFAULT_MULTIPART_CHUNK_SIZE;
        int request_timeout_seconds = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
    };

    explicit HdfsStorageBackend(const Config& config)
        : config_(config) {
        net::HttpClientConfig http_config;
        http_config.user_agent = "storify-webhdfs/1.0";
        http_config.default_total_timeout = std::chrono::seconds(config.request_timeout_seconds);
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "hdfs"; }

    BackendCapabilities capabilities() const override {
        BackendCapabilities caps;
        caps.ranged_reads = true;
        caps.native_append = true;
        caps.real_directories = true;
        caps.native_copy = false;
        caps.atomic_commit = true;
        return caps;
    }

    struct ListPage {
        std::vector<Entry> entries;
        uint64_t remaining = 0;
    };

    // LISTSTATUS_BATCH page after `start_after`; falls back to a single
    // LISTSTATUS on NameNodes that predate the batch operation
    ListPage list_page(const std::string& dir, const std::string& start_after) {
        ListPage page;
        json statuses;

        if (batch_supported_) {
            std::string url = op_url(dir, "LISTSTATUS_BATCH");
            if (!start_after.empty()) url += "&startAfter=" + net::url_encode(start_after);
            auto response = send(net::HttpRequest::get(url));
            if (response.status_code == 400 && start_after.empty() &&
                remote_exception(response) != "FileNotFoundException") {
                batch_supported_ = false;
            } else {
                check(response, "list", dir);
                json body = parse_json(response, dir);
                statuses = body.value(
                    json::json_pointer("/DirectoryListing/partialListing/FileStatuses/FileStatus"),
                    json::array());
                page.remaining = body.value(
                    json::json_pointer("/DirectoryListing/remainingEntries"), uint64_t{0});
            }
        }
        if (!batch_supported_) {
            auto response = send(net::HttpRequest::get(op_url(dir, "LISTSTATUS")));
            check(response, "list", dir);
            statuses = parse_json(response, dir).value(
                json::json_pointer("/FileStatuses/FileStatus"), json::array());
        }

        for (const auto& status : statuses) {
            std::string name = status.value("pathSuffix", "");
            if (name.empty()) {
                throw StorageError(ErrorKind::InvalidArgument, "not a directory", path::display(dir));
            }
            page.entries.push_back(webhdfs_entry_from_status(dir + name, status));
        }
        std::sort(page.entries.begin(), page.entries.end(),
                  [](const Entry& a, const Entry& b) { return a.path < b.path; });
        return page;
    }

    std::unique_ptr<EntryStream> list_dir(const std::string& dir) override;

    Entry stat(const std::string& p) override {
        std::string rel = path::normalize(p);
        auto response = send(net::HttpRequest::get(op_url(rel, "GETFILESTATUS")));
        check(response, "stat", path::display(rel));
        json body = parse_json(response, rel);
        if (!body.contains("FileStatus")) {
            throw StorageError(ErrorKind::ProviderError, "malformed WebHDFS response", rel);
        }
        return webhdfs_entry_from_status(rel, body["FileStatus"]);
    }

    std::unique_ptr<ReadStream> open_read(const std::string& p,
                                          std::optional<ByteRange> range) override {
        Entry entry = stat(p);
        if (!entry.is_file()) {
            throw StorageError(ErrorKind::InvalidArgument, "is a directory", entry.path);
        }
        uint64_t size = entry.size.value_or(0);
        uint64_t start = range ? std::min(range->offset, size) : 0;
        uint64_t end = size;
        if (range && range->length) end = std::min(size, start + *range->length);

        std::string key = entry.path;
        auto fetch = [this, key](uint64_t first, uint64_t last) {
            std::string url = op_url(key, "OPEN") + "&offset=" + std::to_string(first) +
                              "&length=" + std::to_string(last - first + 1);
            // The NameNode redirects to a DataNode; curl follows
            auto response = send(net::HttpRequest::get(url));
            check(response, "read", key);
            return response.body_string();
        };
        return std::make_unique<ChunkedReadStream>(fetch, start, end, config_.read_chunk_size);
    }

    std::unique_ptr<WriteSink> open_write(const std::string& p) override {
        std::string rel = path::normalize(p);
        if (path::is_dir(rel)) {
            throw StorageError(ErrorKind::InvalidArgument, "cannot write to a directory path", path::display(rel));
        }
        return std::make_unique<StagedWriteSink>(rel,
            [this, rel](const std::filesystem::path& staged, uint64_t size) {
                upload_file(rel, staged, size);
            });
    }

    void remove(const std::string& p) override {
        std::string rel = path::normalize(p);
        if (path::is_root(rel)) {
            throw StorageError(ErrorKind::InvalidArgument, "refusing to remove the root", "/");
        }
        Entry entry = stat(rel);
        if (entry.is_dir() && !list_page(entry.path, "").entries.empty()) {
            throw StorageError(ErrorKind::InvalidArgument, "directory not empty", entry.path);
        }

        net::HttpRequest request = net::HttpRequest::del(op_url(entry.path, "DELETE") + "&recursive=false");
        auto response = send(request);
        check(response, "remove", entry.path);
        if (!parse_json(response, entry.path).value("boolean", false)) {
            throw StorageError(ErrorKind::ProviderError, "NameNode refused the delete", entry.path);
        }
    }

    void create_dir(const std::string& p, bool parents) override {
        std::string rel = path::normalize(p);
        if (path::is_root(rel)) return;

        if (auto existing = try_stat(rel)) {
            if (existing->is_dir()) return;
            throw StorageError(ErrorKind::AlreadyExists, "a file exists at this path", existing->path);
        }
        // MKDIRS always creates missing parents; refuse that unless asked
        if (!parents) {
            std::string parent = path::parent(rel);
            auto parent_entry = try_stat(parent);
            if (!parent_entry) {
                throw StorageError(ErrorKind::NotFound, "parent directory does not exist", rel);
            }
            if (!parent_entry->is_dir()) {
                throw StorageError(ErrorKind::InvalidArgument, "parent is not a directory", rel);
            }
        }

        net::HttpRequest request = net::HttpRequest::put(op_url(rel, "MKDIRS") + "&permission=755", {});
        auto response = send(request);
        check(response, "mkdir", rel);
        if (!parse_json(response, rel).value("boolean", false)) {
            throw StorageError(ErrorKind::ProviderError, "NameNode refused mkdir", rel);
        }
    }

    void copy(const std::string& src, const std::string& dst) override {
        Entry source = stat(src);
        if (!source.is_file()) {
            throw StorageError(ErrorKind::InvalidArgument, "copy source is not a file", source.path);
        }
        auto in = open_read(source.path, std::nullopt);
        auto out = open_write(dst);
        std::vector<char> buf(constants::DEFAULT_STREAM_BUFFER_SIZE);
        while (size_t n = in->read(buf.data(), buf.size())) {
            out->write(buf.data(), n);
        }
        out->commit();
    }

    void rename(const std::string& src, const std::string& dst) override {
        Entry source = stat(src);
        std::string to = path::normalize(dst);
        rename_raw(source.path, source.is_dir() ? path::as_dir(to) : path::as_file(to), false);
    }

    void append(const std::string& p, std::string_view data) override {
        std::string rel = path::as_file(path::normalize(p));
        two_step_write(net::HttpMethod::POST, op_url(rel, "APPEND"),
                       std::vector<uint8_t>(data.begin(), data.end()), rel);
    }

private:
    Config config_;
    std::unique_ptr<net::HttpClient> http_client_;
    std::atomic<bool> batch_supported_{true};
    std::atomic<uint64_t> temp_counter_{0};

    std::string absolute(const std::string& rel) const {
        std::string root = config_.root_path;
        if (root.empty() || root.front() != '/') root = "/" + root;
        if (root.back() != '/') root += "/";
        std::string abs = root + path::as_file(rel);
        if (abs.size() > 1 && abs.back() == '/') abs.pop_back();
        return abs;
    }

    std::string op_url(const std::string& rel, const std::string& op) const {
        std::string url = config_.name_node + "/webhdfs/v1" + net::url_encode_path(absolute(rel)) +
                          "?op=" + op;
        if (!config_.user.empty()) url += "&user.name=" + net::url_encode(config_.user);
        return url;
    }

    net::HttpResponse send(const net::HttpRequest& request) {
        return http_client_->execute_with_retry(request);
    }

    static std::string remote_exception(const net::HttpResponse& response) {
        auto body = json::parse(response.body_string(), nullptr, false);
        if (body.is_discarded() || !body.contains("RemoteException")) return "";
        return body["RemoteException"].value("exception", "");
    }

    static void check(const net::HttpResponse& response, const std::string& op,
                      const std::string& subject) {
        if (response.ok()) return;

        // WebHDFS reports Java exception names; map the ones with a clear kind
        std::string exception = remote_exception(response);
        if (exception == "FileNotFoundException") {
            throw StorageError(ErrorKind::NotFound, op + " failed: no such file or directory", subject);
        }
        if (exception == "AccessControlException" || exception == "SecurityException") {
            throw StorageError(ErrorKind::PermissionDenied, op + " failed: " + exception, subject);
        }
        if (exception == "FileAlreadyExistsException") {
            throw StorageError(ErrorKind::AlreadyExists, op + " failed: " + exception, subject);
        }
        if (exception == "PathIsNotEmptyDirectoryException") {
            throw StorageError(ErrorKind::InvalidArgument, op + " failed: directory not empty", subject);
        }
        throw_http_error(response.status_code, exception, response.error, op, subject);
    }

    static json parse_json(const net::HttpResponse& response, const std::string& subject) {
        auto body = json::parse(response.body_string(), nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            throw StorageError(ErrorKind::ProviderError, "malformed WebHDFS response", subject);
        }
        return body;
    }

    // CREATE and APPEND answer with a redirect to the DataNode that takes the data
    void two_step_write(net::HttpMethod method, const std::string& url,
                        std::vector<uint8_t> data, const std::string& subject) {
        net::HttpRequest first_hop;
        first_hop.method = method;
        first_hop.url = url;
        first_hop.follow_redirects = false;
        auto redirect = send(first_hop);
        if (redirect.status_code != 307) {
            check(redirect, "write", subject);
            throw StorageError(ErrorKind::ProviderError, "NameNode did not redirect the write", subject);
        }
        auto location = redirect.headers.get("Location");
        if (!location) {
            throw StorageError(ErrorKind::ProviderError, "redirect without Location", subject);
        }

        net::HttpRequest request;
        request.method = method;
        request.url = *location;
        request.body = std::move(data);
        request.headers.set_content_type("application/octet-stream");
        auto response = send(request);
        check(response, "write", subject);
    }

    void rename_raw(const std::string& from, const std::string& to, bool overwrite) {
        std::string url = op_url(from, "RENAME") + "&destination=" + net::url_encode(absolute(to));
        if (overwrite) url += "&renameoptions=OVERWRITE";
        auto response = send(net::HttpRequest::put(url, {}));
        check(response, "rename", from);
        // Overwrite renames reply with an empty body
        if (!overwrite && !parse_json(response, from).value("boolean", false)) {
            throw StorageError(ErrorKind::ProviderError,
                               "NameNode refused the rename (destination exists or parent missing)", from);
        }
    }

    // Upload into a hidden sibling, then rename it over the target
    void upload_file(const std::string& key, const std::filesystem::path& staged, uint64_t size) {
        std::ifstream file(staged, std::ios::binary);
        if (!file) {
            throw StorageError(ErrorKind::ProviderError, "cannot reopen staging file", key);
        }

        std::string temp = path::parent(key) + "." + path::basename(key) + ".storify-tmp-" +
                           std::to_string(::getpid()) + "-" + std::to_string(temp_counter_.fetch_add(1));
        try {
            uint64_t offset = 0;
            bool created = false;
            while (!created || offset < size) {
                uint64_t len = std::min<uint64_t>(config_.write_chunk_size, size - offset);
                std::vector<uint8_t> chunk(len);
                file.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(len));
                if (static_cast<uint64_t>(file.gcount()) != len) {
                    throw StorageError(ErrorKind::ProviderError, "short read from staging file", key);
                }
                if (!created) {
                    two_step_write(net::HttpMethod::PUT, op_url(temp, "CREATE") + "&overwrite=true",
                                   std::move(chunk), key);
                    created = true;
                } else {
                    two_step_write(net::HttpMethod::POST, op_url(temp, "APPEND"), std::move(chunk), key);
                }
                offset += len;
            }
            rename_raw(temp, key, true);
        } catch (const StorageError&) {
            auto response = send(net::HttpRequest::del(op_url(temp, "DELETE") + "&recursive=false"));
            if (!response.ok() && response.status_code != 404) {
                std::cerr << "warning: could not remove temporary file " << temp << "\n";
            }
            throw;
        }
    }
};

class HdfsListStream : public EntryStream {
public:
    HdfsListStream(HdfsStorageBackend& backend, std::string dir)
        : backend_(backend), dir_(std::move(dir)) {}

    std::optional<Entry> next() override {
        while (buffer_.empty() && more_) {
            auto page = backend_.list_page(dir_, last_name_);
            for (auto& entry : page.entries) {
                buffer_.push_back(std::move(entry));
            }
            if (!buffer_.empty()) last_name_ = path::basename(buffer_.back().path);
            more_ = page.remaining > 0 && !buffer_.empty();
        }
        if (buffer_.empty()) return std::nullopt;
        Entry entry = std::move(buffer_.front());
        buffer_.pop_front();
        return entry;
    }

private:
    HdfsStorageBackend& backend_;
    std::string dir_;
    std::string last_name_;
    bool more_ = true;
    std::deque<Entry> buffer_;
};

std::unique_ptr<EntryStream> HdfsStorageBackend::list_dir(const std::string& dir) {
    return std::make_unique<HdfsListStream>(*this, path::as_dir(path::normalize(dir)));
}

} // anonymous namespace

Entry webhdfs_entry_from_status(const std::string& rel, const json& status) {
    Entry entry;
    std::string type = status.value("type", "FILE");
    if (type == "DIRECTORY") {
        entry.kind = EntryKind::Directory;
        entry.path = path::as_dir(rel);
    } else {
        entry.kind = type == "FILE" ? EntryKind::File : EntryKind::Other;
        entry.path = path::as_file(rel);
        if (entry.is_file()) entry.size = status.value("length", uint64_t{0});
    }
    if (status.contains("modificationTime")) {
        entry.last_modified = timefmt::from_unix_millis(status["modificationTime"].get<int64_t>());
    }
    return entry;
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_hdfs(const BackendParams& params) {
    auto get = [&](const std::string& key) {
        auto it = params.find(key);
        return it == params.end() ? std::string() : it->second;
    };

    HdfsStorageBackend::Config config;
    config.name_node = get("name_node");
    while (!config.name_node.empty() && config.name_node.back() == '/') config.name_node.pop_back();
    if (config.name_node.empty()) {
        throw StorageError(ErrorKind::ConfigError, "name_node is required for hdfs");
    }
    if (config.name_node.find("://") == std::string::npos) {
        config.name_node = "http://" + config.name_node;
    }
    if (!net::ParsedUrl::parse(config.name_node)) {
        throw StorageError(ErrorKind::ConfigError, "invalid name_node", config.name_node);
    }

    std::string root = get("root_path");
    config.root_path = root.empty() ? constants::DEFAULT_ROOT_PATH : root;

    config.request_timeout_seconds = request_timeout_param(params);
    config.user = get("user");
    if (config.user.empty()) {
        if (const char* env = std::getenv("HADOOP_USER_NAME")) config.user = env;
    }
    return std::make_unique<HdfsStorageBackend>(config);
}

} // namespace storify
