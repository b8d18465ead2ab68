#include "storify/storage/backend.hpp"
#include "storify/core/constants.hpp"
#include "storify/core/error.hpp"
#include "storify/core/path.hpp"
#include "storify/core/secure_string.hpp"
#include "storify/core/time_format.hpp"
#include "storify/net/http.hpp"
#include "storify/storage/wire.hpp"
#include "storify/storage/xml.hpp"

#include <algorithm>
#include <cstdio>
#include <deque>
#include <fstream>
#include <map>
#include <sstream>
#include <thread>
#include <vector>

namespace storify {

namespace {

// ============================================================================
// AzureStorageBackend - Azure Blob Storage connector
// ============================================================================

class AzureStorageBackend : public StorageBackend {
public:
    struct Config {
        std::string account_name;
        SecureString account_key;       // SharedKey auth, base64
        std::string container;
        std::string endpoint;           // Empty for Azure, custom for Azurite emulator
        uint64_t block_threshold = constants::DEFAULT_MULTIPART_THRESHOLD;
        uint64_t block_size = constants::DEFAULT_MULTIPART_CHUNK_SIZE;
        size_t read_chunk_size = constants::DEFAULT_READ_CHUNK_SIZE;
        int request_timeout_seconds = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
    };

    explicit AzureStorageBackend(const Config& config)
        : config_(config) {
        net::HttpClientConfig http_config;
        http_config.user_agent = "storify-azure/1.0";
        http_config.default_total_timeout = std::chrono::seconds(config.request_timeout_seconds);
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "azblob"; }

    BackendCapabilities capabilities() const override {
        BackendCapabilities caps;
        caps.ranged_reads = true;
        caps.native_append = false;
        caps.real_directories = false;
        caps.native_copy = true;
        caps.atomic_commit = true;
        return caps;
    }

    ObjectListPage list_page(const std::string& prefix, const std::string& marker,
                             bool delimited, size_t max_results) {
        std::string url = container_url() + "?restype=container&comp=list";
        if (!prefix.empty()) url += "&prefix=" + net::url_encode(prefix);
        if (delimited) url += "&delimiter=%2F";
        url += "&maxresults=" + std::to_string(max_results);
        if (!marker.empty()) url += "&marker=" + net::url_encode(marker);

        net::HttpRequest request = net::HttpRequest::get(url);
        auto response = send(request);
        check(response, "list", path::display(prefix));

        return parse_azure_list(response.body_string(), prefix);
    }

    std::unique_ptr<EntryStream> list_dir(const std::string& dir) override;

    Entry stat(const std::string& p) override {
        std::string rel = path::normalize(p);
        if (path::is_root(rel)) {
            Entry root;
            root.kind = EntryKind::Directory;
            return root;
        }

        std::string key = path::as_file(rel);
        if (!path::is_dir(rel)) {
            net::HttpRequest request = net::HttpRequest::head(blob_url(key));
            auto response = send(request);
            if (response.ok()) {
                Entry entry;
                entry.kind = EntryKind::File;
                entry.path = key;
                entry.size = response.headers.content_length().value_or(0);
                entry.etag = response.headers.get("ETag").value_or("");
                entry.content_type = response.headers.content_type().value_or("");
                if (auto lm = response.headers.get("Last-Modified")) {
                    entry.last_modified = timefmt::parse_http_date(*lm);
                }
                return entry;
            }
            if (response.status_code != 404) {
                check(response, "stat", rel);
            }
        }

        auto page = list_page(key + "/", "", false, 1);
        if (page.saw_marker || !page.entries.empty()) {
            Entry entry;
            entry.kind = EntryKind::Directory;
            entry.path = key + "/";
            return entry;
        }
        throw StorageError(ErrorKind::NotFound, "no such file or directory", rel);
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
            net::HttpRequest request = net::HttpRequest::get(blob_url(key));
            // x-ms-range is part of the signed headers, unlike a curl range
            request.headers.set("x-ms-range",
                                "bytes=" + std::to_string(first) + "-" + std::to_string(last));
            auto response = send(request);
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

        std::string key = path::as_file(rel);
        if (path::is_dir(rel) || !delete_blob(key, true)) {
            Entry entry = stat(rel);
            if (!entry.is_dir()) {
                // Appeared between the delete and the stat
                delete_blob(entry.path, false);
                return;
            }
            auto page = list_page(entry.path, "", false, 2);
            if (!page.entries.empty()) {
                throw StorageError(ErrorKind::InvalidArgument, "directory not empty", entry.path);
            }
            if (page.saw_marker) delete_blob(entry.path, false);
        }
    }

    void create_dir(const std::string& p, bool) override {
        std::string rel = path::normalize(p);
        if (path::is_root(rel)) return;
        std::string key = path::as_dir(rel);

        net::HttpRequest head_request = net::HttpRequest::head(blob_url(path::as_file(key)));
        if (send(head_request).ok()) {
            throw StorageError(ErrorKind::AlreadyExists, "a file exists at this path", path::as_file(key));
        }

        net::HttpRequest request = net::HttpRequest::put(blob_url(key), {});
        request.headers.set("x-ms-blob-type", "BlockBlob");
        auto response = send(request);
        check(response, "mkdir", key);
    }

    void copy(const std::string& src, const std::string& dst) override {
        Entry source = stat(src);
        if (!source.is_file()) {
            throw StorageError(ErrorKind::InvalidArgument, "copy source is not a file", source.path);
        }
        std::string dst_key = path::normalize(dst);

        net::HttpRequest request = net::HttpRequest::put(blob_url(dst_key), {});
        request.headers.set("x-ms-copy-source", blob_url(source.path));
        auto response = send(request);
        check(response, "copy", source.path);

        // Same-account copies usually finish synchronously; otherwise poll
        std::string status = response.headers.get("x-ms-copy-status").value_or("success");
        while (status == "pending") {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            net::HttpRequest head_request = net::HttpRequest::head(blob_url(dst_key));
            auto props = send(head_request);
            check(props, "copy", dst_key);
            status = props.headers.get("x-ms-copy-status").value_or("success");
        }
        if (status != "success") {
            throw StorageError(ErrorKind::ProviderError, "copy ended with status " + status, source.path);
        }
    }

    void rename(const std::string& src, const std::string& dst) override {
        copy(src, dst);
        remove(src);
    }

private:
    Config config_;
    std::unique_ptr<net::HttpClient> http_client_;

    std::string container_url() const {
        if (!config_.endpoint.empty()) {
            return config_.endpoint + "/" + config_.container;
        }
        return "https://" + config_.account_name + ".blob.core.windows.net/" + config_.container;
    }

    std::string blob_url(const std::string& key) const {
        return container_url() + "/" + net::url_encode_path(key);
    }

    // Returns false on 404; other failures throw
    bool delete_blob(const std::string& key, bool missing_ok) {
        net::HttpRequest request = net::HttpRequest::del(blob_url(key));
        auto response = send(request);
        if (response.status_code == 404 && missing_ok) return false;
        check(response, "remove", key);
        return true;
    }

    net::HttpResponse send(net::HttpRequest& request) {
        add_common_headers(request);
        sign_request(request);
        return http_client_->execute_with_retry(request);
    }

    static void check(const net::HttpResponse& response, const std::string& op,
                      const std::string& subject) {
        if (response.ok()) return;
        // HEAD responses carry the code only in a header
        std::string code = response.headers.get("x-ms-error-code")
                               .value_or(xml::get_element(response.body_string(), "Code"));
        throw_http_error(response.status_code, code, response.error, op, subject);
    }

    void add_common_headers(net::HttpRequest& request) const {
        // Azure requires x-ms-date and x-ms-version on all requests
        request.headers.set("x-ms-date", timefmt::format_http_date(std::chrono::system_clock::now()));
        request.headers.set("x-ms-version", "2020-10-02");
    }

    // Azure SharedKey signing
    void sign_request(net::HttpRequest& request) const {
        // StringToSign format:
        // VERB\nContent-Encoding\nContent-Language\nContent-Length\nContent-MD5\n
        // Content-Type\nDate\nIf-Modified-Since\nIf-Match\nIf-None-Match\n
        // If-Unmodified-Since\nRange\nx-ms-headers\nCanonicalizedResource
        std::string string_to_sign;
        string_to_sign += std::string(net::http_method_to_string(request.method)) + "\n";
        string_to_sign += "\n"; // Content-Encoding
        string_to_sign += "\n"; // Content-Language
        // Zero length is signed as an empty string
        string_to_sign += request.body.empty() ? "\n" : std::to_string(request.body.size()) + "\n";
        string_to_sign += "\n"; // Content-MD5
        string_to_sign += request.headers.content_type().value_or("") + "\n";
        string_to_sign += "\n"; // Date (use x-ms-date instead)
        string_to_sign += "\n"; // If-Modified-Since
        string_to_sign += request.headers.get("If-Match").value_or("") + "\n";
        string_to_sign += request.headers.get("If-None-Match").value_or("") + "\n";
        string_to_sign += "\n"; // If-Unmodified-Since
        string_to_sign += "\n"; // Range (x-ms-range is used instead)

        // Canonicalized x-ms- headers; HttpHeaders keeps names lowercased and sorted
        for (const auto& [name, value] : request.headers.all()) {
            if (name.starts_with("x-ms-")) {
                string_to_sign += name + ":" + value + "\n";
            }
        }

        // Canonicalized resource: /account/<encoded url path>
        auto url = net::ParsedUrl::parse(request.url);
        string_to_sign += "/" + config_.account_name + (url ? url->path : std::string("/"));

        if (url && !url->query.empty()) {
            std::map<std::string, std::string> params;
            size_t pos = 0;
            while (pos < url->query.size()) {
                auto amp = url->query.find('&', pos);
                if (amp == std::string::npos) amp = url->query.size();
                std::string param = url->query.substr(pos, amp - pos);
                auto eq = param.find('=');
                std::string name = param.substr(0, eq);
                std::transform(name.begin(), name.end(), name.begin(), ::tolower);
                params[name] = eq == std::string::npos ? "" : net::url_decode(param.substr(eq + 1));
                pos = amp + 1;
            }
            for (const auto& [pname, pval] : params) {
                string_to_sign += "\n" + pname + ":" + pval;
            }
        }

        // HMAC-SHA256 with base64-decoded account key
        auto decoded_key = net::base64_decode(config_.account_key.str());
        auto signature = net::hmac_sha256(decoded_key, string_to_sign);
        request.headers.set("Authorization",
                            "SharedKey " + config_.account_name + ":" + net::base64_encode(signature));
    }

    static std::vector<uint8_t> read_chunk(std::ifstream& file, uint64_t len, const std::string& key) {
        std::vector<uint8_t> data(len);
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(len));
        if (static_cast<uint64_t>(file.gcount()) != len) {
            throw StorageError(ErrorKind::ProviderError, "short read from staging file", key);
        }
        return data;
    }

    // Block IDs must all have the same length within one blob
    static std::string block_id(size_t index) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "block-%08zu", index);
        return net::base64_encode(std::string(buf));
    }

    void upload_file(const std::string& key, const std::filesystem::path& staged, uint64_t size) {
        std::ifstream file(staged, std::ios::binary);
        if (!file) {
            throw StorageError(ErrorKind::ProviderError, "cannot reopen staging file", key);
        }

        if (size <= config_.block_threshold) {
            net::HttpRequest request = net::HttpRequest::put(blob_url(key), read_chunk(file, size, key));
            request.headers.set("x-ms-blob-type", "BlockBlob");
            request.headers.set_content_type("application/octet-stream");
            auto response = send(request);
            check(response, "write", key);
            return;
        }

        // Uncommitted blocks are invisible and expire on their own, so a
        // failure before the block list lands leaves nothing behind
        std::vector<std::string> ids;
        uint64_t offset = 0;
        while (offset < size) {
            uint64_t len = std::min(config_.block_size, size - offset);
            std::string id = block_id(ids.size());
            std::string url = blob_url(key) + "?comp=block&blockid=" + net::url_encode(id);
            net::HttpRequest request = net::HttpRequest::put(url, read_chunk(file, len, key));
            auto response = send(request);
            check(response, "write", key);
            ids.push_back(id);
            offset += len;
        }

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<BlockList>\n";
        for (const auto& id : ids) {
            body << "  <Latest>" << id << "</Latest>\n";
        }
        body << "</BlockList>";
        std::string xml_body = body.str();

        net::HttpRequest request = net::HttpRequest::put(blob_url(key) + "?comp=blocklist",
            std::vector<uint8_t>(xml_body.begin(), xml_body.end()));
        request.headers.set_content_type("application/xml");
        auto response = send(request);
        check(response, "write", key);
    }
};

class AzureListStream : public EntryStream {
public:
    AzureListStream(AzureStorageBackend& backend, std::string prefix)
        : backend_(backend), prefix_(std::move(prefix)) {}

    std::optional<Entry> next() override {
        while (buffer_.empty() && more_) {
            fetch();
        }
        if (buffer_.empty()) return std::nullopt;
        Entry entry = std::move(buffer_.front());
        buffer_.pop_front();
        return entry;
    }

private:
    AzureStorageBackend& backend_;
    std::string prefix_;
    std::string marker_;
    bool more_ = true;
    bool first_ = true;
    std::deque<Entry> buffer_;

    void fetch() {
        auto page = backend_.list_page(prefix_, marker_, true, constants::DEFAULT_LIST_PAGE_SIZE);
        if (first_ && !prefix_.empty() && page.entries.empty() && !page.saw_marker &&
            !page.truncated) {
            throw StorageError(ErrorKind::NotFound, "no such directory", prefix_);
        }
        first_ = false;
        for (auto& entry : page.entries) {
            buffer_.push_back(std::move(entry));
        }
        marker_ = page.next_token;
        more_ = page.truncated;
    }
};

std::unique_ptr<EntryStream> AzureStorageBackend::list_dir(const std::string& dir) {
    return std::make_unique<AzureListStream>(*this, path::as_dir(path::normalize(dir)));
}

} // anonymous namespace

ObjectListPage parse_azure_list(const std::string& body, const std::string& prefix) {
    ObjectListPage page;
    page.next_token = xml::get_element(body, "NextMarker");
    page.truncated = !page.next_token.empty();

    for (const auto& range : xml::find_elements(body, "Blob")) {
        std::string content = range.content(body);
        std::string name = xml::decode_entities(xml::get_element(content, "Name"));
        if (name.empty()) continue;
        if (name == prefix) {
            page.saw_marker = true;
            continue;
        }

        Entry entry;
        entry.path = name;
        entry.kind = name.back() == '/' ? EntryKind::Directory : EntryKind::File;

        std::string props = xml::get_element(content, "Properties");
        if (!props.empty()) {
            std::string size_str = xml::get_element(props, "Content-Length");
            if (entry.is_file()) entry.size = size_str.empty() ? 0 : std::stoull(size_str);
            entry.etag = xml::decode_entities(xml::get_element(props, "Etag"));
            entry.content_type = xml::get_element(props, "Content-Type");
            entry.last_modified = timefmt::parse_http_date(xml::get_element(props, "Last-Modified"));
        }
        page.entries.push_back(std::move(entry));
    }

    // BlobPrefix elements are the directories of a delimited listing
    for (const auto& range : xml::find_elements(body, "BlobPrefix")) {
        Entry entry;
        entry.kind = EntryKind::Directory;
        entry.path = xml::decode_entities(xml::get_element(range.content(body), "Name"));
        page.entries.push_back(std::move(entry));
    }

    std::sort(page.entries.begin(), page.entries.end(),
              [](const Entry& a, const Entry& b) { return a.path < b.path; });
    return page;
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_azure(const BackendParams& params) {
    auto get = [&](const std::string& key) {
        auto it = params.find(key);
        return it == params.end() ? std::string() : it->second;
    };

    AzureStorageBackend::Config config;
    config.container = get("bucket");
    config.account_name = get("access_key_id");
    config.account_key = SecureString(get("access_key_secret"));
    config.endpoint = get("endpoint");
    config.request_timeout_seconds = request_timeout_param(params);
    while (!config.endpoint.empty() && config.endpoint.back() == '/') config.endpoint.pop_back();

    if (config.container.empty()) {
        throw StorageError(ErrorKind::ConfigError, "container (bucket) is required for azblob");
    }
    if (config.account_name.empty() || config.account_key.empty()) {
        throw StorageError(ErrorKind::ConfigError, "account name and key are required for azblob");
    }
    if (net::base64_decode(config.account_key.str()).empty()) {
        throw StorageError(ErrorKind::ConfigError, "account key is not valid base64");
    }
    if (!config.endpoint.empty() && !net::ParsedUrl::parse(config.endpoint)) {
        throw StorageError(ErrorKind::ConfigError, "invalid endpoint", config.endpoint);
    }
    return std::make_unique<AzureStorageBackend>(config);
}

} // namespace storify
