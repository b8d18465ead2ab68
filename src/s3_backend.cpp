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
#include <deque>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace storify {

namespace {

std::string param_or(const BackendParams& params, const std::string& key,
                     const std::string& fallback = "") {
    auto it = params.find(key);
    return (it == params.end() || it->second.empty()) ? fallback : it->second;
}

// ============================================================================
// S3StorageBackend - S3 protocol connector (AWS S3, MinIO, OSS, COS)
// ============================================================================

class S3StorageBackend : public StorageBackend {
public:
    struct Config {
        Provider provider = Provider::S3;
        std::string bucket;
        S3Endpoint endpoint;
        bool anonymous = false;
        SecureString access_key;  // Uses SecureString to zero on destruction
        SecureString secret_key;
        std::string session_token;
        uint64_t multipart_threshold = constants::DEFAULT_MULTIPART_THRESHOLD;
        uint64_t multipart_chunk_size = constants::DEFAULT_MULTIPART_CHUNK_SIZE;
        size_t read_chunk_size = constants::DEFAULT_READ_CHUNK_SIZE;
        int request_timeout_seconds = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
    };

    explicit S3StorageBackend(const Config& config)
        : config_(config)
        , signer_(config.access_key.str(), config.secret_key.str(), config.endpoint.signing_region, "s3") {
        net::HttpClientConfig http_config;
        http_config.user_agent = "storify-s3/1.0";
        http_config.default_total_timeout = std::chrono::seconds(config.request_timeout_seconds);
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return provider_name(config_.provider); }

    BackendCapabilities capabilities() const override {
        BackendCapabilities caps;
        caps.ranged_reads = true;
        caps.native_append = false;
        caps.real_directories = false;
        caps.native_copy = true;
        caps.atomic_commit = true;
        return caps;
    }

    // One ListObjectsV2 page of the immediate children of `prefix`
    ObjectListPage list_page(const std::string& prefix, const std::string& token,
                             bool delimited, size_t max_keys) {
        std::string url = bucket_url() + "/?list-type=2&prefix=" + net::url_encode(prefix) +
                          "&max-keys=" + std::to_string(max_keys);
        if (delimited) url += "&delimiter=%2F";
        if (!token.empty()) url += "&continuation-token=" + net::url_encode(token);

        net::HttpRequest request = net::HttpRequest::get(url);
        auto response = send(request);
        check(response, "list", path::display(prefix));
        return parse_s3_list(response.body_string(), prefix);
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
            net::HttpRequest request = net::HttpRequest::head(object_url(key));
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

        // No object: a directory exists when anything lives under "key/"
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
            net::HttpRequest request = net::HttpRequest::get(object_url(key));
            request.byte_range = std::make_pair(first, last);
            auto response = send(request);
            check(response, "read", key);
            std::string body = response.body_string();
            // Server ignored the range and sent the whole object
            if (response.status_code == 200 && body.size() > last - first + 1) {
                body = body.substr(first, last - first + 1);
            }
            return body;
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
        std::string key = entry.path;
        if (entry.is_dir()) {
            auto page = list_page(key, "", false, 2);
            if (!page.entries.empty()) {
                throw StorageError(ErrorKind::InvalidArgument, "directory not empty", key);
            }
            // Implied directory with no marker object: nothing left to delete
            if (!page.saw_marker) return;
        }

        net::HttpRequest request = net::HttpRequest::del(object_url(key));
        auto response = send(request);
        check(response, "remove", key);
    }

    void create_dir(const std::string& p, bool) override {
        std::string rel = path::normalize(p);
        if (path::is_root(rel)) return;
        std::string key = path::as_dir(rel);

        net::HttpRequest head_request = net::HttpRequest::head(object_url(path::as_file(key)));
        auto existing = send(head_request);
        if (existing.ok()) {
            throw StorageError(ErrorKind::AlreadyExists, "a file exists at this path", path::as_file(key));
        }

        net::HttpRequest request = net::HttpRequest::put(object_url(key), {});
        request.headers.set_content_type("application/x-directory");
        auto response = send(request);
        check(response, "mkdir", key);
    }

    void copy(const std::string& src, const std::string& dst) override {
        Entry source = stat(src);
        if (!source.is_file()) {
            throw StorageError(ErrorKind::InvalidArgument, "copy source is not a file", source.path);
        }
        std::string dst_key = path::normalize(dst);

        net::HttpRequest request = net::HttpRequest::put(object_url(dst_key), {});
        request.headers.set("x-amz-copy-source",
                            "/" + config_.bucket + "/" + net::url_encode_path(source.path));
        auto response = send(request);
        check(response, "copy", source.path);

        // CopyObject can report failure inside a 200 response
        std::string body = response.body_string();
        if (body.find("<Error>") != std::string::npos) {
            throw_http_error(500, xml::get_element(body, "Code"), "", "copy", source.path);
        }
    }

    void rename(const std::string& src, const std::string& dst) override {
        copy(src, dst);
        remove(src);
    }

private:
    Config config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;

    std::string bucket_url() const {
        return config_.endpoint.bucket_url(config_.bucket);
    }

    std::string object_url(const std::string& key) const {
        return config_.endpoint.object_url(config_.bucket, key);
    }

    // Sign request (unless anonymous) and run it with retries
    net::HttpResponse send(net::HttpRequest& request) {
        if (!config_.anonymous) {
            if (!config_.session_token.empty()) {
                signer_.sign_with_token(request, config_.session_token);
            } else {
                signer_.sign(request);
            }
        }
        return http_client_->execute_with_retry(request);
    }

    static void check(const net::HttpResponse& response, const std::string& op,
                      const std::string& subject) {
        if (response.ok()) return;
        std::string code = xml::get_element(response.body_string(), "Code");
        throw_http_error(response.status_code, code, response.error, op, subject);
    }

    // Ensure ETag has surrounding quotes (required for CompleteMultipartUpload)
    static std::string ensure_etag_quotes(const std::string& etag) {
        if (etag.empty()) return etag;
        std::string result = etag;
        if (result.front() != '"') result = "\"" + result;
        if (result.back() != '"') result += "\"";
        return result;
    }

    static std::vector<uint8_t> read_chunk(std::ifstream& file, uint64_t len, const std::string& key) {
        std::vector<uint8_t> data(len);
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(len));
        if (static_cast<uint64_t>(file.gcount()) != len) {
            throw StorageError(ErrorKind::ProviderError, "short read from staging file", key);
        }
        return data;
    }

    void upload_file(const std::string& key, const std::filesystem::path& staged, uint64_t size) {
        std::ifstream file(staged, std::ios::binary);
        if (!file) {
            throw StorageError(ErrorKind::ProviderError, "cannot reopen staging file", key);
        }

        if (size <= config_.multipart_threshold) {
            net::HttpRequest request = net::HttpRequest::put(object_url(key), read_chunk(file, size, key));
            request.headers.set_content_type("application/octet-stream");
            auto response = send(request);
            check(response, "write", key);
            return;
        }

        std::string upload_id = initiate_multipart_upload(key);
        try {
            std::vector<std::pair<int, std::string>> part_etags;
            uint64_t offset = 0;
            int part_number = 1;
            while (offset < size) {
                uint64_t len = std::min(config_.multipart_chunk_size, size - offset);
                part_etags.emplace_back(part_number,
                    upload_part(key, upload_id, part_number, read_chunk(file, len, key)));
                offset += len;
                ++part_number;
            }
            complete_multipart_upload(key, upload_id, part_etags);
        } catch (const StorageError&) {
            abort_multipart_upload(key, upload_id);
            throw;
        }
    }

    std::string initiate_multipart_upload(const std::string& key) {
        net::HttpRequest request = net::HttpRequest::post(object_url(key) + "?uploads", "");
        request.headers.set_content_type("application/octet-stream");
        auto response = send(request);
        check(response, "write", key);

        std::string upload_id = xml::get_element(response.body_string(), "UploadId");
        if (upload_id.empty()) {
            throw StorageError(ErrorKind::ProviderError, "multipart upload returned no UploadId", key);
        }
        return upload_id;
    }

    std::string upload_part(const std::string& key, const std::string& upload_id,
                            int part_number, std::vector<uint8_t> data) {
        std::string url = object_url(key) +
            "?partNumber=" + std::to_string(part_number) +
            "&uploadId=" + net::url_encode(upload_id);

        net::HttpRequest request = net::HttpRequest::put(url, std::move(data));
        auto response = send(request);
        check(response, "write", key);

        // ETag from header comes quoted - preserve quotes for CompleteMultipartUpload
        return ensure_etag_quotes(response.headers.get("ETag").value_or(""));
    }

    void complete_multipart_upload(const std::string& key, const std::string& upload_id,
                                   const std::vector<std::pair<int, std::string>>& part_etags) {
        std::string url = object_url(key) + "?uploadId=" + net::url_encode(upload_id);

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        for (const auto& [part_num, etag] : part_etags) {
            body << "  <Part>\n";
            body << "    <PartNumber>" << part_num << "</PartNumber>\n";
            body << "    <ETag>" << xml::escape(etag) << "</ETag>\n";
            body << "  </Part>\n";
        }
        body << "</CompleteMultipartUpload>";

        net::HttpRequest request = net::HttpRequest::post(url, body.str());
        request.headers.set_content_type("application/xml");
        auto response = send(request);
        check(response, "write", key);

        // CompleteMultipartUpload can fail after a 200 status line
        std::string reply = response.body_string();
        if (reply.find("<Error>") != std::string::npos) {
            throw_http_error(500, xml::get_element(reply, "Code"), "", "write", key);
        }
    }

    void abort_multipart_upload(const std::string& key, const std::string& upload_id) {
        std::string url = object_url(key) + "?uploadId=" + net::url_encode(upload_id);
        net::HttpRequest request = net::HttpRequest::del(url);
        auto response = send(request);
        if (!response.ok()) {
            std::cerr << "warning: failed to abort multipart upload for " << key
                      << " (HTTP " << response.status_code << ")\n";
        }
    }
};

// Pages through ListObjectsV2 only as entries are consumed
class S3ListStream : public EntryStream {
public:
    S3ListStream(S3StorageBackend& backend, std::string prefix)
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
    S3StorageBackend& backend_;
    std::string prefix_;
    std::string token_;
    bool more_ = true;
    bool first_ = true;
    std::deque<Entry> buffer_;

    void fetch() {
        auto page = backend_.list_page(prefix_, token_, true, constants::DEFAULT_LIST_PAGE_SIZE);
        if (first_ && !prefix_.empty() && page.entries.empty() && !page.saw_marker && !page.truncated) {
            throw StorageError(ErrorKind::NotFound, "no such directory", prefix_);
        }
        first_ = false;
        for (auto& entry : page.entries) {
            buffer_.push_back(std::move(entry));
        }
        more_ = page.truncated && !page.next_token.empty();
        token_ = page.next_token;
    }
};

std::unique_ptr<EntryStream> S3StorageBackend::list_dir(const std::string& dir) {
    return std::make_unique<S3ListStream>(*this, path::as_dir(path::normalize(dir)));
}

std::string with_scheme(const std::string& endpoint) {
    std::string out = endpoint;
    while (!out.empty() && out.back() == '/') out.pop_back();
    if (out.find("://") == std::string::npos) out = "https://" + out;
    return out;
}

} // anonymous namespace

// ============================================================================
// Wire format
// ============================================================================

std::string S3Endpoint::bucket_url(const std::string& bucket) const {
    if (use_path_style) {
        return endpoint + "/" + bucket;
    }
    auto url = net::ParsedUrl::parse(endpoint);
    if (!url) return endpoint;
    return url->scheme + "://" + bucket + "." + url->host_with_port();
}

std::string S3Endpoint::object_url(const std::string& bucket, const std::string& key) const {
    return bucket_url(bucket) + "/" + net::url_encode_path(key);
}

S3Endpoint resolve_s3_endpoint(Provider provider, const BackendParams& params) {
    S3Endpoint out;
    std::string endpoint = param_or(params, "endpoint");
    switch (provider) {
        case Provider::S3:
            out.region = param_or(params, "region", constants::DEFAULT_S3_REGION);
            out.signing_region = out.region;
            // Custom endpoints are usually S3-compatible servers that want path-style
            out.use_path_style = !endpoint.empty();
            if (endpoint.empty()) endpoint = "https://s3." + out.region + ".amazonaws.com";
            break;
        case Provider::Minio:
            out.region = param_or(params, "region", constants::DEFAULT_S3_REGION);
            out.signing_region = out.region;
            out.use_path_style = true;
            if (endpoint.empty()) endpoint = constants::DEFAULT_MINIO_ENDPOINT;
            break;
        case Provider::Oss: {
            out.region = param_or(params, "region", constants::DEFAULT_OSS_REGION);
            std::string bare = out.region.starts_with("oss-") ? out.region.substr(4) : out.region;
            out.signing_region = "oss-" + bare;
            if (endpoint.empty()) endpoint = "https://oss-" + bare + ".aliyuncs.com";
            break;
        }
        case Provider::Cos:
            out.region = param_or(params, "region", constants::DEFAULT_COS_REGION);
            out.signing_region = out.region;
            if (endpoint.empty()) endpoint = "https://cos." + out.region + ".myqcloud.com";
            break;
        default:
            throw StorageError(ErrorKind::ConfigError,
                               std::string(provider_name(provider)) + " is not an S3-compatible provider");
    }
    if (param_or(params, "path_style") == "true") out.use_path_style = true;
    out.endpoint = with_scheme(endpoint);

    if (!net::ParsedUrl::parse(out.endpoint)) {
        throw StorageError(ErrorKind::ConfigError, "invalid endpoint", out.endpoint);
    }
    return out;
}

ObjectListPage parse_s3_list(const std::string& body, const std::string& prefix) {
    ObjectListPage page;
    page.truncated = xml::get_element(body, "IsTruncated") == "true";
    page.next_token = xml::decode_entities(xml::get_element(body, "NextContinuationToken"));

    for (const auto& range : xml::find_elements(body, "Contents")) {
        std::string content = range.content(body);
        std::string key = xml::decode_entities(xml::get_element(content, "Key"));
        if (key.empty()) continue;
        if (key == prefix) {
            page.saw_marker = true;
            continue;
        }

        Entry entry;
        if (key.back() == '/') {
            // Marker object of an empty directory below a non-delimited listing
            entry.kind = EntryKind::Directory;
        } else {
            entry.kind = EntryKind::File;
            std::string size_str = xml::get_element(content, "Size");
            entry.size = size_str.empty() ? 0 : std::stoull(size_str);
        }
        entry.path = key;
        entry.etag = xml::decode_entities(xml::get_element(content, "ETag"));
        entry.last_modified = timefmt::parse_iso8601(xml::get_element(content, "LastModified"));
        page.entries.push_back(std::move(entry));
    }

    for (const auto& range : xml::find_elements(body, "CommonPrefixes")) {
        Entry entry;
        entry.kind = EntryKind::Directory;
        entry.path = xml::decode_entities(xml::get_element(range.content(body), "Prefix"));
        page.entries.push_back(std::move(entry));
    }

    // Contents and CommonPrefixes arrive as two sorted runs
    std::sort(page.entries.begin(), page.entries.end(),
              [](const Entry& a, const Entry& b) { return a.path < b.path; });
    return page;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<StorageBackend> StorageBackendFactory::create_s3(Provider provider,
                                                                 const BackendParams& params) {
    S3StorageBackend::Config config;
    config.provider = provider;
    config.bucket = param_or(params, "bucket");
    if (config.bucket.empty()) {
        throw StorageError(ErrorKind::ConfigError,
                           std::string("bucket is required for ") + provider_name(provider));
    }

    config.access_key = SecureString(param_or(params, "access_key_id"));
    config.secret_key = SecureString(param_or(params, "access_key_secret"));
    config.session_token = param_or(params, "session_token");
    config.anonymous = param_or(params, "anonymous") == "true";
    config.request_timeout_seconds = request_timeout_param(params);
    if (!config.anonymous && (config.access_key.empty() || config.secret_key.empty())) {
        throw StorageError(ErrorKind::ConfigError,
                           std::string("credentials are required for ") + provider_name(provider));
    }

    config.endpoint = resolve_s3_endpoint(provider, params);
    return std::make_unique<S3StorageBackend>(config);
}

} // namespace storify
