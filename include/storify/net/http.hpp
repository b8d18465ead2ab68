#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace storify::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_retryable_status(int status);

// Case-insensitive header map
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    // All headers as (name, value) pairs, names lowercased
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    void set_content_length(size_t length);

    std::optional<std::string> content_type() const;
    std::optional<size_t> content_length() const;

private:
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Zero means the client default
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::milliseconds total_timeout{0};

    bool verify_ssl = true;
    bool follow_redirects = true;

    // Retry (execute_with_retry only)
    int max_retries = 3;
    std::chrono::milliseconds initial_retry_delay{200};
    double retry_backoff_multiplier = 2.0;

    // start, end (inclusive)
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Transport error description (empty when a status was received)
    std::string error;
    bool is_network_error = false;
};

struct HttpClientConfig {
    size_t max_idle_handles = 16;

    std::chrono::milliseconds default_connect_timeout{10000};
    std::chrono::milliseconds default_total_timeout{60000};

    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    // Upper bound on a buffered response body
    size_t max_response_size = 64 * 1024 * 1024;

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    std::string user_agent = "storify/1.0";

    std::chrono::seconds dns_cache_timeout{60};

    bool verbose = false;
};

// Blocking HTTP client over libcurl easy handles. Handles are pooled and
// reused so consecutive requests to one host keep their connection. Safe to
// call from several transfer workers at once.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    HttpResponse execute(const HttpRequest& request);

    // Retries network errors and retryable statuses with exponential backoff
    HttpResponse execute_with_retry(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS Signature Version 4 request signing (S3, MinIO, and the S3-compatible
// endpoints of OSS and COS)
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service = "s3");

    void sign(HttpRequest& request) const;
    // Sign as of `at` instead of the current time
    void sign(HttpRequest& request, std::chrono::system_clock::time_point at) const;
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;

    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;  // 0 = default for scheme
    std::string path;
    std::string query;

    std::string host_with_port() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

std::string url_encode(const std::string& str);
// Like url_encode but keeps '/' separators (object keys in URL paths)
std::string url_encode_path(const std::string& str);
std::string url_decode(const std::string& str);

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& str);
std::vector<uint8_t> base64_decode(const std::string& encoded);

std::string sha256_hex(const std::string& data);
std::string sha256_hex(const std::vector<uint8_t>& data);
std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data);

} // namespace storify::net
