#pragma once

#include <cstddef>
#include <cstdint>

namespace storify::constants {

constexpr const char* VERSION = "0.1.0";

// Transfer defaults
constexpr size_t DEFAULT_TRANSFER_CONCURRENCY = 8;
constexpr size_t MAX_TRANSFER_CONCURRENCY = 256;
constexpr size_t DEFAULT_STREAM_BUFFER_SIZE = 64 * 1024;               // 64KB
constexpr size_t DEFAULT_READ_CHUNK_SIZE = 8 * 1024 * 1024;            // 8MB per ranged GET
constexpr size_t DEFAULT_MULTIPART_THRESHOLD = 8 * 1024 * 1024;        // 8MB
constexpr size_t DEFAULT_MULTIPART_CHUNK_SIZE = 8 * 1024 * 1024;       // 8MB
constexpr size_t DEFAULT_BINARY_CHECK_SIZE = 8192;                     // 8KB

// Listing
constexpr size_t DEFAULT_LIST_PAGE_SIZE = 1000;

// Command defaults
constexpr size_t DEFAULT_HEAD_LINES = 10;
constexpr size_t DEFAULT_TAIL_LINES = 10;
constexpr size_t DEFAULT_DIFF_CONTEXT = 3;
constexpr uint64_t DEFAULT_SIZE_LIMIT_MB = 10;

// HTTP request defaults
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 60;
constexpr int DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 10;
constexpr int DEFAULT_HTTP_MAX_RETRIES = 3;

// Profile store
constexpr int64_t DEFAULT_TEMP_CONFIG_TTL_SECONDS = 24 * 60 * 60;     // 24 hours
constexpr uint32_t PROFILE_KDF_ITERATIONS = 210000;
constexpr size_t PROFILE_SALT_SIZE = 16;
constexpr size_t PROFILE_NONCE_SIZE = 12;
constexpr size_t PROFILE_TAG_SIZE = 16;
constexpr size_t PROFILE_KEY_SIZE = 32;

// Provider defaults
constexpr const char* DEFAULT_S3_REGION = "us-east-1";
constexpr const char* DEFAULT_OSS_REGION = "cn-hangzhou";
constexpr const char* DEFAULT_COS_REGION = "ap-guangzhou";
constexpr const char* DEFAULT_MINIO_ENDPOINT = "http://127.0.0.1:9000";
constexpr const char* DEFAULT_ROOT_PATH = "/";

// Exit codes
constexpr int EXIT_PARTIAL_FAILURE = 8;
constexpr int EXIT_INTERRUPTED = 130;

} // namespace storify::constants
