#pragma once

#include "storify/storage/provider.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace storify {

enum class EntryKind {
    File,
    Directory,
    Other,
};

// "file", "dir" or "other"
const char* entry_kind_name(EntryKind kind);

// Metadata about one path. Paths are normalized (see storify/core/path.hpp)
// and directories carry a trailing '/'.
struct Entry {
    std::string path;
    EntryKind kind = EntryKind::File;
    std::optional<uint64_t> size;
    std::optional<std::chrono::system_clock::time_point> last_modified;
    std::string etag;
    std::string content_type;

    bool is_dir() const { return kind == EntryKind::Directory; }
    bool is_file() const { return kind == EntryKind::File; }
};

// Byte window for ranged reads. A missing length reads to the end.
struct ByteRange {
    uint64_t offset = 0;
    std::optional<uint64_t> length;
};

// What a connector can do natively. Commands consult these instead of
// branching on the provider.
struct BackendCapabilities {
    bool ranged_reads = true;
    bool native_append = false;
    bool real_directories = false;  // directories exist independently of files
    bool native_copy = false;
    bool atomic_commit = true;      // a failed write leaves no partial object
};

// Lazy listing cursor. Connectors fetch pages on demand, so abandoning a
// stream early never pulls the rest of the listing.
class EntryStream {
public:
    virtual ~EntryStream() = default;

    // Next entry, or nullopt when exhausted
    virtual std::optional<Entry> next() = 0;
};

class ReadStream {
public:
    virtual ~ReadStream() = default;

    // Read up to len bytes; 0 means end of stream
    virtual size_t read(char* buf, size_t len) = 0;
};

// Sequential writer. Data becomes visible at the destination only when
// commit() returns; a sink destroyed without commit discards what it staged.
class WriteSink {
public:
    virtual ~WriteSink() = default;

    virtual void write(const char* data, size_t len) = 0;
    virtual void commit() = 0;
    virtual void abort() = 0;

    // Bytes accepted so far
    virtual uint64_t bytes_written() const = 0;
};

// Abstract interface for storage connectors.
//
// Every operation reports failure by throwing StorageError with a kind from
// the shared taxonomy; no connector returns provider-specific error types.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    virtual BackendCapabilities capabilities() const = 0;

    // Immediate children of a directory, paged lazily
    virtual std::unique_ptr<EntryStream> list_dir(const std::string& dir) = 0;

    virtual Entry stat(const std::string& path) = 0;

    virtual std::unique_ptr<ReadStream> open_read(const std::string& path,
                                                  std::optional<ByteRange> range = std::nullopt) = 0;

    virtual std::unique_ptr<WriteSink> open_write(const std::string& path) = 0;

    // Remove one file or one empty directory
    virtual void remove(const std::string& path) = 0;

    virtual void create_dir(const std::string& path, bool parents) = 0;

    // Server-side copy of one file
    virtual void copy(const std::string& src, const std::string& dst) = 0;

    virtual void rename(const std::string& src, const std::string& dst) = 0;

    // Native append; only valid when capabilities().native_append is set
    virtual void append(const std::string& path, std::string_view data);

    // Entries under `path`. A file path yields the file itself. With
    // `recursive` the walk is depth-first and each directory is emitted
    // before its children; memory grows with depth, not with tree size.
    std::unique_ptr<EntryStream> list(const std::string& path, bool recursive);

    // stat() that maps NotFound to nullopt
    std::optional<Entry> try_stat(const std::string& path);
    bool exists(const std::string& path);

    // Whole-object read. Throws SizeLimitExceeded past max_bytes.
    std::string read_all(const std::string& path,
                         std::optional<uint64_t> max_bytes = std::nullopt);

    // Replace the object with `data` through open_write/commit
    void write_all(const std::string& path, std::string_view data);
};

// ============================================================================
// Building blocks shared by the remote connectors
// ============================================================================

// Serves a byte window through bounded ranged fetches. `fetch(start, end)`
// returns bytes [start, end] inclusive.
class ChunkedReadStream : public ReadStream {
public:
    using FetchFn = std::function<std::string(uint64_t start, uint64_t end_inclusive)>;

    ChunkedReadStream(FetchFn fetch, uint64_t start, uint64_t end, size_t chunk_size);

    size_t read(char* buf, size_t len) override;

private:
    FetchFn fetch_;
    uint64_t next_;
    uint64_t end_;
    size_t chunk_size_;
    std::string buffer_;
    size_t buffer_pos_ = 0;
};

// Stages written bytes in a local temp file and hands the finished file to
// `publish` on commit. Used by connectors whose upload API needs the total
// size up front.
class StagedWriteSink : public WriteSink {
public:
    using PublishFn = std::function<void(const std::filesystem::path& staged, uint64_t size)>;

    StagedWriteSink(std::string target, PublishFn publish);
    ~StagedWriteSink() override;

    StagedWriteSink(const StagedWriteSink&) = delete;
    StagedWriteSink& operator=(const StagedWriteSink&) = delete;

    void write(const char* data, size_t len) override;
    void commit() override;
    void abort() override;
    uint64_t bytes_written() const override { return size_; }

private:
    std::string target_;
    PublishFn publish_;
    std::filesystem::path staged_;
    int fd_ = -1;
    uint64_t size_ = 0;
    bool finished_ = false;

    void discard() noexcept;
};

// Operations a FaultInjectingStorageBackend can fail
enum class FaultPoint {
    List,
    Stat,
    Read,
    Write,
    Commit,
    Remove,
    CreateDir,
    Copy,
    Rename,
    Append,
};

// Returns true when the operation on `path` should fail
using FaultRule = std::function<bool(FaultPoint point, const std::string& path)>;

// Connector parameters after config resolution (field name -> value)
using BackendParams = std::map<std::string, std::string>;

// Seconds from the "request_timeout" parameter, or the HTTP default when it
// is absent. Throws StorageError(ConfigError) when it is not a number.
int request_timeout_param(const BackendParams& params);

// Factory for creating storage backends from configuration
class StorageBackendFactory {
public:
    // Dispatch on provider; throws StorageError(ConfigError) for missing or
    // malformed parameters
    static std::unique_ptr<StorageBackend> create(Provider provider,
                                                  const BackendParams& params);

    // Local filesystem rooted at root_path
    static std::unique_ptr<StorageBackend> create_local(
        const std::filesystem::path& root_path);

    // S3 protocol connector (AWS S3, MinIO, OSS and COS endpoints)
    static std::unique_ptr<StorageBackend> create_s3(Provider provider,
                                                     const BackendParams& params);

    static std::unique_ptr<StorageBackend> create_azure(const BackendParams& params);

    // WebHDFS connector
    static std::unique_ptr<StorageBackend> create_hdfs(const BackendParams& params);

    // Wrapper that throws ProviderError wherever `rule` matches
    static std::unique_ptr<StorageBackend> create_fault_injecting(
        std::unique_ptr<StorageBackend> backend,
        FaultRule rule);
};

} // namespace storify
