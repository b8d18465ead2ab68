#include "storify/storage/backend.hpp"
#include "storify/core/constants.hpp"
#include "storify/core/error.hpp"
#include "storify/core/path.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>

namespace storify {

namespace fs = std::filesystem;

// ============================================================================
// Provider names
// ============================================================================

const char* provider_name(Provider provider) {
    switch (provider) {
        case Provider::Oss: return "oss";
        case Provider::S3: return "s3";
        case Provider::Minio: return "minio";
        case Provider::Cos: return "cos";
        case Provider::Fs: return "fs";
        case Provider::Hdfs: return "hdfs";
        case Provider::Azblob: return "azblob";
    }
    return "unknown";
}

std::optional<Provider> parse_provider(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (Provider p : all_providers()) {
        if (lower == provider_name(p)) return p;
    }
    if (lower == "azure") return Provider::Azblob;
    return std::nullopt;
}

const std::vector<Provider>& all_providers() {
    static const std::vector<Provider> providers = {
        Provider::Oss, Provider::S3, Provider::Minio, Provider::Cos,
        Provider::Fs, Provider::Hdfs, Provider::Azblob,
    };
    return providers;
}

bool provider_supports_anonymous(Provider provider) {
    switch (provider) {
        case Provider::Oss:
        case Provider::S3:
        case Provider::Minio:
        case Provider::Fs:
            return true;
        case Provider::Cos:
        case Provider::Hdfs:
        case Provider::Azblob:
            return false;
    }
    return false;
}

const char* entry_kind_name(EntryKind kind) {
    switch (kind) {
        case EntryKind::File: return "file";
        case EntryKind::Directory: return "dir";
        case EntryKind::Other: return "other";
    }
    return "other";
}

// ============================================================================
// StorageBackend - operations built on the connector primitives
// ============================================================================

namespace {

class SingleEntryStream : public EntryStream {
public:
    explicit SingleEntryStream(Entry entry) : entry_(std::move(entry)) {}

    std::optional<Entry> next() override {
        if (done_) return std::nullopt;
        done_ = true;
        return entry_;
    }

private:
    Entry entry_;
    bool done_ = false;
};

// Depth-first walk holding one open listing per directory level
class RecursiveEntryStream : public EntryStream {
public:
    RecursiveEntryStream(StorageBackend& backend, std::unique_ptr<EntryStream> top)
        : backend_(backend) {
        stack_.push_back(std::move(top));
    }

    std::optional<Entry> next() override {
        while (!stack_.empty()) {
            auto entry = stack_.back()->next();
            if (!entry) {
                stack_.pop_back();
                continue;
            }
            if (entry->is_dir()) {
                stack_.push_back(backend_.list_dir(entry->path));
            }
            return entry;
        }
        return std::nullopt;
    }

private:
    StorageBackend& backend_;
    std::vector<std::unique_ptr<EntryStream>> stack_;
};

} // anonymous namespace

void StorageBackend::append(const std::string& path, std::string_view) {
    throw StorageError(ErrorKind::InvalidArgument,
                       type_name() + " backend has no native append", path);
}

std::unique_ptr<EntryStream> StorageBackend::list(const std::string& raw_path, bool recursive) {
    std::string p = path::normalize(raw_path);
    if (!path::is_dir(p)) {
        Entry entry = stat(p);
        if (!entry.is_dir()) {
            return std::make_unique<SingleEntryStream>(std::move(entry));
        }
        p = path::as_dir(p);
    }

    auto top = list_dir(p);
    if (!recursive) return top;
    return std::make_unique<RecursiveEntryStream>(*this, std::move(top));
}

std::optional<Entry> StorageBackend::try_stat(const std::string& p) {
    try {
        return stat(p);
    } catch (const StorageError& e) {
        if (e.kind() == ErrorKind::NotFound) return std::nullopt;
        throw;
    }
}

bool StorageBackend::exists(const std::string& p) {
    return try_stat(p).has_value();
}

std::string StorageBackend::read_all(const std::string& p, std::optional<uint64_t> max_bytes) {
    if (max_bytes) {
        Entry entry = stat(p);
        if (entry.size && *entry.size > *max_bytes) {
            throw StorageError(ErrorKind::SizeLimitExceeded,
                               "object is " + std::to_string(*entry.size) +
                               " bytes, limit is " + std::to_string(*max_bytes), p);
        }
    }

    auto stream = open_read(p);
    std::string out;
    std::vector<char> buf(constants::DEFAULT_STREAM_BUFFER_SIZE);
    while (size_t n = stream->read(buf.data(), buf.size())) {
        out.append(buf.data(), n);
        if (max_bytes && out.size() > *max_bytes) {
            throw StorageError(ErrorKind::SizeLimitExceeded,
                               "object exceeds limit of " + std::to_string(*max_bytes) + " bytes", p);
        }
    }
    return out;
}

void StorageBackend::write_all(const std::string& p, std::string_view data) {
    auto sink = open_write(p);
    sink->write(data.data(), data.size());
    sink->commit();
}

// ============================================================================
// ChunkedReadStream
// ============================================================================

ChunkedReadStream::ChunkedReadStream(FetchFn fetch, uint64_t start, uint64_t end, size_t chunk_size)
    : fetch_(std::move(fetch)), next_(start), end_(end), chunk_size_(chunk_size) {}

size_t ChunkedReadStream::read(char* buf, size_t len) {
    if (buffer_pos_ >= buffer_.size()) {
        if (next_ >= end_) return 0;
        uint64_t chunk_end = std::min<uint64_t>(next_ + chunk_size_, end_);
        buffer_ = fetch_(next_, chunk_end - 1);
        buffer_pos_ = 0;
        if (buffer_.empty()) {
            throw StorageError(ErrorKind::ProviderError,
                               "provider returned no data at offset " + std::to_string(next_));
        }
        next_ += buffer_.size();
    }

    size_t n = std::min(len, buffer_.size() - buffer_pos_);
    std::memcpy(buf, buffer_.data() + buffer_pos_, n);
    buffer_pos_ += n;
    return n;
}

// ============================================================================
// StagedWriteSink
// ============================================================================

static void write_fully(int fd, const char* data, size_t len, const std::string& subject) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno_error(errno, "write", subject);
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
}

StagedWriteSink::StagedWriteSink(std::string target, PublishFn publish)
    : target_(std::move(target)), publish_(std::move(publish)) {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) dir = "/tmp";
    std::string templ = (dir / "storify-stage-XXXXXX").string();
    fd_ = ::mkstemp(templ.data());
    if (fd_ < 0) {
        throw_errno_error(errno, "create staging file", templ);
    }
    staged_ = templ;
}

StagedWriteSink::~StagedWriteSink() {
    discard();
}

void StagedWriteSink::write(const char* data, size_t len) {
    if (finished_) {
        throw StorageError(ErrorKind::InvalidArgument, "write after commit or abort", target_);
    }
    write_fully(fd_, data, len, target_);
    size_ += len;
}

void StagedWriteSink::commit() {
    if (finished_) {
        throw StorageError(ErrorKind::InvalidArgument, "sink already finished", target_);
    }
    ::close(fd_);
    fd_ = -1;
    try {
        publish_(staged_, size_);
    } catch (...) {
        discard();
        throw;
    }
    discard();
}

void StagedWriteSink::abort() {
    discard();
}

void StagedWriteSink::discard() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!staged_.empty()) {
        ::unlink(staged_.c_str());
        staged_.clear();
    }
    finished_ = true;
}

// ============================================================================
// LocalStorageBackend - File system implementation
// ============================================================================

namespace {

std::chrono::system_clock::time_point mtime_of(const struct stat& st) {
    auto since_epoch = std::chrono::seconds(st.st_mtim.tv_sec) +
                       std::chrono::nanoseconds(st.st_mtim.tv_nsec);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

Entry entry_from_stat(const std::string& rel, const struct stat& st) {
    Entry entry;
    if (S_ISDIR(st.st_mode)) {
        entry.kind = EntryKind::Directory;
        entry.path = path::as_dir(rel);
    } else if (S_ISREG(st.st_mode)) {
        entry.kind = EntryKind::File;
        entry.path = path::as_file(rel);
        entry.size = static_cast<uint64_t>(st.st_size);
    } else {
        entry.kind = EntryKind::Other;
        entry.path = path::as_file(rel);
    }
    entry.last_modified = mtime_of(st);
    return entry;
}

class LocalDirStream : public EntryStream {
public:
    LocalDirStream(fs::path dir, std::string rel_dir, std::vector<std::string> names)
        : dir_(std::move(dir)), rel_dir_(std::move(rel_dir)), names_(std::move(names)) {}

    // Symlinks to regular files list as files. Every other symlink lists as
    // Other so recursive walks never descend through a link (no cycles).
    std::optional<Entry> next() override {
        while (pos_ < names_.size()) {
            const std::string& name = names_[pos_++];
            fs::path full = dir_ / name;
            struct stat st;
            if (::lstat(full.c_str(), &st) != 0) {
                // Removed since the directory was read
                if (errno == ENOENT) continue;
                throw_errno_error(errno, "stat", rel_dir_ + name);
            }
            if (S_ISLNK(st.st_mode)) {
                struct stat target;
                if (::stat(full.c_str(), &target) == 0 && S_ISREG(target.st_mode)) st = target;
            }
            return entry_from_stat(rel_dir_ + name, st);
        }
        return std::nullopt;
    }

private:
    fs::path dir_;
    std::string rel_dir_;
    std::vector<std::string> names_;
    size_t pos_ = 0;
};

class LocalReadStream : public ReadStream {
public:
    LocalReadStream(int fd, uint64_t offset, uint64_t remaining, std::string subject)
        : fd_(fd), offset_(offset), remaining_(remaining), subject_(std::move(subject)) {}

    ~LocalReadStream() override { ::close(fd_); }

    LocalReadStream(const LocalReadStream&) = delete;
    LocalReadStream& operator=(const LocalReadStream&) = delete;

    size_t read(char* buf, size_t len) override {
        if (remaining_ == 0 || len == 0) return 0;
        size_t want = static_cast<size_t>(std::min<uint64_t>(len, remaining_));
        ssize_t n;
        do {
            n = ::pread(fd_, buf, want, static_cast<off_t>(offset_));
        } while (n < 0 && errno == EINTR);
        if (n < 0) throw_errno_error(errno, "read", subject_);
        offset_ += static_cast<uint64_t>(n);
        remaining_ = n == 0 ? 0 : remaining_ - static_cast<uint64_t>(n);
        return static_cast<size_t>(n);
    }

private:
    int fd_;
    uint64_t offset_;
    uint64_t remaining_;
    std::string subject_;
};

// Writes into a hidden sibling temp file; commit fsyncs and renames it over
// the target so readers never observe a partial file.
class LocalWriteSink : public WriteSink {
public:
    LocalWriteSink(fs::path target, std::string subject)
        : target_(std::move(target)), subject_(std::move(subject)) {
        std::string templ = (target_.parent_path() /
                             ("." + target_.filename().string() + ".storify-XXXXXX")).string();
        fd_ = ::mkstemp(templ.data());
        if (fd_ < 0) throw_errno_error(errno, "create", subject_);
        temp_ = templ;
    }

    ~LocalWriteSink() override { discard(); }

    LocalWriteSink(const LocalWriteSink&) = delete;
    LocalWriteSink& operator=(const LocalWriteSink&) = delete;

    void write(const char* data, size_t len) override {
        if (fd_ < 0) {
            throw StorageError(ErrorKind::InvalidArgument, "write after commit or abort", subject_);
        }
        write_fully(fd_, data, len, subject_);
        written_ += len;
    }

    void commit() override {
        if (fd_ < 0) {
            throw StorageError(ErrorKind::InvalidArgument, "sink already finished", subject_);
        }
        if (::fsync(fd_) != 0) {
            int err = errno;
            discard();
            throw_errno_error(err, "fsync", subject_);
        }
        ::fchmod(fd_, 0644);
        ::close(fd_);
        fd_ = -1;
        if (::rename(temp_.c_str(), target_.c_str()) != 0) {
            int err = errno;
            discard();
            throw_errno_error(err, "rename", subject_);
        }
        temp_.clear();
    }

    void abort() override { discard(); }

    uint64_t bytes_written() const override { return written_; }

private:
    fs::path target_;
    std::string subject_;
    fs::path temp_;
    int fd_ = -1;
    uint64_t written_ = 0;

    void discard() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        if (!temp_.empty()) {
            ::unlink(temp_.c_str());
            temp_.clear();
        }
    }
};

class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(const fs::path& root)
        : root_(fs::absolute(root).lexically_normal()) {
        std::error_code ec;
        if (!fs::is_directory(root_, ec)) {
            throw StorageError(ErrorKind::ConfigError,
                               "root path is not an existing directory", root_.string());
        }
    }

    std::string type_name() const override { return "fs"; }

    BackendCapabilities capabilities() const override {
        BackendCapabilities caps;
        caps.ranged_reads = true;
        caps.native_append = true;
        caps.real_directories = true;
        caps.native_copy = false;
        caps.atomic_commit = true;
        return caps;
    }

    std::unique_ptr<EntryStream> list_dir(const std::string& dir) override {
        std::string rel = path::as_dir(path::normalize(dir));
        fs::path full = to_fs(rel);

        struct stat st;
        if (::stat(full.c_str(), &st) != 0) throw_errno_error(errno, "list", path::display(rel));
        if (!S_ISDIR(st.st_mode)) {
            throw StorageError(ErrorKind::InvalidArgument, "not a directory", path::display(rel));
        }

        std::error_code ec;
        fs::directory_iterator it(full, ec);
        if (ec) throw_errno_error(ec.value(), "list", path::display(rel));

        std::vector<std::string> names;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            names.push_back(it->path().filename().string());
        }
        if (ec) throw_errno_error(ec.value(), "list", path::display(rel));

        // One directory level is buffered and sorted so listings are stable
        std::sort(names.begin(), names.end());
        return std::make_unique<LocalDirStream>(full, rel, std::move(names));
    }

    Entry stat(const std::string& p) override {
        std::string rel = path::normalize(p);
        fs::path full = to_fs(rel);
        struct stat st;
        if (::stat(full.c_str(), &st) != 0) {
            int err = errno;
            if (err != ENOENT || ::lstat(full.c_str(), &st) != 0) {
                throw_errno_error(err, "stat", path::display(rel));
            }
        }
        return entry_from_stat(rel, st);
    }

    std::unique_ptr<ReadStream> open_read(const std::string& p,
                                          std::optional<ByteRange> range) override {
        std::string rel = path::normalize(p);
        fs::path full = to_fs(rel);

        int fd = ::open(full.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) throw_errno_error(errno, "open", rel);

        struct stat st;
        if (::fstat(fd, &st) != 0) {
            int err = errno;
            ::close(fd);
            throw_errno_error(err, "stat", rel);
        }
        if (S_ISDIR(st.st_mode)) {
            ::close(fd);
            throw StorageError(ErrorKind::InvalidArgument, "is a directory", rel);
        }

        uint64_t size = static_cast<uint64_t>(st.st_size);
        uint64_t offset = range ? std::min(range->offset, size) : 0;
        uint64_t remaining = size - offset;
        if (range && range->length) remaining = std::min(remaining, *range->length);
        return std::make_unique<LocalReadStream>(fd, offset, remaining, rel);
    }

    std::unique_ptr<WriteSink> open_write(const std::string& p) override {
        std::string rel = path::normalize(p);
        if (path::is_dir(rel)) {
            throw StorageError(ErrorKind::InvalidArgument, "cannot write to a directory path", path::display(rel));
        }
        fs::path full = to_fs(rel);

        struct stat st;
        if (::stat(full.parent_path().c_str(), &st) != 0) {
            if (errno == ENOENT) {
                throw StorageError(ErrorKind::NotFound, "parent directory does not exist", rel);
            }
            throw_errno_error(errno, "open", rel);
        }
        if (!S_ISDIR(st.st_mode)) {
            throw StorageError(ErrorKind::InvalidArgument, "parent is not a directory", rel);
        }
        if (::stat(full.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
            throw StorageError(ErrorKind::InvalidArgument, "is a directory", rel);
        }
        return std::make_unique<LocalWriteSink>(full, rel);
    }

    void remove(const std::string& p) override {
        std::string rel = path::normalize(p);
        if (path::is_root(rel)) {
            throw StorageError(ErrorKind::InvalidArgument, "refusing to remove the root", "/");
        }
        fs::path full = to_fs(rel);

        struct stat st;
        if (::lstat(full.c_str(), &st) != 0) throw_errno_error(errno, "remove", rel);

        if (S_ISDIR(st.st_mode)) {
            if (::rmdir(full.c_str()) != 0) {
                if (errno == ENOTEMPTY || errno == EEXIST) {
                    throw StorageError(ErrorKind::InvalidArgument, "directory not empty", rel);
                }
                throw_errno_error(errno, "remove", rel);
            }
        } else if (::unlink(full.c_str()) != 0) {
            throw_errno_error(errno, "remove", rel);
        }
    }

    void create_dir(const std::string& p, bool parents) override {
        std::string rel = path::normalize(p);
        fs::path full = to_fs(rel);

        struct stat st;
        if (::stat(full.c_str(), &st) == 0) {
            if (S_ISDIR(st.st_mode)) return;
            throw StorageError(ErrorKind::AlreadyExists, "a file exists at this path", rel);
        }

        if (parents) {
            std::error_code ec;
            fs::create_directories(full, ec);
            if (ec) throw_errno_error(ec.value(), "mkdir", rel);
            return;
        }
        if (::mkdir(full.c_str(), 0755) != 0 && errno != EEXIST) {
            if (errno == ENOENT) {
                throw StorageError(ErrorKind::NotFound, "parent directory does not exist", rel);
            }
            throw_errno_error(errno, "mkdir", rel);
        }
    }

    void copy(const std::string& src, const std::string& dst) override {
        Entry source = stat(src);
        if (!source.is_file()) {
            throw StorageError(ErrorKind::InvalidArgument, "copy source is not a file", source.path);
        }
        auto in = open_read(src, std::nullopt);
        auto out = open_write(dst);
        std::vector<char> buf(constants::DEFAULT_STREAM_BUFFER_SIZE);
        while (size_t n = in->read(buf.data(), buf.size())) {
            out->write(buf.data(), n);
        }
        out->commit();
    }

    void rename(const std::string& src, const std::string& dst) override {
        std::string from = path::normalize(src);
        std::string to = path::normalize(dst);
        if (::rename(to_fs(from).c_str(), to_fs(to).c_str()) != 0) {
            int err = errno;
            struct stat st;
            throw_errno_error(err, "rename", ::lstat(to_fs(from).c_str(), &st) != 0 ? from : to);
        }
    }

    void append(const std::string& p, std::string_view data) override {
        std::string rel = path::normalize(p);
        fs::path full = to_fs(rel);
        int fd = ::open(full.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
        if (fd < 0) throw_errno_error(errno, "append", rel);
        try {
            write_fully(fd, data.data(), data.size(), rel);
        } catch (...) {
            ::close(fd);
            throw;
        }
        if (::fsync(fd) != 0) {
            int err = errno;
            ::close(fd);
            throw_errno_error(err, "fsync", rel);
        }
        ::close(fd);
    }

private:
    fs::path root_;

    // Normalized paths never contain "..", so this cannot leave root_
    fs::path to_fs(const std::string& rel) const {
        std::string trimmed = path::as_file(rel);
        return trimmed.empty() ? root_ : root_ / trimmed;
    }
};

// ============================================================================
// FaultInjectingStorageBackend - wrapper failing selected operations
// ============================================================================

[[noreturn]] void throw_injected(FaultPoint point, const std::string& p) {
    static const char* names[] = {"list", "stat", "read", "write", "commit",
                                  "remove", "create_dir", "copy", "rename", "append"};
    throw StorageError(ErrorKind::ProviderError,
                       std::string("injected fault during ") + names[static_cast<int>(point)], p);
}

class FaultInjectingReadStream : public ReadStream {
public:
    FaultInjectingReadStream(std::unique_ptr<ReadStream> inner, FaultRule& rule, std::string p)
        : inner_(std::move(inner)), rule_(rule), path_(std::move(p)) {}

    size_t read(char* buf, size_t len) override {
        if (rule_(FaultPoint::Read, path_)) throw_injected(FaultPoint::Read, path_);
        return inner_->read(buf, len);
    }

private:
    std::unique_ptr<ReadStream> inner_;
    FaultRule& rule_;
    std::string path_;
};

class FaultInjectingWriteSink : public WriteSink {
public:
    FaultInjectingWriteSink(std::unique_ptr<WriteSink> inner, FaultRule& rule, std::string p)
        : inner_(std::move(inner)), rule_(rule), path_(std::move(p)) {}

    void write(const char* data, size_t len) override {
        if (rule_(FaultPoint::Write, path_)) throw_injected(FaultPoint::Write, path_);
        inner_->write(data, len);
    }

    void commit() override {
        if (rule_(FaultPoint::Commit, path_)) {
            inner_->abort();
            throw_injected(FaultPoint::Commit, path_);
        }
        inner_->commit();
    }

    void abort() override { inner_->abort(); }
    uint64_t bytes_written() const override { return inner_->bytes_written(); }

private:
    std::unique_ptr<WriteSink> inner_;
    FaultRule& rule_;
    std::string path_;
};

class FaultInjectingStorageBackend : public StorageBackend {
public:
    FaultInjectingStorageBackend(std::unique_ptr<StorageBackend> inner, FaultRule rule)
        : inner_(std::move(inner)), rule_(std::move(rule)) {}

    std::string type_name() const override { return inner_->type_name(); }
    BackendCapabilities capabilities() const override { return inner_->capabilities(); }

    std::unique_ptr<EntryStream> list_dir(const std::string& dir) override {
        check(FaultPoint::List, dir);
        return inner_->list_dir(dir);
    }

    Entry stat(const std::string& p) override {
        check(FaultPoint::Stat, p);
        return inner_->stat(p);
    }

    std::unique_ptr<ReadStream> open_read(const std::string& p,
                                          std::optional<ByteRange> range) override {
        return std::make_unique<FaultInjectingReadStream>(inner_->open_read(p, range), rule_, p);
    }

    std::unique_ptr<WriteSink> open_write(const std::string& p) override {
        return std::make_unique<FaultInjectingWriteSink>(inner_->open_write(p), rule_, p);
    }

    void remove(const std::string& p) override {
        check(FaultPoint::Remove, p);
        inner_->remove(p);
    }

    void create_dir(const std::string& p, bool parents) override {
        check(FaultPoint::CreateDir, p);
        inner_->create_dir(p, parents);
    }

    void copy(const std::string& src, const std::string& dst) override {
        check(FaultPoint::Copy, src);
        inner_->copy(src, dst);
    }

    void rename(const std::string& src, const std::string& dst) override {
        check(FaultPoint::Rename, src);
        inner_->rename(src, dst);
    }

    void append(const std::string& p, std::string_view data) override {
        check(FaultPoint::Append, p);
        inner_->append(p, data);
    }

private:
    std::unique_ptr<StorageBackend> inner_;
    FaultRule rule_;

    void check(FaultPoint point, const std::string& p) {
        if (rule_(point, p)) throw_injected(point, p);
    }
};

} // anonymous namespace

// ============================================================================
// StorageBackendFactory
// ============================================================================

std::unique_ptr<StorageBackend> StorageBackendFactory::create(Provider provider,
                                                              const BackendParams& params) {
    switch (provider) {
        case Provider::Fs: {
            auto it = params.find("root_path");
            std::string root = (it == params.end() || it->second.empty())
                ? std::string(constants::DEFAULT_ROOT_PATH) : it->second;
            return create_local(root);
        }
        case Provider::Oss:
        case Provider::S3:
        case Provider::Minio:
        case Provider::Cos:
            return create_s3(provider, params);
        case Provider::Azblob:
            return create_azure(params);
        case Provider::Hdfs:
            return create_hdfs(params);
    }
    throw StorageError(ErrorKind::ConfigError, "unknown storage provider");
}

int request_timeout_param(const BackendParams& params) {
    auto it = params.find("request_timeout");
    if (it == params.end() || it->second.empty()) {
        return constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
    }
    try {
        size_t used = 0;
        int seconds = std::stoi(it->second, &used);
        if (used == it->second.size() && seconds > 0) return seconds;
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    throw StorageError(ErrorKind::ConfigError, "request_timeout must be a positive integer",
                       it->second);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_local(const fs::path& root_path) {
    return std::make_unique<LocalStorageBackend>(root_path);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_fault_injecting(
    std::unique_ptr<StorageBackend> backend, FaultRule rule) {
    return std::make_unique<FaultInjectingStorageBackend>(std::move(backend), std::move(rule));
}

} // namespace storify
