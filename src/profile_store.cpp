#include "storify/config/profile_store.hpp"
#include "storify/core/error.hpp"

#include <cctype>
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace storify {

using json = nlohmann::json;

namespace {

constexpr int STORE_FORMAT_VERSION = 1;

void write_all_fd(int fd, const uint8_t* data, size_t len, const std::filesystem::path& path) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno_error(errno, "write", path.string());
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
}

// nlohmann's messages quote the bytes around a failure, which here are
// decrypted profile data. Report positions and error ids only.
std::string describe_json_error(const json::exception& e) {
    if (const auto* parse = dynamic_cast<const json::parse_error*>(&e)) {
        return "invalid JSON at byte " + std::to_string(parse->byte);
    }
    return "unexpected document layout (json error " + std::to_string(e.id) + ")";
}

// Write `data` to a fresh file (0600) and fsync it
void write_synced(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) throw_errno_error(errno, "create", path.string());
    try {
        write_all_fd(fd, data.data(), data.size(), path);
        if (::fchmod(fd, 0600) != 0) throw_errno_error(errno, "chmod", path.string());
        if (::fsync(fd) != 0) throw_errno_error(errno, "fsync", path.string());
    } catch (...) {
        ::close(fd);
        ::unlink(path.c_str());
        throw;
    }
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(path.c_str());
        throw_errno_error(err, "close", path.string());
    }
}

void fsync_dir(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return;
    ::fsync(fd);
    ::close(fd);
}

std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        if (!std::filesystem::exists(path)) return std::nullopt;
        throw StorageError(ErrorKind::ConfigError, "cannot read profile store", path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(ifs)),
                              std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        throw StorageError(ErrorKind::ConfigError, "cannot read profile store", path.string());
    }
    return data;
}

void ensure_parent_dir(const std::filesystem::path& path) {
    auto dir = path.parent_path();
    if (dir.empty()) return;
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) return;
    std::filesystem::create_directories(dir, ec);
    if (ec) throw_errno_error(ec.value(), "create directory", dir.string());
    ::chmod(dir.c_str(), 0700);
}

json profile_to_json(const Profile& p) {
    json j;
    j["provider"] = provider_name(p.provider);
    auto put = [&](const char* key, const std::string& value) {
        if (!value.empty()) j[key] = value;
    };
    put("bucket", p.bucket);
    put("access_key_id", p.access_key_id);
    put("access_key_secret", p.access_key_secret.str());
    put("endpoint", p.endpoint);
    put("region", p.region);
    put("root_path", p.root_path);
    put("name_node", p.name_node);
    j["anonymous"] = p.anonymous;
    return j;
}

Profile profile_from_json(const json& j) {
    Profile p;
    auto provider = parse_provider(j.at("provider").get<std::string>());
    if (!provider) {
        throw StorageError(ErrorKind::ConfigError, "profile names an unknown provider: " +
                                                       j.at("provider").get<std::string>());
    }
    p.provider = *provider;
    auto get = [&](const char* key) -> std::string {
        return j.contains(key) ? j[key].get<std::string>() : std::string();
    };
    p.bucket = get("bucket");
    p.access_key_id = get("access_key_id");
    p.access_key_secret = SecureString(get("access_key_secret"));
    p.endpoint = get("endpoint");
    p.region = get("region");
    p.root_path = get("root_path");
    p.name_node = get("name_node");
    if (j.contains("anonymous")) p.anonymous = j["anonymous"].get<bool>();
    return p;
}

// Plaintext JSON holds secrets; wipe it before the buffer is released
void wipe(std::string& s) {
    volatile char* p = s.data();
    for (size_t i = 0; i < s.size(); ++i) p[i] = 0;
    s.clear();
}

} // namespace

void write_file_atomic(const std::filesystem::path& path, const std::vector<uint8_t>& data,
                       bool keep_backup) {
    ensure_parent_dir(path);

    auto tmp = path;
    tmp += ".tmp." + std::to_string(::getpid());
    write_synced(tmp, data);

    if (keep_backup && std::filesystem::exists(path)) {
        auto previous = read_file(path);
        if (previous) {
            auto bak = path;
            bak += ".bak";
            auto bak_tmp = bak;
            bak_tmp += ".tmp." + std::to_string(::getpid());
            try {
                write_synced(bak_tmp, *previous);
                if (::rename(bak_tmp.c_str(), bak.c_str()) != 0) {
                    throw_errno_error(errno, "rename", bak.string());
                }
            } catch (const StorageError&) {
                ::unlink(tmp.c_str());
                throw;
            }
        }
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        throw_errno_error(err, "rename", path.string());
    }
    fsync_dir(path.parent_path().empty() ? std::filesystem::path(".") : path.parent_path());
}

// ============================================================================
// ProfileStore
// ============================================================================

ProfileStore::ProfileStore(std::filesystem::path path, KeyMaterial key)
    : path_(std::move(path))
    , key_(std::move(key)) {}

ProfileStore ProfileStore::open(const std::filesystem::path& path, KeyMaterial key) {
    ProfileStore store(path, std::move(key));

    auto record = read_file(path);
    if (!record) return store;

    std::string plaintext = open_record(*record, store.key_);
    try {
        auto j = json::parse(plaintext);
        wipe(plaintext);

        if (j.contains("version") && j["version"].get<int>() > STORE_FORMAT_VERSION) {
            throw StorageError(ErrorKind::ConfigError,
                               "profile store was written by a newer storify", path.string());
        }
        if (j.contains("profiles")) {
            for (auto& [name, value] : j["profiles"].items()) {
                store.profiles_.emplace(name, profile_from_json(value));
            }
        }
        if (j.contains("default") && j["default"].is_string()) {
            store.default_ = j["default"].get<std::string>();
        }
    } catch (const json::exception& e) {
        wipe(plaintext);
        throw StorageError(ErrorKind::ConfigError,
                           "profile store is malformed: " + describe_json_error(e),
                           path.string());
    }

    store.normalize_default();
    return store;
}

std::filesystem::path ProfileStore::backup_path() const {
    auto p = path_;
    p += ".bak";
    return p;
}

std::filesystem::path ProfileStore::temporary_path() const {
    auto p = path_;
    p += ".temp";
    return p;
}

std::vector<std::string> ProfileStore::names() const {
    std::vector<std::string> result;
    result.reserve(profiles_.size());
    for (const auto& [name, _] : profiles_) result.push_back(name);
    return result;
}

bool ProfileStore::contains(const std::string& name) const {
    return profiles_.count(name) > 0;
}

const Profile& ProfileStore::get(const std::string& name) const {
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        throw StorageError(ErrorKind::ConfigError, "unknown profile", name);
    }
    return it->second;
}

void ProfileStore::put(const std::string& name, const Profile& profile, bool overwrite) {
    if (name.empty()) {
        throw StorageError(ErrorKind::InvalidArgument, "profile name must not be empty");
    }
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '/') {
            throw StorageError(ErrorKind::InvalidArgument,
                               "profile name must not contain whitespace or '/'", name);
        }
    }
    auto it = profiles_.find(name);
    if (it != profiles_.end()) {
        if (!overwrite) {
            throw StorageError(ErrorKind::AlreadyExists,
                               "profile already exists (use --force to replace it)", name);
        }
        it->second = profile;
        return;
    }
    profiles_.emplace(name, profile);
}

void ProfileStore::remove(const std::string& name) {
    if (profiles_.erase(name) == 0) {
        throw StorageError(ErrorKind::ConfigError, "unknown profile", name);
    }
    normalize_default();
}

void ProfileStore::set_default(const std::string& name) {
    if (!contains(name)) {
        throw StorageError(ErrorKind::ConfigError, "unknown profile", name);
    }
    default_ = name;
}

void ProfileStore::clear_default() {
    default_.reset();
}

void ProfileStore::normalize_default() {
    if (default_ && !contains(*default_)) default_.reset();
}

void ProfileStore::save() {
    json j;
    j["version"] = STORE_FORMAT_VERSION;
    j["default"] = default_ ? json(*default_) : json(nullptr);
    j["profiles"] = json::object();
    for (const auto& [name, profile] : profiles_) {
        j["profiles"][name] = profile_to_json(profile);
    }
    std::string plaintext = j.dump();
    auto record = seal_record(plaintext, key_);
    wipe(plaintext);
    write_file_atomic(path_, record, true);
}

std::optional<TemporaryConfig> ProfileStore::load_temporary(
    std::chrono::system_clock::time_point now) const {
    auto record = read_file(temporary_path());
    if (!record) return std::nullopt;

    std::string plaintext = open_record(*record, key_);
    TemporaryConfig temp;
    try {
        auto j = json::parse(plaintext);
        wipe(plaintext);
        temp.profile = profile_from_json(j.at("profile"));
        temp.created_at = std::chrono::system_clock::time_point(
            std::chrono::seconds(j.at("created_at").get<int64_t>()));
        temp.ttl = std::chrono::seconds(j.at("ttl_seconds").get<int64_t>());
    } catch (const json::exception& e) {
        wipe(plaintext);
        throw StorageError(ErrorKind::ConfigError,
                           "temporary config is malformed: " + describe_json_error(e),
                           temporary_path().string());
    }

    if (temp.expired(now)) {
        std::cerr << "warning: temporary config expired; ignoring it "
                  << "(run 'storify config temp clear' to remove it)\n";
        return std::nullopt;
    }
    return temp;
}

void ProfileStore::save_temporary(const TemporaryConfig& temp) {
    if (temp.ttl.count() <= 0) {
        throw StorageError(ErrorKind::InvalidArgument, "temporary config TTL must be positive");
    }
    json j;
    j["profile"] = profile_to_json(temp.profile);
    j["created_at"] = std::chrono::duration_cast<std::chrono::seconds>(
        temp.created_at.time_since_epoch()).count();
    j["ttl_seconds"] = temp.ttl.count();
    std::string plaintext = j.dump();
    auto record = seal_record(plaintext, key_);
    wipe(plaintext);
    write_file_atomic(temporary_path(), record, false);
}

bool ProfileStore::clear_temporary() {
    auto p = temporary_path();
    if (::unlink(p.c_str()) != 0) {
        if (errno == ENOENT) return false;
        throw_errno_error(errno, "remove", p.string());
    }
    return true;
}

} // namespace storify
