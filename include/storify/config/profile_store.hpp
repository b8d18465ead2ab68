#pragma once

#include "storify/config/crypto.hpp"
#include "storify/config/profile.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace storify {

/// A single unnamed profile with a time-to-live, kept beside the store.
struct TemporaryConfig {
    Profile profile;
    std::chrono::system_clock::time_point created_at;
    std::chrono::seconds ttl{0};

    std::chrono::system_clock::time_point expires_at() const { return created_at + ttl; }
    bool expired(std::chrono::system_clock::time_point now) const { return now >= expires_at(); }
};

/// Encrypted set of named profiles plus the default pointer.
///
/// The store is loaded once per invocation and mutated in memory; save()
/// replaces the file atomically (temp file, fsync, backup, rename), so a
/// concurrent reader sees either the old or the new complete record. The
/// file is created 0600 inside a 0700 directory.
class ProfileStore {
public:
    /// Load the store at `path`. A missing file is an empty store; an
    /// unreadable, undecryptable or malformed file throws ConfigError.
    static ProfileStore open(const std::filesystem::path& path, KeyMaterial key);

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path backup_path() const;
    std::filesystem::path temporary_path() const;

    std::vector<std::string> names() const;
    bool contains(const std::string& name) const;

    /// Throws ConfigError for an unknown profile.
    const Profile& get(const std::string& name) const;

    const std::optional<std::string>& default_name() const { return default_; }

    /// Add or replace a profile. Replacing requires `overwrite`
    /// (AlreadyExists otherwise).
    void put(const std::string& name, const Profile& profile, bool overwrite);

    /// Remove a profile; clears the default pointer when it named it.
    void remove(const std::string& name);

    void set_default(const std::string& name);
    void clear_default();

    /// Persist the in-memory state.
    void save();

    // --- Temporary config ---

    /// Active temporary config, or nullopt when absent or expired.
    std::optional<TemporaryConfig> load_temporary(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
    void save_temporary(const TemporaryConfig& temp);

    /// Returns false when there was nothing to clear.
    bool clear_temporary();

private:
    ProfileStore(std::filesystem::path path, KeyMaterial key);

    void normalize_default();

    std::filesystem::path path_;
    KeyMaterial key_;
    std::map<std::string, Profile> profiles_;
    std::optional<std::string> default_;
};

/// Atomically replace `path` with `data`: write a sibling temp file (0600),
/// fsync, optionally preserve the previous file as `<path>.bak`, rename,
/// then fsync the directory.
void write_file_atomic(const std::filesystem::path& path, const std::vector<uint8_t>& data,
                       bool keep_backup);

} // namespace storify
