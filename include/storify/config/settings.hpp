#pragma once

#include "storify/core/constants.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace storify {

/// Environment lookup. Injected so config resolution can be tested without
/// touching the process environment.
using EnvGetter = std::function<std::optional<std::string>(const std::string& name)>;

/// Reads the real process environment.
EnvGetter process_env();

/// Trimmed value of `name`; unset and blank values are both nullopt.
std::optional<std::string> env_value(const EnvGetter& env, const std::string& name);

/// Process-wide tunables that do not belong to any profile.
struct Settings {
    size_t concurrency = constants::DEFAULT_TRANSFER_CONCURRENCY;
    int request_timeout_seconds = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;
    int64_t temp_ttl_seconds = constants::DEFAULT_TEMP_CONFIG_TTL_SECONDS;
    std::filesystem::path metrics_file;
    bool verbose = false;

    /// Load a JSON settings file. Returns false (after printing the reason)
    /// when the file is unreadable or malformed.
    bool load_json(const std::filesystem::path& path);

    /// Apply STORIFY_* tunables. Out-of-range values print a warning and keep
    /// the current value.
    void apply_env(const EnvGetter& env);

    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Profile store location: explicit path, else STORIFY_PROFILE_PATH, else
/// STORIFY_CONFIG, else $XDG_CONFIG_HOME/storify/profiles.enc, else
/// $HOME/.config/storify/profiles.enc.
std::filesystem::path resolve_store_path(const std::optional<std::string>& explicit_path,
                                         const EnvGetter& env);

} // namespace storify
