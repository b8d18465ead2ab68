#pragma once

#include "storify/config/profile.hpp"
#include "storify/config/profile_store.hpp"
#include "storify/config/settings.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace storify {

/// Command-line selectors that feed config resolution.
struct ConfigRequest {
    std::optional<std::string> profile;  // --profile NAME
    bool anonymous = false;              // --anonymous
};

/// Configuration actually used for one invocation. Built fresh each time,
/// never persisted.
struct EffectiveConfig {
    Profile profile;                // merged fields with defaults applied
    std::string profile_name;       // named profile that contributed, if any
    bool from_temporary = false;    // temporary config contributed

    // Field name -> where its value came from: an environment variable name,
    // "profile <name>", "temporary config" or "default"
    std::map<std::string, std::string> sources;

    BackendParams backend_params(int request_timeout_seconds) const;
};

/// Merge the configuration layers, highest first:
///   STORAGE_* > provider env > temporary config > named profile > defaults.
/// An explicit --profile replaces the temporary config and the default
/// profile as the base layer. When STORAGE_PROVIDER selects a provider other
/// than the base layer's, that layer is ignored.
/// Throws StorageError(ConfigError) when nothing selects a provider or the
/// merged fields break the provider rules.
EffectiveConfig resolve_effective_config(
    const ProfileStore& store, const ConfigRequest& request, const EnvGetter& env,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

} // namespace storify
