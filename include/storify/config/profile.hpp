#pragma once

#include "storify/core/secure_string.hpp"
#include "storify/storage/backend.hpp"
#include "storify/storage/provider.hpp"

#include <optional>
#include <string>
#include <vector>

namespace storify {

/// Connection settings for one backend, as stored in a named profile or the
/// temporary config. Empty strings mean "not set".
struct Profile {
    Provider provider = Provider::Fs;
    std::string bucket;
    std::string access_key_id;
    SecureString access_key_secret;
    std::string endpoint;
    std::string region;
    std::string root_path;
    std::string name_node;

    // Requested credential-less access (only meaningful for providers that allow it)
    bool anonymous = false;

    bool has_credentials() const { return !access_key_id.empty() || !access_key_secret.empty(); }

    /// Check the per-provider field rules.
    /// Returns error message or empty string on success.
    std::string validate() const;

    /// Fill provider defaults (region, endpoint, root path) and derive
    /// anonymous mode when no credentials are present.
    void apply_defaults();

    /// Parameters for StorageBackendFactory::create().
    BackendParams backend_params() const;

    bool operator==(const Profile& other) const;
};

/// Which fields a provider accepts and which environment variables feed them.
struct ProviderSpec {
    Provider provider;
    bool needs_bucket;
    bool accepts_credentials;
    bool requires_credentials;
    bool uses_endpoint;
    bool uses_region;
    bool uses_root_path;
    bool needs_name_node;
    bool supports_anonymous;

    // Provider-specific environment keys per field, first defined wins
    std::vector<std::string> bucket_env;
    std::vector<std::string> access_key_id_env;
    std::vector<std::string> access_key_secret_env;
    std::vector<std::string> endpoint_env;
    std::vector<std::string> region_env;
    std::vector<std::string> root_path_env;
    std::vector<std::string> name_node_env;
};

const ProviderSpec& provider_spec(Provider provider);

/// "ab12****" for key ids, "****" for secrets; full values with show_secrets.
std::string mask_key_id(const std::string& value, bool show_secrets);
std::string mask_secret(const SecureString& value, bool show_secrets);

} // namespace storify
