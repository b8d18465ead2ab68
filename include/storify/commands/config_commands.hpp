#pragma once

#include "storify/config/effective_config.hpp"
#include "storify/config/profile_store.hpp"
#include "storify/config/settings.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace storify {

/// Profile fields as given on the command line; unset flags stay nullopt.
struct ProfileFields {
    std::optional<std::string> provider;
    std::optional<std::string> bucket;
    std::optional<std::string> access_key_id;
    std::optional<std::string> access_key_secret;
    std::optional<std::string> endpoint;
    std::optional<std::string> region;
    std::optional<std::string> root_path;
    std::optional<std::string> name_node;
    bool anonymous = false;

    /// Build and validate a profile. Throws InvalidArgument for a missing or
    /// unknown provider and ConfigError when the provider rules are broken.
    Profile to_profile(const std::string& subject) const;
};

struct ConfigCreateOptions {
    std::string name;
    ProfileFields fields;
    bool force = false;          // replace an existing profile
    bool make_default = false;
};

struct ConfigShowOptions {
    std::optional<std::string> profile;   // --profile NAME
    bool default_profile = false;         // --default
    bool show_secrets = false;
};

struct ConfigTempSetOptions {
    ProfileFields fields;
    std::chrono::seconds ttl{constants::DEFAULT_TEMP_CONFIG_TTL_SECONDS};
};

/// Print one profile as indented "field: value" lines, masking credentials
/// unless `show_secrets`. With `sources`, each line notes where the value
/// came from.
void print_profile(std::ostream& out, const Profile& profile, bool show_secrets,
                   const std::map<std::string, std::string>* sources = nullptr);

void config_create(ProfileStore& store, const ConfigCreateOptions& options, std::ostream& out);
void config_list(const ProfileStore& store, bool show_secrets, std::ostream& out);

/// Without a selector, shows the configuration the next command would use.
void config_show(const ProfileStore& store, const ConfigShowOptions& options,
                 const ConfigRequest& request, const EnvGetter& env, std::ostream& out);

/// Make `name` the default; nullopt clears the default.
void config_set(ProfileStore& store, const std::optional<std::string>& name, std::ostream& out);

/// Without `force`, asks through `confirm`; declining throws Interrupted.
void config_delete(ProfileStore& store, const std::string& name, bool force,
                   const std::function<bool(const std::string&)>& confirm, std::ostream& out);

void config_temp_set(ProfileStore& store, const ConfigTempSetOptions& options, std::ostream& out);
void config_temp_show(const ProfileStore& store, bool show_secrets, std::ostream& out);
void config_temp_clear(ProfileStore& store, std::ostream& out);

} // namespace storify
