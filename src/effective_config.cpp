#include "storify/config/effective_config.hpp"
#include "storify/core/error.hpp"

#include <vector>

namespace storify {

namespace {

struct BaseLayer {
    Profile profile;
    std::string label;          // "profile <name>" or "temporary config"
    std::string profile_name;
    bool temporary = false;
};

// One profile field with its generic and provider-specific env keys
struct FieldRule {
    const char* name;
    bool used;
    std::vector<std::string> generic_env;
    const std::vector<std::string>* provider_env;
    std::string* target;
};

} // namespace

BackendParams EffectiveConfig::backend_params(int request_timeout_seconds) const {
    auto params = profile.backend_params();
    params["request_timeout"] = std::to_string(request_timeout_seconds);
    return params;
}

EffectiveConfig resolve_effective_config(const ProfileStore& store, const ConfigRequest& request,
                                         const EnvGetter& env,
                                         std::chrono::system_clock::time_point now) {
    std::optional<Provider> env_provider;
    if (auto v = env_value(env, "STORAGE_PROVIDER")) {
        env_provider = parse_provider(*v);
        if (!env_provider) {
            throw StorageError(ErrorKind::ConfigError,
                               "STORAGE_PROVIDER names an unknown provider", *v);
        }
    }

    // Candidate base layers in precedence order
    std::vector<BaseLayer> candidates;
    if (request.profile) {
        candidates.push_back({store.get(*request.profile), "profile " + *request.profile,
                              *request.profile, false});
    } else {
        if (auto temp = store.load_temporary(now)) {
            candidates.push_back({temp->profile, "temporary config", {}, true});
        }
        if (const auto& name = store.default_name()) {
            candidates.push_back({store.get(*name), "profile " + *name, *name, false});
        }
    }

    std::optional<BaseLayer> base;
    Provider provider = Provider::Fs;
    if (request.profile) {
        base = candidates.front();
        provider = base->profile.provider;
    } else if (env_provider) {
        provider = *env_provider;
        for (const auto& c : candidates) {
            if (c.profile.provider == provider) {
                base = c;
                break;
            }
        }
    } else if (!candidates.empty()) {
        base = candidates.front();
        provider = base->profile.provider;
    } else {
        throw StorageError(ErrorKind::ConfigError,
                           "no storage configured: create a profile with 'storify config create' "
                           "or set STORAGE_PROVIDER");
    }

    EffectiveConfig result;
    Profile& p = result.profile;
    p.provider = provider;
    result.sources["provider"] = base && (request.profile || !env_provider)
        ? base->label : std::string("STORAGE_PROVIDER");
    if (base) {
        result.profile_name = base->profile_name;
        result.from_temporary = base->temporary;
    }

    const auto& spec = provider_spec(provider);
    std::string secret;
    std::vector<FieldRule> rules = {
        {"bucket", spec.needs_bucket, {"STORAGE_BUCKET"}, &spec.bucket_env, &p.bucket},
        {"access_key_id", spec.accepts_credentials, {"STORAGE_ACCESS_KEY_ID"},
         &spec.access_key_id_env, &p.access_key_id},
        {"access_key_secret", spec.accepts_credentials, {"STORAGE_ACCESS_KEY_SECRET"},
         &spec.access_key_secret_env, &secret},
        {"endpoint", spec.uses_endpoint, {"STORAGE_ENDPOINT"}, &spec.endpoint_env, &p.endpoint},
        {"region", spec.uses_region, {"STORAGE_REGION"}, &spec.region_env, &p.region},
        {"root_path", spec.uses_root_path, {"STORAGE_ROOT_PATH"}, &spec.root_path_env,
         &p.root_path},
        {"name_node", spec.needs_name_node, {}, &spec.name_node_env, &p.name_node},
    };

    auto base_value = [&](const std::string& field) -> std::string {
        if (!base) return {};
        const Profile& b = base->profile;
        if (field == "bucket") return b.bucket;
        if (field == "access_key_id") return b.access_key_id;
        if (field == "access_key_secret") return b.access_key_secret.str();
        if (field == "endpoint") return b.endpoint;
        if (field == "region") return b.region;
        if (field == "root_path") return b.root_path;
        if (field == "name_node") return b.name_node;
        return {};
    };

    for (auto& rule : rules) {
        if (!rule.used) continue;
        bool found = false;
        for (const auto& key : rule.generic_env) {
            if (auto v = env_value(env, key)) {
                *rule.target = *v;
                result.sources[rule.name] = key;
                found = true;
                break;
            }
        }
        if (!found) {
            for (const auto& key : *rule.provider_env) {
                if (auto v = env_value(env, key)) {
                    *rule.target = *v;
                    result.sources[rule.name] = key;
                    found = true;
                    break;
                }
            }
        }
        if (!found) {
            std::string v = base_value(rule.name);
            if (!v.empty()) {
                *rule.target = v;
                result.sources[rule.name] = base->label;
            }
        }
    }
    p.access_key_secret = SecureString(std::move(secret));

    if (request.anonymous) {
        p.anonymous = true;
        result.sources["anonymous"] = "--anonymous";
    } else if (base && base->profile.anonymous && !p.has_credentials()) {
        p.anonymous = true;
        result.sources["anonymous"] = base->label;
    }

    Profile before = p;
    p.apply_defaults();
    if (p.region != before.region) result.sources["region"] = "default";
    if (p.endpoint != before.endpoint) result.sources["endpoint"] = "default";
    if (p.root_path != before.root_path) result.sources["root_path"] = "default";
    if (p.anonymous != before.anonymous) result.sources["anonymous"] = "default";

    auto err = p.validate();
    if (!err.empty()) {
        std::string subject = result.profile_name.empty()
            ? std::string(provider_name(provider)) : result.profile_name;
        throw StorageError(ErrorKind::ConfigError, err, subject);
    }
    return result;
}

} // namespace storify
