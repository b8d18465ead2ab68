#include "storify/config/profile.hpp"
#include "storify/core/constants.hpp"

namespace storify {

namespace {

ProviderSpec make_spec(Provider p) {
    ProviderSpec s{p, false, false, false, false, false, false, false, false,
                   {}, {}, {}, {}, {}, {}, {}};
    s.uses_endpoint = p != Provider::Fs && p != Provider::Hdfs;
    s.uses_region = p == Provider::Oss || p == Provider::S3 || p == Provider::Minio ||
                    p == Provider::Cos;
    switch (p) {
        case Provider::Oss:
            s.needs_bucket = true;
            s.accepts_credentials = true;
            s.supports_anonymous = true;
            s.bucket_env = {"OSS_BUCKET"};
            s.access_key_id_env = {"OSS_ACCESS_KEY_ID"};
            s.access_key_secret_env = {"OSS_ACCESS_KEY_SECRET"};
            s.endpoint_env = {"OSS_ENDPOINT"};
            s.region_env = {"OSS_REGION"};
            break;
        case Provider::S3:
            s.needs_bucket = true;
            s.accepts_credentials = true;
            s.supports_anonymous = true;
            s.bucket_env = {"AWS_S3_BUCKET"};
            s.access_key_id_env = {"AWS_ACCESS_KEY_ID"};
            s.access_key_secret_env = {"AWS_SECRET_ACCESS_KEY"};
            s.endpoint_env = {"AWS_ENDPOINT_URL"};
            s.region_env = {"AWS_DEFAULT_REGION", "AWS_REGION"};
            break;
        case Provider::Minio:
            s.needs_bucket = true;
            s.accepts_credentials = true;
            s.supports_anonymous = true;
            s.bucket_env = {"MINIO_BUCKET"};
            s.access_key_id_env = {"MINIO_ACCESS_KEY"};
            s.access_key_secret_env = {"MINIO_SECRET_KEY"};
            s.endpoint_env = {"MINIO_ENDPOINT"};
            s.region_env = {"MINIO_DEFAULT_REGION"};
            break;
        case Provider::Cos:
            s.needs_bucket = true;
            s.accepts_credentials = true;
            s.requires_credentials = true;
            s.bucket_env = {"COS_BUCKET"};
            s.access_key_id_env = {"COS_SECRET_ID"};
            s.access_key_secret_env = {"COS_SECRET_KEY"};
            s.endpoint_env = {"COS_ENDPOINT"};
            s.region_env = {"COS_REGION"};
            break;
        case Provider::Fs:
            s.uses_root_path = true;
            s.supports_anonymous = true;
            s.root_path_env = {"STORAGE_ROOT_PATH"};
            break;
        case Provider::Hdfs:
            s.uses_root_path = true;
            s.needs_name_node = true;
            s.name_node_env = {"HDFS_NAME_NODE"};
            s.root_path_env = {"HDFS_ROOT_PATH"};
            break;
        case Provider::Azblob:
            s.needs_bucket = true;
            s.accepts_credentials = true;
            s.requires_credentials = true;
            s.bucket_env = {"AZBLOB_CONTAINER"};
            s.access_key_id_env = {"AZBLOB_ACCOUNT_NAME"};
            s.access_key_secret_env = {"AZBLOB_ACCOUNT_KEY"};
            s.endpoint_env = {"AZBLOB_ENDPOINT"};
            break;
    }
    return s;
}

} // namespace

const ProviderSpec& provider_spec(Provider provider) {
    static const std::vector<ProviderSpec> specs = [] {
        std::vector<ProviderSpec> v;
        for (Provider p : all_providers()) v.push_back(make_spec(p));
        return v;
    }();
    for (const auto& s : specs) {
        if (s.provider == provider) return s;
    }
    return specs.front();
}

std::string Profile::validate() const {
    const auto& spec = provider_spec(provider);
    std::string name = provider_name(provider);

    if (spec.needs_bucket && bucket.empty())
        return "bucket is required for provider " + name;
    if (!spec.needs_bucket && !bucket.empty())
        return "provider " + name + " does not use a bucket";
    if (spec.needs_name_node && name_node.empty())
        return "name_node is required for provider " + name;
    if (!spec.needs_name_node && !name_node.empty())
        return "provider " + name + " does not use name_node";
    if (!spec.uses_root_path && !root_path.empty())
        return "provider " + name + " does not use root_path";
    if (!spec.uses_endpoint && !endpoint.empty())
        return "provider " + name + " does not use an endpoint";
    if (!spec.uses_region && !region.empty())
        return "provider " + name + " does not use a region";

    if (!spec.accepts_credentials && has_credentials())
        return "provider " + name + " does not use access keys";
    if (!access_key_id.empty() && access_key_secret.empty())
        return "access_key_secret is required when access_key_id is set";
    if (access_key_id.empty() && !access_key_secret.empty())
        return "access_key_id is required when access_key_secret is set";

    if (anonymous) {
        if (!provider_supports_anonymous(provider))
            return "provider " + name + " does not support anonymous access";
        if (has_credentials())
            return "anonymous access cannot be combined with credentials";
    }
    if (spec.requires_credentials && !has_credentials())
        return "access_key_id is required for provider " + name;
    if (spec.accepts_credentials && !has_credentials() && !anonymous)
        return "credentials are required unless anonymous access is enabled";
    return {};
}

void Profile::apply_defaults() {
    switch (provider) {
        case Provider::S3:
            if (region.empty()) region = constants::DEFAULT_S3_REGION;
            break;
        case Provider::Minio:
            if (region.empty()) region = constants::DEFAULT_S3_REGION;
            if (endpoint.empty()) endpoint = constants::DEFAULT_MINIO_ENDPOINT;
            break;
        case Provider::Oss:
            if (region.empty()) region = constants::DEFAULT_OSS_REGION;
            break;
        case Provider::Cos:
            if (region.empty()) region = constants::DEFAULT_COS_REGION;
            break;
        case Provider::Fs:
        case Provider::Hdfs:
            if (root_path.empty()) root_path = constants::DEFAULT_ROOT_PATH;
            break;
        case Provider::Azblob:
            break;
    }

    const auto& spec = provider_spec(provider);
    if (spec.accepts_credentials && spec.supports_anonymous && !has_credentials()) {
        anonymous = true;
    }
}

BackendParams Profile::backend_params() const {
    BackendParams params;
    auto put = [&](const char* key, const std::string& value) {
        if (!value.empty()) params[key] = value;
    };
    put("bucket", bucket);
    put("access_key_id", access_key_id);
    put("access_key_secret", access_key_secret.str());
    put("endpoint", endpoint);
    put("region", region);
    put("root_path", root_path);
    put("name_node", name_node);
    if (anonymous && provider != Provider::Fs) params["anonymous"] = "true";
    return params;
}

bool Profile::operator==(const Profile& other) const {
    return provider == other.provider && bucket == other.bucket &&
           access_key_id == other.access_key_id &&
           access_key_secret == other.access_key_secret &&
           endpoint == other.endpoint && region == other.region &&
           root_path == other.root_path && name_node == other.name_node &&
           anonymous == other.anonymous;
}

std::string mask_key_id(const std::string& value, bool show_secrets) {
    if (show_secrets || value.empty()) return value;
    if (value.size() <= 4) return "****";
    return value.substr(0, 4) + "****";
}

std::string mask_secret(const SecureString& value, bool show_secrets) {
    if (value.empty()) return {};
    if (show_secrets) return value.str();
    return "****";
}

} // namespace storify
