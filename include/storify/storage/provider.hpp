#pragma once

#include <optional>
#include <string>
#include <vector>

namespace storify {

// Closed set of storage providers. Every connector is selected by a switch
// over this enum; adding a provider means adding a case everywhere.
enum class Provider {
    Oss,
    S3,
    Minio,
    Cos,
    Fs,
    Hdfs,
    Azblob,
};

// Lowercase wire name ("oss", "s3", "minio", "cos", "fs", "hdfs", "azblob")
const char* provider_name(Provider provider);

// Case-insensitive parse; "azure" is accepted for azblob.
std::optional<Provider> parse_provider(const std::string& name);

const std::vector<Provider>& all_providers();

// Anonymous (credential-less) access is limited to these providers.
bool provider_supports_anonymous(Provider provider);

} // namespace storify
