#pragma once

#include "storify/storage/backend.hpp"
#include "storify/storage/provider.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

// Request addressing and response decoding shared by the network connectors.
// Everything here is pure: no requests are sent.
namespace storify {

// ============================================================================
// S3 protocol (S3, MinIO, OSS, COS)
// ============================================================================

struct S3Endpoint {
    std::string endpoint;         // scheme://host[:port], no trailing slash
    std::string region;
    std::string signing_region;   // region named in the SigV4 credential scope
    bool use_path_style = false;

    // https://bucket.host (virtual-host) or https://host/bucket (path style)
    std::string bucket_url(const std::string& bucket) const;
    std::string object_url(const std::string& bucket, const std::string& key) const;
};

// Endpoint, regions and addressing style for an S3-compatible provider.
//   s3     virtual-host on AWS; path style once a custom endpoint is set
//   minio  always path style, local default endpoint
//   oss    signs for "oss-<region>", endpoint oss-<region>.aliyuncs.com
//   cos    endpoint cos.<region>.myqcloud.com
// "path_style=true" forces path style for any of them. Throws
// StorageError(ConfigError) for a non-S3 provider or an unparsable endpoint.
S3Endpoint resolve_s3_endpoint(Provider provider, const BackendParams& params);

// One page of a bucket or container listing, entries sorted by path
struct ObjectListPage {
    std::vector<Entry> entries;
    bool truncated = false;
    std::string next_token;       // continuation token or marker for the next page
    bool saw_marker = false;      // the "prefix/" object itself was listed
};

// ListObjectsV2 ListBucketResult. `prefix` is the listed directory ("" or "dir/").
ObjectListPage parse_s3_list(const std::string& body, const std::string& prefix);

// ============================================================================
// Azure Blob
// ============================================================================

// List Blobs EnumerationResults
ObjectListPage parse_azure_list(const std::string& body, const std::string& prefix);

// ============================================================================
// WebHDFS
// ============================================================================

// Entry for a FileStatus object; `rel` is the path below the connector root
Entry webhdfs_entry_from_status(const std::string& rel, const nlohmann::json& status);

} // namespace storify
