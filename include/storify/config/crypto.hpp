#pragma once

#include "storify/core/secure_string.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace storify {

/// Where the profile store key comes from.
enum class KeySource : uint8_t {
    Passphrase = 1,    // --master-password / STORIFY_MASTER_PASSWORD
    MachineBound = 2,  // user name + hostname + store path
};

const char* key_source_name(KeySource source);

/// Secret material fed to the KDF. The actual AES key is derived per record
/// with a fresh salt.
struct KeyMaterial {
    KeySource source = KeySource::MachineBound;
    SecureString secret;
};

KeyMaterial passphrase_key(const std::string& passphrase);

/// Secret bound to this user, host and store location.
KeyMaterial machine_bound_key(const std::filesystem::path& store_path);

// Sealed record layout:
//   magic "STFY" | version (1) | key source (1) | kdf iterations (4, BE)
//   | salt (16) | nonce (12) | ciphertext | tag (16)
// Everything before the ciphertext is authenticated as AAD.

/// Encrypt `plaintext` with AES-256-GCM under a PBKDF2-HMAC-SHA256 key.
std::vector<uint8_t> seal_record(const std::string& plaintext, const KeyMaterial& key);

/// Decrypt a sealed record. Throws StorageError(ConfigError) on a foreign,
/// truncated or tampered record and on a wrong key or key source.
std::string open_record(const std::vector<uint8_t>& record, const KeyMaterial& key);

} // namespace storify
