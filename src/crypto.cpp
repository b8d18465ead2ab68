#include "storify/config/crypto.hpp"
#include "storify/core/constants.hpp"
#include "storify/core/error.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <unistd.h>

namespace storify {

namespace {

constexpr char RECORD_MAGIC[4] = {'S', 'T', 'F', 'Y'};
constexpr uint8_t RECORD_VERSION = 1;
constexpr size_t HEADER_SIZE = 4 + 1 + 1 + 4 + constants::PROFILE_SALT_SIZE +
                               constants::PROFILE_NONCE_SIZE;
constexpr uint32_t MAX_KDF_ITERATIONS = 10000000;
constexpr const char* MACHINE_KEY_CONTEXT = "storify-machine-key-v1";

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

// Zeroes the derived key when it leaves scope
struct DerivedKey {
    std::array<uint8_t, constants::PROFILE_KEY_SIZE> bytes{};
    ~DerivedKey() { OPENSSL_cleanse(bytes.data(), bytes.size()); }
};

void derive_key(const KeyMaterial& key, const uint8_t* salt, uint32_t iterations,
                DerivedKey& out) {
    if (PKCS5_PBKDF2_HMAC(key.secret.c_str(), static_cast<int>(key.secret.size()),
                          salt, static_cast<int>(constants::PROFILE_SALT_SIZE),
                          static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(out.bytes.size()), out.bytes.data()) != 1) {
        throw StorageError(ErrorKind::ConfigError, "key derivation failed");
    }
}

[[noreturn]] void fail(const std::string& message) {
    throw StorageError(ErrorKind::ConfigError, message);
}

} // namespace

const char* key_source_name(KeySource source) {
    switch (source) {
        case KeySource::Passphrase: return "passphrase";
        case KeySource::MachineBound: return "machine-bound";
    }
    return "unknown";
}

KeyMaterial passphrase_key(const std::string& passphrase) {
    if (passphrase.empty()) fail("master password must not be empty");
    return KeyMaterial{KeySource::Passphrase, SecureString(passphrase)};
}

KeyMaterial machine_bound_key(const std::filesystem::path& store_path) {
    std::string user;
    if (const char* u = std::getenv("USER"); u && *u) {
        user = u;
    } else if (const char* n = std::getenv("USERNAME"); n && *n) {
        user = n;
    } else {
        user = std::to_string(::getuid());
    }

    char host[256] = {};
    if (::gethostname(host, sizeof(host) - 1) != 0) {
        host[0] = '\0';
    }

    std::string secret = user + '\n' + host + '\n' + store_path.string() + '\n' +
                         MACHINE_KEY_CONTEXT;
    KeyMaterial key{KeySource::MachineBound, SecureString(std::move(secret))};
    return key;
}

std::vector<uint8_t> seal_record(const std::string& plaintext, const KeyMaterial& key) {
    std::vector<uint8_t> record(HEADER_SIZE);
    std::memcpy(record.data(), RECORD_MAGIC, 4);
    record[4] = RECORD_VERSION;
    record[5] = static_cast<uint8_t>(key.source);
    uint32_t iterations = constants::PROFILE_KDF_ITERATIONS;
    record[6] = static_cast<uint8_t>(iterations >> 24);
    record[7] = static_cast<uint8_t>(iterations >> 16);
    record[8] = static_cast<uint8_t>(iterations >> 8);
    record[9] = static_cast<uint8_t>(iterations);

    uint8_t* salt = record.data() + 10;
    uint8_t* nonce = salt + constants::PROFILE_SALT_SIZE;
    if (RAND_bytes(salt, static_cast<int>(constants::PROFILE_SALT_SIZE)) != 1 ||
        RAND_bytes(nonce, static_cast<int>(constants::PROFILE_NONCE_SIZE)) != 1) {
        fail("random number generator failure");
    }

    DerivedKey dk;
    derive_key(key, salt, iterations, dk);

    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) fail("cannot allocate cipher context");

    int len = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(constants::PROFILE_NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, dk.bytes.data(), nonce) != 1 ||
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, record.data(),
                          static_cast<int>(HEADER_SIZE)) != 1) {
        fail("encryption setup failed");
    }

    record.resize(HEADER_SIZE + plaintext.size() + constants::PROFILE_TAG_SIZE);
    uint8_t* out = record.data() + HEADER_SIZE;
    int written = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out, &len,
                              reinterpret_cast<const uint8_t*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1) {
            fail("encryption failed");
        }
        written = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), out + written, &len) != 1) {
        fail("encryption failed");
    }
    written += len;

    uint8_t* tag = record.data() + HEADER_SIZE + written;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(constants::PROFILE_TAG_SIZE), tag) != 1) {
        fail("encryption failed");
    }
    record.resize(HEADER_SIZE + written + constants::PROFILE_TAG_SIZE);
    return record;
}

std::string open_record(const std::vector<uint8_t>& record, const KeyMaterial& key) {
    if (record.size() < HEADER_SIZE + constants::PROFILE_TAG_SIZE ||
        std::memcmp(record.data(), RECORD_MAGIC, 4) != 0) {
        fail("profile store is not a storify record or is truncated");
    }
    if (record[4] != RECORD_VERSION) {
        fail("unsupported profile store version " + std::to_string(record[4]));
    }

    auto source = static_cast<KeySource>(record[5]);
    if (source != KeySource::Passphrase && source != KeySource::MachineBound) {
        fail("profile store names an unknown key source");
    }
    if (source != key.source) {
        if (source == KeySource::Passphrase) {
            fail("profile store is sealed with a master password; "
                 "set STORIFY_MASTER_PASSWORD or pass --master-password");
        }
        fail("profile store is sealed with the machine-bound key; "
             "do not pass a master password");
    }

    uint32_t iterations = (uint32_t(record[6]) << 24) | (uint32_t(record[7]) << 16) |
                          (uint32_t(record[8]) << 8) | uint32_t(record[9]);
    if (iterations == 0 || iterations > MAX_KDF_ITERATIONS) {
        fail("profile store has an invalid key derivation header");
    }

    const uint8_t* salt = record.data() + 10;
    const uint8_t* nonce = salt + constants::PROFILE_SALT_SIZE;
    size_t cipher_len = record.size() - HEADER_SIZE - constants::PROFILE_TAG_SIZE;
    const uint8_t* ciphertext = record.data() + HEADER_SIZE;
    std::array<uint8_t, constants::PROFILE_TAG_SIZE> tag{};
    std::memcpy(tag.data(), ciphertext + cipher_len, tag.size());

    DerivedKey dk;
    derive_key(key, salt, iterations, dk);

    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) fail("cannot allocate cipher context");

    int len = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(constants::PROFILE_NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, dk.bytes.data(), nonce) != 1 ||
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, record.data(),
                          static_cast<int>(HEADER_SIZE)) != 1) {
        fail("decryption setup failed");
    }

    std::string plaintext(cipher_len, '\0');
    int produced = 0;
    if (cipher_len > 0) {
        if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<uint8_t*>(plaintext.data()), &len,
                              ciphertext, static_cast<int>(cipher_len)) != 1) {
            OPENSSL_cleanse(plaintext.data(), plaintext.size());
            fail("profile store decryption failed (wrong key or corrupted file)");
        }
        produced = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(tag.size()), tag.data()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(),
                            reinterpret_cast<uint8_t*>(plaintext.data()) + produced,
                            &len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        fail("profile store decryption failed (wrong key or corrupted file)");
    }
    plaintext.resize(produced + len);
    return plaintext;
}

} // namespace storify
