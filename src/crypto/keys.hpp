#pragma once

#include "core/result.hpp"
#include <sodium.h>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace almanac::crypto {

constexpr size_t SYMMETRIC_KEY_SIZE = crypto_secretbox_KEYBYTES;
constexpr size_t SALT_SIZE = crypto_pwhash_SALTBYTES;
constexpr size_t SHA256_SIZE = crypto_hash_sha256_BYTES;

using SymmetricKey = std::array<uint8_t, SYMMETRIC_KEY_SIZE>;
using Salt = std::array<uint8_t, SALT_SIZE>;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{ErrorKind::Crypto, "Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

[[nodiscard]] inline SymmetricKey generate_symmetric_key() {
    SymmetricKey key;
    crypto_secretbox_keygen(key.data());
    return key;
}

[[nodiscard]] inline Salt generate_salt() {
    Salt salt;
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

[[nodiscard]] inline std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    randombytes_buf(bytes.data(), bytes.size());
    return bytes;
}

/**
 * Derive a symmetric key from a password with Argon2id at the interactive
 * cost limits.
 */
[[nodiscard]] inline Result<SymmetricKey, Error> derive_key_from_password(
    const std::string& password,
    const Salt& salt
) {
    SymmetricKey key;
    int rc = crypto_pwhash(
        key.data(), key.size(),
        password.c_str(), password.size(),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_ARGON2ID13
    );
    if (rc != 0) {
        return Result<SymmetricKey, Error>::err(Error{ErrorKind::Crypto, "Key derivation failed"});
    }
    return Result<SymmetricKey, Error>::ok(key);
}

/**
 * SHA-256 of `data`.
 */
[[nodiscard]] inline std::array<uint8_t, SHA256_SIZE> sha256(std::span<const uint8_t> data) {
    std::array<uint8_t, SHA256_SIZE> out;
    crypto_hash_sha256(out.data(), data.data(), data.size());
    return out;
}

/**
 * Lowercase hex SHA-256 of `data`, the form backup checksums are stored in.
 */
[[nodiscard]] inline std::string sha256_hex(std::span<const uint8_t> data) {
    const auto digest = sha256(data);
    std::string hex(SHA256_SIZE * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    hex.pop_back();
    return hex;
}

inline void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

/**
 * Constant-time comparison of two equal-length strings; false if lengths
 * differ.
 */
[[nodiscard]] inline bool secure_compare(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace almanac::crypto
