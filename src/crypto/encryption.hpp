#pragma once

#include "crypto/keys.hpp"
#include "core/result.hpp"
#include <algorithm>
#include <span>
#include <vector>

namespace almanac::crypto {

constexpr size_t SECRETBOX_NONCE_SIZE = crypto_secretbox_NONCEBYTES;
constexpr size_t SECRETBOX_MAC_SIZE = crypto_secretbox_MACBYTES;

/**
 * Encrypt with XSalsa20-Poly1305. Output layout: nonce || ciphertext || mac.
 */
[[nodiscard]] inline Result<std::vector<uint8_t>, Error> encrypt_symmetric(
    std::span<const uint8_t> plaintext,
    const SymmetricKey& key
) {
    std::vector<uint8_t> output(SECRETBOX_NONCE_SIZE + plaintext.size() + SECRETBOX_MAC_SIZE);
    randombytes_buf(output.data(), SECRETBOX_NONCE_SIZE);

    int rc = crypto_secretbox_easy(
        output.data() + SECRETBOX_NONCE_SIZE,
        plaintext.data(), plaintext.size(),
        output.data(),
        key.data()
    );
    if (rc != 0) {
        return Result<std::vector<uint8_t>, Error>::err(Error{ErrorKind::Crypto, "Encryption failed"});
    }
    return Result<std::vector<uint8_t>, Error>::ok(std::move(output));
}

[[nodiscard]] inline Result<std::vector<uint8_t>, Error> decrypt_symmetric(
    std::span<const uint8_t> ciphertext,
    const SymmetricKey& key
) {
    if (ciphertext.size() < SECRETBOX_NONCE_SIZE + SECRETBOX_MAC_SIZE) {
        return Result<std::vector<uint8_t>, Error>::err(Error{ErrorKind::Crypto, "Ciphertext too short"});
    }

    const uint8_t* nonce = ciphertext.data();
    const uint8_t* boxed = ciphertext.data() + SECRETBOX_NONCE_SIZE;
    const size_t boxed_len = ciphertext.size() - SECRETBOX_NONCE_SIZE;

    std::vector<uint8_t> plaintext(boxed_len - SECRETBOX_MAC_SIZE);
    int rc = crypto_secretbox_open_easy(plaintext.data(), boxed, boxed_len, nonce, key.data());
    if (rc != 0) {
        return Result<std::vector<uint8_t>, Error>::err(
            Error{ErrorKind::Crypto, "Decryption failed (wrong password or corrupted data)"});
    }
    return Result<std::vector<uint8_t>, Error>::ok(std::move(plaintext));
}

/**
 * Password-based encryption. Output layout: salt || nonce || ciphertext || mac;
 * the key is derived from `password` and the fresh salt with Argon2id.
 */
[[nodiscard]] inline Result<std::vector<uint8_t>, Error> encrypt_with_password(
    std::span<const uint8_t> plaintext,
    const std::string& password
) {
    const Salt salt = generate_salt();
    auto key = derive_key_from_password(password, salt);
    if (key.is_err()) {
        return Result<std::vector<uint8_t>, Error>::err(key.unwrap_err());
    }

    auto derived = std::move(key).unwrap();
    auto sealed = encrypt_symmetric(plaintext, derived);
    secure_zero(derived.data(), derived.size());
    if (sealed.is_err()) {
        return sealed;
    }

    std::vector<uint8_t> output;
    output.reserve(SALT_SIZE + sealed.unwrap().size());
    output.insert(output.end(), salt.begin(), salt.end());
    output.insert(output.end(), sealed.unwrap().begin(), sealed.unwrap().end());
    return Result<std::vector<uint8_t>, Error>::ok(std::move(output));
}

[[nodiscard]] inline Result<std::vector<uint8_t>, Error> decrypt_with_password(
    std::span<const uint8_t> data,
    const std::string& password
) {
    if (data.size() < SALT_SIZE + SECRETBOX_NONCE_SIZE + SECRETBOX_MAC_SIZE) {
        return Result<std::vector<uint8_t>, Error>::err(Error{ErrorKind::Crypto, "Ciphertext too short"});
    }

    Salt salt;
    std::copy_n(data.begin(), SALT_SIZE, salt.begin());
    auto key = derive_key_from_password(password, salt);
    if (key.is_err()) {
        return Result<std::vector<uint8_t>, Error>::err(key.unwrap_err());
    }

    auto derived = std::move(key).unwrap();
    auto opened = decrypt_symmetric(data.subspan(SALT_SIZE), derived);
    secure_zero(derived.data(), derived.size());
    return opened;
}

} // namespace almanac::crypto
