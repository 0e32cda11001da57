#pragma once
/**
 * @file crypto_utils.hpp
 * @brief Hashing, encoding and random-number helpers backed by libsodium.
 *
 * mqttop derives its stable Home Assistant device identifier from a SHA-256
 * digest of the machine id, and uses random bytes to build unique client ids
 * for one-shot connections (`mqttop stop`).
 *
 * libsodium is initialized by this module's lifecycle startup. No libsodium
 * type appears in the public API.
 */
#include "mqttop_utils_export.h"
#include "utils/module_def.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mqttop::crypto
{

/** SHA-256 digest size in bytes. */
static constexpr size_t SHA256_HASH_BYTES = 32;

/**
 * @brief Computes the SHA-256 digest of @p data.
 * @return True on success, false if libsodium could not be initialized.
 */
MQTTOP_UTILS_EXPORT bool compute_sha256(std::array<uint8_t, SHA256_HASH_BYTES> &out,
                                        std::string_view data) noexcept;

/**
 * @brief URL-safe base64 without padding (RFC 4648 section 5).
 *
 * Returns an empty string for empty input or on failure.
 */
MQTTOP_UTILS_EXPORT std::string to_base64url(const uint8_t *data, size_t len);

/**
 * @brief base64url(SHA-256(data)), 43 characters.
 *
 * @return The encoded digest, or an empty string on failure.
 */
MQTTOP_UTILS_EXPORT std::string sha256_base64url(std::string_view data);

/// Fills @p out with cryptographically secure random bytes.
MQTTOP_UTILS_EXPORT void generate_random_bytes(uint8_t *out, size_t len) noexcept;

/// @p n random bytes rendered as lower-case hex (2n characters).
MQTTOP_UTILS_EXPORT std::string random_hex(size_t n);

/**
 * @brief Lifecycle module that initializes libsodium.
 *
 * Register it with the LifecycleGuard in `main` alongside the Logger:
 * @code
 * LifecycleGuard guard(MakeModDefList(Logger::GetLifecycleModule(),
 *                                     crypto::GetLifecycleModule()));
 * @endcode
 */
MQTTOP_UTILS_EXPORT mqttop::utils::ModuleDef GetLifecycleModule();

} // namespace mqttop::crypto
