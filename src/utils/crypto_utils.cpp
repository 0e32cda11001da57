/**
 * @file crypto_utils.cpp
 * @brief Implementation of cryptographic utilities using libsodium.
 */
#include "mqttop_service.hpp"

#include <sodium.h>

#include <chrono>
#include <cstring>
#include <vector>

namespace mqttop::crypto
{

namespace
{
/**
 * @brief Tracks libsodium initialization.
 * @details sodium_init() is itself idempotent and thread-safe; the flag lets
 *          the fast path skip it and keeps the log line to a single one.
 */
std::atomic<bool> g_sodium_initialized{false};

bool ensure_sodium_init() noexcept
{
    if (g_sodium_initialized.load(std::memory_order_acquire))
    {
        return true;
    }

    // 0: first initialization, 1: already initialized, -1: failure.
    int result = sodium_init();
    if (result == -1)
    {
        LOGGER_ERROR("[CryptoUtils] FATAL: sodium_init() failed!");
        return false;
    }

    if (!g_sodium_initialized.exchange(true, std::memory_order_acq_rel) && result == 0)
    {
        LOGGER_INFO("[CryptoUtils] libsodium initialized successfully");
    }
    return true;
}

} // anonymous namespace

bool compute_sha256(std::array<uint8_t, SHA256_HASH_BYTES> &out, std::string_view data) noexcept
{
    static_assert(SHA256_HASH_BYTES == crypto_hash_sha256_BYTES);
    if (!ensure_sodium_init())
    {
        return false;
    }
    if (crypto_hash_sha256(out.data(), reinterpret_cast<const unsigned char *>(data.data()),
                           data.size()) != 0)
    {
        LOGGER_ERROR("[CryptoUtils] crypto_hash_sha256 failed");
        return false;
    }
    return true;
}

std::string to_base64url(const uint8_t *data, size_t len)
{
    if (data == nullptr || len == 0 || !ensure_sodium_init())
    {
        return {};
    }
    constexpr int kVariant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    std::vector<char> buf(sodium_base64_ENCODED_LEN(len, kVariant));
    sodium_bin2base64(buf.data(), buf.size(), data, len, kVariant);
    return std::string(buf.data());
}

std::string sha256_base64url(std::string_view data)
{
    std::array<uint8_t, SHA256_HASH_BYTES> digest{};
    if (!compute_sha256(digest, data))
    {
        return {};
    }
    return to_base64url(digest.data(), digest.size());
}

void generate_random_bytes(uint8_t *out, size_t len) noexcept
{
    if (out == nullptr)
    {
        LOGGER_ERROR("[CryptoUtils] generate_random_bytes: null output pointer");
        return;
    }
    if (!ensure_sodium_init())
    {
        LOGGER_ERROR(
            "[CryptoUtils] FATAL: Cannot generate random bytes, libsodium not initialized!");
        std::memset(out, 0, len);
        return;
    }
    // randombytes_buf never fails; it aborts on a catastrophic RNG failure.
    randombytes_buf(out, len);
}

std::string random_hex(size_t n)
{
    std::vector<uint8_t> bytes(n);
    generate_random_bytes(bytes.data(), bytes.size());
    std::string hex(n * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.resize(n * 2);
    return hex;
}

namespace
{
void crypto_startup(const char * /*arg*/)
{
    LOGGER_DEBUG("[CryptoUtils] Module starting up...");
    if (!ensure_sodium_init())
    {
        throw std::runtime_error("[CryptoUtils] failed to initialize libsodium");
    }
}

void crypto_shutdown(const char * /*arg*/)
{
    // libsodium needs no cleanup.
    g_sodium_initialized.store(false, std::memory_order_release);
    LOGGER_DEBUG("[CryptoUtils] Module shutdown complete");
}

} // anonymous namespace

mqttop::utils::ModuleDef GetLifecycleModule()
{
    mqttop::utils::ModuleDef module("CryptoUtils");
    module.add_dependency("mqttop::utils::Logger");
    module.set_startup(crypto_startup);
    module.set_shutdown(crypto_shutdown, std::chrono::milliseconds(1000));
    return module;
}

} // namespace mqttop::crypto
