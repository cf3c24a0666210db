#include "tether/crypto.hpp"
#include <sodium.h>
#include <format>

namespace tether::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(std::string_view data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        std::string hex;
        hex.reserve(64);
        for (uint8_t byte : hash)
        {
            hex += std::format("{:02x}", byte);
        }
        return hex;
    }

    SHA256Hash HmacSha256::compute(std::string_view key, std::string_view message)
    {
        SHA256Hash output;
        crypto_auth_hmacsha256_state state;
        crypto_auth_hmacsha256_init(&state,
                                    reinterpret_cast<const uint8_t *>(key.data()),
                                    key.size());
        crypto_auth_hmacsha256_update(&state,
                                      reinterpret_cast<const uint8_t *>(message.data()),
                                      message.size());
        crypto_auth_hmacsha256_final(&state, output.data());
        sodium_memzero(&state, sizeof(state));
        return output;
    }

    std::string HmacSha256::compute_hex(std::string_view key, std::string_view message)
    {
        return SHA256::to_hex(compute(key, message));
    }

} // namespace tether::crypto
