#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tether::crypto
{

    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;

    /**
     * SHA-256 hashing (libsodium)
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        static SHA256Hash hash(std::string_view data);

        /**
         * Convert hash to lowercase hex string
         */
        static std::string to_hex(const SHA256Hash &hash);
    };

    /**
     * HMAC-SHA-256 keyed hashing. Keys of any length are accepted; the same
     * key and message always give the same digest.
     */
    class HmacSha256
    {
    public:
        static SHA256Hash compute(std::string_view key, std::string_view message);

        static std::string compute_hex(std::string_view key, std::string_view message);
    };

} // namespace tether::crypto
