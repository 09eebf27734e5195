/**
 * @file utils.hxx
 * @brief HTTP utility helpers for the cxxgate.
 */

#ifndef CXXGATE_HTTP_UTILS_HXX
#define CXXGATE_HTTP_UTILS_HXX

#include "internal/internal.hxx"

namespace cxxgate::http::utils {
    /**
     * @brief Computes the 32-bit FNV-1a hash for the given string.
     * @param str Input string to hash.
     * @return 32-bit FNV-1a hash value.
     */
    CXXGATE_INLINE constexpr std::uint32_t fnv1a_hash(const std::string_view str) {
        std::uint32_t hash = 2166136261u;

        for (const auto c : str) {
            hash ^= static_cast<std::uint8_t>(c);
            hash *= 16777619u;
        }

        return hash;
    }

    /**
     * @brief Encode an unsigned value in base 36 (0-9a-z).
     * @param value Value to encode.
     * @return Lower-case base 36 text.
     */
    CXXGATE_INLINE std::string to_base36(std::uint64_t value) {
        constexpr std::string_view k_digits = "0123456789abcdefghijklmnopqrstuvwxyz";

        if (value == 0u)
            return "0";

        std::string out{};

        while (value > 0u) {
            out.push_back(k_digits[value % 36u]);

            value /= 36u;
        }

        std::reverse(out.begin(), out.end());

        return out;
    }
}

#endif // CXXGATE_HTTP_UTILS_HXX
