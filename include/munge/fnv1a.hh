/**
 * @file fnv1a.hh
 * @brief Name hashing used by the game engine for hash-addressed chunks
 * @date 16/08/2025
 *
 * 32-bit FNV-1a where every input byte is OR'd with 0x20 before it is
 * mixed in. For letters this folds upper case to lower case, so "Side" and
 * "side" hash alike. The fold also maps some non-letter pairs together
 * ('@' and '`', '\0' and ' '); that is what the game files were built
 * with and is kept as is.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

#include <munge/export_munge.h>

namespace munge {
    constexpr std::uint32_t fnv1a_offset_basis = 2166136261u;
    constexpr std::uint32_t fnv1a_prime = 16777619u;

    constexpr std::uint32_t fnv1a(std::string_view name) noexcept {
        std::uint32_t hash = fnv1a_offset_basis;
        for (char c : name) {
            hash ^= static_cast<std::uint32_t>(static_cast<unsigned char>(c) | 0x20u);
            hash *= fnv1a_prime;
        }
        return hash;
    }

    MUNGE_EXPORT std::uint32_t fnv1a(const void* data, std::size_t size) noexcept;

    // True when name hashes to the given value
    MUNGE_EXPORT bool fnv1a_matches(std::uint32_t hash, std::string_view name) noexcept;
}
