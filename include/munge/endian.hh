//
// Created by igor on 10/08/2025.
//

#pragma once

#include <cstdint>
#include <cstring>
#include <type_traits>

#include <munge/munge_config.h>

namespace munge {
    // Platform endianness detection using CMake-generated config
#if LIBMUNGE_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    // Byte swapping functions
    inline std::uint16_t swap16(std::uint16_t x) {
        return static_cast<std::uint16_t>((x << 8) | (x >> 8));
    }

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    inline float swap_float(float x) {
        std::uint32_t u;
        std::memcpy(&u, &x, sizeof(u));
        u = swap32(u);
        std::memcpy(&x, &u, sizeof(u));
        return x;
    }

    // Munge data is always little endian on disk
    inline std::uint16_t swap16le(std::uint16_t x) {
        return is_little_endian ? x : swap16(x);
    }

    inline std::uint32_t swap32le(std::uint32_t x) {
        return is_little_endian ? x : swap32(x);
    }

    inline float swap_float_le(float x) {
        return is_little_endian ? x : swap_float(x);
    }

    template<typename T>
    struct is_packed_scalar {
        static constexpr bool value =
            (std::is_integral_v<T> && !std::is_same_v<T, bool> &&
             (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4)) ||
            (std::is_floating_point_v<T> && sizeof(T) == 4);
    };

    template<typename T>
    inline constexpr bool is_packed_scalar_v = is_packed_scalar<T>::value;

    // Converts between host order and the little endian wire order.
    // The operation is its own inverse.
    template<typename T>
    constexpr T to_little_endian(T x) noexcept {
        static_assert(is_packed_scalar_v<T>,
                      "to_little_endian only supports 1, 2 and 4 byte integers and float");

        if constexpr (sizeof(T) == 1) {
            return x;
        } else if constexpr (std::is_floating_point_v<T>) {
            return swap_float_le(x);
        } else if constexpr (sizeof(T) == 2) {
            return static_cast<T>(swap16le(static_cast<std::uint16_t>(x)));
        } else {
            return static_cast<T>(swap32le(static_cast<std::uint32_t>(x)));
        }
    }
}
