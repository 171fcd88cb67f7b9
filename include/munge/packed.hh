/**
 * @file packed.hh
 * @brief Fixed layout values stored inside leaf chunk payloads
 * @date 15/08/2025
 *
 * packed_traits<T> reads a T from a payload reader and appends its wire
 * form to a buffer. Provided for 1, 2 and 4 byte integers, f32,
 * null-terminated strings, raw byte payloads and enums that declare an
 * enum_traits specialization. Fixed structs specialize packed_traits
 * themselves, composing the scalar traits field by field.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <munge/export_munge.h>
#include <munge/endian.hh>
#include <munge/exceptions.hh>
#include <munge/chunk_reader.hh>

namespace munge {

    template<typename T, typename Enable = void>
    struct packed_traits;

    inline void append_raw(std::vector<std::byte>& out, const void* data, std::size_t size) {
        const auto* p = static_cast<const std::byte*>(data);
        out.insert(out.end(), p, p + size);
    }

    template<typename T>
    struct packed_traits<T, std::enable_if_t<is_packed_scalar_v<T>>> {
        static T read(chunk_reader& r) {
            return r.read_le<T>();
        }

        static void write(std::vector<std::byte>& out, const T& value) {
            T le = to_little_endian(value);
            append_raw(out, &le, sizeof(T));
        }
    };

    // Null-terminated byte string. No encoding is assumed.
    template<>
    struct MUNGE_EXPORT packed_traits<std::string> {
        // Content bytes allowed before the terminator
        static constexpr std::size_t max_length = 8192;

        /**
         * @throws string_too_long_error if max_length bytes are not followed
         *         by a terminator
         * @throws io_error if the payload ends sooner
         */
        static std::string read(chunk_reader& r);

        /**
         * @throws string_too_long_error for more than max_length bytes
         */
        static void write(std::vector<std::byte>& out, const std::string& value);
    };

    // The remainder of the payload
    template<>
    struct MUNGE_EXPORT packed_traits<std::vector<std::byte>> {
        static std::vector<std::byte> read(chunk_reader& r);
        static void write(std::vector<std::byte>& out, const std::vector<std::byte>& value);
    };

    /**
     * @brief Declares the wire form of an enum
     *
     * Specializations provide:
     *   using repr = <integer type>;
     *   static constexpr std::string_view name = "...";
     *   static constexpr std::array<E, N> values = { ... };
     */
    template<typename E>
    struct enum_traits;

    template<typename E>
    struct packed_traits<E, std::enable_if_t<std::is_enum_v<E>>> {
        using traits = enum_traits<E>;
        using repr = typename traits::repr;

        /**
         * @throws invalid_discriminant_error when the value is not declared
         */
        static E read(chunk_reader& r) {
            const auto raw = r.read_le<repr>();
            for (E v : traits::values) {
                if (static_cast<repr>(v) == raw) {
                    return v;
                }
            }
            throw invalid_discriminant_error(
                build_error_msg("Invalid ", traits::name, " value ", static_cast<std::uint64_t>(raw),
                                " at offset ", r.absolute_offset() - sizeof(repr)),
                static_cast<std::uint32_t>(raw));
        }

        static void write(std::vector<std::byte>& out, const E& value) {
            packed_traits<repr>::write(out, static_cast<repr>(value));
        }
    };

    template<typename T>
    T read_packed(chunk_reader& r) {
        return packed_traits<T>::read(r);
    }

    template<typename T>
    void write_packed(std::vector<std::byte>& out, const T& value) {
        packed_traits<T>::write(out, value);
    }

} // namespace munge
