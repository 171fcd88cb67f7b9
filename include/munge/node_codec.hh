/**
 * @file node_codec.hh
 * @brief Per-type decode and encode of a whole chunk
 * @date 15/08/2025
 *
 * node_codec<T>::decode(ctx, header) turns a chunk into a T and
 * node_codec<T>::encode(value, writer) fills a writer with its payload.
 * Types with a static schema() are records and go through the schema
 * mapper; everything else is a packed value read from the payload.
 * Lazy payloads and hash-addressed packs bring their own specializations.
 */

#pragma once

#include <type_traits>
#include <utility>

#include <munge/chunk_header.hh>
#include <munge/decode_context.hh>
#include <munge/node_writer.hh>
#include <munge/packed.hh>

namespace munge {

    template<typename T, typename = void>
    struct has_schema : std::false_type {};

    template<typename T>
    struct has_schema<T, std::void_t<decltype(T::schema())>> : std::true_type {};

    template<typename T>
    inline constexpr bool has_schema_v = has_schema<T>::value;

    template<typename T, typename Enable>
    struct node_codec {
        static T decode(decode_context& ctx, const chunk_header& h) {
            if constexpr (has_schema_v<T>) {
                return T::schema().decode(ctx, h);
            } else {
                auto reader = ctx.open(h);
                return packed_traits<T>::read(*reader);
            }
        }

        static void encode(const T& value, node_writer& w) {
            if constexpr (has_schema_v<T>) {
                T::schema().encode(value, w);
            } else {
                w.write_packed(value);
            }
        }
    };

    /**
     * @brief Decode the chunk at h as a T
     */
    template<typename T>
    T decode_node(std::istream& stream, const chunk_header& h, const parse_options& options = {}) {
        decode_context ctx(stream, options);
        return node_codec<T>::decode(ctx, h);
    }

    /**
     * @brief Encode value as a complete chunk named name
     */
    template<typename T>
    std::vector<std::byte> encode_node(const chunk_name& name, const T& value, std::istream* source = nullptr) {
        node_writer w(resolve(name), source);
        node_codec<T>::encode(value, w);
        return w.finish();
    }

} // namespace munge
