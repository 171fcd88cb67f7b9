/**
 * @file texture.hh
 * @brief Texture records, chunk 'tex_'
 * @date 17/08/2025
 *
 * tex_
 *   NAME            string
 *   FMT_ (n)        one per stored pixel format
 *     INFO          texture_format_info
 *     FACE (n)      one for normal textures, six for cubemaps
 *       LVL_ (n)    one per mip level
 *         INFO      texture_mipmap_info
 *         BODY      pixel data, read on request
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <munge/export_munge.h>
#include <munge/tag.hh>
#include <munge/packed.hh>
#include <munge/schema.hh>
#include <munge/lazy_payload.hh>

namespace munge {

    /**
     * @enum texture_format_kind
     * @brief Pixel formats used by the texture munge tools
     *
     * Values follow D3D9. The compressed formats are stored as their
     * four character code.
     */
    enum class texture_format_kind : std::uint32_t {
        dxt1 = 0x31545844,      ///< "DXT1", compressed
        dxt3 = 0x33545844,      ///< "DXT3", compressed
        a8r8g8b8 = 0x15,        ///< RGBA, u8 value per channel
        r5g6b5 = 0x17,          ///< 16-bit RGB
        a1r5g5b5 = 0x19,        ///< 16-bit RGB with a single alpha bit
        a4r4g4b4 = 0x1a,        ///< 16-bit RGBA
        a8 = 0x1c,              ///< 8-bit alpha only
        l8 = 0x32,              ///< 8-bit luminance only
        a8l8 = 0x33,            ///< 8-bit alpha + 8-bit luminance
        a4l4 = 0x34,            ///< 4-bit alpha + 4-bit luminance
        v8u8 = 0x3c             ///< 2D vector map
    };

    enum class texture_kind : std::uint32_t {
        normal = 1,
        cubemap = 2
    };

    template<>
    struct enum_traits<texture_format_kind> {
        using repr = std::uint32_t;
        static constexpr std::string_view name = "texture format";
        static constexpr std::array<texture_format_kind, 11> values = {
            texture_format_kind::dxt1, texture_format_kind::dxt3,
            texture_format_kind::a8r8g8b8, texture_format_kind::r5g6b5,
            texture_format_kind::a1r5g5b5, texture_format_kind::a4r4g4b4,
            texture_format_kind::a8, texture_format_kind::l8,
            texture_format_kind::a8l8, texture_format_kind::a4l4,
            texture_format_kind::v8u8
        };
    };

    template<>
    struct enum_traits<texture_kind> {
        using repr = std::uint32_t;
        static constexpr std::string_view name = "texture kind";
        static constexpr std::array<texture_kind, 2> values = {
            texture_kind::normal, texture_kind::cubemap
        };
    };

    MUNGE_EXPORT std::uint32_t channel_count(texture_format_kind kind);
    MUNGE_EXPORT bool is_compressed(texture_format_kind kind);
    MUNGE_EXPORT std::string_view to_string(texture_format_kind kind);
    MUNGE_EXPORT std::string_view to_string(texture_kind kind);

    // 16 bytes on the wire
    struct texture_format_info {
        texture_format_kind format = texture_format_kind::a8r8g8b8;
        std::uint16_t width = 0;
        std::uint16_t height = 0;
        std::uint16_t depth = 0;
        std::uint16_t mipmaps = 0;
        texture_kind kind = texture_kind::normal;
    };

    // 8 bytes on the wire
    struct texture_mipmap_info {
        std::uint32_t mip_level = 0;
        std::uint32_t body_size = 0;
    };

    template<>
    struct MUNGE_EXPORT packed_traits<texture_format_info> {
        static texture_format_info read(chunk_reader& r);
        static void write(std::vector<std::byte>& out, const texture_format_info& value);
    };

    template<>
    struct MUNGE_EXPORT packed_traits<texture_mipmap_info> {
        static texture_mipmap_info read(chunk_reader& r);
        static void write(std::vector<std::byte>& out, const texture_mipmap_info& value);
    };

    struct texture_mipmap {
        texture_mipmap_info info;
        lazy_payload<std::vector<std::byte>> body;

        MUNGE_EXPORT static const record_schema<texture_mipmap>& schema();
    };

    struct texture_face {
        std::vector<texture_mipmap> mipmaps;

        MUNGE_EXPORT static const record_schema<texture_face>& schema();
    };

    struct texture_format {
        texture_format_info info;
        std::vector<texture_face> faces;

        MUNGE_EXPORT static const record_schema<texture_format>& schema();
    };

    struct texture {
        static constexpr tag chunk_tag = "tex_"_tag;

        std::string name;
        std::vector<texture_format> formats;

        MUNGE_EXPORT static const record_schema<texture>& schema();

        /// First stored format of the given kind, or nullptr
        MUNGE_EXPORT const texture_format* find_format(texture_format_kind kind) const;
    };

} // namespace munge
