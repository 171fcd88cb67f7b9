/**
 * @file model.hh
 * @brief Model records, chunk 'modl'
 * @date 21/08/2025
 *
 * modl
 *   NAME            string
 *   VRTX            u32
 *   NODE            string, scene node the model attaches to
 *   INFO            model_info
 *   segm (n)        one per draw call
 *     INFO          model_segment_info
 *     MTRL          model_material
 *     RTYP          string, render type
 *     TNAM (n)      model_texture_name
 *     BBOX          model_bbox
 *     IBUF          index buffer, read on request
 *     VBUF (n)      vertex buffers, read on request
 *     BNAM          string, bone map name
 *   SPHR            model_sphere
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

    enum class model_topology : std::uint32_t {
        point_list = 1,
        line_list = 2,
        line_strip = 3,
        triangle_list = 4,
        triangle_strip = 5,
        triangle_fan = 6
    };

    template<>
    struct enum_traits<model_topology> {
        using repr = std::uint32_t;
        static constexpr std::string_view name = "model topology";
        static constexpr std::array<model_topology, 6> values = {
            model_topology::point_list, model_topology::line_list,
            model_topology::line_strip, model_topology::triangle_list,
            model_topology::triangle_strip, model_topology::triangle_fan
        };
    };

    MUNGE_EXPORT std::string_view to_string(model_topology topology);

    /// Material flag bits. Undeclared bits are dropped on read.
    namespace material_flag {
        constexpr std::uint32_t normal = 1u << 0;
        constexpr std::uint32_t hard_edged = 1u << 1;
        constexpr std::uint32_t transparent = 1u << 2;
        constexpr std::uint32_t gloss_map = 1u << 3;
        constexpr std::uint32_t glow = 1u << 4;
        constexpr std::uint32_t normal_map = 1u << 5;
        constexpr std::uint32_t additive = 1u << 6;
        constexpr std::uint32_t specular = 1u << 7;
        constexpr std::uint32_t environment_map = 1u << 8;
        constexpr std::uint32_t vertex_lighting = 1u << 9;
        constexpr std::uint32_t tiled_normal_map = 1u << 11;
        constexpr std::uint32_t double_sided = 1u << 16;
        constexpr std::uint32_t scrolling = 1u << 24;
        constexpr std::uint32_t energy = 1u << 25;
        constexpr std::uint32_t animated = 1u << 26;
        constexpr std::uint32_t attached_light = 1u << 27;

        constexpr std::uint32_t all = normal | hard_edged | transparent | gloss_map | glow | normal_map |
                                      additive | specular | environment_map | vertex_lighting |
                                      tiled_normal_map | double_sided | scrolling | energy | animated |
                                      attached_light;
    }

    // 24 bytes on the wire
    struct model_bbox {
        std::array<float, 3> min{};
        std::array<float, 3> max{};
    };

    // 72 bytes on the wire. Only the boxes are understood.
    struct model_info {
        std::array<std::uint32_t, 4> unknown{};
        model_bbox vertex_box;
        model_bbox visibility_box;
        std::uint32_t unknown_0x40 = 0;
        std::uint32_t face_count = 0;
    };

    // 12 bytes on the wire
    struct model_segment_info {
        model_topology topology = model_topology::triangle_list;
        std::uint32_t vertex_count = 0;
        std::uint32_t primitive_count = 0;
    };

    struct model_material {
        std::uint32_t flags = 0;
        std::array<std::uint8_t, 4> diffuse{};
        std::array<std::uint8_t, 4> specular{};
        std::uint32_t specular_exponent = 0;
        std::array<std::uint32_t, 2> parameters{};
        std::string attached_light;

        [[nodiscard]] bool has(std::uint32_t flag) const { return (flags & flag) == flag; }
    };

    struct model_texture_name {
        std::uint32_t index = 0;
        std::string name;
    };

    // 16 bytes on the wire
    struct model_sphere {
        std::array<float, 3> position{};
        float radius = 0;
    };

    template<>
    struct MUNGE_EXPORT packed_traits<model_bbox> {
        static model_bbox read(chunk_reader& r);
        static void write(std::vector<std::byte>& out, const model_bbox& value);
    };

    template<>
    struct MUNGE_EXPORT packed_traits<model_info> {
        static model_info read(chunk_reader& r);
        static void write(std::vector<std::byte>& out, const model_info& value);
    };

    template<>
    struct MUNGE_EXPORT packed_traits<model_segment_info> {
        /**
         * @throws invalid_discriminant_error for an undeclared topology
         */
        static model_segment_info read(chunk_reader& r);
        static void write(std::vector<std::byte>& out, const model_segment_info& value);
    };

    template<>
    struct MUNGE_EXPORT packed_traits<model_material> {
        static model_material read(chunk_reader& r);
        static void write(std::vector<std::byte>& out, const model_material& value);
    };

    template<>
    struct MUNGE_EXPORT packed_traits<model_texture_name> {
        static model_texture_name read(chunk_reader& r);
        static void write(std::vector<std::byte>& out, const model_texture_name& value);
    };

    template<>
    struct MUNGE_EXPORT packed_traits<model_sphere> {
        static model_sphere read(chunk_reader& r);
        static void write(std::vector<std::byte>& out, const model_sphere& value);
    };

    struct model_segment {
        model_segment_info info;
        model_material material;
        std::string render_type;
        std::vector<model_texture_name> textures;
        model_bbox bbox;
        lazy_payload<std::vector<std::byte>> index_buffer;
        std::vector<lazy_payload<std::vector<std::byte>>> vertex_buffers;
        std::string bone_map;

        MUNGE_EXPORT static const record_schema<model_segment>& schema();
    };

    struct model {
        static constexpr tag chunk_tag = "modl"_tag;

        std::string name;
        std::uint32_t vertex = 0;
        std::string node;
        model_info info;
        std::vector<model_segment> segments;
        model_sphere sphere;

        MUNGE_EXPORT static const record_schema<model>& schema();
    };

} // namespace munge
