//
// Created by igor on 21/08/2025.
//

#include <munge/model.hh>

namespace munge {
    namespace {
        template<typename T, std::size_t N>
        std::array<T, N> read_array(chunk_reader& r) {
            std::array<T, N> result{};
            for (auto& v : result) {
                v = read_packed<T>(r);
            }
            return result;
        }

        template<typename T, std::size_t N>
        void write_array(std::vector<std::byte>& out, const std::array<T, N>& values) {
            for (const auto& v : values) {
                write_packed(out, v);
            }
        }
    }

    std::string_view to_string(model_topology topology) {
        switch (topology) {
            case model_topology::point_list: return "point list";
            case model_topology::line_list: return "line list";
            case model_topology::line_strip: return "line strip";
            case model_topology::triangle_list: return "triangle list";
            case model_topology::triangle_strip: return "triangle strip";
            case model_topology::triangle_fan: return "triangle fan";
        }
        return "unknown";
    }

    model_bbox packed_traits<model_bbox>::read(chunk_reader& r) {
        model_bbox box;
        box.min = read_array<float, 3>(r);
        box.max = read_array<float, 3>(r);
        return box;
    }

    void packed_traits<model_bbox>::write(std::vector<std::byte>& out, const model_bbox& value) {
        write_array(out, value.min);
        write_array(out, value.max);
    }

    model_info packed_traits<model_info>::read(chunk_reader& r) {
        model_info info;
        info.unknown = read_array<std::uint32_t, 4>(r);
        info.vertex_box = read_packed<model_bbox>(r);
        info.visibility_box = read_packed<model_bbox>(r);
        info.unknown_0x40 = read_packed<std::uint32_t>(r);
        info.face_count = read_packed<std::uint32_t>(r);
        return info;
    }

    void packed_traits<model_info>::write(std::vector<std::byte>& out, const model_info& value) {
        write_array(out, value.unknown);
        write_packed(out, value.vertex_box);
        write_packed(out, value.visibility_box);
        write_packed(out, value.unknown_0x40);
        write_packed(out, value.face_count);
    }

    model_segment_info packed_traits<model_segment_info>::read(chunk_reader& r) {
        model_segment_info info;
        info.topology = read_packed<model_topology>(r);
        info.vertex_count = read_packed<std::uint32_t>(r);
        info.primitive_count = read_packed<std::uint32_t>(r);
        return info;
    }

    void packed_traits<model_segment_info>::write(std::vector<std::byte>& out, const model_segment_info& value) {
        write_packed(out, value.topology);
        write_packed(out, value.vertex_count);
        write_packed(out, value.primitive_count);
    }

    model_material packed_traits<model_material>::read(chunk_reader& r) {
        model_material m;
        m.flags = read_packed<std::uint32_t>(r) & material_flag::all;
        m.diffuse = read_array<std::uint8_t, 4>(r);
        m.specular = read_array<std::uint8_t, 4>(r);
        m.specular_exponent = read_packed<std::uint32_t>(r);
        m.parameters = read_array<std::uint32_t, 2>(r);
        m.attached_light = read_packed<std::string>(r);
        return m;
    }

    void packed_traits<model_material>::write(std::vector<std::byte>& out, const model_material& value) {
        write_packed(out, value.flags & material_flag::all);
        write_array(out, value.diffuse);
        write_array(out, value.specular);
        write_packed(out, value.specular_exponent);
        write_array(out, value.parameters);
        write_packed(out, value.attached_light);
    }

    model_texture_name packed_traits<model_texture_name>::read(chunk_reader& r) {
        model_texture_name t;
        t.index = read_packed<std::uint32_t>(r);
        t.name = read_packed<std::string>(r);
        return t;
    }

    void packed_traits<model_texture_name>::write(std::vector<std::byte>& out, const model_texture_name& value) {
        write_packed(out, value.index);
        write_packed(out, value.name);
    }

    model_sphere packed_traits<model_sphere>::read(chunk_reader& r) {
        model_sphere s;
        s.position = read_array<float, 3>(r);
        s.radius = read_packed<float>(r);
        return s;
    }

    void packed_traits<model_sphere>::write(std::vector<std::byte>& out, const model_sphere& value) {
        write_array(out, value.position);
        write_packed(out, value.radius);
    }

    const record_schema<model_segment>& model_segment::schema() {
        static const auto s = record_schema<model_segment>("model segment")
            .single("INFO"_tag, &model_segment::info, "info")
            .single("MTRL"_tag, &model_segment::material, "material")
            .single("RTYP"_tag, &model_segment::render_type, "render_type")
            .repeated("TNAM", &model_segment::textures, "textures")
            .single("BBOX"_tag, &model_segment::bbox, "bbox")
            .single("IBUF"_tag, &model_segment::index_buffer, "index_buffer")
            .repeated("VBUF", &model_segment::vertex_buffers, "vertex_buffers")
            .single("BNAM"_tag, &model_segment::bone_map, "bone_map");
        return s;
    }

    const record_schema<model>& model::schema() {
        static const auto s = record_schema<model>("model")
            .single("NAME"_tag, &model::name, "name")
            .single("VRTX"_tag, &model::vertex, "vertex")
            .single("NODE"_tag, &model::node, "node")
            .single("INFO"_tag, &model::info, "info")
            .repeated("segm", &model::segments, "segments")
            .single("SPHR"_tag, &model::sphere, "sphere");
        return s;
    }

} // namespace munge
