//
// Created by igor on 21/08/2025.
//

#include <doctest/doctest.h>
#include <sstream>

#include <munge/model.hh>
#include <munge/level.hh>
#include <munge/locate.hh>
#include <munge/fnv1a.hh>
#include <munge/exceptions.hh>

#include "test_utils.hh"

using namespace munge;

namespace {
    bytes box(float x0, float y0, float z0, float x1, float y1, float z1) {
        return cat({f32(x0), f32(y0), f32(z0), f32(x1), f32(y1), f32(z1)});
    }

    bytes info_payload() {
        return cat({
            le32(1), le32(2), le32(3), le32(4),
            box(-1.5f, -2.0f, -0.25f, 1.5f, 2.0f, 0.25f),
            box(-8.0f, -8.0f, -8.0f, 8.0f, 8.0f, 8.0f),
            le32(0x40),
            le32(12)
        });
    }

    bytes material_payload(std::uint32_t flags) {
        return cat({
            le32(flags),
            u8s({255, 128, 0, 255}),
            u8s({10, 20, 30, 40}),
            le32(50),
            le32(7), le32(9),
            cstr("lamp")
        });
    }

    bytes segment_chunk(std::uint32_t topology, std::uint32_t flags) {
        return chunk("segm", cat({
            chunk("INFO", cat({le32(topology), le32(24), le32(8)})),
            chunk("MTRL", material_payload(flags)),
            chunk("RTYP", cstr("Normal")),
            chunk("TNAM", cat({le32(0), cstr("tank_diffuse")})),
            chunk("TNAM", cat({le32(1), cstr("tank_bump")})),
            chunk("BBOX", box(0.0f, 0.0f, 0.0f, 1.0f, 2.0f, 3.0f)),
            chunk("IBUF", u8s({0, 0, 1, 0, 2, 0})),
            chunk("VBUF", u8s({1, 1, 1, 1})),
            chunk("VBUF", u8s({2, 2})),
            chunk("BNAM", cstr("bones"))
        }));
    }

    bytes model_chunk(const bytes& segments) {
        return chunk("modl", cat({
            chunk("NAME", cstr("tank")),
            chunk("VRTX", le32(0)),
            chunk("NODE", cstr("tank_root")),
            chunk("INFO", info_payload()),
            segments,
            chunk("SPHR", cat({f32(0.5f), f32(1.0f), f32(-3.0f), f32(9.75f)}))
        }));
    }

    constexpr std::uint32_t tank_flags = material_flag::normal | material_flag::specular |
                                         material_flag::double_sided;
}

TEST_CASE("model record") {
    chunk_fixture f(model_chunk(cat({segment_chunk(4, tank_flags), segment_chunk(5, 0)})));
    auto m = decode_node<model>(f.stream, f.header);

    CHECK(m.name == "tank");
    CHECK(m.vertex == 0);
    CHECK(m.node == "tank_root");

    SUBCASE("info") {
        CHECK(m.info.unknown == std::array<std::uint32_t, 4>{1, 2, 3, 4});
        CHECK(m.info.vertex_box.min == std::array<float, 3>{-1.5f, -2.0f, -0.25f});
        CHECK(m.info.vertex_box.max == std::array<float, 3>{1.5f, 2.0f, 0.25f});
        CHECK(m.info.visibility_box.min[2] == -8.0f);
        CHECK(m.info.visibility_box.max[0] == 8.0f);
        CHECK(m.info.unknown_0x40 == 0x40);
        CHECK(m.info.face_count == 12);
    }

    SUBCASE("sphere") {
        CHECK(m.sphere.position == std::array<float, 3>{0.5f, 1.0f, -3.0f});
        CHECK(m.sphere.radius == 9.75f);
    }

    SUBCASE("segments") {
        REQUIRE(m.segments.size() == 2);
        const auto& s = m.segments[0];

        CHECK(s.info.topology == model_topology::triangle_list);
        CHECK(s.info.vertex_count == 24);
        CHECK(s.info.primitive_count == 8);
        CHECK(m.segments[1].info.topology == model_topology::triangle_strip);

        CHECK(s.material.flags == tank_flags);
        CHECK(s.material.has(material_flag::specular));
        CHECK_FALSE(s.material.has(material_flag::glow));
        CHECK(s.material.diffuse == std::array<std::uint8_t, 4>{255, 128, 0, 255});
        CHECK(s.material.specular == std::array<std::uint8_t, 4>{10, 20, 30, 40});
        CHECK(s.material.specular_exponent == 50);
        CHECK(s.material.parameters == std::array<std::uint32_t, 2>{7, 9});
        CHECK(s.material.attached_light == "lamp");

        CHECK(s.render_type == "Normal");
        REQUIRE(s.textures.size() == 2);
        CHECK(s.textures[0].index == 0);
        CHECK(s.textures[0].name == "tank_diffuse");
        CHECK(s.textures[1].index == 1);
        CHECK(s.textures[1].name == "tank_bump");
        CHECK(s.bbox.max == std::array<float, 3>{1.0f, 2.0f, 3.0f});
        CHECK(s.bone_map == "bones");
    }

    SUBCASE("buffers are read on request") {
        const auto& s = m.segments[0];
        CHECK(s.index_buffer.is_deferred());
        REQUIRE(s.vertex_buffers.size() == 2);
        CHECK(s.vertex_buffers[0].is_deferred());
        CHECK(s.vertex_buffers[1].is_deferred());

        CHECK(s.vertex_buffers[1].read(f.stream) == u8s({2, 2}));
        CHECK(s.vertex_buffers[0].read(f.stream) == u8s({1, 1, 1, 1}));
        CHECK(s.index_buffer.read(f.stream) == u8s({0, 0, 1, 0, 2, 0}));
    }
}

TEST_CASE("model topology values") {
    SUBCASE("all six are accepted") {
        for (std::uint32_t v = 1; v <= 6; v++) {
            chunk_fixture f(model_chunk(segment_chunk(v, 0)));
            auto m = decode_node<model>(f.stream, f.header);
            CHECK(static_cast<std::uint32_t>(m.segments[0].info.topology) == v);
        }
    }

    SUBCASE("undeclared values are rejected") {
        for (std::uint32_t v : {0u, 7u, 0xFFFFFFFFu}) {
            chunk_fixture f(model_chunk(segment_chunk(v, 0)));
            try {
                (void)decode_node<model>(f.stream, f.header);
                FAIL("topology " << v << " was accepted");
            } catch (const invalid_discriminant_error& e) {
                CHECK(e.value() == v);
            }
        }
    }

    SUBCASE("names") {
        CHECK(to_string(model_topology::point_list) == "point list");
        CHECK(to_string(model_topology::triangle_fan) == "triangle fan");
        CHECK(to_string(static_cast<model_topology>(9)) == "unknown");
    }
}

TEST_CASE("material flags") {
    SUBCASE("undeclared bits are dropped") {
        chunk_fixture f(model_chunk(segment_chunk(4, material_flag::glow | (1u << 10) | (1u << 31))));
        auto m = decode_node<model>(f.stream, f.header);
        CHECK(m.segments[0].material.flags == material_flag::glow);
    }

    SUBCASE("every declared bit survives") {
        chunk_fixture f(model_chunk(segment_chunk(4, material_flag::all)));
        auto m = decode_node<model>(f.stream, f.header);
        CHECK(m.segments[0].material.flags == material_flag::all);
        CHECK(m.segments[0].material.has(material_flag::attached_light));
        CHECK(m.segments[0].material.has(material_flag::tiled_normal_map));
    }
}

TEST_CASE("model without segments") {
    chunk_fixture f(model_chunk({}));
    auto m = decode_node<model>(f.stream, f.header);
    CHECK(m.segments.empty());
    CHECK(m.sphere.radius == 9.75f);
}

TEST_CASE("model missing its sphere") {
    chunk_fixture f(chunk("modl", cat({
        chunk("NAME", cstr("tank")),
        chunk("VRTX", le32(0)),
        chunk("NODE", cstr("tank_root")),
        chunk("INFO", info_payload())
    })));
    CHECK_THROWS_AS((void)decode_node<model>(f.stream, f.header), missing_child_error);
}

TEST_CASE("truncated model info") {
    chunk_fixture f(chunk("modl", cat({
        chunk("NAME", cstr("tank")),
        chunk("VRTX", le32(0)),
        chunk("NODE", cstr("tank_root")),
        chunk("INFO", le32(1)),
        chunk("SPHR", cat({f32(0), f32(0), f32(0), f32(1)}))
    })));
    CHECK_THROWS_AS((void)decode_node<model>(f.stream, f.header), io_error);
}

TEST_CASE("model encoding") {
    const bytes data = model_chunk(segment_chunk(6, tank_flags));
    chunk_fixture f(data);
    auto m = decode_node<model>(f.stream, f.header);

    CHECK(encode_node(model::chunk_tag, m, &f.stream) == data);
}

TEST_CASE("models in a level") {
    std::istringstream stream(as_string(root({
        level_pack(fnv1a("vehicles"), {model_chunk(segment_chunk(4, 0))}),
        script_chunk("main", 1, u8s({1}))
    })));
    auto level = load_level(stream);

    CHECK(level.models.empty());
    const model* tank = find_model(level, "vehicles/tank");
    REQUIRE(tank != nullptr);
    CHECK(tank->node == "tank_root");
    CHECK(tank->segments[0].vertex_buffers[1].read(stream) == u8s({2, 2}));
    CHECK(find_model(level, "vehicles/jeep") == nullptr);
    CHECK(find_model(level, "tank") == nullptr);
}
