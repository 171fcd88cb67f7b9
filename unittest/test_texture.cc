//
// Created by igor on 17/08/2025.
//

#include <doctest/doctest.h>
#include <sstream>

#include <munge/texture.hh>
#include <munge/exceptions.hh>

#include "test_utils.hh"

using namespace munge;

namespace {
    constexpr std::uint32_t dxt1 = 0x31545844;
    constexpr std::uint32_t a8r8g8b8 = 0x15;

    bytes sky_texture() {
        return chunk("tex_", cat({
            chunk("NAME", cstr("sky")),
            chunk("FMT_", cat({
                chunk("INFO", format_info(dxt1, 8, 4, 2, 1)),
                chunk("FACE", cat({
                    mip_chunk(0, u8s({1, 2, 3, 4, 5, 6, 7, 8})),
                    mip_chunk(1, u8s({9, 10}))
                }))
            })),
            chunk("FMT_", cat({
                chunk("INFO", format_info(a8r8g8b8, 8, 4, 1, 1)),
                chunk("FACE", mip_chunk(0, u8s({0xFF, 0, 0, 0xFF})))
            }))
        }));
    }
}

TEST_CASE("texture record") {
    chunk_fixture f(sky_texture());
    auto t = decode_node<texture>(f.stream, f.header);

    CHECK(t.name == "sky");
    REQUIRE(t.formats.size() == 2);

    const auto& compressed = t.formats[0];
    CHECK(compressed.info.format == texture_format_kind::dxt1);
    CHECK(compressed.info.width == 8);
    CHECK(compressed.info.height == 4);
    CHECK(compressed.info.depth == 1);
    CHECK(compressed.info.mipmaps == 2);
    CHECK(compressed.info.kind == texture_kind::normal);
    REQUIRE(compressed.faces.size() == 1);
    REQUIRE(compressed.faces[0].mipmaps.size() == 2);

    const auto& mip1 = compressed.faces[0].mipmaps[1];
    CHECK(mip1.info.mip_level == 1);
    CHECK(mip1.info.body_size == 2);
    CHECK(mip1.body.is_deferred());
    CHECK(mip1.body.read(f.stream) == u8s({9, 10}));

    CHECK(t.formats[1].info.format == texture_format_kind::a8r8g8b8);
    CHECK(t.formats[1].faces[0].mipmaps[0].body.read(f.stream) == u8s({0xFF, 0, 0, 0xFF}));
}

TEST_CASE("cubemap faces") {
    bytes faces;
    for (int i = 0; i < 6; i++) {
        faces = cat({faces, chunk("FACE", mip_chunk(0, u8s({i})))});
    }
    chunk_fixture f(chunk("tex_", cat({
        chunk("NAME", cstr("env")),
        chunk("FMT_", cat({chunk("INFO", format_info(0x32, 1, 1, 1, 2)), faces}))
    })));
    auto t = decode_node<texture>(f.stream, f.header);

    REQUIRE(t.formats.size() == 1);
    CHECK(t.formats[0].info.kind == texture_kind::cubemap);
    REQUIRE(t.formats[0].faces.size() == 6);
    CHECK(t.formats[0].faces[5].mipmaps[0].body.read(f.stream) == u8s({5}));
}

TEST_CASE("unknown pixel format") {
    chunk_fixture f(chunk("tex_", cat({
        chunk("NAME", cstr("bad")),
        chunk("FMT_", chunk("INFO", format_info(0x99, 1, 1, 1, 1)))
    })));
    CHECK_THROWS_AS(decode_node<texture>(f.stream, f.header), invalid_discriminant_error);
}

TEST_CASE("format without INFO") {
    chunk_fixture f(chunk("tex_", cat({
        chunk("NAME", cstr("bad")),
        chunk("FMT_", chunk("FACE", {}))
    })));
    CHECK_THROWS_AS(decode_node<texture>(f.stream, f.header), missing_child_error);
}

TEST_CASE("find_format") {
    chunk_fixture f(sky_texture());
    auto t = decode_node<texture>(f.stream, f.header);

    const auto* argb = t.find_format(texture_format_kind::a8r8g8b8);
    REQUIRE(argb != nullptr);
    CHECK(argb == &t.formats[1]);
    CHECK(t.find_format(texture_format_kind::l8) == nullptr);
}

TEST_CASE("format properties") {
    CHECK(channel_count(texture_format_kind::dxt1) == 4);
    CHECK(channel_count(texture_format_kind::a8r8g8b8) == 4);
    CHECK(channel_count(texture_format_kind::r5g6b5) == 3);
    CHECK(channel_count(texture_format_kind::a8l8) == 2);
    CHECK(channel_count(texture_format_kind::v8u8) == 2);
    CHECK(channel_count(texture_format_kind::a8) == 1);
    CHECK(channel_count(texture_format_kind::l8) == 1);

    CHECK(is_compressed(texture_format_kind::dxt1));
    CHECK(is_compressed(texture_format_kind::dxt3));
    CHECK_FALSE(is_compressed(texture_format_kind::a4r4g4b4));

    CHECK(to_string(texture_format_kind::dxt3) == "DXT3");
    CHECK(to_string(texture_format_kind::a4l4) == "A4L4");
    CHECK(to_string(texture_kind::cubemap) == "cubemap");
}

TEST_CASE("format properties of undeclared values") {
    const auto bogus = static_cast<texture_format_kind>(0x99);
    CHECK_THROWS_AS((void)channel_count(bogus), invalid_discriminant_error);
    try {
        (void)channel_count(bogus);
        FAIL("expected invalid_discriminant_error");
    } catch (const invalid_discriminant_error& e) {
        CHECK(e.value() == 0x99);
    }
    CHECK_FALSE(is_compressed(bogus));
    CHECK(to_string(bogus) == "unknown");
}

TEST_CASE("texture encodes to the same bytes") {
    const bytes data = sky_texture();
    chunk_fixture f(data);
    auto t = decode_node<texture>(f.stream, f.header);
    CHECK(encode_node(texture::chunk_tag, t, &f.stream) == data);
}
