//
// Created by igor on 18/08/2025.
//

#include <doctest/doctest.h>
#include <sstream>

#include <munge/level.hh>
#include <munge/fnv1a.hh>
#include <munge/exceptions.hh>

#include "test_utils.hh"

using namespace munge;

namespace {
    bytes sample_level() {
        return root({
            level_pack(fnv1a("side"), {
                level_pack(fnv1a("rep"), {shader_chunk("water", "fn main() {}")}),
                script_chunk("rep_init", 1, u8s({0x1B, 0x4C, 0x75, 0x61}))
            }),
            script_chunk("global", 0, {}),
            chunk("tex_", cat({
                chunk("NAME", cstr("grass")),
                chunk("FMT_", cat({
                    chunk("INFO", format_info(0x15, 2, 2, 1, 1)),
                    chunk("FACE", mip_chunk(0, u8s({1, 2, 3, 4, 5, 6, 7, 8,
                                                    9, 10, 11, 12, 13, 14, 15, 16})))
                }))
            })),
            shader_chunk("sky", "// sky")
        });
    }
}

TEST_CASE("load a level") {
    std::istringstream stream(as_string(sample_level()));
    auto level = load_level(stream);

    REQUIRE(level.packs.size() == 1);
    REQUIRE(level.scripts.size() == 1);
    REQUIRE(level.textures.size() == 1);
    REQUIRE(level.shaders.size() == 1);

    CHECK(level.packs[0].has_name("side"));
    CHECK(level.packs[0].contents.scripts[0].name == "rep_init");
    CHECK(level.packs[0].contents.packs[0].contents.shaders[0].name == "water");
    CHECK(level.scripts[0].name == "global");
    CHECK(level.textures[0].name == "grass");
    CHECK(level.shaders[0].code == "// sky");
}

TEST_CASE("saved level matches the input bytes") {
    const bytes original = sample_level();
    std::istringstream stream(as_string(original));
    auto level = load_level(stream);

    std::ostringstream out;
    save_level(out, level, &stream);
    CHECK(as_bytes(out.str()) == original);
}

TEST_CASE("saved level loads back") {
    std::istringstream stream(as_string(sample_level()));
    auto level = load_level(stream);

    std::ostringstream out;
    save_level(out, level, &stream);

    std::istringstream again(out.str());
    auto reloaded = load_level(again);
    REQUIRE(reloaded.packs.size() == 1);
    CHECK(reloaded.packs[0].name_hash == level.packs[0].name_hash);
    CHECK(reloaded.packs[0].contents.scripts[0].body.read(again) == u8s({0x1B, 0x4C, 0x75, 0x61}));
    CHECK(reloaded.textures[0].formats[0].faces[0].mipmaps[0].body.read(again).size() == 16);
}

TEST_CASE("level built in memory") {
    level_data level;

    script s;
    s.name = "main";
    s.info = 2;
    s.body = lazy_payload<bytes>(u8s({1}));
    level.scripts.push_back(s);

    data_pack pack;
    pack.name_hash = fnv1a("common");
    shader sh;
    sh.name = "fx";
    sh.code = "x";
    pack.contents.shaders.push_back(sh);
    level.packs.push_back(pack);

    std::ostringstream out;
    save_level(out, level);

    // Packs come first, in schema order
    bytes expected = root({
        level_pack(fnv1a("common"), {shader_chunk("fx", "x")}),
        script_chunk("main", 2, u8s({1}))
    });
    CHECK(as_bytes(out.str()) == expected);
}

TEST_CASE("deferred payloads need the source stream") {
    std::istringstream stream(as_string(sample_level()));
    auto level = load_level(stream);

    std::ostringstream out;
    CHECK_THROWS_AS(save_level(out, level), content_error);
}

TEST_CASE("root must be ucfb") {
    std::istringstream stream(as_string(chunk("RIFF", {})));
    CHECK_THROWS_AS(load_level(stream), content_error);
}

TEST_CASE("empty level") {
    std::istringstream stream(as_string(root({})));
    auto level = load_level(stream);
    CHECK(level.packs.empty());
    CHECK(level.scripts.empty());
    CHECK(level.textures.empty());
    CHECK(level.shaders.empty());
}
