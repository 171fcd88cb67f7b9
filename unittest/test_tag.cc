//
// Created by igor on 10/08/2025.
//

#include <doctest/doctest.h>
#include <sstream>
#include <unordered_set>

#include <munge/tag.hh>
#include <munge/chunk_name.hh>

using namespace munge;

TEST_CASE("tag construction") {
    SUBCASE("literal") {
        constexpr tag t = "NAME"_tag;
        CHECK(t[0] == 'N');
        CHECK(t[3] == 'E');
        CHECK(t.to_string() == "NAME");
    }

    SUBCASE("from raw bytes") {
        const char data[] = {'s', 'c', 'r', '_'};
        CHECK(tag::from_bytes(data) == "scr_"_tag);
    }

    SUBCASE("short string is padded with spaces") {
        tag t(std::string_view("ab"));
        CHECK(t.to_string() == "ab  ");
    }
}

TEST_CASE("tag little endian reinterpretation") {
    const tag t('\x26', '\x65', '\x61', '\xD8');
    CHECK(t.to_uint32() == 0xD8616526u);
    CHECK(tag::from_uint32(0xD8616526u) == t);
    CHECK(tag::from_uint32("ucfb"_tag.to_uint32()) == "ucfb"_tag);
}

TEST_CASE("tag printing") {
    std::ostringstream os;
    os << "tex_"_tag;
    CHECK(os.str() == "'tex_'");

    std::ostringstream hashed;
    hashed << tag::from_uint32(0x266561d8u);
    CHECK(hashed.str() == "0x266561d8");
}

TEST_CASE("tag hashing in containers") {
    std::unordered_set<tag> tags{"NAME"_tag, "INFO"_tag, "NAME"_tag};
    CHECK(tags.size() == 2);
    CHECK(tags.count("INFO"_tag) == 1);
}

TEST_CASE("tag_pattern matching") {
    SUBCASE("four bytes match exactly") {
        tag_pattern p("FMT_");
        CHECK(p.is_exact());
        CHECK(p.matches("FMT_"_tag));
        CHECK_FALSE(p.matches("FMTX"_tag));
        CHECK(p.as_tag() == "FMT_"_tag);
    }

    SUBCASE("prefix") {
        tag_pattern p("FM");
        CHECK_FALSE(p.is_exact());
        CHECK(p.matches("FMT_"_tag));
        CHECK(p.matches("FMTX"_tag));
        CHECK_FALSE(p.matches("FACE"_tag));
        CHECK(p.prefix() == "FM");
    }

    SUBCASE("from tag") {
        tag_pattern p("BODY"_tag);
        CHECK(p.is_exact());
        CHECK(p.matches("BODY"_tag));
    }

    SUBCASE("invalid patterns") {
        CHECK_THROWS_AS(tag_pattern(""), std::invalid_argument);
        CHECK_THROWS_AS(tag_pattern("TOOLONG"), std::invalid_argument);
    }
}

TEST_CASE("chunk_name resolution") {
    SUBCASE("literal") {
        chunk_name n = "NAME"_tag;
        CHECK(resolve(n) == "NAME"_tag);
        CHECK(matches(n, "NAME"_tag));
        CHECK_FALSE(matches(n, "INFO"_tag));
        CHECK(to_string(n) == "'NAME'");
    }

    SUBCASE("hashed") {
        chunk_name n = hashed_name{0xD8616526u};
        CHECK(resolve(n) == tag('\x26', '\x65', '\x61', '\xD8'));
        CHECK(matches(n, tag::from_uint32(0xD8616526u)));
        CHECK_FALSE(matches(n, "NAME"_tag));
        CHECK(to_string(n) == "#d8616526");
    }

    SUBCASE("hashed from resource name") {
        CHECK(hashed_name::of("all_fly_snowspeeder").value == 0x266561d8u);
        CHECK(hashed_name::of("side") == hashed_name{0x17ba5e5eu});
    }
}
