//
// Created by igor on 16/08/2025.
//

#include <doctest/doctest.h>
#include <string>

#include <munge/fnv1a.hh>

using namespace munge;

TEST_CASE("fnv1a reference values") {
    CHECK(fnv1a("all_fly_snowspeeder") == 0x266561d8u);
    CHECK(fnv1a("side") == 0x17ba5e5eu);
    CHECK(fnv1a("rep") == 0x2cf46160u);
    CHECK(fnv1a("a") == 0xe40c292cu);
}

TEST_CASE("fnv1a of empty input is the offset basis") {
    CHECK(fnv1a("") == fnv1a_offset_basis);
    CHECK(fnv1a_offset_basis == 0x811c9dc5u);
}

TEST_CASE("fnv1a folds case") {
    CHECK(fnv1a("ALL_FLY_SNOWSPEEDER") == fnv1a("all_fly_snowspeeder"));
    CHECK(fnv1a("Side") == fnv1a("side"));
}

TEST_CASE("fnv1a OR transform also folds some non-letters") {
    // '@' (0x40) and '`' (0x60) collapse to the same byte
    CHECK(fnv1a("@") == fnv1a("`"));
    // '_' (0x5f) becomes 0x7f, the same byte as DEL
    CHECK(fnv1a("_") == fnv1a("\x7f"));
    CHECK(fnv1a("a") != fnv1a("b"));
}

TEST_CASE("fnv1a is usable at compile time") {
    static_assert(fnv1a("all_fly_snowspeeder") == 0x266561d8u);
    CHECK(true);
}

TEST_CASE("fnv1a byte overload and matching") {
    const std::string name = "all_fly_snowspeeder";
    CHECK(fnv1a(name.data(), name.size()) == 0x266561d8u);
    CHECK(fnv1a_matches(0x266561d8u, "All_Fly_Snowspeeder"));
    CHECK_FALSE(fnv1a_matches(0x266561d8u, "all_fly_snowspeeder2"));
}
