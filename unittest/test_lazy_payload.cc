//
// Created by igor on 16/08/2025.
//

#include <doctest/doctest.h>
#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <munge/lazy_payload.hh>
#include <munge/script.hh>
#include <munge/exceptions.hh>

#include "test_utils.hh"

using namespace munge;

TEST_CASE("deferred handle reads nothing up front") {
    chunk_fixture f(chunk("BODY", u8s({1, 2, 3, 4})));
    const auto before = static_cast<std::streamoff>(f.stream.tellg());

    lazy_payload<bytes> body(f.header);
    CHECK(body.is_deferred());
    CHECK(body.header().payload_offset == 8);
    CHECK(body.header().payload_size == 4);
    CHECK(static_cast<std::streamoff>(f.stream.tellg()) == before);
}

TEST_CASE("deferred reads are repeatable") {
    chunk_fixture f(chunk("BODY", u8s({1, 2, 3, 4})));
    lazy_payload<bytes> body(f.header);

    const bytes first = body.read(f.stream);
    const bytes second = body.read(f.stream);
    CHECK(first == u8s({1, 2, 3, 4}));
    CHECK(first == second);
}

TEST_CASE("deferred string payload") {
    chunk_fixture f(chunk("NAME", cstr("later")));
    lazy_payload<std::string> name(f.header);
    CHECK(name.read(f.stream) == "later");
}

TEST_CASE("decoding a record leaves the body deferred") {
    bytes data = script_chunk("s", 2, u8s({7, 7, 7}));
    chunk_fixture f(data);
    auto s = decode_node<script>(f.stream, f.header);

    REQUIRE(s.body.is_deferred());
    CHECK(s.body.header().end_offset() == f.header.end_offset());

    // A copy of the handle reads the same bytes
    auto copy = s.body;
    CHECK(copy.read(f.stream) == u8s({7, 7, 7}));
    CHECK(s.body.read(f.stream) == u8s({7, 7, 7}));
}

TEST_CASE("copied handles read through other streams over the same bytes") {
    bytes body;
    for (int i = 0; i < 4096; i++) {
        body.push_back(static_cast<std::byte>(i * 7));
    }
    const std::string data = as_string(cat({chunk("PAD_", u8s({1, 2, 3})), script_chunk("s", 2, body)}));

    std::istringstream origin(data);
    origin.seekg(11);
    const chunk_header h = read_header(origin);
    const auto s = decode_node<script>(origin, h);
    REQUIRE(s.body.is_deferred());

    SUBCASE("one after the other") {
        std::istringstream first(data);
        std::istringstream second(data);
        const auto copy = s.body;
        CHECK(copy.read(first) == body);
        CHECK(s.body.read(second) == body);
    }

    SUBCASE("from two threads") {
        const auto copy_a = s.body;
        const auto copy_b = s.body;
        bytes result_a;
        bytes result_b;
        std::exception_ptr error_a;
        std::exception_ptr error_b;

        std::thread a([&] {
            try {
                std::istringstream stream(data);
                for (int i = 0; i < 50; i++) {
                    result_a = copy_a.read(stream);
                }
            } catch (...) {
                error_a = std::current_exception();
            }
        });
        std::thread b([&] {
            try {
                std::istringstream stream(data);
                for (int i = 0; i < 50; i++) {
                    result_b = copy_b.read(stream);
                }
            } catch (...) {
                error_b = std::current_exception();
            }
        });
        a.join();
        b.join();

        CHECK_FALSE(error_a);
        CHECK_FALSE(error_b);
        CHECK(result_a == body);
        CHECK(result_a == result_b);
    }
}

TEST_CASE("owned values") {
    lazy_payload<bytes> body(u8s({5, 6}));
    CHECK_FALSE(body.is_deferred());
    CHECK(body.value() == u8s({5, 6}));
    CHECK_THROWS_AS((void)body.header(), content_error);

    std::istringstream unused;
    CHECK(body.read(unused) == u8s({5, 6}));

    lazy_payload<bytes> empty;
    CHECK_FALSE(empty.is_deferred());
    CHECK(empty.value().empty());
}

TEST_CASE("deferred handle has no value") {
    chunk_fixture f(chunk("BODY", u8s({1})));
    lazy_payload<bytes> body(f.header);
    CHECK_THROWS_AS((void)body.value(), content_error);
}

TEST_CASE("encoding lazy payloads") {
    SUBCASE("owned value is written as is") {
        node_writer w("BODY"_tag);
        node_codec<lazy_payload<bytes>>::encode(lazy_payload<bytes>(u8s({9, 8})), w);
        CHECK(w.payload() == u8s({9, 8}));
    }

    SUBCASE("deferred handle copies from the source stream") {
        chunk_fixture f(chunk("BODY", u8s({1, 2, 3})));
        lazy_payload<bytes> body(f.header);

        node_writer w("BODY"_tag, &f.stream);
        node_codec<lazy_payload<bytes>>::encode(body, w);
        CHECK(w.finish() == chunk("BODY", u8s({1, 2, 3})));
    }

    SUBCASE("deferred handle without a source") {
        chunk_fixture f(chunk("BODY", u8s({1, 2, 3})));
        lazy_payload<bytes> body(f.header);

        node_writer w("BODY"_tag);
        CHECK_THROWS_AS(node_codec<lazy_payload<bytes>>::encode(body, w), content_error);
    }
}
