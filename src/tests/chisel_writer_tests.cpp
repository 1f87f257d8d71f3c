#include <catch2/catch_test_macros.hpp>

#include <chisel/dom.hpp>
#include <chisel/writer.hpp>

#include <cmath>
#include <limits>
#include <string>

using namespace chisel;

namespace {

    Value parse_ok(const std::string_view json) {
        auto doc = parse_dom(json);
        REQUIRE(doc.ok());
        return doc.take_root();
    }

} // namespace

TEST_CASE("chisel writer compact", "[chisel][writer]") {
    const auto v = parse_ok(R"( { "a" : [ 1 , 2.5 , true , null ] , "b" : { } , "c" : [ ] } )");
    CHECK(encode(v) == R"({"a":[1,2.5,true,null],"b":{},"c":[]})");
}

TEST_CASE("chisel writer pretty", "[chisel][writer]") {
    const auto v = parse_ok(R"({"a":[1,{"b":null}],"e":[]})");

    WriterConfig cfg;
    cfg.pretty = true;

    const std::string expected = "{\n"
                                 "  \"a\": [\n"
                                 "    1,\n"
                                 "    {\n"
                                 "      \"b\": null\n"
                                 "    }\n"
                                 "  ],\n"
                                 "  \"e\": []\n"
                                 "}";
    CHECK(encode(v, cfg) == expected);
}

TEST_CASE("chisel writer string escapes", "[chisel][writer]") {
    const Value v {std::string("q\"b\\s/\b\f\n\r\t\x01\x1F\xC3\xA9")};
    CHECK(encode(v) == "\"q\\\"b\\\\s/\\b\\f\\n\\r\\t\\u0001\\u001f\xC3\xA9\"");
}

TEST_CASE("chisel writer floats stay floats", "[chisel][writer]") {
    CHECK(encode(Value {1.0}) == "1.0");
    CHECK(encode(Value {-0.0}) == "-0.0");
    CHECK(encode(Value {0.1}) == "0.1");
    CHECK(encode(Value {1e300}) == "1e+300");
    CHECK(encode(Value {std::int64_t {-9223372036854775807LL - 1}}) == "-9223372036854775808");

    const auto back = parse_ok(encode(Value {1e21}));
    CHECK(back.is_float());
}

TEST_CASE("chisel writer nan fails", "[chisel][writer]") {
    Array a;
    a.emplace_back(1);
    a.emplace_back(std::nan(""));
    const Value v {std::move(a)};

    ParseError err;
    CHECK(encode(v, {}, &err).empty());
    CHECK(err.kind == ErrorKind::Writer);
    CHECK(err.code == ErrorCode::NonFiniteNumber);
}

TEST_CASE("chisel writer infinities read back saturated", "[chisel][writer]") {
    ParseError err;
    CHECK(encode(Value {std::numeric_limits<double>::infinity()}, {}, &err) == "1e999");
    CHECK(err.ok());
    CHECK(encode(Value {-std::numeric_limits<double>::infinity()}) == "-1e999");

    const auto parsed = parse_ok("[1e400, -1e400]");
    const auto text = encode(parsed, {}, &err);
    REQUIRE(err.ok());
    CHECK(text == "[1e999,-1e999]");

    const auto again = parse_ok(text);
    CHECK(again == parsed);
    CHECK(std::isinf(again[0].as_double()));
    CHECK(again[1].as_double() < 0);
}

TEST_CASE("chisel writer depth limit", "[chisel][writer]") {
    Value v = Value::array();
    for (int i = 0; i < 10; ++i) {
        Array outer;
        outer.push_back(std::move(v));
        v = Value {std::move(outer)};
    }

    WriterConfig cfg;
    cfg.max_depth = 5;

    ParseError err;
    CHECK(encode(v, cfg, &err).empty());
    CHECK(err.code == ErrorCode::EncodeDepthExceeded);

    cfg.max_depth = 11;
    CHECK(encode(v, cfg, &err) == "[[[[[[[[[[[]]]]]]]]]]]");
    CHECK(err.ok());
}

TEST_CASE("chisel writer fixed buffer", "[chisel][writer]") {
    const auto v = parse_ok(R"({"key":"value"})");

    char buf[64];
    CHECK(encode_into(buf, sizeof(buf), v) == R"({"key":"value"})");

    char tiny[8];
    ParseError err;
    CHECK(encode_into(tiny, sizeof(tiny), v, {}, &err).empty());
    CHECK(err.code == ErrorCode::WriterOverflow);
}

TEST_CASE("chisel writer output parses back to an equal value", "[chisel][writer]") {
    const auto original = parse_ok(R"({
        "id": 9007199254740993,
        "ratio": 0.30000000000000004,
        "tiny": 5e-324,
        "neg": -12,
        "text": "line\nbreak   😀",
        "nested": [[], {}, [{"x": [null, false]}]],
        "dup": 1,
        "dup": "second",
        "saturated": [1e400, -1e400, 1e-400]
    })");

    for (const bool pretty : {false, true}) {
        WriterConfig cfg;
        cfg.pretty = pretty;
        const auto text = encode(original, cfg);
        REQUIRE_FALSE(text.empty());

        const auto again = parse_ok(text);
        CHECK(again == original);
    }
}
