#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chisel/chisel.hpp>

#include <string>

using namespace chisel;

namespace {

    struct NullHandler {
        bool on_null() noexcept {
            return true;
        }
        bool on_bool(bool) noexcept {
            return true;
        }
        bool on_number(double) noexcept {
            return true;
        }
        bool on_integer(std::int64_t) noexcept {
            return true;
        }
        bool on_string(std::string_view) noexcept {
            return true;
        }
        bool on_object_begin() noexcept {
            return true;
        }
        bool on_object_end() noexcept {
            return true;
        }
        bool on_array_begin() noexcept {
            return true;
        }
        bool on_array_end() noexcept {
            return true;
        }
        bool on_key(std::string_view) noexcept {
            return true;
        }
    };

    struct NullSink {
        Flow on_event(const Event&) noexcept {
            return Flow::Continue;
        }
    };

    std::string make_large_json(const std::size_t objects) {
        std::string s;
        s.reserve(objects * 64);
        s += "[";

        for (std::size_t i = 0; i < objects; ++i) {
            s += R"({"id":)";
            s += std::to_string(i);
            s += R"(,"name":"player", "alive":true, "score":)";
            s += std::to_string(i * 10);
            s += "}";

            if (i + 1 != objects)
                s += ",";
        }

        s += "]";
        return s;
    }

    bool sax_null(const std::string_view json) {
        NullHandler h;
        HandlerSink sink {h};
        return parse_sax(json, sink).complete();
    }

} // namespace

TEST_CASE("chisel sax parse small", "[chisel][sax][bench]") {
    std::string json = R"({"a":[1,2,3],"b":{"c":4,"d":"x"}})";

    BENCHMARK("sax small") {
        return sax_null(json);
    };
}

TEST_CASE("chisel sax parse large", "[chisel][sax][bench]") {
    std::string json = make_large_json(2000);

    BENCHMARK("sax large (2000 objects)") {
        return sax_null(json);
    };

    BENCHMARK("sax large raw events") {
        NullSink sink;
        return parse_sax(json, sink).complete();
    };
}

TEST_CASE("chisel sax deep nesting", "[chisel][sax][bench]") {
    std::string json;
    for (int i = 0; i < 200; ++i)
        json += "[";
    json += "0";
    for (int i = 0; i < 200; ++i)
        json += "]";

    BENCHMARK("sax deep nesting 200") {
        return sax_null(json);
    };
}

TEST_CASE("chisel sax string heavy", "[chisel][sax][bench]") {
    std::string json = "[";
    for (int i = 0; i < 5000; ++i) {
        json += R"("some_string_value_here")";
        if (i != 4999)
            json += ",";
    }
    json += "]";

    BENCHMARK("sax 5000 strings") {
        return sax_null(json);
    };
}

TEST_CASE("chisel sax pointer tracking", "[chisel][sax][bench]") {
    std::string json = make_large_json(2000);

    BENCHMARK("sax large with pointers") {
        std::size_t depth = 0;
        PointerSink sink {[&](const Event&, const JsonPointer& p) { depth += p.size(); }};
        REQUIRE(parse_sax(json, sink).complete());
        return depth;
    };
}

TEST_CASE("chisel dom vs sax compare", "[chisel][bench]") {
    std::string json = make_large_json(2000);

    BENCHMARK("DOM parse 2000 objects") {
        auto doc = parse_dom(json);
        return doc.ok();
    };

    BENCHMARK("SAX parse 2000 objects") {
        return sax_null(json);
    };
}
