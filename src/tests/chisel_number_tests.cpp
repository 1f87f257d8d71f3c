#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chisel/number.hpp>

#include <cmath>
#include <limits>

using namespace chisel;

TEST_CASE("chisel number integers stay exact", "[chisel][number]") {
    const auto n = resolve_number("42");
    REQUIRE(n.is_integer());
    CHECK(n.i == 42);

    CHECK(resolve_number("-17").i == -17);
    CHECK(resolve_number("9223372036854775807").i == std::numeric_limits<std::int64_t>::max());

    const auto min = resolve_number("-9223372036854775808");
    REQUIRE(min.is_integer());
    CHECK(min.i == std::numeric_limits<std::int64_t>::min());
}

TEST_CASE("chisel number negative zero is integer zero", "[chisel][number]") {
    const auto n = resolve_number("-0");
    REQUIRE(n.is_integer());
    CHECK(n.i == 0);

    const auto f = resolve_number("-0.0");
    REQUIRE(f.is_float());
    CHECK(std::signbit(f.d));
}

TEST_CASE("chisel number fraction and exponent are floats", "[chisel][number]") {
    const auto pi = resolve_number("3.14");
    REQUIRE(pi.is_float());
    CHECK(pi.d == Catch::Approx(3.14));

    const auto e = resolve_number("1e10");
    REQUIRE(e.is_float());
    CHECK(e.d == 1e10);

    CHECK(resolve_number("2E-3").is_float());
    CHECK(resolve_number("5.0").is_float());
}

TEST_CASE("chisel number overflow widens to float", "[chisel][number]") {
    const auto big = resolve_number("9223372036854775808");
    REQUIRE(big.is_float());
    CHECK(big.d == Catch::Approx(9.223372036854775808e18));

    const auto longer = resolve_number("123456789012345678901234567890");
    REQUIRE(longer.is_float());
    CHECK(longer.d == Catch::Approx(1.2345678901234568e29));

    CHECK(resolve_number("-9223372036854775809").is_float());
}

TEST_CASE("chisel number out of range saturates", "[chisel][number]") {
    const auto huge = resolve_number("1e400");
    REQUIRE(huge.is_float());
    CHECK(std::isinf(huge.d));
    CHECK(huge.d > 0);

    const auto neg = resolve_number("-1e400");
    CHECK(std::isinf(neg.d));
    CHECK(neg.d < 0);

    const auto tiny = resolve_number("1e-400");
    REQUIRE(tiny.is_float());
    CHECK(tiny.d == 0.0);
    CHECK_FALSE(std::signbit(tiny.d));

    CHECK(std::signbit(resolve_number("-1e-400").d));
    CHECK(resolve_number("-1e-400").d == 0.0);

    // magnitude comes from the leading significant digit, not the exponent alone
    CHECK(std::isinf(resolve_number("0.5e309").d));
    CHECK(resolve_number("0.0001e-330").d == 0.0);
    CHECK(std::isinf(resolve_number("123456789e99999999999999999999").d));
    CHECK(resolve_number("1E-99999999999999999999").d == 0.0);
    CHECK(std::isinf(resolve_number("1e400", NumericMode::FloatOnly).d));
}

TEST_CASE("chisel number magnitude of lexemes", "[chisel][number]") {
    CHECK(detail::decimal_magnitude("1e400") == 401);
    CHECK(detail::decimal_magnitude("-12.5e3") == 5);
    CHECK(detail::decimal_magnitude("0.001") == -2);
    CHECK(detail::decimal_magnitude("0.0001e-330") == -333);
}

TEST_CASE("chisel number float only mode", "[chisel][number]") {
    const auto n = resolve_number("42", NumericMode::FloatOnly);
    REQUIRE(n.is_float());
    CHECK(n.d == 42.0);
}

TEST_CASE("chisel number equality respects kind", "[chisel][number]") {
    CHECK(Number::from_i64(1) == Number::from_i64(1));
    CHECK_FALSE(Number::from_i64(1) == Number::from_double(1.0));
    CHECK(Number::from_double(0.5) == Number::from_double(0.5));
    CHECK(Number::from_i64(3).as_double() == 3.0);
    CHECK(Number::from_double(3.9).as_i64() == 3);
}
