#include "engine/Margins.hpp"

#include <string>

#include <doctest/doctest.h>

using namespace folio::engine;

TEST_CASE("margins expand one, two and four values in CSS order")
{
    std::string error;
    auto one = parse_margins("1in", error);
    REQUIRE(one);
    CHECK(one->left.value == doctest::Approx(1.0));
    CHECK(one->bottom.unit == MarginUnit::Inches);

    auto two = parse_margins(kDefaultMargins, error);
    REQUIRE(two);
    CHECK(two->top.value == doctest::Approx(1.0));
    CHECK(two->right.value == doctest::Approx(0.75));
    CHECK(two->bottom.value == doctest::Approx(1.0));
    CHECK(two->left.value == doctest::Approx(0.75));

    auto four = parse_margins("1cm 2cm 10mm 72pt", error);
    REQUIRE(four);
    CHECK(four->top.unit == MarginUnit::Centimetres);
    CHECK(four->right.to_cm() == doctest::Approx(2.0));
    CHECK(four->bottom.to_cm() == doctest::Approx(1.0));
    CHECK(four->left.to_inches() == doctest::Approx(1.0));
}

TEST_CASE("a bare number is inches")
{
    std::string error;
    auto value = parse_margin_value("0.5", error);
    REQUIRE(value);
    CHECK(value->unit == MarginUnit::Inches);
    CHECK(value->to_cm() == doctest::Approx(1.27));
}

TEST_CASE("margins outside [0, 3in] or malformed are rejected")
{
    std::string error;
    CHECK_FALSE(parse_margins("1in 1in 1in", error));
    CHECK(error.find("1, 2 or 4") != std::string::npos);

    CHECK_FALSE(parse_margins("4in", error));
    CHECK(error.find("too large") != std::string::npos);

    CHECK_FALSE(parse_margins("-1cm", error));
    CHECK(error.find("negative") != std::string::npos);

    CHECK_FALSE(parse_margins("wide", error));
    CHECK(error.find("invalid margin") != std::string::npos);

    CHECK_FALSE(parse_margins("", error));

    CHECK(parse_margins("7.62cm", error));
    CHECK(parse_margins("0", error));
}
