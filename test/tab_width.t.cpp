#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <bbdown/tab_width.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace {

void check_valid(const std::string_view text, const std::uint8_t expected)
{
    std::uint8_t output = 42;
    const std::optional<bbdown::tab_width_error> error =
        bbdown::parse_tab_width(text, output);

    REQUIRE(!error.has_value());
    CHECK(output == expected);
}

void check_invalid(
    const std::string_view text, const bbdown::tab_width_error expected)
{
    std::uint8_t output = 42;
    const std::optional<bbdown::tab_width_error> error =
        bbdown::parse_tab_width(text, output);

    REQUIRE(error.has_value());
    CHECK(*error == expected);
    CHECK(output == 42);
}

} // namespace

TEST_CASE("tab width valid values")
{
    check_valid("0", 0);
    check_valid("4", 4);
    check_valid("8", 8);
    check_valid("255", 255);
    check_valid("007", 7);
}

TEST_CASE("tab width empty")
{
    check_invalid("", bbdown::tab_width_error::empty);
}

TEST_CASE("tab width not a number")
{
    check_invalid("abc", bbdown::tab_width_error::not_a_number);
    check_invalid("-1", bbdown::tab_width_error::not_a_number);
    check_invalid("4x", bbdown::tab_width_error::not_a_number);
    check_invalid(" 4", bbdown::tab_width_error::not_a_number);
    check_invalid("4.5", bbdown::tab_width_error::not_a_number);
}

TEST_CASE("tab width out of range")
{
    check_invalid("256", bbdown::tab_width_error::out_of_range);
    check_invalid("1000", bbdown::tab_width_error::out_of_range);
    check_invalid(
        "99999999999999999999999", bbdown::tab_width_error::out_of_range);
}

TEST_CASE("tab width error descriptions")
{
    CHECK(bbdown::tab_width_error_str(bbdown::tab_width_error::empty) ==
          "empty value");
    CHECK(bbdown::tab_width_error_str(bbdown::tab_width_error::not_a_number) ==
          "not a number");
    CHECK(bbdown::tab_width_error_str(bbdown::tab_width_error::out_of_range) ==
          "out of range");
}
