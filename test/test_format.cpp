#include <string>

#include "hurwitz.hpp"
#include <doctest/doctest.h>

using namespace hurwitz;

namespace {
bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}
}  // namespace

TEST_CASE("Polynomial to string") {
    CHECK(poly_to_string({1.0, 2.0, 3.0, 4.0}) == "s^3 + 2s^2 + 3s + 4");
    CHECK(poly_to_string({1.0, -2.0, 2.0}) == "s^2 - 2s + 2");
    CHECK(poly_to_string({-1.0, 0.0, 0.5}) == "-s^2 + 0.5");
    CHECK(poly_to_string({1.0, 0.0, 2.0, 0.0}) == "s^3 + 2s");
    CHECK(poly_to_string({2.0, 1.0}, 'z') == "2z + 1");
    CHECK(poly_to_string({3.0}) == "3");
    CHECK(poly_to_string({0.0, 0.0}) == "0");
    CHECK(poly_to_string({}) == "0");
}

TEST_CASE("Routh table rendering") {
    auto result = routh_hurwitz({1.0, 2.0, 3.0, 4.0});
    REQUIRE(result.has_value());

    SUBCASE("Grid layout") {
        const std::string grid = to_string_table(*result);
        CHECK(contains(grid, "Row    | Col 1    | Col 2    |"));
        CHECK(contains(grid, "s^3    | 1.0000   | 3.0000   |"));
        CHECK(contains(grid, "s^2    | 2.0000   | 4.0000   |"));
        CHECK(contains(grid, "s^0    | 4.0000   | 0.0000   |"));
    }

    SUBCASE("Precision and width") {
        const std::string grid = to_string_table(*result, 1, 6);
        CHECK(contains(grid, "s^1    | 1.0  | 0.0  |"));
    }

    SUBCASE("Full report of a stable system") {
        const std::string report = display(*result);
        CHECK(contains(report, "ROUTH-HURWITZ STABILITY ANALYSIS"));
        CHECK(contains(report, "Polynomial of order 3:\n  s^3 + 2s^2 + 3s + 4"));
        CHECK(contains(report, "First column: [1.0000, 2.0000, 1.0000, 4.0000]"));
        CHECK(contains(report, "Right-half-plane poles: 0"));
        CHECK(contains(report, "RESULT: system STABLE"));
        CHECK_FALSE(contains(report, "Notes:"));
    }

    SUBCASE("fmt formatter prints the full report") {
        CHECK(fmt::format("{}", *result) == display(*result));
    }
}

TEST_CASE("Report of an unstable system with notes") {
    auto unstable = routh_hurwitz({1.0, 1.0, 2.0, 2.0, 3.0});
    REQUIRE(unstable.has_value());

    const std::string report = display(*unstable);
    CHECK(contains(report, "RESULT: system UNSTABLE (2 RHP poles)"));
    CHECK(contains(report, "Notes:\n  - Row s^2: zero pivot replaced by epsilon=1e-06."));

    auto marginal = routh_hurwitz({1.0, 0.0, 2.0, 0.0, 1.0});
    REQUIRE(marginal.has_value());
    CHECK(contains(display(*marginal), "  - Row s^3 is entirely zero"));
}
