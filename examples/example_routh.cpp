#include <fmt/core.h>

#include <string>
#include <utility>
#include <vector>

#include "hurwitz.hpp"

int main() {
    using namespace hurwitz;

    fmt::print("=== Routh-Hurwitz Stability Criterion ===\n\n");

    const std::vector<std::pair<std::string, Polynomial>> examples = {
        {"Stable: s^3 + 2s^2 + 3s + 4", {1, 2, 3, 4}},
        {"Unstable: s^2 - 2s + 2", {1, -2, 2}},
        {"Zero row: s^4 + 2s^2 + 1", {1, 0, 2, 0, 1}},
        {"Zero row with a pole at the origin: s^3 + 2s", {1, 0, 2, 0}},
        {"Zero pivot: s^4 + s^3 + 2s^2 + 2s + 3", {1, 1, 2, 2, 3}},
        {"Stable: s^2 + 2s + 2", {1, 2, 2}},
    };

    for (size_t i = 0; i < examples.size(); ++i) {
        const auto& [name, coeffs] = examples[i];
        fmt::print("\nEXAMPLE {}: {}\n", i + 1, name);

        RouthHurwitz rh(coeffs);
        fmt::print("{}\n", rh.compute());
    }

    // Characteristic polynomial given as a product of factors: (s+2)(s+3)(s+5)
    const auto den = poly_product({{1, 2}, {1, 3}, {1, 5}});
    fmt::print("\nEXAMPLE {}: {}\n", examples.size() + 1, poly_to_string(den));
    if (const auto result = routh_hurwitz(den)) {
        fmt::print("{}\n", *result);
    }

    // Invalid input is reported, not thrown, by the free function
    const auto invalid = routh_hurwitz({0, 0, 0});
    if (!invalid) {
        fmt::print("\nRejected [0, 0, 0]: {}\n", invalid.error().what());
    }

    return 0;
}
