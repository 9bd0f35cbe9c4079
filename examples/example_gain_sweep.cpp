#include <fmt/core.h>

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "hurwitz.hpp"

using namespace hurwitz;

// Open loop G(s) = 1 / (s (s+1) (s+2)) under unity feedback with a proportional gain K.
// Closed loop: s^3 + 3s^2 + 2s + K, stable for 0 < K < 6.
int main() {
    fmt::print("=== Proportional Gain Sweep ===\n\n");

    const Polynomial num = {1.0};
    const Polynomial den = poly_product({{1.0, 0.0}, {1.0, 1.0}, {1.0, 2.0}});
    fmt::print("G(s) = {} / ({})\n\n", poly_to_string(num), poly_to_string(den));

    fmt::print("Enter gain values separated by spaces (empty line for a default sweep).\n");
    fmt::print("Gains: ");
    std::vector<double> gains;
    std::string         line;
    std::getline(std::cin, line);
    std::istringstream iss(line);
    double             value;
    while (iss >> value) {
        gains.push_back(value);
    }

    if (gains.empty()) {
        fmt::print("No gains provided. Using 0.0 ... 10.0 in steps of 0.25.\n");
        for (int k = 0; k <= 40; ++k) {
            gains.push_back(0.25 * k);
        }
    }

    auto start = std::chrono::high_resolution_clock::now();

    const auto sweep = gain_sweep(num, den, gains);

    auto end      = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);

    fmt::print("\n{:>8} | {:>9} | {}\n", "K", "RHP poles", "Verdict");
    fmt::print("{}\n", std::string(34, '-'));
    for (size_t i = 0; i < sweep.gains.size(); ++i) {
        fmt::print("{:>8.3f} | {:>9} | {}\n",
                   sweep.gains[i],
                   sweep.rhp_poles[i],
                   sweep.stable[i] ? "stable" : "unstable");
    }

    for (const auto idx : sweep.failed) {
        fmt::print("K = {:.3f}: closed-loop polynomial is invalid\n", sweep.gains[idx]);
    }

    fmt::print("\nStable gain ranges:\n");
    for (const auto& [lo, hi] : stable_gain_ranges(sweep)) {
        fmt::print("  [{:.3f}, {:.3f}]\n", lo, hi);
    }

    fmt::print("\nTotal computation time: {:.3f} ms ({} gains)\n", duration.count() / 1e6, sweep.gains.size());
    return 0;
}
