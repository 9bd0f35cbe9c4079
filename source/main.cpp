#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "fmt/core.h"
#include "hurwitz.hpp"

namespace {

constexpr int exit_stable   = 0;
constexpr int exit_unstable = 1;
constexpr int exit_invalid  = 2;

void usage() {
    fmt::print(stderr,
               "usage: routh_cli [--epsilon X] [--zero-tol X] [--no-normalize] c_n ... c_1 c_0\n"
               "  Coefficients of the characteristic polynomial, highest power first.\n"
               "  Exit code: 0 stable, 1 unstable, 2 invalid input.\n");
}

double parse_number(std::string_view text) {
    size_t       used  = 0;
    const double value = std::stod(std::string(text), &used);
    if (used != text.size()) {
        throw std::invalid_argument(fmt::format("not a number: '{}'", text));
    }
    return value;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace hurwitz;

    RouthConfig         config;
    std::vector<double> coeffs;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                usage();
                return exit_stable;
            }
            if (arg == "--no-normalize") {
                config.normalize_leading = false;
            } else if (arg == "--epsilon" || arg == "--zero-tol") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(fmt::format("missing value for {}", arg));
                }
                const double value = parse_number(argv[++i]);
                (arg == "--epsilon" ? config.epsilon : config.zero_row_epsilon) = value;
            } else {
                coeffs.push_back(parse_number(arg));
            }
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "routh_cli: {}\n", e.what());
        usage();
        return exit_invalid;
    }

    const auto result = routh_hurwitz(coeffs, config);
    if (!result) {
        fmt::print(stderr, "routh_cli: {}\n", result.error().what());
        return exit_invalid;
    }

    fmt::print("{}\n", *result);
    return result->is_stable() ? exit_stable : exit_unstable;
}
