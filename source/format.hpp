#pragma once

#include <string>

#include "routh.hpp"

// ============================================================================
// Human-readable rendering of Routh-Hurwitz results
#include "fmt/core.h"

namespace hurwitz {

// "s^3 + 2s^2 + 3s + 4"; terms with |c| < 1e-12 are skipped, "0" if none remain
std::string poly_to_string(const Polynomial& coeffs, char var = 's');

/**
 * @brief  Format the Routh table as a grid.
 *
 * One line per row, labelled s^k, and one column per table entry.
 *
 * @param result        Result to render
 * @param precision     Digits after the decimal point
 * @param col_width     Width of each column in characters
 */
std::string to_string_table(const RouthResult& result, int precision = 4, int col_width = 10);

// Full report: polynomial, table, first column, sign changes, verdict and notes
std::string display(const RouthResult& result, int precision = 4, int col_width = 10);

}  // namespace hurwitz

template <>
struct fmt::formatter<hurwitz::RouthResult> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const hurwitz::RouthResult& result, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", hurwitz::display(result));
    }
};
