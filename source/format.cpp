#include "format.hpp"

#include <algorithm>
#include <cmath>

namespace hurwitz {

std::string poly_to_string(const Polynomial& coeffs, char var) {
    if (coeffs.empty()) {
        return "0";
    }

    const size_t n = coeffs.size() - 1;
    std::string  result;
    for (size_t i = 0; i < coeffs.size(); ++i) {
        const double c = coeffs[i];
        if (std::abs(c) < 1e-12) {
            continue;
        }

        const size_t power = n - i;
        const double mag   = std::abs(c);

        if (result.empty()) {
            result += c < 0.0 ? "-" : "";
        } else {
            result += c < 0.0 ? " - " : " + ";
        }

        // Unit coefficients are implied except on the constant term
        if (power == 0 || mag != 1.0) {
            result += fmt::format("{:g}", mag);
        }
        if (power == 1) {
            result += var;
        } else if (power > 1) {
            result += fmt::format("{}^{}", var, power);
        }
    }
    return result.empty() ? "0" : result;
}

std::string to_string_table(const RouthResult& result, int precision, int col_width) {
    const auto& table = result.table();
    const auto& rows  = result.row_labels();
    const int   cell  = std::max(col_width - 1, 1);

    std::string header = "Row    |";
    for (Eigen::Index j = 0; j < table.cols(); ++j) {
        header += fmt::format(" {:<{}}|", fmt::format("Col {}", j + 1), cell);
    }

    std::string out = header + "\n" + std::string(header.size(), '-');
    for (Eigen::Index i = 0; i < table.rows(); ++i) {
        out += fmt::format("\n{:<6} |", rows[static_cast<size_t>(i)]);
        for (Eigen::Index j = 0; j < table.cols(); ++j) {
            out += fmt::format(" {:<{}.{}f}|", table(i, j), cell, precision);
        }
    }
    return out;
}

std::string display(const RouthResult& result, int precision, int col_width) {
    const std::string rule(60, '=');

    std::string first_column;
    for (size_t i = 0; i < result.first_column().size(); ++i) {
        first_column += fmt::format("{}{:.{}f}", i == 0 ? "" : ", ", result.first_column()[i], precision);
    }

    std::string out;
    out += rule + "\n";
    out += "ROUTH-HURWITZ STABILITY ANALYSIS\n";
    out += rule + "\n";
    out += fmt::format("\nPolynomial of order {}:\n  {}\n", result.order(), poly_to_string(result.coefficients()));
    out += fmt::format("\nRouth table:\n{}\n", to_string_table(result, precision, col_width));
    out += fmt::format("\nFirst column: [{}]\n", first_column);
    out += fmt::format("\nSign changes: {}\n", result.rhp_poles());
    out += fmt::format("Right-half-plane poles: {}\n", result.rhp_poles());
    out += "\n" + rule + "\n";
    if (result.is_stable()) {
        out += "RESULT: system STABLE\n";
    } else {
        out += fmt::format("RESULT: system UNSTABLE ({} RHP poles)\n", result.rhp_poles());
    }
    out += rule;

    if (!result.notes().empty()) {
        out += "\n\nNotes:";
        for (const auto& note : result.notes()) {
            out += fmt::format("\n  - {}", note);
        }
    }
    return out;
}

}  // namespace hurwitz
