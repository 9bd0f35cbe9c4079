#include "routh.hpp"

#include <cmath>

#include "fmt/core.h"

namespace hurwitz {

namespace {
// Stand-in for first column entries that are ~0; fixed, never data dependent
constexpr double sign_probe = 1e-15;

RouthResult analyze(const Polynomial& poly, const RouthConfig& config) {
    RouthDiagnostics diagnostics;
    RouthTable       table = build_routh_table(poly, config, diagnostics);

    std::vector<double> first_column(static_cast<size_t>(table.rows()));
    for (Eigen::Index i = 0; i < table.rows(); ++i) {
        first_column[static_cast<size_t>(i)] = table(i, 0);
    }

    const size_t rhp = count_sign_changes(first_column, config.zero_row_epsilon);
    return RouthResult{poly, std::move(table), std::move(first_column), rhp, std::move(diagnostics)};
}
}  // namespace

std::expected<void, InvalidInputError> RouthConfig::validate() const {
    if (!std::isfinite(epsilon) || epsilon <= 0.0) {
        return std::unexpected(InvalidInputError(fmt::format("RouthConfig: epsilon must be positive and finite (got {})", epsilon)));
    }
    // Every zero test is a strict |x| < tol, so a zero tolerance would never fire
    if (!std::isfinite(zero_row_epsilon) || zero_row_epsilon <= 0.0) {
        return std::unexpected(InvalidInputError(fmt::format("RouthConfig: zero_row_epsilon must be positive and finite (got {})", zero_row_epsilon)));
    }
    return {};
}

RouthResult::RouthResult(Polynomial          coefficients,
                         RouthTable          table,
                         std::vector<double> first_column,
                         size_t              rhp_poles,
                         RouthDiagnostics    diagnostics)
    : order_(coefficients.empty() ? 0 : coefficients.size() - 1),
      coefficients_(std::move(coefficients)),
      table_(std::move(table)),
      first_column_(std::move(first_column)),
      rhp_poles_(rhp_poles),
      is_stable_(rhp_poles == 0),
      diagnostics_(std::move(diagnostics)) {
    row_labels_.reserve(order_ + 1);
    for (size_t i = 0; i <= order_; ++i) {
        row_labels_.push_back(row_label(order_, i));
    }
}

RouthHurwitz::RouthHurwitz(const Polynomial& coeffs, RouthConfig config)
    : config_(config) {
    if (auto valid = config_.validate(); !valid) {
        throw valid.error();
    }
    auto poly = normalize_polynomial(coeffs, config_);
    if (!poly) {
        throw poly.error();
    }
    coeffs_ = std::move(*poly);
}

RouthResult RouthHurwitz::compute() const {
    return analyze(coeffs_, config_);
}

std::expected<RouthResult, InvalidInputError> routh_hurwitz(const Polynomial& coeffs, const RouthConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    auto poly = normalize_polynomial(coeffs, config);
    if (!poly) {
        return std::unexpected(poly.error());
    }
    return analyze(*poly, config);
}

std::string row_label(size_t order, size_t row) {
    return fmt::format("s^{}", order - row);
}

bool is_zero_row(const RouthRow& row, double tol) {
    return row.size() == 0 || row.cwiseAbs().maxCoeff() < tol;
}

RouthTable build_routh_table(const Polynomial& poly, const RouthConfig& config, RouthDiagnostics& diagnostics) {
    const size_t       n   = poly.size() - 1;
    const Eigen::Index m   = static_cast<Eigen::Index>(n / 2 + 1);
    const double       tol = config.zero_row_epsilon;

    RouthTable table = RouthTable::Zero(static_cast<Eigen::Index>(n + 1), m);

    // s^n row: a0, a2, a4, ...   s^(n-1) row: a1, a3, a5, ...
    table.row(0) = poly_to_row(poly, m);
    if (n >= 1) {
        table.row(1) = poly_to_row(Polynomial(poly.begin() + 1, poly.end()), m);
    }

    for (size_t i = 2; i <= n; ++i) {
        const auto above = static_cast<Eigen::Index>(i - 1);

        if (is_zero_row(table.row(above), tol)) {
            table.row(above) = resolve_zero_row(table.row(above - 1), n, i - 1, diagnostics);
        }

        RouthRow prev = table.row(above);
        if (std::abs(prev(0)) < tol) {
            prev = stabilize_pivot(std::move(prev), n, i - 1, config, diagnostics);
        }
        const RouthRow prev2 = table.row(above - 1);

        // Last column stays zero
        for (Eigen::Index j = 0; j < m - 1; ++j) {
            table(static_cast<Eigen::Index>(i), j) = (prev(0) * prev2(j + 1) - prev2(0) * prev(j + 1)) / prev(0);
        }
    }

    return table;
}

RouthRow stabilize_pivot(RouthRow row, size_t order, size_t row_index, const RouthConfig& config, RouthDiagnostics& diagnostics) {
    row(0) = config.epsilon;
    diagnostics.pivot_rows.push_back(row_index);
    diagnostics.notes.push_back(
        fmt::format("Row {}: zero pivot replaced by epsilon={:g}.", row_label(order, row_index), config.epsilon));
    return row;
}

RouthRow resolve_zero_row(const RouthRow& prev2, size_t order, size_t row_index, RouthDiagnostics& diagnostics) {
    // prev2 sits at table index row_index - 1, i.e. power order - row_index + 1
    const size_t aux_degree = order - row_index + 1;

    const Polynomial aux   = row_to_poly(prev2, aux_degree);
    const Polynomial d_aux = poly_derivative(aux);

    diagnostics.zero_rows.push_back(row_index);
    diagnostics.notes.push_back(
        fmt::format("Row {} is entirely zero: replaced by derivative of the degree-{} auxiliary polynomial.",
                    row_label(order, row_index),
                    aux_degree));
    return poly_to_row(d_aux, prev2.size());
}

size_t count_sign_changes(const std::vector<double>& column, double tol) {
    std::vector<double> cleaned;
    cleaned.reserve(column.size());
    for (double v : column) {
        cleaned.push_back(std::abs(v) < tol ? sign_probe : v);
    }

    size_t changes = 0;
    for (size_t k = 1; k < cleaned.size(); ++k) {
        const double a = cleaned[k - 1];
        const double b = cleaned[k];
        if ((a > 0.0 && b < 0.0) || (a < 0.0 && b > 0.0)) {
            ++changes;
        }
    }
    return changes;
}

}  // namespace hurwitz
