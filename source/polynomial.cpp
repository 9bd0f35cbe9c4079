#include "polynomial.hpp"

#include <algorithm>
#include <cmath>

namespace hurwitz {

std::expected<Polynomial, InvalidInputError> normalize_polynomial(const Polynomial& coeffs, const RouthConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    if (coeffs.empty()) {
        return std::unexpected(InvalidInputError("normalize_polynomial: coefficient list must not be empty"));
    }
    if (std::any_of(coeffs.begin(), coeffs.end(), [](double c) { return !std::isfinite(c); })) {
        return std::unexpected(InvalidInputError("normalize_polynomial: coefficients must be finite"));
    }

    const double tol = config.zero_row_epsilon;
    if (std::all_of(coeffs.begin(), coeffs.end(), [tol](double c) { return std::abs(c) < tol; })) {
        return std::unexpected(InvalidInputError("normalize_polynomial: all coefficients are ~0, polynomial is undefined"));
    }

    // Leading zeros are treated as padding, not as a degree change
    auto first = std::find_if(coeffs.begin(), coeffs.end(), [tol](double c) { return std::abs(c) >= tol; });
    if (first == coeffs.end()) {
        return std::unexpected(InvalidInputError("normalize_polynomial: polynomial reduces to nothing after stripping leading zeros"));
    }

    Polynomial poly(first, coeffs.end());
    if (config.normalize_leading) {
        const double lead = poly[0];
        for (auto& c : poly) {
            c /= lead;
        }
    }
    return poly;
}

RouthRow poly_to_row(const Polynomial& poly, Eigen::Index m) {
    RouthRow row = RouthRow::Zero(m);
    for (size_t k = 0, j = 0; k < poly.size() && static_cast<Eigen::Index>(j) < m; k += 2, ++j) {
        row(static_cast<Eigen::Index>(j)) = poly[k];
    }
    return row;
}

Polynomial row_to_poly(const RouthRow& row, size_t degree) {
    Polynomial poly(degree + 1, 0.0);
    for (Eigen::Index k = 0; k < row.size(); ++k) {
        const size_t idx = 2 * static_cast<size_t>(k);  // Offset from the top power
        if (idx > degree) {
            break;
        }
        poly[idx] = row(k);
    }
    return poly;
}

Polynomial poly_derivative(const Polynomial& poly) {
    if (poly.size() <= 1) {
        return {0.0};
    }

    const size_t n = poly.size() - 1;
    Polynomial   deriv(n);
    for (size_t i = 0; i < n; ++i) {
        deriv[i] = poly[i] * static_cast<double>(n - i);
    }
    return deriv;
}

Polynomial poly_multiply(const Polynomial& a, const Polynomial& b) {
    if (a.empty() || b.empty()) {
        return {};
    }

    Polynomial result(a.size() + b.size() - 1, 0.0);
    for (size_t i = 0; i < a.size(); ++i) {
        for (size_t j = 0; j < b.size(); ++j) {
            result[i + j] += a[i] * b[j];
        }
    }
    return result;
}

Polynomial poly_add(const Polynomial& a, const Polynomial& b) {
    const size_t n = std::max(a.size(), b.size());
    Polynomial   result(n, 0.0);

    // Right-align so the constant terms line up
    std::copy(a.begin(), a.end(), result.begin() + static_cast<std::ptrdiff_t>(n - a.size()));
    const size_t offset = n - b.size();
    for (size_t i = 0; i < b.size(); ++i) {
        result[offset + i] += b[i];
    }
    return result;
}

Polynomial poly_scale(const Polynomial& poly, double factor) {
    Polynomial result = poly;
    for (auto& c : result) {
        c *= factor;
    }
    return result;
}

Polynomial poly_product(const std::vector<Polynomial>& factors) {
    Polynomial result = {1.0};
    for (const auto& f : factors) {
        result = poly_multiply(result, f);
    }
    return result;
}

}  // namespace hurwitz
