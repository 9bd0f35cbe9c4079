#pragma once

#include <expected>

#include "types.hpp"

namespace hurwitz {

/**
 * @brief  Validate and canonicalize a characteristic polynomial.
 *
 * Leading coefficients within config.zero_row_epsilon of zero are stripped. If
 * config.normalize_leading is set, every coefficient is divided by the leading one.
 *
 * @param coeffs    Coefficients, highest power first
 * @param config    Engine configuration (tolerance, normalization)
 *
 * @return The canonical polynomial (coeffs[0] != 0), or InvalidInputError if the
 *         sequence is empty, contains NaN/Inf, or is entirely (near-)zero, or if
 *         config fails RouthConfig::validate().
 */
std::expected<Polynomial, InvalidInputError> normalize_polynomial(const Polynomial& coeffs, const RouthConfig& config = {});

/**
 * @brief  Lay out every other coefficient of a polynomial as a Routh row.
 *
 * For a polynomial of degree d the row holds the coefficients of s^d, s^(d-2), ...
 * Entries beyond the available powers are zero, powers beyond m columns are dropped.
 *
 * @param poly  Polynomial, highest power first
 * @param m     Number of columns of the row
 */
RouthRow poly_to_row(const Polynomial& poly, Eigen::Index m);

/**
 * @brief  Rebuild the full polynomial of a given degree from an interleaved row.
 *
 * row[k] becomes the coefficient of s^(degree - 2k); all other powers are zero.
 * For degree 4, {a4, a2, a0} -> {a4, 0, a2, 0, a0}.
 */
Polynomial row_to_poly(const RouthRow& row, size_t degree);

// d/ds of poly; a constant differentiates to {0}
Polynomial poly_derivative(const Polynomial& poly);

// Product of two polynomials (coefficient convolution)
Polynomial poly_multiply(const Polynomial& a, const Polynomial& b);

// Sum of two polynomials aligned on the constant term
Polynomial poly_add(const Polynomial& a, const Polynomial& b);

Polynomial poly_scale(const Polynomial& poly, double factor);

// Product of all factors, e.g. {{1, 2}, {1, 3}, {1, 5}} -> (s+2)(s+3)(s+5); {1} if empty
Polynomial poly_product(const std::vector<Polynomial>& factors);

}  // namespace hurwitz
