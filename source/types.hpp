#pragma once

#include <expected>
#include <stdexcept>
#include <string>
#include <vector>

#include "Eigen/Dense"

namespace hurwitz {

using Matrix = Eigen::MatrixXd;

// Coefficients ordered from the highest power down to the constant term,
// i.e. {1, 2, 3, 4} is s^3 + 2s^2 + 3s + 4.
using Polynomial = std::vector<double>;

// (order + 1) x (floor(order / 2) + 1), zero padded on the right
using RouthTable = Eigen::MatrixXd;
using RouthRow   = Eigen::RowVectorXd;

/**
 * @brief Raised (or returned through std::expected) when a coefficient sequence
 *        or a RouthConfig cannot be analysed.
 */
class InvalidInputError : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Numerical knobs of the Routh-Hurwitz engine, passed per call.
 */
struct RouthConfig {
    double epsilon           = 1e-6;   // Substitute for a zero pivot
    double zero_row_epsilon  = 1e-12;  // Tolerance for "is zero"
    bool   normalize_leading = true;   // Divide by the leading coefficient first

    // Rejects a non-positive epsilon or tolerance (NaN/Inf included)
    std::expected<void, InvalidInputError> validate() const;
};

}  // namespace hurwitz
