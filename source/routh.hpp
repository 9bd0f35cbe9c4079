#pragma once

#include <expected>
#include <string>
#include <vector>

#include "polynomial.hpp"
#include "types.hpp"

namespace hurwitz {

// Record of the edge-case interventions made while filling a table
struct RouthDiagnostics {
    std::vector<std::string> notes;
    std::vector<size_t>      pivot_rows;  // Rows whose zero pivot was replaced by epsilon
    std::vector<size_t>      zero_rows;   // Rows replaced by an auxiliary polynomial derivative
};

/**
 * @brief Outcome of a Routh-Hurwitz analysis.
 *
 * Immutable once built. The verdict only depends on first_column(); the table and the
 * notes are kept for diagnostics and rendering.
 */
class RouthResult {
   public:
    RouthResult(Polynomial          coefficients,
                RouthTable          table,
                std::vector<double> first_column,
                size_t              rhp_poles,
                RouthDiagnostics    diagnostics);

    size_t                          order() const { return order_; }
    const Polynomial&               coefficients() const { return coefficients_; }
    const RouthTable&               table() const { return table_; }
    const std::vector<std::string>& row_labels() const { return row_labels_; }
    const std::vector<double>&      first_column() const { return first_column_; }
    size_t                          rhp_poles() const { return rhp_poles_; }
    bool                            is_stable() const { return is_stable_; }
    const std::vector<std::string>& notes() const { return diagnostics_.notes; }
    const std::vector<size_t>&      pivot_rows() const { return diagnostics_.pivot_rows; }
    const std::vector<size_t>&      zero_rows() const { return diagnostics_.zero_rows; }

   private:
    size_t                   order_;
    Polynomial               coefficients_;
    RouthTable               table_;
    std::vector<std::string> row_labels_;
    std::vector<double>      first_column_;
    size_t                   rhp_poles_;
    bool                     is_stable_;
    RouthDiagnostics         diagnostics_;
};

/**
 * @brief Routh-Hurwitz stability test of a real polynomial.
 *
 * Counts the roots with strictly positive real part without computing any root.
 *
 * Usage:
 *   RouthHurwitz rh({1, 2, 3, 4});  // s^3 + 2s^2 + 3s + 4
 *   auto result = rh.compute();
 *   result.is_stable();             // true
 */
class RouthHurwitz {
   public:
    /**
     * @param coeffs    Characteristic polynomial, highest power first
     * @param config    Engine configuration
     *
     * @throws InvalidInputError if the coefficients or the configuration are invalid
     */
    explicit RouthHurwitz(const Polynomial& coeffs, RouthConfig config = {});

    RouthResult compute() const;

    size_t             order() const { return coeffs_.size() - 1; }
    const Polynomial&  coefficients() const { return coeffs_; }
    const RouthConfig& config() const { return config_; }

   private:
    Polynomial  coeffs_;  // Canonical (normalized) coefficients
    RouthConfig config_;
};

/**
 * @brief  Non-throwing entry point of the engine.
 *
 * @param coeffs    Characteristic polynomial, highest power first
 * @param config    Engine configuration
 *
 * @return RouthResult, or InvalidInputError for an empty / all-zero / non-finite
 *         polynomial or an invalid configuration
 */
std::expected<RouthResult, InvalidInputError> routh_hurwitz(const Polynomial& coeffs, const RouthConfig& config = {});

// Label of table row `row` for a polynomial of degree `order`, "s^k" with k = order - row
std::string row_label(size_t order, size_t row);

bool is_zero_row(const RouthRow& row, double tol);

/**
 * @brief  Fill the Routh table of a canonical polynomial.
 *
 * Rows 0 and 1 hold the even and odd offset coefficients. Every following row uses the
 * cross-multiplication rule with the row above as divisor. A row that is entirely zero
 * is replaced (in the table) by resolve_zero_row() before use; a zero pivot is replaced
 * by config.epsilon in the divisor only, the committed table keeps the zero.
 */
RouthTable build_routh_table(const Polynomial& poly, const RouthConfig& config, RouthDiagnostics& diagnostics);

/**
 * @brief  Replace a (near-)zero leading element by config.epsilon.
 *
 * @param row           Row about to serve as divisor
 * @param order         Degree of the polynomial
 * @param row_index     Index of `row` in the table
 *
 * @return Copy of `row` with row(0) = config.epsilon
 */
RouthRow stabilize_pivot(RouthRow row, size_t order, size_t row_index, const RouthConfig& config, RouthDiagnostics& diagnostics);

/**
 * @brief  Replacement for an all-zero row.
 *
 * The row two steps above the zero row defines the auxiliary polynomial of degree
 * order - row_index + 1 (only every other power present). Its derivative, laid out in
 * the same interleaved form, replaces the zero row.
 *
 * @param prev2         Row two steps above the zero row
 * @param order         Degree of the polynomial
 * @param row_index     Index of the zero row in the table
 */
RouthRow resolve_zero_row(const RouthRow& prev2, size_t order, size_t row_index, RouthDiagnostics& diagnostics);

/**
 * @brief  Number of sign reversals between adjacent entries of the first column.
 *
 * Entries within `tol` of zero are read as a tiny positive value, so noise around zero
 * never produces a reversal of its own.
 */
size_t count_sign_changes(const std::vector<double>& column, double tol = 1e-12);

}  // namespace hurwitz
