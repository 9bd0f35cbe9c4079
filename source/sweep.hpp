#pragma once

#include <expected>
#include <utility>
#include <vector>

#include "routh.hpp"
#include "types.hpp"

namespace hurwitz {

struct GainSweepResult {
    std::vector<double> gains;
    std::vector<size_t> rhp_poles;  // Closed-loop RHP pole count per gain
    std::vector<bool>   stable;     // Routh verdict per gain
    std::vector<size_t> failed;     // Indices whose closed-loop polynomial was invalid
};

/**
 * @brief  Run the engine on many independent polynomials concurrently.
 *
 * Work is split across std::async tasks; every call only touches its own input, so the
 * results are identical to calling routh_hurwitz() on each polynomial in turn.
 *
 * @return One result per input polynomial, in input order
 */
std::vector<std::expected<RouthResult, InvalidInputError>> routh_hurwitz_batch(const std::vector<Polynomial>& polys,
                                                                               const RouthConfig&             config = {});

/**
 * @brief  Characteristic polynomial of the unity negative feedback loop K*G(s).
 *
 * For G(s) = num(s) / den(s) this is den(s) + K*num(s).
 */
Polynomial closed_loop_polynomial(const Polynomial& num, const Polynomial& den, double gain);

/**
 * @brief  Routh verdict of the closed loop K*G(s) for every gain.
 *
 * Gains whose closed-loop polynomial is invalid (e.g. all zero) are reported as
 * unstable with zero RHP poles and listed in GainSweepResult::failed.
 */
GainSweepResult gain_sweep(const Polynomial&          num,
                           const Polynomial&          den,
                           const std::vector<double>& gains,
                           const RouthConfig&         config = {});

// Contiguous runs of stable gains, as [first, last] pairs in sweep order
std::vector<std::pair<double, double>> stable_gain_ranges(const GainSweepResult& sweep);

}  // namespace hurwitz
