#include "sweep.hpp"

#include <algorithm>
#include <future>
#include <thread>
#include <type_traits>

#include "polynomial.hpp"

namespace hurwitz {

namespace {
// Evaluate fn(0) ... fn(count - 1) on up to hardware_concurrency() tasks, results in index order
template <typename F>
auto parallel_map(size_t count, F&& fn) -> std::vector<std::invoke_result_t<F&, size_t>> {
    using R = std::invoke_result_t<F&, size_t>;

    const size_t workers = std::clamp<size_t>(std::thread::hardware_concurrency(), 1, std::max<size_t>(count, 1));
    const size_t chunk   = (count + workers - 1) / workers;

    std::vector<std::future<std::vector<R>>> futures;
    for (size_t begin = 0; begin < count; begin += chunk) {
        const size_t end = std::min(begin + chunk, count);
        futures.push_back(std::async(std::launch::async, [&fn, begin, end]() {
            std::vector<R> part;
            part.reserve(end - begin);
            for (size_t i = begin; i < end; ++i) {
                part.push_back(fn(i));
            }
            return part;
        }));
    }

    std::vector<R> results;
    results.reserve(count);
    for (auto& future : futures) {
        for (auto& r : future.get()) {
            results.push_back(std::move(r));
        }
    }
    return results;
}

struct GainPoint {
    size_t rhp_poles = 0;
    bool   stable    = false;
    bool   valid     = false;
};
}  // namespace

std::vector<std::expected<RouthResult, InvalidInputError>> routh_hurwitz_batch(const std::vector<Polynomial>& polys,
                                                                               const RouthConfig&             config) {
    return parallel_map(polys.size(), [&](size_t i) { return routh_hurwitz(polys[i], config); });
}

Polynomial closed_loop_polynomial(const Polynomial& num, const Polynomial& den, double gain) {
    return poly_add(den, poly_scale(num, gain));
}

GainSweepResult gain_sweep(const Polynomial&          num,
                           const Polynomial&          den,
                           const std::vector<double>& gains,
                           const RouthConfig&         config) {
    const auto points = parallel_map(gains.size(), [&](size_t i) {
        const auto result = routh_hurwitz(closed_loop_polynomial(num, den, gains[i]), config);
        if (!result) {
            return GainPoint{};
        }
        return GainPoint{result->rhp_poles(), result->is_stable(), true};
    });

    GainSweepResult sweep;
    sweep.gains = gains;
    sweep.rhp_poles.reserve(gains.size());
    sweep.stable.reserve(gains.size());
    for (size_t i = 0; i < points.size(); ++i) {
        sweep.rhp_poles.push_back(points[i].rhp_poles);
        sweep.stable.push_back(points[i].stable);
        if (!points[i].valid) {
            sweep.failed.push_back(i);
        }
    }
    return sweep;
}

std::vector<std::pair<double, double>> stable_gain_ranges(const GainSweepResult& sweep) {
    std::vector<std::pair<double, double>> ranges;

    bool in_range = false;
    for (size_t i = 0; i < sweep.gains.size() && i < sweep.stable.size(); ++i) {
        if (!sweep.stable[i]) {
            in_range = false;
            continue;
        }
        if (in_range) {
            ranges.back().second = sweep.gains[i];
        } else {
            ranges.emplace_back(sweep.gains[i], sweep.gains[i]);
            in_range = true;
        }
    }
    return ranges;
}

}  // namespace hurwitz
