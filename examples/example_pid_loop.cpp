#include <fmt/core.h>

#include "hurwitz.hpp"

// PID controller on a second-order plant, checked with the Routh table instead of root finding.
//
//   Plant       G(s) = 1 / (s^2 + 2s + 1)
//   Controller  C(s) = (Kd s^2 + Kp s + Ki) / s
//   Closed loop 1 + C(s) G(s) = 0  ->  s (s^2 + 2s + 1) + Kd s^2 + Kp s + Ki = 0
int main() {
    using namespace hurwitz;

    fmt::print("=== PID Loop Stability ===\n\n");

    const Polynomial plant_den = {1.0, 2.0, 1.0};
    const Polynomial integrator = {1.0, 0.0};

    struct Gains {
        double Kp, Ki, Kd;
    };

    const Gains candidates[] = {
        {10.0, 5.0, 2.0},
        {1.0, 20.0, 0.0},
        {0.5, 0.1, 0.0},
        {-3.0, 1.0, 0.0},
    };

    for (const auto& g : candidates) {
        const Polynomial controller_num = {g.Kd, g.Kp, g.Ki};
        const Polynomial characteristic = poly_add(poly_multiply(integrator, plant_den), controller_num);

        fmt::print("Kp = {:g}, Ki = {:g}, Kd = {:g}\n", g.Kp, g.Ki, g.Kd);
        fmt::print("  characteristic polynomial: {}\n", poly_to_string(characteristic));

        const auto result = routh_hurwitz(characteristic);
        if (!result) {
            fmt::print("  invalid: {}\n\n", result.error().what());
            continue;
        }

        fmt::print("{}\n", to_string_table(*result));
        if (result->is_stable()) {
            fmt::print("  -> stable\n\n");
        } else {
            fmt::print("  -> unstable, {} RHP poles\n\n", result->rhp_poles());
        }
    }

    return 0;
}
