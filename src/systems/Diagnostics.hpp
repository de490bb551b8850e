#pragma once

#include <cmath>
#include <cstddef>
#include <flecs.h>
#include <tuple>
#include <vector>

#include "../components/Components.hpp"
#include "../physics/Gravity.hpp"

namespace gravsim {

    struct Diagnostics {
        double kinetic = 0.0;
        double potential = 0.0;
        double energy = 0.0;
        DVec2 momentum{0.0, 0.0};
        DVec2 com{0.0, 0.0};
        double totalMass = 0.0;
        double baseline_energy = 0.0;  // energy when the scenario was loaded
        double drift = 0.0;  // |energy - baseline| / |baseline|
        bool ok = true;
    };

    // Potential uses the same softening floor as the force so that the total is
    // what Velocity Verlet approximately conserves.
    inline bool compute_diagnostics(const flecs::world& w, const double G, const double softening, Diagnostics& out) {
        std::vector<std::tuple<DVec2, DVec2, float>> data;
        data.reserve(16);
        w.each(
            [&](const Position& p, const Velocity& v, const Mass& m) { data.emplace_back(p.value, v.value, m.value); });
        const double baseline = out.baseline_energy;
        const size_t n = data.size();
        out = Diagnostics{};
        out.baseline_energy = baseline;
        if (n == 0) return true;

        double KE = 0.0, M = 0.0, Px = 0.0, Py = 0.0, Cx = 0.0, Cy = 0.0;
        for (size_t i = 0; i < n; ++i) {
            auto [p, v, m] = data[i];
            KE += 0.5 * static_cast<double>(m) * length2(v);
            Px += static_cast<double>(m) * v.x;
            Py += static_cast<double>(m) * v.y;
            Cx += static_cast<double>(m) * p.x;
            Cy += static_cast<double>(m) * p.y;
            M += static_cast<double>(m);
        }
        double PE = 0.0;
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                const double r = (std::get<0>(data[j]) - std::get<0>(data[i])).magnitude();
                PE += Gravity::pair_potential(static_cast<double>(std::get<2>(data[i])),
                                              static_cast<double>(std::get<2>(data[j])), r, G, softening);
            }
        }

        out.kinetic = KE;
        out.potential = PE;
        out.energy = KE + PE;
        out.momentum = {Px, Py};
        out.totalMass = M;
        out.com = (M > 0.0) ? DVec2{Cx / M, Cy / M} : DVec2{0.0, 0.0};
        out.drift = (baseline != 0.0) ? std::abs(out.energy - baseline) / std::abs(baseline) : 0.0;

        out.ok = std::isfinite(out.kinetic) && std::isfinite(out.potential) && std::isfinite(out.energy) &&
            is_finite(out.momentum) && std::isfinite(out.totalMass) && is_finite(out.com);
        return out.ok;
    }

    // Fresh diagnostics whose drift is measured against the current energy.
    inline Diagnostics baseline_diagnostics(const flecs::world& w, const double G, const double softening) {
        Diagnostics d{};
        d.ok = compute_diagnostics(w, G, softening, d);
        d.baseline_energy = d.energy;
        d.drift = 0.0;
        return d;
    }

}  // namespace gravsim
