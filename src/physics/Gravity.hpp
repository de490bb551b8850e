#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

#include "../core/Math.hpp"

namespace gravsim {

// Pairwise Newtonian gravity with a minimum-distance floor.
class Gravity {
public:
    // Net acceleration of every body, in input order. positions and masses
    // must have the same length. A body never attracts itself.
    static std::vector<DVec2> compute_accelerations(const std::vector<DVec2>& positions,
                                                    const std::vector<float>& masses, const double G,
                                                    const double softening) {
        const std::size_t n = positions.size();
        std::vector acc(n, DVec2{0.0, 0.0});
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = 0; j < n; ++j) {
                if (i == j) continue;
                acc[i] += pair_acceleration(positions[i], positions[j], static_cast<double>(masses[j]), G, softening);
            }
        }
        return acc;
    }

    // Acceleration felt at `at` due to a mass `source_mass` sitting at `source`.
    static DVec2 pair_acceleration(const DVec2& at, const DVec2& source, const double source_mass, const double G,
                                   const double softening) {
        const DVec2 diff = source - at;
        const double distance = std::max(diff.magnitude(), softening);
        // Coincident with softening disabled: no direction, no pull.
        if (distance == 0.0) return DVec2{0.0, 0.0};
        return diff.normalized() * (G * source_mass / (distance * distance));
    }

    // Pair potential whose gradient is the floored force above: -G mi mj / r
    // outside the softening radius, continued linearly inside it.
    static double pair_potential(const double mi, const double mj, const double r, const double G,
                                 const double softening) {
        const double gmm = G * mi * mj;
        if (r >= softening) {
            return r > 0.0 ? -gmm / r : 0.0;
        }
        return -gmm * (2.0 * softening - r) / (softening * softening);
    }
};

}  // namespace gravsim
