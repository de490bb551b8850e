#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <flecs.h>
#include <raylib.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../components/Components.hpp"
#include "../systems/Diagnostics.hpp"
#include "../systems/FixedStepClock.hpp"
#include "Config.hpp"
#include "Constants.hpp"

namespace gravsim {

struct BodySnapshot {
    DVec2 pos{0.0, 0.0};
    DVec2 vel{0.0, 0.0};
    float mass = 0.0f;
};

struct Scenario {
    std::string name;
    std::string description;
    std::vector<BodySnapshot> bodies;
    // Minimal config subset to replay scenario faithfully
    double g = constants::default_g;
    double softening = constants::default_softening;
    double fixed_dt = constants::default_fixed_dt;
    double time_scale = constants::default_time_scale;
    int max_steps_per_frame = constants::default_max_steps_per_frame;
    int trail_max = constants::default_trail_max;
    int trail_stride = constants::default_trail_stride;
};

// Three bodies on a line: the heavy one at rest in the middle, the outer two
// moving in opposite directions.
inline Scenario three_body_scenario() {
    Scenario s{};
    s.name = "Three bodies";
    s.description = "Masses 70, 100 and 30 released on the x axis";
    s.bodies = {
        BodySnapshot{{-constants::seed_offset_x, 0.0}, {0.0, constants::seed_speed},
                     static_cast<float>(constants::seed_left_mass)},
        BodySnapshot{{0.0, 0.0}, {0.0, 0.0}, static_cast<float>(constants::seed_center_mass)},
        BodySnapshot{{constants::seed_offset_x, 0.0}, {0.0, -constants::seed_speed},
                     static_cast<float>(constants::seed_right_mass)},
    };
    return s;
}

// Throws std::invalid_argument when the scenario breaks an engine precondition.
inline void validate_scenario(const Scenario& s) {
    if (s.bodies.empty()) throw std::invalid_argument("scenario '" + s.name + "' has no bodies");
    for (std::size_t i = 0; i < s.bodies.size(); ++i) {
        const BodySnapshot& b = s.bodies[i];
        if (!(std::isfinite(b.mass) && b.mass > 0.0f))
            throw std::invalid_argument("body " + std::to_string(i) + " must have a finite positive mass");
        if (!is_finite(b.pos) || !is_finite(b.vel))
            throw std::invalid_argument("body " + std::to_string(i) + " has a non-finite position or velocity");
    }
    if (!(std::isfinite(s.fixed_dt) && s.fixed_dt > 0.0))
        throw std::invalid_argument("fixed_dt must be finite and positive");
    if (!(std::isfinite(s.softening) && s.softening >= 0.0))
        throw std::invalid_argument("softening must be finite and non-negative");
    if (!std::isfinite(s.g)) throw std::invalid_argument("g must be finite");
    if (!(std::isfinite(s.time_scale) && s.time_scale >= 0.0))
        throw std::invalid_argument("time_scale must be finite and non-negative");
    if (s.max_steps_per_frame < 0 || s.trail_max < 0 || s.trail_stride < 1)
        throw std::invalid_argument("step cap and trail settings must be non-negative, trail stride at least 1");
}

inline Scenario snapshot_from_world(const flecs::world& w, const std::string& name, const std::string& desc) {
    Scenario s{};
    s.name = name;
    s.description = desc;
    if (const auto* cfg = w.get<Config>()) {
        s.g = cfg->g;
        s.softening = cfg->softening;
        s.fixed_dt = cfg->fixed_dt;
        s.time_scale = cfg->time_scale;
        s.max_steps_per_frame = cfg->max_steps_per_frame;
        s.trail_max = cfg->trail_max;
        s.trail_stride = cfg->trail_stride;
    }
    std::vector<std::pair<std::size_t, BodySnapshot>> indexed;
    w.each([&](const BodyIndex& idx, const Position& p, const Velocity& v, const Mass& m) {
        indexed.emplace_back(idx.value, BodySnapshot{p.value, v.value, m.value});
    });
    std::sort(indexed.begin(), indexed.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    for (const auto& [idx, b] : indexed) s.bodies.push_back(b);
    return s;
}

inline void apply_scenario_bodies_only(const flecs::world& w, const Scenario& s) {
    // Clear all current bodies
    std::vector<flecs::entity> toDel;
    w.each([&](const flecs::entity e, const Position&) { toDel.push_back(e); });
    for (auto& e : toDel) e.destruct();

    // Rebuild bodies
    for (std::size_t i = 0; i < s.bodies.size(); ++i) {
        const BodySnapshot& b = s.bodies[i];
        w.entity()
            .set<BodyIndex>({i})
            .set<Position>({b.pos})
            .set<Velocity>({b.vel})
            .set<Mass>({b.mass})
            .set<Trail>({{}});
    }
}

// Validates, replaces all bodies, applies the config subset and resets the
// clocks. Diagnostics are re-baselined on the new state.
inline void apply_scenario_to_world(const flecs::world& w, const Scenario& s) {
    validate_scenario(s);
    apply_scenario_bodies_only(w, s);

    Config cfg{};
    if (const auto* current = w.get<Config>()) cfg = *current;
    cfg.g = s.g;
    cfg.softening = s.softening;
    cfg.fixed_dt = s.fixed_dt;
    cfg.time_scale = s.time_scale;
    cfg.max_steps_per_frame = s.max_steps_per_frame;
    cfg.trail_max = s.trail_max;
    cfg.trail_stride = s.trail_stride;
    cfg.paused = false;
    w.set<Config>(cfg);

    w.set<SimulationTime>({});
    w.set<FixedStepClock>({});
    w.set<Diagnostics>(baseline_diagnostics(w, cfg.g, cfg.softening));

    TraceLog(LOG_INFO, "SCENARIO: loaded '%s' with %zu bodies (dt=%.4f, G=%.3f, softening=%.3f)", s.name.c_str(),
             s.bodies.size(), s.fixed_dt, s.g, s.softening);
    if (!s.description.empty()) TraceLog(LOG_INFO, "SCENARIO: %s", s.description.c_str());
}

}  // namespace gravsim
