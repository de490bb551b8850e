#pragma once

#include <algorithm>
#include <cstddef>
#include <flecs.h>
#include <raylib.h>
#include <vector>

#include "../components/Components.hpp"
#include "../core/Config.hpp"
#include "../physics/Gravity.hpp"
#include "Diagnostics.hpp"
#include "FixedStepClock.hpp"

namespace gravsim {

// Read-only copy of one body's physics state.
struct BodyState {
    std::size_t index = 0;
    DVec2 pos{0.0, 0.0};
    DVec2 vel{0.0, 0.0};
    float mass = 0.0f;
};

class Physics {
public:
    static void register_systems(const flecs::world& w) {
        // Fixed-step driver: turn frame time into whole engine steps.
        w.system<>().kind(flecs::OnUpdate).iter([&](const flecs::iter& it) {
            const Config* cfg = w.get<Config>();
            auto* clock = w.get_mut<FixedStepClock>();
            if (!cfg || !clock || cfg->paused) return;
            const double droppedBefore = clock->dropped;
            const int steps = clock->advance(static_cast<double>(it.delta_time()), cfg->time_scale, cfg->fixed_dt,
                                             cfg->max_steps_per_frame);
            for (int k = 0; k < steps; ++k) step(w);
            if (clock->dropped > droppedBefore) {
                TraceLog(LOG_WARNING, "PHYSICS: step cap of %d reached, dropped %.3f time units of backlog",
                         cfg->max_steps_per_frame, clock->dropped - droppedBefore);
            }
        });

        // Diagnostics after integration; pause on non-finite state.
        w.system<>().kind(flecs::OnUpdate).iter([&](flecs::iter&) {
            auto* cfg = w.get_mut<Config>();
            auto* d = w.get_mut<Diagnostics>();
            if (!cfg || !d || cfg->paused) return;
            if (!compute_diagnostics(w, cfg->g, cfg->softening, *d)) {
                cfg->paused = true;
                TraceLog(LOG_WARNING, "PHYSICS: non-finite state detected, simulation paused");
            }
        });
    }

    // Advance every body by exactly one fixed dt with Velocity Verlet.
    static void step(const flecs::world& w) {
        const Config* cfg = w.get<Config>();
        if (!cfg || cfg->paused) return;
        const double dt = cfg->fixed_dt;

        std::vector<Ref> refs = gather(w);
        const std::size_t n = refs.size();
        std::vector<DVec2> positions(n);
        std::vector<float> masses(n);
        for (std::size_t i = 0; i < n; ++i) {
            positions[i] = refs[i].p->value;
            masses[i] = refs[i].m->value;
        }

        const std::vector<DVec2> accOld = Gravity::compute_accelerations(positions, masses, cfg->g, cfg->softening);

        // All positions move before any acceleration is re-evaluated.
        const double halfDt2 = 0.5 * dt * dt;
        for (std::size_t i = 0; i < n; ++i) {
            positions[i] += refs[i].v->value * dt + accOld[i] * halfDt2;
            refs[i].p->value = positions[i];
        }

        const std::vector<DVec2> accNew = Gravity::compute_accelerations(positions, masses, cfg->g, cfg->softening);

        auto* time = w.get_mut<SimulationTime>();
        const unsigned long long stepNumber = time ? time->steps + 1 : 1;
        const int stride = std::max(1, cfg->trail_stride);
        const bool record = stepNumber % static_cast<unsigned long long>(stride) == 0;

        for (std::size_t i = 0; i < n; ++i) {
            refs[i].v->value += (accOld[i] + accNew[i]) * (0.5 * dt);
            if (record) append_trail(*refs[i].t, positions[i], cfg->trail_max);
        }

        if (time) {
            time->steps = stepNumber;
            time->elapsed += dt;
        }
    }

    // Current bodies ordered by BodyIndex.
    static std::vector<BodyState> bodies(const flecs::world& w) {
        std::vector<BodyState> out;
        w.each([&](const BodyIndex& idx, const Position& p, const Velocity& v, const Mass& m) {
            out.push_back(BodyState{idx.value, p.value, v.value, m.value});
        });
        std::sort(out.begin(), out.end(),
                  [](const BodyState& a, const BodyState& b) { return a.index < b.index; });
        return out;
    }

private:
    struct Ref {
        std::size_t index;
        Position* p;
        Velocity* v;
        const Mass* m;
        Trail* t;
    };

    static std::vector<Ref> gather(const flecs::world& w) {
        std::vector<Ref> refs;
        w.each([&](const BodyIndex& idx, Position& p, Velocity& v, const Mass& m, Trail& t) {
            refs.push_back(Ref{idx.value, &p, &v, &m, &t});
        });
        std::sort(refs.begin(), refs.end(), [](const Ref& a, const Ref& b) { return a.index < b.index; });
        return refs;
    }

    static void append_trail(Trail& trail, const DVec2& pos, const int maxLen) {
        trail.points.push_back(pos);
        if (maxLen <= 0) return;
        while (trail.points.size() > static_cast<std::size_t>(maxLen)) trail.points.pop_front();
    }
};

}  // namespace gravsim
