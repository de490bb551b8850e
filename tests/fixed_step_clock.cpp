#include <cassert>
#include <cmath>
#include <flecs.h>
#include <raylib.h>

#include "../src/core/Scenario.hpp"
#include "../src/systems/FixedStepClock.hpp"
#include "../src/systems/Physics.hpp"

using namespace gravsim;

int main() {
    SetTraceLogLevel(LOG_ERROR);

    // Leftover time carries over to the next frame
    {
        FixedStepClock clock{};
        assert(clock.advance(0.035, 1.0, 0.01, 0) == 3);
        assert(std::abs(clock.accumulator - 0.005) < 1e-12);
        assert(clock.advance(0.003, 1.0, 0.01, 0) == 0);
        assert(clock.advance(0.003, 1.0, 0.01, 0) == 1);
        assert(std::abs(clock.accumulator - 0.001) < 1e-12);
    }

    // Speed multiplier scales wall-clock time: 1/60 s at x500 is 833 steps
    {
        FixedStepClock clock{};
        assert(clock.advance(1.0 / 60.0, 500.0, 0.01, 0) == 833);
        assert(clock.accumulator >= 0.0 && clock.accumulator < 0.01);
        assert(clock.last_steps == 833);
    }

    // Cap drops backlog but keeps the sub-step remainder
    {
        FixedStepClock clock{};
        assert(clock.advance(1.0055, 1.0, 0.01, 10) == 10);
        assert(clock.accumulator < 0.01);
        assert(std::abs(clock.accumulator - 0.0055) < 1e-9);
        assert(std::abs(clock.dropped - 0.9) < 1e-9);
    }

    // Degenerate input never loops or goes negative
    {
        FixedStepClock clock{};
        assert(clock.advance(1.0, 1.0, 0.0, 0) == 0);
        assert(clock.advance(-1.0, 1.0, 0.01, 0) == 0);
        assert(clock.advance(1.0, -5.0, 0.01, 0) == 0);
        assert(clock.accumulator == 0.0);
        clock.accumulator = 0.5;
        clock.reset();
        assert(clock.accumulator == 0.0 && clock.dropped == 0.0);
    }

    // Driven through flecs: progress(frame) runs the due number of steps
    {
        flecs::world w;
        Scenario s = three_body_scenario();
        s.time_scale = 1.0;
        apply_scenario_to_world(w, s);
        Physics::register_systems(w);

        w.progress(0.035f);
        assert(w.get<SimulationTime>()->steps == 3);
        assert(w.get<FixedStepClock>()->last_steps == 3);

        w.progress(0.001f);
        assert(w.get<SimulationTime>()->steps == 3);

        const auto* d = w.get<Diagnostics>();
        assert(d && d->ok);
        assert(d->drift < 1e-6);
    }
    return 0;
}
