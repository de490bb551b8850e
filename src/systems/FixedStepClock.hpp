#pragma once

#include <algorithm>
#include <cmath>

namespace gravsim {

// Driver-side accumulator converting wall-clock frame time into a whole
// number of fixed simulation steps. Stored in flecs as a singleton.
struct FixedStepClock {
    double accumulator = 0.0;  // simulation time not yet consumed by a step
    double dropped = 0.0;  // simulation time discarded by the per-frame cap
    int last_steps = 0;

    // Add one frame's worth of time and return how many steps of `dt` are due.
    // With max_steps > 0, backlog beyond the cap is discarded and only the
    // sub-step remainder is carried to the next frame.
    int advance(const double frame_seconds, const double time_scale, const double dt, const int max_steps) {
        last_steps = 0;
        if (!(dt > 0.0)) return 0;
        accumulator += std::max(0.0, frame_seconds) * std::max(0.0, time_scale);
        while (accumulator >= dt) {
            if (max_steps > 0 && last_steps >= max_steps) {
                const double remainder = std::fmod(accumulator, dt);
                dropped += accumulator - remainder;
                accumulator = remainder;
                break;
            }
            accumulator -= dt;
            ++last_steps;
        }
        return last_steps;
    }

    void reset() { *this = FixedStepClock{}; }
};

}  // namespace gravsim
