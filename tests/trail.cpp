#include <cassert>
#include <cstddef>
#include <flecs.h>
#include <raylib.h>
#include <vector>

#include "../src/core/Scenario.hpp"
#include "../src/systems/Physics.hpp"

using namespace gravsim;

namespace {

std::vector<const Trail*> trails_by_index(const flecs::world& w) {
    std::vector<const Trail*> out(3, nullptr);
    w.each([&](const BodyIndex& idx, const Trail& t) { out[idx.value] = &t; });
    return out;
}

}  // namespace

int main() {
    SetTraceLogLevel(LOG_WARNING);

    // Default: one point per step, unbounded, last point is the current position
    {
        flecs::world w;
        apply_scenario_to_world(w, three_body_scenario());
        for (int i = 0; i < 25; ++i) Physics::step(w);
        const auto trails = trails_by_index(w);
        const auto bodies = Physics::bodies(w);
        for (std::size_t i = 0; i < 3; ++i) {
            assert(trails[i]->points.size() == 25);
            assert(trails[i]->points.back() == bodies[i].pos);
        }
    }

    // Capped: oldest points are dropped
    {
        flecs::world w;
        Scenario s = three_body_scenario();
        s.trail_max = 4;
        apply_scenario_to_world(w, s);
        std::vector<DVec2> history;
        for (int i = 0; i < 10; ++i) {
            Physics::step(w);
            history.push_back(Physics::bodies(w)[0].pos);
        }
        const Trail& t = *trails_by_index(w)[0];
        assert(t.points.size() == 4);
        for (std::size_t k = 0; k < 4; ++k) assert(t.points[k] == history[6 + k]);
    }

    // Strided: every third step is recorded
    {
        flecs::world w;
        Scenario s = three_body_scenario();
        s.trail_stride = 3;
        apply_scenario_to_world(w, s);
        for (int i = 0; i < 10; ++i) Physics::step(w);
        assert(trails_by_index(w)[1]->points.size() == 3);
    }
    return 0;
}
