#include <cassert>
#include <cmath>
#include <flecs.h>
#include <raylib.h>

#include "../src/core/Constants.hpp"
#include "../src/core/Scenario.hpp"
#include "../src/systems/Camera.hpp"
#include "../src/systems/Physics.hpp"

using namespace gravsim;

int main() {
    SetTraceLogLevel(LOG_WARNING);

    flecs::world w;
    Scenario s = three_body_scenario();
    s.time_scale = 1.0;
    apply_scenario_to_world(w, s);
    Physics::register_systems(w);
    Camera::register_systems(w);

    // Starts on the centre of mass: (70 * -100 + 30 * 100) / 200 = -20
    raylib::Camera2D* cam = Camera::get(w);
    assert(cam);
    assert(std::abs(cam->target.x + 20.0F) < 1e-4F);
    assert(std::abs(cam->target.y) < 1e-6F);

    // Net momentum (0, 20) over mass 200 moves the centre of mass at 0.1 per time unit
    w.progress(1.005f);
    assert(w.get<SimulationTime>()->steps == 100);
    const auto* d = w.get<Diagnostics>();
    assert(std::abs(d->com.y - 0.1) < 1e-9);
    assert(std::abs(cam->target.x - static_cast<float>(d->com.x)) < 1e-4F);
    assert(std::abs(cam->target.y - static_cast<float>(d->com.y)) < 1e-6F);
    assert(std::abs(cam->target.y - 0.1F) < 1e-5F);

    // Detached camera stays where it was
    w.get_mut<ViewCamera>()->follow_com = false;
    const float heldY = cam->target.y;
    w.progress(1.0f);
    assert(w.get<Diagnostics>()->com.y > 0.15);
    assert(cam->target.y == heldY);

    // Zoom is clamped to the configured range
    for (int i = 0; i < 200; ++i) Camera::zoom(*cam, 1.0F);
    assert(cam->zoom == constants::max_zoom);
    for (int i = 0; i < 200; ++i) Camera::zoom(*cam, -1.0F);
    assert(cam->zoom == constants::min_zoom);
    return 0;
}
