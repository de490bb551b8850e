#pragma once

#include <algorithm>
#include <cstddef>
#include <flecs.h>
#include <raylib-cpp.hpp>

#include "../components/Components.hpp"
#include "../components/Tint.hpp"
#include "../core/Config.hpp"
#include "../core/Constants.hpp"

namespace gravsim::systems {

// Draws trails, then bodies on top. Read-only with respect to physics state.
class WorldRenderer {
public:
    static void render_scene(const flecs::world& w, const Config& cfg, raylib::Camera2D& cam) {
        cam.BeginMode();

        if (cfg.draw_trails) {
            w.each([&](const Trail& t, const Tint& tint) {
                const double denom = std::max(1.0, static_cast<double>(t.points.size()));
                for (std::size_t k = 1; k < t.points.size(); ++k) {
                    Color c = tint.value;
                    c.a = static_cast<unsigned char>(std::clamp(
                        constants::trail_alpha_min +
                            static_cast<int>(constants::trail_alpha_range * static_cast<double>(k) / denom),
                        constants::trail_alpha_min, constants::trail_alpha_max));
                    DrawLineV(to_screen(t.points[k - 1]), to_screen(t.points[k]), c);
                }
            });
        }

        const float r = std::max(constants::min_body_radius / cam.zoom, cfg.body_radius);
        w.each([&](const Position& p, const Tint& tint) { DrawCircleV(to_screen(p.value), r, tint.value); });

        cam.EndMode();
    }

private:
    static raylib::Vector2 to_screen(const DVec2& v) { return {static_cast<float>(v.x), static_cast<float>(v.y)}; }
};

}  // namespace gravsim::systems
