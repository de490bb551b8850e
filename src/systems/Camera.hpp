#pragma once

#include <algorithm>
#include <flecs.h>
#include <raylib-cpp.hpp>

#include "../core/Constants.hpp"
#include "Diagnostics.hpp"

namespace gravsim {

// View camera that keeps the system's centre of mass in the middle of the
// window. Stored in flecs as a singleton; only the zoom is user controlled.
struct ViewCamera {
    raylib::Camera2D camera{::Vector2{0.0F, 0.0F}, ::Vector2{0.0F, 0.0F}, 0.0F, 1.0F};
    bool follow_com = true;
};

class Camera {
public:
    // Must run after Physics::register_systems so Diagnostics::com is current.
    static void register_systems(const flecs::world& w) {
        ViewCamera initial{};
        if (const auto* d = w.get<Diagnostics>()) retarget(initial, *d);
        w.set<ViewCamera>(initial);

        w.system<>().kind(flecs::OnUpdate).iter([&](flecs::iter&) {
            auto* view = w.get_mut<ViewCamera>();
            const auto* d = w.get<Diagnostics>();
            if (!view || !d) return;
            // Window may be resized; keep the target at the screen centre
            view->camera.offset = {static_cast<float>(GetScreenWidth()) * 0.5F,
                                   static_cast<float>(GetScreenHeight()) * 0.5F};
            if (view->follow_com) retarget(*view, *d);
        });
    }

    static raylib::Camera2D* get(const flecs::world& w) {
        if (auto* view = w.get_mut<ViewCamera>()) return &view->camera;
        return nullptr;
    }

    // Zoom about the screen centre; the followed target stays put.
    static void zoom(raylib::Camera2D& cam, const float wheel) {
        if (wheel == 0.0F) return;
        cam.zoom = std::clamp(cam.zoom * (1.0F + wheel * constants::zoom_wheel_scale), constants::min_zoom,
                              constants::max_zoom);
    }

private:
    static void retarget(ViewCamera& view, const Diagnostics& d) {
        if (!d.ok) return;
        view.camera.target = {static_cast<float>(d.com.x), static_cast<float>(d.com.y)};
    }
};

}  // namespace gravsim
