#include <exception>
#include <flecs.h>
#include <imgui.h>
#include <raylib-cpp.hpp>
#include <raylib.h>
#include <rlImGui.h>

#include "components/Tint.hpp"
#include "core/Colors.hpp"
#include "core/Config.hpp"
#include "core/Constants.hpp"
#include "core/Scenario.hpp"

#include "systems/Camera.hpp"
#include "systems/Physics.hpp"
#include "systems/UI.hpp"
#include "systems/WorldRenderer.hpp"

class Application {
public:
    Application() {
        SetConfigFlags(FLAG_WINDOW_HIGHDPI | FLAG_MSAA_4X_HINT);
        InitWindow(gravsim::constants::window_width, gravsim::constants::window_height, "Three-Body Simulation");
        SetTargetFPS(gravsim::constants::target_fps);
        rlImGuiSetup(false);

        initialize_world();
    }

    ~Application() {
        rlImGuiShutdown();
        CloseWindow();
    }

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    void run() {
        while (!WindowShouldClose()) {
            update();
            render();
        }
    }

private:
    flecs::world world_;

    void initialize_world() const {
        world_.set<Config>({});

        // Bodies first so the camera can center on them
        gravsim::apply_scenario_to_world(world_, gravsim::three_body_scenario());
        gravsim::assign_tints(world_, gravsim::three_body_palette());

        gravsim::Physics::register_systems(world_);
        gravsim::Camera::register_systems(world_);
    }

    void update() const {
        const double frameStart = GetTime();

        raylib::Camera2D* camera = gravsim::Camera::get(world_);
        auto* cfg = world_.get_mut<Config>();
        if (cfg == nullptr || camera == nullptr) return;

        const ImGuiIO& imguiIO = ImGui::GetIO();
        if (!imguiIO.WantCaptureMouse) {
            if (const float wheel = GetMouseWheelMove(); wheel != 0.0F) {
                gravsim::Camera::zoom(*camera, wheel);
            }
        }

        // Physics system scales wall-clock time and runs whole fixed steps
        [[maybe_unused]] auto progress = world_.progress(GetFrameTime());

        constexpr double kMsPerSec = 1000.0;
        cfg->update_ms = (GetTime() - frameStart) * kMsPerSec;
    }

    void render() const {
        BeginDrawing();
        ClearBackground(gravsim::colors::background);

        if (raylib::Camera2D* camera = gravsim::Camera::get(world_)) {
            if (const auto* cfg = world_.get<Config>()) {
                gravsim::systems::WorldRenderer::render_scene(world_, *cfg, *camera);
            }
        }

        gravsim::UI::begin();
        gravsim::UI::draw(world_);
        gravsim::UI::end();
        EndDrawing();
    }
};

auto main() -> int {
    try {
        Application app;
        app.run();
        return 0;
    } catch (const std::exception& e) {
        TraceLog(LOG_ERROR, "Exception: %s", e.what());
        return 1;
    }
}
