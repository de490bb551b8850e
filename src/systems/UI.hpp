#pragma once

#include <flecs.h>
#include <imgui.h>
#include <rlImGui.h>

#include "../core/Config.hpp"
#include "Diagnostics.hpp"
#include "FixedStepClock.hpp"
#include "Physics.hpp"

namespace gravsim {

// Read-only overlay: nothing here writes simulation state.
class UI {
public:
    static void begin() { rlImGuiBegin(); }
    static void end() { rlImGuiEnd(); }

    static void draw(const flecs::world& w) {
        const Config* cfg = w.get<Config>();
        if (!cfg) return;
        draw_time_panel(w, *cfg);
        draw_diagnostics_panel(w);
        draw_bodies_panel(w);
    }

private:
    static void draw_time_panel(const flecs::world& w, const Config& cfg) {
        ImGui::SetNextWindowPos(ImVec2(12, 12), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(300, 0), ImGuiCond_FirstUseEver);
        ImGui::Begin("Time");
        if (const auto* t = w.get<SimulationTime>()) {
            ImGui::Text("Steps: %llu", t->steps);
            ImGui::Text("Sim time: %.2f", t->elapsed);
        }
        ImGui::Text("dt: %.4f  x%.0f", cfg.fixed_dt, cfg.time_scale);
        if (const auto* clock = w.get<FixedStepClock>()) {
            ImGui::Text("Steps last frame: %d", clock->last_steps);
            if (clock->dropped > 0.0) ImGui::Text("Dropped backlog: %.3f", clock->dropped);
        }
        ImGui::Text("Update: %.3f ms", cfg.update_ms);
        if (cfg.paused) ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "Paused (non-finite state)");
        ImGui::End();
    }

    static void draw_diagnostics_panel(const flecs::world& w) {
        const auto* d = w.get<Diagnostics>();
        if (!d) return;
        ImGui::SetNextWindowPos(ImVec2(12, 150), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(300, 0), ImGuiCond_FirstUseEver);
        ImGui::Begin("Diagnostics");
        ImGui::Text("KE: %.6g", d->kinetic);
        ImGui::Text("PE: %.6g", d->potential);
        ImGui::Text("E: %.6g", d->energy);
        ImGui::Text("Drift: %.3e", d->drift);
        ImGui::Text("P: (%.4g, %.4g)", d->momentum.x, d->momentum.y);
        ImGui::Text("COM: (%.2f, %.2f)", d->com.x, d->com.y);
        ImGui::End();
    }

    static void draw_bodies_panel(const flecs::world& w) {
        ImGui::SetNextWindowPos(ImVec2(12, 300), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(300, 0), ImGuiCond_FirstUseEver);
        ImGui::Begin("Bodies");
        for (const BodyState& b : Physics::bodies(w)) {
            ImGui::Text("#%zu m=%.1f p=(%.1f, %.1f) v=(%.3f, %.3f)", b.index, static_cast<double>(b.mass), b.pos.x,
                        b.pos.y, b.vel.x, b.vel.y);
        }
        ImGui::End();
    }
};

}  // namespace gravsim
