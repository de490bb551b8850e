// src/core/Config.hpp
#pragma once

#include "Constants.hpp"

// Global/singleton simulation configuration stored in flecs as a singleton component.
// Units are internal to the simulation; G and softening are tunables.
struct Config {
    // Physics
    double g = gravsim::constants::default_g;
    double softening = gravsim::constants::default_softening;  // floor applied to pair distance

    // Time
    bool paused = false;
    double fixed_dt = gravsim::constants::default_fixed_dt;
    double time_scale = gravsim::constants::default_time_scale;  // wall-clock -> simulation time multiplier
    int max_steps_per_frame = gravsim::constants::default_max_steps_per_frame;  // 0 = uncapped

    // Trail retention
    int trail_max = gravsim::constants::default_trail_max;  // 0 = unbounded
    int trail_stride = gravsim::constants::default_trail_stride;

    // Visuals
    bool draw_trails = true;
    float body_radius = gravsim::constants::body_radius_px;

    // UI/runtime
    double update_ms = 0.0;  // time spent in Application::update, physics included
};

// Step counter and elapsed simulation time, advanced once per engine step.
struct SimulationTime {
    unsigned long long steps = 0;
    double elapsed = 0.0;
};
