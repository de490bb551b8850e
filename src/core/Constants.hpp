#pragma once

namespace gravsim::constants {
inline constexpr int window_width = 1280;
inline constexpr int window_height = 960;
inline constexpr int target_fps = 60;

inline constexpr float body_radius_px = 5.0F;
inline constexpr float min_body_radius = 2.0F;

inline constexpr int trail_alpha_min = 20;
inline constexpr int trail_alpha_max = 250;
inline constexpr float trail_alpha_range = 230.0F;

inline constexpr float zoom_wheel_scale = 0.1F;
inline constexpr float min_zoom = 0.05F;
inline constexpr float max_zoom = 20.0F;

// Default three-body seed
inline constexpr double seed_left_mass = 70.0;
inline constexpr double seed_center_mass = 100.0;
inline constexpr double seed_right_mass = 30.0;
inline constexpr double seed_offset_x = 100.0;
inline constexpr double seed_speed = 0.5;

// Default configuration values (used to initialize Config)
inline constexpr double default_g = 1.0;  // simulation units, not SI
inline constexpr double default_softening = 0.1;  // minimum pair distance
inline constexpr double default_fixed_dt = 0.01;  // simulation time per step
inline constexpr double default_time_scale = 500.0;  // simulation time per wall-clock second
inline constexpr int default_max_steps_per_frame = 0;  // 0 = uncapped
inline constexpr int default_trail_max = 0;  // points, 0 = unbounded
inline constexpr int default_trail_stride = 1;  // record every Nth step
}  // namespace gravsim::constants
