#pragma once

#include <raylib-cpp.hpp>
#include <vector>

namespace gravsim {

namespace colors {
inline constexpr ::Color background{255, 255, 255, 255};
inline constexpr int random_min = 64;
inline constexpr int random_max = 255;
inline constexpr unsigned char alpha_opaque = 255;
}  // namespace colors

inline auto random_nice_color() -> raylib::Color {
    return {static_cast<unsigned char>(GetRandomValue(colors::random_min, colors::random_max)),
            static_cast<unsigned char>(GetRandomValue(colors::random_min, colors::random_max)),
            static_cast<unsigned char>(GetRandomValue(colors::random_min, colors::random_max)), colors::alpha_opaque};
}

// Palette for the default three-body scenario, by body index.
inline auto three_body_palette() -> std::vector<raylib::Color> {
    return {raylib::Color{255, 0, 0, colors::alpha_opaque}, raylib::Color{0, 255, 0, colors::alpha_opaque},
            raylib::Color{0, 0, 255, colors::alpha_opaque}};
}

}  // namespace gravsim
