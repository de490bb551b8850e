#pragma once

#include <cstddef>
#include <flecs.h>
#include <raylib-cpp.hpp>
#include <utility>
#include <vector>

#include "../core/Colors.hpp"
#include "Components.hpp"

// Per-body visual identity. Attached by the render layer; physics never reads it.
struct Tint {
    raylib::Color value;
};

namespace gravsim {

// Joins a palette to the bodies by BodyIndex. Bodies past the end of the
// palette get a random color.
inline void assign_tints(const flecs::world& w, const std::vector<raylib::Color>& palette) {
    std::vector<std::pair<flecs::entity, std::size_t>> bodies;
    w.each([&](const flecs::entity e, const BodyIndex& idx) { bodies.emplace_back(e, idx.value); });
    for (auto& [e, idx] : bodies) {
        e.set<Tint>({idx < palette.size() ? palette[idx] : random_nice_color()});
    }
}

}  // namespace gravsim
