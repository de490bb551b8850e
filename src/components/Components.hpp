#pragma once

#include <cstddef>
#include <deque>

#include "../core/Math.hpp"

// Physics components. Rendering metadata lives in Tint.hpp.
struct Position {
    DVec2 value;
};
struct Velocity {
    DVec2 value;
};
struct Mass {
    float value;
};

// Slot of the body in its scenario's body list; the engine iterates in this order.
struct BodyIndex {
    std::size_t value;
};

// Trail history per entity
struct Trail {
    std::deque<DVec2> points;
};
