#pragma once

#include <cmath>

struct DVec2 {
    double x{0.0};
    double y{0.0};

    double magnitude() const { return std::sqrt(x * x + y * y); }

    // Unit vector in the same direction. A zero vector is returned as is so
    // that coincident bodies never produce NaN.
    DVec2 normalized() const {
        const double mag = magnitude();
        if (mag == 0.0) return *this;
        return {x / mag, y / mag};
    }
};

inline DVec2 operator+(const DVec2& a, const DVec2& b) { return {a.x + b.x, a.y + b.y}; }
inline DVec2 operator-(const DVec2& a, const DVec2& b) { return {a.x - b.x, a.y - b.y}; }
inline DVec2 operator*(const DVec2& a, double s) { return {a.x * s, a.y * s}; }
inline DVec2 operator*(double s, const DVec2& a) { return {a.x * s, a.y * s}; }
inline DVec2 operator/(const DVec2& a, double s) { return {a.x / s, a.y / s}; }
inline bool operator==(const DVec2& a, const DVec2& b) { return a.x == b.x && a.y == b.y; }
inline DVec2& operator+=(DVec2& a, const DVec2& b) {
    a.x += b.x;
    a.y += b.y;
    return a;
}
inline DVec2& operator-=(DVec2& a, const DVec2& b) {
    a.x -= b.x;
    a.y -= b.y;
    return a;
}
inline DVec2& operator*=(DVec2& a, double s) {
    a.x *= s;
    a.y *= s;
    return a;
}

inline double dot(const DVec2& a, const DVec2& b) { return a.x * b.x + a.y * b.y; }
inline double length2(const DVec2& a) { return dot(a, a); }
inline bool is_finite(const DVec2& a) { return std::isfinite(a.x) && std::isfinite(a.y); }
