#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace udmis {

// Vertex index into the ordered point sequence
using Index = int;

// 2D point / vector
struct Vec2 {
    double x{0.0};
    double y{0.0};

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    [[nodiscard]] constexpr Vec2 operator+(const Vec2& other) const {
        return Vec2{x + other.x, y + other.y};
    }

    [[nodiscard]] constexpr Vec2 operator-(const Vec2& other) const {
        return Vec2{x - other.x, y - other.y};
    }

    [[nodiscard]] constexpr Vec2 operator*(double scalar) const {
        return Vec2{x * scalar, y * scalar};
    }

    [[nodiscard]] double length() const {
        return std::sqrt(x * x + y * y);
    }

    [[nodiscard]] constexpr double length_squared() const {
        return x * x + y * y;
    }

    [[nodiscard]] double distance(const Vec2& other) const {
        return (*this - other).length();
    }

    [[nodiscard]] constexpr double distance_squared(const Vec2& other) const {
        return (*this - other).length_squared();
    }

    [[nodiscard]] bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y);
    }

    [[nodiscard]] constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }
};

[[nodiscard]] inline constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

// Axis-aligned bounding box
struct AABB {
    Vec2 min{std::numeric_limits<double>::max(), std::numeric_limits<double>::max()};
    Vec2 max{std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};

    constexpr AABB() = default;
    constexpr AABB(const Vec2& min_, const Vec2& max_) : min(min_), max(max_) {}

    static AABB of(const std::vector<Vec2>& points) {
        AABB box;
        for (const auto& p : points) box.expand(p);
        return box;
    }

    void expand(const Vec2& point) {
        min.x = std::min(min.x, point.x);
        min.y = std::min(min.y, point.y);
        max.x = std::max(max.x, point.x);
        max.y = std::max(max.y, point.y);
    }

    [[nodiscard]] bool empty() const {
        return min.x > max.x || min.y > max.y;
    }

    [[nodiscard]] Vec2 size() const {
        return Vec2{max.x - min.x, max.y - min.y};
    }

    [[nodiscard]] bool contains(const Vec2& point) const {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y;
    }
};

// Radius of the unit disk
constexpr double UNIT_DISK_RADIUS = 1.0;

}  // namespace udmis
