#pragma once

#include <algorithm>

namespace WC {

struct Point {
    float x = 0.0f;
    float y = 0.0f;
};

// Axis-aligned rectangle with half-open extents: [x, x + width) x [y, y + height).
struct Rect {
    float x      = 0.0f;
    float y      = 0.0f;
    float width  = 0.0f;
    float height = 0.0f;

    [[nodiscard]] constexpr auto right() const -> float {
        return x + width;
    }

    [[nodiscard]] constexpr auto bottom() const -> float {
        return y + height;
    }

    // Zero or negative area rectangles never match any query.
    [[nodiscard]] constexpr auto empty() const -> bool {
        return !(width > 0.0f) || !(height > 0.0f);
    }

    [[nodiscard]] constexpr auto contains(float px, float py) const -> bool {
        if (empty()) {
            return false;
        }
        return px >= x && px < right() && py >= y && py < bottom();
    }

    [[nodiscard]] constexpr auto intersects(Rect const& other) const -> bool {
        if (empty() || other.empty()) {
            return false;
        }
        return x < other.right() && other.x < right() && y < other.bottom() && other.y < bottom();
    }

    [[nodiscard]] constexpr auto united(Rect const& other) const -> Rect {
        if (empty()) {
            return other;
        }
        if (other.empty()) {
            return *this;
        }
        auto const min_x = std::min(x, other.x);
        auto const min_y = std::min(y, other.y);
        auto const max_x = std::max(right(), other.right());
        auto const max_y = std::max(bottom(), other.bottom());
        return Rect{min_x, min_y, max_x - min_x, max_y - min_y};
    }

    constexpr auto operator==(Rect const&) const -> bool = default;
};

} // namespace WC
