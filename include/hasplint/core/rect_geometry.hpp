/**
 * @file rect_geometry.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <cstdint>

namespace hpl {

/**
 * @brief Axis-aligned rectangle in screen pixels.
 */
struct Rect {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t w = 0;
    std::int32_t h = 0;
};

/**
 * @brief Geometric predicates used by bounds and overlap checks.
 *
 * Intervals are half-open: a rectangle covers [x, x + w) horizontally and
 * [y, y + h) vertically, so rectangles that only share an edge do not overlap.
 */
class RectGeometry {
public:
    /**
     * @brief True when @p a and @p b share at least one interior pixel.
     */
    static bool overlaps(const Rect& a, const Rect& b) noexcept;
    /**
     * @brief True when @p inner lies fully inside a 0,0-anchored outer area.
     *
     * Exact fit on the right/bottom boundary is accepted.
     */
    static bool contains(const Rect& inner, std::int32_t outerWidth, std::int32_t outerHeight) noexcept;
};

} // namespace hpl
