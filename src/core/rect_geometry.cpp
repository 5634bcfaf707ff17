/**
 * @file rect_geometry.cpp
 * @brief hasplint source file.
 */

#include "hasplint/core/rect_geometry.hpp"

namespace hpl {

bool RectGeometry::overlaps(const Rect& a, const Rect& b) noexcept {
    // 64-bit sums so extreme coordinates cannot wrap.
    const auto aRight = static_cast<std::int64_t>(a.x) + a.w;
    const auto aBottom = static_cast<std::int64_t>(a.y) + a.h;
    const auto bRight = static_cast<std::int64_t>(b.x) + b.w;
    const auto bBottom = static_cast<std::int64_t>(b.y) + b.h;

    return !(aRight <= b.x ||
             bRight <= a.x ||
             aBottom <= b.y ||
             bBottom <= a.y);
}

bool RectGeometry::contains(const Rect& inner, std::int32_t outerWidth, std::int32_t outerHeight) noexcept {
    if (inner.x < 0 || inner.y < 0) {
        return false;
    }
    return static_cast<std::int64_t>(inner.x) + inner.w <= outerWidth &&
           static_cast<std::int64_t>(inner.y) + inner.h <= outerHeight;
}

} // namespace hpl
