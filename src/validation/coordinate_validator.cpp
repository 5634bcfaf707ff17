/**
 * @file coordinate_validator.cpp
 * @brief hasplint source file.
 */

#include "hasplint/validation/validation_stages.hpp"

#include <sstream>

#include "hasplint/core/rect_geometry.hpp"

namespace hpl {

std::optional<std::string> validateCoordinates(std::int32_t x, std::int32_t y,
                                               std::int32_t width, std::int32_t height,
                                               std::int32_t deviceWidth, std::int32_t deviceHeight) {
    const Rect rect{x, y, width, height};
    if (RectGeometry::contains(rect, deviceWidth, deviceHeight)) {
        return std::nullopt;
    }

    std::ostringstream os;
    if (x < 0 || y < 0) {
        os << "Coordinates cannot be negative: x=" << x << ", y=" << y;
        return os.str();
    }
    const auto right = static_cast<std::int64_t>(x) + width;
    if (right > deviceWidth) {
        os << "Object extends beyond screen width: " << right << " > " << deviceWidth;
        return os.str();
    }
    os << "Object extends beyond screen height: " << (static_cast<std::int64_t>(y) + height)
       << " > " << deviceHeight;
    return os.str();
}

std::vector<ValidationError> CoordinateValidator::validate(const Layout& layout, const ScreenSize& screen) {
    std::vector<ValidationError> errors;
    for (const auto& object : layout) {
        if (object.isPage()) {
            continue;
        }
        const auto violation = validateCoordinates(object.x, object.y, object.w, object.h,
                                                   screen.width, screen.height);
        if (!violation) {
            continue;
        }

        std::ostringstream os;
        if (object.id) {
            os << "Object " << *object.id << ": ";
        } else {
            os << "Object without id on page " << object.page << ": ";
        }
        os << *violation;
        errors.push_back({ErrorKind::Coordinate, os.str(), object.id, std::nullopt});
    }
    return errors;
}

} // namespace hpl
