/**
 * @file overlap_detector.cpp
 * @brief hasplint source file.
 */

#include "hasplint/validation/validation_stages.hpp"

#include <algorithm>
#include <map>
#include <sstream>

#include "hasplint/core/rect_geometry.hpp"

namespace hpl {
namespace {

std::string idText(const std::optional<std::int32_t>& id) {
    return id ? std::to_string(*id) : std::string("<no id>");
}

std::optional<std::int32_t> lowerId(const std::optional<std::int32_t>& a, const std::optional<std::int32_t>& b) {
    if (a && b) {
        return std::min(*a, *b);
    }
    return a ? a : b;
}

} // namespace

std::vector<ValidationWarning> OverlapDetector::detect(const Layout& layout) {
    std::map<std::int32_t, std::vector<const LayoutObject*>> byPage;
    for (const auto& object : layout) {
        if (object.isPage()) {
            continue;
        }
        byPage[object.page].push_back(&object);
    }

    std::vector<ValidationWarning> warnings;
    for (const auto& [page, objects] : byPage) {
        for (std::size_t i = 0; i < objects.size(); ++i) {
            for (std::size_t j = i + 1; j < objects.size(); ++j) {
                const auto& a = *objects[i];
                const auto& b = *objects[j];
                if (!RectGeometry::overlaps(a.bounds(), b.bounds())) {
                    continue;
                }
                std::ostringstream os;
                os << "Objects " << idText(a.id) << " and " << idText(b.id) << " overlap on page " << page;
                warnings.push_back({WarningKind::Overlap, os.str(), lowerId(a.id, b.id), std::nullopt});
            }
        }
    }
    return warnings;
}

} // namespace hpl
