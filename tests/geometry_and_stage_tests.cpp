/**
 * @file geometry_and_stage_tests.cpp
 * @brief hasplint source file.
 */

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "hasplint/core/rect_geometry.hpp"
#include "hasplint/core/resolution_catalog.hpp"
#include "hasplint/layout/layout_models.hpp"
#include "hasplint/validation/validation_stages.hpp"

namespace {

hpl::LayoutObject widget(std::int32_t id, std::int32_t page, std::int32_t x, std::int32_t y,
                         std::int32_t w, std::int32_t h) {
    hpl::LayoutObject object;
    object.id = id;
    object.kind = hpl::ObjectKind::Button;
    object.page = page;
    object.x = x;
    object.y = y;
    object.w = w;
    object.h = h;
    return object;
}

hpl::LayoutObject pageMarker(std::int32_t id, std::int32_t page) {
    hpl::LayoutObject object;
    object.id = id;
    object.kind = hpl::ObjectKind::Page;
    object.page = page;
    return object;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

void testRectangleOverlap() {
    const std::vector<hpl::Rect> rects = {
        {0, 0, 100, 50}, {50, 25, 100, 50}, {100, 0, 10, 50}, {0, 50, 100, 10},
        {200, 200, 5, 5}, {-10, -10, 20, 20}, {10, 10, 0, 0},
    };
    for (const auto& a : rects) {
        for (const auto& b : rects) {
            assert(hpl::RectGeometry::overlaps(a, b) == hpl::RectGeometry::overlaps(b, a));
        }
    }

    // Shared vertical edge.
    assert(!hpl::RectGeometry::overlaps({0, 0, 100, 50}, {100, 0, 100, 50}));
    // Shared horizontal edge.
    assert(!hpl::RectGeometry::overlaps({0, 0, 100, 50}, {0, 50, 100, 50}));
    // One interior pixel in common.
    assert(hpl::RectGeometry::overlaps({0, 0, 100, 50}, {99, 49, 10, 10}));
    // Containment and identity.
    assert(hpl::RectGeometry::overlaps({0, 0, 100, 50}, {10, 10, 5, 5}));
    assert(hpl::RectGeometry::overlaps({0, 0, 100, 50}, {0, 0, 100, 50}));
    assert(!hpl::RectGeometry::overlaps({0, 0, 10, 10}, {200, 200, 10, 10}));
}

void testContainment() {
    assert(hpl::RectGeometry::contains({0, 0, 480, 320}, 480, 320));
    assert(!hpl::RectGeometry::contains({1, 0, 480, 320}, 480, 320));
    assert(!hpl::RectGeometry::contains({0, 1, 480, 320}, 480, 320));
    assert(!hpl::RectGeometry::contains({-1, 0, 10, 10}, 480, 320));
    assert(!hpl::RectGeometry::contains({0, -1, 10, 10}, 480, 320));
}

void testValidateCoordinates() {
    assert(!hpl::validateCoordinates(0, 0, 480, 320, 480, 320).has_value());

    const auto negative = hpl::validateCoordinates(-1, 0, 10, 10, 480, 320);
    assert(negative.has_value());
    assert(contains(*negative, "negative"));

    const auto width = hpl::validateCoordinates(400, 0, 100, 10, 480, 320);
    assert(width.has_value());
    assert(contains(*width, "width"));
    assert(contains(*width, "500 > 480"));

    const auto height = hpl::validateCoordinates(10, 300, 100, 50, 480, 320);
    assert(height.has_value());
    assert(contains(*height, "height"));
    assert(contains(*height, "350 > 320"));

    // Negative origin wins over the extent checks.
    const auto both = hpl::validateCoordinates(-5, 0, 1000, 1000, 480, 320);
    assert(both.has_value());
    assert(contains(*both, "negative"));
    assert(!contains(*both, "width"));

    // Width wins over height.
    const auto wide = hpl::validateCoordinates(0, 0, 500, 500, 480, 320);
    assert(wide.has_value());
    assert(contains(*wide, "width"));
}

void testCoordinateStage() {
    const hpl::ScreenSize screen{480, 320};
    const hpl::Layout layout = {
        pageMarker(0, 1),
        widget(1, 1, 10, 10, 100, 50),
        widget(2, 1, 400, 10, 100, 50),
        widget(3, 1, 10, 300, 100, 50),
        widget(4, 1, -10, 10, 100, 50),
    };

    const auto errors = hpl::CoordinateValidator::validate(layout, screen);
    assert(errors.size() == 3U);
    assert(errors[0].kind == hpl::ErrorKind::Coordinate);
    assert(errors[0].objectId == 2);
    assert(contains(errors[0].message, "width"));
    assert(contains(errors[0].message, "Object 2"));
    assert(errors[1].objectId == 3);
    assert(contains(errors[1].message, "height"));
    assert(errors[2].objectId == 4);
    assert(contains(errors[2].message, "negative"));

    // Page markers carry no geometry and are never checked.
    const hpl::Layout pagesOnly = {pageMarker(0, 1), pageMarker(0, 2)};
    assert(hpl::CoordinateValidator::validate(pagesOnly, {1, 1}).empty());
}

void testObjectIdStage() {
    const hpl::Layout unique = {widget(1, 1, 0, 0, 1, 1), widget(2, 1, 0, 0, 1, 1), widget(3, 1, 0, 0, 1, 1)};
    assert(hpl::ObjectIdUniquenessChecker::validate(unique).empty());

    const hpl::Layout duplicate = {widget(1, 1, 0, 0, 1, 1), widget(2, 1, 0, 0, 1, 1), widget(1, 1, 0, 0, 1, 1)};
    const auto errors = hpl::ObjectIdUniquenessChecker::validate(duplicate);
    assert(errors.size() == 1U);
    assert(errors[0].kind == hpl::ErrorKind::ObjectId);
    assert(errors[0].objectId == 1);
    assert(contains(errors[0].message, "Duplicate"));

    // One error per repeated occurrence, not per pair.
    const hpl::Layout triple = {widget(7, 1, 0, 0, 1, 1), widget(7, 1, 0, 0, 1, 1), widget(7, 1, 0, 0, 1, 1)};
    assert(hpl::ObjectIdUniquenessChecker::validate(triple).size() == 2U);

    hpl::LayoutObject anonymous = widget(0, 1, 0, 0, 1, 1);
    anonymous.id.reset();
    const hpl::Layout withAnonymous = {anonymous, anonymous, widget(1, 1, 0, 0, 1, 1)};
    assert(hpl::ObjectIdUniquenessChecker::validate(withAnonymous).empty());
}

void testOverlapStage() {
    // Two identical objects: one duplicate-id error and one overlap warning.
    const hpl::Layout twins = {widget(1, 1, 0, 0, 100, 50), widget(1, 1, 0, 0, 100, 50)};
    assert(hpl::ObjectIdUniquenessChecker::validate(twins).size() == 1U);
    const auto twinWarnings = hpl::OverlapDetector::detect(twins);
    assert(twinWarnings.size() == 1U);
    assert(twinWarnings[0].kind == hpl::WarningKind::Overlap);

    const hpl::Layout edges = {widget(1, 1, 0, 0, 100, 50), widget(2, 1, 100, 0, 100, 50)};
    assert(hpl::OverlapDetector::detect(edges).empty());

    const hpl::Layout pages = {widget(1, 1, 0, 0, 100, 50), widget(2, 2, 0, 0, 100, 50)};
    assert(hpl::OverlapDetector::detect(pages).empty());

    const hpl::Layout withPageMarker = {pageMarker(0, 1), widget(1, 1, 0, 0, 100, 50)};
    assert(hpl::OverlapDetector::detect(withPageMarker).empty());

    // Warning is attributed to the lower id and names both ids and the page.
    const hpl::Layout partial = {widget(9, 3, 50, 25, 100, 50), widget(4, 3, 0, 0, 100, 50)};
    const auto partialWarnings = hpl::OverlapDetector::detect(partial);
    assert(partialWarnings.size() == 1U);
    assert(partialWarnings[0].objectId == 4);
    assert(contains(partialWarnings[0].message, "9"));
    assert(contains(partialWarnings[0].message, "4"));
    assert(contains(partialWarnings[0].message, "page 3"));

    // Three mutually overlapping objects yield C(3,2) warnings.
    const hpl::Layout stack = {widget(1, 1, 0, 0, 50, 50), widget(2, 1, 10, 10, 50, 50), widget(3, 1, 20, 20, 50, 50)};
    assert(hpl::OverlapDetector::detect(stack).size() == 3U);

    // Pages are reported in ascending order regardless of input order.
    const hpl::Layout multiPage = {
        widget(10, 2, 0, 0, 10, 10), widget(11, 2, 5, 5, 10, 10),
        widget(20, 1, 0, 0, 10, 10), widget(21, 1, 5, 5, 10, 10),
    };
    const auto ordered = hpl::OverlapDetector::detect(multiPage);
    assert(ordered.size() == 2U);
    assert(ordered[0].objectId == 20);
    assert(ordered[1].objectId == 10);
}

void testResolutionCatalog() {
    const auto lanbon = hpl::ResolutionCatalog::find("lanbon_l8");
    assert(lanbon.has_value());
    assert(lanbon->width == 480);
    assert(lanbon->height == 320);
    assert(lanbon->label == "Lanbon L8");

    const auto upper = hpl::ResolutionCatalog::find("LANBON_L8");
    assert(upper.has_value());
    assert(upper->key == "lanbon_l8");

    assert(!hpl::ResolutionCatalog::find("unknown_model").has_value());
    assert(hpl::ResolutionCatalog::all().size() == 17U);

    const auto wt32 = hpl::ResolutionCatalog::matchModel("WT32-SC01");
    assert(wt32.has_value());
    assert(wt32->width == 320 && wt32->height == 480);

    const auto plus = hpl::ResolutionCatalog::matchModel("wt32-sc01-plus");
    assert(plus.has_value());
    assert(plus->key == "wt32_sc01_plus");

    // Spaces survive normalization, so spaced model names do not match.
    assert(!hpl::ResolutionCatalog::matchModel("Lanbon L8-HD").has_value());
    const auto hdCompact = hpl::ResolutionCatalog::matchModel("lanbon_l8_hd");
    assert(hdCompact.has_value());
    assert(hdCompact->key == "lanbon_l8_hd");

    assert(!hpl::ResolutionCatalog::matchModel("").has_value());
    assert(!hpl::ResolutionCatalog::matchModel("Sonoff NSPanel").has_value());
    assert(hpl::normalizeModelText("ESP32-3248S035C") == "esp323248s035c");
}

} // namespace

int main() {
    testRectangleOverlap();
    testContainment();
    testValidateCoordinates();
    testCoordinateStage();
    testObjectIdStage();
    testOverlapStage();
    testResolutionCatalog();
    std::cout << "geometry_and_stage_tests passed\n";
    return 0;
}
