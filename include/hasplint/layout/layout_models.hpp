/**
 * @file layout_models.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "hasplint/core/rect_geometry.hpp"

namespace hpl {

/**
 * @brief Closed set of layout record kinds.
 */
enum class ObjectKind { Page, Button, Label, Slider, Checkbox, Switch, Dropdown };

/**
 * @brief One strongly-typed page or widget record of a layout.
 */
struct LayoutObject {
    /// Object id; absent ids are tolerated and skipped by the id check.
    std::optional<std::int32_t> id;
    ObjectKind kind = ObjectKind::Button;
    /// Page index the object lives on.
    std::int32_t page = 0;
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t w = 0;
    std::int32_t h = 0;
    /// Bound external entity, e.g. "light.kitchen".
    std::optional<std::string> entityRef;

    bool isPage() const noexcept { return kind == ObjectKind::Page; }
    Rect bounds() const noexcept { return Rect{x, y, w, h}; }
};

/**
 * @brief Ordered layout as supplied by the caller.
 */
using Layout = std::vector<LayoutObject>;

const char* toString(ObjectKind kind);
/**
 * @brief Parse an openHASP object tag ("btn", "label", ...), case-insensitive.
 */
std::optional<ObjectKind> parseObjectKind(const std::string& text);

/**
 * @brief Ingestion boundary from flat JSON records to `LayoutObject`.
 *
 * Records are openHASP JSONL lines such as
 * `{"page":1,"id":3,"obj":"btn","x":10,"y":10,"w":100,"h":50,"entity":"light.a"}`.
 * Every field is checked once here so validation stages work on typed values.
 */
class LayoutParser {
public:
    /**
     * @brief Parse a single JSON object line.
     * @return Parsed object, or std::nullopt with @p outError filled.
     */
    static std::optional<LayoutObject> parseObjectLine(const std::string& jsonLine, std::string& outError);
    /**
     * @brief Parse a JSONL document; blank lines are ignored.
     *
     * @param text Document text.
     * @param outLayout Parsed objects on success.
     * @param outError "line N: <reason>" for the first malformed record.
     * @return true if every non-blank line parsed.
     */
    static bool parseLayout(const std::string& text, Layout& outLayout, std::string& outError);
};

} // namespace hpl
