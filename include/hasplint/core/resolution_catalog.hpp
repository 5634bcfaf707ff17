/**
 * @file resolution_catalog.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hpl {

/**
 * @brief Screen geometry of a known display model.
 */
struct DisplayResolution {
    /// Catalog key, e.g. "lanbon_l8".
    std::string key;
    std::int32_t width = 0;
    std::int32_t height = 0;
    /// Human-readable model label, e.g. "Lanbon L8".
    std::string label;
    std::string description;
};

/**
 * @brief Read-only, process-wide table of supported display models.
 *
 * The table is built once on first use and never mutated afterwards, so it is
 * safe to query from concurrent validation calls.
 */
class ResolutionCatalog {
public:
    /**
     * @brief Case-insensitive lookup by catalog key.
     */
    static std::optional<DisplayResolution> find(const std::string& modelKey);
    /**
     * @brief All catalog entries in declaration order.
     */
    static const std::vector<DisplayResolution>& all();
    /**
     * @brief Match a free-form model string against the model pattern table.
     *
     * The model text is lowercased and stripped of '-' and '_' before the
     * substring test. The first matching pattern wins.
     */
    static std::optional<DisplayResolution> matchModel(const std::string& modelText);
};

/**
 * @brief Lowercase and drop '-' / '_' characters.
 */
std::string normalizeModelText(const std::string& text);

} // namespace hpl
