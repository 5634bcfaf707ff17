/**
 * @file resolution_catalog.cpp
 * @brief hasplint source file.
 */

#include "hasplint/core/resolution_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace hpl {
namespace {

std::string lowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const std::vector<DisplayResolution>& catalog() {
    static const std::vector<DisplayResolution> entries = {
        {"lanbon_l8", 480, 320, "Lanbon L8", "Lanbon L8 3-gang switch"},
        {"lanbon_l8_hd", 800, 480, "Lanbon L8 HD", "Lanbon L8 HD high-resolution"},
        {"wt32_sc01", 320, 480, "WT32-SC01", "WT32-SC01 3.5\" display"},
        {"wt32_sc01_plus", 480, 320, "WT32-SC01 Plus", "WT32-SC01 Plus 3.5\" display"},
        {"esp32_2432s028r", 240, 320, "ESP32-2432S028R", "ESP32-2432S028R 2.8\" display (Cheap Yellow Display)"},
        {"esp32_3248s035c", 480, 320, "ESP32-3248S035C", "ESP32-3248S035C 3.5\" display"},
        {"esp32_4827s043", 480, 272, "ESP32-4827S043", "ESP32-4827S043 4.3\" display"},
        {"esp32_8048s070", 800, 480, "ESP32-8048S070", "ESP32-8048S070 7\" display"},
        {"freetouchdeck", 480, 320, "FreeTouchDeck", "FreeTouchDeck ESP32 touchscreen"},
        {"m5stack_core2", 320, 240, "M5Stack Core2", "M5Stack Core2 2\" display"},
        {"lilygo_t_display", 135, 240, "LILYGO T-Display", "LILYGO T-Display 1.14\" TFT"},
        {"small_portrait", 240, 320, "Small Portrait", "Generic small portrait (240x320)"},
        {"medium_portrait", 320, 480, "Medium Portrait", "Generic medium portrait (320x480)"},
        {"large_portrait", 480, 800, "Large Portrait", "Generic large portrait (480x800)"},
        {"small_landscape", 320, 240, "Small Landscape", "Generic small landscape (320x240)"},
        {"medium_landscape", 480, 320, "Medium Landscape", "Generic medium landscape (480x320)"},
        {"large_landscape", 800, 480, "Large Landscape", "Generic large landscape (800x480)"},
    };
    return entries;
}

// Normalized substring pattern -> catalog key. More specific models precede
// the models they extend ("lanbonl8hd" before "lanbonl8").
const std::vector<std::pair<std::string, std::string>>& modelPatterns() {
    static const std::vector<std::pair<std::string, std::string>> patterns = {
        {"lanbonl8hd", "lanbon_l8_hd"},
        {"lanbonl8", "lanbon_l8"},
        {"wt32sc01plus", "wt32_sc01_plus"},
        {"wt32sc01", "wt32_sc01"},
        {"esp322432s028r", "esp32_2432s028r"},
        {"2432s028", "esp32_2432s028r"},
        {"esp323248s035c", "esp32_3248s035c"},
        {"3248s035", "esp32_3248s035c"},
        {"esp324827s043", "esp32_4827s043"},
        {"esp328048s070", "esp32_8048s070"},
        {"freetouchdeck", "freetouchdeck"},
        {"m5stackcore2", "m5stack_core2"},
        {"lilygotdisplay", "lilygo_t_display"},
    };
    return patterns;
}

} // namespace

std::string normalizeModelText(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    for (const unsigned char c : text) {
        if (c == '-' || c == '_') {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(c)));
    }
    return normalized;
}

std::optional<DisplayResolution> ResolutionCatalog::find(const std::string& modelKey) {
    const auto key = lowerCopy(modelKey);
    for (const auto& entry : catalog()) {
        if (entry.key == key) {
            return entry;
        }
    }
    return std::nullopt;
}

const std::vector<DisplayResolution>& ResolutionCatalog::all() { return catalog(); }

std::optional<DisplayResolution> ResolutionCatalog::matchModel(const std::string& modelText) {
    const auto normalized = normalizeModelText(modelText);
    if (normalized.empty()) {
        return std::nullopt;
    }
    for (const auto& [pattern, key] : modelPatterns()) {
        if (normalized.find(pattern) != std::string::npos) {
            return find(key);
        }
    }
    return std::nullopt;
}

} // namespace hpl
