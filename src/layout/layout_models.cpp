/**
 * @file layout_models.cpp
 * @brief hasplint source file.
 */

#include "hasplint/layout/layout_models.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace hpl {
namespace {

// Raw value for "key": either a quoted string or a bare token up to ',' or '}'.
std::optional<std::string> field(const std::string& json, const std::string& key) {
    const std::regex re("\"" + key + "\"\\s*:\\s*(\"([^\"]*)\"|[^,\\}\\s]+)");
    std::smatch match;
    if (!std::regex_search(json, match, re) || match.size() < 3) {
        return std::nullopt;
    }
    if (match[2].matched) {
        return match[2].str();
    }
    return match[1].str();
}

std::int32_t parseInt(const std::string& key, const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument("field '" + key + "' is not an integer: " + value);
    }
    if (consumed != value.size() ||
        parsed < std::numeric_limits<std::int32_t>::min() ||
        parsed > std::numeric_limits<std::int32_t>::max()) {
        throw std::invalid_argument("field '" + key + "' is not an integer: " + value);
    }
    return static_cast<std::int32_t>(parsed);
}

std::int32_t optionalInt(const std::string& json, const std::string& key) {
    const auto raw = field(json, key);
    if (!raw || *raw == "null") {
        return 0;
    }
    return parseInt(key, *raw);
}

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

const char* toString(ObjectKind kind) {
    switch (kind) {
    case ObjectKind::Page:
        return "page";
    case ObjectKind::Button:
        return "btn";
    case ObjectKind::Label:
        return "label";
    case ObjectKind::Slider:
        return "slider";
    case ObjectKind::Checkbox:
        return "checkbox";
    case ObjectKind::Switch:
        return "switch";
    case ObjectKind::Dropdown:
        return "dropdown";
    }
    return "unknown";
}

std::optional<ObjectKind> parseObjectKind(const std::string& text) {
    std::string normalized = text;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalized == "page") {
        return ObjectKind::Page;
    }
    if (normalized == "btn" || normalized == "button") {
        return ObjectKind::Button;
    }
    if (normalized == "label") {
        return ObjectKind::Label;
    }
    if (normalized == "slider") {
        return ObjectKind::Slider;
    }
    if (normalized == "checkbox") {
        return ObjectKind::Checkbox;
    }
    if (normalized == "switch") {
        return ObjectKind::Switch;
    }
    if (normalized == "dropdown" || normalized == "dropdown_list") {
        return ObjectKind::Dropdown;
    }
    return std::nullopt;
}

std::optional<LayoutObject> LayoutParser::parseObjectLine(const std::string& jsonLine, std::string& outError) {
    outError.clear();
    try {
        const auto obj = field(jsonLine, "obj");
        if (!obj) {
            outError = "missing \"obj\" field";
            return std::nullopt;
        }
        const auto kind = parseObjectKind(*obj);
        if (!kind) {
            outError = "unsupported object kind: " + *obj;
            return std::nullopt;
        }

        LayoutObject object;
        object.kind = *kind;
        if (const auto id = field(jsonLine, "id"); id && *id != "null") {
            object.id = parseInt("id", *id);
        }
        object.page = optionalInt(jsonLine, "page");
        object.x = optionalInt(jsonLine, "x");
        object.y = optionalInt(jsonLine, "y");
        object.w = optionalInt(jsonLine, "w");
        object.h = optionalInt(jsonLine, "h");

        auto entity = field(jsonLine, "entity");
        if (!entity) {
            entity = field(jsonLine, "entity_id");
        }
        if (entity && !entity->empty() && *entity != "null") {
            object.entityRef = *entity;
        }
        return object;
    } catch (const std::exception& ex) {
        outError = ex.what();
        return std::nullopt;
    }
}

bool LayoutParser::parseLayout(const std::string& text, Layout& outLayout, std::string& outError) {
    outLayout.clear();
    outError.clear();

    std::istringstream input(text);
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (isBlank(line)) {
            continue;
        }
        std::string lineError;
        auto object = parseObjectLine(line, lineError);
        if (!object) {
            outError = "line " + std::to_string(lineNumber) + ": " + lineError;
            outLayout.clear();
            return false;
        }
        outLayout.push_back(std::move(*object));
    }
    return true;
}

} // namespace hpl
