/**
 * @file validation_types.cpp
 * @brief hasplint source file.
 */

#include "hasplint/validation/validation_types.hpp"

#include <algorithm>
#include <cctype>

namespace hpl {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Device:
        return "device";
    case ErrorKind::Entity:
        return "entity";
    case ErrorKind::Coordinate:
        return "coordinate";
    case ErrorKind::ObjectId:
        return "object_id";
    }
    return "unknown";
}

const char* toString(WarningKind kind) {
    switch (kind) {
    case WarningKind::Overlap:
        return "overlap";
    case WarningKind::Entity:
        return "entity";
    }
    return "unknown";
}

std::optional<ErrorKind> parseErrorKind(const std::string& text) {
    std::string normalized = text;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalized == "device") {
        return ErrorKind::Device;
    }
    if (normalized == "entity") {
        return ErrorKind::Entity;
    }
    if (normalized == "coordinate") {
        return ErrorKind::Coordinate;
    }
    if (normalized == "object_id" || normalized == "objectid") {
        return ErrorKind::ObjectId;
    }
    return std::nullopt;
}

} // namespace hpl
