/**
 * @file device_manifest_loader.cpp
 * @brief hasplint source file.
 */

#include "hasplint/config/device_manifest_loader.hpp"

#include <fstream>
#include <limits>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "hasplint/core/resolution_catalog.hpp"

namespace hpl {
namespace {

bool readFile(const std::string& path, std::string& out, std::string& outError) {
    std::ifstream file(path);
    if (!file) {
        outError = "Cannot open file: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

std::optional<std::string> stringField(const std::string& entry, const std::string& key) {
    const std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
    std::smatch match;
    if (!std::regex_search(entry, match, re)) {
        return std::nullopt;
    }
    return match[1].str();
}

std::optional<std::string> bareField(const std::string& entry, const std::string& key) {
    const std::regex re("\"" + key + "\"\\s*:\\s*([^,\\}\\]\\s\"]+)");
    std::smatch match;
    if (!std::regex_search(entry, match, re)) {
        return std::nullopt;
    }
    return match[1].str();
}

std::int32_t parseDimension(const std::string& key, const std::string& text) {
    std::size_t consumed = 0;
    const auto value = std::stoll(text, &consumed, 10);
    if (consumed != text.size() || value <= 0 || value > std::numeric_limits<std::int32_t>::max()) {
        throw std::invalid_argument("invalid " + key + ": " + text);
    }
    return static_cast<std::int32_t>(value);
}

std::vector<std::string> entityList(const std::string& entry) {
    std::vector<std::string> entities;
    const std::regex listRe("\"entities\"\\s*:\\s*\\[([^\\]]*)\\]");
    std::smatch list;
    if (!std::regex_search(entry, list, listRe)) {
        return entities;
    }
    const std::string body = list[1].str();
    const std::regex itemRe("\"([^\"]+)\"");
    std::unordered_set<std::string> seen;
    for (std::sregex_iterator it(body.begin(), body.end(), itemRe), end; it != end; ++it) {
        auto id = (*it)[1].str();
        if (seen.insert(id).second) {
            entities.push_back(std::move(id));
        }
    }
    return entities;
}

DeviceRecord parseEntry(const std::string& entry, const std::string& deviceId) {
    DeviceRecord device;
    device.deviceId = deviceId;
    device.displayName = stringField(entry, "name").value_or(std::string{});
    device.model = stringField(entry, "model").value_or(std::string{});
    device.entityRefs = entityList(entry);

    device.online = true;
    if (const auto online = bareField(entry, "online")) {
        if (*online == "false") {
            device.online = false;
        } else if (*online != "true") {
            throw std::invalid_argument("invalid online flag for '" + deviceId + "': " + *online);
        }
    }

    const auto width = bareField(entry, "width");
    const auto height = bareField(entry, "height");
    if (width && height) {
        device.resolution = ScreenSize{parseDimension("width", *width), parseDimension("height", *height)};
    } else if (const auto modelKey = stringField(entry, "modelKey")) {
        const auto known = ResolutionCatalog::find(*modelKey);
        if (!known) {
            throw std::invalid_argument("unknown modelKey for '" + deviceId + "': " + *modelKey);
        }
        device.resolution = ScreenSize{known->width, known->height};
    } else if (const auto match = ResolutionCatalog::matchModel(device.model)) {
        device.resolution = ScreenSize{match->width, match->height};
    }
    return device;
}

} // namespace

bool DeviceManifestLoader::loadFromJsonText(const std::string& json,
                                            std::vector<DeviceRecord>& outDevices,
                                            std::string& outError) {
    outDevices.clear();
    outError.clear();

    try {
        // Flat device objects: no nested braces, "entities" is a plain array.
        const std::regex entryRe("\\{[^\\{\\}]*\"deviceId\"[^\\{\\}]*\\}");
        std::unordered_set<std::string> ids;
        for (std::sregex_iterator it(json.begin(), json.end(), entryRe), end; it != end; ++it) {
            const auto entry = it->str();
            const auto deviceId = stringField(entry, "deviceId");
            if (!deviceId || deviceId->empty()) {
                outError = "Device entry without deviceId";
                outDevices.clear();
                return false;
            }
            if (!ids.insert(*deviceId).second) {
                outError = "Duplicate deviceId in manifest: " + *deviceId;
                outDevices.clear();
                return false;
            }
            outDevices.push_back(parseEntry(entry, *deviceId));
        }

        if (outDevices.empty()) {
            outError = "No device entries found in manifest";
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        outError = std::string("Device manifest parse error: ") + ex.what();
        outDevices.clear();
        return false;
    }
}

bool DeviceManifestLoader::loadFromJsonFile(const std::string& filePath,
                                            std::vector<DeviceRecord>& outDevices,
                                            std::string& outError) {
    outDevices.clear();
    outError.clear();

    std::string json;
    if (!readFile(filePath, json, outError)) {
        return false;
    }
    return loadFromJsonText(json, outDevices, outError);
}

} // namespace hpl
