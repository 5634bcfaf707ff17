/**
 * @file device_discovery.cpp
 * @brief hasplint source file.
 */

#include "hasplint/discovery/device_discovery.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <unordered_set>
#include <utility>

#include "hasplint/core/resolution_catalog.hpp"

namespace hpl {
namespace {

// Entity-id role suffixes, tried in order; the first match is stripped.
const std::vector<std::string>& roleSuffixes() {
    static const std::vector<std::string> suffixes = {
        "_backlight", "_moodlight", "_status", "_antiburn", "_idle", "_page",
        "_restart", "_online", "_rssi", "_uptime", "_firmware", "_sensor",
    };
    return suffixes;
}

// Same roles as they appear at the end of friendly names (compared lowercase).
const std::vector<std::string>& roleWords() {
    static const std::vector<std::string> words = {
        "backlight", "moodlight", "status", "antiburn", "idle", "page",
        "restart", "online", "rssi", "uptime", "firmware", "sensor",
    };
    return words;
}

const std::vector<std::string>& candidateDomains() {
    static const std::vector<std::string> domains = {
        "light", "switch", "sensor", "binary_sensor", "number", "button", "select",
    };
    return domains;
}

const std::unordered_set<std::string>& onlineTokens() {
    static const std::unordered_set<std::string> tokens = {"on", "online", "connected", "available"};
    return tokens;
}

constexpr const char* kDeviceMarker = "openhasp";

std::string lowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trimCopy(std::string value) {
    value.erase(value.begin(),
                std::find_if(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
                value.end());
    return value;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::pair<std::string, std::string> splitEntityId(const std::string& entityId) {
    const auto dot = entityId.find('.');
    if (dot == std::string::npos) {
        return {std::string{}, entityId};
    }
    return {entityId.substr(0, dot), entityId.substr(dot + 1)};
}

std::optional<std::string> attribute(const StateRecord& record, const std::string& key) {
    const auto it = record.attributes.find(key);
    if (it == record.attributes.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::int32_t> parseDimension(const std::string& text) {
    try {
        std::size_t consumed = 0;
        const auto value = std::stol(text, &consumed, 10);
        if (consumed != text.size() || value <= 0 || value > 100000) {
            return std::nullopt;
        }
        return static_cast<std::int32_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// "width"/"height" attributes, or a "resolution" attribute such as "480x320".
std::optional<ScreenSize> resolutionHint(const StateRecord& record) {
    const auto width = attribute(record, "width");
    const auto height = attribute(record, "height");
    if (width && height) {
        const auto w = parseDimension(*width);
        const auto h = parseDimension(*height);
        if (w && h) {
            return ScreenSize{*w, *h};
        }
    }
    if (const auto text = attribute(record, "resolution")) {
        static const std::regex re("^\\s*(\\d+)\\s*[xX]\\s*(\\d+)\\s*$");
        std::smatch match;
        if (std::regex_match(*text, match, re)) {
            const auto w = parseDimension(match[1].str());
            const auto h = parseDimension(match[2].str());
            if (w && h) {
                return ScreenSize{*w, *h};
            }
        }
    }
    return std::nullopt;
}

bool hasDeviceMarker(const StateRecord& record) {
    if (lowerCopy(record.entityId).find(kDeviceMarker) != std::string::npos) {
        return true;
    }
    for (const auto& [key, value] : record.attributes) {
        if (lowerCopy(key).find(kDeviceMarker) != std::string::npos ||
            lowerCopy(value).find(kDeviceMarker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Integration bookkeeping (release channel toggles and the like).
bool isBookkeepingEntity(const std::string& objectId) {
    const auto lowered = lowerCopy(objectId);
    return lowered.find("prerelease") != std::string::npos ||
           lowered.find("pre_release") != std::string::npos ||
           lowered == kDeviceMarker;
}

struct Cluster {
    std::vector<std::string> entityIds;
    std::unordered_set<std::string> seen;
    std::vector<std::string> friendlyNames;
    std::string model;
    bool online = false;
    std::optional<ScreenSize> resolution;
};

} // namespace

bool DeviceDiscoveryEngine::isCandidate(const StateRecord& record) {
    const auto [domain, objectId] = splitEntityId(record.entityId);
    if (domain.empty() || objectId.empty()) {
        return false;
    }
    if (std::find(candidateDomains().begin(), candidateDomains().end(), domain) == candidateDomains().end()) {
        return false;
    }
    if (isBookkeepingEntity(objectId)) {
        return false;
    }

    static const std::regex namingConvention("^(plate|hasp)[a-z0-9]*(_[a-z0-9_]+)?$");
    return hasDeviceMarker(record) || std::regex_match(objectId, namingConvention);
}

std::string DeviceDiscoveryEngine::clusterKey(const std::string& entityId) {
    auto key = splitEntityId(entityId).second;
    for (const auto& suffix : roleSuffixes()) {
        if (key.size() > suffix.size() && endsWith(key, suffix)) {
            key.erase(key.size() - suffix.size());
            break;
        }
    }
    static const std::regex numericSuffix("_\\d+$");
    return std::regex_replace(key, numericSuffix, "");
}

std::string DeviceDiscoveryEngine::stripRoleWords(std::string name) {
    bool stripped = true;
    while (stripped) {
        stripped = false;
        name = trimCopy(std::move(name));
        const auto lowered = lowerCopy(name);
        for (const auto& word : roleWords()) {
            if (!endsWith(lowered, word)) {
                continue;
            }
            const auto start = name.size() - word.size();
            // Whole words only: "Plate Status" loses "Status", "Substatus" stays.
            if (start != 0 && !std::isspace(static_cast<unsigned char>(name[start - 1]))) {
                continue;
            }
            name.erase(start);
            stripped = true;
            break;
        }
    }
    return name;
}

std::string DeviceDiscoveryEngine::deriveDisplayName(const std::vector<std::string>& friendlyNames) {
    if (friendlyNames.empty()) {
        return {};
    }
    if (friendlyNames.size() == 1U) {
        return stripRoleWords(friendlyNames.front());
    }

    // After sorting, the common prefix of all names equals that of first and last.
    auto sorted = friendlyNames;
    std::sort(sorted.begin(), sorted.end());
    const auto& first = sorted.front();
    const auto& last = sorted.back();
    std::size_t length = 0;
    while (length < first.size() && length < last.size() && first[length] == last[length]) {
        ++length;
    }
    return stripRoleWords(first.substr(0, length));
}

std::vector<DeviceRecord> DeviceDiscoveryEngine::discover(const std::vector<StateRecord>& records,
                                                          IDeviceNameLookup* nameLookup) {
    const bool trace = (std::getenv("HPL_TRACE_DISCOVERY") != nullptr);

    std::map<std::string, Cluster> clusters;
    for (const auto& record : records) {
        if (!isCandidate(record)) {
            continue;
        }
        const auto key = clusterKey(record.entityId);
        if (key.empty()) {
            continue;
        }
        if (trace) {
            std::cerr << "[hpl-discovery] entity=" << record.entityId << " cluster=" << key << '\n';
        }

        auto& cluster = clusters[key];
        if (cluster.seen.insert(record.entityId).second) {
            cluster.entityIds.push_back(record.entityId);
        }
        if (const auto name = attribute(record, "friendly_name")) {
            cluster.friendlyNames.push_back(*name);
        }
        if (const auto model = attribute(record, "model")) {
            cluster.model = *model;
        }

        const auto objectId = splitEntityId(record.entityId).second;
        const bool isStatus = (objectId.find("status") != std::string::npos);
        if (isStatus && onlineTokens().count(lowerCopy(record.state)) != 0U) {
            cluster.online = true;
        }
        if (!cluster.resolution && (isStatus || objectId == key)) {
            cluster.resolution = resolutionHint(record);
        }
    }

    std::vector<DeviceRecord> devices;
    for (auto& [key, cluster] : clusters) {
        if (cluster.entityIds.size() <= 1U) {
            if (trace) {
                std::cerr << "[hpl-discovery] cluster=" << key << " dropped (single entity)\n";
            }
            continue;
        }

        DeviceRecord device;
        device.deviceId = key;
        device.model = cluster.model;
        device.online = cluster.online;
        device.resolution = cluster.resolution;
        device.entityRefs = cluster.entityIds;

        // Ask in sorted id order so the answer does not depend on snapshot order.
        std::optional<std::string> registryName;
        if (nameLookup != nullptr) {
            auto sortedIds = cluster.entityIds;
            std::sort(sortedIds.begin(), sortedIds.end());
            for (const auto& entityId : sortedIds) {
                registryName = nameLookup->deviceNameFor(entityId);
                if (registryName) {
                    break;
                }
            }
        }
        device.displayName = registryName ? *registryName : deriveDisplayName(cluster.friendlyNames);
        if (device.displayName.empty()) {
            device.displayName = key;
        }

        if (!device.resolution) {
            if (const auto match = ResolutionCatalog::matchModel(device.model)) {
                device.resolution = ScreenSize{match->width, match->height};
            }
        }

        if (trace) {
            std::cerr << "[hpl-discovery] device=" << device.deviceId
                      << " name=\"" << device.displayName << "\""
                      << " entities=" << device.entityRefs.size()
                      << " online=" << (device.online ? 1 : 0)
                      << " resolution=";
            if (device.resolution) {
                std::cerr << device.resolution->width << 'x' << device.resolution->height;
            } else {
                std::cerr << "unknown";
            }
            std::cerr << '\n';
        }
        devices.push_back(std::move(device));
    }
    return devices;
}

DiscoveryDeviceRegistry::DiscoveryDeviceRegistry(std::shared_ptr<IStateSource> stateSource,
                                                 std::shared_ptr<IDeviceNameLookup> nameLookup)
    : stateSource_(std::move(stateSource)), nameLookup_(std::move(nameLookup)) {}

bool DiscoveryDeviceRegistry::listDevices(std::vector<DeviceRecord>& outDevices, std::string& outError) {
    outError.clear();
    if (!stateSource_) {
        outError = "no state source configured";
        return false;
    }

    std::vector<StateRecord> records;
    std::string sourceError;
    if (!stateSource_->fetchStates(records, sourceError)) {
        outError = "state snapshot unavailable: " + sourceError;
        return false;
    }
    outDevices = DeviceDiscoveryEngine::discover(records, nameLookup_.get());
    return true;
}

} // namespace hpl
