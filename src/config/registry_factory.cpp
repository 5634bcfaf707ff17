/**
 * @file registry_factory.cpp
 * @brief hasplint source file.
 */

#include "hasplint/config/registry_factory.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

#include "hasplint/config/device_manifest_loader.hpp"
#include "hasplint/discovery/device_discovery.hpp"
#include "hasplint/external/static_device_registry.hpp"

namespace hpl {
namespace {

std::string trimCopy(std::string value) {
    value.erase(value.begin(),
                std::find_if(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
                value.end());
    return value;
}

} // namespace

bool RegistryFactory::parseRegistrySpec(const std::string& spec,
                                        RegistryFactoryConfig& outConfig,
                                        std::string& outError) {
    outError.clear();
    const auto trimmed = trimCopy(spec);
    if (trimmed.empty()) {
        outError = "registry spec is empty";
        return false;
    }

    if (trimmed == "discovery") {
        outConfig.kind = RegistryKind::Discovery;
        outConfig.manifestPath.clear();
        return true;
    }

    constexpr const char* kManifestPrefix = "manifest:";
    if (trimmed.rfind(kManifestPrefix, 0) == 0) {
        outConfig.kind = RegistryKind::Manifest;
        outConfig.manifestPath = trimCopy(trimmed.substr(9));
        if (outConfig.manifestPath.empty()) {
            outError = "manifest registry requires a path, e.g. manifest:/etc/hasplint/devices.json";
            return false;
        }
        return true;
    }

    outError = "unsupported registry spec '" + spec + "', expected 'discovery' or 'manifest:<path>'";
    return false;
}

std::shared_ptr<IDeviceRegistry> RegistryFactory::create(const RegistryFactoryConfig& config,
                                                         std::shared_ptr<IStateSource> stateSource,
                                                         std::shared_ptr<IDeviceNameLookup> nameLookup,
                                                         std::string& outError) {
    outError.clear();

    if (config.kind == RegistryKind::Discovery) {
        if (!stateSource) {
            outError = "discovery registry requires a state source";
            return nullptr;
        }
        return std::make_shared<DiscoveryDeviceRegistry>(std::move(stateSource), std::move(nameLookup));
    }

    if (config.kind != RegistryKind::Manifest) {
        outError = "unsupported registry kind";
        return nullptr;
    }

    std::vector<DeviceRecord> devices;
    if (!DeviceManifestLoader::loadFromJsonFile(config.manifestPath, devices, outError)) {
        return nullptr;
    }
    return std::make_shared<StaticDeviceRegistry>(std::move(devices));
}

} // namespace hpl
