/**
 * @file device_manifest_loader.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <string>
#include <vector>

#include "hasplint/external/i_device_registry.hpp"

namespace hpl {

/**
 * @brief Loads an explicit device manifest, the alternative to discovery.
 *
 * Expected entries (one flat JSON object per device, inside any wrapper):
 * `{ "deviceId": "plate01", "name": "Kitchen", "model": "Lanbon L8",
 *    "modelKey": "lanbon_l8", "online": true, "entities": ["light.a"] }`
 *
 * Resolution comes from explicit "width"/"height", else "modelKey" through the
 * resolution catalog, else a pattern match on "model". "online" defaults to true.
 */
class DeviceManifestLoader {
public:
    static bool loadFromJsonText(const std::string& json,
                                 std::vector<DeviceRecord>& outDevices,
                                 std::string& outError);
    static bool loadFromJsonFile(const std::string& filePath,
                                 std::vector<DeviceRecord>& outDevices,
                                 std::string& outError);
};

} // namespace hpl
