/**
 * @file i_device_registry.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hpl {

struct ScreenSize {
    std::int32_t width = 0;
    std::int32_t height = 0;
};

/**
 * @brief One logical display device known to the external system.
 */
struct DeviceRecord {
    std::string deviceId;
    /// Display name; may be empty when none could be derived.
    std::string displayName;
    std::string model;
    bool online = false;
    /// Screen size when known or inferable from the model.
    std::optional<ScreenSize> resolution;
    /// Unique entity ids belonging to the device, in discovery order.
    std::vector<std::string> entityRefs;
};

/**
 * @brief Capability interface producing a point-in-time list of devices.
 *
 * Implementations may run live discovery or serve a static manifest. Callers
 * re-fetch per validation; no caching contract is implied.
 */
class IDeviceRegistry {
public:
    virtual ~IDeviceRegistry() = default;

    /**
     * @brief Fetch the current device list.
     * @param outDevices Devices on success.
     * @param outError Failure description on failure.
     * @return true when the list could be produced.
     */
    virtual bool listDevices(std::vector<DeviceRecord>& outDevices, std::string& outError) = 0;
};

} // namespace hpl
