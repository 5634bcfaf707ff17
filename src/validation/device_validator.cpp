/**
 * @file device_validator.cpp
 * @brief hasplint source file.
 */

#include "hasplint/validation/validation_stages.hpp"

#include <algorithm>
#include <exception>

namespace hpl {

DeviceValidator::Check DeviceValidator::evaluate(const std::string& deviceId,
                                                 const std::vector<DeviceRecord>& devices) {
    Check check;
    const auto it = std::find_if(devices.begin(), devices.end(),
                                 [&](const DeviceRecord& d) { return d.deviceId == deviceId; });
    if (it == devices.end()) {
        check.error = ValidationError{ErrorKind::Device, "Device '" + deviceId + "' not found in registry",
                                      std::nullopt, std::nullopt};
        return check;
    }

    check.device = *it;
    if (!it->online) {
        const auto& name = it->displayName.empty() ? it->deviceId : it->displayName;
        check.error = ValidationError{ErrorKind::Device, "Device '" + name + "' is offline",
                                      std::nullopt, std::nullopt};
    }
    return check;
}

ValidationError DeviceValidator::lookupFailure(const std::string& reason) {
    return {ErrorKind::Device, "Failed to validate device: " + reason, std::nullopt, std::nullopt};
}

DeviceValidator::Check DeviceValidator::validate(const std::string& deviceId, IDeviceRegistry& registry) {
    std::vector<DeviceRecord> devices;
    std::string error;
    try {
        if (!registry.listDevices(devices, error)) {
            return {lookupFailure(error.empty() ? "registry unavailable" : error), std::nullopt};
        }
    } catch (const std::exception& ex) {
        return {lookupFailure(ex.what()), std::nullopt};
    } catch (...) {
        return {lookupFailure("unknown exception"), std::nullopt};
    }
    return evaluate(deviceId, devices);
}

} // namespace hpl
