/**
 * @file static_device_registry.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "hasplint/external/i_device_registry.hpp"

namespace hpl {

/**
 * @brief Registry serving a fixed device list (manifest or test fixture).
 *
 * Supports failure/delay injection so callers can exercise error and timeout
 * paths without a live external system.
 */
class StaticDeviceRegistry final : public IDeviceRegistry {
public:
    StaticDeviceRegistry() = default;
    explicit StaticDeviceRegistry(std::vector<DeviceRecord> devices);

    bool listDevices(std::vector<DeviceRecord>& outDevices, std::string& outError) override;

    void setDevices(std::vector<DeviceRecord> devices);
    /**
     * @brief Make every listDevices() call fail with @p message; empty clears.
     */
    void injectFailure(std::string message);
    /**
     * @brief Make listDevices() throw std::runtime_error(@p message); empty clears.
     */
    void injectException(std::string message);
    void setResponseDelay(std::chrono::milliseconds delay);
    std::size_t callCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<DeviceRecord> devices_;
    std::string failure_;
    std::string exception_;
    std::chrono::milliseconds delay_{0};
    std::size_t calls_ = 0;
};

} // namespace hpl
