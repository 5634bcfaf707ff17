/**
 * @file static_device_registry.cpp
 * @brief hasplint source file.
 */

#include "hasplint/external/static_device_registry.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

namespace hpl {

StaticDeviceRegistry::StaticDeviceRegistry(std::vector<DeviceRecord> devices)
    : devices_(std::move(devices)) {}

bool StaticDeviceRegistry::listDevices(std::vector<DeviceRecord>& outDevices, std::string& outError) {
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        delay = delay_;
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!exception_.empty()) {
        throw std::runtime_error(exception_);
    }
    if (!failure_.empty()) {
        outError = failure_;
        return false;
    }
    outDevices = devices_;
    return true;
}

void StaticDeviceRegistry::setDevices(std::vector<DeviceRecord> devices) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = std::move(devices);
}

void StaticDeviceRegistry::injectFailure(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_ = std::move(message);
}

void StaticDeviceRegistry::injectException(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    exception_ = std::move(message);
}

void StaticDeviceRegistry::setResponseDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    delay_ = delay;
}

std::size_t StaticDeviceRegistry::callCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

} // namespace hpl
