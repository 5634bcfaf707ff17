/**
 * @file static_state_source.cpp
 * @brief hasplint source file.
 */

#include "hasplint/external/static_state_source.hpp"

#include <utility>

namespace hpl {

StaticStateSource::StaticStateSource(std::vector<StateRecord> records) : records_(std::move(records)) {}

bool StaticStateSource::fetchStates(std::vector<StateRecord>& outRecords, std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_.empty()) {
        outError = failure_;
        return false;
    }
    outRecords = records_;
    return true;
}

void StaticStateSource::setRecords(std::vector<StateRecord> records) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_ = std::move(records);
}

void StaticStateSource::injectFailure(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_ = std::move(message);
}

StaticDeviceNameLookup::StaticDeviceNameLookup(std::unordered_map<std::string, std::string> names)
    : names_(std::move(names)) {}

std::optional<std::string> StaticDeviceNameLookup::deviceNameFor(const std::string& entityId) {
    const auto it = names_.find(entityId);
    if (it == names_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace hpl
