/**
 * @file static_state_source.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "hasplint/external/i_state_source.hpp"

namespace hpl {

/**
 * @brief Fixed state snapshot, used by tests and offline discovery runs.
 */
class StaticStateSource final : public IStateSource {
public:
    StaticStateSource() = default;
    explicit StaticStateSource(std::vector<StateRecord> records);

    bool fetchStates(std::vector<StateRecord>& outRecords, std::string& outError) override;

    void setRecords(std::vector<StateRecord> records);
    void injectFailure(std::string message);

private:
    mutable std::mutex mutex_;
    std::vector<StateRecord> records_;
    std::string failure_;
};

/**
 * @brief Fixed entity-id -> device-name table.
 */
class StaticDeviceNameLookup final : public IDeviceNameLookup {
public:
    StaticDeviceNameLookup() = default;
    explicit StaticDeviceNameLookup(std::unordered_map<std::string, std::string> names);

    std::optional<std::string> deviceNameFor(const std::string& entityId) override;

private:
    std::unordered_map<std::string, std::string> names_;
};

} // namespace hpl
