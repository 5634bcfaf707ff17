/**
 * @file i_state_source.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hpl {

/**
 * @brief One externally reported entity state.
 */
struct StateRecord {
    /// Domain-qualified id, e.g. "light.plate01_backlight".
    std::string entityId;
    std::string state;
    /// Flattened attribute values (friendly_name, model, width, ...).
    std::map<std::string, std::string> attributes;
};

/**
 * @brief Source of flat state snapshots consumed by device discovery.
 */
class IStateSource {
public:
    virtual ~IStateSource() = default;

    virtual bool fetchStates(std::vector<StateRecord>& outRecords, std::string& outError) = 0;
};

/**
 * @brief Optional authoritative device-name registry keyed by entity id.
 */
class IDeviceNameLookup {
public:
    virtual ~IDeviceNameLookup() = default;

    /**
     * @brief Name of the device owning @p entityId, if the registry knows it.
     */
    virtual std::optional<std::string> deviceNameFor(const std::string& entityId) = 0;
};

} // namespace hpl
