/**
 * @file device_discovery.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "hasplint/external/i_device_registry.hpp"
#include "hasplint/external/i_state_source.hpp"

namespace hpl {

/**
 * @brief Reconstructs display devices from a flat entity state snapshot.
 *
 * There is no device manifest to read, so records are grouped heuristically:
 * relevant records are reduced to a cluster key by stripping a role suffix
 * ("_backlight", "_status", ...) and a trailing "_<n>", then grouped. Clusters
 * with fewer than two entities are dropped as noise, which also hides genuine
 * single-entity devices.
 *
 * Output is sorted by device id and independent of hash/set iteration order.
 */
class DeviceDiscoveryEngine {
public:
    /**
     * @brief Cluster @p records into devices.
     * @param nameLookup Optional authoritative name source; may be null. Entity
     * ids are asked in sorted order and the first known name wins.
     */
    static std::vector<DeviceRecord> discover(const std::vector<StateRecord>& records,
                                              IDeviceNameLookup* nameLookup = nullptr);

    /**
     * @brief Domain filter plus device-marker / naming-convention predicate.
     */
    static bool isCandidate(const StateRecord& record);
    /**
     * @brief Cluster key for a domain-qualified entity id, e.g.
     * "light.plate01_backlight" -> "plate01".
     */
    static std::string clusterKey(const std::string& entityId);
    /**
     * @brief Display name from friendly names: longest common prefix of the
     * sorted names (or the single name), minus trailing role words, trimmed.
     * @return Empty string when nothing usable remains.
     */
    static std::string deriveDisplayName(const std::vector<std::string>& friendlyNames);
    /**
     * @brief Remove trailing role words ("Backlight", "Status", ...) repeatedly.
     */
    static std::string stripRoleWords(std::string name);
};

/**
 * @brief `IDeviceRegistry` backed by live discovery over a state source.
 */
class DiscoveryDeviceRegistry final : public IDeviceRegistry {
public:
    explicit DiscoveryDeviceRegistry(std::shared_ptr<IStateSource> stateSource,
                                     std::shared_ptr<IDeviceNameLookup> nameLookup = nullptr);

    bool listDevices(std::vector<DeviceRecord>& outDevices, std::string& outError) override;

private:
    std::shared_ptr<IStateSource> stateSource_;
    std::shared_ptr<IDeviceNameLookup> nameLookup_;
};

} // namespace hpl
