/**
 * @file registry_factory.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <memory>
#include <string>

#include "hasplint/external/i_device_registry.hpp"
#include "hasplint/external/i_state_source.hpp"

namespace hpl {

enum class RegistryKind {
    Discovery,
    Manifest,
};

struct RegistryFactoryConfig {
    RegistryKind kind = RegistryKind::Discovery;
    std::string manifestPath;
};

/**
 * @brief Create device registries from a small runtime config.
 *
 * Registry spec format for parseRegistrySpec:
 * - discovery
 * - manifest:<path>
 */
class RegistryFactory {
public:
    static bool parseRegistrySpec(const std::string& spec,
                                  RegistryFactoryConfig& outConfig,
                                  std::string& outError);

    /**
     * @param stateSource Required for discovery registries, ignored otherwise.
     * @param nameLookup Optional authoritative name source for discovery.
     */
    static std::shared_ptr<IDeviceRegistry> create(const RegistryFactoryConfig& config,
                                                   std::shared_ptr<IStateSource> stateSource,
                                                   std::shared_ptr<IDeviceNameLookup> nameLookup,
                                                   std::string& outError);
};

} // namespace hpl
