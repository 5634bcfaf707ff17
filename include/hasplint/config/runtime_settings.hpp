/**
 * @file runtime_settings.hpp
 * @brief hasplint source file.
 */

#pragma once

#include "hasplint/validation/validation_types.hpp"

namespace hpl {

/**
 * @brief Validation defaults resolved from the process environment.
 *
 * Recognized variables (unset or malformed values keep the built-in default):
 * - HPL_CHECK_ENTITIES, HPL_CHECK_BOUNDS, HPL_CHECK_DEVICE, HPL_CHECK_OBJECT_IDS,
 *   HPL_CHECK_OVERLAPS, HPL_SUPPRESS_WARNINGS: 1/true/on or 0/false/off
 * - HPL_ENTITY_TIMEOUT_MS, HPL_DEVICE_TIMEOUT_MS: milliseconds, > 0
 * - HPL_MAX_PARALLEL_CHECKS: 0 for unbounded
 */
struct RuntimeSettings {
    ValidationOptions validation{};
    OrchestratorOptions orchestrator{};

    static RuntimeSettings fromEnvironment();
};

} // namespace hpl
