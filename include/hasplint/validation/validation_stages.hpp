/**
 * @file validation_stages.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "hasplint/external/i_device_registry.hpp"
#include "hasplint/external/i_entity_checker.hpp"
#include "hasplint/layout/layout_models.hpp"
#include "hasplint/validation/validation_types.hpp"

namespace hpl {

/**
 * @brief Check one rectangle against a screen size.
 *
 * At most one reason is reported; the negative-origin check takes precedence
 * over the width check, which takes precedence over the height check.
 *
 * @return Human-readable violation, or std::nullopt when the rectangle fits.
 */
std::optional<std::string> validateCoordinates(std::int32_t x, std::int32_t y,
                                               std::int32_t width, std::int32_t height,
                                               std::int32_t deviceWidth, std::int32_t deviceHeight);

/**
 * @brief Bounds stage: every non-page object must fit on the screen.
 */
class CoordinateValidator {
public:
    static std::vector<ValidationError> validate(const Layout& layout, const ScreenSize& screen);
};

/**
 * @brief Overlap stage: pairwise rectangle test per page, warnings only.
 *
 * Pages are visited in ascending page index; within a page pairs follow input
 * order. Each overlapping pair yields one warning attributed to the lower id.
 */
class OverlapDetector {
public:
    static std::vector<ValidationWarning> detect(const Layout& layout);
};

/**
 * @brief Object-id stage: one error per repeated occurrence after the first.
 */
class ObjectIdUniquenessChecker {
public:
    static std::vector<ValidationError> validate(const Layout& layout);
};

/**
 * @brief Entity stage split into indexing, checking and evaluation.
 *
 * The orchestrator indexes the layout, runs one existence check per distinct
 * reference (concurrently, under deadlines) and evaluates the results here.
 */
class EntityReferenceValidator {
public:
    struct ReferenceIndex {
        /// Distinct references in order of first appearance.
        std::vector<std::string> references;
        /// Reference -> ids of every object using it, in input order.
        std::unordered_map<std::string, std::vector<std::optional<std::int32_t>>> users;
    };

    struct Outcome {
        std::vector<ValidationError> errors;
        std::vector<ValidationWarning> warnings;
    };

    static ReferenceIndex index(const Layout& layout);
    /**
     * @brief Turn check results into findings.
     * @param results One result per `index.references` entry, same order.
     */
    static Outcome evaluate(const ReferenceIndex& index, const std::vector<EntityCheckResult>& results);
    /**
     * @brief Sequential convenience path: index, check each reference once, evaluate.
     */
    static Outcome validate(const Layout& layout, IEntityChecker& checker);
};

/**
 * @brief Device stage: target must be listed by the registry and online.
 */
class DeviceValidator {
public:
    struct Check {
        std::optional<ValidationError> error;
        /// Resolved record, present whenever the device was found (online or not).
        std::optional<DeviceRecord> device;
    };

    static Check evaluate(const std::string& deviceId, const std::vector<DeviceRecord>& devices);
    /**
     * @brief Device error for a registry lookup that failed, threw or timed out.
     */
    static ValidationError lookupFailure(const std::string& reason);
    /**
     * @brief Synchronous lookup; registry failures and exceptions become device errors.
     */
    static Check validate(const std::string& deviceId, IDeviceRegistry& registry);
};

} // namespace hpl
