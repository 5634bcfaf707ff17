/**
 * @file validation_orchestrator.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "hasplint/core/concurrency_gate.hpp"
#include "hasplint/external/i_device_registry.hpp"
#include "hasplint/external/i_entity_checker.hpp"
#include "hasplint/layout/layout_models.hpp"
#include "hasplint/validation/validation_stages.hpp"
#include "hasplint/validation/validation_types.hpp"

namespace hpl {

/**
 * @brief States visited by one validation run.
 */
enum class PipelineStage {
    Init,
    DeviceCheck,
    Aborted,
    EntityCheck,
    BoundsCheck,
    IdCheck,
    OverlapCheck,
    Done,
};

/**
 * @brief Stages a run actually executed, in state-machine order.
 */
struct PipelineTrace {
    std::vector<PipelineStage> stages;
    /// Bounds checking was enabled but no resolution was known.
    bool boundsSkipped = false;

    bool visited(PipelineStage stage) const;
};

/**
 * @brief Sequences the validation stages and aggregates their findings.
 *
 * The device check runs first and is a strict gate: a device error aborts the
 * run before any other stage starts. The remaining stages are independent;
 * entity existence checks run on worker threads while the geometry stages run
 * on the caller's thread. Findings are merged in fixed stage order (entity,
 * coordinate, object-id, overlap) whatever the completion order.
 *
 * Collaborators are shared so that a call abandoned at its deadline can finish
 * safely in the background. Such a call keeps its slot of the existence-check
 * limit until it really finishes, and the limit is shared by every run of one
 * orchestrator.
 */
class ValidationOrchestrator {
public:
    ValidationOrchestrator(std::shared_ptr<IEntityChecker> entityChecker,
                           std::shared_ptr<IDeviceRegistry> deviceRegistry,
                           OrchestratorOptions options = {});

    ValidationResult validate(const Layout& layout,
                              const std::string& deviceId,
                              const ValidationOptions& options = {}) const;
    ValidationResult validate(const Layout& layout,
                              const std::string& deviceId,
                              const ValidationOptions& options,
                              PipelineTrace& outTrace) const;

    const OrchestratorOptions& options() const noexcept { return options_; }

private:
    DeviceValidator::Check resolveDevice(const std::string& deviceId, bool trace) const;
    std::vector<EntityCheckResult> checkReferences(const std::vector<std::string>& references,
                                                   bool trace) const;

    std::shared_ptr<IEntityChecker> entityChecker_;
    std::shared_ptr<IDeviceRegistry> deviceRegistry_;
    OrchestratorOptions options_;
    std::shared_ptr<ConcurrencyGate> entityGate_;
};

const char* toString(PipelineStage stage);

} // namespace hpl
