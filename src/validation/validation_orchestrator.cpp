/**
 * @file validation_orchestrator.cpp
 * @brief hasplint source file.
 */

#include "hasplint/validation/validation_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "hasplint/core/deadline_call.hpp"

namespace hpl {
namespace {

struct RegistrySnapshot {
    bool ok = false;
    std::vector<DeviceRecord> devices;
    std::string error;
};

std::string timeoutText(std::chrono::milliseconds timeout) {
    return "timed out after " + std::to_string(timeout.count()) + " ms";
}

} // namespace

bool PipelineTrace::visited(PipelineStage stage) const {
    return std::find(stages.begin(), stages.end(), stage) != stages.end();
}

ValidationOrchestrator::ValidationOrchestrator(std::shared_ptr<IEntityChecker> entityChecker,
                                               std::shared_ptr<IDeviceRegistry> deviceRegistry,
                                               OrchestratorOptions options)
    : entityChecker_(std::move(entityChecker)),
      deviceRegistry_(std::move(deviceRegistry)),
      options_(options),
      entityGate_(std::make_shared<ConcurrencyGate>(options.maxParallelEntityChecks)) {}

ValidationResult ValidationOrchestrator::validate(const Layout& layout,
                                                  const std::string& deviceId,
                                                  const ValidationOptions& options) const {
    PipelineTrace trace;
    return validate(layout, deviceId, options, trace);
}

ValidationResult ValidationOrchestrator::validate(const Layout& layout,
                                                  const std::string& deviceId,
                                                  const ValidationOptions& options,
                                                  PipelineTrace& outTrace) const {
    const bool trace = (std::getenv("HPL_TRACE_VALIDATE") != nullptr);
    outTrace = PipelineTrace{};
    outTrace.stages.push_back(PipelineStage::Init);

    ValidationResult result;
    std::optional<ScreenSize> screen;

    // Device gate. The registry is also consulted when only bounds checking
    // needs the resolution; lookup failures are then non-fatal.
    if (options.checkDevice || options.checkBounds) {
        if (options.checkDevice) {
            outTrace.stages.push_back(PipelineStage::DeviceCheck);
        }
        auto check = resolveDevice(deviceId, trace);
        if (options.checkDevice && check.error) {
            if (trace) {
                std::cerr << "[hpl-validate] device=" << deviceId << " aborted: " << check.error->message << '\n';
            }
            outTrace.stages.push_back(PipelineStage::Aborted);
            result.errors.push_back(std::move(*check.error));
            result.passed = false;
            return result;
        }
        if (check.device && check.device->resolution) {
            screen = check.device->resolution;
        }
    }

    // Existence checks are the only I/O-bound stage; start them first.
    EntityReferenceValidator::ReferenceIndex references;
    std::future<std::vector<EntityCheckResult>> entityChecks;
    if (options.checkEntities) {
        references = EntityReferenceValidator::index(layout);
        entityChecks = std::async(std::launch::async, [this, &references, trace]() {
            return checkReferences(references.references, trace);
        });
    }

    std::vector<ValidationError> coordinateErrors;
    if (options.checkBounds) {
        if (screen) {
            coordinateErrors = CoordinateValidator::validate(layout, *screen);
        } else {
            outTrace.boundsSkipped = true;
            if (trace) {
                std::cerr << "[hpl-validate] device=" << deviceId << " bounds skipped: no resolution\n";
            }
        }
    }

    std::vector<ValidationError> idErrors;
    if (options.checkObjectIds) {
        idErrors = ObjectIdUniquenessChecker::validate(layout);
    }

    std::vector<ValidationWarning> overlapWarnings;
    if (options.checkOverlaps) {
        overlapWarnings = OverlapDetector::detect(layout);
    }

    EntityReferenceValidator::Outcome entityOutcome;
    if (options.checkEntities) {
        entityOutcome = EntityReferenceValidator::evaluate(references, entityChecks.get());
    }

    // Fixed merge order keeps results reproducible.
    if (options.checkEntities) {
        outTrace.stages.push_back(PipelineStage::EntityCheck);
        result.errors.insert(result.errors.end(), entityOutcome.errors.begin(), entityOutcome.errors.end());
        result.warnings.insert(result.warnings.end(), entityOutcome.warnings.begin(),
                               entityOutcome.warnings.end());
    }
    if (options.checkBounds && screen) {
        outTrace.stages.push_back(PipelineStage::BoundsCheck);
        result.errors.insert(result.errors.end(), coordinateErrors.begin(), coordinateErrors.end());
    }
    if (options.checkObjectIds) {
        outTrace.stages.push_back(PipelineStage::IdCheck);
        result.errors.insert(result.errors.end(), idErrors.begin(), idErrors.end());
    }
    if (options.checkOverlaps) {
        outTrace.stages.push_back(PipelineStage::OverlapCheck);
        result.warnings.insert(result.warnings.end(), overlapWarnings.begin(), overlapWarnings.end());
    }
    if (options.suppressWarnings) {
        result.warnings.clear();
    }

    outTrace.stages.push_back(PipelineStage::Done);
    result.passed = result.errors.empty();
    if (trace) {
        std::cerr << "[hpl-validate] device=" << deviceId
                  << " passed=" << (result.passed ? 1 : 0)
                  << " errors=" << result.errors.size()
                  << " warnings=" << result.warnings.size() << '\n';
    }
    return result;
}

DeviceValidator::Check ValidationOrchestrator::resolveDevice(const std::string& deviceId, bool trace) const {
    if (!deviceRegistry_) {
        return {DeviceValidator::lookupFailure("no device registry configured"), std::nullopt};
    }

    auto registry = deviceRegistry_;
    auto call = DeadlineCall<RegistrySnapshot>::start(
        [registry]() {
            RegistrySnapshot snapshot;
            snapshot.ok = registry->listDevices(snapshot.devices, snapshot.error);
            return snapshot;
        },
        options_.deviceLookupTimeout);
    auto outcome = call.await();

    if (outcome.timedOut) {
        if (trace) {
            std::cerr << "[hpl-validate] device registry " << timeoutText(options_.deviceLookupTimeout) << '\n';
        }
        return {DeviceValidator::lookupFailure("device registry lookup " + timeoutText(options_.deviceLookupTimeout)),
                std::nullopt};
    }
    if (!outcome.value) {
        return {DeviceValidator::lookupFailure(outcome.error), std::nullopt};
    }
    if (!outcome.value->ok) {
        const auto& error = outcome.value->error;
        return {DeviceValidator::lookupFailure(error.empty() ? "registry unavailable" : error), std::nullopt};
    }

    if (trace) {
        std::cerr << "[hpl-validate] device registry listed " << outcome.value->devices.size() << " device(s)\n";
    }
    return DeviceValidator::evaluate(deviceId, outcome.value->devices);
}

std::vector<EntityCheckResult> ValidationOrchestrator::checkReferences(const std::vector<std::string>& references,
                                                                       bool trace) const {
    std::vector<EntityCheckResult> results;
    results.reserve(references.size());
    if (references.empty()) {
        return results;
    }
    if (!entityChecker_) {
        results.assign(references.size(), EntityCheckResult{EntityPresence::Unavailable, "no entity checker configured"});
        return results;
    }

    auto checker = entityChecker_;
    std::vector<std::optional<DeadlineCall<EntityCheckResult>>> calls;
    calls.reserve(references.size());

    // A reference waits at most one check timeout for a free slot. Slots held
    // by abandoned calls are only returned when those calls finish.
    for (const auto& ref : references) {
        auto lease = entityGate_->acquireUntil(std::chrono::steady_clock::now() + options_.entityCheckTimeout);
        if (!lease) {
            calls.emplace_back(std::nullopt);
            continue;
        }
        calls.emplace_back(DeadlineCall<EntityCheckResult>::start(
            [checker, ref, lease = std::move(lease)]() { return checker->exists(ref); },
            options_.entityCheckTimeout));
    }

    for (std::size_t i = 0; i < references.size(); ++i) {
        EntityCheckResult checked;
        if (!calls[i]) {
            checked = {EntityPresence::Unavailable,
                       "no check slot freed within " + std::to_string(options_.entityCheckTimeout.count()) + " ms"};
        } else {
            auto outcome = calls[i]->await();
            if (outcome.timedOut) {
                checked = {EntityPresence::Unavailable, "existence check " + timeoutText(options_.entityCheckTimeout)};
            } else if (!outcome.value) {
                checked = {EntityPresence::Unavailable, outcome.error};
            } else {
                checked = std::move(*outcome.value);
            }
        }
        if (trace) {
            std::cerr << "[hpl-validate] entity=" << references[i] << " " << toString(checked.presence);
            if (!checked.error.empty()) {
                std::cerr << " (" << checked.error << ")";
            }
            std::cerr << '\n';
        }
        results.push_back(std::move(checked));
    }
    return results;
}

const char* toString(PipelineStage stage) {
    switch (stage) {
    case PipelineStage::Init:
        return "Init";
    case PipelineStage::DeviceCheck:
        return "DeviceCheck";
    case PipelineStage::Aborted:
        return "Aborted";
    case PipelineStage::EntityCheck:
        return "EntityCheck";
    case PipelineStage::BoundsCheck:
        return "BoundsCheck";
    case PipelineStage::IdCheck:
        return "IdCheck";
    case PipelineStage::OverlapCheck:
        return "OverlapCheck";
    case PipelineStage::Done:
        return "Done";
    }
    return "Unknown";
}

} // namespace hpl
