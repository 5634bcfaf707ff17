/**
 * @file validation_types.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hpl {

/**
 * @brief Category of a blocking validation finding.
 *
 * `Device` is fatal to the pipeline; the other kinds accumulate.
 */
enum class ErrorKind { Device, Entity, Coordinate, ObjectId };

/**
 * @brief Category of a non-blocking validation finding.
 */
enum class WarningKind { Overlap, Entity };

/**
 * @brief Blocking finding; any error fails the validation.
 */
struct ValidationError {
    ErrorKind kind = ErrorKind::Device;
    std::string message;
    std::optional<std::int32_t> objectId;
    std::optional<std::string> entityRef;
};

/**
 * @brief Advisory finding; never affects `ValidationResult::passed`.
 */
struct ValidationWarning {
    WarningKind kind = WarningKind::Overlap;
    std::string message;
    std::optional<std::int32_t> objectId;
    std::optional<std::string> entityRef;
};

/**
 * @brief Aggregated outcome of one validation call.
 *
 * Errors and warnings are ordered by stage (entity, coordinate, object-id,
 * overlap) and, within a stage, by input order.
 */
struct ValidationResult {
    bool passed = true;
    std::vector<ValidationError> errors;
    std::vector<ValidationWarning> warnings;

    bool hasErrors() const noexcept { return !errors.empty(); }
    bool hasWarnings() const noexcept { return !warnings.empty(); }
};

/**
 * @brief Per-call stage switches.
 */
struct ValidationOptions {
    bool checkEntities = true;
    bool checkBounds = true;
    bool checkDevice = true;
    bool checkObjectIds = true;
    bool checkOverlaps = false;
    bool suppressWarnings = false;
};

/**
 * @brief Orchestrator tuning for external calls.
 */
struct OrchestratorOptions {
    /// Deadline for a single entity existence check.
    std::chrono::milliseconds entityCheckTimeout{5000};
    /// Deadline for one device registry snapshot.
    std::chrono::milliseconds deviceLookupTimeout{10000};
    /// Upper bound on concurrently running existence checks, 0 = unbounded.
    std::size_t maxParallelEntityChecks = 8;
};

const char* toString(ErrorKind kind);
const char* toString(WarningKind kind);
std::optional<ErrorKind> parseErrorKind(const std::string& text);

} // namespace hpl
