/**
 * @file i_entity_checker.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <string>

namespace hpl {

/**
 * @brief Outcome class of one existence check.
 *
 * `Missing` is a confirmed "not found" from the external system. `Unavailable`
 * covers every transport or server failure where existence is unknown.
 */
enum class EntityPresence { Exists, Missing, Unavailable };

struct EntityCheckResult {
    EntityPresence presence = EntityPresence::Unavailable;
    /// Failure detail for `Missing` / `Unavailable`; empty otherwise.
    std::string error;
};

/**
 * @brief Capability interface answering "does this entity exist?".
 *
 * The validation orchestrator calls `exists()` from several worker threads at
 * once, so implementations must be safe for concurrent use.
 */
class IEntityChecker {
public:
    virtual ~IEntityChecker() = default;

    virtual EntityCheckResult exists(const std::string& entityRef) = 0;
};

inline const char* toString(EntityPresence presence) {
    switch (presence) {
    case EntityPresence::Exists:
        return "exists";
    case EntityPresence::Missing:
        return "missing";
    case EntityPresence::Unavailable:
        return "unavailable";
    }
    return "unknown";
}

} // namespace hpl
