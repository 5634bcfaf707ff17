/**
 * @file entity_reference_validator.cpp
 * @brief hasplint source file.
 */

#include "hasplint/validation/validation_stages.hpp"

#include <exception>
#include <sstream>

namespace hpl {
namespace {

std::string missingMessage(const std::string& ref, const std::optional<std::int32_t>& objectId) {
    std::ostringstream os;
    os << "Entity '" << ref << "' referenced by ";
    if (objectId) {
        os << "object " << *objectId;
    } else {
        os << "an object without id";
    }
    os << " does not exist";
    return os.str();
}

} // namespace

EntityReferenceValidator::ReferenceIndex EntityReferenceValidator::index(const Layout& layout) {
    ReferenceIndex index;
    for (const auto& object : layout) {
        if (object.isPage() || !object.entityRef || object.entityRef->empty()) {
            continue;
        }
        const auto& ref = *object.entityRef;
        auto it = index.users.find(ref);
        if (it == index.users.end()) {
            index.references.push_back(ref);
            it = index.users.emplace(ref, std::vector<std::optional<std::int32_t>>{}).first;
        }
        it->second.push_back(object.id);
    }
    return index;
}

EntityReferenceValidator::Outcome EntityReferenceValidator::evaluate(
    const ReferenceIndex& index, const std::vector<EntityCheckResult>& results) {
    Outcome outcome;
    for (std::size_t i = 0; i < index.references.size(); ++i) {
        const auto& ref = index.references[i];
        const EntityCheckResult result = (i < results.size())
                                             ? results[i]
                                             : EntityCheckResult{EntityPresence::Unavailable, "no check result"};
        switch (result.presence) {
        case EntityPresence::Exists:
            break;
        case EntityPresence::Missing:
            for (const auto& objectId : index.users.at(ref)) {
                outcome.errors.push_back({ErrorKind::Entity, missingMessage(ref, objectId), objectId, ref});
            }
            break;
        case EntityPresence::Unavailable: {
            // Unknown existence never blocks; surface it as a warning instead.
            const auto& users = index.users.at(ref);
            std::string message = "Could not verify entity '" + ref + "'";
            if (!result.error.empty()) {
                message += ": " + result.error;
            }
            outcome.warnings.push_back({WarningKind::Entity, message,
                                        users.empty() ? std::nullopt : users.front(), ref});
            break;
        }
        }
    }
    return outcome;
}

EntityReferenceValidator::Outcome EntityReferenceValidator::validate(const Layout& layout,
                                                                     IEntityChecker& checker) {
    const auto refs = index(layout);
    std::vector<EntityCheckResult> results;
    results.reserve(refs.references.size());
    for (const auto& ref : refs.references) {
        try {
            results.push_back(checker.exists(ref));
        } catch (const std::exception& ex) {
            results.push_back({EntityPresence::Unavailable, ex.what()});
        } catch (...) {
            results.push_back({EntityPresence::Unavailable, "unknown exception"});
        }
    }
    return evaluate(refs, results);
}

} // namespace hpl
