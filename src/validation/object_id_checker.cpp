/**
 * @file object_id_checker.cpp
 * @brief hasplint source file.
 */

#include "hasplint/validation/validation_stages.hpp"

#include <unordered_set>

namespace hpl {

std::vector<ValidationError> ObjectIdUniquenessChecker::validate(const Layout& layout) {
    std::vector<ValidationError> errors;
    std::unordered_set<std::int32_t> seen;
    for (const auto& object : layout) {
        if (!object.id) {
            continue;
        }
        const auto [_, inserted] = seen.insert(*object.id);
        if (!inserted) {
            errors.push_back({ErrorKind::ObjectId,
                              "Duplicate object ID: " + std::to_string(*object.id),
                              object.id,
                              std::nullopt});
        }
    }
    return errors;
}

} // namespace hpl
