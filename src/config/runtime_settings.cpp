/**
 * @file runtime_settings.cpp
 * @brief hasplint source file.
 */

#include "hasplint/config/runtime_settings.hpp"

#include <cstdlib>
#include <exception>
#include <string>
#include <type_traits>

namespace hpl {
namespace {

bool parseBoolEnv(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return defaultValue;
    }
    const std::string text(value);
    if (text == "1" || text == "true" || text == "TRUE" || text == "on" || text == "ON") {
        return true;
    }
    if (text == "0" || text == "false" || text == "FALSE" || text == "off" || text == "OFF") {
        return false;
    }
    return defaultValue;
}

template <typename T>
T parseIntegralEnv(const char* name, T defaultValue) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return defaultValue;
    }
    try {
        if constexpr (std::is_signed<T>::value) {
            return static_cast<T>(std::stoll(value, nullptr, 0));
        } else {
            const std::string text(value);
            if (!text.empty() && text.front() == '-') {
                return defaultValue;
            }
            return static_cast<T>(std::stoull(text, nullptr, 0));
        }
    } catch (const std::exception&) {
        return defaultValue;
    }
}

std::chrono::milliseconds parseTimeoutEnv(const char* name, std::chrono::milliseconds defaultValue) {
    const auto ms = parseIntegralEnv<long long>(name, defaultValue.count());
    return (ms > 0) ? std::chrono::milliseconds(ms) : defaultValue;
}

} // namespace

RuntimeSettings RuntimeSettings::fromEnvironment() {
    RuntimeSettings settings;

    auto& v = settings.validation;
    v.checkEntities = parseBoolEnv("HPL_CHECK_ENTITIES", v.checkEntities);
    v.checkBounds = parseBoolEnv("HPL_CHECK_BOUNDS", v.checkBounds);
    v.checkDevice = parseBoolEnv("HPL_CHECK_DEVICE", v.checkDevice);
    v.checkObjectIds = parseBoolEnv("HPL_CHECK_OBJECT_IDS", v.checkObjectIds);
    v.checkOverlaps = parseBoolEnv("HPL_CHECK_OVERLAPS", v.checkOverlaps);
    v.suppressWarnings = parseBoolEnv("HPL_SUPPRESS_WARNINGS", v.suppressWarnings);

    auto& o = settings.orchestrator;
    o.entityCheckTimeout = parseTimeoutEnv("HPL_ENTITY_TIMEOUT_MS", o.entityCheckTimeout);
    o.deviceLookupTimeout = parseTimeoutEnv("HPL_DEVICE_TIMEOUT_MS", o.deviceLookupTimeout);
    o.maxParallelEntityChecks = parseIntegralEnv<std::size_t>("HPL_MAX_PARALLEL_CHECKS", o.maxParallelEntityChecks);
    return settings;
}

} // namespace hpl
