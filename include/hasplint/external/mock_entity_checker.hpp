/**
 * @file mock_entity_checker.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "hasplint/external/i_entity_checker.hpp"

namespace hpl {

/**
 * @brief In-memory entity directory with call accounting and fault injection.
 */
class MockEntityChecker final : public IEntityChecker {
public:
    MockEntityChecker() = default;
    explicit MockEntityChecker(const std::vector<std::string>& knownEntities);

    EntityCheckResult exists(const std::string& entityRef) override;

    void addEntity(const std::string& entityRef);
    void removeEntity(const std::string& entityRef);
    /**
     * @brief Make every check of @p entityRef report `Unavailable`.
     */
    void injectFailure(const std::string& entityRef, std::string message);
    void clearFailures();
    /**
     * @brief Sleep this long inside every check.
     */
    void setResponseDelay(std::chrono::milliseconds delay);

    std::size_t callCount(const std::string& entityRef) const;
    std::size_t totalCalls() const;
    /// Highest number of checks observed running at the same time.
    std::size_t peakConcurrentCalls() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> known_;
    std::unordered_map<std::string, std::string> failures_;
    std::unordered_map<std::string, std::size_t> calls_;
    std::chrono::milliseconds delay_{0};
    std::size_t inFlight_ = 0;
    std::size_t peakInFlight_ = 0;
};

} // namespace hpl
