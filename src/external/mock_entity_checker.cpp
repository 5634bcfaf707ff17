/**
 * @file mock_entity_checker.cpp
 * @brief hasplint source file.
 */

#include "hasplint/external/mock_entity_checker.hpp"

#include <algorithm>
#include <thread>

namespace hpl {

MockEntityChecker::MockEntityChecker(const std::vector<std::string>& knownEntities)
    : known_(knownEntities.begin(), knownEntities.end()) {}

EntityCheckResult MockEntityChecker::exists(const std::string& entityRef) {
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_[entityRef];
        ++inFlight_;
        peakInFlight_ = std::max(peakInFlight_, inFlight_);
        delay = delay_;
    }

    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --inFlight_;
    const auto failure = failures_.find(entityRef);
    if (failure != failures_.end()) {
        return {EntityPresence::Unavailable, failure->second};
    }
    if (known_.find(entityRef) == known_.end()) {
        return {EntityPresence::Missing, "Entity '" + entityRef + "' not found"};
    }
    return {EntityPresence::Exists, {}};
}

void MockEntityChecker::addEntity(const std::string& entityRef) {
    std::lock_guard<std::mutex> lock(mutex_);
    known_.insert(entityRef);
}

void MockEntityChecker::removeEntity(const std::string& entityRef) {
    std::lock_guard<std::mutex> lock(mutex_);
    known_.erase(entityRef);
}

void MockEntityChecker::injectFailure(const std::string& entityRef, std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[entityRef] = std::move(message);
}

void MockEntityChecker::clearFailures() {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.clear();
}

void MockEntityChecker::setResponseDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    delay_ = delay;
}

std::size_t MockEntityChecker::callCount(const std::string& entityRef) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = calls_.find(entityRef);
    return (it == calls_.end()) ? 0U : it->second;
}

std::size_t MockEntityChecker::totalCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& kv : calls_) {
        total += kv.second;
    }
    return total;
}

std::size_t MockEntityChecker::peakConcurrentCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peakInFlight_;
}

} // namespace hpl
