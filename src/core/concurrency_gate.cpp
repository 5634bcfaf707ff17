/**
 * @file concurrency_gate.cpp
 * @brief hasplint source file.
 */

#include "hasplint/core/concurrency_gate.hpp"

#include <utility>

namespace hpl {

ConcurrencyGate::Lease::Lease(Lease&& other) noexcept : gate_(std::move(other.gate_)) {}

ConcurrencyGate::Lease& ConcurrencyGate::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = std::move(other.gate_);
    }
    return *this;
}

ConcurrencyGate::Lease::~Lease() { release(); }

void ConcurrencyGate::Lease::release() {
    if (gate_) {
        gate_->releaseSlot();
        gate_.reset();
    }
}

ConcurrencyGate::ConcurrencyGate(std::size_t limit) : limit_(limit) {}

ConcurrencyGate::Lease ConcurrencyGate::acquireUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (limit_ != 0U &&
        !freed_.wait_until(lock, deadline, [this]() { return inFlight_ < limit_; })) {
        return Lease{};
    }
    ++inFlight_;
    return Lease(shared_from_this());
}

std::size_t ConcurrencyGate::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_;
}

void ConcurrencyGate::releaseSlot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --inFlight_;
    }
    freed_.notify_one();
}

} // namespace hpl
