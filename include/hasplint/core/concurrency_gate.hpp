/**
 * @file concurrency_gate.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

namespace hpl {

/**
 * @brief Counting limit on calls in flight, shared with the threads running them.
 *
 * A slot is held by a `Lease` and returned when the lease is destroyed, which
 * for a call abandoned at its deadline is when its worker thread finishes.
 * A limit of 0 never blocks.
 */
class ConcurrencyGate : public std::enable_shared_from_this<ConcurrencyGate> {
public:
    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        explicit operator bool() const noexcept { return static_cast<bool>(gate_); }
        void release();

    private:
        friend class ConcurrencyGate;
        explicit Lease(std::shared_ptr<ConcurrencyGate> gate) : gate_(std::move(gate)) {}

        std::shared_ptr<ConcurrencyGate> gate_;
    };

    explicit ConcurrencyGate(std::size_t limit);

    /**
     * @brief Wait for a free slot until @p deadline.
     * @return Held lease, or an empty one when no slot freed up in time.
     */
    Lease acquireUntil(std::chrono::steady_clock::time_point deadline);

    std::size_t inFlight() const;
    std::size_t limit() const noexcept { return limit_; }

private:
    void releaseSlot();

    const std::size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable freed_;
    std::size_t inFlight_ = 0;
};

} // namespace hpl
