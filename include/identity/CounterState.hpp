/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COUNTER_STATE_HPP
#define COUNTER_STATE_HPP

#include "scene/EntityHandle.hpp"
#include <atomic>

namespace Tether {

/**
 * @brief Next-id-to-hand-out for one id value-space.
 *
 * The value only moves forward: take() returns the current value and
 * advances it by one, raiseFloor() lifts it to at least the given value.
 * Both are lock-free, so concurrent callers never receive the same value.
 *
 * CounterState is owned by the caller and injected into CounterRegistry,
 * so every test can start from a fresh value-space.
 */
class CounterState {
public:
    explicit CounterState(StableId start = 1) : m_next(start == 0 ? 1 : start) {}

    CounterState(const CounterState&) = delete;
    CounterState& operator=(const CounterState&) = delete;

    StableId take() { return m_next.fetch_add(1, std::memory_order_relaxed); }

    StableId peek() const { return m_next.load(std::memory_order_relaxed); }

    void raiseFloor(StableId floor) {
        StableId current = m_next.load(std::memory_order_relaxed);
        while (current < floor &&
               !m_next.compare_exchange_weak(current, floor,
                                             std::memory_order_relaxed)) {
        }
    }

private:
    // Starts at 1 so that 0 is never handed out
    std::atomic<StableId> m_next;
};

} // namespace Tether

#endif // COUNTER_STATE_HPP
