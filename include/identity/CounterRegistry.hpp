/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COUNTER_REGISTRY_HPP
#define COUNTER_REGISTRY_HPP

#include "identity/CounterState.hpp"
#include <boost/container/flat_map.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace Tether {

/**
 * @brief Hands out globally unique, monotonically increasing ids for one
 * collection, kept in sync across every namespace.
 *
 * Each namespace has a counter mirror holding the last value handed out,
 * which is what the host persists per scene. next() advances the shared
 * CounterState and writes the new value into every known mirror, so all
 * namespaces agree on the counter at all times.
 * Values seen through channels the registry does not control (ids restored
 * from storage, another namespace's persisted counter) are fed back through
 * observe() or reconcile() so they can never be handed out again.
 *
 * Usage:
 *   CounterState state;
 *   CounterRegistry registry(state);
 *   registry.reconcile(highestIdInPool);
 *   StableId id = registry.next();
 */
class CounterRegistry {
public:
    explicit CounterRegistry(CounterState& state) : m_state(state) {}

    CounterRegistry(const CounterRegistry&) = delete;
    CounterRegistry& operator=(const CounterRegistry&) = delete;

    /**
     * @brief Returns a value strictly greater than every value previously
     * returned or observed. Never blocks, never fails.
     */
    StableId next();

    /// Value the next call to next() will return
    StableId peek() const { return m_state.peek(); }

    /**
     * @brief Records that `ns` has handed out `value` outside this registry.
     * Raises the floor to value + 1.
     */
    void observe(const std::string& ns, StableId value);

    /**
     * @brief Raises the floor above the highest id currently present in the
     * data. Called before every allocation, the pool being the ground truth.
     */
    void reconcile(StableId maxObservedId);

    /// Starts tracking a namespace, its mirror synced to the high-water mark
    void registerNamespace(const std::string& ns);

    /// Highest value handed out or observed for a namespace; 0 when none
    StableId namespaceCounter(const std::string& ns) const;

    std::vector<std::string> namespaces() const;

private:
    CounterState& m_state;

    mutable std::mutex m_namespaceMutex;
    boost::container::flat_map<std::string, StableId> m_namespaceCounters;
    StableId m_highWater{0}; // highest value handed out or observed
};

} // namespace Tether

#endif // COUNTER_REGISTRY_HPP
