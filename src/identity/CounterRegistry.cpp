/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "identity/CounterRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace Tether {

StableId CounterRegistry::next() {
    StableId value = m_state.take();

    std::lock_guard<std::mutex> lock(m_namespaceMutex);
    m_highWater = std::max(m_highWater, value);
    for (auto& [ns, counter] : m_namespaceCounters) {
        counter = m_highWater;
    }
    return value;
}

void CounterRegistry::observe(const std::string& ns, StableId value) {
    m_state.raiseFloor(value + 1);

    std::lock_guard<std::mutex> lock(m_namespaceMutex);
    m_highWater = std::max(m_highWater, value);
    StableId& counter = m_namespaceCounters[ns];
    if (value > counter) {
        COUNTER_DEBUG(std::format("Namespace '{}' observed at {}", ns, value));
        counter = value;
    }
}

void CounterRegistry::reconcile(StableId maxObservedId) {
    StableId before = m_state.peek();
    m_state.raiseFloor(maxObservedId + 1);
    if (m_state.peek() != before) {
        COUNTER_DEBUG(std::format("Floor raised from {} to {}", before, m_state.peek()));
    }
}

void CounterRegistry::registerNamespace(const std::string& ns) {
    std::lock_guard<std::mutex> lock(m_namespaceMutex);
    m_namespaceCounters.try_emplace(ns, m_highWater);
}

StableId CounterRegistry::namespaceCounter(const std::string& ns) const {
    std::lock_guard<std::mutex> lock(m_namespaceMutex);
    auto it = m_namespaceCounters.find(ns);
    return it != m_namespaceCounters.end() ? it->second : 0;
}

std::vector<std::string> CounterRegistry::namespaces() const {
    std::lock_guard<std::mutex> lock(m_namespaceMutex);
    std::vector<std::string> names;
    names.reserve(m_namespaceCounters.size());
    for (const auto& [ns, _] : m_namespaceCounters) {
        names.push_back(ns);
    }
    return names;
}

} // namespace Tether
