/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CounterRegistryTests
#include <boost/test/unit_test.hpp>

#include "identity/CounterRegistry.hpp"
#include "identity/CounterState.hpp"
#include <algorithm>
#include <set>
#include <thread>
#include <vector>

using namespace Tether;

struct CounterFixture {
    CounterState state;
    CounterRegistry registry{state};
};

// ===================================================================
// CounterState
// ===================================================================

BOOST_AUTO_TEST_SUITE(CounterStateTests)

BOOST_AUTO_TEST_CASE(TestStartsAtOne) {
    CounterState state;
    BOOST_CHECK_EQUAL(state.peek(), 1u);
    BOOST_CHECK_EQUAL(state.take(), 1u);
    BOOST_CHECK_EQUAL(state.take(), 2u);
    BOOST_CHECK_EQUAL(state.peek(), 3u);
}

BOOST_AUTO_TEST_CASE(TestZeroStartIsNeverHandedOut) {
    CounterState state(0);
    BOOST_CHECK_EQUAL(state.take(), 1u);
}

BOOST_AUTO_TEST_CASE(TestRaiseFloorOnlyMovesForward) {
    CounterState state(10);
    state.raiseFloor(5);
    BOOST_CHECK_EQUAL(state.peek(), 10u);
    state.raiseFloor(20);
    BOOST_CHECK_EQUAL(state.peek(), 20u);
}

BOOST_AUTO_TEST_CASE(TestConcurrentTakesAreUnique) {
    CounterState state;
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 1000;

    std::vector<std::vector<StableId>> taken(THREADS);
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&state, &taken, t]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                taken[t].push_back(state.take());
                if (i % 100 == 0) {
                    state.raiseFloor(static_cast<StableId>(i));
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::set<StableId> unique;
    for (const auto& ids : taken) {
        unique.insert(ids.begin(), ids.end());
    }
    BOOST_CHECK_EQUAL(unique.size(), static_cast<size_t>(THREADS * PER_THREAD));
    BOOST_CHECK(unique.find(0) == unique.end());
}

BOOST_AUTO_TEST_SUITE_END()

// ===================================================================
// CounterRegistry
// ===================================================================

BOOST_FIXTURE_TEST_SUITE(CounterRegistryTests, CounterFixture)

BOOST_AUTO_TEST_CASE(TestNextIsStrictlyIncreasing) {
    StableId first = registry.next();
    StableId second = registry.next();
    BOOST_CHECK_EQUAL(first, 1u);
    BOOST_CHECK_GT(second, first);
    BOOST_CHECK_EQUAL(registry.peek(), 3u);
}

BOOST_AUTO_TEST_CASE(TestReconcileRaisesFloor) {
    registry.reconcile(41);
    BOOST_CHECK_EQUAL(registry.next(), 42u);

    // A lower observation never lowers the counter
    registry.reconcile(3);
    BOOST_CHECK_EQUAL(registry.next(), 43u);
}

BOOST_AUTO_TEST_CASE(TestNamespacesMirrorLastHandedOut) {
    registry.registerNamespace("Scene");
    registry.registerNamespace("Layout");
    BOOST_CHECK_EQUAL(registry.namespaceCounter("Scene"), 0u);

    registry.next();
    StableId last = registry.next();
    BOOST_CHECK_EQUAL(registry.namespaceCounter("Scene"), last);
    BOOST_CHECK_EQUAL(registry.namespaceCounter("Layout"), last);
    BOOST_CHECK_EQUAL(registry.namespaceCounter("Unknown"), 0u);
}

BOOST_AUTO_TEST_CASE(TestObserveRaisesAllFutureIds) {
    registry.observe("Layout", 17);
    BOOST_CHECK_EQUAL(registry.namespaceCounter("Layout"), 17u);
    BOOST_CHECK_EQUAL(registry.next(), 18u);

    // Namespaces added later start at the high-water mark
    registry.registerNamespace("Scene");
    BOOST_CHECK_EQUAL(registry.namespaceCounter("Scene"), 18u);
}

BOOST_AUTO_TEST_CASE(TestObserveLowerValueKeepsMirror) {
    registry.observe("Scene", 10);
    registry.observe("Scene", 4);
    BOOST_CHECK_EQUAL(registry.namespaceCounter("Scene"), 10u);
    BOOST_CHECK_EQUAL(registry.next(), 11u);
}

BOOST_AUTO_TEST_CASE(TestRegisterDoesNotResetExisting) {
    registry.observe("Scene", 9);
    registry.registerNamespace("Scene");
    BOOST_CHECK_EQUAL(registry.namespaceCounter("Scene"), 9u);

    std::vector<std::string> names = registry.namespaces();
    BOOST_CHECK_EQUAL(names.size(), 1);
    BOOST_CHECK(std::find(names.begin(), names.end(), "Scene") != names.end());
}

BOOST_AUTO_TEST_CASE(TestSeparateStatesAreIndependent) {
    CounterState otherState;
    CounterRegistry other(otherState);
    registry.reconcile(100);
    BOOST_CHECK_EQUAL(other.next(), 1u);
    BOOST_CHECK_EQUAL(registry.next(), 101u);
}

BOOST_AUTO_TEST_SUITE_END()
