/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE IdentityServiceTests
#include <boost/test/unit_test.hpp>

#include "identity/IdentityService.hpp"
#include "identity/ReferenceField.hpp"
#include "scene/ScenePool.hpp"
#include <stdexcept>

using namespace Tether;

struct ServiceFixture {
    ScenePool pool;
    IdentityConfig config;

    ServiceFixture() {
        pool.createNamespace("Scene");
        pool.createNamespace("Layout");
        config.libraryIdSpace = 1000;
    }

    EntityHandle make(CollectionKind kind, const std::string& name,
                      const std::string& ns = "Scene") {
        return pool.createEntity(kind, ns, name);
    }
};

// ===================================================================
// Wiring
// ===================================================================

BOOST_FIXTURE_TEST_SUITE(WiringTests, ServiceFixture)

BOOST_AUTO_TEST_CASE(TestOneResolverPerCollection) {
    IdentityService service(pool, config);
    for (CollectionKind kind : ALL_COLLECTIONS) {
        BOOST_CHECK(service.resolver(kind).kind() == kind);
    }
    BOOST_CHECK_THROW(service.resolver(CollectionKind::COUNT), std::out_of_range);
    BOOST_CHECK_EQUAL(service.config().libraryIdSpace, 1000u);
    BOOST_CHECK(&service.pool() == &pool);
}

BOOST_AUTO_TEST_CASE(TestCollectionsHaveSeparateIdSpaces) {
    IdentityService service(pool, config);
    EntityHandle cube = make(CollectionKind::Object, "Cube");
    EntityHandle steel = make(CollectionKind::Material, "Steel");
    EntityHandle group = make(CollectionKind::Group, "Props");

    BOOST_CHECK_EQUAL(service.resolver(CollectionKind::Object).ensureId(cube), 1u);
    BOOST_CHECK_EQUAL(service.resolver(CollectionKind::Material).ensureId(steel), 1u);
    BOOST_CHECK_EQUAL(service.resolver(CollectionKind::Group).ensureId(group), 1u);
}

BOOST_AUTO_TEST_CASE(TestCounterStartFromConfig) {
    config.counterStart = 100;
    IdentityService service(pool, config);
    EntityHandle cube = make(CollectionKind::Object, "Cube");
    BOOST_CHECK_EQUAL(service.resolver(CollectionKind::Object).ensureId(cube), 100u);
}

BOOST_AUTO_TEST_CASE(TestDuplicateRepairFollowsCounterStart) {
    config.counterStart = 100;
    IdentityService service(pool, config);
    service.onPoolLoaded();
    IdentityResolver& objects = service.resolver(CollectionKind::Object);

    EntityHandle a = make(CollectionKind::Object, "A");
    EntityHandle b = make(CollectionKind::Object, "B");
    BOOST_CHECK_EQUAL(objects.ensureId(a), 100u);
    BOOST_CHECK_EQUAL(objects.ensureId(b), 101u);

    EntityHandle c = pool.duplicate(b);
    BOOST_CHECK_EQUAL(pool.getStoredId(c).value(), 101u);
    BOOST_CHECK_EQUAL(objects.ensureId(c), 102u);
    BOOST_CHECK_EQUAL(objects.peekId(b).value(), 101u);
}

BOOST_AUTO_TEST_CASE(TestNonLibraryCollectionsUseLibraryOffsets) {
    IdentityService service(pool, config);
    EntityHandle lib = make(CollectionKind::Library, "props.blend");
    EntityHandle steel = make(CollectionKind::Material, "Steel");
    EntityHandle chair = make(CollectionKind::Object, "Chair");
    pool.linkLibrary(steel, lib);
    pool.linkLibrary(chair, lib);

    BOOST_CHECK_EQUAL(service.resolver(CollectionKind::Material).ensureId(steel), 2001u);
    BOOST_CHECK_EQUAL(service.resolver(CollectionKind::Object).ensureId(chair), 2001u);
    BOOST_CHECK_EQUAL(service.resolver(CollectionKind::Library).peekId(lib).value(), 1u);
}

BOOST_AUTO_TEST_CASE(TestServicesAreIsolated) {
    IdentityService first(pool, config);
    EntityHandle a = make(CollectionKind::Object, "A");
    first.resolver(CollectionKind::Object).ensureId(a);

    ScenePool otherPool;
    otherPool.createNamespace("Scene");
    IdentityService second(otherPool, config);
    EntityHandle b = otherPool.createEntity(CollectionKind::Object, "Scene", "B");
    BOOST_CHECK_EQUAL(second.resolver(CollectionKind::Object).ensureId(b), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

// ===================================================================
// Pool load
// ===================================================================

BOOST_FIXTURE_TEST_SUITE(PoolLoadTests, ServiceFixture)

BOOST_AUTO_TEST_CASE(TestPersistedCountersAreObserved) {
    pool.setNamespaceCounter("Layout", CollectionKind::Object, 20);
    IdentityService service(pool, config);
    service.onPoolLoaded();

    CounterRegistry& objects = service.registry(CollectionKind::Object);
    BOOST_CHECK_EQUAL(objects.peek(), 21u);
    BOOST_CHECK_EQUAL(objects.namespaceCounter("Layout"), 20u);
    BOOST_CHECK_EQUAL(objects.namespaces().size(), 2);

    // Other collections are unaffected
    BOOST_CHECK_EQUAL(service.registry(CollectionKind::Material).peek(), 1u);

    EntityHandle cube = make(CollectionKind::Object, "Cube", "Scene");
    BOOST_CHECK_EQUAL(service.resolver(CollectionKind::Object).ensureId(cube), 21u);
}

BOOST_AUTO_TEST_CASE(TestSweepOnLoad) {
    EntityHandle a = make(CollectionKind::Object, "A");
    EntityHandle b = make(CollectionKind::Object, "B");
    EntityHandle steel = make(CollectionKind::Material, "Steel");
    EntityHandle iron = make(CollectionKind::Material, "Iron");
    pool.setStoredId(a, 3);
    pool.setStoredId(b, 3);
    pool.setStoredId(steel, 1);
    pool.setStoredId(iron, 1);

    IdentityService service(pool, config);
    BOOST_CHECK_EQUAL(service.onPoolLoaded(), 2u);
    BOOST_CHECK_EQUAL(pool.getStoredId(a).value(), 3u);
    BOOST_CHECK(!pool.getStoredId(b).has_value());
    BOOST_CHECK_EQUAL(pool.getStoredId(steel).value(), 1u);
    BOOST_CHECK(!pool.getStoredId(iron).has_value());

    // The cleared entity is assigned fresh on next access
    BOOST_CHECK_EQUAL(service.resolver(CollectionKind::Object).ensureId(b), 4u);
}

BOOST_AUTO_TEST_CASE(TestSweepOrderFromConfig) {
    EntityHandle a = make(CollectionKind::Object, "A");
    EntityHandle b = make(CollectionKind::Object, "B");
    pool.setStoredId(a, 3);
    pool.setStoredId(b, 3);

    config.sweepOrder = SweepOrder::NameDescending;
    IdentityService service(pool, config);
    BOOST_CHECK_EQUAL(service.onPoolLoaded(), 1u);
    BOOST_CHECK(!pool.getStoredId(a).has_value());
    BOOST_CHECK_EQUAL(pool.getStoredId(b).value(), 3u);
}

BOOST_AUTO_TEST_CASE(TestSweepDisabled) {
    EntityHandle a = make(CollectionKind::Object, "A");
    EntityHandle b = make(CollectionKind::Object, "B");
    pool.setStoredId(a, 3);
    pool.setStoredId(b, 3);

    config.sweepOnLoad = false;
    IdentityService service(pool, config);
    BOOST_CHECK_EQUAL(service.onPoolLoaded(), 0u);
    BOOST_CHECK_EQUAL(pool.getStoredId(b).value(), 3u);

    // Lazy repair still applies
    BOOST_CHECK_EQUAL(service.resolver(CollectionKind::Object).ensureId(b), 4u);
}

BOOST_AUTO_TEST_CASE(TestLibrariesAreSweptFirst) {
    EntityHandle first = make(CollectionKind::Library, "a.blend");
    EntityHandle second = make(CollectionKind::Library, "b.blend");
    pool.setStoredId(first, 1);
    pool.setStoredId(second, 1);

    EntityHandle fromFirst = make(CollectionKind::Object, "Lamp");
    EntityHandle fromSecond = make(CollectionKind::Object, "Lamp");
    pool.linkLibrary(fromFirst, first);
    pool.linkLibrary(fromSecond, second);
    pool.setStoredId(fromFirst, 1);
    pool.setStoredId(fromSecond, 1);

    // Once the libraries are told apart, the linked objects no longer collide
    IdentityService service(pool, config);
    BOOST_CHECK_EQUAL(service.onPoolLoaded(), 1u);
    BOOST_CHECK_EQUAL(pool.getStoredId(fromFirst).value(), 1u);
    BOOST_CHECK_EQUAL(pool.getStoredId(fromSecond).value(), 1u);

    IdentityResolver& objects = service.resolver(CollectionKind::Object);
    BOOST_CHECK_NE(objects.peekId(fromFirst).value(), objects.peekId(fromSecond).value());
}

BOOST_AUTO_TEST_SUITE_END()

// ===================================================================
// End to end
// ===================================================================

BOOST_FIXTURE_TEST_SUITE(EndToEndTests, ServiceFixture)

BOOST_AUTO_TEST_CASE(TestReferenceAcrossNamespaces) {
    IdentityService service(pool, config);
    service.onPoolLoaded();

    EntityHandle rig = make(CollectionKind::Object, "Rig", "Layout");
    EntityHandle camera = make(CollectionKind::Object, "Camera", "Scene");
    ReferenceField target(pool, service.resolver(CollectionKind::Object), "target");

    target.set(rig, camera);
    EntityHandle copy = pool.duplicate(camera);
    pool.rename(camera, "MainCamera");

    // The copy carries the same id; resolving repairs it and keeps the original
    BOOST_CHECK(target.get(rig) == camera);
    BOOST_CHECK_EQUAL(target.displayValue(rig), "MainCamera");
    BOOST_CHECK_NE(service.resolver(CollectionKind::Object).peekId(copy).value(),
                   target.peekStoredId(rig).value());
}

BOOST_AUTO_TEST_SUITE_END()
