/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IDENTITY_SERVICE_HPP
#define IDENTITY_SERVICE_HPP

#include "core/IdentityConfig.hpp"
#include "identity/CounterRegistry.hpp"
#include "identity/CounterState.hpp"
#include "identity/IdentityResolver.hpp"
#include "scene/EntityPool.hpp"
#include <array>
#include <memory>

namespace Tether {

/**
 * @brief Owns the identity core for every collection of one pool
 *
 * Per CollectionKind it owns a CounterState, a CounterRegistry and an
 * IdentityResolver, and wires every non-Library resolver to the Library
 * resolver for effective-id offsets. The service is owned by the caller;
 * create a fresh one per pool (or per test) rather than sharing one.
 *
 * Usage:
 *   ScenePool pool;
 *   IdentityService service(pool, config);
 *   service.onPoolLoaded();      // after the host restored the pool
 *   StableId id = service.resolver(CollectionKind::Object).ensureId(entity);
 */
class IdentityService {
public:
    explicit IdentityService(EntityPool& pool, IdentityConfig config = {});

    IdentityService(const IdentityService&) = delete;
    IdentityService& operator=(const IdentityService&) = delete;

    IdentityResolver& resolver(CollectionKind kind);
    CounterRegistry& registry(CollectionKind kind);
    const IdentityConfig& config() const { return m_config; }
    EntityPool& pool() { return m_pool; }

    /**
     * @brief Host hook for "pool restored from storage"
     *
     * Pulls every namespace's persisted counter into the registries and,
     * when sweepOnLoad is set, clears duplicate ids in every collection.
     * @return Total number of ids cleared
     */
    size_t onPoolLoaded();

private:
    struct CollectionIdentity {
        CollectionIdentity(EntityPool& pool, CollectionKind kind,
                           const IdentityConfig& config);

        CounterState state;
        CounterRegistry registry;
        IdentityResolver resolver;
    };

    CollectionIdentity& at(CollectionKind kind);

    EntityPool& m_pool;
    IdentityConfig m_config;
    std::array<std::unique_ptr<CollectionIdentity>, COLLECTION_COUNT> m_collections;
};

} // namespace Tether

#endif // IDENTITY_SERVICE_HPP
