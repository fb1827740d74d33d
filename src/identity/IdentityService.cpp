/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "identity/IdentityService.hpp"
#include "core/Logger.hpp"
#include <format>
#include <stdexcept>

namespace Tether {

IdentityService::CollectionIdentity::CollectionIdentity(EntityPool& pool,
                                                        CollectionKind kind,
                                                        const IdentityConfig& config)
    : state(config.counterStart), registry(state),
      resolver(pool, registry, kind, config.libraryIdSpace) {}

IdentityService::IdentityService(EntityPool& pool, IdentityConfig config)
    : m_pool(pool), m_config(config) {
    for (CollectionKind kind : ALL_COLLECTIONS) {
        m_collections[static_cast<size_t>(kind)] =
            std::make_unique<CollectionIdentity>(m_pool, kind, m_config);
    }

    // Library entities are always local, so only the others get offsets
    IdentityResolver& libraries = resolver(CollectionKind::Library);
    for (CollectionKind kind : ALL_COLLECTIONS) {
        if (kind != CollectionKind::Library) {
            resolver(kind).setLibraryResolver(&libraries);
        }
    }
}

IdentityResolver& IdentityService::resolver(CollectionKind kind) {
    return at(kind).resolver;
}

CounterRegistry& IdentityService::registry(CollectionKind kind) {
    return at(kind).registry;
}

size_t IdentityService::onPoolLoaded() {
    for (CollectionKind kind : ALL_COLLECTIONS) {
        CounterRegistry& counters = registry(kind);
        for (const std::string& ns : m_pool.getNamespaces()) {
            if (OptionalId persisted = m_pool.getNamespaceCounter(ns, kind)) {
                counters.observe(ns, *persisted);
            } else {
                counters.registerNamespace(ns);
            }
        }
    }

    if (!m_config.sweepOnLoad) {
        SERVICE_INFO("Pool loaded, duplicate sweep disabled");
        return 0;
    }

    // Libraries first: their ids feed the effective ids of everything else
    size_t cleared = resolver(CollectionKind::Library).sweepDuplicates(m_config.sweepOrder);
    for (CollectionKind kind : ALL_COLLECTIONS) {
        if (kind != CollectionKind::Library) {
            cleared += resolver(kind).sweepDuplicates(m_config.sweepOrder);
        }
    }

    SERVICE_INFO(std::format("Pool loaded, {} duplicate ids cleared", cleared));
    return cleared;
}

IdentityService::CollectionIdentity& IdentityService::at(CollectionKind kind) {
    if (kind >= CollectionKind::COUNT) {
        throw std::out_of_range("Unknown collection kind");
    }
    return *m_collections[static_cast<size_t>(kind)];
}

} // namespace Tether
