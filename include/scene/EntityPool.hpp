/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_POOL_HPP
#define ENTITY_POOL_HPP

/**
 * @file EntityPool.hpp
 * @brief Host contract consumed by the identity core
 *
 * The identity core never creates or destroys entities. Everything it needs
 * from the host application goes through this interface:
 * - an ordered, repeatable enumeration of live entities per collection
 * - one optional stored id per entity
 * - optional reference-field values per entity, keyed by string
 * - display names and lookup by name (UI convenience only)
 * - the namespace list and a per-namespace counter mirror the host persists
 *
 * THREADING CONTRACT:
 * - All calls are made from the host's main thread. The enumeration order
 *   only has to be stable for the duration of one forEachEntity() call.
 * - Visitors passed to forEachEntity() must not mutate the pool. The
 *   identity core snapshots the enumeration before writing anything back.
 */

#include "scene/EntityHandle.hpp"
#include <functional>
#include <string>
#include <vector>

namespace Tether {

class EntityPool {
public:
    using EntityVisitor = std::function<void(const EntityHandle&)>;

    virtual ~EntityPool() = default;

    // Enumeration
    virtual void forEachEntity(CollectionKind kind,
                               const EntityVisitor& visitor) const = 0;
    virtual bool isAlive(const EntityHandle& entity) const = 0;

    // Id storage
    virtual OptionalId getStoredId(const EntityHandle& entity) const = 0;
    virtual void setStoredId(const EntityHandle& entity, OptionalId id) = 0;

    // Reference-field storage
    virtual OptionalId getFieldValue(const EntityHandle& owner,
                                     const std::string& key) const = 0;
    virtual void setFieldValue(const EntityHandle& owner, const std::string& key,
                               OptionalId value) = 0;

    // Display adaptation
    virtual std::string getDisplayName(const EntityHandle& entity) const = 0;
    virtual EntityHandle findByName(CollectionKind kind,
                                    const std::string& name) const = 0;

    /**
     * @brief Library entity this entity is linked from
     * @return INVALID_ENTITY_HANDLE for entities local to the pool
     */
    virtual EntityHandle getLibrary(const EntityHandle& entity) const = 0;

    // Namespaces and their counter mirrors
    virtual std::vector<std::string> getNamespaces() const = 0;
    virtual std::string getNamespaceOf(const EntityHandle& entity) const = 0;
    virtual OptionalId getNamespaceCounter(const std::string& ns,
                                           CollectionKind kind) const = 0;
    virtual void setNamespaceCounter(const std::string& ns, CollectionKind kind,
                                     StableId value) = 0;
};

} // namespace Tether

#endif // ENTITY_POOL_HPP
