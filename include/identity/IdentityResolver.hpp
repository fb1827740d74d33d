/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IDENTITY_RESOLVER_HPP
#define IDENTITY_RESOLVER_HPP

/**
 * @file IdentityResolver.hpp
 * @brief Lazy id assignment, id -> entity resolution, collision repair
 *
 * One resolver serves one collection of an EntityPool. It keeps no index and
 * no cache: every entry point takes a fresh snapshot of the collection, so it
 * stays correct whatever the host did to the pool between calls (create,
 * delete, undo, duplicate). Resolution is O(entities in the collection).
 *
 * Ids are assigned on first ensureId(), not at entity creation. A host copy
 * made after that point carries the same stored id, and nothing signals that
 * a duplication happened. Instead, every ensureId() and resolve() checks the
 * id it touches: when several entities hold it, the one visited first in scan
 * order keeps it and every later holder is reassigned a fresh id in place.
 * Collisions therefore persist until one of the holders is accessed.
 *
 * Library offsets:
 *   An entity linked from a Library entity L has effective id
 *   stored + (id(L) + 1) * libraryIdSpace. ensureId(), peekId(), resolve()
 *   and collision checks all work on effective ids; the counter floor only
 *   considers stored ids. Without a library resolver every entity is local.
 *
 * THREADING CONTRACT: main thread only. The counter itself is atomic, but
 * snapshots are not serialized against pool mutation.
 */

#include "core/IdentityConfig.hpp"
#include "identity/CounterRegistry.hpp"
#include "scene/EntityPool.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace Tether {

struct ResolverStats {
    uint64_t scans{0};        // full collection snapshots taken
    uint64_t allocations{0};  // ids assigned to entities that had none
    uint64_t repairs{0};      // entities reassigned after a collision
    uint64_t swept{0};        // ids cleared by sweepDuplicates()
};

class IdentityResolver {
public:
    IdentityResolver(EntityPool& pool, CounterRegistry& registry,
                     CollectionKind kind,
                     StableId libraryIdSpace = IdentityConfig::DEFAULT_LIBRARY_ID_SPACE);

    IdentityResolver(const IdentityResolver&) = delete;
    IdentityResolver& operator=(const IdentityResolver&) = delete;

    /// Resolver of the Library collection, used for effective-id offsets
    void setLibraryResolver(IdentityResolver* libraries) { m_libraries = libraries; }

    CollectionKind kind() const { return m_kind; }

    /**
     * @brief Effective id of an entity, without side effects
     * @return nullopt if the entity has no id yet (a stored 0 counts as none),
     *         is not alive, or is linked from a library that has no id yet
     */
    [[nodiscard]] OptionalId peekId(const EntityHandle& entity) const;

    /**
     * @brief Returns the entity's effective id, assigning one if needed
     *
     * MUTATES: assigns a fresh id to an entity that has none (after raising
     * the counter floor above every stored id in the collection), and
     * reassigns every later-scanned holder of the entity's id if it is
     * shared. The entity itself may be reassigned if another entity precedes
     * it in scan order.
     *
     * @throws std::invalid_argument if entity is stale or belongs to another
     *         collection
     */
    StableId ensureId(const EntityHandle& entity);

    /**
     * @brief Finds the entity currently holding an effective id
     * @return nullopt ("unresolved") when no live entity holds it
     *
     * Also repairs the id if several entities hold it; the first in scan
     * order is returned.
     */
    std::optional<EntityHandle> resolve(StableId id);

    /**
     * @brief Runs the collision check for the entity's current id
     * @return Number of entities reassigned (0 when the id is unique or unset)
     */
    size_t repairCollisions(const EntityHandle& entity);

    /**
     * @brief Load-time pass: clears the stored id of every entity whose
     * effective id was already seen in `order`. Cleared entities receive a
     * fresh id lazily on next ensureId().
     * @return Number of ids cleared
     */
    size_t sweepDuplicates(SweepOrder order);

    /// Highest stored (not effective) id in the collection; 0 when none
    StableId maxStoredId() const;

    const ResolverStats& stats() const { return m_stats; }

private:
    struct ScanEntry {
        EntityHandle entity;
        OptionalId stored;
        OptionalId effective;
    };

    std::vector<ScanEntry> takeSnapshot();
    OptionalId storedId(const EntityHandle& entity) const;
    void requireMember(const EntityHandle& entity) const;
    StableId libraryOffset(const EntityHandle& entity);
    StableId allocate(const EntityHandle& entity, const std::vector<ScanEntry>& snapshot);
    StableId freshId(const std::vector<ScanEntry>& snapshot);
    size_t repairHolders(StableId effectiveId, const std::vector<ScanEntry>& snapshot);
    void syncNamespaceCounters();

    EntityPool& m_pool;
    CounterRegistry& m_registry;
    CollectionKind m_kind;
    StableId m_libraryIdSpace;
    IdentityResolver* m_libraries{nullptr};
    ResolverStats m_stats;
};

} // namespace Tether

#endif // IDENTITY_RESOLVER_HPP
