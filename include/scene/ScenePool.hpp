/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCENE_POOL_HPP
#define SCENE_POOL_HPP

/**
 * @file ScenePool.hpp
 * @brief In-memory EntityPool: scenes, named entities, duplication
 *
 * ScenePool is a pure data store standing in for a host application's object
 * model. It owns, per collection:
 * - slot records (name, namespace, stored id, reference fields, library link)
 * - a free list with generation bump for stale-handle detection
 * - a name index enforcing unique names per collection
 *
 * Enumeration order is creation order. Destroyed slots are reused for new
 * handles, but a new or duplicated entity is always visited after every
 * older one, so the original of a copy wins an id collision.
 *
 * duplicate() copies the stored id and every reference field verbatim,
 * bypassing the identity allocator, the same way a host's copy/paste or
 * library link would.
 *
 * THREADING CONTRACT: main thread only, no internal locking.
 */

#include "scene/EntityPool.hpp"
#include <array>
#include <boost/container/flat_map.hpp>
#include <string>
#include <vector>

namespace Tether {

class ScenePool : public EntityPool {
public:
    ScenePool() = default;
    ~ScenePool() override = default;

    ScenePool(const ScenePool&) = delete;
    ScenePool& operator=(const ScenePool&) = delete;

    /**
     * @brief Adds a namespace (scene)
     * @throws std::invalid_argument if name is empty
     * @return false if the namespace already exists
     */
    bool createNamespace(const std::string& name);
    bool hasNamespace(const std::string& name) const;

    /**
     * @brief Creates an entity with no stored id
     * @param name Requested name; a taken name gets a ".001"-style suffix
     * @throws std::invalid_argument if name is empty
     * @return INVALID_ENTITY_HANDLE if the namespace does not exist
     */
    EntityHandle createEntity(CollectionKind kind, const std::string& ns,
                              const std::string& name);

    /**
     * @brief Out-of-band copy into the source's namespace
     *
     * The copy gets a unique name derived from the source's name and the
     * source's stored id, reference fields and library link, unchanged.
     */
    EntityHandle duplicate(const EntityHandle& source);

    /// Renames in place; fails if the name is empty or held by another entity
    bool rename(const EntityHandle& entity, const std::string& newName);

    bool destroy(const EntityHandle& entity);

    /// Marks entity as linked from a Library-collection entity
    bool linkLibrary(const EntityHandle& entity, const EntityHandle& library);

    size_t entityCount(CollectionKind kind) const;

    // EntityPool
    void forEachEntity(CollectionKind kind,
                       const EntityVisitor& visitor) const override;
    bool isAlive(const EntityHandle& entity) const override;

    OptionalId getStoredId(const EntityHandle& entity) const override;
    void setStoredId(const EntityHandle& entity, OptionalId id) override;

    OptionalId getFieldValue(const EntityHandle& owner,
                             const std::string& key) const override;
    void setFieldValue(const EntityHandle& owner, const std::string& key,
                       OptionalId value) override;

    std::string getDisplayName(const EntityHandle& entity) const override;
    EntityHandle findByName(CollectionKind kind,
                            const std::string& name) const override;
    EntityHandle getLibrary(const EntityHandle& entity) const override;

    std::vector<std::string> getNamespaces() const override;
    std::string getNamespaceOf(const EntityHandle& entity) const override;
    OptionalId getNamespaceCounter(const std::string& ns,
                                   CollectionKind kind) const override;
    void setNamespaceCounter(const std::string& ns, CollectionKind kind,
                             StableId value) override;

private:
    struct EntityRecord {
        std::string name;
        std::string ns;
        OptionalId storedId;
        boost::container::flat_map<std::string, StableId> fields;
        EntityHandle library{INVALID_ENTITY_HANDLE};
        EntityHandle::Generation generation{EntityHandle::INVALID_GENERATION};
        bool alive{false};
    };

    struct CollectionStore {
        std::vector<EntityRecord> records;
        std::vector<EntityHandle::SlotType> freeSlots;
        boost::container::flat_map<std::string, EntityHandle::SlotType> byName;
        // Live slots in creation order; a reused slot goes to the back
        std::vector<EntityHandle::SlotType> scanOrder;
    };

    using NamespaceCounters = std::array<OptionalId, COLLECTION_COUNT>;

    CollectionStore& store(CollectionKind kind);
    const CollectionStore& store(CollectionKind kind) const;

    EntityRecord* lookup(const EntityHandle& entity);
    const EntityRecord* lookup(const EntityHandle& entity) const;

    EntityHandle allocate(CollectionKind kind, EntityRecord record);
    std::string makeUniqueName(CollectionKind kind, const std::string& requested) const;

    std::array<CollectionStore, COLLECTION_COUNT> m_collections;
    boost::container::flat_map<std::string, NamespaceCounters> m_namespaces;
};

} // namespace Tether

#endif // SCENE_POOL_HPP
