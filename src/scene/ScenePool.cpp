/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "scene/ScenePool.hpp"
#include "core/Logger.hpp"
#include <cctype>
#include <format>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Tether {

namespace {

// "Cube.001" -> "Cube"; names without a three-digit suffix are returned as-is
std::string stripNumericSuffix(const std::string& name) {
    if (name.size() < 5 || name[name.size() - 4] != '.') {
        return name;
    }
    for (size_t i = name.size() - 3; i < name.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
            return name;
        }
    }
    return name.substr(0, name.size() - 4);
}

} // anonymous namespace

bool ScenePool::createNamespace(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("ScenePool namespace name must not be empty");
    }

    auto [it, inserted] = m_namespaces.try_emplace(name);
    if (!inserted) {
        POOL_WARN(std::format("Namespace '{}' already exists", name));
        return false;
    }

    POOL_DEBUG(std::format("Created namespace '{}'", name));
    return true;
}

bool ScenePool::hasNamespace(const std::string& name) const {
    return m_namespaces.find(name) != m_namespaces.end();
}

EntityHandle ScenePool::createEntity(CollectionKind kind, const std::string& ns,
                                     const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("ScenePool entity name must not be empty");
    }
    if (!hasNamespace(ns)) {
        POOL_ERROR(std::format("Cannot create {} '{}': unknown namespace '{}'",
                               collectionToString(kind), name, ns));
        return INVALID_ENTITY_HANDLE;
    }

    EntityRecord record;
    record.name = makeUniqueName(kind, name);
    record.ns = ns;
    return allocate(kind, std::move(record));
}

EntityHandle ScenePool::duplicate(const EntityHandle& source) {
    const EntityRecord* original = lookup(source);
    if (original == nullptr) {
        POOL_ERROR("Cannot duplicate stale handle " + source.toString());
        return INVALID_ENTITY_HANDLE;
    }

    EntityRecord copy;
    copy.name = makeUniqueName(source.kind, original->name);
    copy.ns = original->ns;
    copy.storedId = original->storedId;
    copy.fields = original->fields;
    copy.library = original->library;

    // allocate() may grow the record vector, so `original` is not used past here
    return allocate(source.kind, std::move(copy));
}

bool ScenePool::rename(const EntityHandle& entity, const std::string& newName) {
    EntityRecord* record = lookup(entity);
    if (record == nullptr || newName.empty()) {
        return false;
    }
    if (record->name == newName) {
        return true;
    }

    CollectionStore& col = store(entity.kind);
    if (col.byName.find(newName) != col.byName.end()) {
        POOL_WARN(std::format("Rename to '{}' rejected: name in use", newName));
        return false;
    }

    col.byName.erase(record->name);
    col.byName.emplace(newName, entity.slot);
    record->name = newName;
    return true;
}

bool ScenePool::destroy(const EntityHandle& entity) {
    EntityRecord* record = lookup(entity);
    if (record == nullptr) {
        return false;
    }

    CollectionStore& col = store(entity.kind);
    col.byName.erase(record->name);
    record->alive = false;
    record->fields.clear();
    record->storedId.reset();
    col.freeSlots.push_back(entity.slot);
    std::erase(col.scanOrder, entity.slot);
    return true;
}

bool ScenePool::linkLibrary(const EntityHandle& entity, const EntityHandle& library) {
    EntityRecord* record = lookup(entity);
    if (record == nullptr) {
        return false;
    }
    if (library.kind != CollectionKind::Library || !isAlive(library)) {
        POOL_ERROR("Library link target is not a live Library entity: " +
                   library.toString());
        return false;
    }

    record->library = library;
    return true;
}

size_t ScenePool::entityCount(CollectionKind kind) const {
    return store(kind).scanOrder.size();
}

void ScenePool::forEachEntity(CollectionKind kind,
                              const EntityVisitor& visitor) const {
    const CollectionStore& col = store(kind);
    for (EntityHandle::SlotType slot : col.scanOrder) {
        visitor(EntityHandle{slot, col.records[slot].generation, kind});
    }
}

bool ScenePool::isAlive(const EntityHandle& entity) const {
    return lookup(entity) != nullptr;
}

OptionalId ScenePool::getStoredId(const EntityHandle& entity) const {
    const EntityRecord* record = lookup(entity);
    return record ? record->storedId : std::nullopt;
}

void ScenePool::setStoredId(const EntityHandle& entity, OptionalId id) {
    EntityRecord* record = lookup(entity);
    if (record == nullptr) {
        POOL_WARN("setStoredId on stale handle " + entity.toString());
        return;
    }
    record->storedId = id;
}

OptionalId ScenePool::getFieldValue(const EntityHandle& owner,
                                    const std::string& key) const {
    const EntityRecord* record = lookup(owner);
    if (record == nullptr) {
        return std::nullopt;
    }
    auto it = record->fields.find(key);
    if (it == record->fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ScenePool::setFieldValue(const EntityHandle& owner, const std::string& key,
                              OptionalId value) {
    EntityRecord* record = lookup(owner);
    if (record == nullptr) {
        POOL_WARN("setFieldValue on stale handle " + owner.toString());
        return;
    }

    if (value) {
        record->fields[key] = *value;
    } else {
        record->fields.erase(key);
    }
}

std::string ScenePool::getDisplayName(const EntityHandle& entity) const {
    const EntityRecord* record = lookup(entity);
    return record ? record->name : std::string{};
}

EntityHandle ScenePool::findByName(CollectionKind kind, const std::string& name) const {
    const CollectionStore& col = store(kind);
    auto it = col.byName.find(name);
    if (it == col.byName.end()) {
        return INVALID_ENTITY_HANDLE;
    }
    return EntityHandle{it->second, col.records[it->second].generation, kind};
}

EntityHandle ScenePool::getLibrary(const EntityHandle& entity) const {
    const EntityRecord* record = lookup(entity);
    if (record == nullptr || !isAlive(record->library)) {
        return INVALID_ENTITY_HANDLE;
    }
    return record->library;
}

std::vector<std::string> ScenePool::getNamespaces() const {
    std::vector<std::string> names;
    names.reserve(m_namespaces.size());
    for (const auto& [name, _] : m_namespaces) {
        names.push_back(name);
    }
    return names;
}

std::string ScenePool::getNamespaceOf(const EntityHandle& entity) const {
    const EntityRecord* record = lookup(entity);
    return record ? record->ns : std::string{};
}

OptionalId ScenePool::getNamespaceCounter(const std::string& ns,
                                          CollectionKind kind) const {
    auto it = m_namespaces.find(ns);
    if (it == m_namespaces.end()) {
        return std::nullopt;
    }
    return it->second[static_cast<size_t>(kind)];
}

void ScenePool::setNamespaceCounter(const std::string& ns, CollectionKind kind,
                                    StableId value) {
    auto it = m_namespaces.find(ns);
    if (it == m_namespaces.end()) {
        POOL_WARN(std::format("setNamespaceCounter on unknown namespace '{}'", ns));
        return;
    }
    it->second[static_cast<size_t>(kind)] = value;
}

ScenePool::CollectionStore& ScenePool::store(CollectionKind kind) {
    return m_collections[static_cast<size_t>(kind)];
}

const ScenePool::CollectionStore& ScenePool::store(CollectionKind kind) const {
    return m_collections[static_cast<size_t>(kind)];
}

ScenePool::EntityRecord* ScenePool::lookup(const EntityHandle& entity) {
    return const_cast<EntityRecord*>(std::as_const(*this).lookup(entity));
}

const ScenePool::EntityRecord* ScenePool::lookup(const EntityHandle& entity) const {
    if (!entity.isValid() || entity.kind >= CollectionKind::COUNT) {
        return nullptr;
    }
    const CollectionStore& col = store(entity.kind);
    if (entity.slot >= col.records.size()) {
        return nullptr;
    }
    const EntityRecord& record = col.records[entity.slot];
    if (!record.alive || record.generation != entity.generation) {
        return nullptr;
    }
    return &record;
}

EntityHandle ScenePool::allocate(CollectionKind kind, EntityRecord record) {
    CollectionStore& col = store(kind);

    EntityHandle::SlotType slot;
    EntityHandle::Generation previous = EntityHandle::INVALID_GENERATION;
    if (!col.freeSlots.empty()) {
        slot = col.freeSlots.back();
        col.freeSlots.pop_back();
        previous = col.records[slot].generation;
    } else {
        slot = static_cast<EntityHandle::SlotType>(col.records.size());
        col.records.emplace_back();
    }

    // Generation 0 is reserved for invalid handles
    EntityHandle::Generation generation = static_cast<EntityHandle::Generation>(previous + 1);
    if (generation == EntityHandle::INVALID_GENERATION) {
        generation = 1;
    }

    record.generation = generation;
    record.alive = true;
    col.byName.emplace(record.name, slot);
    col.records[slot] = std::move(record);
    col.scanOrder.push_back(slot);

    EntityHandle handle{slot, generation, kind};
    POOL_DEBUG(std::format("Created '{}' as {}", col.records[slot].name,
                           handle.toString()));
    return handle;
}

std::string ScenePool::makeUniqueName(CollectionKind kind,
                                      const std::string& requested) const {
    const CollectionStore& col = store(kind);
    if (col.byName.find(requested) == col.byName.end()) {
        return requested;
    }

    const std::string base = stripNumericSuffix(requested);
    for (int suffix = 1;; ++suffix) {
        std::string candidate = std::format("{}.{:03}", base, suffix);
        if (col.byName.find(candidate) == col.byName.end()) {
            return candidate;
        }
    }
}

} // namespace Tether
