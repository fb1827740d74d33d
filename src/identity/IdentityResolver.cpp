/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "identity/IdentityResolver.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <numeric>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace Tether {

IdentityResolver::IdentityResolver(EntityPool& pool, CounterRegistry& registry,
                                   CollectionKind kind, StableId libraryIdSpace)
    : m_pool(pool), m_registry(registry), m_kind(kind),
      m_libraryIdSpace(libraryIdSpace) {}

OptionalId IdentityResolver::peekId(const EntityHandle& entity) const {
    if (entity.kind != m_kind || !m_pool.isAlive(entity)) {
        return std::nullopt;
    }

    OptionalId stored = storedId(entity);
    if (!stored) {
        return std::nullopt;
    }

    EntityHandle library = m_libraries ? m_pool.getLibrary(entity) : INVALID_ENTITY_HANDLE;
    if (!library.isValid()) {
        return stored;
    }

    OptionalId libraryId = m_libraries->peekId(library);
    if (!libraryId) {
        return std::nullopt;
    }
    return *stored + (*libraryId + 1) * m_libraryIdSpace;
}

StableId IdentityResolver::ensureId(const EntityHandle& entity) {
    requireMember(entity);

    std::vector<ScanEntry> snapshot = takeSnapshot();
    auto it = std::find_if(snapshot.begin(), snapshot.end(),
                           [&entity](const ScanEntry& entry) {
                               return entry.entity == entity;
                           });

    OptionalId effective;
    if (it != snapshot.end()) {
        effective = it->effective;
    } else if (OptionalId stored = storedId(entity)) {
        // Host did not enumerate a live entity; work from its storage alone
        effective = *stored + libraryOffset(entity);
    }

    if (!effective) {
        return allocate(entity, snapshot);
    }

    repairHolders(*effective, snapshot);

    // The entity itself may have lost the tie-break
    return *storedId(entity) + libraryOffset(entity);
}

std::optional<EntityHandle> IdentityResolver::resolve(StableId id) {
    if (id == 0) {
        return std::nullopt;
    }

    std::vector<ScanEntry> snapshot = takeSnapshot();
    auto first = std::find_if(snapshot.begin(), snapshot.end(),
                              [id](const ScanEntry& entry) {
                                  return entry.effective == id;
                              });
    if (first == snapshot.end()) {
        return std::nullopt;
    }

    EntityHandle winner = first->entity;
    repairHolders(id, snapshot);
    return winner;
}

size_t IdentityResolver::repairCollisions(const EntityHandle& entity) {
    requireMember(entity);

    std::vector<ScanEntry> snapshot = takeSnapshot();
    auto it = std::find_if(snapshot.begin(), snapshot.end(),
                           [&entity](const ScanEntry& entry) {
                               return entry.entity == entity;
                           });
    if (it == snapshot.end() || !it->effective) {
        return 0;
    }
    return repairHolders(*it->effective, snapshot);
}

size_t IdentityResolver::sweepDuplicates(SweepOrder order) {
    std::vector<ScanEntry> snapshot = takeSnapshot();

    std::vector<size_t> visitOrder(snapshot.size());
    std::iota(visitOrder.begin(), visitOrder.end(), size_t{0});

    if (order == SweepOrder::NameDescending) {
        std::vector<std::string> names;
        names.reserve(snapshot.size());
        for (const auto& entry : snapshot) {
            names.push_back(m_pool.getDisplayName(entry.entity));
        }
        std::stable_sort(visitOrder.begin(), visitOrder.end(),
                         [&names](size_t a, size_t b) { return names[a] > names[b]; });
    }

    std::unordered_set<StableId> seen;
    size_t cleared = 0;
    for (size_t index : visitOrder) {
        const ScanEntry& entry = snapshot[index];
        if (!entry.effective) {
            continue;
        }
        if (!seen.insert(*entry.effective).second) {
            IDENTITY_DEBUG(std::format("Sweep cleared duplicate id {} on '{}'",
                                       *entry.effective,
                                       m_pool.getDisplayName(entry.entity)));
            m_pool.setStoredId(entry.entity, std::nullopt);
            ++cleared;
        }
    }

    m_stats.swept += cleared;
    IDENTITY_INFO(std::format("{} sweep ({}) cleared {} duplicate ids over {} entities",
                              collectionToString(m_kind), sweepOrderToString(order),
                              cleared, snapshot.size()));
    return cleared;
}

StableId IdentityResolver::maxStoredId() const {
    StableId maxId = 0;
    m_pool.forEachEntity(m_kind, [this, &maxId](const EntityHandle& entity) {
        if (OptionalId stored = storedId(entity)) {
            maxId = std::max(maxId, *stored);
        }
    });
    return maxId;
}

std::vector<IdentityResolver::ScanEntry> IdentityResolver::takeSnapshot() {
    ++m_stats.scans;

    std::vector<ScanEntry> snapshot;
    m_pool.forEachEntity(m_kind, [this, &snapshot](const EntityHandle& entity) {
        snapshot.push_back({entity, storedId(entity), std::nullopt});
    });

    // Offsets are resolved after enumeration: the library resolver may assign
    // library ids, which must not happen while the host is iterating.
    std::unordered_map<EntityHandle, StableId> offsets;
    for (auto& entry : snapshot) {
        if (!entry.stored) {
            continue;
        }

        StableId offset = 0;
        EntityHandle library = m_libraries ? m_pool.getLibrary(entry.entity) : INVALID_ENTITY_HANDLE;
        if (library.isValid()) {
            auto cached = offsets.find(library);
            if (cached == offsets.end()) {
                cached = offsets.emplace(library, libraryOffset(entry.entity)).first;
            }
            offset = cached->second;
        }
        entry.effective = *entry.stored + offset;
    }

    return snapshot;
}

// 0 is never handed out; hosts use it as "no id yet"
OptionalId IdentityResolver::storedId(const EntityHandle& entity) const {
    OptionalId stored = m_pool.getStoredId(entity);
    if (stored == StableId{0}) {
        return std::nullopt;
    }
    return stored;
}

void IdentityResolver::requireMember(const EntityHandle& entity) const {
    if (entity.kind != m_kind) {
        throw std::invalid_argument(
            std::format("{} is not in the {} collection", entity.toString(),
                        collectionToString(m_kind)));
    }
    if (!m_pool.isAlive(entity)) {
        throw std::invalid_argument("Stale entity handle " + entity.toString());
    }
}

StableId IdentityResolver::libraryOffset(const EntityHandle& entity) {
    if (m_libraries == nullptr) {
        return 0;
    }
    EntityHandle library = m_pool.getLibrary(entity);
    if (!library.isValid()) {
        return 0;
    }
    return (m_libraries->ensureId(library) + 1) * m_libraryIdSpace;
}

StableId IdentityResolver::allocate(const EntityHandle& entity,
                                    const std::vector<ScanEntry>& snapshot) {
    StableId id = freshId(snapshot);
    m_pool.setStoredId(entity, id);
    ++m_stats.allocations;

    IDENTITY_DEBUG(std::format("Assigned {} id {} to '{}'", collectionToString(m_kind),
                               id, m_pool.getDisplayName(entity)));
    return id + libraryOffset(entity);
}

StableId IdentityResolver::freshId(const std::vector<ScanEntry>& snapshot) {
    // Counters persisted by the host per namespace are ground truth too
    for (const std::string& ns : m_pool.getNamespaces()) {
        if (OptionalId persisted = m_pool.getNamespaceCounter(ns, m_kind)) {
            m_registry.observe(ns, *persisted);
        } else {
            m_registry.registerNamespace(ns);
        }
    }

    StableId maxStored = 0;
    for (const auto& entry : snapshot) {
        if (entry.stored) {
            maxStored = std::max(maxStored, *entry.stored);
        }
    }
    m_registry.reconcile(maxStored);

    StableId id = m_registry.next();
    syncNamespaceCounters();
    return id;
}

size_t IdentityResolver::repairHolders(StableId effectiveId,
                                       const std::vector<ScanEntry>& snapshot) {
    std::vector<EntityHandle> holders;
    for (const auto& entry : snapshot) {
        if (entry.effective == effectiveId) {
            holders.push_back(entry.entity);
        }
    }
    if (holders.size() < 2) {
        return 0;
    }

    const std::string keeper = m_pool.getDisplayName(holders.front());
    for (size_t i = 1; i < holders.size(); ++i) {
        const EntityHandle& loser = holders[i];
        OptionalId previous = m_pool.getStoredId(loser);
        StableId replacement = freshId(snapshot);
        m_pool.setStoredId(loser, replacement);
        ++m_stats.repairs;

        IDENTITY_WARN(std::format(
            "{} id collision on {}: '{}' keeps it, '{}' reassigned {} -> {}",
            collectionToString(m_kind), effectiveId, keeper,
            m_pool.getDisplayName(loser), previous.value_or(0), replacement));
    }

    return holders.size() - 1;
}

void IdentityResolver::syncNamespaceCounters() {
    for (const std::string& ns : m_pool.getNamespaces()) {
        m_pool.setNamespaceCounter(ns, m_kind, m_registry.namespaceCounter(ns));
    }
}

} // namespace Tether
