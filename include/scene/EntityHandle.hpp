/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_HANDLE_HPP
#define ENTITY_HANDLE_HPP

#include <array>
#include <cstdint>
#include <format>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace Tether {

/**
 * @brief Stable identifier stored on an entity. Zero never appears in
 * storage; an entity without an id holds std::nullopt.
 */
using StableId = uint64_t;
using OptionalId = std::optional<StableId>;

/**
 * @brief Entity collections. Each collection is a separate id value-space
 * with its own counter, shared by every namespace.
 */
enum class CollectionKind : uint8_t {
    Object = 0,
    Material = 1,
    Group = 2,
    Library = 3,

    COUNT
};

inline constexpr size_t COLLECTION_COUNT = static_cast<size_t>(CollectionKind::COUNT);

inline constexpr std::array<CollectionKind, COLLECTION_COUNT> ALL_COLLECTIONS{
    CollectionKind::Object, CollectionKind::Material, CollectionKind::Group,
    CollectionKind::Library};

/// Returns string name for CollectionKind (for debugging)
constexpr const char* collectionToString(CollectionKind kind) noexcept {
    switch (kind) {
        case CollectionKind::Object:   return "Object";
        case CollectionKind::Material: return "Material";
        case CollectionKind::Group:    return "Group";
        case CollectionKind::Library:  return "Library";
        default:                       return "Unknown";
    }
}

/**
 * @brief Lightweight handle for referencing a host entity
 *
 * A handle names a pool slot plus the generation it was issued for, so a
 * handle to a destroyed entity never aliases the slot's next occupant.
 * Handles are host bookkeeping only: they are never persisted and carry no
 * stable identity of their own. Stable identity is the StableId assigned by
 * IdentityResolver.
 */
struct EntityHandle {
    using SlotType = uint32_t;
    using Generation = uint16_t;

    static constexpr Generation INVALID_GENERATION = 0;

    SlotType slot{0};
    Generation generation{INVALID_GENERATION};
    CollectionKind kind{CollectionKind::Object};

    constexpr EntityHandle() noexcept = default;

    constexpr EntityHandle(SlotType entitySlot, Generation gen,
                           CollectionKind entityKind) noexcept
        : slot(entitySlot), generation(gen), kind(entityKind) {}

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return generation != INVALID_GENERATION;
    }

    [[nodiscard]] constexpr bool
    operator==(const EntityHandle& other) const noexcept {
        return slot == other.slot && generation == other.generation &&
               kind == other.kind;
    }

    [[nodiscard]] constexpr bool
    operator!=(const EntityHandle& other) const noexcept {
        return !(*this == other);
    }

    [[nodiscard]] std::size_t hash() const noexcept {
        std::size_t h = static_cast<std::size_t>(slot);
        h ^= static_cast<std::size_t>(generation) << 32;
        h ^= static_cast<std::size_t>(kind) << 48;
        return h;
    }

    [[nodiscard]] std::string toString() const {
        if (!isValid()) {
            return "EntityHandle::INVALID";
        }
        return std::format("EntityHandle({}:{}:{})", collectionToString(kind),
                           slot, generation);
    }
};

inline constexpr EntityHandle INVALID_ENTITY_HANDLE{};

// Stream output operator for debugging and Boost.Test messages
inline std::ostream& operator<<(std::ostream& os, const EntityHandle& handle) {
    return os << handle.toString();
}

inline std::ostream& operator<<(std::ostream& os, CollectionKind kind) {
    return os << collectionToString(kind);
}

} // namespace Tether

namespace std {
template <>
struct hash<Tether::EntityHandle> {
    std::size_t operator()(const Tether::EntityHandle& handle) const noexcept {
        return handle.hash();
    }
};
} // namespace std

#endif // ENTITY_HANDLE_HPP
