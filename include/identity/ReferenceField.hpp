/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REFERENCE_FIELD_HPP
#define REFERENCE_FIELD_HPP

#include "identity/IdentityResolver.hpp"
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace Tether {

/**
 * @brief Thrown when a reference target is rejected. The owner's stored
 * value is left unchanged.
 */
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ReferenceFieldOptions {
    /// Label for UI layers; not interpreted by the field
    std::string displayName;
    /// Target filter; an empty function accepts any entity of the collection
    std::function<bool(const EntityHandle&)> validator;
};

/**
 * @brief A reference to another entity that survives renaming
 *
 * Read and written as an entity (or its current name), persisted on the
 * owner as the target's stable id under the key "<name>_id". get() resolves
 * the stored id through IdentityResolver on every call, so renames are
 * always reflected and a deleted target reads back as unresolved.
 *
 * Usage:
 *   ReferenceField target(pool, service.resolver(CollectionKind::Object),
 *                         "target", {"Target", isCamera});
 *   target.set(rig, cameraEntity);       // throws ValidationError if rejected
 *   std::string label = target.displayValue(rig); // current name or ""
 */
class ReferenceField {
public:
    /**
     * @throws std::invalid_argument if name is empty
     */
    ReferenceField(EntityPool& pool, IdentityResolver& resolver, std::string name,
                   ReferenceFieldOptions options = {});

    const std::string& name() const { return m_name; }
    const std::string& displayName() const { return m_options.displayName; }
    const std::string& valueKey() const { return m_valueKey; }
    CollectionKind collection() const { return m_resolver.kind(); }

    /**
     * @brief Current target of the owner's field
     * @return nullopt when the field is unset or its id no longer resolves
     */
    std::optional<EntityHandle> get(const EntityHandle& owner);

    /**
     * @brief Points the owner's field at target, assigning target an id if
     * it has none. Setting the same target again stores the same id.
     * @throws ValidationError if target is not a live entity of the field's
     *         collection or fails the validator
     * @throws std::invalid_argument if owner is not a live entity
     */
    void set(const EntityHandle& owner, const EntityHandle& target);

    void clear(const EntityHandle& owner);

    /// Raw stored value, without resolving it
    OptionalId peekStoredId(const EntityHandle& owner) const;

    /// Current name of the resolved target, or an empty string
    std::string displayValue(const EntityHandle& owner);

    /**
     * @brief Name-based setter used by search pickers
     *
     * An empty name clears the field. A name with no matching entity leaves
     * the field untouched and returns false.
     * @throws ValidationError if the named entity fails the validator
     */
    bool setByName(const EntityHandle& owner, const std::string& targetName);

    /// Whether set() would accept target
    bool accepts(const EntityHandle& target) const;

private:
    void requireOwner(const EntityHandle& owner) const;

    EntityPool& m_pool;
    IdentityResolver& m_resolver;
    std::string m_name;
    std::string m_valueKey;
    ReferenceFieldOptions m_options;
};

} // namespace Tether

#endif // REFERENCE_FIELD_HPP
