/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "identity/ReferenceField.hpp"
#include "core/Logger.hpp"
#include <format>
#include <utility>

namespace Tether {

ReferenceField::ReferenceField(EntityPool& pool, IdentityResolver& resolver,
                               std::string name, ReferenceFieldOptions options)
    : m_pool(pool), m_resolver(resolver), m_name(std::move(name)),
      m_options(std::move(options)) {
    if (m_name.empty()) {
        throw std::invalid_argument("ReferenceField name must not be empty");
    }
    m_valueKey = m_name + "_id";
    if (m_options.displayName.empty()) {
        m_options.displayName = m_name;
    }
}

std::optional<EntityHandle> ReferenceField::get(const EntityHandle& owner) {
    OptionalId stored = peekStoredId(owner);
    if (!stored) {
        return std::nullopt;
    }
    return m_resolver.resolve(*stored);
}

void ReferenceField::set(const EntityHandle& owner, const EntityHandle& target) {
    requireOwner(owner);

    if (target.kind != collection() || !m_pool.isAlive(target)) {
        REFERENCE_WARN(std::format("'{}' rejected {}: not a live {}", m_name,
                                   target.toString(), collectionToString(collection())));
        throw ValidationError(std::format("{} is not a live {} entity",
                                          target.toString(),
                                          collectionToString(collection())));
    }

    if (m_options.validator && !m_options.validator(target)) {
        REFERENCE_WARN(std::format("'{}' validator rejected '{}'", m_name,
                                   m_pool.getDisplayName(target)));
        throw ValidationError(std::format("'{}' is not a valid target for '{}'",
                                          m_pool.getDisplayName(target),
                                          m_options.displayName));
    }

    StableId id = m_resolver.ensureId(target);
    m_pool.setFieldValue(owner, m_valueKey, id);
}

void ReferenceField::clear(const EntityHandle& owner) {
    requireOwner(owner);
    m_pool.setFieldValue(owner, m_valueKey, std::nullopt);
}

OptionalId ReferenceField::peekStoredId(const EntityHandle& owner) const {
    return m_pool.getFieldValue(owner, m_valueKey);
}

std::string ReferenceField::displayValue(const EntityHandle& owner) {
    std::optional<EntityHandle> target = get(owner);
    return target ? m_pool.getDisplayName(*target) : std::string{};
}

bool ReferenceField::setByName(const EntityHandle& owner, const std::string& targetName) {
    if (targetName.empty()) {
        clear(owner);
        return true;
    }

    EntityHandle target = m_pool.findByName(collection(), targetName);
    if (!target.isValid()) {
        REFERENCE_WARN(std::format("'{}': no {} named '{}'", m_name,
                                   collectionToString(collection()), targetName));
        return false;
    }

    set(owner, target);
    return true;
}

bool ReferenceField::accepts(const EntityHandle& target) const {
    if (target.kind != collection() || !m_pool.isAlive(target)) {
        return false;
    }
    return !m_options.validator || m_options.validator(target);
}

void ReferenceField::requireOwner(const EntityHandle& owner) const {
    if (!m_pool.isAlive(owner)) {
        throw std::invalid_argument("Reference owner is not a live entity: " +
                                    owner.toString());
    }
}

} // namespace Tether
