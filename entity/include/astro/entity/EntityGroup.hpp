/**
 * @file EntityGroup.hpp
 * @brief Non-owning tracking collection (update / collision sets).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENTITY_ENTITY_GROUP_HPP
    #define ASTRO_ENTITY_ENTITY_GROUP_HPP

    #include <astro/physics/CircleBody.hpp>
    #include <astro/core/NonCopyable.hpp>

    #include <span>
    #include <string>
    #include <unordered_map>
    #include <vector>

namespace astro::entity {

/**
 * @brief Set of bodies the orchestrator iterates each step.
 *
 * Membership is explicit: a Lifecycle adds an entity on acquire/reset
 * and removes it on release.  Removal swaps with the last member, so
 * iteration order is not insertion order.  Mutating a group while
 * iterating members() is not allowed; iterate a snapshot() instead.
 */
class EntityGroup final : private core::NonCopyable<EntityGroup> {
public:
    explicit EntityGroup(std::string name);

    /** @return false if @p body was already a member. */
    bool add(physics::CircleBody &body);

    /** @return false if @p body was not a member. Never dereferences @p body. */
    bool remove(const physics::CircleBody *body);

    [[nodiscard]] bool contains(const physics::CircleBody *body) const;

    void clear();

    [[nodiscard]] std::span<physics::CircleBody *const> members() const noexcept { return _members; }
    [[nodiscard]] std::vector<physics::CircleBody *>    snapshot() const { return _members; }

    [[nodiscard]] core::usize        size()  const noexcept { return _members.size(); }
    [[nodiscard]] bool               empty() const noexcept { return _members.empty(); }
    [[nodiscard]] const std::string &name()  const noexcept { return _name; }

private:
    std::string                                               _name;
    std::vector<physics::CircleBody *>                        _members;
    std::unordered_map<const physics::CircleBody *, core::usize> _positions;
};

} // namespace astro::entity

#endif // ASTRO_ENTITY_ENTITY_GROUP_HPP
