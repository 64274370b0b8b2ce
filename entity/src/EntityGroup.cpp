/**
 * @file EntityGroup.cpp
 * @brief EntityGroup implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/entity/EntityGroup.hpp>

#include <utility>

namespace astro::entity {

EntityGroup::EntityGroup(std::string name)
    : _name{std::move(name)}
{}

bool EntityGroup::add(physics::CircleBody &body)
{
    const auto [it, inserted] = _positions.try_emplace(&body, _members.size());
    if (!inserted)
        return false;
    _members.push_back(&body);
    return true;
}

bool EntityGroup::remove(const physics::CircleBody *body)
{
    const auto it = _positions.find(body);
    if (it == _positions.end())
        return false;

    const core::usize index = it->second;
    physics::CircleBody *last = _members.back();
    _members[index] = last;
    _positions[last] = index;

    _members.pop_back();
    _positions.erase(body);
    return true;
}

bool EntityGroup::contains(const physics::CircleBody *body) const
{
    return _positions.contains(body);
}

void EntityGroup::clear()
{
    _members.clear();
    _positions.clear();
}

} // namespace astro::entity
