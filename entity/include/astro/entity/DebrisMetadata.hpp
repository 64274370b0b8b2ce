/**
 * @file DebrisMetadata.hpp
 * @brief Catalogue payload attached to an asteroid.
 *
 * Supplied by whoever spawns the asteroid and copied verbatim to its
 * offspring; the simulation never interprets it.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENTITY_DEBRIS_METADATA_HPP
    #define ASTRO_ENTITY_DEBRIS_METADATA_HPP

    #include <astro/core/Types.hpp>

    #include <memory>
    #include <optional>
    #include <string>

namespace astro::entity {

/** @brief Immutable catalogue record, shared between an asteroid and its fragments. */
struct DebrisRecord
{
    std::string name;
    std::string objectType;
    std::string country;
    std::string launchDate;
};

struct DebrisMetadata
{
    std::optional<core::u32>            noradId;
    std::shared_ptr<const DebrisRecord> record;

    [[nodiscard]] bool empty() const noexcept { return !noradId && !record; }
};

} // namespace astro::entity

#endif // ASTRO_ENTITY_DEBRIS_METADATA_HPP
