#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <unordered_map>

#include "../Archetype/ArchetypeID.hpp"
#include "../Core/Base.hpp"

namespace Flux
{
    /**
     * Opaque entity handle. Only the allocator mints valid handles; indices
     * are unique for the lifetime of the world.
     */
    class Entity
    {
    public:
        using IDType = std::uint32_t;

        static constexpr IDType INVALID = std::numeric_limits<IDType>::max();

        constexpr Entity() noexcept = default;
        constexpr explicit Entity(IDType index) noexcept : m_index(index) {}

        FLUX_NODISCARD constexpr explicit operator bool() const noexcept { return IsValid(); }

        FLUX_NODISCARD constexpr bool operator==(const Entity& other) const noexcept = default;
        FLUX_NODISCARD constexpr auto operator<=>(const Entity& other) const noexcept = default;

        FLUX_NODISCARD constexpr IDType GetIndex() const noexcept { return m_index; }

        FLUX_NODISCARD constexpr bool IsValid() const noexcept { return m_index != INVALID; }
        FLUX_NODISCARD constexpr bool IsInvalid() const noexcept { return m_index == INVALID; }

        FLUX_NODISCARD static constexpr Entity Invalid() noexcept { return Entity{INVALID}; }

    private:
        IDType m_index = INVALID;
    };

    /**
     * Where a live entity's row is stored.
     */
    struct EntityLocation
    {
        ArchetypeID archetype;
        std::size_t row = 0;

        bool operator==(const EntityLocation&) const noexcept = default;
    };

    struct EntityHash
    {
        std::size_t operator()(const Entity& entity) const noexcept
        {
            // Fibonacci scramble so sequential indices spread across buckets
            std::uint64_t hash = static_cast<std::uint64_t>(entity.GetIndex()) * 0x9E3779B97F4A7C15ULL;
            return static_cast<std::size_t>(hash ^ (hash >> 32));
        }
    };

    // Live entities and their rows
    using EntityLocationMap = std::unordered_map<Entity, EntityLocation, EntityHash>;
}

namespace std
{
    template<>
    struct hash<Flux::Entity>
    {
        FLUX_NODISCARD std::size_t operator()(const Flux::Entity& entity) const noexcept
        {
            return Flux::EntityHash{}(entity);
        }
    };
}
