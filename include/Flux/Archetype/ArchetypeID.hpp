#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

#include "../Core/Base.hpp"

namespace Flux
{
    /**
     * Strong index of an archetype inside the store. The empty archetype is
     * always ArchetypeID::Empty().
     */
    class ArchetypeID
    {
    public:
        using ValueType = std::uint32_t;

        static constexpr ValueType INVALID = std::numeric_limits<ValueType>::max();

        constexpr ArchetypeID() noexcept = default;
        constexpr explicit ArchetypeID(ValueType value) noexcept : m_value(value) {}

        FLUX_NODISCARD static constexpr ArchetypeID Empty() noexcept { return ArchetypeID(0); }
        FLUX_NODISCARD static constexpr ArchetypeID Invalid() noexcept { return ArchetypeID(INVALID); }

        FLUX_NODISCARD constexpr bool IsValid() const noexcept { return m_value != INVALID; }
        FLUX_NODISCARD constexpr ValueType GetValue() const noexcept { return m_value; }
        FLUX_NODISCARD constexpr std::size_t Index() const noexcept { return static_cast<std::size_t>(m_value); }

        constexpr bool operator==(const ArchetypeID&) const noexcept = default;
        constexpr auto operator<=>(const ArchetypeID&) const noexcept = default;

    private:
        ValueType m_value = INVALID;
    };
}

namespace std
{
    template<>
    struct hash<Flux::ArchetypeID>
    {
        std::size_t operator()(const Flux::ArchetypeID& id) const noexcept
        {
            return std::hash<std::uint32_t>{}(id.GetValue());
        }
    };
}
