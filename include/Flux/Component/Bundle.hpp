#pragma once

#include <array>
#include <cstddef>
#include <tuple>
#include <type_traits>

#include "../Archetype/Signature.hpp"
#include "Component.hpp"
#include "ComponentRegistry.hpp"

namespace Flux
{
    namespace Detail
    {
        template<typename T, typename... Ts>
        inline constexpr bool IsOneOf = (std::is_same_v<T, Ts> || ...);

        template<typename... Ts>
        struct AreUnique : std::true_type {};

        template<typename T, typename... Rest>
        struct AreUnique<T, Rest...> : std::bool_constant<!IsOneOf<T, Rest...> && AreUnique<Rest...>::value> {};
    }

    template<typename... Ts>
    inline constexpr bool AreUniqueTypes = Detail::AreUnique<Ts...>::value;

    /**
     * A set of component values spawned together. Each type may appear once.
     */
    template<Component... Ts>
    struct ComponentBundle
    {
        static_assert(AreUniqueTypes<Ts...>, "A component bundle cannot contain the same type twice");

        static constexpr std::size_t Count = sizeof...(Ts);

        // Ids in declaration order
        static std::array<ComponentID, Count> Register(ComponentRegistry& registry)
        {
            return registry.RegisterAll<Ts...>();
        }

        static Signature GetSignature(ComponentRegistry& registry)
        {
            auto ids = Register(registry);
            return Signature(std::span<const ComponentID>(ids.data(), ids.size()));
        }

        // Raw value pointers in declaration order
        static std::array<const void*, Count> GetPointers(const std::tuple<Ts...>& values) noexcept
        {
            return std::apply([](const Ts&... v) { return std::array<const void*, Count>{static_cast<const void*>(&v)...}; }, values);
        }
    };
}
