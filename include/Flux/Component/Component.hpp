#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <type_traits>

#include "../Core/Config.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"

namespace Flux
{
    using ComponentID = std::uint32_t;

    inline constexpr ComponentID INVALID_COMPONENT = std::numeric_limits<ComponentID>::max();

    /**
     * Plain data that can live in a column. Rows are relocated with raw byte
     * copies and dropped without running destructors, so only trivially
     * copyable, trivially destructible object types qualify. Entity handles
     * are fetched from the archetype itself and are not components.
     */
    template<typename T>
    concept Component = std::is_object_v<T> &&
                        !std::is_const_v<T> &&
                        !std::is_volatile_v<T> &&
                        !std::is_array_v<T> &&
                        std::is_trivially_copyable_v<T> &&
                        std::is_trivially_destructible_v<T> &&
                        (!std::is_empty_v<T> || alignof(T) <= config::MAX_ZERO_SIZED_ALIGNMENT) &&
                        !std::same_as<T, Entity>;

    // Zero-sized (tag) components occupy no column bytes
    template<Component T>
    inline constexpr std::size_t ComponentSize = std::is_empty_v<T> ? 0 : sizeof(T);

    struct ComponentInfo
    {
        ComponentID id = INVALID_COMPONENT;
        TypeKey typeKey;
        std::string_view name;
        std::size_t size = 0;
        std::size_t alignment = 1;

        FLUX_NODISCARD bool IsZeroSized() const noexcept { return size == 0; }
    };

    template<Component T>
    FLUX_NODISCARD ComponentInfo MakeComponentInfo(ComponentID id) noexcept
    {
        ComponentInfo info;
        info.id = id;
        info.typeKey = TypeID<T>::Key();
        info.name = TypeID<T>::Name();
        info.size = ComponentSize<T>;
        info.alignment = alignof(T);
        return info;
    }
}
