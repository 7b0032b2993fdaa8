#pragma once

#include <cstddef>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

#include "../Archetype/Archetype.hpp"
#include "../Component/Component.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Core/Base.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"
#include "Access.hpp"

namespace Flux
{
    /**
     * Fetch protocol of one query element.
     *
     *   State     ids resolved once when the query state is built
     *   Fetch     column base pointers resolved once per archetype
     *   Item      what a row yields
     *
     * Supported elements: `T` (mutable reference), `const T` (read-only
     * reference), `Entity` (the row's handle) and `std::tuple<...>` of these.
     */
    template<typename D>
    struct QueryData;

    template<Component T>
    struct QueryData<T>
    {
        using State = ComponentID;
        using Fetch = T*;
        using Item = T&;

        static constexpr bool IsReadOnly = false;

        static State InitState(ComponentRegistry& registry)
        {
            return registry.Register<T>();
        }

        static void AddAccess(const State& state, FilteredAccess& access)
        {
            access.Add(state, true, TypeID<T>::Name());
        }

        static std::optional<Fetch> MakeFetch(const State& state, Archetype& archetype) noexcept
        {
            Column* column = archetype.GetColumn(state);
            if (!column)
                return std::nullopt;
            return column->Data<T>();
        }

        FLUX_FORCEINLINE static Item Get(Fetch fetch, std::size_t row) noexcept
        {
            if constexpr (ComponentSize<T> == 0)
            {
                FLUX_UNUSED(row);
                return *fetch;
            }
            else
            {
                return fetch[row];
            }
        }
    };

    template<Component T>
    struct QueryData<const T>
    {
        using State = ComponentID;
        using Fetch = const T*;
        using Item = const T&;

        static constexpr bool IsReadOnly = true;

        static State InitState(ComponentRegistry& registry)
        {
            return registry.Register<T>();
        }

        static void AddAccess(const State& state, FilteredAccess& access)
        {
            access.Add(state, false, TypeID<T>::Name());
        }

        static std::optional<Fetch> MakeFetch(const State& state, Archetype& archetype) noexcept
        {
            const Column* column = archetype.GetColumn(state);
            if (!column)
                return std::nullopt;
            return column->Data<T>();
        }

        FLUX_FORCEINLINE static Item Get(Fetch fetch, std::size_t row) noexcept
        {
            if constexpr (ComponentSize<T> == 0)
            {
                FLUX_UNUSED(row);
                return *fetch;
            }
            else
            {
                return fetch[row];
            }
        }
    };

    template<>
    struct QueryData<Entity>
    {
        struct State {};
        using Fetch = const Entity*;
        using Item = Entity;

        static constexpr bool IsReadOnly = true;

        static State InitState(ComponentRegistry&) noexcept { return {}; }

        // Entity handles live beside the columns and need no access entry
        static void AddAccess(const State&, FilteredAccess&) noexcept {}

        static std::optional<Fetch> MakeFetch(const State&, Archetype& archetype) noexcept
        {
            return archetype.GetEntities().data();
        }

        FLUX_FORCEINLINE static Item Get(Fetch fetch, std::size_t row) noexcept
        {
            return fetch[row];
        }
    };

    template<typename... Ds>
    struct QueryData<std::tuple<Ds...>>
    {
        using State = std::tuple<typename QueryData<Ds>::State...>;
        using Fetch = std::tuple<typename QueryData<Ds>::Fetch...>;
        using Item = std::tuple<typename QueryData<Ds>::Item...>;

        static constexpr bool IsReadOnly = (QueryData<Ds>::IsReadOnly && ...);

        static State InitState(ComponentRegistry& registry)
        {
            // Braced init keeps registration in declaration order
            return State{QueryData<Ds>::InitState(registry)...};
        }

        static void AddAccess(const State& state, FilteredAccess& access)
        {
            AddAccessImpl(state, access, std::index_sequence_for<Ds...>{});
        }

        static std::optional<Fetch> MakeFetch(const State& state, Archetype& archetype)
        {
            return MakeFetchImpl(state, archetype, std::index_sequence_for<Ds...>{});
        }

        FLUX_FORCEINLINE static Item Get(const Fetch& fetch, std::size_t row) noexcept
        {
            return GetImpl(fetch, row, std::index_sequence_for<Ds...>{});
        }

    private:
        template<std::size_t... Is>
        static void AddAccessImpl(const State& state, FilteredAccess& access, std::index_sequence<Is...>)
        {
            (QueryData<Ds>::AddAccess(std::get<Is>(state), access), ...);
        }

        template<std::size_t... Is>
        static std::optional<Fetch> MakeFetchImpl(const State& state, Archetype& archetype, std::index_sequence<Is...>)
        {
            std::tuple<std::optional<typename QueryData<Ds>::Fetch>...> parts{
                QueryData<Ds>::MakeFetch(std::get<Is>(state), archetype)...};

            if (!(std::get<Is>(parts).has_value() && ...))
                return std::nullopt;

            return Fetch{*std::get<Is>(parts)...};
        }

        template<std::size_t... Is>
        FLUX_FORCEINLINE static Item GetImpl(const Fetch& fetch, std::size_t row, std::index_sequence<Is...>) noexcept
        {
            return Item{QueryData<Ds>::Get(std::get<Is>(fetch), row)...};
        }
    };

    template<typename D>
    concept QueryElement = requires
    {
        typename QueryData<D>::State;
        typename QueryData<D>::Fetch;
        typename QueryData<D>::Item;
    };
}
