#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Archetype/ArchetypeStore.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Core/Base.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Entity/Entity.hpp"
#include "QueryData.hpp"

namespace Flux
{
    /**
     * Cached matching state of a query shape. Holds the resolved ids, the
     * declared access and the list of matching archetypes. Archetypes are only
     * ever appended to the store, so Update scans just the ones created since
     * the previous call.
     */
    template<QueryElement... Ts>
    class QueryState
    {
    public:
        using Data = QueryData<std::tuple<Ts...>>;
        using State = typename Data::State;

        explicit QueryState(ComponentRegistry& registry, const Log& log = GetDefaultLog()) :
            m_state(Data::InitState(registry)),
            m_access(log)
        {
            // Throws AccessConflictError for shapes like <Position, const Position>
            Data::AddAccess(m_state, m_access);
            m_required = m_access.GetRequired();
        }

        void Update(const ArchetypeStore& store)
        {
            for (; m_archetypesSeen < store.Size(); ++m_archetypesSeen)
            {
                const ArchetypeID id(static_cast<ArchetypeID::ValueType>(m_archetypesSeen));
                if (store.Get(id).GetSignature().ContainsAll(m_required.GetIDs()))
                {
                    m_matched.push_back(id);
                }
            }
        }

        FLUX_NODISCARD bool Matches(ArchetypeID id) const noexcept
        {
            return std::binary_search(m_matched.begin(), m_matched.end(), id);
        }

        FLUX_NODISCARD const State& GetState() const noexcept { return m_state; }
        FLUX_NODISCARD const FilteredAccess& GetAccess() const noexcept { return m_access; }
        FLUX_NODISCARD const Signature& GetRequired() const noexcept { return m_required; }
        FLUX_NODISCARD const std::vector<ArchetypeID>& GetMatched() const noexcept { return m_matched; }

    private:
        State m_state;
        FilteredAccess m_access;
        Signature m_required;
        std::vector<ArchetypeID> m_matched;
        std::size_t m_archetypesSeen = 0;
    };

    /**
     * Borrowed view over every row of every archetype matching a query shape.
     * Iterates archetypes in store order, rows in storage order. The view is
     * valid until the next structural change of the store.
     *
     * A single-element query yields that element's item directly, e.g.
     * `Query<Position>` yields `Position&`; otherwise rows are tuples.
     */
    template<QueryElement... Ts>
    class Query
    {
        static_assert(sizeof...(Ts) > 0, "A query needs at least one element");

    public:
        using StateType = QueryState<Ts...>;
        using Data = QueryData<std::tuple<Ts...>>;
        using Fetch = typename Data::Fetch;
        using TupleItem = typename Data::Item;
        using Item = std::conditional_t<sizeof...(Ts) == 1,
            typename QueryData<std::tuple_element_t<0, std::tuple<Ts...>>>::Item,
            TupleItem>;

        class Iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Item;
            using difference_type = std::ptrdiff_t;
            using reference = Item;

            Iterator() = default;

            Iterator(const Query* query, std::size_t archetypeIndex) :
                m_query(query),
                m_archetypeIndex(archetypeIndex)
            {
                LoadArchetype();
                SkipExhausted();
            }

            FLUX_NODISCARD reference operator*() const noexcept
            {
                if constexpr (sizeof...(Ts) == 1)
                {
                    return QueryData<std::tuple_element_t<0, std::tuple<Ts...>>>::Get(std::get<0>(m_fetch), m_row);
                }
                else
                {
                    return Data::Get(m_fetch, m_row);
                }
            }

            Iterator& operator++()
            {
                ++m_row;
                SkipExhausted();
                return *this;
            }

            void operator++(int) { ++*this; }

            FLUX_NODISCARD bool operator==(const Iterator& other) const noexcept
            {
                return m_archetypeIndex == other.m_archetypeIndex && m_row == other.m_row;
            }

            // Handle of the current row
            FLUX_NODISCARD Entity GetEntity() const noexcept
            {
                return m_archetype->GetEntity(m_row);
            }

        private:
            void LoadArchetype()
            {
                m_rows = 0;
                m_row = 0;
                m_archetype = nullptr;

                const auto& matched = m_query->m_state->GetMatched();
                if (m_archetypeIndex >= matched.size())
                    return;

                Archetype& archetype = m_query->m_store->Get(matched[m_archetypeIndex]);
                if (auto fetch = Data::MakeFetch(m_query->m_state->GetState(), archetype))
                {
                    m_fetch = *fetch;
                    m_rows = archetype.Size();
                    m_archetype = &archetype;
                }
            }

            void SkipExhausted()
            {
                const std::size_t matchedCount = m_query->m_state->GetMatched().size();
                while (m_row >= m_rows && m_archetypeIndex < matchedCount)
                {
                    ++m_archetypeIndex;
                    LoadArchetype();
                }

                if (m_archetypeIndex >= matchedCount)
                {
                    m_archetypeIndex = matchedCount;
                    m_row = 0;
                }
            }

            const Query* m_query = nullptr;
            Archetype* m_archetype = nullptr;
            Fetch m_fetch{};
            std::size_t m_archetypeIndex = 0;
            std::size_t m_row = 0;
            std::size_t m_rows = 0;
        };

        Query(const StateType& state, ArchetypeStore& store, const EntityLocationMap& locations) noexcept :
            m_state(&state),
            m_store(&store),
            m_locations(&locations)
        {}

        FLUX_NODISCARD Iterator begin() const { return Iterator(this, 0); }
        FLUX_NODISCARD Iterator end() const { return Iterator(this, m_state->GetMatched().size()); }

        /**
         * Call func once per row with one argument per query element.
         */
        template<typename Func>
        void ForEach(Func&& func) const
        {
            FLUX_PROFILE_ZONE_NAMED_COLOR("Query::ForEach", Profile::ColorQuery);

            for (ArchetypeID id : m_state->GetMatched())
            {
                Archetype& archetype = m_store->Get(id);
                const std::size_t rows = archetype.Size();
                if (rows == 0)
                    continue;

                auto fetch = Data::MakeFetch(m_state->GetState(), archetype);
                if (!fetch)
                    continue;

                for (std::size_t row = 0; row < rows; ++row)
                {
                    InvokeRow(func, *fetch, row, std::index_sequence_for<Ts...>{});
                }
            }
        }

        // Number of matching rows
        FLUX_NODISCARD std::size_t Count() const
        {
            std::size_t count = 0;
            for (ArchetypeID id : m_state->GetMatched())
            {
                count += m_store->Get(id).Size();
            }
            return count;
        }

        FLUX_NODISCARD bool Empty() const
        {
            for (ArchetypeID id : m_state->GetMatched())
            {
                if (!m_store->Get(id).Empty())
                    return false;
            }
            return true;
        }

        /**
         * The only matching row.
         * @return nullopt when zero or more than one row matches
         */
        FLUX_NODISCARD std::optional<TupleItem> Single() const
        {
            if (Count() != 1)
                return std::nullopt;

            for (ArchetypeID id : m_state->GetMatched())
            {
                Archetype& archetype = m_store->Get(id);
                if (archetype.Empty())
                    continue;
                if (auto fetch = Data::MakeFetch(m_state->GetState(), archetype))
                    return Data::Get(*fetch, 0);
            }
            return std::nullopt;
        }

        /**
         * Row of one entity.
         * @return nullopt when the entity is dead or its archetype does not match
         */
        FLUX_NODISCARD std::optional<TupleItem> Get(Entity entity) const
        {
            auto it = m_locations->find(entity);
            if (it == m_locations->end() || !m_state->Matches(it->second.archetype))
                return std::nullopt;

            Archetype& archetype = m_store->Get(it->second.archetype);
            auto fetch = Data::MakeFetch(m_state->GetState(), archetype);
            if (!fetch)
                return std::nullopt;
            return Data::Get(*fetch, it->second.row);
        }

        FLUX_NODISCARD bool Contains(Entity entity) const
        {
            auto it = m_locations->find(entity);
            return it != m_locations->end() && m_state->Matches(it->second.archetype);
        }

        FLUX_NODISCARD const StateType& GetState() const noexcept { return *m_state; }

    private:
        template<typename Func, std::size_t... Is>
        FLUX_FORCEINLINE static void InvokeRow(Func& func, const Fetch& fetch, std::size_t row, std::index_sequence<Is...>)
        {
            func(QueryData<Ts>::Get(std::get<Is>(fetch), row)...);
        }

        const StateType* m_state;
        ArchetypeStore* m_store;
        const EntityLocationMap* m_locations;
    };
}
