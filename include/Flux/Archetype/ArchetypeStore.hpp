#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "../Component/Bundle.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Entity/Entity.hpp"
#include "Archetype.hpp"
#include "ArchetypeGraph.hpp"

namespace Flux
{
    /**
     * Owns the archetype graph and the storage of every identity it creates,
     * indexed by ArchetypeID. Archetypes are never destroyed, so ids (and the
     * matched lists of queries) stay valid for the store's lifetime.
     */
    class ArchetypeStore
    {
    public:
        struct MoveResult
        {
            EntityLocation newLocation;
            // Entity that was swapped into the vacated source row, if any
            std::optional<Entity> displaced;
        };

        explicit ArchetypeStore(std::size_t initialColumnCapacity = config::COLUMN_INITIAL_CAPACITY) :
            m_initialColumnCapacity(initialColumnCapacity)
        {
            // The graph starts with the empty signature
            m_archetypes.emplace_back(ArchetypeID::Empty(), Signature{}, std::span<const ComponentInfo>{}, m_initialColumnCapacity);
        }

        ArchetypeStore(const ArchetypeStore&) = delete;
        ArchetypeStore& operator=(const ArchetypeStore&) = delete;
        ArchetypeStore(ArchetypeStore&&) = default;
        ArchetypeStore& operator=(ArchetypeStore&&) = default;

        template<Component... Ts>
        ArchetypeID GetOrCreateForBundle(ComponentRegistry& registry)
        {
            return GetOrCreate(ComponentBundle<Ts...>::GetSignature(registry), registry);
        }

        ArchetypeID GetOrCreate(const Signature& signature, const ComponentRegistry& registry)
        {
            const ArchetypeID id = m_graph.GetOrCreate(signature);
            SyncStorage(registry);
            return id;
        }

        /**
         * Destination of adding a component to an entity of `from`. Uses the
         * cached edge when present, otherwise creates the destination and
         * caches the edge.
         */
        ArchetypeID GetAddComponentDestination(ArchetypeID from, ComponentID component, const ComponentRegistry& registry)
        {
            if (auto to = m_graph.GetAddEdge(from, component))
                return *to;

            const ArchetypeID to = GetOrCreate(m_graph.GetSignature(from).With(component), registry);
            m_graph.SetAddEdge(from, component, to);
            return to;
        }

        ArchetypeID GetRemoveComponentDestination(ArchetypeID from, ComponentID component, const ComponentRegistry& registry)
        {
            if (auto to = m_graph.GetRemoveEdge(from, component))
                return *to;

            const ArchetypeID to = GetOrCreate(m_graph.GetSignature(from).Without(component), registry);
            m_graph.SetRemoveEdge(from, component, to);
            return to;
        }

        /**
         * Relocate an entity's row to another archetype. Shared components are
         * copied; a component the target adds is left unwritten for the caller.
         */
        MoveResult MoveEntity(Entity entity, EntityLocation location, ArchetypeID target)
        {
            FLUX_PROFILE_ZONE_NAMED_COLOR("ArchetypeStore::MoveEntity", Profile::ColorEntity);

            auto [source, destination] = GetPair(location.archetype, target);
            FLUX_ASSERT(location.row < source.Size() && source.GetEntity(location.row) == entity,
                "Entity location is stale");

            MoveResult result;
            result.newLocation.archetype = target;
            result.newLocation.row = destination.AddMovedEntity(entity, source, location.row);
            result.displaced = source.Remove(location.row).moved;
            return result;
        }

        /**
         * Two distinct archetypes borrowed mutably at once.
         */
        std::pair<Archetype&, Archetype&> GetPair(ArchetypeID a, ArchetypeID b)
        {
            if (a == b)
            {
                GetDefaultLog().Fatal("Cannot borrow archetype {} twice", a.GetValue());
            }
            return {Get(a), Get(b)};
        }

        FLUX_NODISCARD Archetype& Get(ArchetypeID id)
        {
            if (id.Index() >= m_archetypes.size())
            {
                GetDefaultLog().Fatal("Unknown archetype id {}", id.GetValue());
            }
            return m_archetypes[id.Index()];
        }

        FLUX_NODISCARD const Archetype& Get(ArchetypeID id) const
        {
            if (id.Index() >= m_archetypes.size())
            {
                GetDefaultLog().Fatal("Unknown archetype id {}", id.GetValue());
            }
            return m_archetypes[id.Index()];
        }

        FLUX_NODISCARD Archetype* TryGet(ArchetypeID id) noexcept
        {
            return id.Index() < m_archetypes.size() ? &m_archetypes[id.Index()] : nullptr;
        }

        FLUX_NODISCARD std::size_t Size() const noexcept { return m_archetypes.size(); }

        FLUX_NODISCARD auto begin() noexcept { return m_archetypes.begin(); }
        FLUX_NODISCARD auto end() noexcept { return m_archetypes.end(); }
        FLUX_NODISCARD auto begin() const noexcept { return m_archetypes.begin(); }
        FLUX_NODISCARD auto end() const noexcept { return m_archetypes.end(); }

        FLUX_NODISCARD const ArchetypeGraph& GetGraph() const noexcept { return m_graph; }

    private:
        // Allocate storage for every identity the graph has created
        void SyncStorage(const ComponentRegistry& registry)
        {
            std::vector<ComponentInfo> infos;
            for (std::size_t i = m_archetypes.size(); i < m_graph.Size(); ++i)
            {
                const ArchetypeID id(static_cast<ArchetypeID::ValueType>(i));
                const Signature& signature = m_graph.GetSignature(id);

                infos.clear();
                infos.reserve(signature.Size());
                for (ComponentID component : signature)
                {
                    const ComponentInfo* info = registry.GetInfo(component);
                    if (!info)
                    {
                        GetDefaultLog().Fatal("Component {} is not registered", component);
                    }
                    infos.push_back(*info);
                }

                m_archetypes.emplace_back(id, signature, infos, m_initialColumnCapacity);
            }
        }

        ArchetypeGraph m_graph;
        std::vector<Archetype> m_archetypes;
        std::size_t m_initialColumnCapacity;
    };
}
