#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Log.hpp"
#include "ArchetypeID.hpp"
#include "Signature.hpp"

namespace Flux
{
    /**
     * Identity and transition graph of archetypes. Assigns an id to every
     * distinct signature and records add/remove edges between signatures that
     * differ by exactly one component, so structural changes resolve their
     * destination with one map lookup.
     *
     * Identities are only ever appended and edges are never invalidated. The
     * empty signature is created with the graph and is always id 0.
     */
    class ArchetypeGraph
    {
    public:
        ArchetypeGraph()
        {
            Insert(Signature{});
        }

        ArchetypeGraph(const ArchetypeGraph&) = delete;
        ArchetypeGraph& operator=(const ArchetypeGraph&) = delete;
        ArchetypeGraph(ArchetypeGraph&&) = default;
        ArchetypeGraph& operator=(ArchetypeGraph&&) = default;

        /**
         * Return the id of a signature, creating it if needed. Creation also
         * creates every signature one component smaller (recursively) and
         * links each of them to the new one with an add edge and the reverse
         * remove edge.
         */
        ArchetypeID GetOrCreate(const Signature& signature)
        {
            if (auto it = m_bySignature.find(signature); it != m_bySignature.end())
                return it->second;

            const ArchetypeID id = Insert(signature);

            for (ComponentID component : signature)
            {
                const ArchetypeID smaller = GetOrCreate(signature.Without(component));
                SetAddEdge(smaller, component, id);
                SetRemoveEdge(id, component, smaller);
            }

            return id;
        }

        FLUX_NODISCARD std::optional<ArchetypeID> Find(const Signature& signature) const
        {
            auto it = m_bySignature.find(signature);
            if (it == m_bySignature.end())
                return std::nullopt;
            return it->second;
        }

        /**
         * Get the archetype reached by adding a component.
         * @return Target id, or nullopt if the edge has not been created yet
         */
        FLUX_NODISCARD std::optional<ArchetypeID> GetAddEdge(ArchetypeID from, ComponentID component) const
        {
            auto it = m_addEdges.find(EdgeKey(from, component));
            if (it == m_addEdges.end())
                return std::nullopt;
            return it->second;
        }

        /**
         * Get the archetype reached by removing a component.
         * @return Target id, or nullopt if the edge has not been created yet
         */
        FLUX_NODISCARD std::optional<ArchetypeID> GetRemoveEdge(ArchetypeID from, ComponentID component) const
        {
            auto it = m_removeEdges.find(EdgeKey(from, component));
            if (it == m_removeEdges.end())
                return std::nullopt;
            return it->second;
        }

        void SetAddEdge(ArchetypeID from, ComponentID component, ArchetypeID to)
        {
            m_addEdges.insert_or_assign(EdgeKey(from, component), to);
        }

        void SetRemoveEdge(ArchetypeID from, ComponentID component, ArchetypeID to)
        {
            m_removeEdges.insert_or_assign(EdgeKey(from, component), to);
        }

        FLUX_NODISCARD const Signature& GetSignature(ArchetypeID id) const
        {
            if (id.Index() >= m_signatures.size())
            {
                GetDefaultLog().Fatal("Unknown archetype id {}", id.GetValue());
            }
            return m_signatures[id.Index()];
        }

        FLUX_NODISCARD std::size_t Size() const noexcept { return m_signatures.size(); }

        FLUX_NODISCARD std::size_t GetEdgeCount() const noexcept
        {
            return m_addEdges.size() + m_removeEdges.size();
        }

    private:
        ArchetypeID Insert(const Signature& signature)
        {
            const ArchetypeID id(static_cast<ArchetypeID::ValueType>(m_signatures.size()));
            m_signatures.push_back(signature);
            m_bySignature.emplace(signature, id);
            return id;
        }

        static constexpr std::uint64_t EdgeKey(ArchetypeID from, ComponentID component) noexcept
        {
            return (static_cast<std::uint64_t>(from.GetValue()) << 32) | component;
        }

        std::unordered_map<Signature, ArchetypeID, SignatureHash> m_bySignature;
        std::vector<Signature> m_signatures;
        std::unordered_map<std::uint64_t, ArchetypeID> m_addEdges;
        std::unordered_map<std::uint64_t, ArchetypeID> m_removeEdges;
    };
}
