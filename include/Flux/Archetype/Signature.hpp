#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <span>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"

namespace Flux
{
    /**
     * Canonical component set of an archetype: ids sorted ascending, no
     * duplicates. Column order inside an archetype follows this order.
     */
    class Signature
    {
    public:
        Signature() = default;

        Signature(std::initializer_list<ComponentID> ids) : m_ids(ids)
        {
            Canonicalize();
        }

        explicit Signature(std::vector<ComponentID> ids) : m_ids(std::move(ids))
        {
            Canonicalize();
        }

        explicit Signature(std::span<const ComponentID> ids) : m_ids(ids.begin(), ids.end())
        {
            Canonicalize();
        }

        FLUX_NODISCARD bool Contains(ComponentID id) const noexcept
        {
            return std::binary_search(m_ids.begin(), m_ids.end(), id);
        }

        // Position of id in column order, or Size() if absent
        FLUX_NODISCARD std::size_t IndexOf(ComponentID id) const noexcept
        {
            auto it = std::lower_bound(m_ids.begin(), m_ids.end(), id);
            if (it == m_ids.end() || *it != id)
                return m_ids.size();
            return static_cast<std::size_t>(it - m_ids.begin());
        }

        FLUX_NODISCARD bool ContainsAll(std::span<const ComponentID> ids) const noexcept
        {
            for (ComponentID id : ids)
            {
                if (!Contains(id))
                    return false;
            }
            return true;
        }

        FLUX_NODISCARD Signature With(ComponentID id) const
        {
            Signature result = *this;
            auto it = std::lower_bound(result.m_ids.begin(), result.m_ids.end(), id);
            if (it == result.m_ids.end() || *it != id)
                result.m_ids.insert(it, id);
            return result;
        }

        FLUX_NODISCARD Signature Without(ComponentID id) const
        {
            Signature result = *this;
            auto it = std::lower_bound(result.m_ids.begin(), result.m_ids.end(), id);
            if (it != result.m_ids.end() && *it == id)
                result.m_ids.erase(it);
            return result;
        }

        FLUX_NODISCARD std::size_t Size() const noexcept { return m_ids.size(); }
        FLUX_NODISCARD bool Empty() const noexcept { return m_ids.empty(); }

        FLUX_NODISCARD ComponentID operator[](std::size_t i) const noexcept { return m_ids[i]; }

        FLUX_NODISCARD auto begin() const noexcept { return m_ids.begin(); }
        FLUX_NODISCARD auto end() const noexcept { return m_ids.end(); }

        FLUX_NODISCARD const std::vector<ComponentID>& GetIDs() const noexcept { return m_ids; }

        bool operator==(const Signature&) const = default;

    private:
        void Canonicalize()
        {
            std::sort(m_ids.begin(), m_ids.end());
            m_ids.erase(std::unique(m_ids.begin(), m_ids.end()), m_ids.end());
        }

        std::vector<ComponentID> m_ids;
    };

    struct SignatureHash
    {
        std::size_t operator()(const Signature& signature) const noexcept
        {
            std::size_t hash = signature.Size();
            for (ComponentID id : signature)
            {
                hash ^= std::hash<ComponentID>{}(id) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
            }
            return hash;
        }
    };
}
