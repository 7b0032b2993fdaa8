#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/TypeID.hpp"
#include "Component.hpp"

namespace Flux
{
    /**
     * Maps component types to dense ids in first-registration order and
     * keeps the layout of each.
     */
    class ComponentRegistry
    {
    public:
        /**
         * Register a component type. Registering the same type again returns
         * the id it was first given.
         */
        template<Component T>
        ComponentID Register()
        {
            const TypeKey key = TypeID<T>::Key();
            if (auto it = m_typeToID.find(key); it != m_typeToID.end())
                return it->second;

            const ComponentID id = static_cast<ComponentID>(m_infos.size());
            m_infos.push_back(MakeComponentInfo<T>(id));
            m_typeToID.emplace(key, id);
            return id;
        }

        // Ids in template argument order
        template<Component... Ts>
        std::array<ComponentID, sizeof...(Ts)> RegisterAll()
        {
            return {Register<Ts>()...};
        }

        template<Component T>
        FLUX_NODISCARD std::optional<ComponentID> GetID() const
        {
            auto it = m_typeToID.find(TypeID<T>::Key());
            if (it == m_typeToID.end())
                return std::nullopt;
            return it->second;
        }

        template<Component T>
        FLUX_NODISCARD bool IsRegistered() const
        {
            return m_typeToID.contains(TypeID<T>::Key());
        }

        FLUX_NODISCARD const ComponentInfo* GetInfo(ComponentID id) const noexcept
        {
            return id < m_infos.size() ? &m_infos[id] : nullptr;
        }

        FLUX_NODISCARD std::size_t Size() const noexcept { return m_infos.size(); }

        FLUX_NODISCARD const std::vector<ComponentInfo>& GetInfos() const noexcept { return m_infos; }

    private:
        std::unordered_map<TypeKey, ComponentID> m_typeToID;
        std::vector<ComponentInfo> m_infos;
    };
}
