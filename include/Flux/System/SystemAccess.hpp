#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Error.hpp"
#include "../Core/Log.hpp"
#include "../Core/TypeID.hpp"
#include "../Query/Access.hpp"

namespace Flux
{
    /**
     * Everything one system's parameters touch. Each query contributes one
     * FilteredAccess; resources are tracked by type. Validate rejects a
     * parameter list where two parameters alias the same column or resource
     * and at least one of them writes it.
     */
    class SystemAccess
    {
    public:
        struct ResourceAccess
        {
            TypeKey key;
            std::string_view name;
            bool isMutable = false;
        };

        void AddQuery(const FilteredAccess& access)
        {
            m_queries.push_back(access);
        }

        void AddResource(TypeKey key, std::string_view name, bool isMutable)
        {
            m_resources.push_back(ResourceAccess{key, name, isMutable});
        }

        /**
         * Throws AccessConflictError naming the system and the aliased data,
         * after reporting it through log.
         */
        void Validate(std::string_view systemName, const Log& log) const
        {
            for (std::size_t i = 0; i < m_queries.size(); ++i)
            {
                for (std::size_t j = i + 1; j < m_queries.size(); ++j)
                {
                    if (auto conflict = m_queries[i].FindConflict(m_queries[j]))
                    {
                        log.Fatal<AccessConflictError>(
                            "System '{}' has conflicting queries on component '{}'", systemName, conflict->name);
                    }
                }
            }

            for (std::size_t i = 0; i < m_resources.size(); ++i)
            {
                for (std::size_t j = i + 1; j < m_resources.size(); ++j)
                {
                    const ResourceAccess& a = m_resources[i];
                    const ResourceAccess& b = m_resources[j];
                    if (a.key == b.key && (a.isMutable || b.isMutable))
                    {
                        log.Fatal<AccessConflictError>(
                            "System '{}' has conflicting access to resource '{}'", systemName, a.name);
                    }
                }
            }
        }

        FLUX_NODISCARD bool IsValid() const
        {
            for (std::size_t i = 0; i < m_queries.size(); ++i)
            {
                for (std::size_t j = i + 1; j < m_queries.size(); ++j)
                {
                    if (m_queries[i].ConflictsWith(m_queries[j]))
                        return false;
                }
            }

            for (std::size_t i = 0; i < m_resources.size(); ++i)
            {
                for (std::size_t j = i + 1; j < m_resources.size(); ++j)
                {
                    if (m_resources[i].key == m_resources[j].key && (m_resources[i].isMutable || m_resources[j].isMutable))
                        return false;
                }
            }
            return true;
        }

        FLUX_NODISCARD bool WritesResource(TypeKey key) const noexcept
        {
            for (const ResourceAccess& access : m_resources)
            {
                if (access.key == key && access.isMutable)
                    return true;
            }
            return false;
        }

        FLUX_NODISCARD const std::vector<FilteredAccess>& GetQueries() const noexcept { return m_queries; }
        FLUX_NODISCARD const std::vector<ResourceAccess>& GetResources() const noexcept { return m_resources; }

        void Clear() noexcept
        {
            m_queries.clear();
            m_resources.clear();
        }

    private:
        std::vector<FilteredAccess> m_queries;
        std::vector<ResourceAccess> m_resources;
    };
}
