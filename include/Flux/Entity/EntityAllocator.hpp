#pragma once

#include <cstddef>

#include "../Core/Base.hpp"
#include "../Core/Error.hpp"
#include "Entity.hpp"

namespace Flux
{
    /**
     * Mints entity handles from a monotonically increasing counter. Indices
     * are never recycled, so a handle that has been despawned can never
     * alias a newer entity.
     */
    class EntityAllocator
    {
    public:
        EntityAllocator() = default;

        FLUX_NODISCARD Entity Allocate()
        {
            if (m_next == Entity::INVALID) FLUX_UNLIKELY
            {
                throw ContractViolation("Entity index space exhausted", ErrorCode::OutOfBounds);
            }
            return Entity{m_next++};
        }

        /**
         * Hands out the next handle without creating storage for it. Used by
         * deferred spawns, which become live when their command is applied.
         */
        FLUX_NODISCARD Entity Reserve()
        {
            return Allocate();
        }

        // Number of handles issued so far
        FLUX_NODISCARD std::size_t Count() const noexcept { return m_next; }

        FLUX_NODISCARD bool WasIssued(Entity entity) const noexcept
        {
            return entity.IsValid() && entity.GetIndex() < m_next;
        }

    private:
        Entity::IDType m_next = 0;
    };
}
