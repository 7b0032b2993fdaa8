#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Log.hpp"
#include "../Entity/Entity.hpp"
#include "ArchetypeID.hpp"
#include "Column.hpp"
#include "Signature.hpp"

namespace Flux
{
    // One component value handed to Archetype::Add
    struct ComponentPointer
    {
        ComponentID id = INVALID_COMPONENT;
        const void* data = nullptr;
    };

    /**
     * Result of removing a row. When the removed row was not the last one,
     * the former last entity now occupies it and its location must be fixed.
     */
    struct RemovedRow
    {
        Entity removed;
        std::optional<Entity> moved;
    };

    /**
     * Storage for every entity with exactly one component set. Row i of each
     * column belongs to m_entities[i].
     */
    class Archetype
    {
    public:
        Archetype(ArchetypeID id, Signature signature, std::span<const ComponentInfo> infos,
                  std::size_t initialColumnCapacity = config::COLUMN_INITIAL_CAPACITY) :
            m_id(id),
            m_signature(std::move(signature))
        {
            if (infos.size() != m_signature.Size())
            {
                GetDefaultLog().Fatal("Archetype {} built with {} component infos for a signature of {}",
                    m_id.GetValue(), infos.size(), m_signature.Size());
            }

            m_columns.reserve(infos.size());
            for (std::size_t i = 0; i < infos.size(); ++i)
            {
                FLUX_ASSERT(infos[i].id == m_signature[i], "Component infos must follow signature order");
                m_columns.emplace_back(infos[i], initialColumnCapacity);
            }
            m_entities.reserve(config::ARCHETYPE_INITIAL_CAPACITY);
        }

        Archetype(const Archetype&) = delete;
        Archetype& operator=(const Archetype&) = delete;
        Archetype(Archetype&&) noexcept = default;
        Archetype& operator=(Archetype&&) noexcept = default;

        /**
         * Append an entity with one value per signature component.
         * @param components Values in any order; their ids must equal the signature
         * @return Row of the new entity
         */
        std::size_t Add(Entity entity, std::span<const ComponentPointer> components)
        {
            ValidateBundle(components);

            for (const ComponentPointer& component : components)
            {
                m_columns[m_signature.IndexOf(component.id)].Push(component.data);
            }
            m_entities.push_back(entity);
            return m_entities.size() - 1;
        }

        /**
         * Swap-remove a row from every column and the entity list.
         */
        RemovedRow Remove(std::size_t row)
        {
            FLUX_ASSERT(row < m_entities.size(), "Archetype::Remove row out of bounds");

            RemovedRow result;
            result.removed = m_entities[row];

            const std::size_t last = m_entities.size() - 1;
            for (Column& column : m_columns)
            {
                column.SwapRemove(row);
            }

            if (row != last)
            {
                m_entities[row] = m_entities[last];
                result.moved = m_entities[row];
            }
            m_entities.pop_back();
            return result;
        }

        /**
         * Append an entity whose shared components are copied from another
         * archetype's row. Columns the source lacks get an unwritten slot that
         * the caller fills. The source row is left in place.
         */
        std::size_t AddMovedEntity(Entity entity, const Archetype& source, std::size_t sourceRow)
        {
            FLUX_ASSERT(sourceRow < source.Size(), "Archetype::AddMovedEntity source row out of bounds");

            for (std::size_t i = 0; i < m_columns.size(); ++i)
            {
                const Column* from = source.GetColumn(m_signature[i]);
                if (from)
                {
                    m_columns[i].Push(from->GetPointer(sourceRow));
                }
                else
                {
                    m_columns[i].PushUninitialized();
                }
            }
            m_entities.push_back(entity);
            return m_entities.size() - 1;
        }

        FLUX_NODISCARD bool HasComponent(ComponentID id) const noexcept
        {
            return m_signature.Contains(id);
        }

        FLUX_NODISCARD Column* GetColumn(ComponentID id) noexcept
        {
            const std::size_t index = m_signature.IndexOf(id);
            return index < m_columns.size() ? &m_columns[index] : nullptr;
        }

        FLUX_NODISCARD const Column* GetColumn(ComponentID id) const noexcept
        {
            const std::size_t index = m_signature.IndexOf(id);
            return index < m_columns.size() ? &m_columns[index] : nullptr;
        }

        FLUX_NODISCARD void* GetComponentPointer(ComponentID id, std::size_t row) noexcept
        {
            Column* column = GetColumn(id);
            return column ? column->GetPointer(row) : nullptr;
        }

        FLUX_NODISCARD const void* GetComponentPointer(ComponentID id, std::size_t row) const noexcept
        {
            const Column* column = GetColumn(id);
            return column ? column->GetPointer(row) : nullptr;
        }

        FLUX_NODISCARD Entity GetEntity(std::size_t row) const noexcept
        {
            FLUX_ASSERT(row < m_entities.size(), "Archetype::GetEntity row out of bounds");
            return m_entities[row];
        }

        FLUX_NODISCARD std::span<const Entity> GetEntities() const noexcept { return m_entities; }
        FLUX_NODISCARD std::size_t Size() const noexcept { return m_entities.size(); }
        FLUX_NODISCARD bool Empty() const noexcept { return m_entities.empty(); }
        FLUX_NODISCARD const Signature& GetSignature() const noexcept { return m_signature; }
        FLUX_NODISCARD ArchetypeID GetID() const noexcept { return m_id; }
        FLUX_NODISCARD std::size_t GetColumnCount() const noexcept { return m_columns.size(); }

    private:
        void ValidateBundle(std::span<const ComponentPointer> components) const
        {
            if (components.size() != m_signature.Size())
            {
                GetDefaultLog().Fatal("Archetype {} expects {} components, got {}",
                    m_id.GetValue(), m_signature.Size(), components.size());
            }

            for (std::size_t i = 0; i < components.size(); ++i)
            {
                if (!m_signature.Contains(components[i].id))
                {
                    GetDefaultLog().Fatal("Component {} is not part of archetype {}",
                        components[i].id, m_id.GetValue());
                }

                for (std::size_t j = i + 1; j < components.size(); ++j)
                {
                    if (components[i].id == components[j].id)
                    {
                        GetDefaultLog().Fatal("Component {} supplied twice to archetype {}",
                            components[i].id, m_id.GetValue());
                    }
                }
            }
        }

        ArchetypeID m_id;
        Signature m_signature;
        std::vector<Column> m_columns;
        std::vector<Entity> m_entities;
    };
}
