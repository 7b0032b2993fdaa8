#pragma once

#include <cstddef>
#include <cstring>
#include <utility>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/TypeID.hpp"
#include "../Memory/Memory.hpp"

namespace Flux
{
    /**
     * Type-erased contiguous storage for one component type of one archetype.
     * Elements are plain bytes; rows are relocated with memcpy and dropped
     * without destructors. Zero-sized components keep only a row count.
     */
    class Column
    {
    public:
        Column(const ComponentInfo& info, std::size_t initialCapacity = config::COLUMN_INITIAL_CAPACITY) noexcept :
            m_elementSize(info.size),
            m_alignment(info.alignment),
            m_initialCapacity(initialCapacity == 0 ? 1 : initialCapacity),
            m_typeKey(info.typeKey)
        {}

        Column(std::size_t elementSize, std::size_t alignment, TypeKey typeKey = {}, std::size_t initialCapacity = config::COLUMN_INITIAL_CAPACITY) noexcept :
            m_elementSize(elementSize),
            m_alignment(alignment),
            m_initialCapacity(initialCapacity == 0 ? 1 : initialCapacity),
            m_typeKey(typeKey)
        {}

        ~Column()
        {
            FreeTracked(m_block);
        }

        Column(const Column&) = delete;
        Column& operator=(const Column&) = delete;

        Column(Column&& other) noexcept :
            m_block(std::exchange(other.m_block, TrackedBlock{})),
            m_elementSize(other.m_elementSize),
            m_alignment(other.m_alignment),
            m_size(std::exchange(other.m_size, 0)),
            m_capacity(std::exchange(other.m_capacity, 0)),
            m_initialCapacity(other.m_initialCapacity),
            m_typeKey(other.m_typeKey)
        {}

        Column& operator=(Column&& other) noexcept
        {
            if (this != &other)
            {
                FreeTracked(m_block);
                m_block = std::exchange(other.m_block, TrackedBlock{});
                m_elementSize = other.m_elementSize;
                m_alignment = other.m_alignment;
                m_size = std::exchange(other.m_size, 0);
                m_capacity = std::exchange(other.m_capacity, 0);
                m_initialCapacity = other.m_initialCapacity;
                m_typeKey = other.m_typeKey;
            }
            return *this;
        }

        /**
         * Append one element by copying elementSize bytes from src.
         * @return Row of the new element
         */
        std::size_t Push(const void* src)
        {
            const std::size_t row = PushUninitialized();
            if (m_elementSize != 0)
            {
                FLUX_ASSERT(src != nullptr, "Column::Push with null source");
                std::memcpy(RowAddress(row), src, m_elementSize);
            }
            return row;
        }

        /**
         * Append a slot whose bytes are written by the caller afterwards.
         */
        std::size_t PushUninitialized()
        {
            if (m_elementSize != 0 && m_size == m_capacity)
            {
                Grow();
            }
            return m_size++;
        }

        /**
         * Remove a row by moving the last row into its place.
         */
        void SwapRemove(std::size_t row) noexcept
        {
            FLUX_ASSERT(row < m_size, "Column::SwapRemove row out of bounds");

            const std::size_t last = m_size - 1;
            if (row != last && m_elementSize != 0)
            {
                std::memcpy(RowAddress(row), RowAddress(last), m_elementSize);
            }
            --m_size;
        }

        // Overwrite an existing row in place
        void Write(std::size_t row, const void* src) noexcept
        {
            FLUX_ASSERT(row < m_size, "Column::Write row out of bounds");
            if (m_elementSize != 0)
            {
                std::memcpy(RowAddress(row), src, m_elementSize);
            }
        }

        FLUX_NODISCARD void* GetPointer(std::size_t row) noexcept
        {
            FLUX_ASSERT(row < m_size, "Column::GetPointer row out of bounds");
            return m_elementSize == 0 ? ZeroSizedAddress() : RowAddress(row);
        }

        FLUX_NODISCARD const void* GetPointer(std::size_t row) const noexcept
        {
            FLUX_ASSERT(row < m_size, "Column::GetPointer row out of bounds");
            return m_elementSize == 0 ? ZeroSizedAddress() : RowAddress(row);
        }

        template<Component T>
        FLUX_NODISCARD T& Get(std::size_t row) noexcept
        {
            FLUX_ASSERT(IsType<T>(), "Column::Get with mismatched component type");
            return *static_cast<T*>(GetPointer(row));
        }

        template<Component T>
        FLUX_NODISCARD const T& Get(std::size_t row) const noexcept
        {
            FLUX_ASSERT(IsType<T>(), "Column::Get with mismatched component type");
            return *static_cast<const T*>(GetPointer(row));
        }

        /**
         * Typed base pointer. For zero-sized components every row aliases the
         * same address and must not be indexed.
         */
        template<Component T>
        FLUX_NODISCARD T* Data() noexcept
        {
            FLUX_ASSERT(IsType<T>(), "Column::Data with mismatched component type");
            return static_cast<T*>(m_elementSize == 0 ? ZeroSizedAddress() : m_block.ptr);
        }

        template<Component T>
        FLUX_NODISCARD const T* Data() const noexcept
        {
            FLUX_ASSERT(IsType<T>(), "Column::Data with mismatched component type");
            return static_cast<const T*>(m_elementSize == 0 ? ZeroSizedAddress() : m_block.ptr);
        }

        template<typename T>
        FLUX_NODISCARD bool IsType() const noexcept
        {
            return !m_typeKey.IsValid() || m_typeKey == TypeID<T>::Key();
        }

        FLUX_NODISCARD std::size_t Size() const noexcept { return m_size; }
        FLUX_NODISCARD std::size_t Capacity() const noexcept { return m_capacity; }
        FLUX_NODISCARD bool Empty() const noexcept { return m_size == 0; }
        FLUX_NODISCARD std::size_t GetElementSize() const noexcept { return m_elementSize; }
        FLUX_NODISCARD std::size_t GetAlignment() const noexcept { return m_alignment; }
        FLUX_NODISCARD TypeKey GetTypeKey() const noexcept { return m_typeKey; }
        FLUX_NODISCARD MemoryRegion GetRegion() const noexcept { return m_block.region; }

    private:
        void Grow()
        {
            const std::size_t newCapacity = m_capacity == 0
                ? m_initialCapacity
                : m_capacity * config::COLUMN_GROWTH_FACTOR;

            TrackedBlock newBlock = AllocateTracked(newCapacity * m_elementSize, m_alignment);
            if (m_size != 0)
            {
                std::memcpy(newBlock.ptr, m_block.ptr, m_size * m_elementSize);
            }
            FreeTracked(m_block);
            m_block = newBlock;
            m_capacity = newCapacity;
        }

        FLUX_NODISCARD std::byte* RowAddress(std::size_t row) const noexcept
        {
            return static_cast<std::byte*>(m_block.ptr) + row * m_elementSize;
        }

        // Shared by every zero-sized column; aligned for any tag the Component concept admits
        static void* ZeroSizedAddress() noexcept
        {
            alignas(config::MAX_ZERO_SIZED_ALIGNMENT) static std::byte s_storage[1];
            return s_storage;
        }

        TrackedBlock m_block;
        std::size_t m_elementSize = 0;
        std::size_t m_alignment = 1;
        std::size_t m_size = 0;
        std::size_t m_capacity = 0;
        std::size_t m_initialCapacity = config::COLUMN_INITIAL_CAPACITY;
        TypeKey m_typeKey;
    };
}
