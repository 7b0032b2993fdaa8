#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "../Core/Base.hpp"
#include "../Core/TypeID.hpp"

namespace Flux
{
    /**
     * Any movable, non-reference object type can be a world singleton.
     */
    template<typename T>
    concept Resource = std::is_object_v<T> &&
                       !std::is_const_v<T> &&
                       !std::is_array_v<T> &&
                       std::is_move_constructible_v<T> &&
                       std::is_destructible_v<T>;

    /**
     * Type-keyed singleton storage. At most one value per type.
     */
    class Resources
    {
    public:
        Resources() = default;

        Resources(const Resources&) = delete;
        Resources& operator=(const Resources&) = delete;
        Resources(Resources&&) = default;
        Resources& operator=(Resources&&) = default;

        /**
         * Store a value, replacing (and destroying) any previous one of the
         * same type.
         * @return Reference to the stored value
         */
        template<Resource T>
        T& Insert(T value)
        {
            std::unique_ptr<void, void(*)(void*)> instance(new T(std::move(value)), &Destroy<T>);
            T& stored = *static_cast<T*>(instance.get());
            m_data.insert_or_assign(TypeID<T>::Key(), Entry{std::move(instance), TypeID<T>::Name()});
            return stored;
        }

        template<Resource T>
        FLUX_NODISCARD T* Get() noexcept
        {
            auto it = m_data.find(TypeID<T>::Key());
            return it != m_data.end() ? static_cast<T*>(it->second.instance.get()) : nullptr;
        }

        template<Resource T>
        FLUX_NODISCARD const T* Get() const noexcept
        {
            auto it = m_data.find(TypeID<T>::Key());
            return it != m_data.end() ? static_cast<const T*>(it->second.instance.get()) : nullptr;
        }

        /**
         * Take a value out of storage.
         * @return The value, or nullopt if none was stored
         */
        template<Resource T>
        std::optional<T> Remove()
        {
            auto it = m_data.find(TypeID<T>::Key());
            if (it == m_data.end())
                return std::nullopt;

            std::optional<T> value(std::move(*static_cast<T*>(it->second.instance.get())));
            m_data.erase(it);
            return value;
        }

        template<Resource T>
        FLUX_NODISCARD bool Contains() const noexcept
        {
            return m_data.contains(TypeID<T>::Key());
        }

        FLUX_NODISCARD std::size_t Size() const noexcept { return m_data.size(); }
        FLUX_NODISCARD bool Empty() const noexcept { return m_data.empty(); }

        void Clear() noexcept { m_data.clear(); }

    private:
        template<typename T>
        static void Destroy(void* ptr)
        {
            delete static_cast<T*>(ptr);
        }

        struct Entry
        {
            std::unique_ptr<void, void(*)(void*)> instance;
            std::string_view name;
        };

        std::unordered_map<TypeKey, Entry> m_data;
    };
}
