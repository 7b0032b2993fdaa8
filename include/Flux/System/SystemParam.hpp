#pragma once

#include <string_view>
#include <utility>

#include "../Commands/CommandQueue.hpp"
#include "../Commands/Commands.hpp"
#include "../Core/Base.hpp"
#include "../Core/Error.hpp"
#include "../Core/TypeID.hpp"
#include "../Query/Query.hpp"
#include "../World/Resources.hpp"
#include "../World/World.hpp"
#include "System.hpp"
#include "SystemAccess.hpp"

namespace Flux
{
    /**
     * Shared read access to a resource that must exist when the system runs.
     */
    template<Resource T>
    class Res
    {
    public:
        explicit Res(const T& value) noexcept : m_value(&value) {}

        FLUX_NODISCARD const T& Get() const noexcept { return *m_value; }
        FLUX_NODISCARD const T& operator*() const noexcept { return *m_value; }
        FLUX_NODISCARD const T* operator->() const noexcept { return m_value; }

    private:
        const T* m_value;
    };

    /**
     * Exclusive write access to a resource that must exist when the system runs.
     */
    template<Resource T>
    class ResMut
    {
    public:
        explicit ResMut(T& value) noexcept : m_value(&value) {}

        FLUX_NODISCARD T& Get() const noexcept { return *m_value; }
        FLUX_NODISCARD T& operator*() const noexcept { return *m_value; }
        FLUX_NODISCARD T* operator->() const noexcept { return m_value; }

    private:
        T* m_value;
    };

    // Read access to a resource that may be absent
    template<Resource T>
    class OptionalRes
    {
    public:
        explicit OptionalRes(const T* value) noexcept : m_value(value) {}

        FLUX_NODISCARD bool HasValue() const noexcept { return m_value != nullptr; }
        FLUX_NODISCARD explicit operator bool() const noexcept { return HasValue(); }

        FLUX_NODISCARD const T* Get() const noexcept { return m_value; }
        FLUX_NODISCARD const T& operator*() const noexcept { return *m_value; }
        FLUX_NODISCARD const T* operator->() const noexcept { return m_value; }

    private:
        const T* m_value;
    };

    // Write access to a resource that may be absent
    template<Resource T>
    class OptionalResMut
    {
    public:
        explicit OptionalResMut(T* value) noexcept : m_value(value) {}

        FLUX_NODISCARD bool HasValue() const noexcept { return m_value != nullptr; }
        FLUX_NODISCARD explicit operator bool() const noexcept { return HasValue(); }

        FLUX_NODISCARD T* Get() const noexcept { return m_value; }
        FLUX_NODISCARD T& operator*() const noexcept { return *m_value; }
        FLUX_NODISCARD T* operator->() const noexcept { return m_value; }

    private:
        T* m_value;
    };

    template<QueryElement... Ts>
    struct SystemParam<Query<Ts...>>
    {
        using State = QueryState<Ts...>;
        using Item = Query<Ts...>;

        static State InitState(World& world)
        {
            return State(world.GetRegistry(), world.GetLog());
        }

        static void AddAccess(const State& state, SystemAccess& access)
        {
            access.AddQuery(state.GetAccess());
        }

        static Item GetParam(State& state, World& world, std::string_view)
        {
            state.Update(world.GetStore());
            return Item(state, world.GetStore(), world.GetEntityLocations());
        }

        static void ApplyBuffers(State&, World&) noexcept {}
        static void DiscardBuffers(State&) noexcept {}
    };

    namespace Detail
    {
        // Resource params keep no state
        struct NoParamState {};

        template<Resource T, bool Mutable, bool Optional>
        struct ResourceParam
        {
            using State = NoParamState;

            static State InitState(World&) noexcept { return {}; }

            static void AddAccess(const State&, SystemAccess& access)
            {
                access.AddResource(TypeID<T>::Key(), TypeID<T>::Name(), Mutable);
            }

            static T* Fetch(World& world, std::string_view systemName)
            {
                T* value = world.GetResource<T>();
                if (!value && !Optional)
                {
                    world.GetLog().template Fatal<MissingResourceError>(
                        "System '{}' requires missing resource '{}'", systemName, TypeID<T>::Name());
                }
                return value;
            }

            static void ApplyBuffers(State&, World&) noexcept {}
            static void DiscardBuffers(State&) noexcept {}
        };
    }

    template<Resource T>
    struct SystemParam<Res<T>> : Detail::ResourceParam<T, false, false>
    {
        using Item = Res<T>;

        static Item GetParam(Detail::NoParamState&, World& world, std::string_view systemName)
        {
            return Item(*Detail::ResourceParam<T, false, false>::Fetch(world, systemName));
        }
    };

    template<Resource T>
    struct SystemParam<ResMut<T>> : Detail::ResourceParam<T, true, false>
    {
        using Item = ResMut<T>;

        static Item GetParam(Detail::NoParamState&, World& world, std::string_view systemName)
        {
            return Item(*Detail::ResourceParam<T, true, false>::Fetch(world, systemName));
        }
    };

    template<Resource T>
    struct SystemParam<OptionalRes<T>> : Detail::ResourceParam<T, false, true>
    {
        using Item = OptionalRes<T>;

        static Item GetParam(Detail::NoParamState&, World& world, std::string_view systemName)
        {
            return Item(Detail::ResourceParam<T, false, true>::Fetch(world, systemName));
        }
    };

    template<Resource T>
    struct SystemParam<OptionalResMut<T>> : Detail::ResourceParam<T, true, true>
    {
        using Item = OptionalResMut<T>;

        static Item GetParam(Detail::NoParamState&, World& world, std::string_view systemName)
        {
            return Item(Detail::ResourceParam<T, true, true>::Fetch(world, systemName));
        }
    };

    /**
     * Commands record into a per-system buffer so a failed run can be
     * discarded without touching the world queue.
     */
    template<>
    struct SystemParam<Commands>
    {
        using State = CommandQueue;
        using Item = Commands;

        static State InitState(World&) { return State{}; }

        // Deferred writes do not alias any live borrow
        static void AddAccess(const State&, SystemAccess&) noexcept {}

        static Item GetParam(State& state, World& world, std::string_view)
        {
            return Item(state, world.GetAllocator());
        }

        static void ApplyBuffers(State& state, World& world)
        {
            for (CommandPtr& command : state.Drain())
            {
                world.PushCommand(std::move(command));
            }
        }

        static void DiscardBuffers(State& state) noexcept
        {
            state.Clear();
        }
    };
}
