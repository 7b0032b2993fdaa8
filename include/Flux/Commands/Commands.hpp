#pragma once

#include <functional>
#include <memory>
#include <string_view>
#include <tuple>
#include <utility>

#include "../Component/Bundle.hpp"
#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Entity/Entity.hpp"
#include "../Entity/EntityAllocator.hpp"
#include "../World/Resources.hpp"
#include "Command.hpp"
#include "CommandQueue.hpp"

namespace Flux
{
    // Built-in commands. Execute bodies are defined in World.hpp.

    template<Resource T>
    class InsertResourceCommand final : public Command
    {
    public:
        explicit InsertResourceCommand(T value) : m_value(std::move(value)) {}

        void Execute(World& world) override;

        FLUX_NODISCARD std::string_view GetName() const noexcept override { return "InsertResource"; }

    private:
        T m_value;
    };

    template<Resource T>
    class RemoveResourceCommand final : public Command
    {
    public:
        void Execute(World& world) override;

        FLUX_NODISCARD std::string_view GetName() const noexcept override { return "RemoveResource"; }
    };

    /**
     * Spawns an entity whose handle was reserved when the command was
     * recorded.
     */
    template<Component... Ts>
    class SpawnCommand final : public Command
    {
    public:
        explicit SpawnCommand(Entity entity, Ts... components) :
            m_entity(entity),
            m_components(std::move(components)...)
        {}

        void Execute(World& world) override;

        FLUX_NODISCARD std::string_view GetName() const noexcept override { return "Spawn"; }

    private:
        Entity m_entity;
        std::tuple<Ts...> m_components;
    };

    class DespawnCommand final : public Command
    {
    public:
        explicit DespawnCommand(Entity entity) noexcept : m_entity(entity) {}

        void Execute(World& world) override;

        FLUX_NODISCARD std::string_view GetName() const noexcept override { return "Despawn"; }

    private:
        Entity m_entity;
    };

    template<Component T>
    class AddComponentCommand final : public Command
    {
    public:
        AddComponentCommand(Entity entity, T value) : m_entity(entity), m_value(std::move(value)) {}

        void Execute(World& world) override;

        FLUX_NODISCARD std::string_view GetName() const noexcept override { return "AddComponent"; }

    private:
        Entity m_entity;
        T m_value;
    };

    template<Component T>
    class RemoveComponentCommand final : public Command
    {
    public:
        explicit RemoveComponentCommand(Entity entity) noexcept : m_entity(entity) {}

        void Execute(World& world) override;

        FLUX_NODISCARD std::string_view GetName() const noexcept override { return "RemoveComponent"; }

    private:
        Entity m_entity;
    };

    /**
     * System parameter that records commands into the owning system's buffer.
     * The buffer is moved to the world queue after the system returns, and
     * dropped if the system fails.
     */
    class Commands
    {
    public:
        Commands(CommandQueue& buffer, EntityAllocator& allocator) noexcept :
            m_buffer(&buffer),
            m_allocator(&allocator)
        {}

        void Push(CommandPtr command)
        {
            m_buffer->Push(std::move(command));
        }

        template<typename T, typename... Args>
        requires std::is_base_of_v<Command, T>
        void Push(Args&&... args)
        {
            m_buffer->Emplace<T>(std::forward<Args>(args)...);
        }

        template<Resource T>
        void InsertResource(T value)
        {
            m_buffer->Emplace<InsertResourceCommand<T>>(std::move(value));
        }

        template<Resource T>
        void RemoveResource()
        {
            m_buffer->Emplace<RemoveResourceCommand<T>>();
        }

        /**
         * Queue a spawn. The returned handle is valid immediately and becomes
         * alive when the command is applied.
         */
        template<Component... Ts>
        Entity Spawn(Ts... components)
        {
            static_assert(AreUniqueTypes<Ts...>, "A component bundle cannot contain the same type twice");

            const Entity entity = m_allocator->Reserve();
            m_buffer->Emplace<SpawnCommand<Ts...>>(entity, std::move(components)...);
            return entity;
        }

        void Despawn(Entity entity)
        {
            m_buffer->Emplace<DespawnCommand>(entity);
        }

        template<Component T>
        void AddComponent(Entity entity, T value)
        {
            m_buffer->Emplace<AddComponentCommand<T>>(entity, std::move(value));
        }

        template<Component T>
        void RemoveComponent(Entity entity)
        {
            m_buffer->Emplace<RemoveComponentCommand<T>>(entity);
        }

        // Queue a callable that receives the world when applied
        template<typename Func>
        void Run(Func&& func)
        {
            m_buffer->Emplace<FunctionCommand>(std::function<void(World&)>(std::forward<Func>(func)));
        }

        FLUX_NODISCARD std::size_t Size() const noexcept { return m_buffer->Size(); }

    private:
        CommandQueue* m_buffer;
        EntityAllocator* m_allocator;
    };
}
