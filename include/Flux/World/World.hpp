#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "../Archetype/ArchetypeStore.hpp"
#include "../Commands/Command.hpp"
#include "../Commands/CommandQueue.hpp"
#include "../Commands/Commands.hpp"
#include "../Component/Bundle.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Core/Base.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"
#include "../Entity/EntityAllocator.hpp"
#include "../Memory/Region.hpp"
#include "../Query/Query.hpp"
#include "../Schedule/Schedule.hpp"
#include "../System/System.hpp"
#include "Resources.hpp"
#include "WorldConfig.hpp"

namespace Flux
{
    class World;

    /**
     * A feature module. Init registers the module's resources and systems.
     */
    template<typename P>
    concept Plugin = requires(P& plugin, World& world)
    {
        plugin.Init(world);
    };

    namespace Detail
    {
        // Defined in System/FunctionSystem.hpp
        template<typename Func>
        std::unique_ptr<ISystem> MakeFunctionSystem(Func&& func, std::string name);
    }

    /**
     * The entity/component store together with its resources, command queue
     * and schedules. Single-threaded: structural operations must not run
     * while a Query obtained from this world is being iterated; systems defer
     * them through Commands.
     */
    class World
    {
    public:
        explicit World(WorldConfig config = {}) :
            m_config(std::move(config)),
            m_log(m_config.logSink, m_config.minLogLevel),
            m_store(m_config.initialColumnCapacity)
        {}

        World(const World&) = delete;
        World& operator=(const World&) = delete;
        World(World&&) = delete;
        World& operator=(World&&) = delete;

        // ============= Entities =============

        /**
         * Create an entity with the given components. Zero components places
         * it in the empty archetype.
         */
        template<Component... Ts>
        Entity Spawn(Ts... components)
        {
            const Entity entity = m_allocator.Allocate();
            Insert(entity, components...);
            return entity;
        }

        /**
         * Make a handle previously obtained from EntityAllocator::Reserve
         * alive with the given components.
         */
        template<Component... Ts>
        void SpawnReserved(Entity entity, Ts... components)
        {
            if (!m_allocator.WasIssued(entity) || IsAlive(entity))
            {
                m_log.Fatal("Entity {} was never reserved or is already alive", entity.GetIndex());
            }
            Insert(entity, components...);
        }

        /**
         * Destroy an entity and its components.
         * @return false if the entity was not alive
         */
        bool Despawn(Entity entity)
        {
            FLUX_PROFILE_ZONE_NAMED_COLOR("World::Despawn", Profile::ColorEntity);

            auto it = m_locations.find(entity);
            if (it == m_locations.end())
                return false;

            const EntityLocation location = it->second;
            m_locations.erase(it);

            const RemovedRow removed = m_store.Get(location.archetype).Remove(location.row);
            if (removed.moved)
            {
                m_locations[*removed.moved] = location;
            }
            return true;
        }

        FLUX_NODISCARD bool IsAlive(Entity entity) const
        {
            return m_locations.contains(entity);
        }

        FLUX_NODISCARD std::optional<EntityLocation> GetLocation(Entity entity) const
        {
            auto it = m_locations.find(entity);
            if (it == m_locations.end())
                return std::nullopt;
            return it->second;
        }

        FLUX_NODISCARD std::size_t GetEntityCount() const noexcept { return m_locations.size(); }

        // ============= Components =============

        /**
         * Add a component, moving the entity to the archetype with it. If the
         * entity already has the component, it is overwritten in place.
         * @return Pointer to the stored component, or nullptr if the entity is dead
         */
        template<Component T>
        T* AddComponent(Entity entity, T value)
        {
            FLUX_PROFILE_ZONE_NAMED_COLOR("World::AddComponent", Profile::ColorComponent);

            auto it = m_locations.find(entity);
            if (it == m_locations.end())
                return nullptr;

            RegionGuard region(MemoryRegion::Ecs);
            const ComponentID id = m_registry.Register<T>();
            const EntityLocation location = it->second;

            if (Column* column = m_store.Get(location.archetype).GetColumn(id))
            {
                column->Write(location.row, &value);
                return &column->Get<T>(location.row);
            }

            const ArchetypeID target = m_store.GetAddComponentDestination(location.archetype, id, m_registry);
            const ArchetypeStore::MoveResult moved = m_store.MoveEntity(entity, location, target);
            ApplyMove(entity, location, moved);

            Column* column = m_store.Get(target).GetColumn(id);
            column->Write(moved.newLocation.row, &value);
            return &column->Get<T>(moved.newLocation.row);
        }

        /**
         * Remove a component, moving the entity to the archetype without it.
         * The entity stays alive even when no components remain.
         * @return false if the entity is dead or lacks the component
         */
        template<Component T>
        bool RemoveComponent(Entity entity)
        {
            FLUX_PROFILE_ZONE_NAMED_COLOR("World::RemoveComponent", Profile::ColorComponent);

            const std::optional<ComponentID> id = m_registry.GetID<T>();
            if (!id)
                return false;

            auto it = m_locations.find(entity);
            if (it == m_locations.end())
                return false;

            const EntityLocation location = it->second;
            if (!m_store.Get(location.archetype).HasComponent(*id))
                return false;

            RegionGuard region(MemoryRegion::Ecs);
            const ArchetypeID target = m_store.GetRemoveComponentDestination(location.archetype, *id, m_registry);
            ApplyMove(entity, location, m_store.MoveEntity(entity, location, target));
            return true;
        }

        template<Component T>
        FLUX_NODISCARD T* GetComponent(Entity entity)
        {
            const std::optional<ComponentID> id = m_registry.GetID<T>();
            auto it = m_locations.find(entity);
            if (!id || it == m_locations.end())
                return nullptr;

            Column* column = m_store.Get(it->second.archetype).GetColumn(*id);
            return column ? &column->Get<T>(it->second.row) : nullptr;
        }

        template<Component T>
        FLUX_NODISCARD const T* GetComponent(Entity entity) const
        {
            const std::optional<ComponentID> id = m_registry.GetID<T>();
            auto it = m_locations.find(entity);
            if (!id || it == m_locations.end())
                return nullptr;

            const Column* column = m_store.Get(it->second.archetype).GetColumn(*id);
            return column ? &column->Get<T>(it->second.row) : nullptr;
        }

        template<Component T>
        FLUX_NODISCARD bool HasComponent(Entity entity) const
        {
            const std::optional<ComponentID> id = m_registry.GetID<T>();
            auto it = m_locations.find(entity);
            return id && it != m_locations.end() && m_store.Get(it->second.archetype).HasComponent(*id);
        }

        // ============= Resources =============

        // Insert or replace the singleton of type T
        template<Resource T>
        T& InsertResource(T value)
        {
            return m_resources.Insert(std::move(value));
        }

        template<Resource T>
        FLUX_NODISCARD T* GetResource() noexcept
        {
            return m_resources.Get<T>();
        }

        template<Resource T>
        FLUX_NODISCARD const T* GetResource() const noexcept
        {
            return m_resources.Get<T>();
        }

        template<Resource T>
        std::optional<T> RemoveResource()
        {
            return m_resources.Remove<T>();
        }

        template<Resource T>
        FLUX_NODISCARD bool HasResource() const noexcept
        {
            return m_resources.Contains<T>();
        }

        // ============= Queries =============

        /**
         * Ad-hoc query. The matching state is cached per query shape and
         * refreshed on every call.
         */
        template<QueryElement... Ts>
        FLUX_NODISCARD Query<Ts...> QueryOnce()
        {
            QueryState<Ts...>& state = GetCachedQueryState<Ts...>();
            state.Update(m_store);
            return Query<Ts...>(state, m_store, m_locations);
        }

        // ============= Systems =============

        /**
         * Register a function (pointer, lambda or functor) whose parameters
         * are system parameters and whose return type is void or SystemResult.
         * @param name Defaults to the callable's type name
         */
        template<typename Func>
        requires (!std::is_convertible_v<Func, std::unique_ptr<ISystem>>)
        void AddSystem(ScheduleLabel label, Func&& func, std::string name = {})
        {
            AddSystem(label, Detail::MakeFunctionSystem(std::forward<Func>(func), std::move(name)));
        }

        void AddSystem(ScheduleLabel label, std::unique_ptr<ISystem> system)
        {
            m_log.Trace("Adding system '{}' to schedule {}", system ? system->GetName() : "<null>", GetScheduleLabelName(label));
            m_schedules.Add(label, std::move(system));
        }

        ScheduleReport RunSchedule(ScheduleLabel label)
        {
            return m_schedules.Run(label, *this);
        }

        template<typename P>
        requires Plugin<P>
        void AddPlugin(P&& plugin)
        {
            m_log.Info("Initializing plugin '{}'", TypeID<P>::Name());
            plugin.Init(*this);
        }

        // ============= Commands =============

        void PushCommand(CommandPtr command)
        {
            m_commands.Push(std::move(command));
        }

        /**
         * Execute queued commands in FIFO order until the queue is empty,
         * including commands pushed by commands. If a command throws, it is
         * dropped, the commands behind it go back to the front of the queue
         * and the exception propagates.
         * @return Number of commands executed
         */
        std::size_t ApplyCommands()
        {
            FLUX_PROFILE_ZONE_NAMED_COLOR("World::ApplyCommands", Profile::ColorCommand);

            std::size_t applied = 0;
            while (!m_commands.Empty())
            {
                std::deque<CommandPtr> batch = m_commands.Drain();
                while (!batch.empty())
                {
                    CommandPtr command = std::move(batch.front());
                    batch.pop_front();

                    m_log.Trace("Applying command '{}'", command->GetName());
                    try
                    {
                        command->Execute(*this);
                    }
                    catch (...)
                    {
                        m_log.Error("Command '{}' threw, {} pending commands kept", command->GetName(), batch.size());
                        m_commands.PushFront(std::move(batch));
                        throw;
                    }
                    ++applied;
                }
            }
            return applied;
        }

        // ============= Accessors =============

        FLUX_NODISCARD ComponentRegistry& GetRegistry() noexcept { return m_registry; }
        FLUX_NODISCARD const ComponentRegistry& GetRegistry() const noexcept { return m_registry; }
        FLUX_NODISCARD ArchetypeStore& GetStore() noexcept { return m_store; }
        FLUX_NODISCARD const ArchetypeStore& GetStore() const noexcept { return m_store; }
        FLUX_NODISCARD EntityAllocator& GetAllocator() noexcept { return m_allocator; }
        FLUX_NODISCARD const EntityLocationMap& GetEntityLocations() const noexcept { return m_locations; }
        FLUX_NODISCARD CommandQueue& GetCommandQueue() noexcept { return m_commands; }
        FLUX_NODISCARD Schedules& GetSchedules() noexcept { return m_schedules; }
        FLUX_NODISCARD const Log& GetLog() const noexcept { return m_log; }
        FLUX_NODISCARD Log& GetLog() noexcept { return m_log; }
        FLUX_NODISCARD const WorldConfig& GetConfig() const noexcept { return m_config; }

        void SetFlushPolicy(FlushPolicy policy) noexcept { m_config.flushPolicy = policy; }

    private:
        template<Component... Ts>
        void Insert(Entity entity, Ts&... components)
        {
            FLUX_PROFILE_ZONE_NAMED_COLOR("World::Spawn", Profile::ColorEntity);

            RegionGuard region(MemoryRegion::Ecs);
            const auto ids = ComponentBundle<Ts...>::Register(m_registry);
            const ArchetypeID archetype = m_store.GetOrCreate(Signature(std::span<const ComponentID>(ids.data(), ids.size())), m_registry);

            const std::array<const void*, sizeof...(Ts)> values{static_cast<const void*>(&components)...};
            std::array<ComponentPointer, sizeof...(Ts)> pointers{};
            for (std::size_t i = 0; i < pointers.size(); ++i)
            {
                pointers[i] = ComponentPointer{ids[i], values[i]};
            }

            const std::size_t row = m_store.Get(archetype).Add(entity, pointers);
            m_locations.insert_or_assign(entity, EntityLocation{archetype, row});
        }

        void ApplyMove(Entity entity, EntityLocation from, const ArchetypeStore::MoveResult& moved)
        {
            m_locations[entity] = moved.newLocation;
            if (moved.displaced)
            {
                m_locations[*moved.displaced] = from;
            }
        }

        template<QueryElement... Ts>
        QueryState<Ts...>& GetCachedQueryState()
        {
            using StateType = QueryState<Ts...>;

            const TypeKey key = TypeID<StateType>::Key();
            auto it = m_queryCache.find(key);
            if (it == m_queryCache.end())
            {
                std::unique_ptr<void, void(*)(void*)> state(
                    new StateType(m_registry, m_log),
                    [](void* ptr) { delete static_cast<StateType*>(ptr); });
                it = m_queryCache.emplace(key, std::move(state)).first;
            }
            return *static_cast<StateType*>(it->second.get());
        }

        WorldConfig m_config;
        Log m_log;
        ComponentRegistry m_registry;
        ArchetypeStore m_store;
        EntityAllocator m_allocator;
        EntityLocationMap m_locations;
        Resources m_resources;
        CommandQueue m_commands;
        Schedules m_schedules;
        std::unordered_map<TypeKey, std::unique_ptr<void, void(*)(void*)>> m_queryCache;
    };

    // ============= Schedule execution =============

    inline void Schedule::Build(World& world)
    {
        for (auto& system : m_systems)
        {
            if (system->IsInitialized())
                continue;

            system->Initialize(world);
            world.GetLog().Trace("Initialized system '{}'", system->GetName());
        }
    }

    inline ScheduleReport Schedule::Run(World& world)
    {
        FLUX_PROFILE_ZONE_NAMED_COLOR("Schedule::Run", Profile::ColorSystem);

        Build(world);

        ScheduleReport report;
        const FlushPolicy policy = world.GetConfig().flushPolicy;

        for (auto& system : m_systems)
        {
            SystemResult result = system->Run(world);
            ++report.systemsRun;

            if (result.IsErr())
            {
                world.GetLog().Error("System '{}' failed: {}", system->GetName(), result.Error().message);
                system->DiscardBuffers();
                report.failures.push_back(SystemFailure{std::string(system->GetName()), std::move(result).Error()});
            }
            else
            {
                system->ApplyBuffers(world);
            }

            if (policy == FlushPolicy::AfterEachSystem)
            {
                report.commandsApplied += world.ApplyCommands();
            }
        }

        if (policy == FlushPolicy::AfterSchedule)
        {
            report.commandsApplied += world.ApplyCommands();
        }

        return report;
    }

    inline ScheduleReport Schedules::Run(ScheduleLabel label, World& world)
    {
        std::unique_ptr<Schedule> schedule = Take(label);
        if (!schedule)
            return {};

        struct PutBack
        {
            Schedules& owner;
            ScheduleLabel label;
            std::unique_ptr<Schedule>& schedule;

            ~PutBack() { owner.Put(label, std::move(schedule)); }
        } putBack{*this, label, schedule};

        return schedule->Run(world);
    }

    // ============= Built-in commands =============

    template<Resource T>
    void InsertResourceCommand<T>::Execute(World& world)
    {
        world.InsertResource(std::move(m_value));
    }

    template<Resource T>
    void RemoveResourceCommand<T>::Execute(World& world)
    {
        FLUX_UNUSED(world.RemoveResource<T>());
    }

    template<Component... Ts>
    void SpawnCommand<Ts...>::Execute(World& world)
    {
        std::apply([&](Ts&... components) { world.SpawnReserved(m_entity, components...); }, m_components);
    }

    inline void DespawnCommand::Execute(World& world)
    {
        if (!world.Despawn(m_entity))
        {
            world.GetLog().Trace("Despawn skipped: entity {} is not alive", m_entity.GetIndex());
        }
    }

    template<Component T>
    void AddComponentCommand<T>::Execute(World& world)
    {
        if (!world.AddComponent(m_entity, m_value))
        {
            world.GetLog().Warn("AddComponent<{}> skipped: entity {} is not alive", TypeID<T>::Name(), m_entity.GetIndex());
        }
    }

    template<Component T>
    void RemoveComponentCommand<T>::Execute(World& world)
    {
        if (!world.RemoveComponent<T>(m_entity))
        {
            world.GetLog().Trace("RemoveComponent<{}> skipped for entity {}", TypeID<T>::Name(), m_entity.GetIndex());
        }
    }
}

#include "../System/FunctionSystem.hpp"
