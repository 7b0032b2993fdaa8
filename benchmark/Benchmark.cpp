#include <Flux/Flux.hpp>
#include <benchmark/benchmark.h>
#include <cstdint>
#include <vector>

struct Position
{
    std::uint64_t x;
    std::uint64_t y;
};

struct Velocity : Position {};

template<int N>
struct Comp
{
    int x;
};

struct Tag {};

static void BM_SpawnEntities(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        Flux::World world;
        for(size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(world.Spawn(Position{i, i}));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_SpawnEntitiesDeferred(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        Flux::World world;
        Flux::CommandQueue buffer;
        Flux::Commands commands(buffer, world.GetAllocator());
        for(size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(commands.Spawn(Position{i, i}, Velocity{}));
        }
        for(Flux::CommandPtr& command : buffer.Drain())
        {
            world.PushCommand(std::move(command));
        }
        benchmark::DoNotOptimize(world.ApplyCommands());
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_AddComponents(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Flux::World world;
        std::vector<Flux::Entity> entities;
        entities.reserve(count);
        for(size_t i = 0; i < count; ++i)
        {
            entities.push_back(world.Spawn(Position{i, i}));
        }
        state.ResumeTiming();

        for(Flux::Entity entity : entities)
        {
            benchmark::DoNotOptimize(world.AddComponent(entity, Velocity{}));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_RemoveComponents(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Flux::World world;
        std::vector<Flux::Entity> entities;
        entities.reserve(count);
        for(size_t i = 0; i < count; ++i)
        {
            entities.push_back(world.Spawn(Position{i, i}, Velocity{}));
        }
        state.ResumeTiming();

        for(Flux::Entity entity : entities)
        {
            benchmark::DoNotOptimize(world.RemoveComponent<Velocity>(entity));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_IterateSingleComponent(benchmark::State& state)
{
    const size_t count = state.range(0);
    Flux::World world;
    for(size_t i = 0; i < count; ++i)
    {
        world.Spawn(Position{i, i});
    }

    for(auto _ : state)
    {
        for(Position& pos : world.QueryOnce<Position>())
        {
            pos.x += 1;
            benchmark::DoNotOptimize(pos);
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_IterateTwoComponents(benchmark::State& state)
{
    const size_t count = state.range(0);
    Flux::World world;
    for(size_t i = 0; i < count; ++i)
    {
        world.Spawn(Position{i, i}, Velocity{{1, 1}});
    }

    for(auto _ : state)
    {
        world.QueryOnce<Position, const Velocity>().ForEach([](Position& pos, const Velocity& vel)
        {
            pos.x += vel.x;
            pos.y += vel.y;
            benchmark::DoNotOptimize(pos);
        });
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Half the entities carry a tag, splitting the match across two archetypes
static void BM_IterateTwoComponentsHalf(benchmark::State& state)
{
    const size_t count = state.range(0);
    Flux::World world;
    for(size_t i = 0; i < count; ++i)
    {
        if(i % 2 == 0)
            world.Spawn(Position{i, i}, Velocity{{1, 1}});
        else
            world.Spawn(Position{i, i}, Velocity{{1, 1}}, Tag{});
    }

    for(auto _ : state)
    {
        world.QueryOnce<Position, const Velocity>().ForEach([](Position& pos, const Velocity& vel)
        {
            pos.x += vel.x;
            benchmark::DoNotOptimize(pos);
        });
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_IterateFiveComponents(benchmark::State& state)
{
    const size_t count = state.range(0);
    Flux::World world;
    for(size_t i = 0; i < count; ++i)
    {
        world.Spawn(Comp<0>{1}, Comp<1>{2}, Comp<2>{3}, Comp<3>{4}, Comp<4>{5});
    }

    for(auto _ : state)
    {
        for(auto [a, b, c, d, e] : world.QueryOnce<Comp<0>, const Comp<1>, const Comp<2>, const Comp<3>, const Comp<4>>())
        {
            a.x = b.x + c.x + d.x + e.x;
            benchmark::DoNotOptimize(a);
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_GetComponent(benchmark::State& state)
{
    const size_t count = state.range(0);
    Flux::World world;
    std::vector<Flux::Entity> entities;
    entities.reserve(count);
    for(size_t i = 0; i < count; ++i)
    {
        entities.push_back(world.Spawn(Position{i, i}));
    }

    for(auto _ : state)
    {
        for(Flux::Entity entity : entities)
        {
            benchmark::DoNotOptimize(world.GetComponent<Position>(entity));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void IntegrateSystem(Flux::Query<Position, const Velocity> query)
{
    query.ForEach([](Position& pos, const Velocity& vel)
    {
        pos.x += vel.x;
        pos.y += vel.y;
    });
}

static void BM_RunSchedule(benchmark::State& state)
{
    const size_t count = state.range(0);
    Flux::World world;
    for(size_t i = 0; i < count; ++i)
    {
        world.Spawn(Position{i, i}, Velocity{{1, 1}});
    }
    world.AddSystem(Flux::ScheduleLabel::Main, &IntegrateSystem, "integrate");
    world.AddSystem(Flux::ScheduleLabel::Main, [](Flux::Query<const Position> query)
    {
        benchmark::DoNotOptimize(query.Count());
    }, "count");

    for(auto _ : state)
    {
        Flux::ScheduleReport report = world.RunSchedule(Flux::ScheduleLabel::Main);
        benchmark::DoNotOptimize(report.systemsRun);
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Entity creation
BENCHMARK(BM_SpawnEntities)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_SpawnEntitiesDeferred)->Arg(10000)->Arg(100000);

// Structural changes
BENCHMARK(BM_AddComponents)->Arg(10000)->Arg(100000);
BENCHMARK(BM_RemoveComponents)->Arg(10000)->Arg(100000);

// Iteration
BENCHMARK(BM_IterateSingleComponent)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_IterateTwoComponents)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_IterateTwoComponentsHalf)->Arg(10000)->Arg(100000)->Arg(1000000);
BENCHMARK(BM_IterateFiveComponents)->Arg(10000)->Arg(100000)->Arg(1000000);

// Random access
BENCHMARK(BM_GetComponent)->Arg(10000)->Arg(100000)->Arg(1000000);

// Schedules
BENCHMARK(BM_RunSchedule)->Arg(10000)->Arg(100000);

BENCHMARK_MAIN();
