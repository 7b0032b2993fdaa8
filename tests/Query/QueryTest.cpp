#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <tuple>
#include <vector>
#include "Flux/World/World.hpp"
#include "../TestComponents.hpp"

using namespace Flux;
using namespace Flux::Test;

class QueryTest : public ::testing::Test
{
protected:
    World world;
};

TEST_F(QueryTest, MatchesArchetypesContainingAllComponents)
{
    world.Spawn(Position{1, 0, 0});
    world.Spawn(Position{2, 0, 0}, Velocity{1, 1, 1});
    world.Spawn(Velocity{3, 3, 3});
    world.Spawn(Position{4, 0, 0}, Velocity{1, 1, 1}, Health{10, 10});

    EXPECT_EQ(world.QueryOnce<const Position>().Count(), 3u);
    EXPECT_EQ((world.QueryOnce<const Position, const Velocity>().Count()), 2u);
    EXPECT_EQ(world.QueryOnce<const Health>().Count(), 1u);
    EXPECT_TRUE(world.QueryOnce<const Frozen>().Empty());
}

TEST_F(QueryTest, SingleElementYieldsReference)
{
    world.Spawn(Position{1, 2, 3});

    for (Position& position : world.QueryOnce<Position>())
    {
        position.x += 10.0f;
    }

    auto query = world.QueryOnce<const Position>();
    static_assert(std::is_same_v<decltype(*query.begin()), const Position&>);
    EXPECT_FLOAT_EQ((*query.begin()).x, 11.0f);
}

TEST_F(QueryTest, TupleIterationAndMutation)
{
    for (int i = 0; i < 10; ++i)
    {
        world.Spawn(Position{static_cast<float>(i), 0, 0}, Velocity{1, 2, 3});
    }

    for (auto [position, velocity] : world.QueryOnce<Position, const Velocity>())
    {
        position.x += velocity.dx;
        position.y += velocity.dy;
    }

    std::vector<float> xs;
    world.QueryOnce<const Position>().ForEach([&](const Position& position)
    {
        EXPECT_FLOAT_EQ(position.y, 2.0f);
        xs.push_back(position.x);
    });
    std::sort(xs.begin(), xs.end());
    ASSERT_EQ(xs.size(), 10u);
    for (int i = 0; i < 10; ++i)
    {
        EXPECT_FLOAT_EQ(xs[i], static_cast<float>(i + 1));
    }
}

TEST_F(QueryTest, EntityElementYieldsHandles)
{
    Entity a = world.Spawn(Position{});
    Entity b = world.Spawn(Position{}, Velocity{});
    Entity c = world.Spawn();

    std::set<Entity> withPosition;
    for (auto [entity, position] : world.QueryOnce<Entity, const Position>())
    {
        FLUX_UNUSED(position);
        withPosition.insert(entity);
    }
    EXPECT_EQ(withPosition, (std::set<Entity>{a, b}));

    // Entity alone matches every archetype, the empty one included
    std::set<Entity> all;
    for (Entity entity : world.QueryOnce<Entity>())
    {
        all.insert(entity);
    }
    EXPECT_EQ(all, (std::set<Entity>{a, b, c}));
}

TEST_F(QueryTest, IteratorReportsEntity)
{
    Entity e = world.Spawn(Health{5, 10});
    auto query = world.QueryOnce<const Health>();
    auto it = query.begin();

    ASSERT_NE(it, query.end());
    EXPECT_EQ(it.GetEntity(), e);
    ++it;
    EXPECT_EQ(it, query.end());
}

TEST_F(QueryTest, NestedTupleElements)
{
    world.Spawn(Position{1, 0, 0}, Velocity{2, 0, 0}, Health{3, 3});

    std::size_t rows = 0;
    world.QueryOnce<std::tuple<const Position, Velocity>, const Health>().ForEach(
        [&](std::tuple<const Position&, Velocity&> pair, const Health& health)
        {
            auto& [position, velocity] = pair;
            velocity.dx += position.x;
            EXPECT_EQ(health.current, 3);
            ++rows;
        });

    EXPECT_EQ(rows, 1u);
    EXPECT_FLOAT_EQ((*world.QueryOnce<const Velocity>().begin()).dx, 3.0f);
}

TEST_F(QueryTest, ZeroSizedComponentsFilterRows)
{
    world.Spawn(Position{1, 0, 0}, Player{});
    world.Spawn(Position{2, 0, 0});
    world.Spawn(Position{3, 0, 0}, Player{});

    std::size_t players = 0;
    world.QueryOnce<const Position, const Player>().ForEach([&](const Position& position, const Player&)
    {
        EXPECT_NE(position.x, 2.0f);
        ++players;
    });
    EXPECT_EQ(players, 2u);
}

TEST_F(QueryTest, SingleRequiresExactlyOneRow)
{
    EXPECT_FALSE(world.QueryOnce<const Health>().Single().has_value());

    world.Spawn(Health{7, 10});
    auto single = world.QueryOnce<const Health>().Single();
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(std::get<0>(*single).current, 7);

    world.Spawn(Health{8, 10});
    EXPECT_FALSE(world.QueryOnce<const Health>().Single().has_value());
}

TEST_F(QueryTest, GetByEntity)
{
    Entity moving = world.Spawn(Position{1, 0, 0}, Velocity{5, 0, 0});
    Entity still = world.Spawn(Position{2, 0, 0});

    auto query = world.QueryOnce<const Position, Velocity>();
    auto row = query.Get(moving);
    ASSERT_TRUE(row.has_value());
    std::get<1>(*row).dx = 6.0f;

    EXPECT_FALSE(query.Get(still).has_value());
    EXPECT_TRUE(query.Contains(moving));
    EXPECT_FALSE(query.Contains(still));
    EXPECT_FLOAT_EQ(world.GetComponent<Velocity>(moving)->dx, 6.0f);

    world.Despawn(moving);
    EXPECT_FALSE((world.QueryOnce<const Position, Velocity>().Get(moving).has_value()));
}

TEST_F(QueryTest, ConflictingAccessIsRejected)
{
    EXPECT_THROW(static_cast<void>(world.QueryOnce<Position, const Position>()), AccessConflictError);
    EXPECT_THROW(static_cast<void>(world.QueryOnce<Position, Position>()), AccessConflictError);
    EXPECT_NO_THROW(static_cast<void>(world.QueryOnce<const Position, const Position>()));
}

TEST_F(QueryTest, ConflictIsReportedThroughWorldLog)
{
    CapturedLog captured;
    WorldConfig config;
    config.logSink = captured.Sink();
    World logged(config);

    EXPECT_THROW(static_cast<void>(logged.QueryOnce<Velocity, const Velocity>()), AccessConflictError);
    EXPECT_TRUE(captured.Contains(LogLevel::Error, "Velocity"));
}

TEST_F(QueryTest, StateUpdatesIncrementally)
{
    QueryState<const Position> state(world.GetRegistry());
    state.Update(world.GetStore());
    const std::size_t initial = state.GetMatched().size();

    world.Spawn(Position{}, Velocity{});
    state.Update(world.GetStore());

    EXPECT_GT(state.GetMatched().size(), initial);
    for (ArchetypeID id : state.GetMatched())
    {
        EXPECT_TRUE(world.GetStore().Get(id).HasComponent(*world.GetRegistry().GetID<Position>()));
    }
    EXPECT_TRUE(std::is_sorted(state.GetMatched().begin(), state.GetMatched().end()));

    // Idempotent without new archetypes
    const std::size_t matched = state.GetMatched().size();
    state.Update(world.GetStore());
    EXPECT_EQ(state.GetMatched().size(), matched);
}

TEST_F(QueryTest, AccessDescribesReadsAndWrites)
{
    QueryState<Position, const Velocity, Entity> state(world.GetRegistry());
    const FilteredAccess& access = state.GetAccess();
    const ComponentID positionId = *world.GetRegistry().GetID<Position>();
    const ComponentID velocityId = *world.GetRegistry().GetID<Velocity>();

    EXPECT_TRUE(access.Writes(positionId));
    EXPECT_TRUE(access.Reads(velocityId));
    EXPECT_FALSE(access.Writes(velocityId));
    EXPECT_EQ(access.GetEntries().size(), 2u);
    EXPECT_EQ(state.GetRequired(), (Signature{positionId, velocityId}));
}

TEST_F(QueryTest, FilteredAccessConflicts)
{
    FilteredAccess reader;
    reader.Add(0, false);
    FilteredAccess otherReader;
    otherReader.Add(0, false);
    FilteredAccess writer;
    writer.Add(0, true);

    EXPECT_FALSE(reader.ConflictsWith(otherReader));
    EXPECT_TRUE(reader.ConflictsWith(writer));
    EXPECT_TRUE(writer.ConflictsWith(reader));
    EXPECT_FALSE(writer.TryAdd(0, false));
    EXPECT_TRUE(reader.TryAdd(0, false));
}
