#include <gtest/gtest.h>
#include <cstdint>
#include "Flux/Archetype/Column.hpp"
#include "../TestComponents.hpp"

using namespace Flux;
using namespace Flux::Test;

namespace
{
    struct alignas(64) CacheLineTag {};
    struct alignas(2 * config::MAX_ZERO_SIZED_ALIGNMENT) OversizedTag {};

    static_assert(Component<CacheLineTag>);
    static_assert(!Component<OversizedTag>);
}

class ColumnTest : public ::testing::Test
{
protected:
    static Column MakeColumn(std::size_t initialCapacity = config::COLUMN_INITIAL_CAPACITY)
    {
        return Column(MakeComponentInfo<Position>(0), initialCapacity);
    }
};

TEST_F(ColumnTest, StartsEmptyWithoutAllocation)
{
    Column column = MakeColumn();

    EXPECT_TRUE(column.Empty());
    EXPECT_EQ(column.Size(), 0u);
    EXPECT_EQ(column.Capacity(), 0u);
    EXPECT_EQ(column.GetElementSize(), sizeof(Position));
    EXPECT_EQ(column.GetAlignment(), alignof(Position));
}

TEST_F(ColumnTest, PushCopiesBytes)
{
    Column column = MakeColumn();
    Position value{1.0f, 2.0f, 3.0f};

    const std::size_t row = column.Push(&value);
    value.x = 99.0f;

    EXPECT_EQ(row, 0u);
    EXPECT_EQ(column.Get<Position>(0), (Position{1.0f, 2.0f, 3.0f}));
}

TEST_F(ColumnTest, FirstGrowthUsesInitialCapacityThenDoubles)
{
    Column column = MakeColumn();
    Position value;

    column.Push(&value);
    EXPECT_EQ(column.Capacity(), config::COLUMN_INITIAL_CAPACITY);

    for (std::size_t i = 1; i <= config::COLUMN_INITIAL_CAPACITY; ++i)
    {
        column.Push(&value);
    }
    EXPECT_EQ(column.Capacity(), config::COLUMN_INITIAL_CAPACITY * config::COLUMN_GROWTH_FACTOR);
}

TEST_F(ColumnTest, GrowthPreservesValues)
{
    Column column = MakeColumn(2);
    for (int i = 0; i < 100; ++i)
    {
        Position value{static_cast<float>(i), 0.0f, 0.0f};
        column.Push(&value);
    }

    ASSERT_EQ(column.Size(), 100u);
    for (int i = 0; i < 100; ++i)
    {
        EXPECT_FLOAT_EQ(column.Get<Position>(i).x, static_cast<float>(i));
    }
}

TEST_F(ColumnTest, SwapRemoveMovesLastRow)
{
    Column column = MakeColumn();
    for (int i = 0; i < 3; ++i)
    {
        Position value{static_cast<float>(i), 0.0f, 0.0f};
        column.Push(&value);
    }

    column.SwapRemove(0);
    ASSERT_EQ(column.Size(), 2u);
    EXPECT_FLOAT_EQ(column.Get<Position>(0).x, 2.0f);
    EXPECT_FLOAT_EQ(column.Get<Position>(1).x, 1.0f);

    // Removing the last row moves nothing
    column.SwapRemove(1);
    ASSERT_EQ(column.Size(), 1u);
    EXPECT_FLOAT_EQ(column.Get<Position>(0).x, 2.0f);
}

TEST_F(ColumnTest, UninitializedSlotThenWrite)
{
    Column column = MakeColumn();
    const std::size_t row = column.PushUninitialized();
    const Position value{4.0f, 5.0f, 6.0f};
    column.Write(row, &value);

    EXPECT_EQ(column.Get<Position>(row), value);
    EXPECT_EQ(column.Data<Position>()[row], value);
}

TEST_F(ColumnTest, ZeroSizedColumnCountsOnly)
{
    Column column(MakeComponentInfo<Player>(0));
    Player tag;

    column.Push(&tag);
    column.Push(nullptr);
    column.PushUninitialized();

    EXPECT_EQ(column.Size(), 3u);
    EXPECT_EQ(column.Capacity(), 0u);
    EXPECT_NE(column.GetPointer(0), nullptr);
    EXPECT_EQ(column.GetPointer(0), column.GetPointer(2));

    column.SwapRemove(1);
    EXPECT_EQ(column.Size(), 2u);
}

TEST_F(ColumnTest, ZeroSizedColumnHonorsTagAlignment)
{
    Column column(MakeComponentInfo<CacheLineTag>(0));
    column.PushUninitialized();

    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(column.GetPointer(0)) % alignof(CacheLineTag), 0u);
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(column.Data<CacheLineTag>()) % alignof(CacheLineTag), 0u);
}

TEST_F(ColumnTest, RespectsOverAlignment)
{
    Column column(MakeComponentInfo<RenderData>(0), 4);
    RenderData value;
    for (int i = 0; i < 9; ++i)
    {
        column.Push(&value);
    }

    for (std::size_t row = 0; row < column.Size(); ++row)
    {
        EXPECT_EQ(reinterpret_cast<std::uintptr_t>(column.GetPointer(row)) % 32, 0u);
    }
}

TEST_F(ColumnTest, MoveTransfersStorage)
{
    Column source = MakeColumn();
    Position value{7.0f, 8.0f, 9.0f};
    source.Push(&value);

    Column target = std::move(source);
    EXPECT_EQ(target.Size(), 1u);
    EXPECT_EQ(target.Get<Position>(0), value);
    EXPECT_EQ(source.Size(), 0u);
    EXPECT_EQ(source.Capacity(), 0u);
}

TEST_F(ColumnTest, TypeCheck)
{
    Column column = MakeColumn();
    EXPECT_TRUE(column.IsType<Position>());
    EXPECT_FALSE(column.IsType<Velocity>());
    EXPECT_EQ(column.GetTypeKey(), TypeID<Position>::Key());
}
