#include <gtest/gtest.h>
#include <Flux/Archetype/Column.hpp>
#include <Flux/Memory/Memory.hpp>
#include <Flux/Memory/Region.hpp>
#include <cstdint>
#include <stdexcept>

using namespace Flux;

class RegionTest : public ::testing::Test
{
protected:
    AllocationTracker& tracker = AllocationTracker::Get();
};

TEST_F(RegionTest, DefaultRegionIsGeneral)
{
    EXPECT_EQ(GetCurrentRegion(), MemoryRegion::General);
    EXPECT_EQ(GetRegionName(MemoryRegion::Ecs), "Ecs");
}

TEST_F(RegionTest, GuardRestoresPreviousRegion)
{
    {
        RegionGuard physics(MemoryRegion::Physics);
        EXPECT_EQ(GetCurrentRegion(), MemoryRegion::Physics);
        {
            RegionGuard audio(MemoryRegion::Audio);
            EXPECT_EQ(GetCurrentRegion(), MemoryRegion::Audio);
            EXPECT_EQ(audio.GetPrevious(), MemoryRegion::Physics);
        }
        EXPECT_EQ(GetCurrentRegion(), MemoryRegion::Physics);
    }
    EXPECT_EQ(GetCurrentRegion(), MemoryRegion::General);
}

TEST_F(RegionTest, GuardRestoresOnException)
{
    try
    {
        RegionGuard guard(MemoryRegion::Scene);
        throw std::runtime_error("unwind");
    }
    catch (const std::runtime_error&)
    {
    }
    EXPECT_EQ(GetCurrentRegion(), MemoryRegion::General);
}

TEST_F(RegionTest, TrackedBlocksAreAttributedToActiveRegion)
{
    const auto before = tracker.GetStats(MemoryRegion::Graphics);

    TrackedBlock block;
    {
        RegionGuard guard(MemoryRegion::Graphics);
        block = AllocateTracked(256, 64);
    }
    ASSERT_NE(block.ptr, nullptr);
    EXPECT_EQ(block.region, MemoryRegion::Graphics);
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(block.ptr) % 64, 0u);
    EXPECT_EQ(tracker.GetCount(MemoryRegion::Graphics), before.liveAllocations + 1);
    EXPECT_EQ(tracker.GetBytes(MemoryRegion::Graphics), before.liveBytes + 256);

    // Released against the block's own region
    FreeTracked(block);
    EXPECT_EQ(block.ptr, nullptr);
    EXPECT_EQ(tracker.GetCount(MemoryRegion::Graphics), before.liveAllocations);
    EXPECT_EQ(tracker.GetStats(MemoryRegion::Graphics).totalAllocations, before.totalAllocations + 1);
}

TEST_F(RegionTest, ZeroSizeAllocationIsEmpty)
{
    TrackedBlock block = AllocateTracked(0, 16);
    EXPECT_EQ(block.ptr, nullptr);
    FreeTracked(block);
}

TEST_F(RegionTest, ColumnAllocationsFollowRegion)
{
    const std::size_t before = tracker.GetCount(MemoryRegion::Physics);
    {
        RegionGuard guard(MemoryRegion::Physics);
        Column column(sizeof(float), alignof(float), TypeID<float>::Key(), 4);
        const float value = 1.0f;
        column.Push(&value);

        EXPECT_EQ(column.GetRegion(), MemoryRegion::Physics);
        EXPECT_EQ(tracker.GetCount(MemoryRegion::Physics), before + 1);
    }
    EXPECT_EQ(tracker.GetCount(MemoryRegion::Physics), before);
}
