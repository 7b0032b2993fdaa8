#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "Flux/Flux.hpp"
#include "../TestComponents.hpp"

using namespace Flux;
using namespace Flux::Test;

namespace
{
    void SpawnHealthSystem(Commands commands)
    {
        commands.Spawn(Health{10, 10});
    }

    // Sees the world after the previous system's commands were applied
    void RecordHealthCountSystem(Query<const Health> query, ResMut<EventLog> log)
    {
        log->entries.push_back(std::to_string(query.Count()));
    }

    // Throws after recording its spawn while the Frozen flag resource is present
    void ThrowingSpawnSystem(Commands commands, OptionalRes<Frozen> frozen)
    {
        commands.Spawn(Health{1, 1});
        if (frozen)
            throw std::runtime_error("spawner frozen");
    }

    SystemResult FailingSpawnSystem(Commands commands)
    {
        commands.Spawn(Health{0, 0});
        return Err(ErrorCode::SystemFailed, "spawn limit reached");
    }
}

class ScheduleTest : public ::testing::Test
{
protected:
    ScheduleTest() :
        world(MakeConfig())
    {
        world.InsertResource(EventLog{});
    }

    WorldConfig MakeConfig()
    {
        WorldConfig config;
        config.logSink = captured.Sink();
        config.minLogLevel = LogLevel::Trace;
        return config;
    }

    const std::vector<std::string>& Entries()
    {
        return world.GetResource<EventLog>()->entries;
    }

    CapturedLog captured;
    World world;
};

TEST_F(ScheduleTest, SystemsRunInRegistrationOrder)
{
    world.AddSystem(ScheduleLabel::Main, [](ResMut<EventLog> log) { log->entries.push_back("first"); });
    world.AddSystem(ScheduleLabel::Main, [](ResMut<EventLog> log) { log->entries.push_back("second"); });
    world.AddSystem(ScheduleLabel::Main, [](ResMut<EventLog> log) { log->entries.push_back("third"); });

    ScheduleReport report = world.RunSchedule(ScheduleLabel::Main);

    EXPECT_TRUE(report.Succeeded());
    EXPECT_EQ(report.systemsRun, 3u);
    EXPECT_EQ(Entries(), (std::vector<std::string>{"first", "second", "third"}));
}

TEST_F(ScheduleTest, LabelsAreIndependent)
{
    world.AddSystem(ScheduleLabel::Initialization, [](ResMut<EventLog> log) { log->entries.push_back("init"); });
    world.AddSystem(ScheduleLabel::Destroy, [](ResMut<EventLog> log) { log->entries.push_back("destroy"); });

    EXPECT_EQ(world.RunSchedule(ScheduleLabel::Main).systemsRun, 0u);
    world.RunSchedule(ScheduleLabel::Initialization);
    world.RunSchedule(ScheduleLabel::Destroy);

    EXPECT_EQ(Entries(), (std::vector<std::string>{"init", "destroy"}));
    EXPECT_EQ(GetScheduleLabelName(ScheduleLabel::Destroy), "Destroy");
}

TEST_F(ScheduleTest, CommandsAreNotVisibleUntilFlush)
{
    world.AddSystem(ScheduleLabel::Main, [](Commands commands, Query<const Health> query, ResMut<EventLog> log)
    {
        commands.Spawn(Health{1, 1});
        log->entries.push_back(std::to_string(query.Count()));
    });

    world.RunSchedule(ScheduleLabel::Main);
    EXPECT_EQ(world.QueryOnce<const Health>().Count(), 1u);

    world.RunSchedule(ScheduleLabel::Main);
    EXPECT_EQ(Entries(), (std::vector<std::string>{"0", "1"}));
}

TEST_F(ScheduleTest, FlushAfterEachSystem)
{
    world.AddSystem(ScheduleLabel::Main, &SpawnHealthSystem);
    world.AddSystem(ScheduleLabel::Main, &RecordHealthCountSystem);

    ScheduleReport report = world.RunSchedule(ScheduleLabel::Main);

    EXPECT_EQ(report.commandsApplied, 1u);
    EXPECT_EQ(Entries(), (std::vector<std::string>{"1"}));
}

TEST_F(ScheduleTest, FlushAfterSchedule)
{
    world.SetFlushPolicy(FlushPolicy::AfterSchedule);
    world.AddSystem(ScheduleLabel::Main, &SpawnHealthSystem);
    world.AddSystem(ScheduleLabel::Main, &RecordHealthCountSystem);

    ScheduleReport report = world.RunSchedule(ScheduleLabel::Main);

    EXPECT_EQ(report.commandsApplied, 1u);
    EXPECT_EQ(Entries(), (std::vector<std::string>{"0"}));
    EXPECT_EQ(world.QueryOnce<const Health>().Count(), 1u);
}

TEST_F(ScheduleTest, FailingSystemIsReportedAndScheduleContinues)
{
    world.AddSystem(ScheduleLabel::Main, &FailingSpawnSystem, "spawner");
    world.AddSystem(ScheduleLabel::Main, &RecordHealthCountSystem, "recorder");

    ScheduleReport report = world.RunSchedule(ScheduleLabel::Main);

    EXPECT_FALSE(report.Succeeded());
    EXPECT_EQ(report.systemsRun, 2u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].systemName, "spawner");
    EXPECT_EQ(report.failures[0].error.code, ErrorCode::SystemFailed);
    EXPECT_TRUE(captured.Contains(LogLevel::Error, "spawner"));

    // The failed system's commands were discarded
    EXPECT_EQ(report.commandsApplied, 0u);
    EXPECT_EQ(Entries(), (std::vector<std::string>{"0"}));
    EXPECT_EQ(world.QueryOnce<const Health>().Count(), 0u);
}

TEST_F(ScheduleTest, ThrowingSystemDiscardsItsCommands)
{
    world.InsertResource(Frozen{});
    world.AddSystem(ScheduleLabel::Main, &ThrowingSpawnSystem, "spawner");

    EXPECT_THROW(world.RunSchedule(ScheduleLabel::Main), std::runtime_error);
    EXPECT_EQ(world.QueryOnce<const Health>().Count(), 0u);

    FLUX_UNUSED(world.RemoveResource<Frozen>());
    ScheduleReport report = world.RunSchedule(ScheduleLabel::Main);

    EXPECT_TRUE(report.Succeeded());
    EXPECT_EQ(report.commandsApplied, 1u);
    EXPECT_EQ(world.QueryOnce<const Health>().Count(), 1u);
}

TEST_F(ScheduleTest, ConflictIsRejectedBeforeAnySystemRuns)
{
    world.AddSystem(ScheduleLabel::Main, [](ResMut<EventLog> log) { log->entries.push_back("ran"); });
    world.AddSystem(ScheduleLabel::Main, [](Query<Position>, Query<const Position>) {}, "aliasing");

    EXPECT_THROW(world.RunSchedule(ScheduleLabel::Main), AccessConflictError);
    EXPECT_TRUE(Entries().empty());
    EXPECT_TRUE(captured.Contains(LogLevel::Error, "aliasing"));

    // The schedule is put back after the throw
    EXPECT_NE(world.GetSchedules().Get(ScheduleLabel::Main), nullptr);
    EXPECT_EQ(world.GetSchedules().Get(ScheduleLabel::Main)->Size(), 2u);
}

TEST_F(ScheduleTest, MissingResourceStopsTheRun)
{
    world.AddSystem(ScheduleLabel::Main, [](Res<DeltaTime>) {}, "needs_time");
    EXPECT_THROW(world.RunSchedule(ScheduleLabel::Main), MissingResourceError);

    world.InsertResource(DeltaTime{});
    EXPECT_TRUE(world.RunSchedule(ScheduleLabel::Main).Succeeded());
}

TEST_F(ScheduleTest, BuildInitializesPendingSystems)
{
    Schedule schedule;
    schedule.AddSystem(MakeSystem([](Query<const Position>) {}));
    schedule.AddSystem(nullptr);
    EXPECT_EQ(schedule.Size(), 1u);
    EXPECT_FALSE(schedule.GetSystem(0)->IsInitialized());

    schedule.Build(world);
    EXPECT_TRUE(schedule.GetSystem(0)->IsInitialized());
    EXPECT_EQ(schedule.GetSystem(1), nullptr);
}

TEST_F(ScheduleTest, SystemsAddedWhileScheduleRunsAreKept)
{
    world.AddSystem(ScheduleLabel::Main, [](Commands commands)
    {
        commands.Run([](World& w)
        {
            // Main is taken out while it runs
            EXPECT_EQ(w.GetSchedules().Get(ScheduleLabel::Main), nullptr);
            if (!w.HasResource<FrameCounter>())
            {
                w.InsertResource(FrameCounter{});
                w.AddSystem(ScheduleLabel::Main, [](ResMut<EventLog> log) { log->entries.push_back("late"); });
            }
        });
    });

    world.RunSchedule(ScheduleLabel::Main);
    EXPECT_EQ(world.GetSchedules().Get(ScheduleLabel::Main)->Size(), 2u);

    world.RunSchedule(ScheduleLabel::Main);
    EXPECT_EQ(Entries(), (std::vector<std::string>{"late"}));
}

TEST_F(ScheduleTest, TakeAndPut)
{
    Schedules& schedules = world.GetSchedules();
    schedules.Add(ScheduleLabel::Main, MakeSystem([](ResMut<EventLog>) {}));

    std::unique_ptr<Schedule> taken = schedules.Take(ScheduleLabel::Main);
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(schedules.Get(ScheduleLabel::Main), nullptr);
    EXPECT_EQ(schedules.Take(ScheduleLabel::Main), nullptr);

    // Running a taken label is a no-op
    EXPECT_EQ(schedules.Run(ScheduleLabel::Main, world).systemsRun, 0u);

    schedules.Add(ScheduleLabel::Main, MakeSystem([](Res<EventLog>) {}));
    schedules.Put(ScheduleLabel::Main, std::move(taken));
    EXPECT_EQ(schedules.Get(ScheduleLabel::Main)->Size(), 2u);
}
