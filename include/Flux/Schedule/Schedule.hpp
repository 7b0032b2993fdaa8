#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Error.hpp"
#include "../System/System.hpp"

namespace Flux
{
    class World;

    enum class ScheduleLabel : std::uint8_t
    {
        Initialization,
        Main,
        Destroy
    };

    FLUX_NODISCARD constexpr std::string_view GetScheduleLabelName(ScheduleLabel label) noexcept
    {
        switch (label)
        {
            case ScheduleLabel::Initialization: return "Initialization";
            case ScheduleLabel::Main: return "Main";
            case ScheduleLabel::Destroy: return "Destroy";
            default: return "Unknown";
        }
    }

    struct SystemFailure
    {
        std::string systemName;
        Error error;
    };

    struct ScheduleReport
    {
        std::vector<SystemFailure> failures;
        std::size_t systemsRun = 0;
        std::size_t commandsApplied = 0;

        FLUX_NODISCARD bool Succeeded() const noexcept { return failures.empty(); }
    };

    /**
     * Ordered list of systems. Systems run in registration order, one at a
     * time. Run and Build are defined with World.
     */
    class Schedule
    {
    public:
        Schedule() = default;

        Schedule(const Schedule&) = delete;
        Schedule& operator=(const Schedule&) = delete;
        Schedule(Schedule&&) = default;
        Schedule& operator=(Schedule&&) = default;

        void AddSystem(std::unique_ptr<ISystem> system)
        {
            if (system)
                m_systems.push_back(std::move(system));
        }

        /**
         * Initialize every system added since the last build and validate
         * its access. Throws AccessConflictError before any system runs.
         */
        void Build(World& world);

        /**
         * Build, then run each system: apply its buffered commands on success,
         * discard them on failure, and flush the world queue per FlushPolicy.
         */
        ScheduleReport Run(World& world);

        // Append systems from another schedule, keeping their order
        void Append(Schedule&& other)
        {
            for (auto& system : other.m_systems)
            {
                m_systems.push_back(std::move(system));
            }
            other.m_systems.clear();
        }

        FLUX_NODISCARD std::size_t Size() const noexcept { return m_systems.size(); }
        FLUX_NODISCARD bool Empty() const noexcept { return m_systems.empty(); }

        FLUX_NODISCARD const ISystem* GetSystem(std::size_t index) const noexcept
        {
            return index < m_systems.size() ? m_systems[index].get() : nullptr;
        }

    private:
        std::vector<std::unique_ptr<ISystem>> m_systems;
    };

    /**
     * Schedules by label. A schedule is taken out while it runs so its
     * systems can borrow the world that owns it.
     */
    class Schedules
    {
    public:
        Schedules()
        {
            m_schedules.emplace(ScheduleLabel::Initialization, std::make_unique<Schedule>());
            m_schedules.emplace(ScheduleLabel::Main, std::make_unique<Schedule>());
            m_schedules.emplace(ScheduleLabel::Destroy, std::make_unique<Schedule>());
        }

        void Add(ScheduleLabel label, std::unique_ptr<ISystem> system)
        {
            auto& schedule = m_schedules[label];
            if (!schedule)
                schedule = std::make_unique<Schedule>();
            schedule->AddSystem(std::move(system));
        }

        FLUX_NODISCARD Schedule* Get(ScheduleLabel label) noexcept
        {
            auto it = m_schedules.find(label);
            return it != m_schedules.end() ? it->second.get() : nullptr;
        }

        FLUX_NODISCARD const Schedule* Get(ScheduleLabel label) const noexcept
        {
            auto it = m_schedules.find(label);
            return it != m_schedules.end() ? it->second.get() : nullptr;
        }

        /**
         * Take the schedule out, run it, and put it back (also on throw).
         * An absent label runs nothing.
         */
        ScheduleReport Run(ScheduleLabel label, World& world);

        /**
         * Remove a schedule for running.
         * @return The schedule, or nullptr if absent or already taken
         */
        FLUX_NODISCARD std::unique_ptr<Schedule> Take(ScheduleLabel label)
        {
            auto it = m_schedules.find(label);
            if (it == m_schedules.end())
                return nullptr;
            return std::move(it->second);
        }

        /**
         * Return a taken schedule. Systems added to the label while it was
         * out are appended after the returned ones.
         */
        void Put(ScheduleLabel label, std::unique_ptr<Schedule> schedule)
        {
            if (!schedule)
                return;

            auto& slot = m_schedules[label];
            if (slot)
                schedule->Append(std::move(*slot));
            slot = std::move(schedule);
        }

    private:
        std::unordered_map<ScheduleLabel, std::unique_ptr<Schedule>> m_schedules;
    };
}
