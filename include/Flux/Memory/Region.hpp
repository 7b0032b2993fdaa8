#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "../Core/Base.hpp"

namespace Flux
{
    /**
     * Subsystem a heap allocation is attributed to. The active region is
     * thread-local and changed with RegionGuard.
     */
    enum class MemoryRegion : std::uint8_t
    {
        General,
        Graphics,
        Physics,
        Audio,
        Scene,
        Ecs,

        Count
    };

    inline constexpr std::size_t MEMORY_REGION_COUNT = static_cast<std::size_t>(MemoryRegion::Count);

    FLUX_NODISCARD constexpr std::string_view GetRegionName(MemoryRegion region) noexcept
    {
        switch (region)
        {
            case MemoryRegion::General: return "General";
            case MemoryRegion::Graphics: return "Graphics";
            case MemoryRegion::Physics: return "Physics";
            case MemoryRegion::Audio: return "Audio";
            case MemoryRegion::Scene: return "Scene";
            case MemoryRegion::Ecs: return "Ecs";
            default: return "Unknown";
        }
    }

    namespace Detail
    {
        inline MemoryRegion& CurrentRegionSlot() noexcept
        {
            thread_local MemoryRegion s_region = MemoryRegion::General;
            return s_region;
        }
    }

    FLUX_NODISCARD inline MemoryRegion GetCurrentRegion() noexcept
    {
        return Detail::CurrentRegionSlot();
    }

    /**
     * Scoped region switch. Restores the previous region on destruction,
     * including during stack unwinding.
     */
    class RegionGuard
    {
    public:
        explicit RegionGuard(MemoryRegion region) noexcept :
            m_previous(Detail::CurrentRegionSlot())
        {
            Detail::CurrentRegionSlot() = region;
        }

        ~RegionGuard()
        {
            Detail::CurrentRegionSlot() = m_previous;
        }

        RegionGuard(const RegionGuard&) = delete;
        RegionGuard& operator=(const RegionGuard&) = delete;
        RegionGuard(RegionGuard&&) = delete;
        RegionGuard& operator=(RegionGuard&&) = delete;

        FLUX_NODISCARD MemoryRegion GetPrevious() const noexcept { return m_previous; }

    private:
        MemoryRegion m_previous;
    };

    /**
     * Process-wide counters of live allocations and bytes per region.
     */
    class AllocationTracker
    {
    public:
        struct Stats
        {
            std::size_t liveAllocations = 0;
            std::size_t liveBytes = 0;
            std::size_t totalAllocations = 0;   // Monotonic
        };

        FLUX_NODISCARD static AllocationTracker& Get() noexcept
        {
            static AllocationTracker s_tracker;
            return s_tracker;
        }

        void RecordAllocation(MemoryRegion region, std::size_t bytes) noexcept
        {
            Counters& c = m_counters[Index(region)];
            c.live.fetch_add(1, std::memory_order_relaxed);
            c.bytes.fetch_add(bytes, std::memory_order_relaxed);
            c.total.fetch_add(1, std::memory_order_relaxed);
        }

        void RecordDeallocation(MemoryRegion region, std::size_t bytes) noexcept
        {
            Counters& c = m_counters[Index(region)];
            c.live.fetch_sub(1, std::memory_order_relaxed);
            c.bytes.fetch_sub(bytes, std::memory_order_relaxed);
        }

        FLUX_NODISCARD Stats GetStats(MemoryRegion region) const noexcept
        {
            const Counters& c = m_counters[Index(region)];
            Stats stats;
            stats.liveAllocations = c.live.load(std::memory_order_relaxed);
            stats.liveBytes = c.bytes.load(std::memory_order_relaxed);
            stats.totalAllocations = c.total.load(std::memory_order_relaxed);
            return stats;
        }

        FLUX_NODISCARD std::size_t GetCount(MemoryRegion region) const noexcept
        {
            return m_counters[Index(region)].live.load(std::memory_order_relaxed);
        }

        FLUX_NODISCARD std::size_t GetBytes(MemoryRegion region) const noexcept
        {
            return m_counters[Index(region)].bytes.load(std::memory_order_relaxed);
        }

    private:
        AllocationTracker() = default;

        struct Counters
        {
            std::atomic<std::size_t> live{0};
            std::atomic<std::size_t> bytes{0};
            std::atomic<std::size_t> total{0};
        };

        static constexpr std::size_t Index(MemoryRegion region) noexcept
        {
            return static_cast<std::size_t>(region) < MEMORY_REGION_COUNT
                ? static_cast<std::size_t>(region)
                : static_cast<std::size_t>(MemoryRegion::General);
        }

        std::array<Counters, MEMORY_REGION_COUNT> m_counters;
    };
}
