#pragma once

#include <cstddef>
#include <cstdint>

#include "../Core/Config.hpp"
#include "../Core/Log.hpp"

namespace Flux
{
    enum class FlushPolicy : std::uint8_t
    {
        // Drain the world command queue after every system
        AfterEachSystem,
        // Drain once after the whole schedule
        AfterSchedule
    };

    struct WorldConfig
    {
        FlushPolicy flushPolicy = FlushPolicy::AfterEachSystem;
        LogLevel minLogLevel = LogLevel::Warning;
        // Empty means stderr
        LogFn logSink;
        std::size_t initialColumnCapacity = config::COLUMN_INITIAL_CAPACITY;
    };
}
