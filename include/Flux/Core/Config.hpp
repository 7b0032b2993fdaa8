#pragma once

#include <cstddef>

#include "Base.hpp"

#define FLUX_VERSION_MAJOR 0
#define FLUX_VERSION_MINOR 3
#define FLUX_VERSION_PATCH 0

#define FLUX_VERSION ((FLUX_VERSION_MAJOR << 16) | (FLUX_VERSION_MINOR << 8) | FLUX_VERSION_PATCH)

namespace Flux
{
    inline constexpr int VERSION_MAJOR = FLUX_VERSION_MAJOR;
    inline constexpr int VERSION_MINOR = FLUX_VERSION_MINOR;
    inline constexpr int VERSION_PATCH = FLUX_VERSION_PATCH;
    inline constexpr int VERSION = FLUX_VERSION;

    namespace config
    {
        // Rows allocated by the first growth of an empty column
        inline constexpr std::size_t COLUMN_INITIAL_CAPACITY = 64;

        inline constexpr std::size_t COLUMN_GROWTH_FACTOR = 2;

        inline constexpr std::size_t ARCHETYPE_INITIAL_CAPACITY = 16;

        // Largest alignment a zero-sized component may request
        inline constexpr std::size_t MAX_ZERO_SIZED_ALIGNMENT = 4096;
    }

    template<typename T>
    inline constexpr bool IsPowerOfTwo(T value) noexcept
    {
        return value && !(value & (value - 1));
    }
}
