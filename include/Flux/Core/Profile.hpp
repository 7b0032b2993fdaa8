#pragma once

#include <cstdint>

#include "Base.hpp"

// Tracy zones in release builds compiled with TRACY_ENABLE; no-ops otherwise
#if defined(FLUX_BUILD_RELEASE) && defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    #define FLUX_PROFILE_ZONE_NAMED_COLOR(name, color) ZoneScopedNC(name, color)

    // Attach dynamic text to the current zone, e.g. the running system's name
    #define FLUX_PROFILE_ZONE_TEXT(text, size) ZoneText(text, size)

    #define FLUX_PROFILE_ALLOC(ptr, size) TracyAlloc(ptr, size)
    #define FLUX_PROFILE_FREE(ptr) TracyFree(ptr)
#else
    #define FLUX_PROFILE_ZONE_NAMED_COLOR(name, color)
    #define FLUX_PROFILE_ZONE_TEXT(text, size)
    #define FLUX_PROFILE_ALLOC(ptr, size)
    #define FLUX_PROFILE_FREE(ptr)
#endif

namespace Flux::Profile
{
    constexpr std::uint32_t ColorSystem = 0xDD0000;
    constexpr std::uint32_t ColorEntity = 0x88FF00;
    constexpr std::uint32_t ColorComponent = 0x0088FF;
    constexpr std::uint32_t ColorQuery = 0x8800FF;
    constexpr std::uint32_t ColorCommand = 0x00DDDD;
}
