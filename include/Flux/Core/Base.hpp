#pragma once

#include "Platform.hpp"

#define FLUX_NODISCARD [[nodiscard]]
#define FLUX_LIKELY [[likely]]
#define FLUX_UNLIKELY [[unlikely]]

#if defined(FLUX_COMPILER_MSVC)
    #define FLUX_FORCEINLINE __forceinline
#else
    #define FLUX_FORCEINLINE inline __attribute__((always_inline))
#endif

#define FLUX_UNUSED(x) ((void)(x))

// Row bounds and pointer checks on hot paths; compiled out unless
// FLUX_BUILD_DEBUG is defined
#ifdef FLUX_BUILD_DEBUG
    #include <cassert>
    #define FLUX_ASSERT(condition, message) assert((condition) && (message))
#else
    #define FLUX_ASSERT(condition, message) ((void)0)
#endif
