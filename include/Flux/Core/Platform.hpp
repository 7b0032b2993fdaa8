#pragma once

// Compiler detection; TypeID name parsing and Base.hpp depend on it
#if defined(_MSC_VER) && !defined(__clang__)
    #define FLUX_COMPILER_MSVC 1
#elif defined(__clang__)
    #define FLUX_COMPILER_CLANG 1
#elif defined(__GNUC__)
    #define FLUX_COMPILER_GCC 1
#else
    #error "Unsupported compiler"
#endif

#if __cplusplus < 202002L && !defined(FLUX_COMPILER_MSVC)
    #error "Flux requires C++20"
#endif
