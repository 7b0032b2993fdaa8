#pragma once

#include <cstddef>
#include <functional>
#include <string_view>
#include <type_traits>

#include "Base.hpp"

namespace Flux
{
    namespace Detail
    {
        // Cross-platform compile-time type name extraction
        template<typename T>
        constexpr std::string_view TypeNameInternal() noexcept
        {
            #if defined(FLUX_COMPILER_MSVC)
                // MSVC: __FUNCSIG__ gives "auto __cdecl TypeNameInternal<class MyClass>(void)"
                constexpr std::string_view funcName = __FUNCSIG__;
                constexpr std::string_view prefix = "TypeNameInternal<";
                constexpr std::string_view suffix = ">(void)";
            #elif defined(FLUX_COMPILER_CLANG)
                // Clang: "std::string_view TypeNameInternal() [T = MyClass]"
                constexpr std::string_view funcName = __PRETTY_FUNCTION__;
                constexpr std::string_view prefix = "TypeNameInternal() [T = ";
                constexpr std::string_view suffix = "]";
            #elif defined(FLUX_COMPILER_GCC)
                // GCC: "constexpr std::string_view TypeNameInternal() [with T = MyClass; ...]"
                constexpr std::string_view funcName = __PRETTY_FUNCTION__;
                constexpr std::string_view prefix = "TypeNameInternal() [with T = ";
                constexpr std::string_view suffix = "]";
            #endif

            std::size_t start = funcName.find(prefix);
            if (start == std::string_view::npos)
                return "Unknown";
            start += prefix.length();

            std::size_t end = funcName.rfind(suffix);
            if (end == std::string_view::npos || end <= start)
                return "Unknown";

            std::string_view typeName = funcName.substr(start, end - start);

            #if defined(FLUX_COMPILER_GCC)
                // GCC appends "; std::string_view = ..." after the template argument
                if (std::size_t semicolon = typeName.find(';'); semicolon != std::string_view::npos)
                    typeName = typeName.substr(0, semicolon);
            #elif defined(FLUX_COMPILER_MSVC)
                if (typeName.starts_with("class "))
                    typeName.remove_prefix(6);
                else if (typeName.starts_with("struct "))
                    typeName.remove_prefix(7);
                else if (typeName.starts_with("enum "))
                    typeName.remove_prefix(5);
            #endif

            return typeName;
        }

        template<typename T>
        struct TypeKeyTag
        {
            static constexpr char value = 0;
        };
    }

    /**
     * Opaque per-type identity. Two keys compare equal iff they name the same
     * decayed type. Used wherever the store must recognise a concrete type
     * behind type-erased storage (registry lookups, resource map, column checks).
     */
    class TypeKey
    {
    public:
        constexpr TypeKey() noexcept = default;

        template<typename T>
        FLUX_NODISCARD static constexpr TypeKey Of() noexcept
        {
            return TypeKey(&Detail::TypeKeyTag<std::remove_cvref_t<T>>::value);
        }

        FLUX_NODISCARD constexpr bool IsValid() const noexcept { return m_tag != nullptr; }
        FLUX_NODISCARD constexpr const void* GetValue() const noexcept { return m_tag; }

        constexpr bool operator==(const TypeKey&) const noexcept = default;

    private:
        constexpr explicit TypeKey(const void* tag) noexcept : m_tag(tag) {}

        const void* m_tag = nullptr;
    };

    template<typename T>
    struct TypeID
    {
        using Type = std::remove_cvref_t<T>;

        FLUX_NODISCARD static constexpr TypeKey Key() noexcept
        {
            return TypeKey::Of<Type>();
        }

        // Compile-time type name (for logs and diagnostics)
        FLUX_NODISCARD static constexpr std::string_view Name() noexcept
        {
            return Detail::TypeNameInternal<Type>();
        }
    };
}

namespace std
{
    template<>
    struct hash<Flux::TypeKey>
    {
        std::size_t operator()(const Flux::TypeKey& key) const noexcept
        {
            return std::hash<const void*>{}(key.GetValue());
        }
    };
}
