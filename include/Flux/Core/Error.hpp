#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace Flux
{
    enum class ErrorCode : std::uint32_t
    {
        None = 0,

        InvalidArgument,
        OutOfBounds,
        NotFound,
        InvalidState,

        EntityNotFound,
        ComponentNotFound,
        ResourceNotFound,

        AccessConflict,
        SystemFailed,

        Unknown = 0xFFFFFFFF
    };

    [[nodiscard]] constexpr const char* GetDefaultMessage(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::None: return "No error";
            case ErrorCode::InvalidArgument: return "Invalid argument";
            case ErrorCode::OutOfBounds: return "Index out of bounds";
            case ErrorCode::NotFound: return "Item not found";
            case ErrorCode::InvalidState: return "Invalid state";
            case ErrorCode::EntityNotFound: return "Entity not found";
            case ErrorCode::ComponentNotFound: return "Component not found";
            case ErrorCode::ResourceNotFound: return "Resource not found";
            case ErrorCode::AccessConflict: return "Conflicting data access";
            case ErrorCode::SystemFailed: return "System failed";
            case ErrorCode::Unknown: return "Unknown error";
            default: return "Unspecified error";
        }
    }

    struct Error
    {
        ErrorCode code;
        std::string message;

        Error(ErrorCode c = ErrorCode::None) :
            code(c),
            message(GetDefaultMessage(c))
        {}

        Error(ErrorCode c, std::string msg) :
            code(c),
            message(msg.empty() ? std::string(GetDefaultMessage(c)) : std::move(msg))
        {}

        [[nodiscard]] bool operator==(const Error& other) const noexcept
        {
            return code == other.code;
        }

        [[nodiscard]] bool operator!=(const Error& other) const noexcept
        {
            return code != other.code;
        }
    };

    /**
     * Thrown when a caller breaks an invariant of the store: conflicting
     * access, a missing non-optional resource, a bundle that does not match
     * its archetype, or an attempt to split-borrow one archetype twice.
     * These are not recoverable and are never returned as values.
     */
    class ContractViolation : public std::logic_error
    {
    public:
        explicit ContractViolation(const std::string& what, ErrorCode code = ErrorCode::InvalidState) :
            std::logic_error(what),
            m_code(code)
        {}

        [[nodiscard]] ErrorCode GetCode() const noexcept { return m_code; }

    private:
        ErrorCode m_code;
    };

    class AccessConflictError : public ContractViolation
    {
    public:
        explicit AccessConflictError(const std::string& what) :
            ContractViolation(what, ErrorCode::AccessConflict)
        {}
    };

    class MissingResourceError : public ContractViolation
    {
    public:
        explicit MissingResourceError(const std::string& what) :
            ContractViolation(what, ErrorCode::ResourceNotFound)
        {}
    };
}

namespace std
{
    template<>
    struct hash<Flux::Error>
    {
        std::size_t operator()(const Flux::Error& e) const noexcept
        {
            return std::hash<std::uint32_t>{}(static_cast<std::uint32_t>(e.code));
        }
    };
}
