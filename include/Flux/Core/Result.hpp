#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "Base.hpp"
#include "Error.hpp"

namespace Flux
{
    template<typename E>
    struct ErrorValue
    {
        E value;

        constexpr explicit ErrorValue(const E& e) : value(e) {}
        constexpr explicit ErrorValue(E&& e) : value(std::move(e)) {}
    };

    template<typename E>
    constexpr ErrorValue<std::decay_t<E>> Err(E&& e)
    {
        return ErrorValue<std::decay_t<E>>(std::forward<E>(e));
    }

    inline ErrorValue<Error> Err(ErrorCode code, std::string message = {})
    {
        return ErrorValue<Error>(Error(code, std::move(message)));
    }

    struct OkTag {};
    inline constexpr OkTag OK{};

    template<typename T, typename E = Error>
    class Result
    {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference type");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = T;
        using ErrorType = E;

        Result(const T& value) : m_storage(std::in_place_index<0>, value) {}
        Result(T&& value) : m_storage(std::in_place_index<0>, std::move(value)) {}
        Result(const ErrorValue<E>& err) : m_storage(std::in_place_index<1>, err.value) {}
        Result(ErrorValue<E>&& err) : m_storage(std::in_place_index<1>, std::move(err.value)) {}

        [[nodiscard]] bool IsOk() const noexcept { return m_storage.index() == 0; }
        [[nodiscard]] bool IsErr() const noexcept { return m_storage.index() == 1; }
        [[nodiscard]] explicit operator bool() const noexcept { return IsOk(); }

        T& Value() &
        {
            FLUX_ASSERT(IsOk(), "Called Value() on Result containing error");
            return std::get<0>(m_storage);
        }

        const T& Value() const&
        {
            FLUX_ASSERT(IsOk(), "Called Value() on Result containing error");
            return std::get<0>(m_storage);
        }

        T&& Value() &&
        {
            FLUX_ASSERT(IsOk(), "Called Value() on Result containing error");
            return std::get<0>(std::move(m_storage));
        }

        E& Error() &
        {
            FLUX_ASSERT(IsErr(), "Called Error() on Result containing value");
            return std::get<1>(m_storage);
        }

        const E& Error() const&
        {
            FLUX_ASSERT(IsErr(), "Called Error() on Result containing value");
            return std::get<1>(m_storage);
        }

        T* operator->() { return &Value(); }
        const T* operator->() const { return &Value(); }
        T& operator*() & { return Value(); }
        const T& operator*() const& { return Value(); }

        template<typename U>
        [[nodiscard]] T ValueOr(U&& defaultValue) const&
        {
            return IsOk() ? Value() : static_cast<T>(std::forward<U>(defaultValue));
        }

    private:
        std::variant<T, E> m_storage;
    };

    template<typename E>
    class Result<void, E>
    {
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = void;
        using ErrorType = E;

        Result() noexcept = default;
        Result(OkTag) noexcept {}
        Result(const ErrorValue<E>& err) : m_error(err.value) {}
        Result(ErrorValue<E>&& err) : m_error(std::move(err.value)) {}

        [[nodiscard]] bool IsOk() const noexcept { return !m_error.has_value(); }
        [[nodiscard]] bool IsErr() const noexcept { return m_error.has_value(); }
        [[nodiscard]] explicit operator bool() const noexcept { return IsOk(); }

        E& Error() &
        {
            FLUX_ASSERT(IsErr(), "Called Error() on Result containing value");
            return *m_error;
        }

        const E& Error() const&
        {
            FLUX_ASSERT(IsErr(), "Called Error() on Result containing value");
            return *m_error;
        }

        E&& Error() &&
        {
            FLUX_ASSERT(IsErr(), "Called Error() on Result containing value");
            return std::move(*m_error);
        }

    private:
        std::optional<E> m_error;
    };

    inline Result<void, Error> Ok()
    {
        return Result<void, Error>();
    }

    template<typename T>
    inline auto Ok(T&& value) -> Result<std::decay_t<T>, Error>
    {
        return Result<std::decay_t<T>, Error>(std::forward<T>(value));
    }
}
