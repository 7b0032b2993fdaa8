#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "Base.hpp"
#include "Error.hpp"

namespace Flux
{
    enum class LogLevel : std::uint8_t
    {
        Trace,
        Info,
        Warning,
        Error,
        Off
    };

    [[nodiscard]] constexpr std::string_view GetLogLevelName(LogLevel level) noexcept
    {
        switch (level)
        {
            case LogLevel::Trace: return "trace";
            case LogLevel::Info: return "info";
            case LogLevel::Warning: return "warning";
            case LogLevel::Error: return "error";
            default: return "off";
        }
    }

    using LogFn = std::function<void(LogLevel, const std::string&)>;

    /**
     * Default sink: writes "[flux] [level] message" to stderr.
     */
    inline void StderrLogSink(LogLevel level, const std::string& message)
    {
        fmt::print(stderr, "[flux] [{}] {}\n", GetLogLevelName(level), message);
    }

    /**
     * Formatting front-end over a pluggable sink. Messages below the minimum
     * level are dropped before formatting.
     */
    class Log
    {
    public:
        Log() : m_sink(&StderrLogSink) {}

        explicit Log(LogFn sink, LogLevel minLevel = LogLevel::Info) :
            m_sink(sink ? std::move(sink) : LogFn(&StderrLogSink)),
            m_minLevel(minLevel)
        {}

        template<typename... Ts>
        void Trace(fmt::format_string<Ts...> str, Ts&&... args) const
        {
            Write(LogLevel::Trace, str, std::forward<Ts>(args)...);
        }

        template<typename... Ts>
        void Info(fmt::format_string<Ts...> str, Ts&&... args) const
        {
            Write(LogLevel::Info, str, std::forward<Ts>(args)...);
        }

        template<typename... Ts>
        void Warn(fmt::format_string<Ts...> str, Ts&&... args) const
        {
            Write(LogLevel::Warning, str, std::forward<Ts>(args)...);
        }

        template<typename... Ts>
        void Error(fmt::format_string<Ts...> str, Ts&&... args) const
        {
            Write(LogLevel::Error, str, std::forward<Ts>(args)...);
        }

        /**
         * Log at error level and throw. Used for broken invariants only.
         */
        template<typename E = ContractViolation, typename... Ts>
        [[noreturn]] void Fatal(fmt::format_string<Ts...> str, Ts&&... args) const
        {
            std::string message = fmt::format(str, std::forward<Ts>(args)...);
            if (m_minLevel <= LogLevel::Error)
            {
                m_sink(LogLevel::Error, message);
            }
            throw E(message);
        }

        void SetMinLevel(LogLevel level) noexcept { m_minLevel = level; }
        FLUX_NODISCARD LogLevel GetMinLevel() const noexcept { return m_minLevel; }

        void SetSink(LogFn sink) { m_sink = sink ? std::move(sink) : LogFn(&StderrLogSink); }

    private:
        template<typename... Ts>
        void Write(LogLevel level, fmt::format_string<Ts...> str, Ts&&... args) const
        {
            if (level < m_minLevel)
                return;

            m_sink(level, fmt::format(str, std::forward<Ts>(args)...));
        }

        LogFn m_sink;
        LogLevel m_minLevel = LogLevel::Info;
    };

    /**
     * Logger used by free-standing storage code that has no world to ask.
     * Defaults to the stderr sink at warning level.
     */
    inline Log& GetDefaultLog()
    {
        static Log s_log(&StderrLogSink, LogLevel::Warning);
        return s_log;
    }
}
