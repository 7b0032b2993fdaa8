#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <type_traits>
#include <utility>

#include "../Core/Base.hpp"
#include "Command.hpp"

namespace Flux
{
    /**
     * FIFO of boxed commands. Draining hands the whole batch to the caller
     * so commands may push new commands while the batch executes.
     */
    class CommandQueue
    {
    public:
        CommandQueue() = default;

        CommandQueue(const CommandQueue&) = delete;
        CommandQueue& operator=(const CommandQueue&) = delete;
        CommandQueue(CommandQueue&&) = default;
        CommandQueue& operator=(CommandQueue&&) = default;

        void Push(CommandPtr command)
        {
            if (command)
                m_commands.push_back(std::move(command));
        }

        template<typename T, typename... Args>
        requires std::is_base_of_v<Command, T>
        void Emplace(Args&&... args)
        {
            m_commands.push_back(std::make_unique<T>(std::forward<Args>(args)...));
        }

        // Take every queued command, leaving the queue empty
        FLUX_NODISCARD std::deque<CommandPtr> Drain()
        {
            return std::exchange(m_commands, std::deque<CommandPtr>{});
        }

        // Put commands back ahead of everything queued, keeping their order
        void PushFront(std::deque<CommandPtr> commands)
        {
            for (auto it = commands.rbegin(); it != commands.rend(); ++it)
            {
                if (*it)
                    m_commands.push_front(std::move(*it));
            }
        }

        FLUX_NODISCARD std::size_t Size() const noexcept { return m_commands.size(); }
        FLUX_NODISCARD bool Empty() const noexcept { return m_commands.empty(); }

        void Clear() noexcept { m_commands.clear(); }

    private:
        std::deque<CommandPtr> m_commands;
    };
}
