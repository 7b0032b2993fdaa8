#pragma once

#include <functional>
#include <memory>
#include <string_view>
#include <utility>

#include "../Core/Base.hpp"

namespace Flux
{
    class World;

    /**
     * Deferred mutation of the world. Commands are queued while systems run
     * and executed in FIFO order when the queue is flushed.
     */
    class Command
    {
    public:
        virtual ~Command() = default;

        virtual void Execute(World& world) = 0;

        FLUX_NODISCARD virtual std::string_view GetName() const noexcept { return "Command"; }
    };

    using CommandPtr = std::unique_ptr<Command>;

    /**
     * Runs an arbitrary callable against the world.
     */
    class FunctionCommand final : public Command
    {
    public:
        explicit FunctionCommand(std::function<void(World&)> func) : m_func(std::move(func)) {}

        void Execute(World& world) override
        {
            if (m_func)
                m_func(world);
        }

        FLUX_NODISCARD std::string_view GetName() const noexcept override { return "FunctionCommand"; }

    private:
        std::function<void(World&)> m_func;
    };
}
