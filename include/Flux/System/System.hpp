#pragma once

#include <string_view>

#include "../Core/Base.hpp"
#include "../Core/Error.hpp"
#include "../Core/Result.hpp"
#include "SystemAccess.hpp"

namespace Flux
{
    class World;

    // Return type of fallible system bodies
    using SystemResult = Result<void, Error>;

    /**
     * Parameter protocol, specialized per parameter type in SystemParam.hpp:
     *
     *   State          built once per system by InitState(World&)
     *   Item           handed to the system body, built by GetParam every run
     *   AddAccess      declares component/resource access for validation
     *   ApplyBuffers   flushes deferred work after a successful run
     *   DiscardBuffers drops deferred work after a failed run
     */
    template<typename P>
    struct SystemParam;

    template<typename P>
    concept SystemParameter = requires
    {
        typename SystemParam<P>::State;
        typename SystemParam<P>::Item;
    };

    /**
     * Type-erased system as stored by a schedule.
     *
     * Lifecycle: Initialize once (builds parameter state and validates
     * access), then per run: Run, followed by either ApplyBuffers on success
     * or DiscardBuffers on failure.
     */
    class ISystem
    {
    public:
        virtual ~ISystem() = default;

        virtual void Initialize(World& world) = 0;

        virtual SystemResult Run(World& world) = 0;

        // Move commands recorded during the last run to the world queue
        virtual void ApplyBuffers(World& world) = 0;

        virtual void DiscardBuffers() = 0;

        FLUX_NODISCARD virtual std::string_view GetName() const noexcept = 0;
        FLUX_NODISCARD virtual bool IsInitialized() const noexcept = 0;
        FLUX_NODISCARD virtual const SystemAccess& GetAccess() const noexcept = 0;
    };
}
