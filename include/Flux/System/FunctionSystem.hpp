#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include "../Core/Base.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"
#include "System.hpp"
#include "SystemAccess.hpp"
#include "SystemParam.hpp"

namespace Flux
{
    namespace Detail
    {
        // Parameter list and return type of a callable
        template<typename F>
        struct FunctionTraits : FunctionTraits<decltype(&std::remove_cvref_t<F>::operator())> {};

        template<typename R, typename... Args>
        struct FunctionTraits<R(Args...)>
        {
            using Return = R;
            using Params = std::tuple<std::remove_cvref_t<Args>...>;
        };

        template<typename R, typename... Args>
        struct FunctionTraits<R(*)(Args...)> : FunctionTraits<R(Args...)> {};

        template<typename R, typename... Args>
        struct FunctionTraits<R(*)(Args...) noexcept> : FunctionTraits<R(Args...)> {};

        template<typename R, typename C, typename... Args>
        struct FunctionTraits<R(C::*)(Args...)> : FunctionTraits<R(Args...)> {};

        template<typename R, typename C, typename... Args>
        struct FunctionTraits<R(C::*)(Args...) const> : FunctionTraits<R(Args...)> {};

        template<typename R, typename C, typename... Args>
        struct FunctionTraits<R(C::*)(Args...) noexcept> : FunctionTraits<R(Args...)> {};

        template<typename R, typename C, typename... Args>
        struct FunctionTraits<R(C::*)(Args...) const noexcept> : FunctionTraits<R(Args...)> {};
    }

    /**
     * System built from a plain callable. Each callable parameter is a system
     * parameter (Query, Res, ResMut, OptionalRes, OptionalResMut, Commands);
     * parameter state is built lazily on first Initialize or Run.
     */
    template<typename Func, typename... Params>
    class FunctionSystem final : public ISystem
    {
        static_assert((SystemParameter<Params> && ...), "Every system argument must be a system parameter");

        using Return = std::invoke_result_t<Func&, typename SystemParam<Params>::Item&...>;
        static_assert(std::is_void_v<Return> || std::is_same_v<Return, SystemResult>,
                      "A system must return void or SystemResult");

        using StateTuple = std::tuple<typename SystemParam<Params>::State...>;

    public:
        FunctionSystem(Func func, std::string name) :
            m_func(std::move(func)),
            m_name(name.empty() ? std::string(TypeID<Func>::Name()) : std::move(name))
        {}

        void Initialize(World& world) override
        {
            if (m_state)
                return;

            // Braced init builds parameter states in declaration order
            StateTuple state{SystemParam<Params>::InitState(world)...};

            SystemAccess access;
            AddAccess(state, access, std::index_sequence_for<Params...>{});
            access.Validate(m_name, world.GetLog());

            m_access = std::move(access);
            m_state.emplace(std::move(state));
        }

        SystemResult Run(World& world) override
        {
            FLUX_PROFILE_ZONE_NAMED_COLOR("FunctionSystem::Run", Profile::ColorSystem);
            FLUX_PROFILE_ZONE_TEXT(m_name.data(), m_name.size());

            if (!m_state)
                Initialize(world);

            // A body that throws leaves nothing behind for the next flush
            try
            {
                return Invoke(world, std::index_sequence_for<Params...>{});
            }
            catch (...)
            {
                DiscardBuffersImpl(std::index_sequence_for<Params...>{});
                throw;
            }
        }

        void ApplyBuffers(World& world) override
        {
            if (m_state)
                ApplyBuffersImpl(world, std::index_sequence_for<Params...>{});
        }

        void DiscardBuffers() override
        {
            if (m_state)
                DiscardBuffersImpl(std::index_sequence_for<Params...>{});
        }

        FLUX_NODISCARD std::string_view GetName() const noexcept override { return m_name; }
        FLUX_NODISCARD bool IsInitialized() const noexcept override { return m_state.has_value(); }
        FLUX_NODISCARD const SystemAccess& GetAccess() const noexcept override { return m_access; }

    private:
        template<std::size_t... Is>
        static void AddAccess(const StateTuple& state, SystemAccess& access, std::index_sequence<Is...>)
        {
            (SystemParam<Params>::AddAccess(std::get<Is>(state), access), ...);
        }

        template<std::size_t... Is>
        SystemResult Invoke(World& world, std::index_sequence<Is...>)
        {
            // Items are held as lvalues so the body may take them by value or reference
            std::tuple<typename SystemParam<Params>::Item...> items{
                SystemParam<Params>::GetParam(std::get<Is>(*m_state), world, m_name)...};

            if constexpr (std::is_void_v<Return>)
            {
                m_func(std::get<Is>(items)...);
                return OK;
            }
            else
            {
                return m_func(std::get<Is>(items)...);
            }
        }

        template<std::size_t... Is>
        void ApplyBuffersImpl(World& world, std::index_sequence<Is...>)
        {
            (SystemParam<Params>::ApplyBuffers(std::get<Is>(*m_state), world), ...);
        }

        template<std::size_t... Is>
        void DiscardBuffersImpl(std::index_sequence<Is...>)
        {
            (SystemParam<Params>::DiscardBuffers(std::get<Is>(*m_state)), ...);
        }

        Func m_func;
        std::string m_name;
        std::optional<StateTuple> m_state;
        SystemAccess m_access;
    };

    namespace Detail
    {
        template<typename Func, typename ParamTuple>
        struct FunctionSystemFor;

        template<typename Func, typename... Params>
        struct FunctionSystemFor<Func, std::tuple<Params...>>
        {
            using Type = FunctionSystem<Func, Params...>;
        };

        template<typename Func>
        std::unique_ptr<ISystem> MakeFunctionSystem(Func&& func, std::string name)
        {
            using Callable = std::decay_t<Func>;
            using Params = typename FunctionTraits<Callable>::Params;
            using SystemType = typename FunctionSystemFor<Callable, Params>::Type;

            return std::make_unique<SystemType>(Callable(std::forward<Func>(func)), std::move(name));
        }
    }

    /**
     * Wrap a callable as a boxed system without registering it.
     */
    template<typename Func>
    FLUX_NODISCARD std::unique_ptr<ISystem> MakeSystem(Func&& func, std::string name = {})
    {
        return Detail::MakeFunctionSystem(std::forward<Func>(func), std::move(name));
    }
}
