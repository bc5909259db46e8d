#ifndef REPLICA_DETAIL_FACTORY_HPP
#define REPLICA_DETAIL_FACTORY_HPP

#include <concepts>

#include <replica/detail/concepts.hpp>
#include <replica/detail/program.hpp>

namespace replica
{

template <StateMachine SM>
    requires std::default_initializable<SM>
struct StateMachineContainerProgramFactory
{
    using State_t = StateMachineContainerProgram<SM>;

    State_t create()
    {
        return State_t{};
    }
};

template <StateProgram P>
    requires std::default_initializable<P>
struct DefaultStateProgramFactory
{
    using State_t = P;

    State_t create()
    {
        return P{};
    }
};

namespace detail
{
template <class X>
struct factory_for;

template <class X>
    requires StateProgram<X>
struct factory_for<X>
{
    using type = DefaultStateProgramFactory<X>;
};

template <class X>
    requires(StateMachine<X> && !StateProgram<X>)
struct factory_for<X>
{
    using type = StateMachineContainerProgramFactory<X>;
};
} // namespace detail

// Session code can stay generic over whether the application schedules.
template <class X>
using factory_for_t = typename detail::factory_for<X>::type;

} // namespace replica

#endif
