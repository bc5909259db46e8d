#ifndef REPLICA_DETAIL_HELPERS_HPP
#define REPLICA_DETAIL_HELPERS_HPP

#include <cstddef>
#include <optional>
#include <ranges>
#include <utility>

#include <replica/detail/concepts.hpp>
#include <replica/detail/types.hpp>

namespace replica
{

template <class T>
TransitionEvent<T> player_event(PlayerId player, Timestamp timestamp, T transition)
{
    return TransitionEvent<T>{timestamp, player, std::move(transition)};
}

template <class T>
TransitionEvent<T> machine_event(Timestamp timestamp, T transition)
{
    return TransitionEvent<T>{timestamp, std::nullopt, std::move(transition)};
}

template <StateMachine SM, std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, const typename SM::Transition_t&>
std::size_t replay(SM& machine, R&& transitions)
{
    std::size_t applied = 0;
    for(auto&& t : transitions)
    {
        machine.apply(t);
        ++applied;
    }
    return applied;
}

} // namespace replica

#endif
