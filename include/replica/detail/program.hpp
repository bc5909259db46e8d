#ifndef REPLICA_DETAIL_PROGRAM_HPP
#define REPLICA_DETAIL_PROGRAM_HPP

#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

#include <replica/detail/concepts.hpp>
#include <replica/detail/types.hpp>

namespace replica
{

// The single pending future event of a program, or nullopt. Every answer
// supersedes the previous one; programs that never declare the member are
// never self-scheduling.
template <StateProgram P>
std::optional<program_event_t<P>> suspended_event(const P& program)
{
    if constexpr(has_suspended_event_member<P>)
    {
        return program.suspended_event();
    }
    else
    {
        return std::nullopt;
    }
}

// Lifts a plain StateMachine into a StateProgram. Event metadata is dropped
// before the transition reaches the inner machine.
template <StateMachine SM>
class StateMachineContainerProgram
{
public:
    using Inner_t = SM;
    using Transition_t = TransitionEvent<typename SM::Transition_t>;

    StateMachineContainerProgram()
        requires std::default_initializable<SM>
    = default;

    explicit StateMachineContainerProgram(SM inner) : inner_(std::move(inner)) {}

    void apply(const Transition_t& event)
    {
        inner_.apply(event.transition);
    }

    const SM& inner() const noexcept
    {
        return inner_;
    }

    friend bool operator==(const StateMachineContainerProgram&, const StateMachineContainerProgram&) = default;

private:
    SM inner_{};
};

} // namespace replica

#endif
