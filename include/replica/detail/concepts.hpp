#ifndef REPLICA_DETAIL_CONCEPTS_HPP
#define REPLICA_DETAIL_CONCEPTS_HPP

#include <concepts>
#include <optional>
#include <type_traits>

#include <replica/detail/policy.hpp>
#include <replica/detail/types.hpp>

namespace replica
{

template <class T>
concept TransitionType = std::movable<T> && std::copy_constructible<T>;

template <class SM>
concept StateMachine =
    requires { typename SM::Transition_t; } &&
    TransitionType<typename SM::Transition_t> &&
    requires(SM& sm, const typename SM::Transition_t& t) {
        { sm.apply(t) } -> std::same_as<void>;
    };

// Detected by calling it, so overloaded, ref-qualified and template members
// are all seen; a lone member with the wrong parameters is still detected
// through its address.
template <class P>
concept has_suspended_event_member =
    requires(const P& p) { p.suspended_event(); } ||
    requires(P& p) { p.suspended_event(); } ||
    requires(P&& p) { static_cast<P&&>(p).suspended_event(); } ||
    requires { &P::suspended_event; };

template <class P>
concept SuspendsWith =
    requires(const P& p) {
        { p.suspended_event() } -> std::same_as<std::optional<typename P::Transition_t>>;
    };

// A program may leave suspended_event undeclared; if it declares one, the
// signature has to match exactly.
template <class P>
concept StateProgram =
    StateMachine<P> &&
    detail::is_transition_event_v<typename P::Transition_t> &&
    (!has_suspended_event_member<P> || SuspendsWith<P>);

template <StateProgram P>
using program_transition_t = typename detail::is_transition_event<typename P::Transition_t>::transition_type;

template <StateProgram P>
using program_event_t = typename P::Transition_t;

template <class F>
concept StateProgramFactory =
    std::copy_constructible<F> &&
    requires { typename F::State_t; } &&
    StateProgram<typename F::State_t> &&
    requires(F& f) {
        { f.create() } -> std::same_as<typename F::State_t>;
    };

template <class F, class P>
concept AdmissionGuardFor =
    requires(F f, const P& program, const program_event_t<P>& event) {
        { f(program, event) } -> std::convertible_to<bool>;
    };

template <class T>
concept PolicyHasCallableTemplate = requires {
    typename T::template Callable<void()>;
};

} // namespace replica

#endif
