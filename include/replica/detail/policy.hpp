#ifndef REPLICA_DETAIL_POLICY_HPP
#define REPLICA_DETAIL_POLICY_HPP

#include <functional>
#include <optional>

namespace replica
{
namespace detail
{

struct policy_copy
{
    template <typename Sig>
    using Callable = std::function<Sig>;
};

struct policy_move
{
    template <typename Sig>
    using Callable = std::move_only_function<Sig>;
};

// Storage for everything a host calls back into, bound to one callable policy.
template <class CallablePolicy, class Program, class Event>
struct HostCallables
{
    using Program_t = Program;
    using Event_t = Event;

    using AdmissionSig = bool(const Program_t&, const Event_t&);
    using EventSig = void(const Program_t&, const Event_t&);
    using RescheduledSig = void(const std::optional<Event_t>&);

    template <typename Sig>
    using Callable = typename CallablePolicy::template Callable<Sig>;

    Callable<AdmissionSig> admission;
    Callable<EventSig> on_applied;
    Callable<EventSig> on_rejected;
    Callable<RescheduledSig> on_rescheduled;
};

} // namespace detail

namespace policy
{

using copy = detail::policy_copy;
using move = detail::policy_move;

} // namespace policy
} // namespace replica

#endif
