#ifndef REPLICA_DETAIL_TYPES_HPP
#define REPLICA_DETAIL_TYPES_HPP

#include <chrono>
#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>

namespace replica
{

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

struct PlayerId
{
    std::size_t value = 0;

    friend constexpr auto operator<=>(const PlayerId&, const PlayerId&) = default;
};

// A transition tagged with replication metadata. An empty originator marks an
// event synthesized by the state program itself (a fired suspended event).
template <typename T>
struct TransitionEvent
{
    using Transition_t = T;

    Timestamp timestamp{};
    std::optional<PlayerId> originator{};
    T transition{};

    bool machine_originated() const noexcept
    {
        return !originator.has_value();
    }

    friend bool operator==(const TransitionEvent&, const TransitionEvent&) = default;
};

namespace detail
{

template <class>
struct is_transition_event : std::false_type
{
};
template <class T>
struct is_transition_event<TransitionEvent<T>> : std::true_type
{
    using transition_type = T;
};
template <class E>
constexpr bool is_transition_event_v = is_transition_event<std::remove_cvref_t<E>>::value;

} // namespace detail
} // namespace replica

namespace std
{
template <>
struct hash<replica::PlayerId>
{
    std::size_t operator()(const replica::PlayerId& id) const noexcept
    {
        return std::hash<std::size_t>{}(id.value);
    }
};
} // namespace std

#endif
