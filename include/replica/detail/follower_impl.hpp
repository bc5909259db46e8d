#ifndef REPLICA_DETAIL_FOLLOWER_IMPL_HPP
#define REPLICA_DETAIL_FOLLOWER_IMPL_HPP

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <utility>

#include <replica/detail/concepts.hpp>
#include <replica/detail/types.hpp>

namespace replica
{

// Replays the authority's ordered stream. A follower never asks its program
// for a suspended event; fired events arrive like any other.
template <StateProgramFactory Factory>
class FollowerImpl
{
public:
    using Factory_t = Factory;
    using Program_t = typename Factory::State_t;
    using Event_t = program_event_t<Program_t>;

    FollowerImpl()
        requires std::default_initializable<Factory_t>
        : FollowerImpl(Factory_t{}) {}

    explicit FollowerImpl(Factory_t factory) : program_(factory.create()) {}

    FollowerImpl(Program_t program, std::uint64_t sequence)
        : program_(std::move(program)), sequence_(sequence) {}

    void apply(const Event_t& event)
    {
        program_.apply(event);
        ++sequence_;
    }

    template <std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, const Event_t&>
    std::size_t apply_all(R&& events)
    {
        std::size_t applied = 0;
        for(auto&& event : events)
        {
            apply(event);
            ++applied;
        }
        return applied;
    }

    const Program_t& program() const noexcept
    {
        return program_;
    }

    std::uint64_t sequence() const noexcept
    {
        return sequence_;
    }

private:
    Program_t program_;
    std::uint64_t sequence_ = 0;
};

} // namespace replica

#endif
