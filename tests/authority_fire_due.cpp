#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <optional>

#include <replica/host.hpp>

using namespace std::chrono_literals;

struct Tick
{
    friend bool operator==(const Tick&, const Tick&) = default;
};

// Schedules a tick every `period` until `limit` ticks have happened. With a
// zero period every tick is due immediately.
template <std::int64_t PeriodMs>
struct Metronome
{
    using Transition_t = replica::TransitionEvent<Tick>;

    int ticks = 0;
    int limit = 1000;
    replica::Timestamp last{};

    void apply(const Transition_t& event)
    {
        last = event.timestamp;
        ++ticks;
    }

    std::optional<Transition_t> suspended_event() const
    {
        if(ticks >= limit) return std::nullopt;
        return replica::machine_event(last + std::chrono::milliseconds(PeriodMs), Tick{});
    }
};

int main()
{
    const replica::Timestamp t0{};

    {
        using Factory = replica::DefaultStateProgramFactory<Metronome<100>>;
        auto authority = replica::Authority<Factory>::Builder{}.build();
        assert(authority.fire_limit() == replica::Authority<Factory>::default_fire_limit);

        assert(authority.fire_due(t0) == 0);
        assert(authority.fire_due(t0 + 99ms) == 0);
        assert(authority.fire_due(t0 + 100ms) == 1);
        assert(authority.program().ticks == 1);

        // Catching up fires every overdue tick in order, and none from the future.
        assert(authority.fire_due(t0 + 1050ms) == 9);
        assert(authority.program().ticks == 10);
        assert(authority.program().last == t0 + 1000ms);
        assert(authority.pending()->timestamp == t0 + 1100ms);

        const auto stream = authority.drain();
        assert(stream.size() == 10);
        for(std::size_t i = 1; i < stream.size(); ++i)
        {
            assert(stream[i - 1].timestamp < stream[i].timestamp);
            assert(stream[i].machine_originated());
        }
    }

    {
        using Factory = replica::DefaultStateProgramFactory<Metronome<0>>;
        replica::Authority<Factory>::Builder builder;
        builder.set_fire_limit(8);
        auto authority = std::move(builder).build();

        // An always-due program is cut off at the limit on every call.
        assert(authority.fire_due(t0) == 8);
        assert(authority.fire_due(t0) == 8);
        assert(authority.program().ticks == 16);
        assert(authority.pending());
    }

    {
        using Factory = replica::DefaultStateProgramFactory<Metronome<0>>;
        replica::Authority<Factory>::Builder builder;
        builder.set_fire_limit(0);
        auto authority = std::move(builder).build();
        assert(authority.fire_limit() == 1);
        assert(authority.fire_due(t0 + 1h) == 1);
    }

    {
        Metronome<10> restored;
        restored.ticks = 995;
        restored.last = t0 + 5s;

        using Factory = replica::DefaultStateProgramFactory<Metronome<10>>;
        replica::Authority<Factory>::Builder builder;
        builder.restore(restored, 995);
        auto authority = std::move(builder).build();

        // The slot is derived from restored state, not carried over.
        assert(authority.pending());
        assert(authority.pending()->timestamp == t0 + 5010ms);
        assert(authority.sequence() == 995);
        assert(authority.fire_due(t0 + 1h) == 5);
        assert(authority.program().ticks == 1000);
        assert(!authority.pending());
        assert(authority.sequence() == 1000);
    }

    return 0;
}
