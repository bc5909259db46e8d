#include <cassert>
#include <chrono>
#include <cstdlib>
#include <optional>

#include <replica/host.hpp>

struct Ping
{
    friend bool operator==(const Ping&, const Ping&) = default;
};

struct Echo
{
    using Transition_t = replica::TransitionEvent<Ping>;

    unsigned long long count = 0;
    replica::Timestamp last{};

    void apply(const Transition_t& event)
    {
        last = event.timestamp;
        ++count;
    }

    std::optional<Transition_t> suspended_event() const
    {
        if(count % 2 == 0) return std::nullopt;
        return replica::machine_event(last, Ping{});
    }

    friend bool operator==(const Echo&, const Echo&) = default;
};

using Factory = replica::DefaultStateProgramFactory<Echo>;

int main()
{
    auto authority = replica::Authority<Factory>::Builder{}.build();
    replica::Follower<Factory> follower;

    const char* gate = std::getenv("REPLICA_ENABLE_BENCH_SMOKE");
    const int rounds = gate ? 50000 : 2;
    replica::Timestamp now{};
    for(int i = 0; i < rounds; ++i)
    {
        now += std::chrono::milliseconds(1);
        authority.submit(replica::PlayerId{0}, Ping{}, now);
        authority.fire_due(now);
        follower.apply_all(authority.drain());
    }

    assert(authority.program().count == static_cast<unsigned long long>(rounds) * 2);
    assert(follower.program() == authority.program());

    return 0;
}
