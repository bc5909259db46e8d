#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <replica/host.hpp>

using namespace std::chrono_literals;

struct Decrement {
    friend bool operator==(const Decrement&, const Decrement&) = default;
};
struct Reset {
    friend bool operator==(const Reset&, const Reset&) = default;
};
using Command = std::variant<Decrement, Reset>;

struct Countdown {
    using Transition_t = replica::TransitionEvent<Command>;

    int remaining = 3;
    replica::Timestamp last{};

    void apply(const Transition_t& event) {
        last = event.timestamp;
        if (std::holds_alternative<Decrement>(event.transition)) {
            if (remaining > 0) --remaining;
        } else {
            remaining = 3;
        }
    }

    std::optional<Transition_t> suspended_event() const {
        if (remaining == 0) return std::nullopt;
        return replica::machine_event(last + 1s, Command{Decrement{}});
    }
};

using Factory = replica::DefaultStateProgramFactory<Countdown>;
using Authority = replica::Authority<Factory>;

int main() {
    const replica::Timestamp t0{};
    auto seconds = [&t0](replica::Timestamp ts) {
        return std::chrono::duration_cast<std::chrono::seconds>(ts - t0).count();
    };

    Authority::Builder builder;
    builder.on_applied([&seconds](const Countdown& c, const Authority::Event_t& event) {
        std::cout << "t=" << seconds(event.timestamp) << "s "
                  << (event.machine_originated() ? "clock" : "player " + std::to_string(event.originator->value))
                  << " -> remaining=" << c.remaining << "\n";
    });
    builder.on_rescheduled([&seconds](const std::optional<Authority::Event_t>& next) {
        if (next) {
            std::cout << "  next wake-up at t=" << seconds(next->timestamp) << "s\n";
        } else {
            std::cout << "  nothing scheduled\n";
        }
    });

    auto authority = std::move(builder).build();
    replica::Follower<Factory> client;

    authority.fire_due(t0 + 2s);
    authority.submit(replica::PlayerId{1}, Reset{}, t0 + 2500ms);
    authority.fire_due(t0 + 10s);

    client.apply_all(authority.drain());
    std::cout << "client remaining=" << client.program().remaining
              << " after " << client.sequence() << " events\n";

    return 0;
}
