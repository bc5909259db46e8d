#include <iostream>
#include <string>
#include <utility>
#include <variant>

#include <replica/host.hpp>

// A plain state machine: no events, no timers, no knowledge of players.
enum class Vote { Yes, No, Abstain };

struct Tally {
    using Transition_t = Vote;

    int yes = 0;
    int no = 0;
    int abstain = 0;

    void apply(Vote v) {
        switch (v) {
        case Vote::Yes: ++yes; break;
        case Vote::No: ++no; break;
        case Vote::Abstain: ++abstain; break;
        }
    }
};

using Factory = replica::factory_for_t<Tally>;
using Authority = replica::Authority<Factory>;

int main() {
    Authority::Builder builder;
    builder.admit([](const Authority::Program_t&, const Authority::Event_t& event) {
        return event.originator->value < 3;
    });
    builder.on_rejected([](const Authority::Program_t&, const Authority::Event_t& event) {
        std::cout << "ignored vote from player " << event.originator->value << "\n";
    });
    auto authority = std::move(builder).build();

    replica::Timestamp now{};
    authority.submit(replica::PlayerId{0}, Vote::Yes, now);
    authority.submit(replica::PlayerId{1}, Vote::No, now);
    authority.submit(replica::PlayerId{2}, Vote::Yes, now);
    authority.submit(replica::PlayerId{7}, Vote::No, now);

    const auto& tally = authority.program().inner();
    std::cout << "yes=" << tally.yes << " no=" << tally.no << " abstain=" << tally.abstain << "\n";
    std::cout << "pending=" << (authority.pending() ? "yes" : "no") << "\n";

    return 0;
}
