#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <replica/host.hpp>

using namespace std::chrono_literals;

// Each player holds an independent reminder; only the earliest is exposed to
// the authority at any time.
struct Remind {
    std::chrono::seconds after{};
    friend bool operator==(const Remind&, const Remind&) = default;
};
struct Ring {
    std::size_t player{};
    replica::Timestamp at{};
    friend bool operator==(const Ring&, const Ring&) = default;
};
using ReminderOp = std::variant<Remind, Ring>;

struct Reminders {
    using Transition_t = replica::TransitionEvent<ReminderOp>;

    struct Entry {
        replica::Timestamp at{};
        std::size_t player{};
        friend bool operator==(const Entry&, const Entry&) = default;
        friend auto operator<=>(const Entry&, const Entry&) = default;
    };

    std::vector<Entry> entries;
    std::vector<std::string> rung;

    void apply(const Transition_t& event) {
        if (const auto* remind = std::get_if<Remind>(&event.transition)) {
            if (!event.originator) return;
            entries.push_back(Entry{event.timestamp + remind->after, event.originator->value});
            std::sort(entries.begin(), entries.end());
            return;
        }
        const auto& ring = std::get<Ring>(event.transition);
        auto it = std::find(entries.begin(), entries.end(), Entry{ring.at, ring.player});
        if (it != entries.end()) {
            entries.erase(it);
            rung.push_back("player " + std::to_string(ring.player));
        }
    }

    std::optional<Transition_t> suspended_event() const {
        if (entries.empty()) return std::nullopt;
        const auto& next = entries.front();
        return replica::machine_event(next.at, ReminderOp{Ring{next.player, next.at}});
    }
};

using Factory = replica::DefaultStateProgramFactory<Reminders>;

int main() {
    const replica::Timestamp t0{};
    auto authority = replica::Authority<Factory>::Builder{}.build();

    authority.submit(replica::PlayerId{1}, Remind{40s}, t0);
    authority.submit(replica::PlayerId{2}, Remind{15s}, t0 + 1s);
    authority.submit(replica::PlayerId{3}, Remind{25s}, t0 + 2s);

    for (auto now = t0; now <= t0 + 60s; now += 10s) {
        const auto fired = authority.fire_due(now);
        if (fired) {
            std::cout << "t=" << std::chrono::duration_cast<std::chrono::seconds>(now - t0).count()
                      << "s fired " << fired << "\n";
        }
    }

    for (const auto& who : authority.program().rung) {
        std::cout << "rang " << who << "\n";
    }

    return 0;
}
