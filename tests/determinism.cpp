#include <cassert>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <replica/core.hpp>

struct Deposit
{
    std::int64_t amount{};
};
struct Withdraw
{
    std::int64_t amount{};
};
struct Rename
{
    std::string name;
};

using LedgerOp = std::variant<Deposit, Withdraw, Rename>;

// Overdrafts are not an error path: they are counted in state and the
// balance is left alone.
struct Ledger
{
    using Transition_t = LedgerOp;

    std::string name = "ledger";
    std::int64_t balance = 0;
    std::uint32_t refused = 0;

    void apply(const Transition_t& op)
    {
        if(const auto* d = std::get_if<Deposit>(&op))
        {
            balance += d->amount;
        }
        else if(const auto* w = std::get_if<Withdraw>(&op))
        {
            if(w->amount > balance)
            {
                ++refused;
                return;
            }
            balance -= w->amount;
        }
        else
        {
            name = std::get<Rename>(op).name;
        }
    }

    friend bool operator==(const Ledger&, const Ledger&) = default;
};

static_assert(replica::StateMachine<Ledger>);
static_assert(!replica::StateProgram<Ledger>);

int main()
{
    const std::vector<LedgerOp> ops{
        Deposit{50}, Withdraw{20}, Withdraw{100}, Rename{"savings"}, Deposit{5}, Withdraw{35},
    };

    Ledger a;
    Ledger b;
    assert(a == b);
    for(const auto& op : ops)
    {
        a.apply(op);
        b.apply(op);
        assert(a == b);
    }
    assert(a.balance == 0);
    assert(a.refused == 1);
    assert(a.name == "savings");

    // Two states that reached equality along different paths stay equal.
    Ledger c;
    c.apply(Deposit{10});
    c.apply(Withdraw{10});
    Ledger d;
    assert(c == d);
    c.apply(Withdraw{1});
    d.apply(Withdraw{1});
    assert(c == d);
    assert(c.refused == 1 && c.balance == 0);

    return 0;
}
