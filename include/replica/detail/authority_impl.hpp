#ifndef REPLICA_DETAIL_AUTHORITY_IMPL_HPP
#define REPLICA_DETAIL_AUTHORITY_IMPL_HPP

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <replica/detail/concepts.hpp>
#include <replica/detail/policy.hpp>
#include <replica/detail/program.hpp>
#include <replica/detail/types.hpp>

namespace replica
{

template <StateProgramFactory Factory, PolicyHasCallableTemplate CallablePolicy = policy::copy>
class AuthorityImpl
{
public:
    template <typename Sig>
    using Callable = typename CallablePolicy::template Callable<Sig>;

    using Factory_t = Factory;
    using Program_t = typename Factory::State_t;
    using Transition_t = program_transition_t<Program_t>;
    using Event_t = program_event_t<Program_t>;
    using Policy = CallablePolicy;

    using Callbacks = detail::HostCallables<CallablePolicy, Program_t, Event_t>;
    using AdmissionGuard = Callable<typename Callbacks::AdmissionSig>;
    using EventHook = Callable<typename Callbacks::EventSig>;
    using RescheduledHook = Callable<typename Callbacks::RescheduledSig>;

    // Upper bound on suspended events fired by a single fire_due call.
    static constexpr std::size_t default_fire_limit = 64;

    class Builder
    {
    public:
        using Policy = CallablePolicy;

        Builder()
            requires std::default_initializable<Factory_t>
            : factory_(Factory_t{}) {}

        explicit Builder(Factory_t factory) : factory_(std::move(factory)) {}

        Builder& set_factory(Factory_t factory)
        {
            factory_ = std::move(factory);
            return *this;
        }

        Builder& set_fire_limit(std::size_t limit)
        {
            fire_limit_ = limit == 0 ? 1 : limit;
            return *this;
        }

        // Resume from a restored program instead of creating a fresh one.
        // The slot is recomputed from the restored state when built.
        Builder& restore(Program_t program, std::uint64_t sequence = 0)
        {
            restored_.emplace(std::move(program));
            sequence_ = sequence;
            return *this;
        }

        template <class Fn>
        Builder& admit(Fn&& fn)
        {
            using Fn_t = std::decay_t<Fn>;
            if constexpr(std::is_same_v<Fn_t, AdmissionGuard>)
            {
                callbacks_.admission = std::forward<Fn>(fn);
            }
            else
            {
                static_assert(AdmissionGuardFor<Fn_t, Program_t>,
                              "admission guard must be callable as bool(const Program&, const Event&)");
                callbacks_.admission = AdmissionGuard{std::forward<Fn>(fn)};
            }
            return *this;
        }

        Builder& on_applied(EventHook fn)
        {
            callbacks_.on_applied = std::move(fn);
            return *this;
        }

        Builder& on_rejected(EventHook fn)
        {
            callbacks_.on_rejected = std::move(fn);
            return *this;
        }

        Builder& on_rescheduled(RescheduledHook fn)
        {
            callbacks_.on_rescheduled = std::move(fn);
            return *this;
        }

        AuthorityImpl build() &&
        {
            Program_t program = restored_ ? std::move(*restored_) : factory_.create();
            return AuthorityImpl(std::move(factory_), std::move(program), sequence_, fire_limit_,
                                 std::move(callbacks_));
        }

    private:
        Factory_t factory_;
        std::optional<Program_t> restored_{};
        std::uint64_t sequence_ = 0;
        std::size_t fire_limit_ = default_fire_limit;
        Callbacks callbacks_{};
    };

    bool submit(PlayerId player, Transition_t transition, Timestamp timestamp)
    {
        return admit_and_apply(Event_t{timestamp, player, std::move(transition)});
    }

    // Events without an originator only enter the stream through fire().
    bool inject(Event_t event)
    {
        if(event.machine_originated())
        {
            return false;
        }
        return admit_and_apply(std::move(event));
    }

    bool fire()
    {
        if(!pending_)
        {
            return false;
        }
        Event_t event = *pending_;
        event.originator.reset();
        apply_and_record(std::move(event));
        return true;
    }

    std::size_t fire_due(Timestamp now)
    {
        std::size_t fired = 0;
        while(fired < fire_limit_ && pending_ && pending_->timestamp <= now)
        {
            fire();
            ++fired;
        }
        return fired;
    }

    void resync()
    {
        reschedule();
    }

    const std::optional<Event_t>& pending() const noexcept
    {
        return pending_;
    }

    const Program_t& program() const noexcept
    {
        return program_;
    }

    std::uint64_t sequence() const noexcept
    {
        return sequence_;
    }

    std::size_t fire_limit() const noexcept
    {
        return fire_limit_;
    }

    Factory_t& factory() noexcept
    {
        return factory_;
    }

    std::vector<Event_t> drain()
    {
        std::vector<Event_t> out;
        out.reserve(outbox_.size());
        while(!outbox_.empty())
        {
            out.push_back(std::move(outbox_.front()));
            outbox_.pop_front();
        }
        return out;
    }

private:
    AuthorityImpl(Factory_t factory,
                  Program_t program,
                  std::uint64_t sequence,
                  std::size_t fire_limit,
                  Callbacks callbacks)
        : factory_(std::move(factory)), program_(std::move(program)), sequence_(sequence), fire_limit_(fire_limit), callbacks_(std::move(callbacks))
    {
        reschedule();
    }

    bool admit_and_apply(Event_t event)
    {
        if(callbacks_.admission && !callbacks_.admission(program_, event))
        {
            if(callbacks_.on_rejected)
            {
                callbacks_.on_rejected(program_, event);
            }
            return false;
        }
        apply_and_record(std::move(event));
        return true;
    }

    // A throwing apply leaves sequence, outbox and slot untouched. The slot
    // change is announced before on_applied runs, so a throwing hook cannot
    // leave an external timer armed for a stale answer.
    void apply_and_record(Event_t event)
    {
        program_.apply(event);
        ++sequence_;
        outbox_.push_back(event);
        reschedule();
        if(callbacks_.on_applied)
        {
            callbacks_.on_applied(program_, event);
        }
    }

    void reschedule()
    {
        if(requery() && callbacks_.on_rescheduled)
        {
            callbacks_.on_rescheduled(pending_);
        }
    }

    bool requery()
    {
        auto next = suspended_event(program_);
        bool changed = true;
        if constexpr(std::equality_comparable<Event_t>)
        {
            changed = next != pending_;
        }
        else
        {
            changed = next.has_value() || pending_.has_value();
        }
        pending_ = std::move(next);
        return changed;
    }

    Factory_t factory_;
    Program_t program_;
    std::optional<Event_t> pending_{};
    std::deque<Event_t> outbox_;
    std::uint64_t sequence_ = 0;
    std::size_t fire_limit_ = default_fire_limit;
    Callbacks callbacks_{};
};

} // namespace replica

#endif
