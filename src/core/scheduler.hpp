#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace tabweave
{

using TimePoint = std::chrono::steady_clock::time_point;

class Clock
{
   public:
    virtual ~Clock()              = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock : public Clock
{
   public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

// Test clock: time only moves when advance() is called.
class ManualClock : public Clock
{
   public:
    TimePoint now() const override
    {
        std::lock_guard<std::mutex> lock(mu_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta)
    {
        std::lock_guard<std::mutex> lock(mu_);
        now_ += delta;
    }

   private:
    mutable std::mutex mu_;
    TimePoint          now_{std::chrono::hours(1)};
};

// Cancellable one-shot timers.  Nothing runs on its own: the owner calls
// run_due() from its loop (Orchestrator::tick), so callbacks execute on the
// control thread and never behind a sleeping thread.
//
// Thread-safe.  Callbacks run without the scheduler lock held and may
// schedule or cancel other timers.
class Scheduler
{
   public:
    using TimerId  = uint64_t;
    using Callback = std::function<void()>;

    static constexpr TimerId INVALID_TIMER = 0;

    explicit Scheduler(const Clock& clock) : clock_(clock) {}

    Scheduler(const Scheduler&)            = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, Callback fn);

    // Returns false if the timer already fired or was never scheduled.
    bool cancel(TimerId id);

    bool pending(TimerId id) const;

    // Runs every timer whose deadline has passed, earliest first.  Timers
    // scheduled by a callback with zero delay run in the same call.
    size_t run_due();

    std::optional<TimePoint> next_deadline() const;
    size_t                   pending_count() const;

    const Clock& clock() const { return clock_; }

   private:
    using Key = std::pair<TimePoint, TimerId>;

    const Clock&                        clock_;
    mutable std::mutex                  mu_;
    TimerId                             next_id_ = 1;
    std::map<Key, Callback>             queue_;
    std::unordered_map<TimerId, TimePoint> deadlines_;
};

}   // namespace tabweave
