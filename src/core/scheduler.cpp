#include "scheduler.hpp"

namespace tabweave
{

Scheduler::TimerId Scheduler::schedule(std::chrono::milliseconds delay, Callback fn)
{
    if (delay.count() < 0)
        delay = std::chrono::milliseconds(0);

    const TimePoint deadline = clock_.now() + delay;

    std::lock_guard<std::mutex> lock(mu_);
    TimerId id = next_id_++;
    queue_.emplace(Key{deadline, id}, std::move(fn));
    deadlines_[id] = deadline;
    return id;
}

bool Scheduler::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = deadlines_.find(id);
    if (it == deadlines_.end())
        return false;
    queue_.erase(Key{it->second, id});
    deadlines_.erase(it);
    return true;
}

bool Scheduler::pending(TimerId id) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return deadlines_.count(id) > 0;
}

size_t Scheduler::run_due()
{
    size_t ran = 0;
    for (;;)
    {
        Callback fn;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (queue_.empty())
                break;
            auto it = queue_.begin();
            if (it->first.first > clock_.now())
                break;
            fn = std::move(it->second);
            deadlines_.erase(it->first.second);
            queue_.erase(it);
        }
        if (fn)
            fn();
        ++ran;
    }
    return ran;
}

std::optional<TimePoint> Scheduler::next_deadline() const
{
    std::lock_guard<std::mutex> lock(mu_);
    if (queue_.empty())
        return std::nullopt;
    return queue_.begin()->first.first;
}

size_t Scheduler::pending_count() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

}   // namespace tabweave
