#include "event_bus.hpp"

#include <tabweave/logger.hpp>

#include <algorithm>
#include <exception>
#include <iterator>

namespace tabweave
{

const char* event_name(EventType type)
{
    static constexpr const char* NAMES[] = {
        "SurfaceCreated",
        "SurfaceDestroyed",
        "SurfaceCreateFailed",
        "LoadStarted",
        "LoadFinished",
        "LoadFailed",
        "UrlChanged",
        "NavigationFlagsChanged",
        "TitleChanged",
        "FaviconChanged",
        "SurfaceCrashed",
        "OpenUrlRequested",
        "TabActivated",
        "TabClosed",
        "WindowMarkedForClosure",
        "SurfaceHidden",
        "SurfaceNeeded",
        "DisplayModeChanged",
        "FocusChanged",
    };
    static_assert(std::size(NAMES) == EVENT_TYPE_COUNT, "event name table out of date");
    return type < EVENT_TYPE_COUNT ? NAMES[type] : "Unknown";
}

EventBus::EventBus() : core_(std::make_shared<Core>()) {}

EventBus::~EventBus()
{
    unsubscribe_all();
}

void EventBus::Core::remove(EventType type, SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(mu);
    auto& list = topics[type];
    auto  it   = std::find_if(list.begin(), list.end(),
                           [id](const auto& e) { return e->id == id; });
    if (it == list.end())
        return;
    (*it)->active.store(false);
    list.erase(it);
}

EventBus::SubscriptionId EventBus::add_handler(EventType type, Handler handler)
{
    if (type >= EVENT_TYPE_COUNT || !handler)
    {
        TABWEAVE_LOG_WARN("bus", "add_handler: rejected handler for topic {}", type);
        return 0;
    }

    auto entry     = std::make_shared<Entry>();
    entry->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(core_->mu);
    entry->id = core_->next_id++;
    core_->topics[type].push_back(entry);
    return entry->id;
}

EventBus::Unsubscriber EventBus::subscribe(EventType type, Handler handler)
{
    SubscriptionId id = add_handler(type, std::move(handler));
    if (id == 0)
        return [] {};

    std::weak_ptr<Core> weak = core_;
    return [weak, type, id]
    {
        if (auto core = weak.lock())
            core->remove(type, id);
    };
}

void EventBus::unsubscribe(EventType type, SubscriptionId id)
{
    if (type >= EVENT_TYPE_COUNT)
        return;
    core_->remove(type, id);
}

void EventBus::unsubscribe_all()
{
    std::lock_guard<std::mutex> lock(core_->mu);
    for (auto& list : core_->topics)
    {
        for (auto& e : list)
            e->active.store(false);
        list.clear();
    }
}

void EventBus::unsubscribe_all(EventType type)
{
    if (type >= EVENT_TYPE_COUNT)
        return;
    std::lock_guard<std::mutex> lock(core_->mu);
    for (auto& e : core_->topics[type])
        e->active.store(false);
    core_->topics[type].clear();
}

void EventBus::publish(const Event& event)
{
    const EventType type = event_type(event);

    std::vector<std::shared_ptr<Entry>> targets;
    {
        std::lock_guard<std::mutex> lock(core_->mu);
        targets = core_->topics[type];
    }

    TABWEAVE_LOG_TRACE("bus", "publish {} to {} handler(s)", event_name(type), targets.size());

    for (const auto& entry : targets)
    {
        // Unsubscribed by an earlier handler in this same delivery
        if (!entry->active.load())
            continue;

        try
        {
            entry->handler(event);
        }
        catch (const std::exception& e)
        {
            core_->failures.fetch_add(1);
            TABWEAVE_LOG_ERROR("bus",
                               "handler {} for {} threw: {}",
                               entry->id,
                               event_name(type),
                               e.what());
        }
        catch (...)
        {
            core_->failures.fetch_add(1);
            TABWEAVE_LOG_ERROR("bus",
                               "handler {} for {} threw a non-standard exception",
                               entry->id,
                               event_name(type));
        }
    }
}

size_t EventBus::subscriber_count(EventType type) const
{
    if (type >= EVENT_TYPE_COUNT)
        return 0;
    std::lock_guard<std::mutex> lock(core_->mu);
    return core_->topics[type].size();
}

}   // namespace tabweave
