#pragma once

#include "events.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace tabweave
{

// In-process publish/subscribe hub.  Topics are Event alternatives.
//
// Delivery is synchronous and in registration order.  A throwing handler is
// caught and logged; the remaining handlers still run and the publisher never
// sees the exception.  Handlers may publish, subscribe and unsubscribe from
// inside a delivery.  There is no replay: a late subscriber never sees events
// published before it registered.
//
// Thread-safe.
class EventBus
{
   public:
    using Handler        = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;
    // Removes the subscription it was returned for.  Safe to call more than
    // once and safe to call after the bus is gone.
    using Unsubscriber = std::function<void()>;

    EventBus();
    ~EventBus();

    EventBus(const EventBus&)            = delete;
    EventBus& operator=(const EventBus&) = delete;

    Unsubscriber subscribe(EventType type, Handler handler);

    // Like subscribe(), but returns the id for use with unsubscribe().
    SubscriptionId add_handler(EventType type, Handler handler);

    // Typed convenience: bus.on<TabActivated>([](const TabActivated& e) { ... }).
    template <typename E>
    Unsubscriber on(std::function<void(const E&)> handler)
    {
        return subscribe(event_type_of<E>,
                         [h = std::move(handler)](const Event& ev)
                         {
                             if (const auto* e = std::get_if<E>(&ev))
                                 h(*e);
                         });
    }

    // No-op when the id is unknown or already removed.
    void unsubscribe(EventType type, SubscriptionId id);

    void unsubscribe_all();
    void unsubscribe_all(EventType type);

    void publish(const Event& event);

    size_t subscriber_count(EventType type) const;

    // Number of handler invocations that threw since construction.
    uint64_t handler_failures() const { return core_->failures.load(); }

   private:
    struct Entry
    {
        SubscriptionId    id = 0;
        Handler           handler;
        std::atomic<bool> active{true};
    };

    struct Core
    {
        mutable std::mutex mu;
        SubscriptionId     next_id = 1;
        std::array<std::vector<std::shared_ptr<Entry>>, EVENT_TYPE_COUNT> topics;
        std::atomic<uint64_t> failures{0};

        void remove(EventType type, SubscriptionId id);
    };

    std::shared_ptr<Core> core_;
};

}   // namespace tabweave
