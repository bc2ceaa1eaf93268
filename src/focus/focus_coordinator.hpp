#pragma once

#include "bus/event_bus.hpp"

#include <tabweave/fwd.hpp>
#include <tabweave/status.hpp>

#include <mutex>
#include <vector>

namespace tabweave
{

// Tracks which tab should have input focus and routes it to the tab's live
// surface.  Requests are advisory: they return at once and the host applies
// focus on its own schedule.
//
// A request for a tab that is not live (frozen, unfreezing, still creating)
// is logged and remembered; focus is routed to that tab as soon as its
// surface becomes live.  Activating a tab in the focused window moves focus
// to it.
class FocusCoordinator
{
   public:
    FocusCoordinator(ViewLifecycleManager& views, StateSynchronizer& state, EventBus& bus);
    ~FocusCoordinator();

    FocusCoordinator(const FocusCoordinator&)            = delete;
    FocusCoordinator& operator=(const FocusCoordinator&) = delete;

    // NotFound for an unknown tab; success otherwise.  For a tab that is not
    // live the call changes no focus now: it only records the tab as
    // pending_tab(), and focus follows once that tab's surface is live.
    Status request_focus(TabId tab);

    // The OS window that holds keyboard focus changed.
    void set_focused_window(WindowId window);

    WindowId focused_window() const;
    TabId    focused_tab() const;
    // Waiting for its surface to come up; INVALID_TAB if none.
    TabId pending_tab() const;

   private:
    void on_tab_activated(const TabActivated& e);
    void on_became_live(TabId tab);
    void on_tab_closed(const TabClosed& e);
    void on_window_closing(const WindowMarkedForClosure& e);

    // Focuses `tab` now if its surface is live, otherwise remembers it.
    void route(TabId tab, WindowId window);

    ViewLifecycleManager& views_;
    StateSynchronizer&    state_;
    EventBus&             bus_;

    mutable std::mutex mu_;
    WindowId           focused_window_ = INVALID_WINDOW;
    TabId              focused_tab_    = INVALID_TAB;
    TabId              pending_tab_    = INVALID_TAB;

    std::vector<EventBus::Unsubscriber> subs_;
};

}   // namespace tabweave
