#include "focus_coordinator.hpp"

#include "state/state_synchronizer.hpp"
#include "view/view_lifecycle_manager.hpp"

#include <tabweave/logger.hpp>

namespace tabweave
{

FocusCoordinator::FocusCoordinator(ViewLifecycleManager& views, StateSynchronizer& state, EventBus& bus)
    : views_(views), state_(state), bus_(bus)
{
    subs_.push_back(bus_.on<TabActivated>([this](const TabActivated& e) { on_tab_activated(e); }));
    subs_.push_back(bus_.on<SurfaceCreated>([this](const SurfaceCreated& e) { on_became_live(e.tab_id); }));
    subs_.push_back(bus_.on<DisplayModeChanged>(
        [this](const DisplayModeChanged& e)
        {
            if (e.mode == DisplayMode::Live)
                on_became_live(e.tab_id);
        }));
    subs_.push_back(bus_.on<TabClosed>([this](const TabClosed& e) { on_tab_closed(e); }));
    subs_.push_back(
        bus_.on<WindowMarkedForClosure>([this](const WindowMarkedForClosure& e) { on_window_closing(e); }));
}

FocusCoordinator::~FocusCoordinator()
{
    for (auto& unsub : subs_)
        unsub();
}

Status FocusCoordinator::request_focus(TabId tab)
{
    const WindowId window = state_.window_of(tab);
    if (window == INVALID_WINDOW)
    {
        TABWEAVE_LOG_DEBUG("focus", "focus request for unknown tab {} ignored", tab);
        return Status::error(ErrorCode::NotFound, "tab " + std::to_string(tab) + " is unknown");
    }
    route(tab, window);
    return Status::success();
}

void FocusCoordinator::set_focused_window(WindowId window)
{
    TabId active = INVALID_TAB;
    if (auto snap = state_.get_state(window))
        active = snap->set.active_tab_id;

    {
        std::lock_guard<std::mutex> lock(mu_);
        focused_window_ = window;
    }
    if (active != INVALID_TAB)
        route(active, window);
}

WindowId FocusCoordinator::focused_window() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return focused_window_;
}

TabId FocusCoordinator::focused_tab() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return focused_tab_;
}

TabId FocusCoordinator::pending_tab() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return pending_tab_;
}

void FocusCoordinator::route(TabId tab, WindowId window)
{
    if (views_.state(tab) != SurfaceState::Live)
    {
        TABWEAVE_LOG_INFO("focus",
                          "tab {} is {}, focus deferred",
                          tab,
                          surface_state_name(views_.state(tab)));
        std::lock_guard<std::mutex> lock(mu_);
        pending_tab_ = tab;
        return;
    }

    Status st = views_.focus(tab);
    if (!st)
    {
        TABWEAVE_LOG_DEBUG("focus", "tab {}: {}", tab, st.to_string());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        focused_window_ = window;
        focused_tab_    = tab;
        if (pending_tab_ == tab)
            pending_tab_ = INVALID_TAB;
    }
    bus_.publish(FocusChanged{window, tab});
}

void FocusCoordinator::on_tab_activated(const TabActivated& e)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (focused_window_ != INVALID_WINDOW && focused_window_ != e.window_id)
            return;
    }
    route(e.tab_id, e.window_id);
}

void FocusCoordinator::on_became_live(TabId tab)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (pending_tab_ != tab)
            return;
    }
    const WindowId window = state_.window_of(tab);
    if (window != INVALID_WINDOW && views_.state(tab) == SurfaceState::Live)
        route(tab, window);
}

void FocusCoordinator::on_tab_closed(const TabClosed& e)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (focused_tab_ == e.tab_id)
        focused_tab_ = INVALID_TAB;
    if (pending_tab_ == e.tab_id)
        pending_tab_ = INVALID_TAB;
}

void FocusCoordinator::on_window_closing(const WindowMarkedForClosure& e)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (focused_window_ == e.window_id)
    {
        focused_window_ = INVALID_WINDOW;
        focused_tab_    = INVALID_TAB;
    }
}

}   // namespace tabweave
