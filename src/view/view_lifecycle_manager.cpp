#include "view_lifecycle_manager.hpp"

#include "bus/event_bus.hpp"

#include <tabweave/logger.hpp>

#include <algorithm>

namespace tabweave
{

ViewLifecycleManager::ViewLifecycleManager(SurfaceHost&        host,
                                           EventBus&           bus,
                                           Scheduler&          scheduler,
                                           ViewLifecycleConfig config)
    : host_(host), bus_(bus), scheduler_(scheduler), config_(config)
{
    host_.set_event_sink([this](const HostEvent& ev) { on_host_event(ev); });
}

ViewLifecycleManager::~ViewLifecycleManager()
{
    host_.set_event_sink(nullptr);

    std::lock_guard<std::mutex> lock(mu_);
    for (auto& [tab, e] : entries_)
        cancel_destroy_timer(e);
}

// ─── Windows ─────────────────────────────────────────────────────────────────

Status ViewLifecycleManager::register_window(WindowId window)
{
    if (window == INVALID_WINDOW)
        return Status::error(ErrorCode::InvalidWindow, "window id 0 is reserved");

    std::lock_guard<std::mutex> lock(mu_);
    if (windows_.count(window))
        return Status::success();

    Status st = host_.attach_window(window);
    if (!st)
        return st;
    windows_.insert(window);
    TABWEAVE_LOG_DEBUG("view", "window {} registered with {} host", window, host_.name());
    return Status::success();
}

void ViewLifecycleManager::unregister_window(WindowId window)
{
    Pending out;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!windows_.erase(window))
            return;

        for (auto it = entries_.begin(); it != entries_.end();)
        {
            if (it->second.window != window)
            {
                ++it;
                continue;
            }
            cancel_destroy_timer(it->second);
            release_surface(it->first, it->second, false, out);
            it = entries_.erase(it);
        }
        z_orders_.erase(window);
        host_.detach_window(window);
    }
    TABWEAVE_LOG_DEBUG("view", "window {} unregistered", window);
    publish_all(out);
}

bool ViewLifecycleManager::has_window(WindowId window) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return windows_.count(window) > 0;
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

Status ViewLifecycleManager::create_surface(WindowId window, TabId tab, const std::string& url)
{
    if (tab == INVALID_TAB)
        return Status::error(ErrorCode::InvalidArgument, "tab id 0 is reserved");

    Pending out;
    Status  result;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!windows_.count(window))
        {
            return Status::error(ErrorCode::InvalidWindow,
                                 "window " + std::to_string(window) + " is unknown");
        }

        highest_tab_ = std::max(highest_tab_, tab);
        Entry& e     = entries_[tab];
        if (e.window != window && e.window != INVALID_WINDOW)
            drop_from_order(e.window, tab);
        if (e.window != window)
        {
            e.window = window;
            raise_in_order(window, tab, true);
        }

        if (e.destroy_timer != Scheduler::INVALID_TIMER)
        {
            cancel_destroy_timer(e);
            TABWEAVE_LOG_DEBUG("view", "tab {}: pending destroy cancelled by create", tab);
        }

        switch (e.state)
        {
            case SurfaceState::Creating:
            case SurfaceState::Live:
            case SurfaceState::Unfreezing:
                // Duplicate mount
                return Status::success();

            case SurfaceState::Freezing:
                e.state = SurfaceState::Live;
                TABWEAVE_LOG_DEBUG("view", "tab {}: create during freeze keeps surface", tab);
                return Status::success();

            case SurfaceState::Frozen:
                if (!url.empty())
                    e.url = url;
                e.state             = SurfaceState::Unfreezing;
                e.hide_until_loaded = true;
                result              = start_surface(tab, e, out);
                if (!result)
                    e.state = SurfaceState::Frozen;
                break;

            case SurfaceState::Uninitialized:
            case SurfaceState::Destroying:
            case SurfaceState::Destroyed:
                e.url               = url;
                e.state             = SurfaceState::Creating;
                e.hide_until_loaded = false;
                result              = start_surface(tab, e, out);
                if (!result)
                    e.state = SurfaceState::Uninitialized;
                break;
        }
    }
    publish_all(out);
    return result;
}

void ViewLifecycleManager::destroy_surface(TabId tab)
{
    Pending out;
    {
        std::lock_guard<std::mutex> lock(mu_);
        Entry* e = find(tab);
        if (!e || e->state == SurfaceState::Destroyed)
            return;

        if (e->state == SurfaceState::Freezing)
        {
            release_surface(tab, *e, true, out);
        }
        else if (e->destroy_timer == Scheduler::INVALID_TIMER)
        {
            const uint64_t generation = ++e->destroy_generation;
            e->destroy_timer          = scheduler_.schedule(config_.destroy_debounce,
                                                   [this, tab, generation]
                                                   { on_destroy_timer(tab, generation); });
            TABWEAVE_LOG_TRACE("view", "tab {}: destroy scheduled", tab);
        }
    }
    publish_all(out);
}

void ViewLifecycleManager::on_destroy_timer(TabId tab, uint64_t generation)
{
    Pending out;
    {
        std::lock_guard<std::mutex> lock(mu_);
        Entry* e = find(tab);
        // A create in the meantime cancelled this timer (and maybe armed another)
        if (!e || e->destroy_timer == Scheduler::INVALID_TIMER || e->destroy_generation != generation)
            return;
        e->destroy_timer = Scheduler::INVALID_TIMER;
        release_surface(tab, *e, false, out);
        entries_.erase(tab);
    }
    publish_all(out);
}

void ViewLifecycleManager::destroy_surface_now(TabId tab)
{
    Pending out;
    {
        std::lock_guard<std::mutex> lock(mu_);
        Entry* e = find(tab);
        if (!e || e->state == SurfaceState::Destroyed)
            return;
        cancel_destroy_timer(*e);
        release_surface(tab, *e, false, out);
        entries_.erase(tab);
    }
    publish_all(out);
}

bool ViewLifecycleManager::destroy_pending(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const Entry* e = find(tab);
    return e && e->destroy_timer != Scheduler::INVALID_TIMER;
}

// ─── Geometry and stacking ───────────────────────────────────────────────────

void ViewLifecycleManager::set_bounds(TabId tab, const Rect& rect)
{
    if (!rect.valid())
    {
        TABWEAVE_LOG_DEBUG("view", "tab {}: ignoring empty bounds {}x{}", tab, rect.width, rect.height);
        return;
    }

    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (!e)
        return;
    e->bounds = rect;
    apply_geometry(*e);
}

void ViewLifecycleManager::set_visible(TabId tab, bool visible)
{
    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (!e)
        return;
    e->visible = visible;
    apply_geometry(*e);
}

void ViewLifecycleManager::bring_to_front(TabId tab)
{
    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (!e)
        return;
    raise_in_order(e->window, tab, true);
    if (e->handle.valid())
        host_.raise(e->handle.id_);
}

void ViewLifecycleManager::send_to_back(TabId tab)
{
    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (!e)
        return;
    raise_in_order(e->window, tab, false);
    if (e->handle.valid())
        host_.lower(e->handle.id_);
}

std::vector<TabId> ViewLifecycleManager::z_order(WindowId window) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = z_orders_.find(window);
    if (it == z_orders_.end())
        return {};
    return it->second;
}

// ─── Content ─────────────────────────────────────────────────────────────────

Status ViewLifecycleManager::navigate(TabId tab, const std::string& url)
{
    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (Status st = require_live(tab, e, "navigate"); !st)
        return st;
    Status st = host_.load_url(e->handle.id_, url);
    if (st)
        e->url = url;
    return st;
}

Status ViewLifecycleManager::go_back(TabId tab)
{
    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (Status st = require_live(tab, e, "go_back"); !st)
        return st;
    return host_.go_back(e->handle.id_);
}

Status ViewLifecycleManager::go_forward(TabId tab)
{
    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (Status st = require_live(tab, e, "go_forward"); !st)
        return st;
    return host_.go_forward(e->handle.id_);
}

Status ViewLifecycleManager::reload(TabId tab)
{
    Pending out;
    Status  result;
    {
        std::lock_guard<std::mutex> lock(mu_);
        Entry* e = find(tab);
        if (e && e->needs_recreate && windows_.count(e->window))
        {
            TABWEAVE_LOG_INFO("view", "tab {}: recreating surface for {}", tab, e->url);
            if (e->handle.valid())
            {
                by_surface_.erase(e->handle.id_);
                Status st = host_.destroy_surface(e->handle.id_);
                if (!st)
                    TABWEAVE_LOG_DEBUG("view", "tab {}: dropping crashed surface: {}", tab, st.to_string());
                e->handle = SurfaceHandle{};
            }
            e->state = SurfaceState::Creating;
            result   = start_surface(tab, *e, out);
            if (!result)
                e->state = SurfaceState::Uninitialized;
        }
        else
        {
            if (Status st = require_live(tab, e, "reload"); !st)
                return st;
            return host_.reload(e->handle.id_);
        }
    }
    publish_all(out);
    return result;
}

Status ViewLifecycleManager::stop(TabId tab)
{
    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (Status st = require_live(tab, e, "stop"); !st)
        return st;
    return host_.stop(e->handle.id_);
}

Status ViewLifecycleManager::focus(TabId tab)
{
    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (Status st = require_live(tab, e, "focus"); !st)
        return st;
    return host_.focus(e->handle.id_);
}

Status ViewLifecycleManager::capture(TabId tab, CaptureCallback done)
{
    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (!e || !e->handle.valid()
        || (e->state != SurfaceState::Live && e->state != SurfaceState::Freezing))
    {
        return Status::error(ErrorCode::NoSuchSurface,
                             "capture: tab " + std::to_string(tab) + " has no live surface");
    }
    return host_.capture(e->handle.id_, std::move(done));
}

Status ViewLifecycleManager::reparent(TabId tab, WindowId target)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        Entry* e = find(tab);
        if (!e)
            return Status::error(ErrorCode::NotFound, "reparent: tab " + std::to_string(tab) + " is unknown");
        if (!windows_.count(target))
            return Status::error(ErrorCode::InvalidWindow,
                                 "reparent: window " + std::to_string(target) + " is unknown");
        if (e->window == target)
            return Status::success();

        if (e->state == SurfaceState::Freezing)
        {
            TABWEAVE_LOG_DEBUG("view", "tab {}: re-parent cancels freeze", tab);
            e->state = SurfaceState::Live;
        }

        const WindowId source = e->window;

        if (!e->handle.valid())
        {
            // Frozen or never created: only the ownership moves
            drop_from_order(source, tab);
            e->window = target;
            raise_in_order(target, tab, true);
            return Status::success();
        }

        Status st = host_.reparent(e->handle.id_, target);
        if (st)
        {
            drop_from_order(source, tab);
            e->window = target;
            raise_in_order(target, tab, true);
            TABWEAVE_LOG_DEBUG("view", "tab {}: surface re-parented {} -> {}", tab, source, target);
            return Status::success();
        }
        if (st.code != ErrorCode::Unsupported)
            return st;

        // Recreate in the target.  The old surface is only released once
        // the replacement exists, so a refused creation changes nothing.
        HostSurfaceId replacement = INVALID_HOST_SURFACE;
        Status        created     = host_.create_surface(target, e->url, replacement);
        if (!created)
            return created;

        const HostSurfaceId old = e->handle.id_;
        by_surface_.erase(old);
        if (Status gone = host_.destroy_surface(old); !gone)
            TABWEAVE_LOG_DEBUG("view", "tab {}: releasing old surface: {}", tab, gone.to_string());

        drop_from_order(source, tab);
        e->window = target;
        raise_in_order(target, tab, true);
        e->handle              = SurfaceHandle(replacement);
        by_surface_[replacement] = tab;
        if (e->state == SurfaceState::Live)
            e->state = SurfaceState::Creating;
        apply_geometry(*e);
        TABWEAVE_LOG_DEBUG("view", "tab {}: surface recreated in window {} at {}", tab, target, e->url);
    }
    return Status::success();
}

// ─── Freeze protocol ─────────────────────────────────────────────────────────

Status ViewLifecycleManager::begin_freeze(TabId tab)
{
    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (!e || e->state != SurfaceState::Live || !e->handle.valid())
    {
        return Status::error(ErrorCode::NoSuchSurface,
                             "begin_freeze: tab " + std::to_string(tab) + " is not live");
    }
    e->state = SurfaceState::Freezing;
    return Status::success();
}

void ViewLifecycleManager::cancel_freeze(TabId tab)
{
    std::lock_guard<std::mutex> lock(mu_);
    Entry* e = find(tab);
    if (e && e->state == SurfaceState::Freezing)
        e->state = SurfaceState::Live;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

SurfaceState ViewLifecycleManager::state(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const Entry* e = find(tab);
    if (e)
        return e->state;
    return tab != INVALID_TAB && tab <= highest_tab_ ? SurfaceState::Destroyed : SurfaceState::Uninitialized;
}

bool ViewLifecycleManager::has_surface(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const Entry* e = find(tab);
    return e && e->handle.valid();
}

std::optional<SurfaceHandle> ViewLifecycleManager::handle(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const Entry* e = find(tab);
    if (!e || !e->handle.valid())
        return std::nullopt;
    return e->handle;
}

WindowId ViewLifecycleManager::window_of(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const Entry* e = find(tab);
    return e ? e->window : INVALID_WINDOW;
}

std::string ViewLifecycleManager::url_of(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const Entry* e = find(tab);
    return e ? e->url : std::string{};
}

std::optional<Rect> ViewLifecycleManager::bounds(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const Entry* e = find(tab);
    return e ? e->bounds : std::nullopt;
}

bool ViewLifecycleManager::desired_visible(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const Entry* e = find(tab);
    return e && e->visible;
}

size_t ViewLifecycleManager::live_count() const
{
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (const auto& [tab, e] : entries_)
    {
        if (e.handle.valid())
            ++n;
    }
    return n;
}

std::vector<TabId> ViewLifecycleManager::tabs_with_surface() const
{
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<TabId> result;
    for (const auto& [tab, e] : entries_)
    {
        if (e.handle.valid())
            result.push_back(tab);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t ViewLifecycleManager::entry_count() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

HostSurfaceId ViewLifecycleManager::host_surface(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    const Entry* e = find(tab);
    return e ? e->handle.id_ : INVALID_HOST_SURFACE;
}

// ─── Host completions ────────────────────────────────────────────────────────

void ViewLifecycleManager::on_host_event(const HostEvent& ev)
{
    Pending out;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto sit = by_surface_.find(ev.surface);
        if (sit == by_surface_.end())
        {
            TABWEAVE_LOG_TRACE("view",
                               "stale {} for released surface {}",
                               host_event_kind_name(ev.kind),
                               ev.surface);
            return;
        }
        const TabId tab = sit->second;
        Entry&      e   = entries_[tab];

        switch (ev.kind)
        {
            case HostEvent::Kind::Created:
                if (e.state == SurfaceState::Creating)
                    e.state = SurfaceState::Live;
                e.needs_recreate = false;
                apply_geometry(e);
                out.emplace_back(SurfaceCreated{tab, e.window});
                break;

            case HostEvent::Kind::CreateFailed:
            {
                by_surface_.erase(sit);
                e.handle         = SurfaceHandle{};
                e.needs_recreate = true;
                e.state = e.state == SurfaceState::Unfreezing ? SurfaceState::Frozen
                                                              : SurfaceState::Uninitialized;
                TABWEAVE_LOG_WARN("view", "tab {}: surface creation failed: {}", tab, ev.text);
                SurfaceCreateFailed failed;
                failed.tab_id    = tab;
                failed.window_id = e.window;
                failed.code      = ErrorCode::ResourceExhausted;
                failed.message   = ev.text;
                out.emplace_back(std::move(failed));
                break;
            }

            case HostEvent::Kind::LoadStarted:
                out.emplace_back(LoadStarted{tab});
                break;

            case HostEvent::Kind::LoadFinished:
                if (!ev.url.empty())
                    e.url = ev.url;
                if (e.state == SurfaceState::Unfreezing || e.state == SurfaceState::Creating)
                    e.state = SurfaceState::Live;
                reveal(e);
                out.emplace_back(LoadFinished{tab, ev.url, ev.text});
                break;

            case HostEvent::Kind::LoadFailed:
                if (ev.code == LOAD_ERROR_ABORTED)
                {
                    TABWEAVE_LOG_DEBUG("view", "tab {}: load of {} superseded", tab, ev.url);
                    break;
                }
                if (e.state == SurfaceState::Unfreezing)
                    e.state = SurfaceState::Live;
                reveal(e);
                out.emplace_back(LoadFailed{tab, ev.code, ev.text, ev.url});
                break;

            case HostEvent::Kind::Navigated:
                e.url = ev.url;
                out.emplace_back(UrlChanged{tab, ev.url, ev.flag});
                break;

            case HostEvent::Kind::TitleChanged:
                out.emplace_back(TitleChanged{tab, ev.text});
                break;

            case HostEvent::Kind::FaviconChanged:
                out.emplace_back(FaviconChanged{tab, ev.url});
                break;

            case HostEvent::Kind::NavFlagsChanged:
                out.emplace_back(NavigationFlagsChanged{tab, ev.flag, ev.flag2});
                break;

            case HostEvent::Kind::Crashed:
                TABWEAVE_LOG_WARN("view", "tab {}: surface crashed: {}", tab, ev.text);
                e.needs_recreate = true;
                if (e.state == SurfaceState::Unfreezing)
                    e.state = SurfaceState::Live;
                reveal(e);
                out.emplace_back(SurfaceCrashed{tab, ev.text});
                break;

            case HostEvent::Kind::OpenUrlRequested:
                out.emplace_back(OpenUrlRequested{tab, e.window, ev.url, ev.flag});
                break;
        }
    }
    publish_all(out);
}

// ─── Internals ───────────────────────────────────────────────────────────────

Status ViewLifecycleManager::start_surface(TabId tab, Entry& e, Pending& out)
{
    HostSurfaceId id = INVALID_HOST_SURFACE;
    Status        st = host_.create_surface(e.window, e.url, id);
    if (!st)
    {
        TABWEAVE_LOG_WARN("view", "tab {}: host refused surface: {}", tab, st.to_string());
        e.needs_recreate = true;
        SurfaceCreateFailed failed;
        failed.tab_id    = tab;
        failed.window_id = e.window;
        failed.code      = st.code;
        failed.message   = st.message;
        out.emplace_back(std::move(failed));
        return st;
    }

    e.handle        = SurfaceHandle(id);
    by_surface_[id] = tab;
    apply_geometry(e);
    TABWEAVE_LOG_DEBUG("view",
                       "tab {}: surface {} requested in window {} ({})",
                       tab,
                       id,
                       e.window,
                       surface_state_name(e.state));
    return Status::success();
}

void ViewLifecycleManager::release_surface(TabId tab, Entry& e, bool frozen, Pending& out)
{
    const bool had_surface = e.handle.valid();
    if (!frozen)
        e.state = SurfaceState::Destroying;

    if (had_surface)
    {
        by_surface_.erase(e.handle.id_);
        Status st = host_.destroy_surface(e.handle.id_);
        if (!st)
            TABWEAVE_LOG_DEBUG("view", "tab {}: teardown: {}", tab, st.to_string());
        e.handle = SurfaceHandle{};
    }

    if (frozen)
    {
        e.state = SurfaceState::Frozen;
    }
    else
    {
        e.state = SurfaceState::Destroyed;
        drop_from_order(e.window, tab);
    }
    out.emplace_back(SurfaceDestroyed{tab, e.window, frozen});
}

void ViewLifecycleManager::apply_geometry(Entry& e)
{
    if (!e.handle.valid())
        return;
    if (e.bounds)
    {
        if (Status st = host_.set_bounds(e.handle.id_, *e.bounds); !st)
            TABWEAVE_LOG_DEBUG("view", "set_bounds: {}", st.to_string());
    }
    const bool show = e.visible && !e.hide_until_loaded;
    if (Status st = host_.set_visible(e.handle.id_, show); !st)
        TABWEAVE_LOG_DEBUG("view", "set_visible: {}", st.to_string());
}

void ViewLifecycleManager::reveal(Entry& e)
{
    if (!e.hide_until_loaded)
        return;
    e.hide_until_loaded = false;
    apply_geometry(e);
}

void ViewLifecycleManager::cancel_destroy_timer(Entry& e)
{
    if (e.destroy_timer == Scheduler::INVALID_TIMER)
        return;
    scheduler_.cancel(e.destroy_timer);
    e.destroy_timer = Scheduler::INVALID_TIMER;
}

void ViewLifecycleManager::raise_in_order(WindowId window, TabId tab, bool front)
{
    auto& order = z_orders_[window];
    order.erase(std::remove(order.begin(), order.end(), tab), order.end());
    if (front)
        order.push_back(tab);
    else
        order.insert(order.begin(), tab);
}

void ViewLifecycleManager::drop_from_order(WindowId window, TabId tab)
{
    auto it = z_orders_.find(window);
    if (it == z_orders_.end())
        return;
    auto& order = it->second;
    order.erase(std::remove(order.begin(), order.end(), tab), order.end());
}

Status ViewLifecycleManager::require_live(TabId tab, const Entry* e, const char* op) const
{
    if (!e || !e->handle.valid()
        || (e->state != SurfaceState::Live && e->state != SurfaceState::Creating))
    {
        return Status::error(ErrorCode::NoSuchSurface,
                             std::string(op) + ": tab " + std::to_string(tab) + " has no live surface ("
                                 + surface_state_name(e ? e->state : SurfaceState::Uninitialized) + ")");
    }
    return Status::success();
}

ViewLifecycleManager::Entry* ViewLifecycleManager::find(TabId tab)
{
    auto it = entries_.find(tab);
    return it == entries_.end() ? nullptr : &it->second;
}

const ViewLifecycleManager::Entry* ViewLifecycleManager::find(TabId tab) const
{
    auto it = entries_.find(tab);
    return it == entries_.end() ? nullptr : &it->second;
}

void ViewLifecycleManager::publish_all(const Pending& events)
{
    for (const auto& ev : events)
        bus_.publish(ev);
}

}   // namespace tabweave
