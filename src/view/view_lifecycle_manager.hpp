#pragma once

#include "bus/events.hpp"
#include "core/scheduler.hpp"
#include "host/surface_host.hpp"

#include <tabweave/fwd.hpp>
#include <tabweave/status.hpp>
#include <tabweave/tab_state.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tabweave
{

// Opaque reference to a host surface.  Only ViewLifecycleManager can read
// the id inside; everyone else addresses surfaces by TabId.
class SurfaceHandle
{
   public:
    SurfaceHandle() = default;

    bool valid() const { return id_ != INVALID_HOST_SURFACE; }

    bool operator==(const SurfaceHandle&) const = default;

   private:
    friend class ViewLifecycleManager;
    explicit SurfaceHandle(HostSurfaceId id) : id_(id) {}

    HostSurfaceId id_ = INVALID_HOST_SURFACE;
};

struct ViewLifecycleConfig
{
    std::chrono::milliseconds destroy_debounce{50};
};

// Owns every native surface and its per-tab state machine:
//
//   Uninitialized -> Creating -> Live -> (Freezing -> Frozen -> Unfreezing -> Live)*
//   any -> Destroying -> Destroyed
//
// create_surface() is idempotent and cancels a pending debounced destroy, so
// a spurious unmount/mount pair from the UI never tears a surface down.
// Desired bounds and visibility are remembered while no surface exists and
// applied once one does.  A surface recreated by an unfreeze stays hidden
// until its first load completes.
//
// An entry is dropped once its surface is fully destroyed; state() then
// reports Destroyed for any tab id at or below the highest one ever mounted
// and Uninitialized above it.  Frozen tabs keep their entry.
//
// Host completions are turned into bus events (SurfaceCreated, LoadFinished,
// ...).  Events are published after the internal lock is released, in host
// completion order.
//
// Thread-safe: all public methods lock the internal mutex.
class ViewLifecycleManager
{
   public:
    using CaptureCallback = SurfaceHost::CaptureCallback;

    ViewLifecycleManager(SurfaceHost&        host,
                         EventBus&           bus,
                         Scheduler&          scheduler,
                         ViewLifecycleConfig config = {});
    ~ViewLifecycleManager();

    ViewLifecycleManager(const ViewLifecycleManager&)            = delete;
    ViewLifecycleManager& operator=(const ViewLifecycleManager&) = delete;

    // ─── Windows ─────────────────────────────────────────────────────────
    Status register_window(WindowId window);
    // Destroys every surface in the window without debounce.
    void unregister_window(WindowId window);
    bool has_window(WindowId window) const;

    // ─── Lifecycle ───────────────────────────────────────────────────────
    Status create_surface(WindowId window, TabId tab, const std::string& url);
    // Debounced; idempotent.  A Freezing tab is released at once and ends Frozen.
    void destroy_surface(TabId tab);
    void destroy_surface_now(TabId tab);
    bool destroy_pending(TabId tab) const;

    // ─── Geometry and stacking ───────────────────────────────────────────
    void set_bounds(TabId tab, const Rect& rect);
    void set_visible(TabId tab, bool visible);
    void bring_to_front(TabId tab);
    void send_to_back(TabId tab);
    // Back to front.
    std::vector<TabId> z_order(WindowId window) const;

    // ─── Content ─────────────────────────────────────────────────────────
    Status navigate(TabId tab, const std::string& url);
    Status go_back(TabId tab);
    Status go_forward(TabId tab);
    // Recreates the surface when the previous one crashed or failed to start.
    Status reload(TabId tab);
    Status stop(TabId tab);
    Status focus(TabId tab);
    Status capture(TabId tab, CaptureCallback done);

    // Moves the tab's surface to `target`, in place when the host can and
    // by recreating it at the same url otherwise.  On failure the surface is
    // left where it was.
    Status reparent(TabId tab, WindowId target);

    // ─── Freeze protocol ─────────────────────────────────────────────────
    Status begin_freeze(TabId tab);
    void   cancel_freeze(TabId tab);

    // ─── Queries ─────────────────────────────────────────────────────────
    SurfaceState                 state(TabId tab) const;
    bool                         has_surface(TabId tab) const;
    std::optional<SurfaceHandle> handle(TabId tab) const;
    WindowId                     window_of(TabId tab) const;
    std::string                  url_of(TabId tab) const;
    std::optional<Rect>          bounds(TabId tab) const;
    bool                         desired_visible(TabId tab) const;
    size_t                       live_count() const;
    std::vector<TabId>           tabs_with_surface() const;
    // Tabs with a retained entry (live, pending, frozen or failed).
    size_t                       entry_count() const;

    // Host-level id behind a tab, for host-side diagnostics and tests.
    HostSurfaceId host_surface(TabId tab) const;

   private:
    struct Entry
    {
        WindowId            window = INVALID_WINDOW;
        std::string         url;
        SurfaceHandle       handle;
        SurfaceState        state = SurfaceState::Uninitialized;
        std::optional<Rect> bounds;
        bool                visible          = false;
        bool                hide_until_loaded = false;
        bool                needs_recreate    = false;
        Scheduler::TimerId  destroy_timer     = Scheduler::INVALID_TIMER;
        uint64_t            destroy_generation = 0;
    };

    using Pending = std::vector<Event>;

    void on_host_event(const HostEvent& ev);
    void on_destroy_timer(TabId tab, uint64_t generation);

    // Callers hold mu_.
    Status start_surface(TabId tab, Entry& e, Pending& out);
    void   release_surface(TabId tab, Entry& e, bool frozen, Pending& out);
    void   apply_geometry(Entry& e);
    void   reveal(Entry& e);
    void   cancel_destroy_timer(Entry& e);
    void   raise_in_order(WindowId window, TabId tab, bool front);
    void   drop_from_order(WindowId window, TabId tab);
    Status require_live(TabId tab, const Entry* e, const char* op) const;
    Entry* find(TabId tab);
    const Entry* find(TabId tab) const;

    void publish_all(const Pending& events);

    SurfaceHost&        host_;
    EventBus&           bus_;
    Scheduler&          scheduler_;
    ViewLifecycleConfig config_;

    mutable std::mutex                                   mu_;
    std::unordered_set<WindowId>                         windows_;
    std::unordered_map<TabId, Entry>                     entries_;
    std::unordered_map<HostSurfaceId, TabId>             by_surface_;
    std::unordered_map<WindowId, std::vector<TabId>>     z_orders_;
    TabId                                                highest_tab_ = INVALID_TAB;
};

}   // namespace tabweave
