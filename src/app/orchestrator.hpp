#pragma once

#include "bus/event_bus.hpp"
#include "config/orchestrator_config.hpp"
#include "core/scheduler.hpp"
#include "focus/focus_coordinator.hpp"
#include "host/surface_host.hpp"
#include "snapshot/snapshot_service.hpp"
#include "state/state_synchronizer.hpp"
#include "transfer/tab_transfer.hpp"
#include "view/view_lifecycle_manager.hpp"

#include <tabweave/commands.hpp>
#include <tabweave/fwd.hpp>
#include <tabweave/status.hpp>
#include <tabweave/tab_state.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace tabweave
{

// Event channel towards the UI: one push per window change.
struct WindowStateChanged
{
    WindowId       window_id = INVALID_WINDOW;
    WindowSnapshot snapshot;
};

// Owns and wires every service of the subsystem.  The host and clock are
// borrowed and must outlive the orchestrator.
//
// All work happens on the thread calling tick(): host completions, timers,
// and window closes requested from bus handlers.  dispatch() may be called
// from any thread.
class Orchestrator
{
   public:
    using StateListener  = std::function<void(const WindowStateChanged&)>;
    using ClosedListener = std::function<void(WindowId)>;

    Orchestrator(SurfaceHost& host, const Clock& clock, OrchestratorConfig config = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&)            = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // InvalidArgument for INVALID_WINDOW; success if already open.
    Status open_window(WindowId window);
    // Destroys every tab of the window and forgets it.  No-op when unknown.
    void close_window(WindowId window);
    bool has_window(WindowId window) const;
    std::vector<WindowId> windows() const;

    CommandResult dispatch(const Command& command);

    void set_state_listener(StateListener listener);
    void set_window_closed_listener(ClosedListener listener);

    // Pumps the host, fires due timers, then handles window closes and
    // new-tab requests queued by bus handlers.  Returns the amount of work
    // done; 0 means the caller may sleep until next_wakeup().
    size_t tick();

    // Time until the next timer is due, clamped at zero.  nullopt: no timer.
    std::optional<std::chrono::milliseconds> next_wakeup() const;

    EventBus&               bus() { return bus_; }
    Scheduler&              scheduler() { return scheduler_; }
    ViewLifecycleManager&   views() { return views_; }
    StateSynchronizer&      state() { return state_; }
    SnapshotService&        snapshots() { return snapshots_; }
    TabTransferCoordinator& transfers() { return transfers_; }
    FocusCoordinator&       focus() { return focus_; }

    const OrchestratorConfig& config() const { return config_; }

   private:
    void on_state(const WindowSnapshot& snap);
    void on_window_marked(const WindowMarkedForClosure& e);
    void on_open_url(const OpenUrlRequested& e);
    void open_requested_tab(const OpenUrlRequested& e);

    SurfaceHost&       host_;
    OrchestratorConfig config_;

    EventBus               bus_;
    Scheduler              scheduler_;
    ViewLifecycleManager   views_;
    StateSynchronizer      state_;
    SnapshotService        snapshots_;
    TabTransferCoordinator transfers_;
    FocusCoordinator       focus_;

    mutable std::mutex                mu_;
    std::set<WindowId>                windows_;
    std::vector<WindowId>             pending_closes_;
    std::vector<OpenUrlRequested>     pending_opens_;
    StateListener                     state_listener_;
    ClosedListener                    closed_listener_;

    StateSynchronizer::ListenerId       state_sub_ = 0;
    std::vector<EventBus::Unsubscriber> subs_;
};

}   // namespace tabweave
