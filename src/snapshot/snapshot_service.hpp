#pragma once

#include "bus/event_bus.hpp"
#include "core/scheduler.hpp"
#include "host/surface_host.hpp"

#include <tabweave/fwd.hpp>
#include <tabweave/status.hpp>
#include <tabweave/tab_state.hpp>

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tabweave
{

// Last visible content of a frozen tab.  RGBA8.  A placeholder is a uniform
// grey image used when the capture timed out or the full image was evicted.
struct SnapshotImage
{
    TabId                                 tab_id     = INVALID_TAB;
    uint64_t                              generation = 0;
    std::vector<uint8_t>                  rgba;
    uint32_t                              width       = 0;
    uint32_t                              height      = 0;
    std::chrono::steady_clock::time_point captured_at{};
    bool                                  placeholder = false;

    SnapshotRef ref() const { return SnapshotRef{tab_id, generation, placeholder}; }
};

struct SnapshotConfig
{
    bool                      enabled = true;
    std::chrono::milliseconds freeze_grace{3000};
    std::chrono::milliseconds capture_timeout{500};
    size_t                    max_snapshots     = 10;
    size_t                    max_live_surfaces = 5;
};

// Freezes hidden tabs to bound the number of live surfaces.
//
// A tab that stops being active gets SurfaceHidden and a grace timer; if it
// is still hidden when the timer fires it is captured, the UI is switched to
// the snapshot (DisplayModeChanged{Frozen}), and only then is its surface
// destroyed.  Reactivating a frozen tab publishes SurfaceNeeded and recreates
// the surface at the tab's last url; the UI switches back to Live when that
// surface finishes its first load, never earlier.
//
// Beyond the grace timer, live surfaces are capped at max_live_surfaces: the
// least recently activated hidden tab is frozen at once when the cap is
// exceeded.
class SnapshotService
{
   public:
    SnapshotService(ViewLifecycleManager& views,
                    StateSynchronizer&    state,
                    EventBus&             bus,
                    Scheduler&            scheduler,
                    SnapshotConfig        config = {});
    ~SnapshotService();

    SnapshotService(const SnapshotService&)            = delete;
    SnapshotService& operator=(const SnapshotService&) = delete;

    // Skips the grace period.  Fails for the active tab, a tab without a
    // live surface, or an authentication page.
    Status freeze_now(TabId tab);

    bool                         is_frozen(TabId tab) const;
    bool                         is_unfreezing(TabId tab) const;
    bool                         freeze_pending(TabId tab) const;
    bool                         capture_in_flight(TabId tab) const;
    std::optional<SnapshotImage> snapshot(TabId tab) const;
    size_t                       snapshot_count() const;
    // Snapshots still holding real pixels.
    size_t full_snapshot_count() const;

    const SnapshotConfig& config() const { return config_; }

   private:
    struct Capture
    {
        uint64_t           generation = 0;
        Scheduler::TimerId timeout    = Scheduler::INVALID_TIMER;
    };

    void on_tab_activated(const TabActivated& e);
    void on_surface_hidden(const SurfaceHidden& e);
    void on_surface_created(const SurfaceCreated& e);
    void on_unfreeze_settled(TabId tab);
    void on_create_failed(const SurfaceCreateFailed& e);
    void on_tab_closed(const TabClosed& e);

    void arm_grace_timer(TabId tab);
    void on_grace_timer(TabId tab, uint64_t generation);
    void on_capture_done(TabId tab, uint64_t generation, std::optional<CapturedImage> image, bool timed_out);
    void unfreeze(TabId tab);
    void enforce_budget();

    bool is_active_tab(TabId tab) const;

    // Callers hold mu_.  Returns the tab whose snapshot was downgraded.
    std::optional<SnapshotRef> store_locked(SnapshotImage image);
    void                       cancel_timers_locked(TabId tab);

    static SnapshotImage make_placeholder(TabId tab, uint64_t generation);

    ViewLifecycleManager& views_;
    StateSynchronizer&    state_;
    EventBus&             bus_;
    Scheduler&            scheduler_;
    SnapshotConfig        config_;

    mutable std::mutex                                      mu_;
    std::unordered_map<TabId, SnapshotImage>                store_;
    std::list<TabId>                                        full_lru_;   // oldest first
    std::unordered_set<TabId>                               frozen_;
    std::unordered_set<TabId>                               unfreezing_;
    std::unordered_map<TabId, std::pair<uint64_t, Scheduler::TimerId>> grace_;
    std::unordered_map<TabId, Capture>                      captures_;
    std::unordered_map<TabId, uint64_t>                     last_activated_;
    uint64_t                                                activation_clock_ = 0;
    uint64_t                                                next_generation_  = 1;

    std::vector<EventBus::Unsubscriber> subs_;
};

}   // namespace tabweave
