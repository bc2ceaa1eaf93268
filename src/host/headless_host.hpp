#pragma once

#include "surface_host.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tabweave
{

// In-process stand-in for the rendering host.  Nothing is drawn; surfaces
// are bookkeeping records and every completion is queued until pump(), so a
// test decides exactly when "the host answers".
//
// Fault injection covers the failures the orchestrator must survive: surface
// limits, refused creations, refused re-parenting, failed or stalled
// captures, and completions arriving interleaved across surfaces.
//
// Thread-safe.  The event sink and capture callbacks are invoked from pump()
// without the host lock held.
class HeadlessHost : public SurfaceHost
{
   public:
    struct SurfaceInfo
    {
        WindowId                 window = INVALID_WINDOW;
        std::string              url;
        std::string              title;
        Rect                     bounds;
        bool                     visible = false;
        bool                     created = false;
        bool                     loading = false;
        std::vector<std::string> history;
        size_t                   history_index = 0;
    };

    HeadlessHost() = default;

    HeadlessHost(const HeadlessHost&)            = delete;
    HeadlessHost& operator=(const HeadlessHost&) = delete;

    const char* name() const override { return "headless"; }

    void set_event_sink(EventSink sink) override;

    Status attach_window(WindowId window) override;
    void   detach_window(WindowId window) override;
    bool   has_window(WindowId window) const override;

    Status create_surface(WindowId window, const std::string& url, HostSurfaceId& out) override;
    Status destroy_surface(HostSurfaceId surface) override;

    Status set_bounds(HostSurfaceId surface, const Rect& rect) override;
    Status set_visible(HostSurfaceId surface, bool visible) override;
    Status raise(HostSurfaceId surface) override;
    Status lower(HostSurfaceId surface) override;
    Status focus(HostSurfaceId surface) override;

    Status load_url(HostSurfaceId surface, const std::string& url) override;
    Status go_back(HostSurfaceId surface) override;
    Status go_forward(HostSurfaceId surface) override;
    Status reload(HostSurfaceId surface) override;
    Status stop(HostSurfaceId surface) override;

    Status capture(HostSurfaceId surface, CaptureCallback done) override;
    Status reparent(HostSurfaceId surface, WindowId window) override;

    size_t pump() override;

    // ─── Fault injection ─────────────────────────────────────────────────

    // Maximum number of concurrently existing surfaces; 0 means unlimited.
    void set_surface_limit(size_t limit);

    // The next create_surface() succeeds synchronously but reports
    // CreateFailed from pump().
    void fail_next_create();

    void set_reparent_supported(bool supported);
    void fail_next_reparent();

    void fail_next_capture();

    // While held, capture requests are parked until release_captures().
    void   set_hold_captures(bool hold);
    size_t release_captures();
    size_t held_captures() const;

    // When false, loads stay in progress until complete_load()/fail_load().
    void set_auto_complete_loads(bool enabled);

    // Deliver queued completions grouped by surface, newest surface first.
    // Order within one surface is preserved.
    void set_interleave_reversed(bool reversed);

    // ─── Scripted page activity ──────────────────────────────────────────

    bool complete_load(HostSurfaceId surface, const std::string& title = {});
    bool fail_load(HostSurfaceId surface, int32_t code, const std::string& description);
    bool simulate_crash(HostSurfaceId surface, const std::string& reason);
    bool simulate_title(HostSurfaceId surface, const std::string& title);
    bool simulate_favicon(HostSurfaceId surface, const std::string& favicon_url);
    bool simulate_in_page_navigation(HostSurfaceId surface, const std::string& url);
    bool simulate_open_url(HostSurfaceId surface, const std::string& url, bool background);

    // ─── Inspection ──────────────────────────────────────────────────────

    size_t                     surface_count() const;
    std::optional<SurfaceInfo> info(HostSurfaceId surface) const;
    // Back to front.
    std::vector<HostSurfaceId> surfaces_in(WindowId window) const;
    HostSurfaceId              last_created() const;
    HostSurfaceId              focused() const;
    uint64_t                   create_calls() const;
    uint64_t                   destroy_calls() const;
    size_t                     queued() const;

    // Title the host reports for a url it loaded: its host part.
    static std::string title_for(const std::string& url);

   private:
    struct Pending
    {
        HostEvent                    event;
        CaptureCallback              capture_done;
        std::optional<CapturedImage> image;
        bool                         is_capture = false;
    };

    // Callers hold mu_.
    void    queue(HostEvent ev);
    void    begin_load(HostSurfaceId id, SurfaceInfo& s, const std::string& url, bool push_history);
    void    finish_load(HostSurfaceId id, SurfaceInfo& s, const std::string& title);
    void    queue_flags(HostSurfaceId id, const SurfaceInfo& s);
    void    erase_surface(HostSurfaceId id);
    Status  missing(HostSurfaceId id) const;
    CapturedImage render(HostSurfaceId id, const SurfaceInfo& s) const;

    mutable std::mutex mu_;
    EventSink          sink_;

    std::unordered_map<HostSurfaceId, SurfaceInfo>         surfaces_;
    std::unordered_map<WindowId, std::vector<HostSurfaceId>> windows_;
    std::deque<Pending>                                    queue_;
    std::vector<Pending>                                   held_;

    HostSurfaceId next_id_      = 1;
    HostSurfaceId last_created_ = INVALID_HOST_SURFACE;
    HostSurfaceId focused_      = INVALID_HOST_SURFACE;
    uint64_t      create_calls_  = 0;
    uint64_t      destroy_calls_ = 0;

    size_t surface_limit_       = 0;
    bool   fail_next_create_    = false;
    bool   reparent_supported_  = true;
    bool   fail_next_reparent_  = false;
    bool   fail_next_capture_   = false;
    bool   hold_captures_       = false;
    bool   auto_complete_loads_ = true;
    bool   interleave_reversed_ = false;
};

}   // namespace tabweave
