#pragma once

#include <tabweave/fwd.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tabweave
{

// Surface-level lifecycle of a tab, as driven by the ViewLifecycleManager.
enum class SurfaceState : uint8_t
{
    Uninitialized = 0,
    Creating      = 1,
    Live          = 2,
    Freezing      = 3,
    Frozen        = 4,
    Unfreezing    = 5,
    Destroying    = 6,
    Destroyed     = 7,
};

const char* surface_state_name(SurfaceState state);

// What the UI should draw for a tab: the live surface or its snapshot.
enum class DisplayMode : uint8_t
{
    Live   = 0,
    Frozen = 1,
};

// Reference to a stored SnapshotImage.  Present on a TabRecord only while
// the tab is frozen.
struct SnapshotRef
{
    TabId    tab_id      = INVALID_TAB;
    uint64_t generation  = 0;
    bool     placeholder = false;

    bool operator==(const SnapshotRef&) const = default;
};

struct TabRecord
{
    TabId       tab_id    = INVALID_TAB;
    WindowId    window_id = INVALID_WINDOW;
    std::string url;
    std::string title;
    std::string favicon_url;
    bool        can_go_back    = false;
    bool        can_go_forward = false;
    bool        is_loading     = false;
    SurfaceState               lifecycle    = SurfaceState::Uninitialized;
    DisplayMode                display_mode = DisplayMode::Live;
    std::optional<SnapshotRef> snapshot;
    // Inline error shown instead of the surface (failed create, failed load,
    // crashed renderer).  Empty when the tab is healthy.
    std::string error;
    std::chrono::steady_clock::time_point last_accessed{};
};

// Per-window ordering and activation.  active_tab_id is INVALID_TAB or a
// member of tab_ids.
struct WindowSurfaceSet
{
    WindowId           window_id     = INVALID_WINDOW;
    std::vector<TabId> tab_ids;
    TabId              active_tab_id = INVALID_TAB;
    // Set when a transfer emptied the window; the orchestrator closes it.
    bool closing = false;
};

// Full, self-contained view of one window, pushed to the UI on every change.
struct WindowSnapshot
{
    WindowSurfaceSet       set;
    std::vector<TabRecord> tabs;   // in set.tab_ids order
    uint64_t               revision = 0;

    const TabRecord* find_tab(TabId id) const
    {
        for (const auto& t : tabs)
        {
            if (t.tab_id == id)
                return &t;
        }
        return nullptr;
    }

    const TabRecord* active_tab() const { return find_tab(set.active_tab_id); }
};

}   // namespace tabweave
