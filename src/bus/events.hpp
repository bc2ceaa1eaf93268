#pragma once

#include <tabweave/fwd.hpp>
#include <tabweave/status.hpp>
#include <tabweave/tab_state.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace tabweave
{

// ─── Surface lifecycle (published by ViewLifecycleManager) ───────────────────

struct SurfaceCreated
{
    TabId    tab_id    = INVALID_TAB;
    WindowId window_id = INVALID_WINDOW;
};

// frozen == true when the surface was released as part of a freeze and the
// tab lives on behind its snapshot.
struct SurfaceDestroyed
{
    TabId    tab_id    = INVALID_TAB;
    WindowId window_id = INVALID_WINDOW;
    bool     frozen    = false;
};

struct SurfaceCreateFailed
{
    TabId     tab_id    = INVALID_TAB;
    WindowId  window_id = INVALID_WINDOW;
    ErrorCode code      = ErrorCode::ResourceExhausted;
    std::string message;
};

struct LoadStarted
{
    TabId tab_id = INVALID_TAB;
};

struct LoadFinished
{
    TabId       tab_id = INVALID_TAB;
    std::string url;
    std::string title;
};

struct LoadFailed
{
    TabId       tab_id     = INVALID_TAB;
    int32_t     error_code = 0;
    std::string description;
    std::string url;
};

struct UrlChanged
{
    TabId       tab_id  = INVALID_TAB;
    std::string url;
    bool        in_page = false;
};

struct NavigationFlagsChanged
{
    TabId tab_id         = INVALID_TAB;
    bool  can_go_back    = false;
    bool  can_go_forward = false;
};

struct TitleChanged
{
    TabId       tab_id = INVALID_TAB;
    std::string title;
};

struct FaviconChanged
{
    TabId       tab_id = INVALID_TAB;
    std::string favicon_url;
};

struct SurfaceCrashed
{
    TabId       tab_id = INVALID_TAB;
    std::string reason;
};

// A page asked for a new window (target=_blank, window.open).
struct OpenUrlRequested
{
    TabId       tab_id     = INVALID_TAB;
    WindowId    window_id  = INVALID_WINDOW;
    std::string url;
    bool        background = false;
};

// ─── Tab state (published by StateSynchronizer) ──────────────────────────────

struct TabActivated
{
    WindowId window_id = INVALID_WINDOW;
    TabId    tab_id    = INVALID_TAB;
    TabId    previous  = INVALID_TAB;
};

struct TabClosed
{
    WindowId window_id = INVALID_WINDOW;
    TabId    tab_id    = INVALID_TAB;
};

struct WindowMarkedForClosure
{
    WindowId window_id = INVALID_WINDOW;
};

// ─── Freeze protocol (published by SnapshotService) ──────────────────────────

struct SurfaceHidden
{
    TabId tab_id = INVALID_TAB;
};

struct SurfaceNeeded
{
    TabId tab_id = INVALID_TAB;
};

struct DisplayModeChanged
{
    TabId                      tab_id = INVALID_TAB;
    DisplayMode                mode   = DisplayMode::Live;
    std::optional<SnapshotRef> snapshot;
};

// ─── Focus (published by FocusCoordinator) ───────────────────────────────────

struct FocusChanged
{
    WindowId window_id = INVALID_WINDOW;
    TabId    tab_id    = INVALID_TAB;
};

using Event = std::variant<SurfaceCreated,
                           SurfaceDestroyed,
                           SurfaceCreateFailed,
                           LoadStarted,
                           LoadFinished,
                           LoadFailed,
                           UrlChanged,
                           NavigationFlagsChanged,
                           TitleChanged,
                           FaviconChanged,
                           SurfaceCrashed,
                           OpenUrlRequested,
                           TabActivated,
                           TabClosed,
                           WindowMarkedForClosure,
                           SurfaceHidden,
                           SurfaceNeeded,
                           DisplayModeChanged,
                           FocusChanged>;

// Topic of an event: the index of its alternative in Event.
using EventType = size_t;

static constexpr size_t EVENT_TYPE_COUNT = std::variant_size_v<Event>;

namespace detail
{
template <typename E, typename V>
struct event_index;

template <typename E, typename... Ts>
struct event_index<E, std::variant<Ts...>>
{
    static constexpr size_t value = []
    {
        constexpr bool matches[] = {std::is_same_v<E, Ts>...};
        for (size_t i = 0; i < sizeof...(Ts); ++i)
        {
            if (matches[i])
                return i;
        }
        return sizeof...(Ts);
    }();
    static_assert(value < sizeof...(Ts), "type is not an Event alternative");
};
}   // namespace detail

template <typename E>
inline constexpr EventType event_type_of = detail::event_index<E, Event>::value;

inline EventType event_type(const Event& ev)
{
    return ev.index();
}

const char* event_name(EventType type);

}   // namespace tabweave
