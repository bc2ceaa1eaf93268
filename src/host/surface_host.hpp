#pragma once

#include <tabweave/fwd.hpp>
#include <tabweave/status.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tabweave
{

// Host-side surface id.  Only the ViewLifecycleManager and the host itself
// ever see these; everything above the lifecycle manager talks in TabIds.
using HostSurfaceId = uint64_t;

static constexpr HostSurfaceId INVALID_HOST_SURFACE = 0;

// Load error code the host reports when a navigation was superseded by another.
static constexpr int32_t LOAD_ERROR_ABORTED = -3;

// Pixel data returned by SurfaceHost::capture().  RGBA8, row-major.
struct CapturedImage
{
    std::vector<uint8_t> rgba;
    uint32_t             width  = 0;
    uint32_t             height = 0;
};

// Asynchronous completion reported by the host.  Which fields are meaningful
// depends on `kind`.
struct HostEvent
{
    enum class Kind : uint8_t
    {
        Created,            // surface is usable
        CreateFailed,       // code, text = reason
        LoadStarted,
        LoadFinished,       // url, text = title
        LoadFailed,         // code, text = description, url
        Navigated,          // url, flag = in-page
        TitleChanged,       // text
        FaviconChanged,     // url
        NavFlagsChanged,    // flag = can_go_back, flag2 = can_go_forward
        Crashed,            // text = reason
        OpenUrlRequested,   // url, flag = background
    };

    Kind          kind    = Kind::Created;
    HostSurfaceId surface = INVALID_HOST_SURFACE;
    std::string   url;
    std::string   text;
    int32_t       code  = 0;
    bool          flag  = false;
    bool          flag2 = false;
};

const char* host_event_kind_name(HostEvent::Kind kind);

// The platform that actually renders web content.  Every call returns
// immediately; results that take time (creation, loads, captures) come back
// later through the event sink or the capture callback, and only from inside
// pump().
//
// Implementations: HeadlessHost (simulation, fault injection) and GlfwHost.
class SurfaceHost
{
   public:
    using EventSink = std::function<void(const HostEvent&)>;
    // nullopt when the capture failed.
    using CaptureCallback = std::function<void(std::optional<CapturedImage>)>;

    virtual ~SurfaceHost() = default;

    virtual const char* name() const = 0;

    virtual void set_event_sink(EventSink sink) = 0;

    // ─── Windows ─────────────────────────────────────────────────────────
    virtual Status attach_window(WindowId window)    = 0;
    virtual void   detach_window(WindowId window)    = 0;
    virtual bool   has_window(WindowId window) const = 0;

    // ─── Surfaces ────────────────────────────────────────────────────────
    // On success `out` holds the new id and a Created (or CreateFailed)
    // event follows.  A synchronous ResourceExhausted means no id was used.
    virtual Status create_surface(WindowId window, const std::string& url, HostSurfaceId& out) = 0;

    // Also cancels a creation that has not completed yet.
    virtual Status destroy_surface(HostSurfaceId surface) = 0;

    virtual Status set_bounds(HostSurfaceId surface, const Rect& rect) = 0;
    virtual Status set_visible(HostSurfaceId surface, bool visible)    = 0;
    virtual Status raise(HostSurfaceId surface)                        = 0;
    virtual Status lower(HostSurfaceId surface)                        = 0;
    virtual Status focus(HostSurfaceId surface)                        = 0;

    virtual Status load_url(HostSurfaceId surface, const std::string& url) = 0;
    virtual Status go_back(HostSurfaceId surface)                          = 0;
    virtual Status go_forward(HostSurfaceId surface)                       = 0;
    virtual Status reload(HostSurfaceId surface)                           = 0;
    virtual Status stop(HostSurfaceId surface)                             = 0;

    virtual Status capture(HostSurfaceId surface, CaptureCallback done) = 0;

    // Move a live surface to another window without reloading it.  Hosts
    // that cannot do this return Unsupported and the caller recreates.
    virtual Status reparent(HostSurfaceId surface, WindowId window) = 0;

    // Delivers queued completions.  Returns how many were delivered.
    virtual size_t pump() = 0;
};

}   // namespace tabweave
