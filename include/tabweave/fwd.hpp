#pragma once

#include <cstdint>

namespace tabweave
{

using WindowId = uint64_t;
using TabId    = uint64_t;

static constexpr WindowId INVALID_WINDOW = 0;
static constexpr TabId    INVALID_TAB    = 0;

// Position and size of a surface in its window's content coordinates.
struct Rect
{
    int32_t x      = 0;
    int32_t y      = 0;
    int32_t width  = 0;
    int32_t height = 0;

    bool valid() const { return width > 0 && height > 0; }

    bool operator==(const Rect&) const = default;
};

class EventBus;
class Scheduler;
class SurfaceHost;
class ViewLifecycleManager;
class StateSynchronizer;
class SnapshotService;
class TabTransferCoordinator;
class FocusCoordinator;
class Orchestrator;

}   // namespace tabweave
