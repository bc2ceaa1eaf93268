#pragma once

#include <tabweave/fwd.hpp>
#include <tabweave/status.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace tabweave
{

// ─── Command channel (UI → orchestrator) ─────────────────────────────────────

struct CreateTab
{
    WindowId    window_id = INVALID_WINDOW;
    std::string url;                  // empty: configured default url
    bool        activate = true;
    std::optional<uint32_t> position; // default: end of the tab strip
};

struct CloseTab
{
    TabId tab_id = INVALID_TAB;
};

struct SwitchActiveTab
{
    WindowId window_id = INVALID_WINDOW;
    TabId    tab_id    = INVALID_TAB;
};

struct ReorderTab
{
    TabId    tab_id = INVALID_TAB;
    uint32_t index  = 0;
};

struct Navigate
{
    TabId       tab_id = INVALID_TAB;
    std::string url;
};

enum class NavAction : uint8_t
{
    Back    = 1,
    Forward = 2,
    Reload  = 3,
    Stop    = 4,
};

struct NavigationAction
{
    TabId     tab_id = INVALID_TAB;
    NavAction action = NavAction::Reload;
};

struct SetBounds
{
    TabId tab_id = INVALID_TAB;
    Rect  rect;
};

struct TransferTab
{
    TabId    tab_id           = INVALID_TAB;
    WindowId target_window_id = INVALID_WINDOW;
    std::optional<uint32_t> target_position;
};

struct RequestFocus
{
    TabId tab_id = INVALID_TAB;
};

using Command = std::variant<CreateTab,
                             CloseTab,
                             SwitchActiveTab,
                             ReorderTab,
                             Navigate,
                             NavigationAction,
                             SetBounds,
                             TransferTab,
                             RequestFocus>;

const char* command_name(const Command& cmd);

// Outcome of a dispatched command.  tab_id is set by CreateTab.
struct CommandResult
{
    Status status;
    TabId  tab_id = INVALID_TAB;

    bool ok() const { return status.ok(); }
};

}   // namespace tabweave
