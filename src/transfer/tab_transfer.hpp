#pragma once

#include <tabweave/commands.hpp>
#include <tabweave/fwd.hpp>
#include <tabweave/status.hpp>

#include <cstdint>
#include <optional>

namespace tabweave
{

// Moves a tab (record and, when it has one, its live surface) between
// windows as one step.
//
// Both windows' command streams are held for the whole operation.  The
// surface is re-parented before any state changes, and the state is then
// moved in a single commit, so a failure at any point leaves the tab exactly
// where it was and nothing partial is ever pushed to the UI.  Failures come
// back as TransferFailed with the original error in Status::cause.
//
// A source window left without tabs is marked closing and announced with
// WindowMarkedForClosure; the orchestrator closes it on its next tick.
class TabTransferCoordinator
{
   public:
    TabTransferCoordinator(StateSynchronizer& state, ViewLifecycleManager& views, EventBus& bus);

    Status transfer_tab(TabId                   tab,
                        WindowId                source,
                        WindowId                target,
                        std::optional<uint32_t> position = std::nullopt);

    // Source is the tab's current window.
    Status transfer_tab(const TransferTab& cmd);

   private:
    StateSynchronizer&    state_;
    ViewLifecycleManager& views_;
    EventBus&             bus_;
};

}   // namespace tabweave
