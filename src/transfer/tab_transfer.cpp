#include "tab_transfer.hpp"

#include "bus/event_bus.hpp"
#include "state/state_synchronizer.hpp"
#include "view/view_lifecycle_manager.hpp"

#include <tabweave/logger.hpp>

#include <limits>

namespace tabweave
{

namespace
{

Status failed(TabId tab, const Status& cause)
{
    TABWEAVE_LOG_WARN("transfer", "tab {}: transfer rolled back: {}", tab, cause.to_string());
    return Status::transfer_failed(cause);
}

}   // namespace

TabTransferCoordinator::TabTransferCoordinator(StateSynchronizer&    state,
                                               ViewLifecycleManager& views,
                                               EventBus&             bus)
    : state_(state), views_(views), bus_(bus)
{
}

Status TabTransferCoordinator::transfer_tab(const TransferTab& cmd)
{
    const WindowId source = state_.window_of(cmd.tab_id);
    if (source == INVALID_WINDOW)
    {
        return failed(cmd.tab_id,
                      Status::error(ErrorCode::NotFound, "tab " + std::to_string(cmd.tab_id) + " is unknown"));
    }
    return transfer_tab(cmd.tab_id, source, cmd.target_window_id, cmd.target_position);
}

Status TabTransferCoordinator::transfer_tab(TabId                   tab,
                                            WindowId                source,
                                            WindowId                target,
                                            std::optional<uint32_t> position)
{
    if (source == target)
    {
        ReorderTab reorder{tab, position.value_or(std::numeric_limits<uint32_t>::max())};
        CommandResult r = state_.apply_command(reorder);
        return r.ok() ? Status::success() : failed(tab, r.status);
    }

    StateSynchronizer::TransferOutcome outcome;
    {
        auto pair = state_.lock_pair(source, target);

        StateSynchronizer::TransferTicket ticket;
        if (Status st = state_.prepare_transfer(pair, tab, source, target, ticket); !st)
            return failed(tab, st);

        // The only step that can fail; nothing has changed yet if it does
        if (Status st = views_.reparent(tab, target); !st)
            return failed(tab, st);

        outcome = state_.commit_transfer(pair, ticket, position);
    }

    if (outcome.previous_target_active != INVALID_TAB)
        views_.set_visible(outcome.previous_target_active, false);
    views_.set_visible(tab, true);
    views_.bring_to_front(tab);
    if (outcome.new_source_active != INVALID_TAB)
    {
        views_.set_visible(outcome.new_source_active, true);
        views_.bring_to_front(outcome.new_source_active);
    }

    bus_.publish(TabActivated{target, tab, outcome.previous_target_active});
    if (outcome.new_source_active != INVALID_TAB)
        bus_.publish(TabActivated{source, outcome.new_source_active, INVALID_TAB});
    if (outcome.source_emptied)
    {
        TABWEAVE_LOG_INFO("transfer", "window {} emptied, marked for closure", source);
        bus_.publish(WindowMarkedForClosure{source});
    }
    return Status::success();
}

}   // namespace tabweave
