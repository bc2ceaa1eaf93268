#pragma once

#include "bus/event_bus.hpp"

#include <tabweave/commands.hpp>
#include <tabweave/fwd.hpp>
#include <tabweave/status.hpp>
#include <tabweave/tab_state.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tabweave
{

struct StateSynchronizerConfig
{
    // Used by CreateTab when no url is given.
    std::string default_url = "about:blank";
};

// Canonical tab model: one WindowSurfaceSet plus its TabRecords per window.
//
// apply_command() is the only way in for external mutations.  Commands on
// the same window are serialized by a per-window command mutex; commands on
// different windows run concurrently.  Bus events from the lifecycle manager
// and the snapshot service are folded into the records under the per-window
// state mutex, and every change pushes a full WindowSnapshot to the
// window's listeners.
//
// Listeners and bus handlers run with no synchronizer lock held, but a
// listener must not call apply_command() for the window it is notified
// about (the command mutex may be held by the caller).
class StateSynchronizer
{
    struct WindowSlot;

   public:
    using Listener   = std::function<void(const WindowSnapshot&)>;
    using ListenerId = uint64_t;

    // Exclusive hold on the command stream of two windows (or one, when
    // both ids are equal).  Acquired in window-id order, so two transfers in
    // opposite directions cannot deadlock.
    class WindowPairLock
    {
       public:
        WindowPairLock(WindowPairLock&&)            = default;
        WindowPairLock& operator=(WindowPairLock&&) = default;

        WindowId first() const { return first_; }
        WindowId second() const { return second_; }

       private:
        friend class StateSynchronizer;
        WindowPairLock() = default;

        WindowId                     first_  = INVALID_WINDOW;
        WindowId                     second_ = INVALID_WINDOW;
        std::shared_ptr<WindowSlot>  slot_a_;
        std::shared_ptr<WindowSlot>  slot_b_;
        std::unique_lock<std::mutex> lock_a_;
        std::unique_lock<std::mutex> lock_b_;
    };

    // Everything commit_transfer() needs, captured by prepare_transfer().
    struct TransferTicket
    {
        TabId    tab_id        = INVALID_TAB;
        WindowId source        = INVALID_WINDOW;
        WindowId target        = INVALID_WINDOW;
        size_t   source_index  = 0;
        bool     was_active    = false;
    };

    struct TransferOutcome
    {
        TabId previous_target_active = INVALID_TAB;
        TabId new_source_active      = INVALID_TAB;
        bool  source_emptied         = false;
    };

    StateSynchronizer(ViewLifecycleManager& views, EventBus& bus, StateSynchronizerConfig config = {});
    ~StateSynchronizer();

    StateSynchronizer(const StateSynchronizer&)            = delete;
    StateSynchronizer& operator=(const StateSynchronizer&) = delete;

    // ─── Reads (never block on I/O) ──────────────────────────────────────
    std::optional<WindowSnapshot> get_state(WindowId window) const;
    std::optional<TabRecord>      tab(TabId tab) const;
    WindowId                      window_of(TabId tab) const;
    std::vector<WindowId>         window_ids() const;
    size_t                        tab_count() const;

    // ─── Push listeners ──────────────────────────────────────────────────
    ListenerId subscribe(WindowId window, Listener listener);
    // Every window's pushes.
    ListenerId subscribe_all(Listener listener);
    // Idempotent.
    void unsubscribe(ListenerId id);

    // ─── Commands ────────────────────────────────────────────────────────
    // TransferTab and RequestFocus are not handled here (Unsupported); the
    // orchestrator routes them to their coordinators.
    CommandResult apply_command(const Command& command);

    // ─── Transfer support ────────────────────────────────────────────────
    WindowPairLock lock_pair(WindowId a, WindowId b);
    // Validates without mutating.  NotFound when the tab is not (or no
    // longer) in `source`, InvalidWindow when `target` is unknown or closing.
    Status prepare_transfer(const WindowPairLock& lock,
                            TabId                 tab,
                            WindowId              source,
                            WindowId              target,
                            TransferTicket&       out);
    // Moves the record in one step; cannot fail.  Pushes both windows.
    TransferOutcome commit_transfer(WindowPairLock&         lock,
                                    const TransferTicket&   ticket,
                                    std::optional<uint32_t> position);

    // ─── Window teardown ─────────────────────────────────────────────────
    void mark_window_closing(WindowId window);
    // Drops the set and all its records, publishing TabClosed for each tab.
    // Listeners get a final snapshot with an empty, closing set.
    void remove_window(WindowId window);

   private:
    struct WindowSlot
    {
        WindowId           window_id = INVALID_WINDOW;
        std::mutex         command_mu;
        mutable std::mutex mu;
        WindowSurfaceSet   set;
        std::unordered_map<TabId, TabRecord> tabs;
        uint64_t           revision = 0;
        bool               removed  = false;
    };
    using SlotPtr = std::shared_ptr<WindowSlot>;

    struct ListenerEntry
    {
        WindowId window = INVALID_WINDOW;   // INVALID_WINDOW: all windows
        Listener fn;
    };

    CommandResult create_tab(const CreateTab& cmd);
    CommandResult close_tab(const CloseTab& cmd);
    CommandResult switch_tab(const SwitchActiveTab& cmd);
    CommandResult reorder_tab(const ReorderTab& cmd);
    CommandResult navigate(const Navigate& cmd);
    CommandResult navigation_action(const NavigationAction& cmd);
    CommandResult set_bounds(const SetBounds& cmd);

    SlotPtr find_slot(WindowId window) const;
    SlotPtr get_or_create_slot(WindowId window);
    void    erase_slot(WindowId window, const SlotPtr& slot);
    void    drop_if_unused(WindowId window, const SlotPtr& slot);

    // Locks the command mutex of the window currently owning `tab`.  Retries
    // if a transfer moved the tab while waiting.  Null slot: unknown tab.
    SlotPtr lock_tab_window(TabId tab, std::unique_lock<std::mutex>& lock);

    // Callers hold slot.mu.
    WindowSnapshot snapshot_locked(const WindowSlot& slot) const;

    // Applies `fn` to the record under the state lock and pushes.
    template <typename Fn>
    void update_tab(TabId tab, Fn&& fn);

    void notify(const WindowSnapshot& snap);
    void subscribe_bus();

    ViewLifecycleManager&   views_;
    EventBus&               bus_;
    StateSynchronizerConfig config_;

    mutable std::mutex                                 windows_mu_;
    std::unordered_map<WindowId, SlotPtr>              windows_;
    std::unordered_map<TabId, WindowId>                tab_index_;

    mutable std::mutex                                 listeners_mu_;
    std::unordered_map<ListenerId, ListenerEntry>      listeners_;
    ListenerId                                         next_listener_ = 1;

    std::atomic<TabId>                                 next_tab_id_{1};
    std::vector<EventBus::Unsubscriber>                bus_subs_;
};

}   // namespace tabweave
