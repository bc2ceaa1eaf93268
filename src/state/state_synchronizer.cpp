#include "state_synchronizer.hpp"

#include "url/url_helpers.hpp"
#include "view/view_lifecycle_manager.hpp"

#include <tabweave/logger.hpp>

#include <algorithm>
#include <chrono>

namespace tabweave
{

namespace
{

CommandResult fail(ErrorCode code, std::string message)
{
    return CommandResult{Status::error(code, std::move(message)), INVALID_TAB};
}

std::string tab_str(TabId tab)
{
    return "tab " + std::to_string(tab);
}

std::string window_str(WindowId window)
{
    return "window " + std::to_string(window);
}

// New active tab after removing the one at `index`: its left neighbour, or
// the new first tab.
TabId neighbour_after_removal(const std::vector<TabId>& ids, size_t index)
{
    if (ids.empty())
        return INVALID_TAB;
    return ids[index > 0 ? std::min(index - 1, ids.size() - 1) : 0];
}

}   // namespace

template <typename Fn>
void StateSynchronizer::update_tab(TabId tab, Fn&& fn)
{
    // A transfer can move the record between the index lookup and the state
    // lock; look again in that case
    for (int attempt = 0; attempt < 3; ++attempt)
    {
        SlotPtr slot = find_slot(window_of(tab));
        if (!slot)
            return;

        const SurfaceState lifecycle = views_.state(tab);
        WindowSnapshot     snap;
        {
            std::lock_guard<std::mutex> lock(slot->mu);
            auto it = slot->tabs.find(tab);
            if (it == slot->tabs.end())
                continue;
            it->second.lifecycle = lifecycle;
            fn(it->second);
            ++slot->revision;
            snap = snapshot_locked(*slot);
        }
        notify(snap);
        return;
    }
}

StateSynchronizer::StateSynchronizer(ViewLifecycleManager&   views,
                                     EventBus&               bus,
                                     StateSynchronizerConfig config)
    : views_(views), bus_(bus), config_(std::move(config))
{
    subscribe_bus();
}

StateSynchronizer::~StateSynchronizer()
{
    for (auto& unsub : bus_subs_)
        unsub();
}

// ─── Reads ───────────────────────────────────────────────────────────────────

std::optional<WindowSnapshot> StateSynchronizer::get_state(WindowId window) const
{
    SlotPtr slot = find_slot(window);
    if (!slot)
        return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mu);
    if (slot->set.tab_ids.empty() && !slot->set.closing)
        return std::nullopt;
    return snapshot_locked(*slot);
}

std::optional<TabRecord> StateSynchronizer::tab(TabId tab) const
{
    SlotPtr slot = find_slot(window_of(tab));
    if (!slot)
        return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mu);
    auto it = slot->tabs.find(tab);
    if (it == slot->tabs.end())
        return std::nullopt;
    return it->second;
}

WindowId StateSynchronizer::window_of(TabId tab) const
{
    std::lock_guard<std::mutex> lock(windows_mu_);
    auto it = tab_index_.find(tab);
    return it == tab_index_.end() ? INVALID_WINDOW : it->second;
}

std::vector<WindowId> StateSynchronizer::window_ids() const
{
    std::vector<SlotPtr> slots;
    {
        std::lock_guard<std::mutex> lock(windows_mu_);
        for (const auto& [id, slot] : windows_)
            slots.push_back(slot);
    }
    std::vector<WindowId> ids;
    for (const auto& slot : slots)
    {
        std::lock_guard<std::mutex> lock(slot->mu);
        if (!slot->set.tab_ids.empty() || slot->set.closing)
            ids.push_back(slot->window_id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t StateSynchronizer::tab_count() const
{
    std::lock_guard<std::mutex> lock(windows_mu_);
    return tab_index_.size();
}

// ─── Listeners ───────────────────────────────────────────────────────────────

StateSynchronizer::ListenerId StateSynchronizer::subscribe(WindowId window, Listener listener)
{
    std::lock_guard<std::mutex> lock(listeners_mu_);
    ListenerId id = next_listener_++;
    listeners_[id] = ListenerEntry{window, std::move(listener)};
    return id;
}

StateSynchronizer::ListenerId StateSynchronizer::subscribe_all(Listener listener)
{
    return subscribe(INVALID_WINDOW, std::move(listener));
}

void StateSynchronizer::unsubscribe(ListenerId id)
{
    std::lock_guard<std::mutex> lock(listeners_mu_);
    listeners_.erase(id);
}

void StateSynchronizer::notify(const WindowSnapshot& snap)
{
    std::vector<Listener> targets;
    {
        std::lock_guard<std::mutex> lock(listeners_mu_);
        for (const auto& [id, entry] : listeners_)
        {
            if (entry.window == INVALID_WINDOW || entry.window == snap.set.window_id)
                targets.push_back(entry.fn);
        }
    }
    for (const auto& fn : targets)
        fn(snap);
}

// ─── Commands ────────────────────────────────────────────────────────────────

CommandResult StateSynchronizer::apply_command(const Command& command)
{
    TABWEAVE_LOG_DEBUG("state", "apply {}", command_name(command));

    return std::visit(
        [this](const auto& cmd) -> CommandResult
        {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, CreateTab>)
                return create_tab(cmd);
            else if constexpr (std::is_same_v<T, CloseTab>)
                return close_tab(cmd);
            else if constexpr (std::is_same_v<T, SwitchActiveTab>)
                return switch_tab(cmd);
            else if constexpr (std::is_same_v<T, ReorderTab>)
                return reorder_tab(cmd);
            else if constexpr (std::is_same_v<T, Navigate>)
                return navigate(cmd);
            else if constexpr (std::is_same_v<T, NavigationAction>)
                return navigation_action(cmd);
            else if constexpr (std::is_same_v<T, SetBounds>)
                return set_bounds(cmd);
            else
                return fail(ErrorCode::Unsupported,
                            std::string(command_name(Command{cmd})) + " is not a state command");
        },
        command);
}

CommandResult StateSynchronizer::create_tab(const CreateTab& cmd)
{
    const WindowId window = cmd.window_id;
    if (!views_.has_window(window))
        return fail(ErrorCode::InvalidWindow, window_str(window) + " is not registered");

    std::string url = normalize_url(cmd.url);
    if (url.empty())
        url = normalize_url(config_.default_url);
    if (url.empty())
        url = "about:blank";

    SlotPtr                      slot;
    std::unique_lock<std::mutex> cmd_lock;
    for (;;)
    {
        slot     = get_or_create_slot(window);
        cmd_lock = std::unique_lock<std::mutex>(slot->command_mu);
        if (!slot->removed)
            break;
        cmd_lock.unlock();
    }
    {
        // Emptied by a transfer and about to be torn down
        std::lock_guard<std::mutex> lock(slot->mu);
        if (slot->set.closing)
            return fail(ErrorCode::InvalidWindow, window_str(window) + " is closing");
    }

    const TabId tab      = next_tab_id_.fetch_add(1);
    TabId       previous = INVALID_TAB;
    bool        activate = false;

    WindowSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(slot->mu);
        TabRecord rec;
        rec.tab_id        = tab;
        rec.window_id     = window;
        rec.url           = url;
        rec.title         = "New Tab";
        rec.last_accessed = std::chrono::steady_clock::now();
        slot->tabs.emplace(tab, std::move(rec));

        auto&        ids = slot->set.tab_ids;
        const size_t pos = cmd.position ? std::min<size_t>(*cmd.position, ids.size()) : ids.size();
        ids.insert(ids.begin() + static_cast<std::ptrdiff_t>(pos), tab);
        slot->set.window_id = window;

        if (cmd.activate || slot->set.active_tab_id == INVALID_TAB)
        {
            previous                 = slot->set.active_tab_id;
            slot->set.active_tab_id = tab;
            activate                 = true;
        }
        ++slot->revision;
        snap = snapshot_locked(*slot);
    }
    {
        std::lock_guard<std::mutex> lock(windows_mu_);
        tab_index_[tab] = window;
    }
    notify(snap);

    TABWEAVE_LOG_INFO("state", "{} created in {} at {}", tab_str(tab), window_str(window), url);

    Status st = views_.create_surface(window, tab, url);
    if (!st)
        TABWEAVE_LOG_WARN("state", "{} shown in error state: {}", tab_str(tab), st.to_string());

    if (activate)
    {
        if (previous != INVALID_TAB)
            views_.set_visible(previous, false);
        views_.set_visible(tab, true);
        views_.bring_to_front(tab);
        bus_.publish(TabActivated{window, tab, previous});
    }
    return CommandResult{st, tab};
}

CommandResult StateSynchronizer::close_tab(const CloseTab& cmd)
{
    const TabId                  tab = cmd.tab_id;
    std::unique_lock<std::mutex> cmd_lock;
    SlotPtr                      slot = lock_tab_window(tab, cmd_lock);
    if (!slot)
        return fail(ErrorCode::NotFound, tab_str(tab) + " is unknown");

    const WindowId window     = slot->window_id;
    TabId          new_active = INVALID_TAB;
    bool           emptied    = false;

    WindowSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(slot->mu);
        auto&  ids   = slot->set.tab_ids;
        auto   it    = std::find(ids.begin(), ids.end(), tab);
        size_t index = static_cast<size_t>(it - ids.begin());
        ids.erase(it);
        slot->tabs.erase(tab);

        if (slot->set.active_tab_id == tab)
        {
            new_active              = neighbour_after_removal(ids, index);
            slot->set.active_tab_id = new_active;
            if (new_active != INVALID_TAB)
                slot->tabs[new_active].last_accessed = std::chrono::steady_clock::now();
        }

        emptied = ids.empty();
        if (emptied)
            slot->removed = true;
        ++slot->revision;
        snap = snapshot_locked(*slot);
    }
    {
        std::lock_guard<std::mutex> lock(windows_mu_);
        tab_index_.erase(tab);
    }
    if (emptied)
        erase_slot(window, slot);
    notify(snap);

    TABWEAVE_LOG_INFO("state", "{} closed in {}", tab_str(tab), window_str(window));

    // A capture in flight must not turn the teardown into a freeze
    views_.cancel_freeze(tab);
    views_.destroy_surface(tab);
    if (new_active != INVALID_TAB)
    {
        views_.set_visible(new_active, true);
        views_.bring_to_front(new_active);
    }

    bus_.publish(TabClosed{window, tab});
    if (new_active != INVALID_TAB)
        bus_.publish(TabActivated{window, new_active, INVALID_TAB});
    return CommandResult{Status::success(), tab};
}

CommandResult StateSynchronizer::switch_tab(const SwitchActiveTab& cmd)
{
    SlotPtr slot = find_slot(cmd.window_id);
    if (!slot)
        return fail(ErrorCode::NotFound, window_str(cmd.window_id) + " is unknown");

    std::unique_lock<std::mutex> cmd_lock(slot->command_mu);
    if (slot->removed)
        return fail(ErrorCode::NotFound, window_str(cmd.window_id) + " is unknown");

    TabId          previous = INVALID_TAB;
    WindowSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(slot->mu);
        auto it = slot->tabs.find(cmd.tab_id);
        if (it == slot->tabs.end())
            return fail(ErrorCode::NotFound,
                        tab_str(cmd.tab_id) + " is not in " + window_str(cmd.window_id));
        if (slot->set.active_tab_id == cmd.tab_id)
            return CommandResult{Status::success(), cmd.tab_id};

        previous                 = slot->set.active_tab_id;
        slot->set.active_tab_id  = cmd.tab_id;
        it->second.last_accessed = std::chrono::steady_clock::now();
        ++slot->revision;
        snap = snapshot_locked(*slot);
    }
    notify(snap);

    if (previous != INVALID_TAB)
        views_.set_visible(previous, false);
    views_.set_visible(cmd.tab_id, true);
    views_.bring_to_front(cmd.tab_id);

    bus_.publish(TabActivated{cmd.window_id, cmd.tab_id, previous});
    return CommandResult{Status::success(), cmd.tab_id};
}

CommandResult StateSynchronizer::reorder_tab(const ReorderTab& cmd)
{
    std::unique_lock<std::mutex> cmd_lock;
    SlotPtr                      slot = lock_tab_window(cmd.tab_id, cmd_lock);
    if (!slot)
        return fail(ErrorCode::NotFound, tab_str(cmd.tab_id) + " is unknown");

    WindowSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(slot->mu);
        auto& ids = slot->set.tab_ids;
        ids.erase(std::find(ids.begin(), ids.end(), cmd.tab_id));
        const size_t pos = std::min<size_t>(cmd.index, ids.size());
        ids.insert(ids.begin() + static_cast<std::ptrdiff_t>(pos), cmd.tab_id);
        ++slot->revision;
        snap = snapshot_locked(*slot);
    }
    notify(snap);
    return CommandResult{Status::success(), cmd.tab_id};
}

CommandResult StateSynchronizer::navigate(const Navigate& cmd)
{
    const std::string url = normalize_url(cmd.url);
    if (url.empty())
        return fail(ErrorCode::InvalidArgument, "navigate: empty url");

    std::unique_lock<std::mutex> cmd_lock;
    if (!lock_tab_window(cmd.tab_id, cmd_lock))
        return fail(ErrorCode::NotFound, tab_str(cmd.tab_id) + " is unknown");

    Status st = views_.navigate(cmd.tab_id, url);
    if (!st)
        return CommandResult{st, cmd.tab_id};

    update_tab(cmd.tab_id,
               [&url](TabRecord& r)
               {
                   r.url = url;
                   r.error.clear();
               });
    return CommandResult{Status::success(), cmd.tab_id};
}

CommandResult StateSynchronizer::navigation_action(const NavigationAction& cmd)
{
    std::unique_lock<std::mutex> cmd_lock;
    if (!lock_tab_window(cmd.tab_id, cmd_lock))
        return fail(ErrorCode::NotFound, tab_str(cmd.tab_id) + " is unknown");

    Status st;
    switch (cmd.action)
    {
        case NavAction::Back:
            st = views_.go_back(cmd.tab_id);
            break;
        case NavAction::Forward:
            st = views_.go_forward(cmd.tab_id);
            break;
        case NavAction::Reload:
            st = views_.reload(cmd.tab_id);
            if (st)
                update_tab(cmd.tab_id, [](TabRecord& r) { r.error.clear(); });
            break;
        case NavAction::Stop:
            st = views_.stop(cmd.tab_id);
            break;
        default:
            st = Status::error(ErrorCode::InvalidArgument, "unknown navigation action");
            break;
    }
    return CommandResult{st, cmd.tab_id};
}

CommandResult StateSynchronizer::set_bounds(const SetBounds& cmd)
{
    if (!cmd.rect.valid())
        return fail(ErrorCode::InvalidArgument, "set_bounds: empty rect");

    std::unique_lock<std::mutex> cmd_lock;
    if (!lock_tab_window(cmd.tab_id, cmd_lock))
        return fail(ErrorCode::NotFound, tab_str(cmd.tab_id) + " is unknown");

    views_.set_bounds(cmd.tab_id, cmd.rect);
    return CommandResult{Status::success(), cmd.tab_id};
}

// ─── Transfer support ────────────────────────────────────────────────────────

StateSynchronizer::WindowPairLock StateSynchronizer::lock_pair(WindowId a, WindowId b)
{
    for (;;)
    {
        const WindowId lo = std::min(a, b);
        const WindowId hi = std::max(a, b);

        SlotPtr slot_lo = get_or_create_slot(lo);
        SlotPtr slot_hi = lo == hi ? slot_lo : get_or_create_slot(hi);

        std::unique_lock<std::mutex> lock_lo(slot_lo->command_mu);
        std::unique_lock<std::mutex> lock_hi;
        if (slot_hi != slot_lo)
            lock_hi = std::unique_lock<std::mutex>(slot_hi->command_mu);

        if (slot_lo->removed || slot_hi->removed)
            continue;

        WindowPairLock pair;
        pair.first_  = a;
        pair.second_ = b;
        pair.slot_a_ = a == lo ? slot_lo : slot_hi;
        pair.slot_b_ = a == lo ? slot_hi : slot_lo;
        pair.lock_a_ = std::move(lock_lo);
        pair.lock_b_ = std::move(lock_hi);
        return pair;
    }
}

Status StateSynchronizer::prepare_transfer(const WindowPairLock& lock,
                                           TabId                 tab,
                                           WindowId              source,
                                           WindowId              target,
                                           TransferTicket&       out)
{
    if (lock.first() != source || lock.second() != target)
        return Status::error(ErrorCode::InvalidArgument, "transfer lock does not cover both windows");

    Status result;
    {
        std::lock_guard<std::mutex> guard(lock.slot_a_->mu);
        const auto& ids = lock.slot_a_->set.tab_ids;
        auto        it  = std::find(ids.begin(), ids.end(), tab);
        if (it == ids.end())
        {
            result = Status::error(ErrorCode::NotFound, tab_str(tab) + " is not in " + window_str(source));
        }
        else
        {
            out.tab_id       = tab;
            out.source       = source;
            out.target       = target;
            out.source_index = static_cast<size_t>(it - ids.begin());
            out.was_active   = lock.slot_a_->set.active_tab_id == tab;
        }
    }
    if (result && !views_.has_window(target))
        result = Status::error(ErrorCode::InvalidWindow, window_str(target) + " is not registered");
    if (result)
    {
        std::lock_guard<std::mutex> guard(lock.slot_b_->mu);
        if (lock.slot_b_->set.closing)
            result = Status::error(ErrorCode::InvalidWindow, window_str(target) + " is closing");
    }

    if (!result)
    {
        // lock_pair() may have created empty slots for unknown windows
        drop_if_unused(source, lock.slot_a_);
        drop_if_unused(target, lock.slot_b_);
    }
    return result;
}

StateSynchronizer::TransferOutcome StateSynchronizer::commit_transfer(WindowPairLock&         lock,
                                                                      const TransferTicket&   ticket,
                                                                      std::optional<uint32_t> position)
{
    TransferOutcome outcome;
    WindowSlot&     src = *lock.slot_a_;
    WindowSlot&     dst = *lock.slot_b_;
    const auto      now = std::chrono::steady_clock::now();

    WindowSnapshot src_snap;
    WindowSnapshot dst_snap;
    {
        std::scoped_lock guard(src.mu, dst.mu);

        auto rec_it = src.tabs.find(ticket.tab_id);
        TabRecord rec = std::move(rec_it->second);
        src.tabs.erase(rec_it);

        auto& src_ids = src.set.tab_ids;
        src_ids.erase(std::find(src_ids.begin(), src_ids.end(), ticket.tab_id));
        if (src.set.active_tab_id == ticket.tab_id)
        {
            outcome.new_source_active = neighbour_after_removal(src_ids, ticket.source_index);
            src.set.active_tab_id     = outcome.new_source_active;
            if (outcome.new_source_active != INVALID_TAB)
                src.tabs[outcome.new_source_active].last_accessed = now;
        }
        outcome.source_emptied = src_ids.empty();
        if (outcome.source_emptied)
            src.set.closing = true;

        rec.window_id     = ticket.target;
        rec.last_accessed = now;

        auto&        dst_ids = dst.set.tab_ids;
        const size_t pos     = position ? std::min<size_t>(*position, dst_ids.size()) : dst_ids.size();
        dst_ids.insert(dst_ids.begin() + static_cast<std::ptrdiff_t>(pos), ticket.tab_id);
        dst.set.window_id              = ticket.target;
        outcome.previous_target_active = dst.set.active_tab_id;
        dst.set.active_tab_id          = ticket.tab_id;
        dst.tabs.emplace(ticket.tab_id, std::move(rec));

        ++src.revision;
        ++dst.revision;
        src_snap = snapshot_locked(src);
        dst_snap = snapshot_locked(dst);
    }
    {
        std::lock_guard<std::mutex> guard(windows_mu_);
        tab_index_[ticket.tab_id] = ticket.target;
    }

    TABWEAVE_LOG_INFO("state",
                      "{} moved {} -> {}{}",
                      tab_str(ticket.tab_id),
                      window_str(ticket.source),
                      window_str(ticket.target),
                      outcome.source_emptied ? " (source emptied)" : "");

    notify(src_snap);
    notify(dst_snap);
    return outcome;
}

// ─── Window teardown ─────────────────────────────────────────────────────────

void StateSynchronizer::mark_window_closing(WindowId window)
{
    SlotPtr slot = find_slot(window);
    if (!slot)
        return;

    WindowSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(slot->mu);
        if (slot->set.closing)
            return;
        slot->set.closing = true;
        ++slot->revision;
        snap = snapshot_locked(*slot);
    }
    notify(snap);
}

void StateSynchronizer::remove_window(WindowId window)
{
    SlotPtr slot = find_slot(window);
    if (!slot)
        return;

    std::unique_lock<std::mutex> cmd_lock(slot->command_mu);
    if (slot->removed)
        return;

    std::vector<TabId> closed;
    WindowSnapshot     snap;
    {
        std::lock_guard<std::mutex> lock(slot->mu);
        closed = slot->set.tab_ids;
        slot->set.tab_ids.clear();
        slot->tabs.clear();
        slot->set.active_tab_id = INVALID_TAB;
        slot->set.window_id     = window;
        slot->set.closing       = true;
        slot->removed           = true;
        ++slot->revision;
        snap = snapshot_locked(*slot);
    }
    {
        std::lock_guard<std::mutex> lock(windows_mu_);
        for (TabId tab : closed)
        {
            auto it = tab_index_.find(tab);
            if (it != tab_index_.end() && it->second == window)
                tab_index_.erase(it);
        }
    }
    erase_slot(window, slot);
    cmd_lock.unlock();

    TABWEAVE_LOG_INFO("state", "{} removed with {} tab(s)", window_str(window), closed.size());
    notify(snap);

    for (TabId tab : closed)
    {
        views_.destroy_surface_now(tab);
        bus_.publish(TabClosed{window, tab});
    }
}

// ─── Slots ───────────────────────────────────────────────────────────────────

StateSynchronizer::SlotPtr StateSynchronizer::find_slot(WindowId window) const
{
    std::lock_guard<std::mutex> lock(windows_mu_);
    auto it = windows_.find(window);
    return it == windows_.end() ? nullptr : it->second;
}

StateSynchronizer::SlotPtr StateSynchronizer::get_or_create_slot(WindowId window)
{
    std::lock_guard<std::mutex> lock(windows_mu_);
    auto& slot = windows_[window];
    if (!slot)
    {
        slot                = std::make_shared<WindowSlot>();
        slot->window_id     = window;
        slot->set.window_id = window;
    }
    return slot;
}

void StateSynchronizer::erase_slot(WindowId window, const SlotPtr& slot)
{
    std::lock_guard<std::mutex> lock(windows_mu_);
    auto it = windows_.find(window);
    if (it != windows_.end() && it->second == slot)
        windows_.erase(it);
}

void StateSynchronizer::drop_if_unused(WindowId window, const SlotPtr& slot)
{
    bool unused;
    {
        std::lock_guard<std::mutex> lock(slot->mu);
        unused = slot->set.tab_ids.empty() && !slot->set.closing;
        if (unused)
            slot->removed = true;
    }
    if (unused)
        erase_slot(window, slot);
}

StateSynchronizer::SlotPtr StateSynchronizer::lock_tab_window(TabId tab, std::unique_lock<std::mutex>& out)
{
    for (;;)
    {
        WindowId window = INVALID_WINDOW;
        SlotPtr  slot;
        {
            std::lock_guard<std::mutex> lock(windows_mu_);
            auto it = tab_index_.find(tab);
            if (it == tab_index_.end())
                return nullptr;
            window  = it->second;
            auto wi = windows_.find(window);
            if (wi == windows_.end())
                return nullptr;
            slot = wi->second;
        }

        std::unique_lock<std::mutex> cmd_lock(slot->command_mu);
        {
            std::lock_guard<std::mutex> lock(windows_mu_);
            auto it = tab_index_.find(tab);
            if (it == tab_index_.end())
                return nullptr;
            // Moved by a transfer while we waited
            if (it->second != window || slot->removed)
                continue;
        }
        out = std::move(cmd_lock);
        return slot;
    }
}

WindowSnapshot StateSynchronizer::snapshot_locked(const WindowSlot& slot) const
{
    WindowSnapshot snap;
    snap.set      = slot.set;
    snap.revision = slot.revision;
    snap.tabs.reserve(slot.set.tab_ids.size());
    for (TabId id : slot.set.tab_ids)
    {
        auto it = slot.tabs.find(id);
        if (it != slot.tabs.end())
            snap.tabs.push_back(it->second);
    }
    return snap;
}

// ─── Event folding ───────────────────────────────────────────────────────────

void StateSynchronizer::subscribe_bus()
{
    bus_subs_.push_back(bus_.on<SurfaceCreated>(
        [this](const SurfaceCreated& e) { update_tab(e.tab_id, [](TabRecord& r) { r.error.clear(); }); }));

    bus_subs_.push_back(bus_.on<SurfaceDestroyed>(
        [this](const SurfaceDestroyed& e) { update_tab(e.tab_id, [](TabRecord& r) { r.is_loading = false; }); }));

    bus_subs_.push_back(bus_.on<SurfaceCreateFailed>(
        [this](const SurfaceCreateFailed& e)
        {
            update_tab(e.tab_id,
                       [&e](TabRecord& r)
                       {
                           r.is_loading = false;
                           r.error      = Status::error(e.code, e.message).to_string();
                       });
        }));

    bus_subs_.push_back(bus_.on<LoadStarted>(
        [this](const LoadStarted& e)
        {
            update_tab(e.tab_id,
                       [](TabRecord& r)
                       {
                           r.is_loading = true;
                           r.error.clear();
                       });
        }));

    bus_subs_.push_back(bus_.on<LoadFinished>(
        [this](const LoadFinished& e)
        {
            update_tab(e.tab_id,
                       [&e](TabRecord& r)
                       {
                           r.is_loading = false;
                           if (!e.url.empty())
                               r.url = e.url;
                           if (!e.title.empty())
                               r.title = e.title;
                       });
        }));

    bus_subs_.push_back(bus_.on<LoadFailed>(
        [this](const LoadFailed& e)
        {
            update_tab(e.tab_id,
                       [&e](TabRecord& r)
                       {
                           r.is_loading = false;
                           r.error = e.description.empty() ? "load failed (" + std::to_string(e.error_code) + ")"
                                                           : e.description;
                       });
        }));

    bus_subs_.push_back(bus_.on<UrlChanged>(
        [this](const UrlChanged& e) { update_tab(e.tab_id, [&e](TabRecord& r) { r.url = e.url; }); }));

    bus_subs_.push_back(bus_.on<NavigationFlagsChanged>(
        [this](const NavigationFlagsChanged& e)
        {
            update_tab(e.tab_id,
                       [&e](TabRecord& r)
                       {
                           r.can_go_back    = e.can_go_back;
                           r.can_go_forward = e.can_go_forward;
                       });
        }));

    bus_subs_.push_back(bus_.on<TitleChanged>(
        [this](const TitleChanged& e) { update_tab(e.tab_id, [&e](TabRecord& r) { r.title = e.title; }); }));

    bus_subs_.push_back(bus_.on<FaviconChanged>(
        [this](const FaviconChanged& e)
        { update_tab(e.tab_id, [&e](TabRecord& r) { r.favicon_url = e.favicon_url; }); }));

    bus_subs_.push_back(bus_.on<SurfaceCrashed>(
        [this](const SurfaceCrashed& e)
        {
            update_tab(e.tab_id,
                       [&e](TabRecord& r)
                       {
                           r.is_loading = false;
                           r.error      = "surface crashed: " + e.reason;
                       });
        }));

    bus_subs_.push_back(bus_.on<DisplayModeChanged>(
        [this](const DisplayModeChanged& e)
        {
            update_tab(e.tab_id,
                       [&e](TabRecord& r)
                       {
                           r.display_mode = e.mode;
                           r.snapshot     = e.mode == DisplayMode::Frozen ? e.snapshot : std::nullopt;
                       });
        }));
}

}   // namespace tabweave
