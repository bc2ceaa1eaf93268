#include "snapshot_service.hpp"

#include "state/state_synchronizer.hpp"
#include "url/url_helpers.hpp"
#include "view/view_lifecycle_manager.hpp"

#include <tabweave/logger.hpp>

#include <algorithm>

namespace tabweave
{

static constexpr uint32_t PLACEHOLDER_SIZE = 16;
static constexpr uint8_t  PLACEHOLDER_GREY = 128;

SnapshotService::SnapshotService(ViewLifecycleManager& views,
                                 StateSynchronizer&    state,
                                 EventBus&             bus,
                                 Scheduler&            scheduler,
                                 SnapshotConfig        config)
    : views_(views), state_(state), bus_(bus), scheduler_(scheduler), config_(config)
{
    subs_.push_back(bus_.on<TabActivated>([this](const TabActivated& e) { on_tab_activated(e); }));
    subs_.push_back(bus_.on<SurfaceHidden>([this](const SurfaceHidden& e) { on_surface_hidden(e); }));
    subs_.push_back(bus_.on<SurfaceCreated>([this](const SurfaceCreated& e) { on_surface_created(e); }));
    subs_.push_back(bus_.on<LoadFinished>([this](const LoadFinished& e) { on_unfreeze_settled(e.tab_id); }));
    subs_.push_back(bus_.on<LoadFailed>([this](const LoadFailed& e) { on_unfreeze_settled(e.tab_id); }));
    subs_.push_back(bus_.on<SurfaceCrashed>([this](const SurfaceCrashed& e) { on_unfreeze_settled(e.tab_id); }));
    subs_.push_back(
        bus_.on<SurfaceCreateFailed>([this](const SurfaceCreateFailed& e) { on_create_failed(e); }));
    subs_.push_back(bus_.on<TabClosed>([this](const TabClosed& e) { on_tab_closed(e); }));
}

SnapshotService::~SnapshotService()
{
    for (auto& unsub : subs_)
        unsub();

    std::lock_guard<std::mutex> lock(mu_);
    for (auto& [tab, g] : grace_)
        scheduler_.cancel(g.second);
    for (auto& [tab, c] : captures_)
        scheduler_.cancel(c.timeout);
}

// ─── Freeze ──────────────────────────────────────────────────────────────────

Status SnapshotService::freeze_now(TabId tab)
{
    if (!config_.enabled)
        return Status::error(ErrorCode::Unsupported, "freezing is disabled");

    if (!state_.tab(tab))
        return Status::error(ErrorCode::NotFound, "tab " + std::to_string(tab) + " is unknown");
    if (is_active_tab(tab))
        return Status::error(ErrorCode::InvalidArgument, "the active tab is never frozen");
    if (views_.state(tab) != SurfaceState::Live)
        return Status::error(ErrorCode::NoSuchSurface, "tab " + std::to_string(tab) + " is not live");

    const std::string url = views_.url_of(tab);
    if (is_authentication_url(url))
    {
        TABWEAVE_LOG_INFO("snapshot", "tab {}: not freezing authentication page {}", tab, url);
        return Status::error(ErrorCode::Unsupported, "authentication pages are not frozen");
    }

    if (Status st = views_.begin_freeze(tab); !st)
        return st;

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (auto g = grace_.find(tab); g != grace_.end())
        {
            scheduler_.cancel(g->second.second);
            grace_.erase(g);
        }
        generation = next_generation_++;
        Capture c;
        c.generation = generation;
        c.timeout    = scheduler_.schedule(config_.capture_timeout,
                                        [this, tab, generation]
                                        { on_capture_done(tab, generation, std::nullopt, true); });
        captures_[tab] = c;
    }

    TABWEAVE_LOG_DEBUG("snapshot", "tab {}: capturing before freeze", tab);
    Status st = views_.capture(tab,
                               [this, tab, generation](std::optional<CapturedImage> image)
                               { on_capture_done(tab, generation, std::move(image), false); });
    if (!st)
    {
        {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = captures_.find(tab);
            if (it != captures_.end() && it->second.generation == generation)
            {
                scheduler_.cancel(it->second.timeout);
                captures_.erase(it);
            }
        }
        views_.cancel_freeze(tab);
        TABWEAVE_LOG_WARN("snapshot", "tab {}: capture refused, staying live: {}", tab, st.to_string());
        return st;
    }
    return Status::success();
}

void SnapshotService::on_capture_done(TabId                        tab,
                                      uint64_t                     generation,
                                      std::optional<CapturedImage> image,
                                      bool                         timed_out)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = captures_.find(tab);
        // Late completion of a capture that already timed out or was abandoned
        if (it == captures_.end() || it->second.generation != generation)
            return;
        if (!timed_out)
            scheduler_.cancel(it->second.timeout);
        captures_.erase(it);
    }

    if (!timed_out && !image)
    {
        TABWEAVE_LOG_WARN("snapshot", "tab {}: capture failed, freeze aborted", tab);
        views_.cancel_freeze(tab);
        return;
    }
    if (views_.state(tab) != SurfaceState::Freezing)
    {
        TABWEAVE_LOG_DEBUG("snapshot", "tab {}: freeze abandoned ({})", tab, surface_state_name(views_.state(tab)));
        return;
    }

    SnapshotImage img;
    if (timed_out)
    {
        TABWEAVE_LOG_WARN("snapshot",
                          "tab {}: capture exceeded {} ms, using placeholder",
                          tab,
                          config_.capture_timeout.count());
        img = make_placeholder(tab, generation);
    }
    else
    {
        img.tab_id     = tab;
        img.generation = generation;
        img.rgba       = std::move(image->rgba);
        img.width      = image->width;
        img.height     = image->height;
    }
    img.captured_at = std::chrono::steady_clock::now();

    SnapshotRef                ref = img.ref();
    std::optional<SnapshotRef> downgraded;
    {
        std::lock_guard<std::mutex> lock(mu_);
        downgraded = store_locked(std::move(img));
        frozen_.insert(tab);
    }

    // Snapshot goes up before the surface goes away, so the tab never blanks
    bus_.publish(DisplayModeChanged{tab, DisplayMode::Frozen, ref});
    if (downgraded && downgraded->tab_id != tab)
        bus_.publish(DisplayModeChanged{downgraded->tab_id, DisplayMode::Frozen, downgraded});
    views_.destroy_surface(tab);

    TABWEAVE_LOG_INFO("snapshot", "tab {} frozen{}", tab, ref.placeholder ? " (placeholder)" : "");
}

// ─── Unfreeze ────────────────────────────────────────────────────────────────

void SnapshotService::unfreeze(TabId tab)
{
    auto rec = state_.tab(tab);
    if (!rec)
        return;

    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!frozen_.count(tab) || unfreezing_.count(tab))
            return;
        unfreezing_.insert(tab);
    }

    TABWEAVE_LOG_DEBUG("snapshot", "tab {}: unfreezing at {}", tab, rec->url);
    bus_.publish(SurfaceNeeded{tab});

    Status st = views_.create_surface(rec->window_id, tab, rec->url);
    if (!st)
    {
        std::lock_guard<std::mutex> lock(mu_);
        unfreezing_.erase(tab);
        TABWEAVE_LOG_WARN("snapshot", "tab {}: unfreeze failed, snapshot kept: {}", tab, st.to_string());
    }
}

void SnapshotService::on_unfreeze_settled(TabId tab)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!unfreezing_.erase(tab))
            return;
        frozen_.erase(tab);
        store_.erase(tab);
        full_lru_.remove(tab);
    }
    bus_.publish(DisplayModeChanged{tab, DisplayMode::Live, std::nullopt});
    TABWEAVE_LOG_INFO("snapshot", "tab {} live again", tab);
}

void SnapshotService::on_create_failed(const SurfaceCreateFailed& e)
{
    std::lock_guard<std::mutex> lock(mu_);
    unfreezing_.erase(e.tab_id);
}

// ─── Signals ─────────────────────────────────────────────────────────────────

void SnapshotService::on_tab_activated(const TabActivated& e)
{
    bool abandon_capture = false;
    bool frozen          = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        last_activated_[e.tab_id] = ++activation_clock_;
        if (auto g = grace_.find(e.tab_id); g != grace_.end())
        {
            scheduler_.cancel(g->second.second);
            grace_.erase(g);
        }
        if (auto c = captures_.find(e.tab_id); c != captures_.end())
        {
            scheduler_.cancel(c->second.timeout);
            captures_.erase(c);
            abandon_capture = true;
        }
        frozen = frozen_.count(e.tab_id) > 0;
    }

    if (abandon_capture)
    {
        TABWEAVE_LOG_DEBUG("snapshot", "tab {}: reactivated during capture", e.tab_id);
        views_.cancel_freeze(e.tab_id);
    }
    if (e.previous != INVALID_TAB)
        bus_.publish(SurfaceHidden{e.previous});
    if (frozen)
        unfreeze(e.tab_id);
    enforce_budget();
}

void SnapshotService::on_surface_hidden(const SurfaceHidden& e)
{
    if (!config_.enabled || is_active_tab(e.tab_id))
        return;
    arm_grace_timer(e.tab_id);
}

void SnapshotService::on_surface_created(const SurfaceCreated& e)
{
    if (!config_.enabled)
        return;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (unfreezing_.count(e.tab_id))
            return;
    }
    // Opened in the background
    if (!is_active_tab(e.tab_id))
        arm_grace_timer(e.tab_id);
    enforce_budget();
}

void SnapshotService::on_tab_closed(const TabClosed& e)
{
    std::lock_guard<std::mutex> lock(mu_);
    cancel_timers_locked(e.tab_id);
    store_.erase(e.tab_id);
    full_lru_.remove(e.tab_id);
    frozen_.erase(e.tab_id);
    unfreezing_.erase(e.tab_id);
    last_activated_.erase(e.tab_id);
}

void SnapshotService::arm_grace_timer(TabId tab)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (grace_.count(tab) || captures_.count(tab) || frozen_.count(tab))
        return;
    const uint64_t generation = next_generation_++;
    auto timer = scheduler_.schedule(config_.freeze_grace,
                                     [this, tab, generation] { on_grace_timer(tab, generation); });
    grace_[tab] = {generation, timer};
}

void SnapshotService::on_grace_timer(TabId tab, uint64_t generation)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = grace_.find(tab);
        if (it == grace_.end() || it->second.first != generation)
            return;
        grace_.erase(it);
    }
    if (is_active_tab(tab) || views_.state(tab) != SurfaceState::Live)
        return;
    if (Status st = freeze_now(tab); !st)
        TABWEAVE_LOG_DEBUG("snapshot", "tab {}: not frozen: {}", tab, st.to_string());
}

void SnapshotService::enforce_budget()
{
    if (!config_.enabled || config_.max_live_surfaces == 0)
        return;

    std::unordered_set<TabId> refused;
    for (;;)
    {
        size_t                               live = 0;
        std::vector<std::pair<uint64_t, TabId>> candidates;
        for (TabId t : views_.tabs_with_surface())
        {
            const SurfaceState st = views_.state(t);
            if (st == SurfaceState::Freezing)
                continue;
            ++live;
            if (st != SurfaceState::Live || refused.count(t) || is_active_tab(t))
                continue;
            uint64_t stamp = 0;
            {
                std::lock_guard<std::mutex> lock(mu_);
                auto it = last_activated_.find(t);
                if (it != last_activated_.end())
                    stamp = it->second;
            }
            candidates.emplace_back(stamp, t);
        }

        if (live <= config_.max_live_surfaces || candidates.empty())
            return;

        const TabId victim = std::min_element(candidates.begin(), candidates.end())->second;
        TABWEAVE_LOG_DEBUG("snapshot",
                           "{} live surfaces over budget {}, freezing tab {}",
                           live,
                           config_.max_live_surfaces,
                           victim);
        if (!freeze_now(victim))
            refused.insert(victim);
    }
}

// ─── Queries ─────────────────────────────────────────────────────────────────

bool SnapshotService::is_frozen(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return frozen_.count(tab) > 0;
}

bool SnapshotService::is_unfreezing(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return unfreezing_.count(tab) > 0;
}

bool SnapshotService::freeze_pending(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return grace_.count(tab) > 0;
}

bool SnapshotService::capture_in_flight(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return captures_.count(tab) > 0;
}

std::optional<SnapshotImage> SnapshotService::snapshot(TabId tab) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = store_.find(tab);
    if (it == store_.end())
        return std::nullopt;
    return it->second;
}

size_t SnapshotService::snapshot_count() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return store_.size();
}

size_t SnapshotService::full_snapshot_count() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return full_lru_.size();
}

bool SnapshotService::is_active_tab(TabId tab) const
{
    auto rec = state_.tab(tab);
    if (!rec)
        return false;
    auto snap = state_.get_state(rec->window_id);
    return snap && snap->set.active_tab_id == tab;
}

// ─── Store ───────────────────────────────────────────────────────────────────

std::optional<SnapshotRef> SnapshotService::store_locked(SnapshotImage image)
{
    const TabId tab  = image.tab_id;
    const bool  full = !image.placeholder;
    store_[tab]      = std::move(image);
    full_lru_.remove(tab);
    if (full)
        full_lru_.push_back(tab);

    std::optional<SnapshotRef> downgraded;
    while (full_lru_.size() > config_.max_snapshots)
    {
        const TabId victim = full_lru_.front();
        full_lru_.pop_front();
        SnapshotImage placeholder = make_placeholder(victim, next_generation_++);
        placeholder.captured_at   = store_[victim].captured_at;
        store_[victim]            = std::move(placeholder);
        downgraded                = store_[victim].ref();
        TABWEAVE_LOG_DEBUG("snapshot", "tab {}: snapshot evicted to placeholder", victim);
    }
    return downgraded;
}

void SnapshotService::cancel_timers_locked(TabId tab)
{
    if (auto g = grace_.find(tab); g != grace_.end())
    {
        scheduler_.cancel(g->second.second);
        grace_.erase(g);
    }
    if (auto c = captures_.find(tab); c != captures_.end())
    {
        scheduler_.cancel(c->second.timeout);
        captures_.erase(c);
    }
}

SnapshotImage SnapshotService::make_placeholder(TabId tab, uint64_t generation)
{
    SnapshotImage img;
    img.tab_id      = tab;
    img.generation  = generation;
    img.width       = PLACEHOLDER_SIZE;
    img.height      = PLACEHOLDER_SIZE;
    img.placeholder = true;
    img.rgba.assign(static_cast<size_t>(PLACEHOLDER_SIZE) * PLACEHOLDER_SIZE * 4, PLACEHOLDER_GREY);
    for (size_t i = 3; i < img.rgba.size(); i += 4)
        img.rgba[i] = 255;
    return img;
}

}   // namespace tabweave
