#include "orchestrator.hpp"

#include "url/url_helpers.hpp"

#include <tabweave/logger.hpp>

#include <algorithm>

namespace tabweave
{

namespace
{

ViewLifecycleConfig view_config(const OrchestratorConfig& c)
{
    ViewLifecycleConfig v;
    v.destroy_debounce = std::chrono::milliseconds(std::max<int64_t>(c.destroy_debounce_ms, 0));
    return v;
}

StateSynchronizerConfig state_config(const OrchestratorConfig& c)
{
    StateSynchronizerConfig s;
    s.default_url = c.default_url;
    return s;
}

SnapshotConfig snapshot_config(const OrchestratorConfig& c)
{
    SnapshotConfig s;
    s.enabled           = c.freeze_enabled;
    s.freeze_grace      = std::chrono::milliseconds(std::max<int64_t>(c.freeze_grace_ms, 0));
    s.capture_timeout   = std::chrono::milliseconds(std::max<int64_t>(c.capture_timeout_ms, 1));
    s.max_snapshots     = static_cast<size_t>(std::max<int64_t>(c.max_snapshots, 0));
    s.max_live_surfaces = static_cast<size_t>(std::max<int64_t>(c.max_live_surfaces, 1));
    return s;
}

}   // namespace

Orchestrator::Orchestrator(SurfaceHost& host, const Clock& clock, OrchestratorConfig config)
    : host_(host),
      config_(std::move(config)),
      scheduler_(clock),
      views_(host_, bus_, scheduler_, view_config(config_)),
      state_(views_, bus_, state_config(config_)),
      snapshots_(views_, state_, bus_, scheduler_, snapshot_config(config_)),
      transfers_(state_, views_, bus_),
      focus_(views_, state_, bus_)
{
    state_sub_ = state_.subscribe_all([this](const WindowSnapshot& snap) { on_state(snap); });

    subs_.push_back(bus_.on<WindowMarkedForClosure>(
        [this](const WindowMarkedForClosure& e) { on_window_marked(e); }));
    subs_.push_back(
        bus_.on<OpenUrlRequested>([this](const OpenUrlRequested& e) { on_open_url(e); }));

    TABWEAVE_LOG_INFO("orchestrator",
                      "Started on host '{}' (grace {} ms, {} live surfaces max)",
                      host_.name(),
                      config_.freeze_grace_ms,
                      config_.max_live_surfaces);
}

Orchestrator::~Orchestrator()
{
    for (auto& unsub : subs_)
        unsub();
    subs_.clear();
    state_.unsubscribe(state_sub_);

    for (WindowId window : windows())
        close_window(window);
}

// ─── Windows ─────────────────────────────────────────────────────────────────

Status Orchestrator::open_window(WindowId window)
{
    if (window == INVALID_WINDOW)
        return Status::error(ErrorCode::InvalidArgument, "window id 0 is reserved");

    {
        std::lock_guard<std::mutex> lock(mu_);
        if (windows_.count(window))
            return Status::success();
    }

    Status st = views_.register_window(window);
    if (!st)
    {
        TABWEAVE_LOG_ERROR("orchestrator", "window {}: open failed: {}", window, st.to_string());
        return st;
    }

    std::lock_guard<std::mutex> lock(mu_);
    windows_.insert(window);
    TABWEAVE_LOG_INFO("orchestrator", "window {} opened", window);
    return Status::success();
}

void Orchestrator::close_window(WindowId window)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (windows_.erase(window) == 0)
            return;
        std::erase(pending_closes_, window);
        std::erase_if(pending_opens_, [&](const OpenUrlRequested& e) { return e.window_id == window; });
    }

    state_.remove_window(window);
    views_.unregister_window(window);
    TABWEAVE_LOG_INFO("orchestrator", "window {} closed", window);

    ClosedListener listener;
    {
        std::lock_guard<std::mutex> lock(mu_);
        listener = closed_listener_;
    }
    if (listener)
        listener(window);
}

bool Orchestrator::has_window(WindowId window) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return windows_.count(window) != 0;
}

std::vector<WindowId> Orchestrator::windows() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return {windows_.begin(), windows_.end()};
}

// ─── Commands ────────────────────────────────────────────────────────────────

CommandResult Orchestrator::dispatch(const Command& command)
{
    TABWEAVE_LOG_DEBUG("orchestrator", "dispatch {}", command_name(command));

    CommandResult result;
    if (const auto* transfer = std::get_if<TransferTab>(&command))
    {
        result.status = transfers_.transfer_tab(*transfer);
        result.tab_id = transfer->tab_id;
    }
    else if (const auto* focus = std::get_if<RequestFocus>(&command))
    {
        result.status = focus_.request_focus(focus->tab_id);
        result.tab_id = focus->tab_id;
    }
    else
    {
        result = state_.apply_command(command);
    }

    if (!result.ok())
    {
        TABWEAVE_LOG_WARN(
            "orchestrator", "{} failed: {}", command_name(command), result.status.to_string());
    }
    return result;
}

void Orchestrator::set_state_listener(StateListener listener)
{
    std::lock_guard<std::mutex> lock(mu_);
    state_listener_ = std::move(listener);
}

void Orchestrator::set_window_closed_listener(ClosedListener listener)
{
    std::lock_guard<std::mutex> lock(mu_);
    closed_listener_ = std::move(listener);
}

// ─── Loop ────────────────────────────────────────────────────────────────────

size_t Orchestrator::tick()
{
    size_t work = host_.pump();
    work += scheduler_.run_due();

    std::vector<WindowId>         closes;
    std::vector<OpenUrlRequested> opens;
    {
        std::lock_guard<std::mutex> lock(mu_);
        closes.swap(pending_closes_);
        opens.swap(pending_opens_);
    }

    for (const auto& req : opens)
        open_requested_tab(req);
    for (WindowId window : closes)
        close_window(window);

    return work + closes.size() + opens.size();
}

std::optional<std::chrono::milliseconds> Orchestrator::next_wakeup() const
{
    auto deadline = scheduler_.next_deadline();
    if (!deadline)
        return std::nullopt;
    auto now = scheduler_.clock().now();
    if (*deadline <= now)
        return std::chrono::milliseconds(0);
    return std::chrono::ceil<std::chrono::milliseconds>(*deadline - now);
}

// ─── Bus and state handlers ──────────────────────────────────────────────────

void Orchestrator::on_state(const WindowSnapshot& snap)
{
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(mu_);
        listener = state_listener_;
    }
    if (listener)
        listener(WindowStateChanged{snap.set.window_id, snap});
}

void Orchestrator::on_window_marked(const WindowMarkedForClosure& e)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (!windows_.count(e.window_id))
        return;
    if (std::find(pending_closes_.begin(), pending_closes_.end(), e.window_id) == pending_closes_.end())
        pending_closes_.push_back(e.window_id);
}

void Orchestrator::on_open_url(const OpenUrlRequested& e)
{
    std::lock_guard<std::mutex> lock(mu_);
    pending_opens_.push_back(e);
}

void Orchestrator::open_requested_tab(const OpenUrlRequested& e)
{
    std::string url = normalize_url(e.url);
    if (url.empty())
    {
        TABWEAVE_LOG_DEBUG("orchestrator", "tab {}: ignoring open request with empty url", e.tab_id);
        return;
    }

    // The opener may have moved since the request was queued.
    WindowId window = state_.window_of(e.tab_id);
    if (window == INVALID_WINDOW)
        window = e.window_id;
    if (!has_window(window))
        return;

    CreateTab cmd;
    cmd.window_id = window;
    cmd.url       = url;
    cmd.activate  = !e.background;
    if (auto snap = state_.get_state(window))
    {
        const auto& ids = snap->set.tab_ids;
        auto        it  = std::find(ids.begin(), ids.end(), e.tab_id);
        if (it != ids.end())
            cmd.position = static_cast<uint32_t>(it - ids.begin() + 1);
    }

    CommandResult r = state_.apply_command(cmd);
    if (r.tab_id == INVALID_TAB)
    {
        TABWEAVE_LOG_WARN("orchestrator", "tab {}: could not open {}: {}", e.tab_id, url, r.status.to_string());
        return;
    }
    TABWEAVE_LOG_INFO("orchestrator",
                      "tab {} opened {} as tab {} ({})",
                      e.tab_id,
                      url,
                      r.tab_id,
                      e.background ? "background" : "foreground");
}

}   // namespace tabweave
