#include "headless_host.hpp"

#include <tabweave/logger.hpp>

#include <algorithm>

namespace tabweave
{

namespace
{

HostEvent make_event(HostEvent::Kind kind, HostSurfaceId surface)
{
    HostEvent ev;
    ev.kind    = kind;
    ev.surface = surface;
    return ev;
}

}   // namespace

std::string HeadlessHost::title_for(const std::string& url)
{
    auto scheme = url.find("://");
    if (scheme == std::string::npos)
        return url;
    auto start = scheme + 3;
    auto end   = url.find_first_of("/?#", start);
    return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

void HeadlessHost::set_event_sink(EventSink sink)
{
    std::lock_guard<std::mutex> lock(mu_);
    sink_ = std::move(sink);
}

// ─── Windows ─────────────────────────────────────────────────────────────────

Status HeadlessHost::attach_window(WindowId window)
{
    if (window == INVALID_WINDOW)
        return Status::error(ErrorCode::InvalidWindow, "window id 0 is reserved");

    std::lock_guard<std::mutex> lock(mu_);
    windows_.try_emplace(window);
    return Status::success();
}

void HeadlessHost::detach_window(WindowId window)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = windows_.find(window);
    if (it == windows_.end())
        return;
    auto ids = it->second;
    for (auto id : ids)
        erase_surface(id);
    windows_.erase(window);
}

bool HeadlessHost::has_window(WindowId window) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return windows_.count(window) > 0;
}

// ─── Surfaces ────────────────────────────────────────────────────────────────

Status HeadlessHost::create_surface(WindowId window, const std::string& url, HostSurfaceId& out)
{
    std::lock_guard<std::mutex> lock(mu_);
    ++create_calls_;

    auto wit = windows_.find(window);
    if (wit == windows_.end())
        return Status::error(ErrorCode::InvalidWindow,
                             "window " + std::to_string(window) + " is not attached");

    if (surface_limit_ > 0 && surfaces_.size() >= surface_limit_)
        return Status::error(ErrorCode::ResourceExhausted,
                             "surface limit " + std::to_string(surface_limit_) + " reached");

    HostSurfaceId id = next_id_++;
    out              = id;

    if (fail_next_create_)
    {
        fail_next_create_ = false;
        HostEvent ev      = make_event(HostEvent::Kind::CreateFailed, id);
        ev.code           = static_cast<int32_t>(ErrorCode::ResourceExhausted);
        ev.text           = "renderer process could not be started";
        queue(std::move(ev));
        return Status::success();
    }

    SurfaceInfo info;
    info.window = window;
    auto& s     = surfaces_.emplace(id, std::move(info)).first->second;
    wit->second.push_back(id);
    last_created_ = id;

    queue(make_event(HostEvent::Kind::Created, id));
    s.created = true;
    begin_load(id, s, url, true);
    return Status::success();
}

Status HeadlessHost::destroy_surface(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (!surfaces_.count(surface))
        return missing(surface);
    ++destroy_calls_;
    erase_surface(surface);
    return Status::success();
}

Status HeadlessHost::set_bounds(HostSurfaceId surface, const Rect& rect)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return missing(surface);
    it->second.bounds = rect;
    return Status::success();
}

Status HeadlessHost::set_visible(HostSurfaceId surface, bool visible)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return missing(surface);
    it->second.visible = visible;
    return Status::success();
}

Status HeadlessHost::raise(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return missing(surface);
    auto& order = windows_[it->second.window];
    order.erase(std::remove(order.begin(), order.end(), surface), order.end());
    order.push_back(surface);
    return Status::success();
}

Status HeadlessHost::lower(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return missing(surface);
    auto& order = windows_[it->second.window];
    order.erase(std::remove(order.begin(), order.end(), surface), order.end());
    order.insert(order.begin(), surface);
    return Status::success();
}

Status HeadlessHost::focus(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (!surfaces_.count(surface))
        return missing(surface);
    focused_ = surface;
    return Status::success();
}

// ─── Navigation ──────────────────────────────────────────────────────────────

Status HeadlessHost::load_url(HostSurfaceId surface, const std::string& url)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return missing(surface);
    begin_load(surface, it->second, url, true);
    return Status::success();
}

Status HeadlessHost::go_back(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return missing(surface);
    auto& s = it->second;
    if (s.history_index == 0)
        return Status::error(ErrorCode::InvalidArgument, "no previous entry");
    --s.history_index;
    begin_load(surface, s, s.history[s.history_index], false);
    return Status::success();
}

Status HeadlessHost::go_forward(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return missing(surface);
    auto& s = it->second;
    if (s.history_index + 1 >= s.history.size())
        return Status::error(ErrorCode::InvalidArgument, "no next entry");
    ++s.history_index;
    begin_load(surface, s, s.history[s.history_index], false);
    return Status::success();
}

Status HeadlessHost::reload(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return missing(surface);
    std::string url = it->second.url;
    begin_load(surface, it->second, url, false);
    return Status::success();
}

Status HeadlessHost::stop(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return missing(surface);
    auto& s = it->second;
    if (s.loading)
        finish_load(surface, s, s.title);
    return Status::success();
}

// ─── Capture / re-parent ─────────────────────────────────────────────────────

Status HeadlessHost::capture(HostSurfaceId surface, CaptureCallback done)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return missing(surface);

    Pending p;
    p.event        = make_event(HostEvent::Kind::Created, surface);
    p.is_capture   = true;
    p.capture_done = std::move(done);
    if (fail_next_capture_)
        fail_next_capture_ = false;
    else
        p.image = render(surface, it->second);

    if (hold_captures_)
        held_.push_back(std::move(p));
    else
        queue_.push_back(std::move(p));
    return Status::success();
}

Status HeadlessHost::reparent(HostSurfaceId surface, WindowId window)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return missing(surface);
    if (!reparent_supported_)
        return Status::error(ErrorCode::Unsupported, "headless host: re-parenting disabled");
    if (fail_next_reparent_)
    {
        fail_next_reparent_ = false;
        return Status::error(ErrorCode::ResourceExhausted, "re-parent refused by host");
    }
    auto wit = windows_.find(window);
    if (wit == windows_.end())
        return Status::error(ErrorCode::InvalidWindow,
                             "window " + std::to_string(window) + " is not attached");

    auto& old_order = windows_[it->second.window];
    old_order.erase(std::remove(old_order.begin(), old_order.end(), surface), old_order.end());
    wit->second.push_back(surface);
    it->second.window = window;
    return Status::success();
}

// ─── Delivery ────────────────────────────────────────────────────────────────

size_t HeadlessHost::pump()
{
    std::deque<Pending> batch;
    EventSink           sink;
    {
        std::lock_guard<std::mutex> lock(mu_);
        batch.swap(queue_);
        sink = sink_;
    }

    if (interleave_reversed_)
    {
        std::stable_sort(batch.begin(),
                         batch.end(),
                         [](const Pending& a, const Pending& b)
                         { return a.event.surface > b.event.surface; });
    }

    size_t delivered = 0;
    for (auto& p : batch)
    {
        bool alive;
        {
            std::lock_guard<std::mutex> lock(mu_);
            alive = surfaces_.count(p.event.surface) > 0;
        }

        if (p.is_capture)
        {
            if (p.capture_done)
                p.capture_done(alive ? std::move(p.image) : std::nullopt);
            ++delivered;
            continue;
        }

        // Events of a surface destroyed earlier in this batch are dropped
        if (!alive && p.event.kind != HostEvent::Kind::CreateFailed)
            continue;

        TABWEAVE_LOG_TRACE("host",
                           "surface {} -> {}",
                           p.event.surface,
                           host_event_kind_name(p.event.kind));
        if (sink)
            sink(p.event);
        ++delivered;
    }
    return delivered;
}

// ─── Fault injection ─────────────────────────────────────────────────────────

void HeadlessHost::set_surface_limit(size_t limit)
{
    std::lock_guard<std::mutex> lock(mu_);
    surface_limit_ = limit;
}

void HeadlessHost::fail_next_create()
{
    std::lock_guard<std::mutex> lock(mu_);
    fail_next_create_ = true;
}

void HeadlessHost::set_reparent_supported(bool supported)
{
    std::lock_guard<std::mutex> lock(mu_);
    reparent_supported_ = supported;
}

void HeadlessHost::fail_next_reparent()
{
    std::lock_guard<std::mutex> lock(mu_);
    fail_next_reparent_ = true;
}

void HeadlessHost::fail_next_capture()
{
    std::lock_guard<std::mutex> lock(mu_);
    fail_next_capture_ = true;
}

void HeadlessHost::set_hold_captures(bool hold)
{
    std::lock_guard<std::mutex> lock(mu_);
    hold_captures_ = hold;
}

size_t HeadlessHost::release_captures()
{
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = held_.size();
    for (auto& p : held_)
        queue_.push_back(std::move(p));
    held_.clear();
    return n;
}

size_t HeadlessHost::held_captures() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return held_.size();
}

void HeadlessHost::set_auto_complete_loads(bool enabled)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto_complete_loads_ = enabled;
}

void HeadlessHost::set_interleave_reversed(bool reversed)
{
    std::lock_guard<std::mutex> lock(mu_);
    interleave_reversed_ = reversed;
}

// ─── Scripted page activity ──────────────────────────────────────────────────

bool HeadlessHost::complete_load(HostSurfaceId surface, const std::string& title)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end() || !it->second.loading)
        return false;
    finish_load(surface, it->second, title.empty() ? title_for(it->second.url) : title);
    return true;
}

bool HeadlessHost::fail_load(HostSurfaceId surface, int32_t code, const std::string& description)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end() || !it->second.loading)
        return false;
    it->second.loading = false;
    HostEvent ev       = make_event(HostEvent::Kind::LoadFailed, surface);
    ev.code            = code;
    ev.text            = description;
    ev.url             = it->second.url;
    queue(std::move(ev));
    return true;
}

bool HeadlessHost::simulate_crash(HostSurfaceId surface, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return false;
    it->second.loading = false;
    HostEvent ev       = make_event(HostEvent::Kind::Crashed, surface);
    ev.text            = reason;
    queue(std::move(ev));
    return true;
}

bool HeadlessHost::simulate_title(HostSurfaceId surface, const std::string& title)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return false;
    it->second.title = title;
    HostEvent ev     = make_event(HostEvent::Kind::TitleChanged, surface);
    ev.text          = title;
    queue(std::move(ev));
    return true;
}

bool HeadlessHost::simulate_favicon(HostSurfaceId surface, const std::string& favicon_url)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (!surfaces_.count(surface))
        return false;
    HostEvent ev = make_event(HostEvent::Kind::FaviconChanged, surface);
    ev.url       = favicon_url;
    queue(std::move(ev));
    return true;
}

bool HeadlessHost::simulate_in_page_navigation(HostSurfaceId surface, const std::string& url)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return false;
    auto& s = it->second;
    s.history.resize(s.history_index + 1);
    s.history.push_back(url);
    s.history_index = s.history.size() - 1;
    s.url           = url;
    HostEvent ev    = make_event(HostEvent::Kind::Navigated, surface);
    ev.url          = url;
    ev.flag         = true;
    queue(std::move(ev));
    queue_flags(surface, s);
    return true;
}

bool HeadlessHost::simulate_open_url(HostSurfaceId surface, const std::string& url, bool background)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (!surfaces_.count(surface))
        return false;
    HostEvent ev = make_event(HostEvent::Kind::OpenUrlRequested, surface);
    ev.url       = url;
    ev.flag      = background;
    queue(std::move(ev));
    return true;
}

// ─── Inspection ──────────────────────────────────────────────────────────────

size_t HeadlessHost::surface_count() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return surfaces_.size();
}

std::optional<HeadlessHost::SurfaceInfo> HeadlessHost::info(HostSurfaceId surface) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return std::nullopt;
    return it->second;
}

std::vector<HostSurfaceId> HeadlessHost::surfaces_in(WindowId window) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = windows_.find(window);
    if (it == windows_.end())
        return {};
    return it->second;
}

HostSurfaceId HeadlessHost::last_created() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return last_created_;
}

HostSurfaceId HeadlessHost::focused() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return focused_;
}

uint64_t HeadlessHost::create_calls() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return create_calls_;
}

uint64_t HeadlessHost::destroy_calls() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return destroy_calls_;
}

size_t HeadlessHost::queued() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

// ─── Internals ───────────────────────────────────────────────────────────────

void HeadlessHost::queue(HostEvent ev)
{
    Pending p;
    p.event = std::move(ev);
    queue_.push_back(std::move(p));
}

void HeadlessHost::begin_load(HostSurfaceId      id,
                              SurfaceInfo&       s,
                              const std::string& url,
                              bool               push_history)
{
    if (s.loading)
    {
        HostEvent aborted = make_event(HostEvent::Kind::LoadFailed, id);
        aborted.code      = LOAD_ERROR_ABORTED;
        aborted.text      = "ERR_ABORTED";
        aborted.url       = s.url;
        queue(std::move(aborted));
    }

    if (push_history)
    {
        if (!s.history.empty())
            s.history.resize(s.history_index + 1);
        s.history.push_back(url);
        s.history_index = s.history.size() - 1;
    }

    s.url     = url;
    s.loading = true;
    queue(make_event(HostEvent::Kind::LoadStarted, id));

    HostEvent nav = make_event(HostEvent::Kind::Navigated, id);
    nav.url       = url;
    queue(std::move(nav));
    queue_flags(id, s);

    if (auto_complete_loads_)
        finish_load(id, s, title_for(url));
}

void HeadlessHost::finish_load(HostSurfaceId id, SurfaceInfo& s, const std::string& title)
{
    s.loading = false;
    s.title   = title;
    HostEvent ev = make_event(HostEvent::Kind::LoadFinished, id);
    ev.url       = s.url;
    ev.text      = title;
    queue(std::move(ev));
}

void HeadlessHost::queue_flags(HostSurfaceId id, const SurfaceInfo& s)
{
    HostEvent ev = make_event(HostEvent::Kind::NavFlagsChanged, id);
    ev.flag      = s.history_index > 0;
    ev.flag2     = s.history_index + 1 < s.history.size();
    queue(std::move(ev));
}

void HeadlessHost::erase_surface(HostSurfaceId id)
{
    auto it = surfaces_.find(id);
    if (it != surfaces_.end())
    {
        auto wit = windows_.find(it->second.window);
        if (wit != windows_.end())
        {
            auto& order = wit->second;
            order.erase(std::remove(order.begin(), order.end(), id), order.end());
        }
        surfaces_.erase(it);
    }
    if (focused_ == id)
        focused_ = INVALID_HOST_SURFACE;

    // A destroyed surface never reports anything again; a creation that had
    // not completed is thereby cancelled
    queue_.erase(std::remove_if(queue_.begin(),
                                queue_.end(),
                                [id](const Pending& p)
                                { return !p.is_capture && p.event.surface == id; }),
                 queue_.end());
}

Status HeadlessHost::missing(HostSurfaceId id) const
{
    return Status::error(ErrorCode::NoSuchSurface, "host surface " + std::to_string(id) + " does not exist");
}

CapturedImage HeadlessHost::render(HostSurfaceId id, const SurfaceInfo& s) const
{
    CapturedImage img;
    img.width  = static_cast<uint32_t>(std::clamp(s.bounds.width, 1, 64));
    img.height = static_cast<uint32_t>(std::clamp(s.bounds.height, 1, 64));
    img.rgba.resize(static_cast<size_t>(img.width) * img.height * 4);
    const uint8_t shade = static_cast<uint8_t>(40 + (id * 37) % 200);
    for (size_t i = 0; i < img.rgba.size(); i += 4)
    {
        img.rgba[i + 0] = shade;
        img.rgba[i + 1] = static_cast<uint8_t>(255 - shade);
        img.rgba[i + 2] = 128;
        img.rgba[i + 3] = 255;
    }
    return img;
}

}   // namespace tabweave
