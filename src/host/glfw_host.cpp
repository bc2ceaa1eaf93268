#ifdef TABWEAVE_USE_GLFW

    #include "glfw_host.hpp"

    #include <tabweave/logger.hpp>

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>

namespace tabweave
{

GlfwHost::~GlfwHost()
{
    shutdown();
}

bool GlfwHost::init()
{
    if (initialized_)
        return true;

    if (!glfwInit())
    {
        TABWEAVE_LOG_ERROR("host", "Failed to initialize GLFW");
        return false;
    }
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    initialized_ = true;
    return true;
}

void GlfwHost::shutdown()
{
    if (!initialized_)
        return;

    std::lock_guard<std::mutex> lock(mu_);
    for (auto& [id, s] : surfaces_)
    {
        if (s.handle)
            glfwDestroyWindow(s.handle);
    }
    surfaces_.clear();
    for (auto& [id, w] : windows_)
        glfwDestroyWindow(w);
    windows_.clear();
    queue_.clear();

    glfwTerminate();
    initialized_ = false;
}

void GlfwHost::set_event_sink(EventSink sink)
{
    std::lock_guard<std::mutex> lock(mu_);
    sink_ = std::move(sink);
}

Status GlfwHost::attach_window(WindowId window)
{
    if (!initialized_)
        return Status::error(ErrorCode::Unsupported, "GLFW host not initialized");

    std::lock_guard<std::mutex> lock(mu_);
    if (windows_.count(window))
        return Status::success();

    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    std::string title = "tabweave window " + std::to_string(window);
    GLFWwindow* w     = glfwCreateWindow(1280, 800, title.c_str(), nullptr, nullptr);
    if (!w)
        return Status::error(ErrorCode::ResourceExhausted, "glfwCreateWindow failed");
    windows_[window] = w;
    return Status::success();
}

void GlfwHost::detach_window(WindowId window)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = windows_.find(window);
    if (it == windows_.end())
        return;

    for (auto sit = surfaces_.begin(); sit != surfaces_.end();)
    {
        if (sit->second.window == window)
        {
            glfwDestroyWindow(sit->second.handle);
            sit = surfaces_.erase(sit);
        }
        else
        {
            ++sit;
        }
    }
    glfwDestroyWindow(it->second);
    windows_.erase(it);
}

bool GlfwHost::has_window(WindowId window) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return windows_.count(window) > 0;
}

Status GlfwHost::create_surface(WindowId window, const std::string& url, HostSurfaceId& out)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto wit = windows_.find(window);
    if (wit == windows_.end())
        return Status::error(ErrorCode::InvalidWindow,
                             "window " + std::to_string(window) + " is not attached");

    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_DECORATED, GLFW_FALSE);
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    glfwWindowHint(GLFW_FOCUS_ON_SHOW, GLFW_FALSE);
    GLFWwindow* handle = glfwCreateWindow(640, 480, url.c_str(), nullptr, nullptr);
    if (!handle)
        return Status::error(ErrorCode::ResourceExhausted, "glfwCreateWindow failed for surface");

    HostSurfaceId id = next_id_++;
    Surface       s;
    s.window     = window;
    s.handle     = handle;
    surfaces_[id] = s;
    out           = id;

    HostEvent created;
    created.kind    = HostEvent::Kind::Created;
    created.surface = id;
    queue_.push_back(created);
    queue_load(id, url);
    return Status::success();
}

Status GlfwHost::destroy_surface(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return Status::error(ErrorCode::NoSuchSurface, "unknown surface");
    glfwDestroyWindow(it->second.handle);
    surfaces_.erase(it);
    std::erase_if(queue_, [surface](const HostEvent& ev) { return ev.surface == surface; });
    return Status::success();
}

Status GlfwHost::set_bounds(HostSurfaceId surface, const Rect& rect)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return Status::error(ErrorCode::NoSuchSurface, "unknown surface");
    it->second.bounds = rect;
    place(it->second);
    return Status::success();
}

Status GlfwHost::set_visible(HostSurfaceId surface, bool visible)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return Status::error(ErrorCode::NoSuchSurface, "unknown surface");
    it->second.visible = visible;
    if (visible)
        glfwShowWindow(it->second.handle);
    else
        glfwHideWindow(it->second.handle);
    return Status::success();
}

Status GlfwHost::raise(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return Status::error(ErrorCode::NoSuchSurface, "unknown surface");
    glfwSetWindowAttrib(it->second.handle, GLFW_FLOATING, GLFW_TRUE);
    return Status::success();
}

Status GlfwHost::lower(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return Status::error(ErrorCode::NoSuchSurface, "unknown surface");
    glfwSetWindowAttrib(it->second.handle, GLFW_FLOATING, GLFW_FALSE);
    return Status::success();
}

Status GlfwHost::focus(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return Status::error(ErrorCode::NoSuchSurface, "unknown surface");
    glfwFocusWindow(it->second.handle);
    return Status::success();
}

Status GlfwHost::load_url(HostSurfaceId surface, const std::string& url)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (!surfaces_.count(surface))
        return Status::error(ErrorCode::NoSuchSurface, "unknown surface");
    queue_load(surface, url);
    return Status::success();
}

Status GlfwHost::go_back(HostSurfaceId)
{
    return Status::error(ErrorCode::Unsupported, "GLFW host keeps no history");
}

Status GlfwHost::go_forward(HostSurfaceId)
{
    return Status::error(ErrorCode::Unsupported, "GLFW host keeps no history");
}

Status GlfwHost::reload(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return Status::error(ErrorCode::NoSuchSurface, "unknown surface");
    std::string url = it->second.url;
    queue_load(surface, url);
    return Status::success();
}

Status GlfwHost::stop(HostSurfaceId surface)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (!surfaces_.count(surface))
        return Status::error(ErrorCode::NoSuchSurface, "unknown surface");
    return Status::success();
}

Status GlfwHost::capture(HostSurfaceId, CaptureCallback)
{
    return Status::error(ErrorCode::Unsupported, "GLFW host cannot capture surfaces");
}

Status GlfwHost::reparent(HostSurfaceId surface, WindowId window)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return Status::error(ErrorCode::NoSuchSurface, "unknown surface");
    if (!windows_.count(window))
        return Status::error(ErrorCode::InvalidWindow, "target window is not attached");
    it->second.window = window;
    place(it->second);
    return Status::success();
}

size_t GlfwHost::pump()
{
    if (!initialized_)
        return 0;

    glfwPollEvents();

    std::deque<HostEvent> batch;
    EventSink             sink;
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto& [id, s] : surfaces_)
            place(s);
        batch.swap(queue_);
        sink = sink_;
    }

    if (sink)
    {
        for (const auto& ev : batch)
            sink(ev);
    }
    return batch.size();
}

// Callers hold mu_.
void GlfwHost::queue_load(HostSurfaceId id, const std::string& url)
{
    auto& s = surfaces_[id];
    s.url   = url;
    glfwSetWindowTitle(s.handle, url.c_str());

    HostEvent started;
    started.kind    = HostEvent::Kind::LoadStarted;
    started.surface = id;
    queue_.push_back(started);

    HostEvent nav;
    nav.kind    = HostEvent::Kind::Navigated;
    nav.surface = id;
    nav.url     = url;
    queue_.push_back(nav);

    HostEvent finished;
    finished.kind    = HostEvent::Kind::LoadFinished;
    finished.surface = id;
    finished.url     = url;
    finished.text    = url;
    queue_.push_back(finished);
}

void GlfwHost::place(Surface& s)
{
    auto wit = windows_.find(s.window);
    if (wit == windows_.end() || !s.bounds.valid())
        return;
    int wx = 0, wy = 0;
    glfwGetWindowPos(wit->second, &wx, &wy);
    glfwSetWindowPos(s.handle, wx + s.bounds.x, wy + s.bounds.y);
    glfwSetWindowSize(s.handle, s.bounds.width, s.bounds.height);
}

}   // namespace tabweave

#endif   // TABWEAVE_USE_GLFW
