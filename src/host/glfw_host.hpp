#pragma once

#ifdef TABWEAVE_USE_GLFW

    #include "surface_host.hpp"

    #include <deque>
    #include <mutex>
    #include <string>
    #include <unordered_map>

struct GLFWwindow;

namespace tabweave
{

// Desktop host: every window is a decorated GLFW window and every surface an
// undecorated GLFW window kept over its owner at the requested bounds.  No
// page content is rendered; loads complete immediately with the url as the
// title, so the orchestration can be watched on a real desktop.
//
// Navigation history and capture are not available and report Unsupported.
// Re-parenting works in place (the surface window is simply re-anchored).
//
// Must be used from the thread that called glfwInit (the daemon main thread).
class GlfwHost : public SurfaceHost
{
   public:
    GlfwHost() = default;
    ~GlfwHost() override;

    GlfwHost(const GlfwHost&)            = delete;
    GlfwHost& operator=(const GlfwHost&) = delete;

    bool init();
    void shutdown();

    const char* name() const override { return "glfw"; }

    void set_event_sink(EventSink sink) override;

    Status attach_window(WindowId window) override;
    void   detach_window(WindowId window) override;
    bool   has_window(WindowId window) const override;

    Status create_surface(WindowId window, const std::string& url, HostSurfaceId& out) override;
    Status destroy_surface(HostSurfaceId surface) override;

    Status set_bounds(HostSurfaceId surface, const Rect& rect) override;
    Status set_visible(HostSurfaceId surface, bool visible) override;
    Status raise(HostSurfaceId surface) override;
    Status lower(HostSurfaceId surface) override;
    Status focus(HostSurfaceId surface) override;

    Status load_url(HostSurfaceId surface, const std::string& url) override;
    Status go_back(HostSurfaceId surface) override;
    Status go_forward(HostSurfaceId surface) override;
    Status reload(HostSurfaceId surface) override;
    Status stop(HostSurfaceId surface) override;

    Status capture(HostSurfaceId surface, CaptureCallback done) override;
    Status reparent(HostSurfaceId surface, WindowId window) override;

    // Polls GLFW, re-anchors surfaces whose owner moved, then delivers.
    size_t pump() override;

   private:
    struct Surface
    {
        WindowId    window = INVALID_WINDOW;
        GLFWwindow* handle = nullptr;
        std::string url;
        Rect        bounds;
        bool        visible = false;
    };

    void queue_load(HostSurfaceId id, const std::string& url);
    void place(Surface& s);

    mutable std::mutex mu_;
    bool               initialized_ = false;
    EventSink          sink_;

    std::unordered_map<WindowId, GLFWwindow*>  windows_;
    std::unordered_map<HostSurfaceId, Surface> surfaces_;
    std::deque<HostEvent>                      queue_;
    HostSurfaceId                              next_id_ = 1;
};

}   // namespace tabweave

#endif   // TABWEAVE_USE_GLFW
