#pragma once

#include "../ipc/message.hpp"
#include "../ipc/transport.hpp"

#include <tabweave/fwd.hpp>
#include <tabweave/status.hpp>
#include <tabweave/tab_state.hpp>

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace tabweave
{
class Orchestrator;
}

namespace tabweave::daemon
{

// Bridges UI clients on the Unix socket to one Orchestrator.
//
// Each client says HELLO, then sends window requests and commands; every
// request is answered with RESP_OK or RESP_ERR carrying its request id.
// Window state pushes and closing notices go to every client that has
// completed the handshake.
//
// Single-threaded: poll_once() and the orchestrator's tick() must run on
// the same thread.
class SessionServer
{
   public:
    SessionServer(Orchestrator& orchestrator, std::string host_name);
    ~SessionServer();

    SessionServer(const SessionServer&)            = delete;
    SessionServer& operator=(const SessionServer&) = delete;

    bool listen(const std::string& path);
    void close();

    // Waits up to `timeout` for socket activity, accepts new clients and
    // handles every complete message.  Returns the number of messages
    // handled, or -1 if poll() failed for a reason other than a signal.
    int poll_once(std::chrono::milliseconds timeout);

    // Sends EVT_HEARTBEAT when heartbeat_interval() has passed.
    void maybe_send_heartbeat();

    size_t                    client_count() const;
    ipc::SessionId            session_id() const { return session_id_; }
    std::chrono::milliseconds heartbeat_interval() const { return heartbeat_interval_; }
    const std::string&        socket_path() const { return server_.path(); }

   private:
    struct ClientSlot
    {
        std::unique_ptr<ipc::Connection> conn;
        bool                             handshake_done = false;
        std::string                      build;
    };

    void handle_message(ClientSlot& client, const ipc::Message& msg);
    void handle_hello(ClientSlot& client, const ipc::Message& msg);
    void handle_window_request(ClientSlot& client, const ipc::Message& msg);
    void handle_command(ClientSlot& client, const ipc::Message& msg);

    void reply_ok(ClientSlot& client, const ipc::Message& req, TabId tab = INVALID_TAB);
    void reply_err(ClientSlot& client, const ipc::Message& req, const Status& status, TabId tab = INVALID_TAB);
    void send_state(ClientSlot& client, WindowId window, ipc::RequestId request_id);

    void broadcast(const ipc::Message& msg);
    void on_window_state(const WindowSnapshot& snap);
    void on_window_closed(WindowId window);
    void drop_closed_clients();

    Orchestrator&                         orchestrator_;
    std::string                           host_name_;
    ipc::Server                           server_;
    std::vector<ClientSlot>               clients_;
    ipc::SessionId                        session_id_;
    std::set<WindowId>                    requested_closes_;
    std::chrono::milliseconds             heartbeat_interval_{5000};
    std::chrono::steady_clock::time_point last_heartbeat_;
};

}   // namespace tabweave::daemon
