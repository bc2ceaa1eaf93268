#include "session_server.hpp"

#include "../app/orchestrator.hpp"
#include "../ipc/codec.hpp"

#include <tabweave/logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

namespace tabweave::daemon
{

namespace
{

ipc::SessionId make_session_id()
{
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return (static_cast<uint64_t>(::getpid()) << 32) ^ static_cast<uint64_t>(now & 0xFFFFFFFF);
}

}   // namespace

SessionServer::SessionServer(Orchestrator& orchestrator, std::string host_name)
    : orchestrator_(orchestrator),
      host_name_(std::move(host_name)),
      session_id_(make_session_id()),
      last_heartbeat_(std::chrono::steady_clock::now())
{
    orchestrator_.set_state_listener([this](const WindowStateChanged& e) { on_window_state(e.snapshot); });
    orchestrator_.set_window_closed_listener([this](WindowId window) { on_window_closed(window); });
}

SessionServer::~SessionServer()
{
    orchestrator_.set_state_listener(nullptr);
    orchestrator_.set_window_closed_listener(nullptr);
    close();
}

bool SessionServer::listen(const std::string& path)
{
    return server_.listen(path);
}

void SessionServer::close()
{
    for (auto& c : clients_)
    {
        if (c.conn)
            c.conn->close();
    }
    clients_.clear();
    server_.close();
}

size_t SessionServer::client_count() const
{
    return clients_.size();
}

// ─── Loop ────────────────────────────────────────────────────────────────────

int SessionServer::poll_once(std::chrono::milliseconds timeout)
{
    std::vector<pollfd> pfds;
    pfds.reserve(1 + clients_.size());
    pfds.push_back({server_.listen_fd(), POLLIN, 0});
    for (const auto& c : clients_)
        pfds.push_back({c.conn ? c.conn->fd() : -1, POLLIN, 0});

    int ret = ::poll(pfds.data(), static_cast<nfds_t>(pfds.size()), static_cast<int>(timeout.count()));
    if (ret < 0)
    {
        if (errno == EINTR)
            return 0;
        TABWEAVE_LOG_ERROR("daemon", "poll() failed: {}", std::strerror(errno));
        return -1;
    }

    int          handled  = 0;
    const size_t existing = clients_.size();
    for (size_t i = 0; i < existing; ++i)
    {
        if (!(pfds[i + 1].revents & (POLLIN | POLLHUP | POLLERR)))
            continue;

        ClientSlot& client = clients_[i];
        if (!client.conn || !client.conn->is_open())
            continue;

        const int  fd    = client.conn->fd();
        const bool alive = client.conn->read_available();
        while (auto msg = client.conn->next_message())
        {
            handle_message(client, *msg);
            ++handled;
        }

        if (client.conn->protocol_error())
        {
            TABWEAVE_LOG_WARN("daemon", "fd {}: bad frame, dropping client", fd);
            client.conn->close();
        }
        else if (!alive)
        {
            TABWEAVE_LOG_INFO("daemon", "fd {}: client disconnected", fd);
            client.conn->close();
        }
    }

    if (pfds[0].revents & POLLIN)
    {
        while (auto conn = server_.try_accept())
        {
            TABWEAVE_LOG_INFO("daemon", "New connection (fd={})", conn->fd());
            ClientSlot slot;
            slot.conn = std::move(conn);
            clients_.push_back(std::move(slot));
        }
    }

    drop_closed_clients();
    return handled;
}

void SessionServer::maybe_send_heartbeat()
{
    auto now = std::chrono::steady_clock::now();
    if (now - last_heartbeat_ < heartbeat_interval_)
        return;
    last_heartbeat_ = now;

    auto msg              = ipc::make_message(ipc::MessageType::EVT_HEARTBEAT, {});
    msg.header.session_id = session_id_;
    broadcast(msg);
    drop_closed_clients();
}

void SessionServer::drop_closed_clients()
{
    std::erase_if(clients_, [](const ClientSlot& c) { return !c.conn || !c.conn->is_open(); });
}

// ─── Message handling ────────────────────────────────────────────────────────

void SessionServer::handle_message(ClientSlot& client, const ipc::Message& msg)
{
    const auto type = msg.header.type;
    TABWEAVE_LOG_TRACE("daemon", "fd {}: {} (req {})", client.conn->fd(), ipc::message_type_name(type),
                       msg.header.request_id);

    if (type == ipc::MessageType::HELLO)
    {
        handle_hello(client, msg);
        return;
    }
    if (type == ipc::MessageType::EVT_HEARTBEAT)
        return;

    if (!client.handshake_done)
    {
        reply_err(client, msg, Status::error(ErrorCode::InvalidArgument, "HELLO required first"));
        return;
    }

    switch (type)
    {
        case ipc::MessageType::REQ_OPEN_WINDOW:
        case ipc::MessageType::REQ_CLOSE_WINDOW:
        case ipc::MessageType::REQ_GET_STATE:
            handle_window_request(client, msg);
            break;
        default:
            if (ipc::is_command_message(type))
                handle_command(client, msg);
            else
                reply_err(client,
                          msg,
                          Status::error(ErrorCode::Unsupported,
                                        std::string("unexpected ") + ipc::message_type_name(type)));
            break;
    }
}

void SessionServer::handle_hello(ClientSlot& client, const ipc::Message& msg)
{
    auto hello = ipc::decode_hello(msg.payload);
    if (!hello || hello->protocol_major != ipc::PROTOCOL_MAJOR)
    {
        TABWEAVE_LOG_WARN("daemon", "fd {}: protocol {} not supported", client.conn->fd(),
                          hello ? hello->protocol_major : 0);
        reply_err(client, msg, Status::error(ErrorCode::Unsupported, "protocol version mismatch"));
        client.conn->close();
        return;
    }

    client.handshake_done = true;
    client.build          = hello->client_build;
    TABWEAVE_LOG_INFO("daemon", "HELLO from client (build={})", client.build);

    ipc::WelcomePayload wp;
    wp.session_id   = session_id_;
    wp.heartbeat_ms = static_cast<uint32_t>(heartbeat_interval_.count());
    wp.host_name    = host_name_;

    auto reply              = ipc::make_message(ipc::MessageType::WELCOME, ipc::encode_welcome(wp),
                                   msg.header.request_id);
    reply.header.session_id = session_id_;
    client.conn->send(std::move(reply));

    // Late joiners start from the current state of every window.
    for (WindowId window : orchestrator_.windows())
        send_state(client, window, ipc::INVALID_REQUEST);
}

void SessionServer::handle_window_request(ClientSlot& client, const ipc::Message& msg)
{
    auto     payload = ipc::decode_window(msg.payload);
    WindowId window  = payload ? payload->window_id : INVALID_WINDOW;
    if (window == INVALID_WINDOW)
        window = msg.header.window_id;

    switch (msg.header.type)
    {
        case ipc::MessageType::REQ_OPEN_WINDOW:
        {
            Status st = orchestrator_.open_window(window);
            if (!st)
            {
                reply_err(client, msg, st);
                return;
            }
            reply_ok(client, msg);
            send_state(client, window, msg.header.request_id);
            break;
        }
        case ipc::MessageType::REQ_CLOSE_WINDOW:
            if (!orchestrator_.has_window(window))
            {
                reply_err(client, msg,
                          Status::error(ErrorCode::InvalidWindow, "window " + std::to_string(window) + " is not open"));
                return;
            }
            requested_closes_.insert(window);
            orchestrator_.close_window(window);
            reply_ok(client, msg);
            break;
        case ipc::MessageType::REQ_GET_STATE:
            if (!orchestrator_.has_window(window))
            {
                reply_err(client, msg,
                          Status::error(ErrorCode::InvalidWindow, "window " + std::to_string(window) + " is not open"));
                return;
            }
            send_state(client, window, msg.header.request_id);
            reply_ok(client, msg);
            break;
        default:
            break;
    }
}

void SessionServer::handle_command(ClientSlot& client, const ipc::Message& msg)
{
    auto cmd = ipc::decode_command(msg.header.type, msg.payload);
    if (!cmd)
    {
        reply_err(client, msg, Status::error(ErrorCode::InvalidArgument, "malformed command payload"));
        return;
    }

    CommandResult result = orchestrator_.dispatch(*cmd);
    if (result.ok())
        reply_ok(client, msg, result.tab_id);
    else
        reply_err(client, msg, result.status, result.tab_id);
}

// ─── Replies and pushes ──────────────────────────────────────────────────────

void SessionServer::reply_ok(ClientSlot& client, const ipc::Message& req, TabId tab)
{
    ipc::RespOkPayload p;
    p.request_id = req.header.request_id;
    p.tab_id     = tab;
    client.conn->send(ipc::make_message(ipc::MessageType::RESP_OK, ipc::encode_resp_ok(p),
                                        req.header.request_id, req.header.window_id));
}

void SessionServer::reply_err(ClientSlot& client, const ipc::Message& req, const Status& status, TabId tab)
{
    ipc::RespErrPayload p;
    p.request_id = req.header.request_id;
    p.code       = static_cast<uint32_t>(status.code);
    p.cause      = static_cast<uint32_t>(status.cause);
    p.message    = status.message;
    p.tab_id     = tab;
    client.conn->send(ipc::make_message(ipc::MessageType::RESP_ERR, ipc::encode_resp_err(p),
                                        req.header.request_id, req.header.window_id));
}

void SessionServer::send_state(ClientSlot& client, WindowId window, ipc::RequestId request_id)
{
    WindowSnapshot snap;
    if (auto current = orchestrator_.state().get_state(window))
        snap = std::move(*current);
    else
        snap.set.window_id = window;

    client.conn->send(ipc::make_message(ipc::MessageType::EVT_WINDOW_STATE,
                                        ipc::encode_window_snapshot(snap), request_id, window));
}

void SessionServer::broadcast(const ipc::Message& msg)
{
    for (auto& c : clients_)
    {
        if (!c.handshake_done || !c.conn || !c.conn->is_open())
            continue;
        if (!c.conn->send(msg))
        {
            TABWEAVE_LOG_DEBUG("daemon", "fd {}: push failed, dropping client", c.conn->fd());
            c.conn->close();
        }
    }
}

void SessionServer::on_window_state(const WindowSnapshot& snap)
{
    broadcast(ipc::make_message(ipc::MessageType::EVT_WINDOW_STATE, ipc::encode_window_snapshot(snap),
                                ipc::INVALID_REQUEST, snap.set.window_id));
}

void SessionServer::on_window_closed(WindowId window)
{
    ipc::EvtWindowClosingPayload p;
    p.window_id = window;
    p.reason    = requested_closes_.erase(window) ? "closed" : "emptied";
    broadcast(ipc::make_message(ipc::MessageType::EVT_WINDOW_CLOSING, ipc::encode_window_closing(p),
                                ipc::INVALID_REQUEST, window));
}

}   // namespace tabweave::daemon
