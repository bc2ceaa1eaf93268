#pragma once

#include "message.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabweave::ipc
{

// ─── Connection ──────────────────────────────────────────────────────────────
// Owns a connected Unix stream socket and moves framed Messages over it.
//
// Two read styles: recv() blocks for one whole message (clients), while
// read_available() + next_message() drain whatever poll() reported without
// ever blocking (the daemon loop).  Do not mix them on one connection.
// Not thread-safe.
class Connection
{
   public:
    explicit Connection(int fd);
    ~Connection();

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    bool is_open() const { return fd_ >= 0; }
    int  fd() const { return fd_; }

    // Stamps a sequence number and writes the whole frame.  False once the
    // peer is gone; never raises SIGPIPE.
    bool send(Message msg);

    std::optional<Message> recv();

    // Reads what the socket has buffered.  False on EOF or a hard error.
    bool read_available();
    // A complete message from the read buffer, if one has arrived.
    std::optional<Message> next_message();
    // Set when the peer sent bytes that are not a valid frame.
    bool protocol_error() const { return protocol_error_; }

    void close();

   private:
    bool read_exact(uint8_t* buf, size_t len);
    bool write_exact(const uint8_t* buf, size_t len);

    int                  fd_ = -1;
    uint64_t             next_seq_ = 1;
    std::vector<uint8_t> inbox_;
    bool                 protocol_error_ = false;
};

// ─── Server ──────────────────────────────────────────────────────────────────

class Server
{
   public:
    Server() = default;
    ~Server();

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    // Removes a stale socket file first.  The socket is created owner-only.
    bool listen(const std::string& path);

    // Blocks.  nullptr when the server is closed or accept fails.
    std::unique_ptr<Connection> accept();

    // nullptr at once when nobody is waiting.
    std::unique_ptr<Connection> try_accept();

    // Closes the socket and unlinks its file.
    void close();

    bool               is_listening() const { return listen_fd_ >= 0; }
    int                listen_fd() const { return listen_fd_; }
    const std::string& path() const { return path_; }

   private:
    int         listen_fd_ = -1;
    std::string path_;
};

// ─── Client ──────────────────────────────────────────────────────────────────

class Client
{
   public:
    // nullptr when nothing listens at `path`.
    static std::unique_ptr<Connection> connect(const std::string& path);
};

// ─── Utility ─────────────────────────────────────────────────────────────────

// $XDG_RUNTIME_DIR/tabweave-<pid>.sock, or /tmp/tabweave-<pid>.sock when
// XDG_RUNTIME_DIR is unset.
std::string default_socket_path();

}   // namespace tabweave::ipc
