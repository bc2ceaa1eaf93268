#include "transport.hpp"

#include "codec.hpp"

#include <tabweave/logger.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <span>

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace tabweave::ipc
{

namespace
{

bool fill_address(const std::string& path, sockaddr_un& addr)
{
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path))
        return false;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return true;
}

}   // namespace

// ─── Connection ──────────────────────────────────────────────────────────────

Connection::Connection(int fd) : fd_(fd) {}

Connection::~Connection()
{
    close();
}

Connection::Connection(Connection&& other) noexcept
    : fd_(other.fd_),
      next_seq_(other.next_seq_),
      inbox_(std::move(other.inbox_)),
      protocol_error_(other.protocol_error_)
{
    other.fd_ = -1;
}

Connection& Connection::operator=(Connection&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_             = other.fd_;
        next_seq_       = other.next_seq_;
        inbox_          = std::move(other.inbox_);
        protocol_error_ = other.protocol_error_;
        other.fd_       = -1;
    }
    return *this;
}

bool Connection::read_exact(uint8_t* buf, size_t len)
{
    size_t total = 0;
    while (total < len)
    {
        auto n = ::read(fd_, buf + total, len - total);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool Connection::write_exact(const uint8_t* buf, size_t len)
{
    size_t total = 0;
    while (total < len)
    {
        auto n = ::send(fd_, buf + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool Connection::send(Message msg)
{
    if (fd_ < 0)
        return false;
    msg.header.seq = next_seq_++;
    auto wire      = encode_message(msg);
    if (!write_exact(wire.data(), wire.size()))
    {
        TABWEAVE_LOG_DEBUG("ipc", "fd {}: send {} failed: {}", fd_, message_type_name(msg.header.type),
                           std::strerror(errno));
        return false;
    }
    return true;
}

std::optional<Message> Connection::recv()
{
    if (fd_ < 0)
        return std::nullopt;

    uint8_t hdr_buf[HEADER_SIZE];
    if (!read_exact(hdr_buf, HEADER_SIZE))
        return std::nullopt;

    auto hdr = decode_header(std::span<const uint8_t>(hdr_buf, HEADER_SIZE));
    if (!hdr || hdr->payload_len > MAX_PAYLOAD_SIZE)
    {
        protocol_error_ = true;
        return std::nullopt;
    }

    Message msg;
    msg.header = *hdr;
    msg.payload.resize(hdr->payload_len);
    if (hdr->payload_len > 0 && !read_exact(msg.payload.data(), hdr->payload_len))
        return std::nullopt;
    return msg;
}

bool Connection::read_available()
{
    if (fd_ < 0)
        return false;

    uint8_t chunk[4096];
    for (;;)
    {
        auto n = ::recv(fd_, chunk, sizeof(chunk), MSG_DONTWAIT);
        if (n > 0)
        {
            inbox_.insert(inbox_.end(), chunk, chunk + n);
            continue;
        }
        if (n == 0)
            return false;
        if (errno == EINTR)
            continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

std::optional<Message> Connection::next_message()
{
    if (inbox_.size() < HEADER_SIZE)
        return std::nullopt;

    auto hdr = decode_header(inbox_);
    if (!hdr || hdr->payload_len > MAX_PAYLOAD_SIZE)
    {
        protocol_error_ = true;
        inbox_.clear();
        return std::nullopt;
    }

    const size_t frame = HEADER_SIZE + hdr->payload_len;
    if (inbox_.size() < frame)
        return std::nullopt;

    Message msg;
    msg.header = *hdr;
    msg.payload.assign(inbox_.begin() + HEADER_SIZE, inbox_.begin() + static_cast<std::ptrdiff_t>(frame));
    inbox_.erase(inbox_.begin(), inbox_.begin() + static_cast<std::ptrdiff_t>(frame));
    return msg;
}

void Connection::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
    inbox_.clear();
}

// ─── Server ──────────────────────────────────────────────────────────────────

Server::~Server()
{
    close();
}

bool Server::listen(const std::string& path)
{
    sockaddr_un addr;
    if (!fill_address(path, addr))
    {
        TABWEAVE_LOG_ERROR("ipc", "Socket path '{}' is empty or too long", path);
        return false;
    }

    ::unlink(path.c_str());

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        TABWEAVE_LOG_ERROR("ipc", "socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        TABWEAVE_LOG_ERROR("ipc", "bind({}) failed: {}", path, std::strerror(errno));
        ::close(fd);
        return false;
    }

    ::chmod(path.c_str(), 0600);

    if (::listen(fd, 8) < 0)
    {
        TABWEAVE_LOG_ERROR("ipc", "listen({}) failed: {}", path, std::strerror(errno));
        ::close(fd);
        ::unlink(path.c_str());
        return false;
    }

    listen_fd_ = fd;
    path_      = path;
    TABWEAVE_LOG_INFO("ipc", "Listening on {}", path);
    return true;
}

std::unique_ptr<Connection> Server::accept()
{
    if (listen_fd_ < 0)
        return nullptr;

    int fd;
    do
    {
        fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0)
        return nullptr;
    return std::make_unique<Connection>(fd);
}

std::unique_ptr<Connection> Server::try_accept()
{
    if (listen_fd_ < 0)
        return nullptr;

    // The listening socket stays blocking; only this attempt is non-blocking.
    int flags = ::fcntl(listen_fd_, F_GETFL, 0);
    if (flags >= 0)
        ::fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK);

    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);

    if (flags >= 0)
        ::fcntl(listen_fd_, F_SETFL, flags);

    if (fd < 0)
        return nullptr;
    return std::make_unique<Connection>(fd);
}

void Server::close()
{
    if (listen_fd_ >= 0)
    {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (!path_.empty())
    {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

// ─── Client ──────────────────────────────────────────────────────────────────

std::unique_ptr<Connection> Client::connect(const std::string& path)
{
    sockaddr_un addr;
    if (!fill_address(path, addr))
        return nullptr;

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return nullptr;

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        TABWEAVE_LOG_DEBUG("ipc", "connect({}) failed: {}", path, std::strerror(errno));
        ::close(fd);
        return nullptr;
    }
    return std::make_unique<Connection>(fd);
}

// ─── Utility ─────────────────────────────────────────────────────────────────

std::string default_socket_path()
{
    std::string dir = "/tmp";
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && xdg[0] != '\0')
        dir = xdg;
    return dir + "/tabweave-" + std::to_string(::getpid()) + ".sock";
}

}   // namespace tabweave::ipc
