#pragma once

#include <tabweave/fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tabweave::ipc
{

// ─── IPC ID types ────────────────────────────────────────────────────────────
using SessionId = uint64_t;
using RequestId = uint64_t;

static constexpr SessionId INVALID_SESSION = 0;
static constexpr RequestId INVALID_REQUEST = 0;

// ─── Message types ───────────────────────────────────────────────────────────
enum class MessageType : uint16_t
{
    // Handshake
    HELLO   = 0x0001,
    WELCOME = 0x0002,

    // Request/Response
    RESP_OK  = 0x0010,
    RESP_ERR = 0x0011,

    // Windows (UI → orchestrator)
    REQ_OPEN_WINDOW  = 0x0100,
    REQ_CLOSE_WINDOW = 0x0101,
    REQ_GET_STATE    = 0x0102,

    // Commands (UI → orchestrator), one per Command alternative
    REQ_CREATE_TAB    = 0x0200,
    REQ_CLOSE_TAB     = 0x0201,
    REQ_SWITCH_TAB    = 0x0202,
    REQ_REORDER_TAB   = 0x0203,
    REQ_NAVIGATE      = 0x0204,
    REQ_NAV_ACTION    = 0x0205,
    REQ_SET_BOUNDS    = 0x0206,
    REQ_TRANSFER_TAB  = 0x0207,
    REQ_REQUEST_FOCUS = 0x0208,

    // Events (orchestrator → UI)
    EVT_WINDOW_STATE   = 0x0300,
    EVT_WINDOW_CLOSING = 0x0301,
    EVT_HEARTBEAT      = 0x0302,
};

const char* message_type_name(MessageType type);

// ─── Message envelope ────────────────────────────────────────────────────────
// Wire format: [Header (fixed 40 bytes)] [payload (variable)]
//
// Header layout:
//   bytes 0-1:   magic (0x54, 0x57 = "TW")
//   bytes 2-3:   message type (uint16_t LE)
//   bytes 4-7:   payload length (uint32_t LE)
//   bytes 8-15:  sequence number (uint64_t LE)
//   bytes 16-23: request_id (uint64_t LE)
//   bytes 24-31: session_id (uint64_t LE)
//   bytes 32-39: window_id (uint64_t LE)

static constexpr uint8_t MAGIC_0          = 0x54;   // 'T'
static constexpr uint8_t MAGIC_1          = 0x57;   // 'W'
static constexpr size_t  HEADER_SIZE      = 40;
static constexpr size_t  MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;

struct MessageHeader
{
    MessageType type        = MessageType::HELLO;
    uint32_t    payload_len = 0;
    uint64_t    seq         = 0;
    RequestId   request_id  = INVALID_REQUEST;
    SessionId   session_id  = INVALID_SESSION;
    WindowId    window_id   = INVALID_WINDOW;
};

struct Message
{
    MessageHeader        header;
    std::vector<uint8_t> payload;
};

// ─── Handshake payloads ──────────────────────────────────────────────────────

static constexpr uint16_t PROTOCOL_MAJOR = 1;
static constexpr uint16_t PROTOCOL_MINOR = 0;

struct HelloPayload
{
    uint16_t    protocol_major = PROTOCOL_MAJOR;
    uint16_t    protocol_minor = PROTOCOL_MINOR;
    std::string client_build;
};

struct WelcomePayload
{
    SessionId   session_id   = INVALID_SESSION;
    uint32_t    heartbeat_ms = 5000;
    std::string host_name;   // surface host backing the daemon
};

// ─── Response payloads ───────────────────────────────────────────────────────

struct RespOkPayload
{
    RequestId request_id = INVALID_REQUEST;
    TabId     tab_id     = INVALID_TAB;   // CreateTab only
};

// code and cause carry tabweave::ErrorCode values.
struct RespErrPayload
{
    RequestId   request_id = INVALID_REQUEST;
    uint32_t    code       = 0;
    uint32_t    cause      = 0;
    std::string message;
    TabId       tab_id = INVALID_TAB;
};

// ─── Window payloads ─────────────────────────────────────────────────────────

struct WindowPayload
{
    WindowId window_id = INVALID_WINDOW;
};

struct EvtWindowClosingPayload
{
    WindowId    window_id = INVALID_WINDOW;
    std::string reason;   // "emptied", "closed"
};

}   // namespace tabweave::ipc
