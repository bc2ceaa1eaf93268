#pragma once

#include "message.hpp"

#include <tabweave/commands.hpp>
#include <tabweave/tab_state.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace tabweave::ipc
{

// ─── Header serialization ────────────────────────────────────────────────────

// Appends exactly HEADER_SIZE bytes to `out`.
void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out);

// std::nullopt if the magic is wrong or fewer than HEADER_SIZE bytes are given.
std::optional<MessageHeader> decode_header(std::span<const uint8_t> data);

// ─── Full message serialization ──────────────────────────────────────────────

// payload_len in the header is taken from the payload, not from msg.header.
std::vector<uint8_t> encode_message(const Message& msg);

// std::nullopt on any framing or size error.
std::optional<Message> decode_message(std::span<const uint8_t> data);

Message make_message(MessageType          type,
                     std::vector<uint8_t> payload,
                     RequestId            request_id = INVALID_REQUEST,
                     WindowId             window_id  = INVALID_WINDOW);

// ─── Payload serialization (TLV) ─────────────────────────────────────────────
// Each field: [tag: uint8_t] [len: uint32_t LE] [data: len bytes]
// Integers are little-endian.  Strings and nested blobs carry no terminator.
// Decoders skip unknown tags, so fields can be added without a version bump.

class PayloadEncoder
{
   public:
    void put_u16(uint8_t tag, uint16_t val);
    void put_u32(uint8_t tag, uint32_t val);
    void put_u64(uint8_t tag, uint64_t val);
    void put_i32(uint8_t tag, int32_t val);
    void put_bool(uint8_t tag, bool val);
    void put_string(uint8_t tag, const std::string& val);
    void put_blob(uint8_t tag, const std::vector<uint8_t>& blob);

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t>        take() { return std::move(buf_); }

   private:
    std::vector<uint8_t> buf_;
};

class PayloadDecoder
{
   public:
    explicit PayloadDecoder(std::span<const uint8_t> data);

    // Advances to the next field.  False at the end or on a truncated field.
    bool next();

    uint8_t  tag() const { return tag_; }
    uint32_t field_len() const { return len_; }

    // A field shorter than the requested width reads as 0.
    uint16_t                 as_u16() const;
    uint32_t                 as_u32() const;
    uint64_t                 as_u64() const;
    int32_t                  as_i32() const;
    bool                     as_bool() const;
    std::string              as_string() const;
    std::span<const uint8_t> as_blob() const;

   private:
    std::span<const uint8_t> data_;
    size_t                   pos_        = 0;
    uint8_t                  tag_        = 0;
    uint32_t                 len_        = 0;
    size_t                   val_offset_ = 0;
};

// ─── Field tags ──────────────────────────────────────────────────────────────

// HelloPayload / WelcomePayload
static constexpr uint8_t TAG_PROTOCOL_MAJOR = 0x10;
static constexpr uint8_t TAG_PROTOCOL_MINOR = 0x11;
static constexpr uint8_t TAG_CLIENT_BUILD   = 0x12;
static constexpr uint8_t TAG_SESSION_ID     = 0x20;
static constexpr uint8_t TAG_HEARTBEAT_MS   = 0x21;
static constexpr uint8_t TAG_HOST_NAME      = 0x22;

// Responses
static constexpr uint8_t TAG_REQUEST_ID    = 0x30;
static constexpr uint8_t TAG_ERROR_CODE    = 0x31;
static constexpr uint8_t TAG_ERROR_MESSAGE = 0x32;
static constexpr uint8_t TAG_ERROR_CAUSE   = 0x33;
static constexpr uint8_t TAG_RESULT_TAB    = 0x34;

// Commands and window requests
static constexpr uint8_t TAG_WINDOW_ID     = 0x40;
static constexpr uint8_t TAG_TAB_ID        = 0x41;
static constexpr uint8_t TAG_URL           = 0x42;
static constexpr uint8_t TAG_ACTIVATE      = 0x43;
static constexpr uint8_t TAG_POSITION      = 0x44;   // absent: end of strip
static constexpr uint8_t TAG_INDEX         = 0x45;
static constexpr uint8_t TAG_NAV_ACTION    = 0x46;
static constexpr uint8_t TAG_RECT_X        = 0x47;
static constexpr uint8_t TAG_RECT_Y        = 0x48;
static constexpr uint8_t TAG_RECT_W        = 0x49;
static constexpr uint8_t TAG_RECT_H        = 0x4A;
static constexpr uint8_t TAG_TARGET_WINDOW = 0x4B;
static constexpr uint8_t TAG_REASON        = 0x4C;

// EVT_WINDOW_STATE
static constexpr uint8_t TAG_REVISION   = 0x50;
static constexpr uint8_t TAG_ACTIVE_TAB = 0x51;
static constexpr uint8_t TAG_CLOSING    = 0x52;
static constexpr uint8_t TAG_TAB_IDS    = 0x53;   // repeated u64, strip order
static constexpr uint8_t TAG_TAB_BLOB   = 0x54;   // nested TLV, one per tab

// Nested TabRecord fields
static constexpr uint8_t TAG_TITLE                = 0x60;
static constexpr uint8_t TAG_FAVICON              = 0x61;
static constexpr uint8_t TAG_CAN_GO_BACK          = 0x62;
static constexpr uint8_t TAG_CAN_GO_FORWARD       = 0x63;
static constexpr uint8_t TAG_IS_LOADING           = 0x64;
static constexpr uint8_t TAG_LIFECYCLE            = 0x65;
static constexpr uint8_t TAG_DISPLAY_MODE         = 0x66;
static constexpr uint8_t TAG_SNAPSHOT_GENERATION  = 0x67;   // present iff frozen
static constexpr uint8_t TAG_SNAPSHOT_PLACEHOLDER = 0x68;
static constexpr uint8_t TAG_TAB_ERROR            = 0x69;

// ─── Handshake and response payloads ─────────────────────────────────────────

std::vector<uint8_t>        encode_hello(const HelloPayload& p);
std::optional<HelloPayload> decode_hello(std::span<const uint8_t> data);

std::vector<uint8_t>          encode_welcome(const WelcomePayload& p);
std::optional<WelcomePayload> decode_welcome(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_resp_ok(const RespOkPayload& p);
std::optional<RespOkPayload> decode_resp_ok(std::span<const uint8_t> data);

std::vector<uint8_t>          encode_resp_err(const RespErrPayload& p);
std::optional<RespErrPayload> decode_resp_err(std::span<const uint8_t> data);

// ─── Window payloads ─────────────────────────────────────────────────────────

std::vector<uint8_t>         encode_window(const WindowPayload& p);
std::optional<WindowPayload> decode_window(std::span<const uint8_t> data);

std::vector<uint8_t>                   encode_window_closing(const EvtWindowClosingPayload& p);
std::optional<EvtWindowClosingPayload> decode_window_closing(std::span<const uint8_t> data);

// ─── Commands ────────────────────────────────────────────────────────────────

MessageType command_message_type(const Command& cmd);
bool        is_command_message(MessageType type);

std::vector<uint8_t> encode_command(const Command& cmd);

// std::nullopt when `type` is not a command request.  Missing fields keep
// their defaults and are rejected later by the orchestrator.
std::optional<Command> decode_command(MessageType type, std::span<const uint8_t> data);

// ─── State push ──────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_window_snapshot(const WindowSnapshot& snap);

// Records come back in strip order.  last_accessed is not transmitted.
std::optional<WindowSnapshot> decode_window_snapshot(std::span<const uint8_t> data);

}   // namespace tabweave::ipc
