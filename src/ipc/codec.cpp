#include "codec.hpp"

#include <type_traits>

namespace tabweave::ipc
{

// ─── Little-endian helpers ───────────────────────────────────────────────────

static void write_u16_le(std::vector<uint8_t>& buf, uint16_t v)
{
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

static void write_u32_le(std::vector<uint8_t>& buf, uint32_t v)
{
    for (int i = 0; i < 4; ++i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static void write_u64_le(std::vector<uint8_t>& buf, uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static uint16_t read_u16_le(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static uint32_t read_u32_le(const uint8_t* p)
{
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i)
        v |= static_cast<uint32_t>(p[i]) << (i * 8);
    return v;
}

static uint64_t read_u64_le(const uint8_t* p)
{
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v |= static_cast<uint64_t>(p[i]) << (i * 8);
    return v;
}

const char* message_type_name(MessageType type)
{
    switch (type)
    {
        case MessageType::HELLO:              return "HELLO";
        case MessageType::WELCOME:            return "WELCOME";
        case MessageType::RESP_OK:            return "RESP_OK";
        case MessageType::RESP_ERR:           return "RESP_ERR";
        case MessageType::REQ_OPEN_WINDOW:    return "REQ_OPEN_WINDOW";
        case MessageType::REQ_CLOSE_WINDOW:   return "REQ_CLOSE_WINDOW";
        case MessageType::REQ_GET_STATE:      return "REQ_GET_STATE";
        case MessageType::REQ_CREATE_TAB:     return "REQ_CREATE_TAB";
        case MessageType::REQ_CLOSE_TAB:      return "REQ_CLOSE_TAB";
        case MessageType::REQ_SWITCH_TAB:     return "REQ_SWITCH_TAB";
        case MessageType::REQ_REORDER_TAB:    return "REQ_REORDER_TAB";
        case MessageType::REQ_NAVIGATE:       return "REQ_NAVIGATE";
        case MessageType::REQ_NAV_ACTION:     return "REQ_NAV_ACTION";
        case MessageType::REQ_SET_BOUNDS:     return "REQ_SET_BOUNDS";
        case MessageType::REQ_TRANSFER_TAB:   return "REQ_TRANSFER_TAB";
        case MessageType::REQ_REQUEST_FOCUS:  return "REQ_REQUEST_FOCUS";
        case MessageType::EVT_WINDOW_STATE:   return "EVT_WINDOW_STATE";
        case MessageType::EVT_WINDOW_CLOSING: return "EVT_WINDOW_CLOSING";
        case MessageType::EVT_HEARTBEAT:      return "EVT_HEARTBEAT";
    }
    return "UNKNOWN";
}

// ─── Header encode/decode ────────────────────────────────────────────────────

void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out)
{
    out.reserve(out.size() + HEADER_SIZE);
    out.push_back(MAGIC_0);
    out.push_back(MAGIC_1);
    write_u16_le(out, static_cast<uint16_t>(hdr.type));
    write_u32_le(out, hdr.payload_len);
    write_u64_le(out, hdr.seq);
    write_u64_le(out, hdr.request_id);
    write_u64_le(out, hdr.session_id);
    write_u64_le(out, hdr.window_id);
}

std::optional<MessageHeader> decode_header(std::span<const uint8_t> data)
{
    if (data.size() < HEADER_SIZE)
        return std::nullopt;
    if (data[0] != MAGIC_0 || data[1] != MAGIC_1)
        return std::nullopt;

    MessageHeader hdr;
    hdr.type        = static_cast<MessageType>(read_u16_le(&data[2]));
    hdr.payload_len = read_u32_le(&data[4]);
    hdr.seq         = read_u64_le(&data[8]);
    hdr.request_id  = read_u64_le(&data[16]);
    hdr.session_id  = read_u64_le(&data[24]);
    hdr.window_id   = read_u64_le(&data[32]);
    return hdr;
}

// ─── Full message encode/decode ──────────────────────────────────────────────

std::vector<uint8_t> encode_message(const Message& msg)
{
    std::vector<uint8_t> out;
    MessageHeader        hdr = msg.header;
    hdr.payload_len          = static_cast<uint32_t>(msg.payload.size());
    encode_header(hdr, out);
    out.insert(out.end(), msg.payload.begin(), msg.payload.end());
    return out;
}

std::optional<Message> decode_message(std::span<const uint8_t> data)
{
    auto hdr = decode_header(data);
    if (!hdr)
        return std::nullopt;
    if (hdr->payload_len > MAX_PAYLOAD_SIZE)
        return std::nullopt;
    if (data.size() < HEADER_SIZE + hdr->payload_len)
        return std::nullopt;

    Message msg;
    msg.header = *hdr;
    msg.payload.assign(data.begin() + HEADER_SIZE, data.begin() + HEADER_SIZE + hdr->payload_len);
    return msg;
}

Message make_message(MessageType type, std::vector<uint8_t> payload, RequestId request_id, WindowId window_id)
{
    Message msg;
    msg.header.type        = type;
    msg.header.request_id  = request_id;
    msg.header.window_id   = window_id;
    msg.header.payload_len = static_cast<uint32_t>(payload.size());
    msg.payload            = std::move(payload);
    return msg;
}

// ─── PayloadEncoder ──────────────────────────────────────────────────────────

void PayloadEncoder::put_u16(uint8_t tag, uint16_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 2);
    write_u16_le(buf_, val);
}

void PayloadEncoder::put_u32(uint8_t tag, uint32_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 4);
    write_u32_le(buf_, val);
}

void PayloadEncoder::put_u64(uint8_t tag, uint64_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 8);
    write_u64_le(buf_, val);
}

void PayloadEncoder::put_i32(uint8_t tag, int32_t val)
{
    put_u32(tag, static_cast<uint32_t>(val));
}

void PayloadEncoder::put_bool(uint8_t tag, bool val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 1);
    buf_.push_back(val ? 1 : 0);
}

void PayloadEncoder::put_string(uint8_t tag, const std::string& val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(val.size()));
    buf_.insert(buf_.end(), val.begin(), val.end());
}

void PayloadEncoder::put_blob(uint8_t tag, const std::vector<uint8_t>& blob)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(blob.size()));
    buf_.insert(buf_.end(), blob.begin(), blob.end());
}

// ─── PayloadDecoder ──────────────────────────────────────────────────────────

PayloadDecoder::PayloadDecoder(std::span<const uint8_t> data) : data_(data) {}

bool PayloadDecoder::next()
{
    // 1 byte tag + 4 bytes length
    if (pos_ + 5 > data_.size())
        return false;

    tag_        = data_[pos_];
    len_        = read_u32_le(&data_[pos_ + 1]);
    val_offset_ = pos_ + 5;

    if (len_ > data_.size() - val_offset_)
        return false;

    pos_ = val_offset_ + len_;
    return true;
}

uint16_t PayloadDecoder::as_u16() const
{
    return len_ < 2 ? 0 : read_u16_le(&data_[val_offset_]);
}

uint32_t PayloadDecoder::as_u32() const
{
    return len_ < 4 ? 0 : read_u32_le(&data_[val_offset_]);
}

uint64_t PayloadDecoder::as_u64() const
{
    return len_ < 8 ? 0 : read_u64_le(&data_[val_offset_]);
}

int32_t PayloadDecoder::as_i32() const
{
    return static_cast<int32_t>(as_u32());
}

bool PayloadDecoder::as_bool() const
{
    return len_ >= 1 && data_[val_offset_] != 0;
}

std::string PayloadDecoder::as_string() const
{
    if (len_ == 0)
        return {};
    return std::string(reinterpret_cast<const char*>(&data_[val_offset_]), len_);
}

std::span<const uint8_t> PayloadDecoder::as_blob() const
{
    return data_.subspan(val_offset_, len_);
}

// ─── Handshake and response payloads ─────────────────────────────────────────

std::vector<uint8_t> encode_hello(const HelloPayload& p)
{
    PayloadEncoder enc;
    enc.put_u16(TAG_PROTOCOL_MAJOR, p.protocol_major);
    enc.put_u16(TAG_PROTOCOL_MINOR, p.protocol_minor);
    enc.put_string(TAG_CLIENT_BUILD, p.client_build);
    return enc.take();
}

std::optional<HelloPayload> decode_hello(std::span<const uint8_t> data)
{
    HelloPayload   p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_PROTOCOL_MAJOR: p.protocol_major = dec.as_u16(); break;
            case TAG_PROTOCOL_MINOR: p.protocol_minor = dec.as_u16(); break;
            case TAG_CLIENT_BUILD:   p.client_build   = dec.as_string(); break;
            default: break;
        }
    }
    return p;
}

std::vector<uint8_t> encode_welcome(const WelcomePayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_SESSION_ID, p.session_id);
    enc.put_u32(TAG_HEARTBEAT_MS, p.heartbeat_ms);
    enc.put_string(TAG_HOST_NAME, p.host_name);
    return enc.take();
}

std::optional<WelcomePayload> decode_welcome(std::span<const uint8_t> data)
{
    WelcomePayload p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION_ID:   p.session_id   = dec.as_u64(); break;
            case TAG_HEARTBEAT_MS: p.heartbeat_ms = dec.as_u32(); break;
            case TAG_HOST_NAME:    p.host_name    = dec.as_string(); break;
            default: break;
        }
    }
    return p;
}

std::vector<uint8_t> encode_resp_ok(const RespOkPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_REQUEST_ID, p.request_id);
    if (p.tab_id != INVALID_TAB)
        enc.put_u64(TAG_RESULT_TAB, p.tab_id);
    return enc.take();
}

std::optional<RespOkPayload> decode_resp_ok(std::span<const uint8_t> data)
{
    RespOkPayload  p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_REQUEST_ID: p.request_id = dec.as_u64(); break;
            case TAG_RESULT_TAB: p.tab_id     = dec.as_u64(); break;
            default: break;
        }
    }
    return p;
}

std::vector<uint8_t> encode_resp_err(const RespErrPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_REQUEST_ID, p.request_id);
    enc.put_u32(TAG_ERROR_CODE, p.code);
    enc.put_u32(TAG_ERROR_CAUSE, p.cause);
    enc.put_string(TAG_ERROR_MESSAGE, p.message);
    if (p.tab_id != INVALID_TAB)
        enc.put_u64(TAG_RESULT_TAB, p.tab_id);
    return enc.take();
}

std::optional<RespErrPayload> decode_resp_err(std::span<const uint8_t> data)
{
    RespErrPayload p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_REQUEST_ID:    p.request_id = dec.as_u64(); break;
            case TAG_ERROR_CODE:    p.code       = dec.as_u32(); break;
            case TAG_ERROR_CAUSE:   p.cause      = dec.as_u32(); break;
            case TAG_ERROR_MESSAGE: p.message    = dec.as_string(); break;
            case TAG_RESULT_TAB:    p.tab_id     = dec.as_u64(); break;
            default: break;
        }
    }
    return p;
}

// ─── Window payloads ─────────────────────────────────────────────────────────

std::vector<uint8_t> encode_window(const WindowPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    return enc.take();
}

std::optional<WindowPayload> decode_window(std::span<const uint8_t> data)
{
    WindowPayload  p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_WINDOW_ID)
            p.window_id = dec.as_u64();
    }
    return p;
}

std::vector<uint8_t> encode_window_closing(const EvtWindowClosingPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    enc.put_string(TAG_REASON, p.reason);
    return enc.take();
}

std::optional<EvtWindowClosingPayload> decode_window_closing(std::span<const uint8_t> data)
{
    EvtWindowClosingPayload p;
    PayloadDecoder          dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_WINDOW_ID: p.window_id = dec.as_u64(); break;
            case TAG_REASON:    p.reason    = dec.as_string(); break;
            default: break;
        }
    }
    return p;
}

// ─── Commands ────────────────────────────────────────────────────────────────

MessageType command_message_type(const Command& cmd)
{
    return std::visit(
        [](const auto& c) -> MessageType
        {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, CreateTab>)
                return MessageType::REQ_CREATE_TAB;
            else if constexpr (std::is_same_v<T, CloseTab>)
                return MessageType::REQ_CLOSE_TAB;
            else if constexpr (std::is_same_v<T, SwitchActiveTab>)
                return MessageType::REQ_SWITCH_TAB;
            else if constexpr (std::is_same_v<T, ReorderTab>)
                return MessageType::REQ_REORDER_TAB;
            else if constexpr (std::is_same_v<T, Navigate>)
                return MessageType::REQ_NAVIGATE;
            else if constexpr (std::is_same_v<T, NavigationAction>)
                return MessageType::REQ_NAV_ACTION;
            else if constexpr (std::is_same_v<T, SetBounds>)
                return MessageType::REQ_SET_BOUNDS;
            else if constexpr (std::is_same_v<T, TransferTab>)
                return MessageType::REQ_TRANSFER_TAB;
            else
                return MessageType::REQ_REQUEST_FOCUS;
        },
        cmd);
}

bool is_command_message(MessageType type)
{
    auto v = static_cast<uint16_t>(type);
    return v >= static_cast<uint16_t>(MessageType::REQ_CREATE_TAB)
           && v <= static_cast<uint16_t>(MessageType::REQ_REQUEST_FOCUS);
}

std::vector<uint8_t> encode_command(const Command& cmd)
{
    PayloadEncoder enc;
    std::visit(
        [&enc](const auto& c)
        {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, CreateTab>)
            {
                enc.put_u64(TAG_WINDOW_ID, c.window_id);
                enc.put_string(TAG_URL, c.url);
                enc.put_bool(TAG_ACTIVATE, c.activate);
                if (c.position)
                    enc.put_u32(TAG_POSITION, *c.position);
            }
            else if constexpr (std::is_same_v<T, CloseTab> || std::is_same_v<T, RequestFocus>)
            {
                enc.put_u64(TAG_TAB_ID, c.tab_id);
            }
            else if constexpr (std::is_same_v<T, SwitchActiveTab>)
            {
                enc.put_u64(TAG_WINDOW_ID, c.window_id);
                enc.put_u64(TAG_TAB_ID, c.tab_id);
            }
            else if constexpr (std::is_same_v<T, ReorderTab>)
            {
                enc.put_u64(TAG_TAB_ID, c.tab_id);
                enc.put_u32(TAG_INDEX, c.index);
            }
            else if constexpr (std::is_same_v<T, Navigate>)
            {
                enc.put_u64(TAG_TAB_ID, c.tab_id);
                enc.put_string(TAG_URL, c.url);
            }
            else if constexpr (std::is_same_v<T, NavigationAction>)
            {
                enc.put_u64(TAG_TAB_ID, c.tab_id);
                enc.put_u16(TAG_NAV_ACTION, static_cast<uint16_t>(c.action));
            }
            else if constexpr (std::is_same_v<T, SetBounds>)
            {
                enc.put_u64(TAG_TAB_ID, c.tab_id);
                enc.put_i32(TAG_RECT_X, c.rect.x);
                enc.put_i32(TAG_RECT_Y, c.rect.y);
                enc.put_i32(TAG_RECT_W, c.rect.width);
                enc.put_i32(TAG_RECT_H, c.rect.height);
            }
            else if constexpr (std::is_same_v<T, TransferTab>)
            {
                enc.put_u64(TAG_TAB_ID, c.tab_id);
                enc.put_u64(TAG_TARGET_WINDOW, c.target_window_id);
                if (c.target_position)
                    enc.put_u32(TAG_POSITION, *c.target_position);
            }
        },
        cmd);
    return enc.take();
}

namespace
{

struct CommandFields
{
    WindowId                window_id = INVALID_WINDOW;
    TabId                   tab_id    = INVALID_TAB;
    WindowId                target    = INVALID_WINDOW;
    std::string             url;
    bool                    activate = true;
    std::optional<uint32_t> position;
    uint32_t                index  = 0;
    uint16_t                action = static_cast<uint16_t>(NavAction::Reload);
    Rect                    rect;
};

CommandFields read_command_fields(std::span<const uint8_t> data)
{
    CommandFields  f;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_WINDOW_ID:     f.window_id   = dec.as_u64(); break;
            case TAG_TAB_ID:        f.tab_id      = dec.as_u64(); break;
            case TAG_TARGET_WINDOW: f.target      = dec.as_u64(); break;
            case TAG_URL:           f.url         = dec.as_string(); break;
            case TAG_ACTIVATE:      f.activate    = dec.as_bool(); break;
            case TAG_POSITION:      f.position    = dec.as_u32(); break;
            case TAG_INDEX:         f.index       = dec.as_u32(); break;
            case TAG_NAV_ACTION:    f.action      = dec.as_u16(); break;
            case TAG_RECT_X:        f.rect.x      = dec.as_i32(); break;
            case TAG_RECT_Y:        f.rect.y      = dec.as_i32(); break;
            case TAG_RECT_W:        f.rect.width  = dec.as_i32(); break;
            case TAG_RECT_H:        f.rect.height = dec.as_i32(); break;
            default: break;
        }
    }
    return f;
}

}   // namespace

std::optional<Command> decode_command(MessageType type, std::span<const uint8_t> data)
{
    if (!is_command_message(type))
        return std::nullopt;

    CommandFields f = read_command_fields(data);
    switch (type)
    {
        case MessageType::REQ_CREATE_TAB:
            return CreateTab{f.window_id, f.url, f.activate, f.position};
        case MessageType::REQ_CLOSE_TAB:
            return CloseTab{f.tab_id};
        case MessageType::REQ_SWITCH_TAB:
            return SwitchActiveTab{f.window_id, f.tab_id};
        case MessageType::REQ_REORDER_TAB:
            return ReorderTab{f.tab_id, f.index};
        case MessageType::REQ_NAVIGATE:
            return Navigate{f.tab_id, f.url};
        case MessageType::REQ_NAV_ACTION:
            if (f.action < static_cast<uint16_t>(NavAction::Back)
                || f.action > static_cast<uint16_t>(NavAction::Stop))
                return std::nullopt;
            return NavigationAction{f.tab_id, static_cast<NavAction>(f.action)};
        case MessageType::REQ_SET_BOUNDS:
            return SetBounds{f.tab_id, f.rect};
        case MessageType::REQ_TRANSFER_TAB:
            return TransferTab{f.tab_id, f.target, f.position};
        case MessageType::REQ_REQUEST_FOCUS:
            return RequestFocus{f.tab_id};
        default:
            return std::nullopt;
    }
}

// ─── State push ──────────────────────────────────────────────────────────────

static std::vector<uint8_t> encode_tab_record(const TabRecord& t)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_TAB_ID, t.tab_id);
    enc.put_u64(TAG_WINDOW_ID, t.window_id);
    enc.put_string(TAG_URL, t.url);
    enc.put_string(TAG_TITLE, t.title);
    enc.put_string(TAG_FAVICON, t.favicon_url);
    enc.put_bool(TAG_CAN_GO_BACK, t.can_go_back);
    enc.put_bool(TAG_CAN_GO_FORWARD, t.can_go_forward);
    enc.put_bool(TAG_IS_LOADING, t.is_loading);
    enc.put_u16(TAG_LIFECYCLE, static_cast<uint16_t>(t.lifecycle));
    enc.put_u16(TAG_DISPLAY_MODE, static_cast<uint16_t>(t.display_mode));
    if (t.snapshot)
    {
        enc.put_u64(TAG_SNAPSHOT_GENERATION, t.snapshot->generation);
        enc.put_bool(TAG_SNAPSHOT_PLACEHOLDER, t.snapshot->placeholder);
    }
    if (!t.error.empty())
        enc.put_string(TAG_TAB_ERROR, t.error);
    return enc.take();
}

static TabRecord decode_tab_record(std::span<const uint8_t> data)
{
    TabRecord      t;
    PayloadDecoder dec(data);
    SnapshotRef    snap;
    bool           has_snapshot = false;
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_TAB_ID:         t.tab_id         = dec.as_u64(); break;
            case TAG_WINDOW_ID:      t.window_id      = dec.as_u64(); break;
            case TAG_URL:            t.url            = dec.as_string(); break;
            case TAG_TITLE:          t.title          = dec.as_string(); break;
            case TAG_FAVICON:        t.favicon_url    = dec.as_string(); break;
            case TAG_CAN_GO_BACK:    t.can_go_back    = dec.as_bool(); break;
            case TAG_CAN_GO_FORWARD: t.can_go_forward = dec.as_bool(); break;
            case TAG_IS_LOADING:     t.is_loading     = dec.as_bool(); break;
            case TAG_TAB_ERROR:      t.error          = dec.as_string(); break;
            case TAG_LIFECYCLE:
                t.lifecycle = static_cast<SurfaceState>(dec.as_u16());
                break;
            case TAG_DISPLAY_MODE:
                t.display_mode = dec.as_u16() == static_cast<uint16_t>(DisplayMode::Frozen)
                                     ? DisplayMode::Frozen
                                     : DisplayMode::Live;
                break;
            case TAG_SNAPSHOT_GENERATION:
                snap.generation = dec.as_u64();
                has_snapshot    = true;
                break;
            case TAG_SNAPSHOT_PLACEHOLDER:
                snap.placeholder = dec.as_bool();
                break;
            default: break;
        }
    }
    if (has_snapshot)
    {
        snap.tab_id = t.tab_id;
        t.snapshot  = snap;
    }
    return t;
}

std::vector<uint8_t> encode_window_snapshot(const WindowSnapshot& snap)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, snap.set.window_id);
    enc.put_u64(TAG_REVISION, snap.revision);
    enc.put_u64(TAG_ACTIVE_TAB, snap.set.active_tab_id);
    enc.put_bool(TAG_CLOSING, snap.set.closing);
    for (TabId id : snap.set.tab_ids)
        enc.put_u64(TAG_TAB_IDS, id);
    for (const auto& t : snap.tabs)
        enc.put_blob(TAG_TAB_BLOB, encode_tab_record(t));
    return enc.take();
}

std::optional<WindowSnapshot> decode_window_snapshot(std::span<const uint8_t> data)
{
    WindowSnapshot snap;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_WINDOW_ID:  snap.set.window_id     = dec.as_u64(); break;
            case TAG_REVISION:   snap.revision          = dec.as_u64(); break;
            case TAG_ACTIVE_TAB: snap.set.active_tab_id = dec.as_u64(); break;
            case TAG_CLOSING:    snap.set.closing       = dec.as_bool(); break;
            case TAG_TAB_IDS:    snap.set.tab_ids.push_back(dec.as_u64()); break;
            case TAG_TAB_BLOB:   snap.tabs.push_back(decode_tab_record(dec.as_blob())); break;
            default: break;
        }
    }

    // Records must mirror the strip one to one.
    if (snap.tabs.size() != snap.set.tab_ids.size())
        return std::nullopt;
    for (size_t i = 0; i < snap.tabs.size(); ++i)
    {
        if (snap.tabs[i].tab_id != snap.set.tab_ids[i])
            return std::nullopt;
    }
    return snap;
}

}   // namespace tabweave::ipc
