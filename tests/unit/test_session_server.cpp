#include "daemon/session_server.hpp"

#include <gtest/gtest.h>

#include "app/orchestrator.hpp"
#include "core/scheduler.hpp"
#include "host/headless_host.hpp"
#include "ipc/codec.hpp"
#include "ipc/transport.hpp"

#include <tabweave/logger.hpp>

#include <algorithm>
#include <memory>
#include <unistd.h>

using namespace tabweave;
using namespace tabweave::ipc;

#ifdef __linux__

namespace
{

class SessionServerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        Logger::instance().set_level(LogLevel::Critical);
        path_   = "/tmp/tabweave-session-test-" + std::to_string(::getpid()) + ".sock";
        orch_   = std::make_unique<Orchestrator>(host_, clock_);
        server_ = std::make_unique<daemon::SessionServer>(*orch_, host_.name());
        ASSERT_TRUE(server_->listen(path_));
    }

    void TearDown() override
    {
        clients_.clear();
        server_.reset();
        orch_.reset();
        Logger::instance().set_level(LogLevel::Info);
    }

    Connection& connect()
    {
        auto conn = Client::connect(path_);
        EXPECT_NE(conn, nullptr);
        clients_.push_back(std::move(conn));
        pump();
        return *clients_.back();
    }

    // Lets the daemon side catch up: socket traffic and orchestrator work.
    void pump()
    {
        for (int i = 0; i < 4; ++i)
        {
            server_->poll_once(std::chrono::milliseconds(5));
            orch_->tick();
        }
    }

    RequestId send(Connection& conn, MessageType type, std::vector<uint8_t> payload)
    {
        const RequestId id = next_request_++;
        EXPECT_TRUE(conn.send(make_message(type, std::move(payload), id)));
        pump();
        return id;
    }

    RequestId send_command(Connection& conn, const Command& cmd)
    {
        return send(conn, command_message_type(cmd), encode_command(cmd));
    }

    // Everything the daemon has written to `conn` so far.
    std::vector<Message> drain(Connection& conn)
    {
        std::vector<Message> out;
        conn.read_available();
        while (auto msg = conn.next_message())
            out.push_back(std::move(*msg));
        return out;
    }

    void handshake(Connection& conn)
    {
        send(conn, MessageType::HELLO, encode_hello({PROTOCOL_MAJOR, PROTOCOL_MINOR, "test-shell"}));
    }

    static const Message* find(const std::vector<Message>& msgs, MessageType type, RequestId id)
    {
        for (const auto& m : msgs)
        {
            if (m.header.type == type && m.header.request_id == id)
                return &m;
        }
        return nullptr;
    }

    static const Message* last_of(const std::vector<Message>& msgs, MessageType type)
    {
        for (auto it = msgs.rbegin(); it != msgs.rend(); ++it)
        {
            if (it->header.type == type)
                return &*it;
        }
        return nullptr;
    }

    std::string                              path_;
    ManualClock                              clock_;
    HeadlessHost                             host_;
    std::unique_ptr<Orchestrator>            orch_;
    std::unique_ptr<daemon::SessionServer>   server_;
    std::vector<std::unique_ptr<Connection>> clients_;
    RequestId                                next_request_ = 1;
};

}   // namespace

TEST_F(SessionServerTest, HelloGetsWelcome)
{
    Connection& conn = connect();
    EXPECT_EQ(server_->client_count(), 1u);

    handshake(conn);
    auto msgs = drain(conn);
    ASSERT_FALSE(msgs.empty());
    EXPECT_EQ(msgs.front().header.type, MessageType::WELCOME);
    EXPECT_EQ(msgs.front().header.session_id, server_->session_id());

    auto welcome = decode_welcome(msgs.front().payload);
    ASSERT_TRUE(welcome.has_value());
    EXPECT_EQ(welcome->session_id, server_->session_id());
    EXPECT_EQ(welcome->heartbeat_ms, 5000u);
    EXPECT_EQ(welcome->host_name, "headless");
}

TEST_F(SessionServerTest, RequestBeforeHelloIsRejected)
{
    Connection&     conn = connect();
    const RequestId id   = send(conn, MessageType::REQ_OPEN_WINDOW, encode_window({1}));

    auto msgs = drain(conn);
    const Message* err = find(msgs, MessageType::RESP_ERR, id);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(decode_resp_err(err->payload)->code, static_cast<uint32_t>(ErrorCode::InvalidArgument));
    EXPECT_FALSE(orch_->has_window(1));
}

TEST_F(SessionServerTest, WrongProtocolDropsClient)
{
    Connection& conn = connect();
    send(conn, MessageType::HELLO, encode_hello({PROTOCOL_MAJOR + 1, 0, "future-shell"}));

    auto msgs = drain(conn);
    ASSERT_FALSE(msgs.empty());
    EXPECT_EQ(msgs.front().header.type, MessageType::RESP_ERR);
    EXPECT_EQ(decode_resp_err(msgs.front().payload)->code, static_cast<uint32_t>(ErrorCode::Unsupported));
    EXPECT_EQ(server_->client_count(), 0u);
}

TEST_F(SessionServerTest, OpenWindowSendsState)
{
    Connection& conn = connect();
    handshake(conn);
    drain(conn);

    const RequestId id   = send(conn, MessageType::REQ_OPEN_WINDOW, encode_window({4}));
    auto            msgs = drain(conn);
    EXPECT_NE(find(msgs, MessageType::RESP_OK, id), nullptr);
    const Message* state = find(msgs, MessageType::EVT_WINDOW_STATE, id);
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->header.window_id, 4u);
    auto snap = decode_window_snapshot(state->payload);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->set.window_id, 4u);
    EXPECT_TRUE(snap->set.tab_ids.empty());
    EXPECT_TRUE(orch_->has_window(4));
}

TEST_F(SessionServerTest, CommandsAreAnswered)
{
    Connection& conn = connect();
    handshake(conn);
    send(conn, MessageType::REQ_OPEN_WINDOW, encode_window({1}));
    drain(conn);

    CreateTab create;
    create.window_id = 1;
    create.url       = "https://a.test";
    const RequestId id = send_command(conn, create);

    auto           msgs = drain(conn);
    const Message* ok   = find(msgs, MessageType::RESP_OK, id);
    ASSERT_NE(ok, nullptr);
    const TabId tab = decode_resp_ok(ok->payload)->tab_id;
    EXPECT_NE(tab, INVALID_TAB);

    // The last push reflects the finished load.
    const Message* push = last_of(msgs, MessageType::EVT_WINDOW_STATE);
    ASSERT_NE(push, nullptr);
    auto snap = decode_window_snapshot(push->payload);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->set.active_tab_id, tab);
    ASSERT_NE(snap->find_tab(tab), nullptr);
    EXPECT_EQ(snap->find_tab(tab)->title, "a.test");
    EXPECT_FALSE(snap->find_tab(tab)->is_loading);

    const RequestId bad = send_command(conn, CloseTab{999});
    msgs                = drain(conn);
    const Message* err  = find(msgs, MessageType::RESP_ERR, bad);
    ASSERT_NE(err, nullptr);
    auto p = decode_resp_err(err->payload);
    EXPECT_EQ(p->code, static_cast<uint32_t>(ErrorCode::NotFound));
    EXPECT_FALSE(p->message.empty());
}

TEST_F(SessionServerTest, GetStateForUnknownWindow)
{
    Connection& conn = connect();
    handshake(conn);
    const RequestId id = send(conn, MessageType::REQ_GET_STATE, encode_window({12}));

    auto           msgs = drain(conn);
    const Message* err  = find(msgs, MessageType::RESP_ERR, id);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(decode_resp_err(err->payload)->code, static_cast<uint32_t>(ErrorCode::InvalidWindow));
}

TEST_F(SessionServerTest, LateJoinerReceivesCurrentState)
{
    Connection& first = connect();
    handshake(first);
    send(first, MessageType::REQ_OPEN_WINDOW, encode_window({1}));
    CreateTab create;
    create.window_id = 1;
    create.url       = "https://a.test";
    send_command(first, create);

    Connection& second = connect();
    handshake(second);
    auto msgs = drain(second);
    ASSERT_GE(msgs.size(), 2u);
    EXPECT_EQ(msgs[0].header.type, MessageType::WELCOME);
    EXPECT_EQ(msgs[1].header.type, MessageType::EVT_WINDOW_STATE);
    auto snap = decode_window_snapshot(msgs[1].payload);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->set.tab_ids.size(), 1u);
}

TEST_F(SessionServerTest, ClosingReasons)
{
    Connection& conn = connect();
    handshake(conn);
    send(conn, MessageType::REQ_OPEN_WINDOW, encode_window({1}));
    send(conn, MessageType::REQ_OPEN_WINDOW, encode_window({2}));
    send(conn, MessageType::REQ_OPEN_WINDOW, encode_window({3}));

    CreateTab create;
    create.window_id = 1;
    create.url       = "https://x.test";
    send_command(conn, create);
    create.window_id = 2;
    create.url       = "https://y.test";
    send_command(conn, create);
    drain(conn);

    // Requested close
    const RequestId close_id = send(conn, MessageType::REQ_CLOSE_WINDOW, encode_window({3}));
    auto            msgs     = drain(conn);
    EXPECT_NE(find(msgs, MessageType::RESP_OK, close_id), nullptr);
    const Message* closing = last_of(msgs, MessageType::EVT_WINDOW_CLOSING);
    ASSERT_NE(closing, nullptr);
    EXPECT_EQ(decode_window_closing(closing->payload)->window_id, 3u);
    EXPECT_EQ(decode_window_closing(closing->payload)->reason, "closed");

    // Emptied by a transfer
    const TabId x = orch_->state().get_state(1)->set.tab_ids.front();
    send_command(conn, TransferTab{x, 2, std::nullopt});
    msgs    = drain(conn);
    closing = last_of(msgs, MessageType::EVT_WINDOW_CLOSING);
    ASSERT_NE(closing, nullptr);
    EXPECT_EQ(decode_window_closing(closing->payload)->window_id, 1u);
    EXPECT_EQ(decode_window_closing(closing->payload)->reason, "emptied");
    EXPECT_FALSE(orch_->has_window(1));
}

TEST_F(SessionServerTest, DisconnectedClientIsDropped)
{
    Connection& conn = connect();
    handshake(conn);
    ASSERT_EQ(server_->client_count(), 1u);

    conn.close();
    pump();
    EXPECT_EQ(server_->client_count(), 0u);
}

TEST_F(SessionServerTest, GarbageDropsClient)
{
    Connection& conn = connect();
    std::vector<uint8_t> garbage(HEADER_SIZE, 0x00);
    ASSERT_EQ(::write(conn.fd(), garbage.data(), garbage.size()), static_cast<ssize_t>(garbage.size()));
    pump();
    EXPECT_EQ(server_->client_count(), 0u);
}

#endif
