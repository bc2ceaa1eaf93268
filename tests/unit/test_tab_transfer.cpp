#include <gtest/gtest.h>

#include <thread>

#include "util/orchestrator_fixture.hpp"

using namespace tabweave;
using namespace tabweave::test;

namespace
{

class TabTransferTest : public OrchestratorFixture
{
   protected:
    void SetUp() override
    {
        OrchestratorFixture::SetUp();
        open(1);
        open(2);
        a_ = create_tab(1, "https://a.test");
        b_ = create_tab(1, "https://b.test");
        c_ = create_tab(2, "https://c.test");
        pushes_.clear();
        recorder_->clear();
    }

    Status transfer(TabId tab, WindowId target, std::optional<uint32_t> position = std::nullopt)
    {
        CommandResult r = orch_->dispatch(TransferTab{tab, target, position});
        settle();
        return r.status;
    }

    TabId a_ = INVALID_TAB;
    TabId b_ = INVALID_TAB;
    TabId c_ = INVALID_TAB;
};

}   // namespace

// ─── Success ─────────────────────────────────────────────────────────────────

TEST_F(TabTransferTest, MovesRecordAndSurface)
{
    const HostSurfaceId id = surface_of(b_);
    ASSERT_TRUE(transfer(b_, 2).ok());

    EXPECT_EQ(state(1).set.tab_ids, (std::vector<TabId>{a_}));
    EXPECT_EQ(state(2).set.tab_ids, (std::vector<TabId>{c_, b_}));
    EXPECT_EQ(state(1).set.active_tab_id, a_);
    EXPECT_EQ(state(2).set.active_tab_id, b_);
    EXPECT_EQ(orch_->state().window_of(b_), 2u);
    EXPECT_EQ(orch_->views().window_of(b_), 2u);

    // Re-parented in place: same surface, no reload
    EXPECT_EQ(surface_of(b_), id);
    EXPECT_EQ(host_.info(id)->window, 2u);
    EXPECT_TRUE(host_.info(id)->visible);
    EXPECT_FALSE(host_.info(surface_of(c_))->visible);
    EXPECT_EQ(host_.create_calls(), 3u);
}

TEST_F(TabTransferTest, KeepsPageState)
{
    host_.simulate_title(surface_of(b_), "Bee");
    settle();
    ASSERT_TRUE(transfer(b_, 2).ok());

    auto rec = orch_->state().tab(b_);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->title, "Bee");
    EXPECT_EQ(rec->url, "https://b.test");
    EXPECT_EQ(rec->window_id, 2u);
}

TEST_F(TabTransferTest, InsertsAtPosition)
{
    ASSERT_TRUE(transfer(a_, 2, 0).ok());
    EXPECT_EQ(state(2).set.tab_ids, (std::vector<TabId>{a_, c_}));
}

TEST_F(TabTransferTest, PublishesActivations)
{
    ASSERT_TRUE(transfer(b_, 2).ok());
    auto acts = recorder_->all<TabActivated>();
    ASSERT_EQ(acts.size(), 2u);
    EXPECT_EQ(acts[0].window_id, 2u);
    EXPECT_EQ(acts[0].tab_id, b_);
    EXPECT_EQ(acts[0].previous, c_);
    EXPECT_EQ(acts[1].window_id, 1u);
    EXPECT_EQ(acts[1].tab_id, a_);
}

TEST_F(TabTransferTest, BothWindowsPushedOnce)
{
    ASSERT_TRUE(transfer(b_, 2).ok());
    ASSERT_GE(pushes_.size(), 2u);
    EXPECT_EQ(pushes_[0].window_id, 1u);
    EXPECT_EQ(pushes_[1].window_id, 2u);
    EXPECT_EQ(pushes_[0].snapshot.set.tab_ids.size(), 1u);
    EXPECT_EQ(pushes_[1].snapshot.set.tab_ids.size(), 2u);
}

TEST_F(TabTransferTest, EmptiedSourceWindowCloses)
{
    std::vector<WindowId> closed;
    orch_->set_window_closed_listener([&](WindowId w) { closed.push_back(w); });

    ASSERT_TRUE(transfer(c_, 1).ok());
    EXPECT_EQ(recorder_->count<WindowMarkedForClosure>(), 1u);
    EXPECT_EQ(closed, (std::vector<WindowId>{2}));
    EXPECT_FALSE(orch_->has_window(2));
    EXPECT_EQ(state(1).set.tab_ids, (std::vector<TabId>{a_, b_, c_}));
    EXPECT_EQ(lifecycle(c_), SurfaceState::Live);
    EXPECT_EQ(host_.info(surface_of(c_))->window, 1u);
}

TEST_F(TabTransferTest, SameWindowIsReorder)
{
    ASSERT_TRUE(transfer(b_, 1, 0).ok());
    EXPECT_EQ(state(1).set.tab_ids, (std::vector<TabId>{b_, a_}));
    EXPECT_EQ(recorder_->count<WindowMarkedForClosure>(), 0u);
}

TEST_F(TabTransferTest, FallbackRecreatesSurfaceAtSameUrl)
{
    host_.set_reparent_supported(false);
    const HostSurfaceId old = surface_of(b_);
    ASSERT_TRUE(transfer(b_, 2).ok());

    EXPECT_NE(surface_of(b_), old);
    EXPECT_FALSE(host_.info(old).has_value());
    auto info = host_.info(surface_of(b_));
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->window, 2u);
    EXPECT_EQ(info->url, "https://b.test");
    EXPECT_EQ(lifecycle(b_), SurfaceState::Live);
}

TEST_F(TabTransferTest, FrozenTabMovesWithoutSurface)
{
    advance(3000ms);
    ASSERT_TRUE(orch_->snapshots().is_frozen(a_));

    ASSERT_TRUE(transfer(a_, 2).ok());
    EXPECT_EQ(orch_->state().window_of(a_), 2u);
    // Activated in the target, so it comes back to life there
    EXPECT_EQ(lifecycle(a_), SurfaceState::Live);
    EXPECT_EQ(host_.info(surface_of(a_))->window, 2u);
}

// ─── Failure and rollback ────────────────────────────────────────────────────

TEST_F(TabTransferTest, RefusedReparentRollsBack)
{
    host_.fail_next_reparent();
    const auto before1 = state(1);
    const auto before2 = state(2);

    Status st = transfer(b_, 2);
    EXPECT_EQ(st.code, ErrorCode::TransferFailed);
    EXPECT_EQ(st.cause, ErrorCode::ResourceExhausted);

    EXPECT_EQ(state(1).set.tab_ids, before1.set.tab_ids);
    EXPECT_EQ(state(1).set.active_tab_id, before1.set.active_tab_id);
    EXPECT_EQ(state(2).set.tab_ids, before2.set.tab_ids);
    EXPECT_EQ(state(1).revision, before1.revision);
    EXPECT_EQ(orch_->state().window_of(b_), 1u);
    EXPECT_EQ(host_.info(surface_of(b_))->window, 1u);
    EXPECT_TRUE(pushes_.empty());
    EXPECT_EQ(recorder_->count<TabActivated>(), 0u);
}

TEST_F(TabTransferTest, RefusedRecreateRollsBack)
{
    host_.set_reparent_supported(false);
    host_.set_surface_limit(3);
    const HostSurfaceId id = surface_of(b_);

    Status st = transfer(b_, 2);
    EXPECT_EQ(st.code, ErrorCode::TransferFailed);
    EXPECT_EQ(st.cause, ErrorCode::ResourceExhausted);
    EXPECT_EQ(surface_of(b_), id);
    EXPECT_TRUE(host_.info(id).has_value());
    EXPECT_EQ(orch_->state().window_of(b_), 1u);
}

TEST_F(TabTransferTest, UnknownTargetWindow)
{
    Status st = transfer(b_, 9);
    EXPECT_EQ(st.code, ErrorCode::TransferFailed);
    EXPECT_EQ(st.cause, ErrorCode::InvalidWindow);
    EXPECT_EQ(orch_->state().window_of(b_), 1u);
    EXPECT_FALSE(orch_->state().get_state(9).has_value());
}

TEST_F(TabTransferTest, UnknownTab)
{
    Status st = transfer(999, 2);
    EXPECT_EQ(st.code, ErrorCode::TransferFailed);
    EXPECT_EQ(st.cause, ErrorCode::NotFound);
}

TEST_F(TabTransferTest, StaleSourceIsRejected)
{
    Status st = orch_->transfers().transfer_tab(b_, 2, 1);
    EXPECT_EQ(st.code, ErrorCode::TransferFailed);
    EXPECT_EQ(st.cause, ErrorCode::NotFound);
}

// ─── Concurrency ─────────────────────────────────────────────────────────────

TEST_F(TabTransferTest, TargetMarkedClosingIsRejected)
{
    orch_->state().mark_window_closing(2);
    Status st = orch_->transfers().transfer_tab(b_, 1, 2);
    EXPECT_EQ(st.code, ErrorCode::TransferFailed);
    EXPECT_EQ(st.cause, ErrorCode::InvalidWindow);
    EXPECT_EQ(orch_->state().window_of(b_), 1u);
}

TEST_F(TabTransferTest, OppositeTransfersDoNotDeadlock)
{
    create_tab(2, "https://d.test");
    // The recorders are not thread-safe
    recorder_.reset();
    orch_->set_state_listener(nullptr);

    std::thread t1([this] { orch_->dispatch(TransferTab{a_, 2, std::nullopt}); });
    std::thread t2([this] { orch_->dispatch(TransferTab{c_, 1, std::nullopt}); });
    t1.join();
    t2.join();
    settle();

    EXPECT_EQ(orch_->state().window_of(a_), 2u);
    EXPECT_EQ(orch_->state().window_of(c_), 1u);
    EXPECT_EQ(orch_->state().tab_count(), 4u);
}
