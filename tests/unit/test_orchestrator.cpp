#include <gtest/gtest.h>

#include <algorithm>

#include "util/orchestrator_fixture.hpp"

using namespace tabweave;
using namespace tabweave::test;

namespace
{

class OrchestratorTest : public OrchestratorFixture
{
   protected:
    TabRecord record(TabId tab) const { return orch_->state().tab(tab).value_or(TabRecord{}); }

    // Every push must be internally consistent: the active tab is nil or
    // listed, records follow the tab order, and a tab shows either its live
    // surface or its snapshot.
    void expect_consistent_pushes() const
    {
        for (const auto& push : pushes_)
        {
            const auto& set = push.snapshot.set;
            EXPECT_EQ(set.window_id, push.window_id);
            if (set.active_tab_id != INVALID_TAB)
            {
                EXPECT_NE(std::find(set.tab_ids.begin(), set.tab_ids.end(), set.active_tab_id),
                          set.tab_ids.end())
                    << "dangling active tab " << set.active_tab_id << " at revision "
                    << push.snapshot.revision;
            }
            ASSERT_EQ(push.snapshot.tabs.size(), set.tab_ids.size());
            for (size_t i = 0; i < set.tab_ids.size(); ++i)
            {
                const TabRecord& rec = push.snapshot.tabs[i];
                EXPECT_EQ(rec.tab_id, set.tab_ids[i]);
                if (rec.display_mode == DisplayMode::Live)
                    EXPECT_FALSE(rec.snapshot.has_value()) << "tab " << rec.tab_id;
                else
                    EXPECT_TRUE(rec.snapshot.has_value()) << "tab " << rec.tab_id;
            }
        }
    }
};

}   // namespace

// ─── Windows ─────────────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, OpenAndCloseWindow)
{
    EXPECT_FALSE(orch_->open_window(INVALID_WINDOW).ok());

    open(1);
    open(1);
    open(2);
    EXPECT_TRUE(orch_->has_window(1));
    EXPECT_EQ(orch_->windows(), (std::vector<WindowId>{1, 2}));

    std::vector<WindowId> closed;
    orch_->set_window_closed_listener([&](WindowId w) { closed.push_back(w); });

    const TabId a = create_tab(1, "https://a.test");
    create_tab(1, "https://b.test");
    EXPECT_EQ(host_.surface_count(), 2u);

    recorder_->clear();
    orch_->close_window(1);
    EXPECT_FALSE(orch_->has_window(1));
    EXPECT_EQ(host_.surface_count(), 0u);
    EXPECT_EQ(recorder_->count<TabClosed>(), 2u);
    EXPECT_FALSE(orch_->state().tab(a).has_value());
    EXPECT_EQ(closed, (std::vector<WindowId>{1}));

    orch_->close_window(1);
    EXPECT_EQ(closed.size(), 1u);
}

TEST_F(OrchestratorTest, CommandsForUnknownWindowFail)
{
    CreateTab cmd;
    cmd.window_id = 9;
    cmd.url       = "https://a.test";
    CommandResult r = orch_->dispatch(cmd);
    EXPECT_EQ(r.status.code, ErrorCode::InvalidWindow);
    EXPECT_EQ(host_.create_calls(), 0u);
}

// ─── Command routing ─────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, CreateTabPushesLoadedState)
{
    open(1);
    const TabId a = create_tab(1, "a.test/page");

    const WindowStateChanged* push = last_push(1);
    ASSERT_NE(push, nullptr);
    EXPECT_EQ(push->snapshot.set.active_tab_id, a);
    const TabRecord* rec = push->snapshot.find_tab(a);
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->url, "https://a.test/page");
    EXPECT_EQ(rec->title, "a.test");
    EXPECT_FALSE(rec->is_loading);
    EXPECT_EQ(rec->lifecycle, SurfaceState::Live);
    EXPECT_EQ(rec->display_mode, DisplayMode::Live);
    expect_consistent_pushes();
}

TEST_F(OrchestratorTest, PushRevisionsIncrease)
{
    open(1);
    create_tab(1, "https://a.test");
    create_tab(1, "https://b.test");

    uint64_t last = 0;
    for (const auto& push : pushes_)
    {
        EXPECT_GT(push.snapshot.revision, last);
        last = push.snapshot.revision;
    }
}

TEST_F(OrchestratorTest, NavigateAndBounds)
{
    open(1);
    const TabId a = create_tab(1, "https://a.test");

    EXPECT_TRUE(orch_->dispatch(Navigate{a, "https://b.test/x"}).ok());
    settle();
    EXPECT_EQ(last_push(1)->snapshot.find_tab(a)->url, "https://b.test/x");
    EXPECT_TRUE(last_push(1)->snapshot.find_tab(a)->can_go_back);

    const Rect rect{0, 40, 800, 560};
    EXPECT_TRUE(orch_->dispatch(SetBounds{a, rect}).ok());
    EXPECT_EQ(host_.info(surface_of(a))->bounds, rect);

    EXPECT_EQ(orch_->dispatch(Navigate{77, "https://c.test"}).status.code, ErrorCode::NotFound);
}

TEST_F(OrchestratorTest, RequestFocusRoutedToCoordinator)
{
    open(1);
    const TabId a = create_tab(1, "https://a.test");
    create_tab(1, "https://b.test");

    CommandResult r = orch_->dispatch(RequestFocus{a});
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.tab_id, a);
    EXPECT_EQ(orch_->focus().focused_tab(), a);
    EXPECT_EQ(host_.focused(), surface_of(a));

    EXPECT_EQ(orch_->dispatch(RequestFocus{99}).status.code, ErrorCode::NotFound);
}

// ─── Scenarios ───────────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, SwitchKeepsOtherTabsState)
{
    open(1);
    const TabId a = create_tab(1, "https://a.test");
    const TabId b = create_tab(1, "https://b.test", false);
    ASSERT_EQ(state(1).set.active_tab_id, a);

    const bool b_loading = record(b).is_loading;
    pushes_.clear();
    EXPECT_TRUE(switch_to(1, b).ok());

    const WindowStateChanged* push = last_push(1);
    ASSERT_NE(push, nullptr);
    EXPECT_EQ(push->snapshot.set.active_tab_id, b);
    EXPECT_EQ(push->snapshot.find_tab(a)->display_mode, DisplayMode::Live);
    EXPECT_EQ(push->snapshot.find_tab(b)->is_loading, b_loading);
    EXPECT_TRUE(host_.info(surface_of(b))->visible);
    EXPECT_FALSE(host_.info(surface_of(a))->visible);
}

TEST_F(OrchestratorTest, FrozenTabRefocusedAfterLoad)
{
    open(1);
    const TabId a = create_tab(1, "https://a.test/story");
    const TabId b = create_tab(1, "https://b.test");
    advance(3000ms);
    ASSERT_EQ(record(a).display_mode, DisplayMode::Frozen);
    ASSERT_EQ(host_.surface_count(), 1u);

    host_.set_auto_complete_loads(false);
    recorder_->clear();
    switch_to(1, a);
    EXPECT_TRUE(orch_->dispatch(RequestFocus{a}).ok());
    settle();

    EXPECT_GE(recorder_->index_of<SurfaceNeeded>(a), 0);
    const HostSurfaceId id = surface_of(a);
    ASSERT_NE(id, INVALID_HOST_SURFACE);
    EXPECT_EQ(host_.info(id)->url, "https://a.test/story");
    EXPECT_EQ(last_push(1)->snapshot.find_tab(a)->display_mode, DisplayMode::Frozen);
    EXPECT_NE(host_.focused(), id);

    host_.complete_load(id);
    settle();
    EXPECT_EQ(last_push(1)->snapshot.find_tab(a)->display_mode, DisplayMode::Live);
    EXPECT_EQ(lifecycle(a), SurfaceState::Live);
    EXPECT_EQ(host_.focused(), id);
    EXPECT_NE(lifecycle(b), SurfaceState::Destroyed);
    expect_consistent_pushes();
}

TEST_F(OrchestratorTest, TransferEmptiesAndClosesSource)
{
    open(1);
    open(2);
    const TabId x = create_tab(1, "https://x.test");
    const TabId y = create_tab(2, "https://y.test");

    std::vector<WindowId> closed;
    orch_->set_window_closed_listener([&](WindowId w) { closed.push_back(w); });

    TransferTab cmd;
    cmd.tab_id           = x;
    cmd.target_window_id = 2;
    EXPECT_TRUE(orch_->dispatch(cmd).ok());
    EXPECT_EQ(recorder_->count<WindowMarkedForClosure>(), 1u);

    settle();
    EXPECT_EQ(closed, (std::vector<WindowId>{1}));
    EXPECT_FALSE(orch_->has_window(1));

    const WindowSnapshot w2 = state(2);
    EXPECT_EQ(std::count(w2.set.tab_ids.begin(), w2.set.tab_ids.end(), x), 1);
    EXPECT_EQ(w2.set.tab_ids, (std::vector<TabId>{y, x}));
    EXPECT_EQ(w2.set.active_tab_id, x);
    EXPECT_EQ(lifecycle(x), SurfaceState::Live);
    EXPECT_EQ(host_.info(surface_of(x))->window, 2u);
}

TEST_F(OrchestratorTest, FailedTransferLeavesTabInSource)
{
    open(1);
    open(2);
    const TabId x = create_tab(1, "https://x.test");
    create_tab(2, "https://y.test");

    host_.fail_next_reparent();
    TransferTab cmd;
    cmd.tab_id           = x;
    cmd.target_window_id = 2;
    CommandResult r = orch_->dispatch(cmd);
    settle();

    EXPECT_EQ(r.status.code, ErrorCode::TransferFailed);
    EXPECT_TRUE(orch_->has_window(1));
    EXPECT_EQ(state(1).set.tab_ids, (std::vector<TabId>{x}));
    const auto& ids2 = state(2).set.tab_ids;
    EXPECT_EQ(std::find(ids2.begin(), ids2.end(), x), ids2.end());
    EXPECT_EQ(orch_->state().window_of(x), 1u);
    expect_consistent_pushes();
}

TEST_F(OrchestratorTest, CreateTabIntoEmptiedWindowRejected)
{
    open(1);
    open(2);
    const TabId x = create_tab(1, "https://x.test");
    create_tab(2, "https://y.test");

    ASSERT_TRUE(orch_->dispatch(TransferTab{x, 2, std::nullopt}).ok());

    // Window 1 is marked for closure but not torn down until the next tick
    CreateTab cmd;
    cmd.window_id   = 1;
    cmd.url         = "https://new.test";
    CommandResult r = orch_->dispatch(cmd);
    EXPECT_EQ(r.status.code, ErrorCode::InvalidWindow);
    EXPECT_EQ(r.tab_id, INVALID_TAB);
    EXPECT_EQ(host_.surface_count(), 2u);

    settle();
    EXPECT_FALSE(orch_->has_window(1));
    EXPECT_EQ(state(2).set.tab_ids.size(), 2u);
    EXPECT_EQ(host_.surface_count(), 2u);
}

TEST_F(OrchestratorTest, ClosedTabsReleaseSurfaceEntries)
{
    open(1);
    const TabId keep = create_tab(1, "https://keep.test");

    for (int i = 0; i < 200; ++i)
    {
        const TabId tab = create_tab(1, "https://bg" + std::to_string(i) + ".test", false);
        ASSERT_TRUE(orch_->dispatch(CloseTab{tab}).ok());
    }
    advance(100ms);

    EXPECT_EQ(orch_->views().entry_count(), 1u);
    EXPECT_EQ(host_.surface_count(), 1u);
    EXPECT_EQ(state(1).set.tab_ids, (std::vector<TabId>{keep}));
    EXPECT_EQ(lifecycle(keep), SurfaceState::Live);
    EXPECT_EQ(lifecycle(keep + 1), SurfaceState::Destroyed);
}

// ─── Host-initiated tabs ─────────────────────────────────────────────────────

TEST_F(OrchestratorTest, OpenedUrlInsertedAfterOpener)
{
    open(1);
    const TabId a = create_tab(1, "https://a.test");
    const TabId b = create_tab(1, "https://b.test");
    switch_to(1, a);

    ASSERT_TRUE(host_.simulate_open_url(surface_of(a), "c.test", false));
    settle();

    const WindowSnapshot snap = state(1);
    ASSERT_EQ(snap.set.tab_ids.size(), 3u);
    EXPECT_EQ(snap.set.tab_ids[0], a);
    EXPECT_EQ(snap.set.tab_ids[2], b);
    const TabId c = snap.set.tab_ids[1];
    EXPECT_EQ(snap.set.active_tab_id, c);
    EXPECT_EQ(snap.find_tab(c)->url, "https://c.test");
    EXPECT_EQ(lifecycle(c), SurfaceState::Live);
}

TEST_F(OrchestratorTest, BackgroundOpenKeepsActiveTab)
{
    open(1);
    const TabId a = create_tab(1, "https://a.test");

    ASSERT_TRUE(host_.simulate_open_url(surface_of(a), "https://c.test", true));
    settle();

    const WindowSnapshot snap = state(1);
    ASSERT_EQ(snap.set.tab_ids.size(), 2u);
    EXPECT_EQ(snap.set.active_tab_id, a);
    EXPECT_TRUE(orch_->snapshots().freeze_pending(snap.set.tab_ids[1]));
}

TEST_F(OrchestratorTest, EmptyOpenRequestIgnored)
{
    open(1);
    const TabId a = create_tab(1, "https://a.test");

    ASSERT_TRUE(host_.simulate_open_url(surface_of(a), "   ", false));
    settle();
    EXPECT_EQ(state(1).set.tab_ids.size(), 1u);
}

// ─── Asynchronous completion ─────────────────────────────────────────────────

TEST_F(OrchestratorTest, InterleavedCompletionsSettle)
{
    open(1);
    host_.set_interleave_reversed(true);

    std::vector<TabId> tabs;
    for (const char* url : {"https://a.test", "https://b.test", "https://c.test"})
    {
        CreateTab cmd;
        cmd.window_id = 1;
        cmd.url       = url;
        CommandResult r = orch_->dispatch(cmd);
        ASSERT_TRUE(r.ok());
        tabs.push_back(r.tab_id);
    }
    EXPECT_EQ(host_.queued(), 15u);
    settle();

    const WindowSnapshot snap = state(1);
    EXPECT_EQ(snap.set.tab_ids, tabs);
    EXPECT_EQ(snap.set.active_tab_id, tabs.back());
    for (TabId t : tabs)
    {
        EXPECT_EQ(lifecycle(t), SurfaceState::Live);
        EXPECT_FALSE(snap.find_tab(t)->is_loading);
    }
    EXPECT_TRUE(host_.info(surface_of(tabs.back()))->visible);
    EXPECT_FALSE(host_.info(surface_of(tabs.front()))->visible);
    expect_consistent_pushes();
}

TEST_F(OrchestratorTest, RemountWithinDebounceKeepsSurface)
{
    open(1);
    const TabId a = create_tab(1, "https://a.test");
    const HostSurfaceId id = surface_of(a);

    orch_->views().destroy_surface(a);
    EXPECT_TRUE(orch_->views().create_surface(1, a, "https://a.test").ok());
    advance(200ms);

    EXPECT_EQ(surface_of(a), id);
    EXPECT_EQ(lifecycle(a), SurfaceState::Live);
    EXPECT_EQ(host_.destroy_calls(), 0u);
    EXPECT_EQ(host_.create_calls(), 1u);
    EXPECT_EQ(recorder_->count<SurfaceDestroyed>(), 0u);
}

TEST_F(OrchestratorTest, ClosingLastTabEmptiesWindow)
{
    open(1);
    const TabId a = create_tab(1, "https://a.test");

    pushes_.clear();
    EXPECT_TRUE(orch_->dispatch(CloseTab{a}).ok());
    ASSERT_NE(last_push(1), nullptr);
    EXPECT_TRUE(last_push(1)->snapshot.set.tab_ids.empty());
    EXPECT_EQ(last_push(1)->snapshot.set.active_tab_id, INVALID_TAB);

    advance(100ms);
    EXPECT_EQ(host_.surface_count(), 0u);
    EXPECT_TRUE(orch_->has_window(1));

    const TabId b = create_tab(1, "https://b.test");
    EXPECT_EQ(state(1).set.tab_ids, (std::vector<TabId>{b}));
}

// ─── Scheduling ──────────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, NextWakeupFollowsTimers)
{
    EXPECT_FALSE(orch_->next_wakeup().has_value());
    EXPECT_EQ(orch_->tick(), 0u);

    open(1);
    create_tab(1, "https://a.test");
    create_tab(1, "https://b.test");

    auto wake = orch_->next_wakeup();
    ASSERT_TRUE(wake.has_value());
    EXPECT_EQ(*wake, 3000ms);

    advance(1000ms);
    EXPECT_EQ(*orch_->next_wakeup(), 2000ms);
}

TEST_F(OrchestratorTest, MixedWorkloadKeepsInvariants)
{
    open(1);
    open(2);
    std::vector<TabId> tabs;
    for (int i = 0; i < 4; ++i)
        tabs.push_back(create_tab(1, "https://t" + std::to_string(i) + ".test"));
    const TabId other = create_tab(2, "https://other.test");

    advance(3000ms);
    switch_to(1, tabs[0]);
    EXPECT_TRUE(orch_->dispatch(CloseTab{tabs[3]}).ok());
    settle();

    TransferTab cmd;
    cmd.tab_id           = tabs[1];
    cmd.target_window_id = 2;
    EXPECT_TRUE(orch_->dispatch(cmd).ok());
    settle();
    switch_to(2, other);
    advance(3000ms);
    EXPECT_TRUE(orch_->dispatch(ReorderTab{tabs[2], 0}).ok());
    advance(5000ms);

    expect_consistent_pushes();
    EXPECT_LE(orch_->views().live_count(), static_cast<size_t>(orch_->config().max_live_surfaces));
}
