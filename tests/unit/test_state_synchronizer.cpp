#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "bus/event_bus.hpp"
#include "core/scheduler.hpp"
#include "host/headless_host.hpp"
#include "state/state_synchronizer.hpp"
#include "view/view_lifecycle_manager.hpp"

#include <tabweave/logger.hpp>

using namespace tabweave;
using namespace std::chrono_literals;

namespace
{

class StateSynchronizerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        Logger::instance().set_level(LogLevel::Critical);
        views_ = std::make_unique<ViewLifecycleManager>(host_, bus_, sched_);
        state_ = std::make_unique<StateSynchronizer>(*views_, bus_);
        views_->register_window(1);
        views_->register_window(2);
        listener_ = state_->subscribe_all([this](const WindowSnapshot& s) { pushes_.push_back(s); });
        subs_.push_back(bus_.on<TabActivated>([this](const TabActivated& e) { activated_.push_back(e); }));
        subs_.push_back(bus_.on<TabClosed>([this](const TabClosed& e) { closed_.push_back(e); }));
    }

    void TearDown() override
    {
        for (auto& unsub : subs_)
            unsub();
        state_.reset();
        views_.reset();
        Logger::instance().set_level(LogLevel::Info);
    }

    void pump()
    {
        host_.pump();
        sched_.run_due();
    }

    TabId create(WindowId window, const std::string& url, bool activate = true,
                 std::optional<uint32_t> position = std::nullopt)
    {
        CreateTab cmd;
        cmd.window_id = window;
        cmd.url       = url;
        cmd.activate  = activate;
        cmd.position  = position;
        CommandResult r = state_->apply_command(cmd);
        EXPECT_TRUE(r.ok()) << r.status.to_string();
        return r.tab_id;
    }

    std::vector<TabId> ids(WindowId window) const
    {
        auto snap = state_->get_state(window);
        return snap ? snap->set.tab_ids : std::vector<TabId>{};
    }

    TabId active(WindowId window) const
    {
        auto snap = state_->get_state(window);
        return snap ? snap->set.active_tab_id : INVALID_TAB;
    }

    ManualClock                           clock_;
    Scheduler                             sched_{clock_};
    EventBus                              bus_;
    HeadlessHost                          host_;
    std::unique_ptr<ViewLifecycleManager> views_;
    std::unique_ptr<StateSynchronizer>    state_;

    StateSynchronizer::ListenerId       listener_ = 0;
    std::vector<WindowSnapshot>         pushes_;
    std::vector<TabActivated>           activated_;
    std::vector<TabClosed>              closed_;
    std::vector<EventBus::Unsubscriber> subs_;
};

}   // namespace

// ─── CreateTab ───────────────────────────────────────────────────────────────

TEST_F(StateSynchronizerTest, CreateFirstTabActivatesIt)
{
    TabId tab = create(1, "example.com", false);
    EXPECT_NE(tab, INVALID_TAB);
    EXPECT_EQ(ids(1), (std::vector<TabId>{tab}));
    EXPECT_EQ(active(1), tab);

    auto rec = state_->tab(tab);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->url, "https://example.com");
    EXPECT_EQ(rec->window_id, 1u);
    EXPECT_EQ(state_->window_of(tab), 1u);
    ASSERT_EQ(activated_.size(), 1u);
    EXPECT_EQ(activated_[0].previous, INVALID_TAB);
}

TEST_F(StateSynchronizerTest, CreateIdsAreUnique)
{
    TabId a = create(1, "a.test");
    TabId b = create(2, "b.test");
    TabId c = create(1, "c.test");
    EXPECT_NE(a, b);
    EXPECT_NE(b, c);
    EXPECT_NE(a, c);
    EXPECT_EQ(state_->tab_count(), 3u);
}

TEST_F(StateSynchronizerTest, CreateBackgroundKeepsActive)
{
    TabId a = create(1, "a.test");
    TabId b = create(1, "b.test", false);
    EXPECT_EQ(active(1), a);
    EXPECT_EQ(ids(1), (std::vector<TabId>{a, b}));
    EXPECT_FALSE(views_->desired_visible(b));
    EXPECT_TRUE(views_->desired_visible(a));
}

TEST_F(StateSynchronizerTest, CreateAtPosition)
{
    TabId a = create(1, "a.test");
    TabId b = create(1, "b.test");
    TabId c = create(1, "c.test", true, 1);
    TabId d = create(1, "d.test", true, 99);
    EXPECT_EQ(ids(1), (std::vector<TabId>{a, c, b, d}));
}

TEST_F(StateSynchronizerTest, CreateEmptyUrlUsesDefault)
{
    TabId tab = create(1, "   ");
    EXPECT_EQ(state_->tab(tab)->url, "about:blank");
}

TEST_F(StateSynchronizerTest, CreateInUnknownWindow)
{
    CommandResult r = state_->apply_command(CreateTab{9, "a.test"});
    EXPECT_EQ(r.status.code, ErrorCode::InvalidWindow);
    EXPECT_FALSE(state_->get_state(9).has_value());
}

TEST_F(StateSynchronizerTest, CreateWithRefusedSurfaceKeepsRecordWithError)
{
    host_.set_surface_limit(1);
    create(1, "a.test");

    CommandResult r = state_->apply_command(CreateTab{1, "b.test"});
    EXPECT_EQ(r.status.code, ErrorCode::ResourceExhausted);
    ASSERT_NE(r.tab_id, INVALID_TAB);

    auto rec = state_->tab(r.tab_id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_FALSE(rec->error.empty());
    EXPECT_EQ(ids(1).size(), 2u);
}

// ─── Folding bus events ──────────────────────────────────────────────────────

TEST_F(StateSynchronizerTest, HostActivityFoldsIntoRecord)
{
    TabId tab = create(1, "https://example.com/index");
    pump();

    auto rec = state_->tab(tab);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->title, "example.com");
    EXPECT_FALSE(rec->is_loading);
    EXPECT_EQ(rec->lifecycle, SurfaceState::Live);

    const HostSurfaceId id = views_->host_surface(tab);
    host_.simulate_title(id, "Example Domain");
    host_.simulate_favicon(id, "https://example.com/favicon.ico");
    host_.simulate_in_page_navigation(id, "https://example.com/index#part");
    pump();

    rec = state_->tab(tab);
    EXPECT_EQ(rec->title, "Example Domain");
    EXPECT_EQ(rec->favicon_url, "https://example.com/favicon.ico");
    EXPECT_EQ(rec->url, "https://example.com/index#part");
    EXPECT_TRUE(rec->can_go_back);
    EXPECT_FALSE(rec->can_go_forward);
}

TEST_F(StateSynchronizerTest, LoadingFlagAndFailure)
{
    host_.set_auto_complete_loads(false);
    TabId tab = create(1, "https://example.com");
    pump();
    EXPECT_TRUE(state_->tab(tab)->is_loading);

    host_.fail_load(views_->host_surface(tab), -105, "NAME_NOT_RESOLVED");
    pump();
    auto rec = state_->tab(tab);
    EXPECT_FALSE(rec->is_loading);
    EXPECT_EQ(rec->error, "NAME_NOT_RESOLVED");
}

TEST_F(StateSynchronizerTest, CrashSetsErrorAndReloadClearsIt)
{
    TabId tab = create(1, "https://example.com");
    pump();
    host_.simulate_crash(views_->host_surface(tab), "gpu process gone");
    pump();
    EXPECT_EQ(state_->tab(tab)->error, "surface crashed: gpu process gone");

    CommandResult r = state_->apply_command(NavigationAction{tab, NavAction::Reload});
    ASSERT_TRUE(r.ok()) << r.status.to_string();
    pump();
    EXPECT_TRUE(state_->tab(tab)->error.empty());
    EXPECT_EQ(views_->state(tab), SurfaceState::Live);
}

TEST_F(StateSynchronizerTest, EveryChangeBumpsRevision)
{
    TabId tab = create(1, "a.test");
    pump();
    ASSERT_GE(pushes_.size(), 2u);
    for (size_t i = 1; i < pushes_.size(); ++i)
        EXPECT_GT(pushes_[i].revision, pushes_[i - 1].revision);
    EXPECT_EQ(pushes_.back().tabs.size(), 1u);
    EXPECT_EQ(pushes_.back().tabs[0].tab_id, tab);
}

// ─── CloseTab ────────────────────────────────────────────────────────────────

TEST_F(StateSynchronizerTest, CloseActivePicksLeftNeighbour)
{
    TabId a = create(1, "a.test");
    TabId b = create(1, "b.test");
    TabId c = create(1, "c.test");
    ASSERT_TRUE(state_->apply_command(SwitchActiveTab{1, b}).ok());

    ASSERT_TRUE(state_->apply_command(CloseTab{b}).ok());
    EXPECT_EQ(ids(1), (std::vector<TabId>{a, c}));
    EXPECT_EQ(active(1), a);
    EXPECT_FALSE(state_->tab(b).has_value());
    EXPECT_EQ(state_->window_of(b), INVALID_WINDOW);
    ASSERT_EQ(closed_.size(), 1u);
    EXPECT_EQ(closed_[0].tab_id, b);
}

TEST_F(StateSynchronizerTest, CloseFirstActivePicksNewFirst)
{
    TabId a = create(1, "a.test");
    TabId b = create(1, "b.test");
    state_->apply_command(SwitchActiveTab{1, a});

    state_->apply_command(CloseTab{a});
    EXPECT_EQ(active(1), b);
}

TEST_F(StateSynchronizerTest, CloseInactiveKeepsActive)
{
    TabId a = create(1, "a.test");
    TabId b = create(1, "b.test");
    state_->apply_command(CloseTab{a});
    EXPECT_EQ(active(1), b);
}

TEST_F(StateSynchronizerTest, CloseLastTabDropsSet)
{
    TabId a = create(1, "a.test");
    pushes_.clear();
    ASSERT_TRUE(state_->apply_command(CloseTab{a}).ok());

    ASSERT_FALSE(pushes_.empty());
    EXPECT_TRUE(pushes_.back().set.tab_ids.empty());
    EXPECT_EQ(pushes_.back().set.active_tab_id, INVALID_TAB);
    EXPECT_FALSE(state_->get_state(1).has_value());
    EXPECT_TRUE(state_->window_ids().empty());

    // The window can be populated again
    TabId b = create(1, "b.test");
    EXPECT_EQ(ids(1), (std::vector<TabId>{b}));
}

TEST_F(StateSynchronizerTest, CloseDestroysSurfaceAfterDebounce)
{
    TabId a = create(1, "a.test");
    pump();
    state_->apply_command(CloseTab{a});
    EXPECT_EQ(host_.surface_count(), 1u);
    clock_.advance(50ms);
    pump();
    EXPECT_EQ(host_.surface_count(), 0u);
}

TEST_F(StateSynchronizerTest, CloseUnknown)
{
    EXPECT_EQ(state_->apply_command(CloseTab{42}).status.code, ErrorCode::NotFound);
}

// ─── SwitchActiveTab / ReorderTab ────────────────────────────────────────────

TEST_F(StateSynchronizerTest, SwitchUpdatesVisibility)
{
    TabId a = create(1, "a.test");
    TabId b = create(1, "b.test");
    activated_.clear();

    ASSERT_TRUE(state_->apply_command(SwitchActiveTab{1, a}).ok());
    EXPECT_EQ(active(1), a);
    EXPECT_TRUE(views_->desired_visible(a));
    EXPECT_FALSE(views_->desired_visible(b));
    ASSERT_EQ(activated_.size(), 1u);
    EXPECT_EQ(activated_[0].previous, b);
    EXPECT_EQ(views_->z_order(1).back(), a);
}

TEST_F(StateSynchronizerTest, SwitchToActiveIsNoop)
{
    TabId a = create(1, "a.test");
    const size_t before = pushes_.size();
    activated_.clear();
    EXPECT_TRUE(state_->apply_command(SwitchActiveTab{1, a}).ok());
    EXPECT_EQ(pushes_.size(), before);
    EXPECT_TRUE(activated_.empty());
}

TEST_F(StateSynchronizerTest, SwitchErrors)
{
    TabId a = create(1, "a.test");
    EXPECT_EQ(state_->apply_command(SwitchActiveTab{2, a}).status.code, ErrorCode::NotFound);
    EXPECT_EQ(state_->apply_command(SwitchActiveTab{1, 999}).status.code, ErrorCode::NotFound);
    EXPECT_EQ(state_->apply_command(SwitchActiveTab{7, a}).status.code, ErrorCode::NotFound);
}

TEST_F(StateSynchronizerTest, Reorder)
{
    TabId a = create(1, "a.test");
    TabId b = create(1, "b.test");
    TabId c = create(1, "c.test");

    ASSERT_TRUE(state_->apply_command(ReorderTab{c, 0}).ok());
    EXPECT_EQ(ids(1), (std::vector<TabId>{c, a, b}));
    ASSERT_TRUE(state_->apply_command(ReorderTab{c, 50}).ok());
    EXPECT_EQ(ids(1), (std::vector<TabId>{a, b, c}));
    EXPECT_EQ(active(1), c);
    EXPECT_EQ(state_->apply_command(ReorderTab{77, 0}).status.code, ErrorCode::NotFound);
}

// ─── Navigation and bounds ───────────────────────────────────────────────────

TEST_F(StateSynchronizerTest, NavigateNormalizesUrl)
{
    TabId a = create(1, "a.test");
    pump();
    ASSERT_TRUE(state_->apply_command(Navigate{a, " b.test/page "}).ok());
    EXPECT_EQ(state_->tab(a)->url, "https://b.test/page");
    pump();
    EXPECT_EQ(state_->tab(a)->title, "b.test");
    EXPECT_EQ(state_->apply_command(Navigate{a, ""}).status.code, ErrorCode::InvalidArgument);
}

TEST_F(StateSynchronizerTest, BackAndForward)
{
    TabId a = create(1, "a.test");
    pump();
    state_->apply_command(Navigate{a, "b.test"});
    pump();
    EXPECT_TRUE(state_->tab(a)->can_go_back);

    ASSERT_TRUE(state_->apply_command(NavigationAction{a, NavAction::Back}).ok());
    pump();
    EXPECT_EQ(state_->tab(a)->url, "https://a.test");
    EXPECT_TRUE(state_->tab(a)->can_go_forward);

    EXPECT_EQ(state_->apply_command(NavigationAction{a, NavAction::Back}).status.code,
              ErrorCode::InvalidArgument);
}

TEST_F(StateSynchronizerTest, StopFinishesLoad)
{
    host_.set_auto_complete_loads(false);
    TabId a = create(1, "a.test");
    pump();
    ASSERT_TRUE(state_->apply_command(NavigationAction{a, NavAction::Stop}).ok());
    pump();
    EXPECT_FALSE(state_->tab(a)->is_loading);
}

TEST_F(StateSynchronizerTest, SetBounds)
{
    TabId a = create(1, "a.test");
    ASSERT_TRUE(state_->apply_command(SetBounds{a, Rect{0, 40, 800, 560}}).ok());
    EXPECT_EQ(views_->bounds(a), (Rect{0, 40, 800, 560}));
    EXPECT_EQ(state_->apply_command(SetBounds{a, Rect{0, 0, 0, 0}}).status.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(state_->apply_command(SetBounds{99, Rect{0, 0, 5, 5}}).status.code, ErrorCode::NotFound);
}

TEST_F(StateSynchronizerTest, RoutedCommandsAreUnsupported)
{
    TabId a = create(1, "a.test");
    EXPECT_EQ(state_->apply_command(TransferTab{a, 2}).status.code, ErrorCode::Unsupported);
    EXPECT_EQ(state_->apply_command(RequestFocus{a}).status.code, ErrorCode::Unsupported);
}

// ─── Listeners ───────────────────────────────────────────────────────────────

TEST_F(StateSynchronizerTest, PerWindowListener)
{
    std::vector<WindowId> seen;
    auto id = state_->subscribe(2, [&](const WindowSnapshot& s) { seen.push_back(s.set.window_id); });

    create(1, "a.test");
    create(2, "b.test");
    ASSERT_FALSE(seen.empty());
    for (WindowId w : seen)
        EXPECT_EQ(w, 2u);

    state_->unsubscribe(id);
    state_->unsubscribe(id);
    const size_t n = seen.size();
    create(2, "c.test");
    EXPECT_EQ(seen.size(), n);
}

TEST_F(StateSynchronizerTest, ListenerMayReadState)
{
    size_t counted = 0;
    auto id = state_->subscribe(1,
                                [&](const WindowSnapshot& s)
                                {
                                    auto again = state_->get_state(s.set.window_id);
                                    if (again)
                                        counted = again->set.tab_ids.size();
                                });
    create(1, "a.test");
    create(1, "b.test");
    EXPECT_EQ(counted, 2u);
    state_->unsubscribe(id);
}

// ─── Window teardown ─────────────────────────────────────────────────────────

TEST_F(StateSynchronizerTest, RemoveWindowClosesEveryTab)
{
    TabId a = create(1, "a.test");
    TabId b = create(1, "b.test");
    TabId c = create(2, "c.test");
    pump();

    state_->mark_window_closing(1);
    EXPECT_TRUE(state_->get_state(1)->set.closing);

    state_->remove_window(1);
    EXPECT_FALSE(state_->get_state(1).has_value());
    EXPECT_FALSE(state_->tab(a).has_value());
    EXPECT_FALSE(state_->tab(b).has_value());
    EXPECT_TRUE(state_->tab(c).has_value());
    EXPECT_EQ(closed_.size(), 2u);
    EXPECT_TRUE(pushes_.back().set.closing);
    EXPECT_TRUE(pushes_.back().set.tab_ids.empty());
    EXPECT_EQ(views_->state(a), SurfaceState::Destroyed);
}

// ─── Transfer support ────────────────────────────────────────────────────────

TEST_F(StateSynchronizerTest, PrepareTransferValidates)
{
    TabId a = create(1, "a.test");

    StateSynchronizer::TransferTicket ticket;
    {
        auto lock = state_->lock_pair(1, 2);
        EXPECT_TRUE(state_->prepare_transfer(lock, a, 1, 2, ticket).ok());
        EXPECT_EQ(ticket.source_index, 0u);
        EXPECT_TRUE(ticket.was_active);
        EXPECT_EQ(state_->prepare_transfer(lock, a, 2, 1, ticket).code, ErrorCode::InvalidArgument);
    }
    {
        auto lock = state_->lock_pair(2, 1);
        EXPECT_EQ(state_->prepare_transfer(lock, a, 2, 1, ticket).code, ErrorCode::NotFound);
    }
    {
        auto lock = state_->lock_pair(1, 5);
        EXPECT_EQ(state_->prepare_transfer(lock, a, 1, 5, ticket).code, ErrorCode::InvalidWindow);
    }
    EXPECT_EQ(ids(1), (std::vector<TabId>{a}));
    EXPECT_FALSE(state_->get_state(5).has_value());
}

TEST_F(StateSynchronizerTest, CommitTransferMovesRecord)
{
    TabId a = create(1, "a.test");
    TabId b = create(1, "b.test");
    TabId c = create(2, "c.test");

    StateSynchronizer::TransferOutcome outcome;
    {
        auto                              lock = state_->lock_pair(1, 2);
        StateSynchronizer::TransferTicket ticket;
        ASSERT_TRUE(state_->prepare_transfer(lock, b, 1, 2, ticket).ok());
        outcome = state_->commit_transfer(lock, ticket, 0);
    }

    EXPECT_EQ(ids(1), (std::vector<TabId>{a}));
    EXPECT_EQ(ids(2), (std::vector<TabId>{b, c}));
    EXPECT_EQ(active(1), a);
    EXPECT_EQ(active(2), b);
    EXPECT_EQ(state_->window_of(b), 2u);
    EXPECT_EQ(state_->tab(b)->window_id, 2u);
    EXPECT_EQ(outcome.new_source_active, a);
    EXPECT_EQ(outcome.previous_target_active, c);
    EXPECT_FALSE(outcome.source_emptied);
}

// ─── Concurrency ─────────────────────────────────────────────────────────────

TEST_F(StateSynchronizerTest, ConcurrentCommandsOnDifferentWindows)
{
    // The recorders are not thread-safe
    state_->unsubscribe(listener_);
    for (auto& unsub : subs_)
        unsub();

    std::atomic<int> failures{0};
    auto worker = [&](WindowId window)
    {
        for (int i = 0; i < 50; ++i)
        {
            CommandResult r = state_->apply_command(CreateTab{window, "about:blank"});
            if (!r.ok())
                failures.fetch_add(1);
            if (i % 3 == 0)
                state_->apply_command(CloseTab{r.tab_id});
        }
    };

    std::thread t1(worker, 1);
    std::thread t2(worker, 2);
    t1.join();
    t2.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(ids(1).size() + ids(2).size(), state_->tab_count());
    EXPECT_EQ(ids(1).size(), 33u);
    EXPECT_EQ(ids(2).size(), 33u);
}

TEST_F(StateSynchronizerTest, ConcurrentSwitchesOnOneWindow)
{
    state_->unsubscribe(listener_);
    for (auto& unsub : subs_)
        unsub();

    std::vector<TabId> tabs;
    for (int i = 0; i < 4; ++i)
        tabs.push_back(create(1, "https://t" + std::to_string(i) + ".test"));
    pump();

    std::mutex       mu;
    std::atomic<int> dangling{0};
    uint64_t         last_revision = 0;
    bool             in_order      = true;
    TabId            last_active   = INVALID_TAB;
    auto             sub           = state_->subscribe_all(
        [&](const WindowSnapshot& s)
        {
            const auto& ids = s.set.tab_ids;
            if (std::find(ids.begin(), ids.end(), s.set.active_tab_id) == ids.end())
                dangling.fetch_add(1);
            std::lock_guard<std::mutex> lock(mu);
            if (s.revision <= last_revision)
                in_order = false;
            last_revision = s.revision;
            last_active   = s.set.active_tab_id;
        });

    auto worker = [&](size_t offset)
    {
        for (int i = 0; i < 200; ++i)
        {
            const TabId target = tabs[(offset + static_cast<size_t>(i)) % tabs.size()];
            if (!state_->apply_command(SwitchActiveTab{1, target}).ok())
                dangling.fetch_add(1);
        }
    };

    std::thread t1(worker, 0);
    std::thread t2(worker, 2);
    t1.join();
    t2.join();
    state_->unsubscribe(sub);

    EXPECT_EQ(dangling.load(), 0);
    EXPECT_TRUE(in_order);

    // Whichever switch ran last owns the window, and only its surface shows
    const TabId final_active = active(1);
    EXPECT_NE(std::find(tabs.begin(), tabs.end(), final_active), tabs.end());
    EXPECT_EQ(final_active, last_active);

    size_t visible = 0;
    for (TabId tab : tabs)
    {
        auto info = host_.info(views_->host_surface(tab));
        ASSERT_TRUE(info.has_value());
        if (info->visible)
        {
            ++visible;
            EXPECT_EQ(tab, final_active);
        }
    }
    EXPECT_EQ(visible, 1u);
}
