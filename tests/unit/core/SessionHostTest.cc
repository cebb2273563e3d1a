#include "keepsake/core/SessionHost.hh"
#include "keepsake/core/SessionSignals.hh"
#include "Testing.hh"

#include <gtest/gtest.h>

using namespace keepsake;
using namespace keepsake::Testing;
using namespace std::chrono_literals;

class SessionHostTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config_.probeRetryInterval = 10ms;
        config_.restartSettleDelay = 5ms;
        host_ = std::make_unique<SessionHost>(io_, remote_, local_, config_);
        recorder_.listen(host_->signals(), {signals::kValidSaveFound, signals::kFreshStart, signals::kSessionReload,
                                            signals::kSessionReloaded, signals::kSessionFault});
    }

    void TearDown() override {
        if (host_) {
            host_->shutdown();
        }
        async::poll(io_);
    }

    void putValidSave() {
        SessionPayload payload;
        payload.version = config_.appVersion;
        payload.lastLocation = "Kitchen";
        remote_.put("DLX_template_ana", payload.serialize());
    }

    bool settled() {
        return runUntil(io_, [this] { return host_->session() && host_->session()->settled(); });
    }

    asio::io_context io_;
    ScriptedStore remote_{io_, "remote"};
    ScriptedStore local_{io_, "local"};
    SyncConfig config_;
    std::unique_ptr<SessionHost> host_;
    EventRecorder recorder_;
};

TEST_F(SessionHostTest, NoSessionBeforeLogin) {
    EXPECT_EQ(host_->session(), nullptr);
    EXPECT_EQ(host_->reloadCount(), 0);
    EXPECT_FALSE(host_->reloading());
}

TEST_F(SessionHostTest, LoginBuildsAndIdentifiesSession) {
    host_->login("ana");
    ASSERT_NE(host_->session(), nullptr);
    EXPECT_EQ(host_->session()->userId(), "ana");

    ASSERT_TRUE(settled());
    EXPECT_EQ(host_->session()->loadState(), LoadState::FreshStart);
}

TEST_F(SessionHostTest, SecondLoginIsIgnored) {
    host_->login("ana");
    auto first = host_->session();
    host_->login("bo");
    EXPECT_EQ(host_->session(), first);
    EXPECT_EQ(host_->session()->userId(), "ana");
}

TEST_F(SessionHostTest, RestartRebuildsSessionWithoutResumePrompt) {
    putValidSave();
    host_->login("ana");
    ASSERT_TRUE(settled());
    ASSERT_EQ(host_->session()->loadState(), LoadState::VersionValid);
    auto first = host_->session();

    host_->session()->restartSession();
    ASSERT_TRUE(runUntil(io_, [this] { return recorder_.received(signals::kSessionReloaded); }));

    auto second = host_->session();
    ASSERT_NE(second, nullptr);
    EXPECT_NE(second, first);
    EXPECT_TRUE(first->stopped());
    EXPECT_EQ(second->userId(), "ana");
    EXPECT_EQ(second->loadState(), LoadState::FreshStart);
    EXPECT_EQ(host_->reloadCount(), 1);
    EXPECT_FALSE(host_->reloading());

    // Only the first session offered a resume
    EXPECT_EQ(recorder_.count(signals::kValidSaveFound), 1u);
    const Event* fresh = recorder_.last(signals::kFreshStart);
    ASSERT_NE(fresh, nullptr);
    EXPECT_TRUE(fresh->getData<bool>(signals::kRestarted));

    const Event* reloaded = recorder_.last(signals::kSessionReloaded);
    EXPECT_EQ(reloaded->getData<int>(signals::kReloadCount), 1);
    EXPECT_TRUE(reloaded->getData<bool>(signals::kRestarted));
    EXPECT_FALSE(remote_.contains("DLX_template_ana"));
}

TEST_F(SessionHostTest, FaultedSessionIsReloadedWithoutMarker) {
    remote_.setDefault(StoreAction::List, false);
    host_->login("ana");

    ASSERT_TRUE(runUntil(io_, [this] { return host_->reloadCount() >= 1; }));
    const Event* reload = recorder_.last(signals::kSessionReload);
    ASSERT_NE(reload, nullptr);
    EXPECT_FALSE(reload->getData<bool>(signals::kRestarted));
    EXPECT_EQ(reload->getData<std::string>(signals::kReason), "fallback load failed");
    EXPECT_GE(recorder_.count(signals::kSessionFault), 2u);
}

TEST_F(SessionHostTest, ShutdownStopsTheSession) {
    host_->login("ana");
    auto session = host_->session();
    host_->shutdown();

    EXPECT_EQ(host_->session(), nullptr);
    EXPECT_TRUE(session->stopped());
    EXPECT_FALSE(session->requestSave());
}

TEST_F(SessionHostTest, ReloadQueuedBeforeDestructionDoesNothing) {
    remote_.setDefault(StoreAction::List, false);
    host_->login("ana");
    ASSERT_TRUE(runUntil(io_, [this] { return recorder_.received(signals::kSessionReload); }));
    ASSERT_TRUE(host_->reloading());
    size_t listCalls = remote_.callCount(StoreAction::List);

    host_.reset();
    async::poll(io_);
    runFor(io_, 30ms);

    // No replacement session was built
    EXPECT_EQ(remote_.callCount(StoreAction::List), listCalls);
    EXPECT_FALSE(recorder_.received(signals::kSessionReloaded));
}

TEST_F(SessionHostTest, DestroyingHostDuringReloadEndsTheReload) {
    remote_.setDefault(StoreAction::List, false);
    host_->login("ana");
    ASSERT_TRUE(runUntil(io_, [this] { return recorder_.received(signals::kSessionReload); }));

    // The rebuilt session stalls on its first reachability check
    remote_.setManual(StoreAction::List, true);
    ASSERT_TRUE(runUntil(io_, [this] { return remote_.heldCount(StoreAction::List) == 1; }));
    ASSERT_TRUE(host_->reloading());

    host_.reset();
    async::poll(io_);
    ASSERT_TRUE(remote_.release(StoreAction::List));
    runFor(io_, 30ms);

    EXPECT_FALSE(recorder_.received(signals::kSessionReloaded));
    EXPECT_EQ(recorder_.count(signals::kSessionReload), 1u);
}
