#include "keepsake/core/SessionRecorder.hh"
#include "keepsake/core/SessionSignals.hh"
#include "Testing.hh"

#include <gtest/gtest.h>

using namespace keepsake;
using namespace keepsake::Testing;
using namespace std::chrono_literals;

class SessionRecorderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config_.probeRetryInterval = 10ms;
        host_ = std::make_unique<SessionHost>(io_, remote_, local_, config_);
        recorder_ = std::make_unique<SessionRecorder>(*host_);
        events_.listen(host_->signals(), signals::kSaveCompleted);
    }

    void TearDown() override {
        recorder_.reset();
        host_->shutdown();
        async::poll(io_);
    }

    void loginAndSettle() {
        host_->login("ana");
        ASSERT_TRUE(runUntil(io_, [this] { return host_->session()->settled(); }));
    }

    SessionPayload& payload() { return host_->session()->payload(); }

    asio::io_context io_;
    ScriptedStore remote_{io_, "remote"};
    ScriptedStore local_{io_, "local"};
    SyncConfig config_;
    std::unique_ptr<SessionHost> host_;
    std::unique_ptr<SessionRecorder> recorder_;
    EventRecorder events_;
};

TEST_F(SessionRecorderTest, NothingRecordedWithoutSession) {
    EXPECT_FALSE(recorder_->stampVersion());
    EXPECT_FALSE(recorder_->setFlag("intro_seen", true));
    EXPECT_FALSE(recorder_->triggerSave());
}

TEST_F(SessionRecorderTest, RecordsButDoesNotSaveBeforeTheSessionSettles) {
    remote_.setManual(StoreAction::List, true);
    host_->login("ana");
    async::poll(io_);

    EXPECT_FALSE(recorder_->canSave());
    EXPECT_FALSE(recorder_->setFlag("intro_seen", true));
    EXPECT_TRUE(payload().flags.at("intro_seen"));

    // Locations are only tracked once saving is allowed
    EXPECT_FALSE(recorder_->recordLastLocation("Kitchen"));
    EXPECT_TRUE(payload().lastLocation.empty());
    EXPECT_EQ(remote_.callCount(StoreAction::Save), 0u);
}

TEST_F(SessionRecorderTest, FreshStartOpensTheSaveGate) {
    loginAndSettle();
    EXPECT_TRUE(recorder_->canSave());
    EXPECT_TRUE(recorder_->stampVersion());
    EXPECT_EQ(payload().version, config_.appVersion);

    EXPECT_TRUE(recorder_->recordLastLocation("Kitchen"));
    EXPECT_TRUE(recorder_->recordLastLocation("Garage"));
    EXPECT_TRUE(recorder_->recordLastLocation("Kitchen"));

    EXPECT_EQ(payload().lastLocation, "Kitchen");
    EXPECT_EQ(payload().visitedLocations, (std::vector<std::string>{"Kitchen", "Garage"}));

    ASSERT_TRUE(runUntil(io_, [this] { return events_.count(signals::kSaveCompleted) == 3; }));
    EXPECT_EQ(remote_.callCount(StoreAction::Save), 3u);
}

TEST_F(SessionRecorderTest, RecordedFieldsReachThePayload) {
    loginAndSettle();

    EXPECT_TRUE(recorder_->recordInspections({InspectionRecord{"ladder-3", true, false}}));
    EXPECT_TRUE(recorder_->recordActivity({ActivityEntry{true, "Found the ladder"}}));
    EXPECT_TRUE(recorder_->recordPhotos({{"ladder-3", "2026-10-19 10:00:00"}}));
    EXPECT_TRUE(recorder_->setSetting("volume", 0.5));

    ASSERT_EQ(payload().inspectionLog.size(), 1u);
    EXPECT_EQ(payload().inspectionLog[0].objectId, "ladder-3");
    ASSERT_EQ(payload().activityLog.size(), 1u);
    EXPECT_TRUE(payload().activityLog[0].isPrimary);
    EXPECT_EQ(payload().photoTimestamps.at("ladder-3"), "2026-10-19 10:00:00");
    EXPECT_DOUBLE_EQ(payload().settings.at("volume"), 0.5);
}

TEST_F(SessionRecorderTest, ResumeRestoresTheClock) {
    SessionPayload saved;
    saved.version = config_.appVersion;
    saved.elapsed = 90000ms;
    remote_.put("DLX_template_ana", saved.serialize());

    loginAndSettle();
    EXPECT_FALSE(recorder_->canSave());

    ASSERT_TRUE(host_->session()->confirmResume());
    EXPECT_TRUE(recorder_->canSave());
    EXPECT_EQ(recorder_->clock().offset(), 90000ms);

    recorder_->tick(1.0f);
    EXPECT_TRUE(recorder_->triggerSave());
    EXPECT_EQ(payload().elapsed, 91000ms);
}

TEST_F(SessionRecorderTest, ReloadClosesTheSaveGate) {
    loginAndSettle();
    ASSERT_TRUE(recorder_->canSave());

    Event reload(signals::kSessionReload, signals::kSource);
    host_->signals().dispatchEvent(reload);
    EXPECT_FALSE(recorder_->canSave());
    EXPECT_FALSE(recorder_->triggerSave());
}

TEST_F(SessionRecorderTest, AutosaveFiresOnItsInterval) {
    loginAndSettle();
    recorder_->enableAutosave(1.0f);

    EXPECT_FALSE(recorder_->tick(0.5f));
    EXPECT_TRUE(recorder_->tick(0.6f));
    EXPECT_FALSE(recorder_->tick(0.5f));
    EXPECT_EQ(recorder_->autosaveCount(), 1u);

    recorder_->disableAutosave();
    EXPECT_FALSE(recorder_->tick(5.0f));
    EXPECT_EQ(recorder_->autosaveCount(), 1u);
}

TEST_F(SessionRecorderTest, AutosaveSkippedWhileSavingIsBlocked) {
    loginAndSettle();
    recorder_->enableAutosave(1.0f);
    recorder_->setCanSave(false);

    EXPECT_FALSE(recorder_->tick(1.5f));
    EXPECT_EQ(recorder_->autosaveCount(), 0u);
}

TEST(SessionClockTest, TicksFromTheRestoredOffset) {
    SessionClock clock;
    EXPECT_EQ(clock.elapsed(), 0ms);

    clock.tick(1.5f);
    EXPECT_EQ(clock.elapsed(), 1500ms);

    clock.pause();
    clock.tick(10.0f);
    EXPECT_EQ(clock.elapsed(), 1500ms);
    clock.resume();

    clock.reset(60000ms);
    EXPECT_EQ(clock.elapsed(), 60000ms);
    clock.tick(0.25f);
    EXPECT_EQ(clock.elapsed(), 60250ms);
    EXPECT_EQ(clock.offset(), 60000ms);
}
