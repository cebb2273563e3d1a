#include "keepsake/core/Event.hh"
#include "keepsake/core/SessionSignals.hh"
#include "keepsake/utils/ErrorHandling.hh"
#include "Testing.hh"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace keepsake;
using namespace keepsake::Testing;

class EventTest : public ::testing::Test {
  protected:
    void SetUp() override {
        saveEvent = std::make_unique<Event>(signals::kSaveCompleted, signals::kSource);
        loadEvent = std::make_unique<Event>(signals::kLoadCompleted, signals::kSource);
        dispatcher = std::make_unique<EventDispatcher>();
    }

    std::unique_ptr<Event> saveEvent;
    std::unique_ptr<Event> loadEvent;
    std::unique_ptr<EventDispatcher> dispatcher;
    EventRecorder recorder;
};

TEST_F(EventTest, ConstructorThrowsOnEmptyType) {
    EXPECT_THROW(Event("", "source"), KeepsakeException);
}

TEST_F(EventTest, TypeAndSource) {
    EXPECT_EQ(saveEvent->getType(), "save_completed");
    EXPECT_EQ(saveEvent->getSource(), "session_sync");
}

TEST_F(EventTest, SetGetData) {
    saveEvent->setData<int>("reload_count", 2);
    saveEvent->setData<double>("elapsed", 1.5);
    saveEvent->setData<std::string>("user_id", "learner-7");
    saveEvent->setData<bool>("success", true);

    EXPECT_EQ(saveEvent->getData<int>("reload_count"), 2);
    EXPECT_DOUBLE_EQ(saveEvent->getData<double>("elapsed"), 1.5);
    EXPECT_EQ(saveEvent->getData<std::string>("user_id"), "learner-7");
    EXPECT_TRUE(saveEvent->getData<bool>("success"));
}

TEST_F(EventTest, GetDataThrowsOnMissingKey) {
    EXPECT_THROW(saveEvent->getData<bool>("success"), KeepsakeException);
}

TEST_F(EventTest, GetDataThrowsOnWrongType) {
    saveEvent->setData<bool>("success", true);
    EXPECT_THROW(saveEvent->getData<std::string>("success"), KeepsakeException);
}

TEST_F(EventTest, GetDataOrFallsBack) {
    EXPECT_FALSE(saveEvent->getDataOr<bool>("success", false));
    saveEvent->setData<int>("success", 1);
    EXPECT_TRUE(saveEvent->getDataOr<bool>("success", true)); // wrong type
    saveEvent->setData<bool>("success", false);
    EXPECT_FALSE(saveEvent->getDataOr<bool>("success", true));
    EXPECT_TRUE(saveEvent->hasData("success"));
}

TEST_F(EventTest, AddEventListenerThrowsOnEmptyTypeOrNullHandler) {
    EXPECT_THROW(dispatcher->addEventListener("", [](Event&) {}), KeepsakeException);
    EXPECT_THROW(dispatcher->addEventListener("save_completed", nullptr), KeepsakeException);
}

TEST_F(EventTest, RemoveEventListener) {
    std::string handlerId = dispatcher->addEventListener("save_completed", [](Event&) {});
    EXPECT_EQ(dispatcher->listenerCount("save_completed"), 1u);
    EXPECT_TRUE(dispatcher->removeEventListener("save_completed", handlerId));
    EXPECT_FALSE(dispatcher->removeEventListener("save_completed", handlerId)); // Already removed
    EXPECT_FALSE(dispatcher->removeEventListener("nonexistent", "invalid"));
    EXPECT_EQ(dispatcher->listenerCount("save_completed"), 0u);
}

TEST_F(EventTest, DispatchReachesOnlyMatchingListeners) {
    recorder.listen(*dispatcher, "save_completed");

    EXPECT_FALSE(dispatcher->dispatchEvent(*saveEvent)); // not marked handled
    EXPECT_FALSE(dispatcher->dispatchEvent(*loadEvent)); // no listeners
    EXPECT_EQ(recorder.events().size(), 1u);
    EXPECT_EQ(recorder.types()[0], "save_completed");
}

TEST_F(EventTest, HandledStopsPropagation) {
    int later = 0;
    dispatcher->addEventListener("save_completed", [](Event& event) { event.setHandled(true); });
    dispatcher->addEventListener("save_completed", [&later](Event&) { later++; });

    EXPECT_TRUE(dispatcher->dispatchEvent(*saveEvent));
    EXPECT_TRUE(saveEvent->isHandled());
    EXPECT_EQ(later, 0);
}

TEST_F(EventTest, CancellationStopsPropagation) {
    int calls = 0;
    dispatcher->addEventListener("save_completed", [](Event& e) { e.setCancelled(true); });
    dispatcher->addEventListener("save_completed", [&](Event&) { calls++; });

    EXPECT_TRUE(dispatcher->dispatchEvent(*saveEvent));
    EXPECT_TRUE(saveEvent->isCancelled());
    EXPECT_EQ(calls, 0);
}

TEST_F(EventTest, PriorityOrdering) {
    std::vector<int> order;

    dispatcher->addEventListener("save_completed", [&](Event&) { order.push_back(2); }, 10);
    dispatcher->addEventListener("save_completed", [&](Event&) { order.push_back(0); }, -5);
    dispatcher->addEventListener("save_completed", [&](Event&) { order.push_back(1); }, 0);
    dispatcher->addEventListener("save_completed", [&](Event&) { order.push_back(3); }, 10);

    dispatcher->dispatchEvent(*saveEvent);

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST_F(EventTest, ThrowingListenerDoesNotStopOthers) {
    int calls = 0;
    dispatcher->addEventListener("save_completed", [](Event&) { throwError("listener failure"); });
    dispatcher->addEventListener("save_completed", [&](Event&) { calls++; });

    EXPECT_FALSE(dispatcher->dispatchEvent(*saveEvent));
    EXPECT_EQ(calls, 1);
}

TEST_F(EventTest, ListenerMaySubscribeDuringDispatch) {
    int late = 0;
    dispatcher->addEventListener("save_completed", [&](Event&) {
        dispatcher->addEventListener("save_completed", [&late](Event&) { late++; });
    });

    dispatcher->dispatchEvent(*saveEvent);
    EXPECT_EQ(late, 0);
    EXPECT_EQ(dispatcher->listenerCount("save_completed"), 2u);
}
