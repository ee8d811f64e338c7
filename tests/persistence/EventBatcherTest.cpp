#include <gtest/gtest.h>
#include <flowcanvas/common/Logger.h>
#include <flowcanvas/persistence/EventBatcher.h>
#include <flowcanvas/persistence/InMemoryEventStore.h>

#include <memory>
#include <stdexcept>

using namespace flowcanvas;
using namespace std::chrono_literals;

namespace {

/// Store whose n-th create() call (1-based) fails once
class ScriptedStore : public InMemoryEventStore {
public:
    CanvasEvent create(const CanvasEvent& event) override {
        ++calls;
        if (calls == failAt) {
            throw PersistenceError("connection reset");
        }
        return InMemoryEventStore::create(event);
    }

    size_t calls = 0;
    size_t failAt = 0;
};

CanvasEvent addNode(const NodeId& id) {
    return makeEvent(AddNodePayload{id, NodeType::Document, {0, 0}, std::nullopt}, 0);
}

CanvasEvent selectNode(const std::string& id) {
    return makeEvent(SelectElementPayload{id, ElementType::Node, std::nullopt}, 0);
}

CanvasEvent pan(float dx) {
    return makeEvent(PanCanvasPayload{ViewBox{}, ViewBox{dx, 0, 1200, 800}, dx, 0}, 0);
}

}  // namespace

class EventBatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::enableCapture(true);
        Logger::clearCapturedLogs();
        store = std::make_shared<ScriptedStore>();
        batcher = std::make_unique<EventBatcher>(store, 500ms);
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
    }

    std::shared_ptr<ScriptedStore> store;
    std::unique_ptr<EventBatcher> batcher;
    EventBatcher::TimePoint t0 = EventBatcher::Clock::now();
};

TEST_F(EventBatcherTest, RequiresStore) {
    EXPECT_THROW(EventBatcher(nullptr), std::invalid_argument);
}

// ============== Batching window ==============

TEST_F(EventBatcherTest, BatchableEventsWaitForWindow) {
    auto result = batcher->enqueue(selectNode("n1"), t0);
    EXPECT_TRUE(result.persisted.empty());
    EXPECT_EQ(batcher->pendingCount(), 1u);
    EXPECT_EQ(store->size(), 0u);

    EXPECT_TRUE(batcher->tick(t0 + 499ms).persisted.empty());
    EXPECT_EQ(batcher->pendingCount(), 1u);

    auto flushed = batcher->tick(t0 + 500ms);
    EXPECT_TRUE(flushed.success);
    EXPECT_EQ(flushed.persisted.size(), 1u);
    EXPECT_EQ(batcher->pendingCount(), 0u);
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(EventBatcherTest, WindowStartsAtFirstBufferedEvent) {
    batcher->enqueue(pan(10), t0);
    batcher->enqueue(pan(20), t0 + 300ms);

    ASSERT_TRUE(batcher->deadline().has_value());
    EXPECT_EQ(*batcher->deadline(), t0 + 500ms);

    EXPECT_EQ(batcher->tick(t0 + 500ms).persisted.size(), 2u);
    EXPECT_FALSE(batcher->deadline().has_value());
}

TEST_F(EventBatcherTest, HighPriorityFlushesImmediately) {
    auto result = batcher->enqueue(addNode("n1"), t0);
    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.persisted.size(), 1u);
    EXPECT_EQ(result.persisted[0].eventId, "evt-1");
    EXPECT_EQ(batcher->pendingCount(), 0u);
}

TEST_F(EventBatcherTest, FlushOrdersByPriorityStably) {
    batcher->enqueue(pan(10), t0);
    batcher->enqueue(selectNode("n1"), t0 + 10ms);
    batcher->enqueue(pan(20), t0 + 20ms);
    auto result = batcher->enqueue(addNode("n2"), t0 + 30ms);

    ASSERT_EQ(result.persisted.size(), 4u);
    EXPECT_EQ(result.persisted[0].kind(), EventKind::AddNode);
    EXPECT_EQ(result.persisted[1].kind(), EventKind::SelectElement);
    EXPECT_FLOAT_EQ(result.persisted[2].as<PanCanvasPayload>()->deltaX, 10.0f);
    EXPECT_FLOAT_EQ(result.persisted[3].as<PanCanvasPayload>()->deltaX, 20.0f);
}

TEST_F(EventBatcherTest, FlushWithNothingPending) {
    auto result = batcher->flush(t0);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.persisted.empty());
}

// ============== Failure handling ==============

TEST_F(EventBatcherTest, FailedFlushRequeuesRemainder) {
    store->failAt = 2;

    batcher->enqueue(selectNode("n1"), t0);
    batcher->enqueue(pan(10), t0 + 10ms);
    auto result = batcher->enqueue(addNode("n2"), t0 + 20ms);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.reason, "connection reset");
    EXPECT_EQ(result.persisted.size(), 1u);
    EXPECT_EQ(result.requeued, 2u);
    EXPECT_TRUE(batcher->hasError());

    auto pending = batcher->pending();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].kind(), EventKind::SelectElement);
    EXPECT_EQ(pending[1].kind(), EventKind::PanCanvas);

    EXPECT_EQ(Logger::getCapturedLogs("persist failed").size(), 1u);
    EXPECT_EQ(Logger::getCapturedLogs("re-queued 2 event(s)").size(), 1u);
}

TEST_F(EventBatcherTest, RequeuedEventsStayAheadOfNewOnes) {
    store->failAt = 1;
    batcher->enqueue(selectNode("n1"), t0);
    batcher->flush(t0 + 10ms);
    ASSERT_EQ(batcher->pendingCount(), 1u);

    batcher->enqueue(selectNode("n2"), t0 + 20ms);

    // Window restarted at the failed flush
    EXPECT_EQ(*batcher->deadline(), t0 + 510ms);

    auto retry = batcher->tick(t0 + 510ms);
    EXPECT_TRUE(retry.success);
    ASSERT_EQ(retry.persisted.size(), 2u);
    EXPECT_EQ(*retry.persisted[0].as<SelectElementPayload>()->elementId, "n1");
    EXPECT_EQ(*retry.persisted[1].as<SelectElementPayload>()->elementId, "n2");
    EXPECT_FALSE(batcher->hasError());
}

TEST_F(EventBatcherTest, UnavailableStoreKeepsEverything) {
    store->setAvailable(false);

    auto result = batcher->enqueue(addNode("n1"), t0);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.requeued, 1u);
    EXPECT_EQ(batcher->lastError(), "event store unavailable");

    store->setAvailable(true);
    auto retry = batcher->flush(t0 + 1s);
    EXPECT_TRUE(retry.success);
    EXPECT_EQ(store->size(), 1u);
    EXPECT_TRUE(batcher->lastError().empty());
}
