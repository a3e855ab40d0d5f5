#include <gtest/gtest.h>
#include "parley/engine/history_store.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace parley;
using namespace parley::engine;

/**
 * Steady clock that only moves when a test advances it.
 */
class FakeClock {
public:
    HistoryStore::Clock::time_point now() const {
        return HistoryStore::Clock::time_point(HistoryStore::Clock::duration(ticks_.load()));
    }

    void advance(HistoryStore::Clock::duration d) {
        ticks_.fetch_add(d.count());
    }

    HistoryStore::TimeSource source() {
        return [this]() { return now(); };
    }

private:
    std::atomic<HistoryStore::Clock::rep> ticks_{
        std::chrono::duration_cast<HistoryStore::Clock::duration>(std::chrono::hours(1000)).count()};
};

class HistoryStoreTest : public ::testing::Test {
protected:
    HistoryStoreTest()
        : store(3, std::chrono::minutes(10), Logger(LogLevel::Off), clock.source())
        , id(ConversationId::generate())
    {}

    FakeClock clock;
    HistoryStore store;
    ConversationId id;
};

// ============================================================================
// Basic Operations
// ============================================================================

TEST_F(HistoryStoreTest, UnknownIdReadsEmpty) {
    EXPECT_TRUE(store.get(id).empty());
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(HistoryStoreTest, AppendCreatesEntry) {
    ASSERT_TRUE(store.append(id, Message::user("Hello")).has_value());

    auto messages = store.get(id);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], Message::user("Hello"));
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(HistoryStoreTest, AppendKeepsInsertionOrder) {
    ASSERT_TRUE(store.append(id, Message::user("a")).has_value());
    ASSERT_TRUE(store.append(id, Message::assistant("A")).has_value());

    auto messages = store.get(id);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].content, "a");
    EXPECT_EQ(messages[1].content, "A");
}

TEST_F(HistoryStoreTest, AppendTrimsToLimit) {
    ASSERT_TRUE(store.append(id, Message::system("sys")).has_value());
    for (const char* text : {"a", "A", "b", "B"}) {
        ASSERT_TRUE(store.append(id, Message::user(text)).has_value());
    }

    auto messages = store.get(id);
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0], Message::system("sys"));
    EXPECT_EQ(messages[1].content, "b");
    EXPECT_EQ(messages[2].content, "B");
}

TEST_F(HistoryStoreTest, ResetReplacesHistory) {
    ASSERT_TRUE(store.append(id, Message::user("a")).has_value());
    ASSERT_TRUE(store.append(id, Message::assistant("A")).has_value());

    store.reset(id, Message::system("sys"));
    store.reset(id, Message::system("sys"));

    auto messages = store.get(id);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], Message::system("sys"));
}

TEST_F(HistoryStoreTest, RemoveDeletesEntry) {
    ASSERT_TRUE(store.append(id, Message::user("a")).has_value());

    store.remove(id);
    EXPECT_TRUE(store.get(id).empty());
    EXPECT_EQ(store.size(), 0u);

    store.remove(id);  // No-op when absent
    store.remove(ConversationId::generate());
}

TEST_F(HistoryStoreTest, ConversationsAreIndependent) {
    auto other = ConversationId::generate();
    ASSERT_TRUE(store.append(id, Message::user("mine")).has_value());
    ASSERT_TRUE(store.append(other, Message::user("theirs")).has_value());

    store.remove(other);

    ASSERT_EQ(store.get(id).size(), 1u);
    EXPECT_TRUE(store.get(other).empty());
}

TEST_F(HistoryStoreTest, GetReturnsCopy) {
    ASSERT_TRUE(store.append(id, Message::user("a")).has_value());

    auto messages = store.get(id);
    messages[0].content = "modified";
    messages.push_back(Message::user("extra"));

    auto again = store.get(id);
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].content, "a");
}

// ============================================================================
// Expiration
// ============================================================================

TEST_F(HistoryStoreTest, IdleEntryExpires) {
    ASSERT_TRUE(store.append(id, Message::user("a")).has_value());

    clock.advance(std::chrono::minutes(11));

    EXPECT_TRUE(store.get(id).empty());
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(HistoryStoreTest, ExpirationIsSliding) {
    ASSERT_TRUE(store.append(id, Message::user("a")).has_value());

    clock.advance(std::chrono::minutes(8));
    EXPECT_EQ(store.get(id).size(), 1u);

    clock.advance(std::chrono::minutes(8));
    EXPECT_EQ(store.get(id).size(), 1u);
}

TEST_F(HistoryStoreTest, ExactlyAtWindowIsNotExpired) {
    ASSERT_TRUE(store.append(id, Message::user("a")).has_value());

    clock.advance(std::chrono::minutes(10));
    EXPECT_EQ(store.get(id).size(), 1u);
}

TEST_F(HistoryStoreTest, AppendAfterExpiryStartsFresh) {
    ASSERT_TRUE(store.append(id, Message::user("old")).has_value());

    clock.advance(std::chrono::minutes(11));
    ASSERT_TRUE(store.append(id, Message::user("new")).has_value());

    auto messages = store.get(id);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].content, "new");
}

TEST_F(HistoryStoreTest, PurgeExpiredRemovesOnlyStaleEntries) {
    auto fresh = ConversationId::generate();
    ASSERT_TRUE(store.append(id, Message::user("stale")).has_value());

    clock.advance(std::chrono::minutes(6));
    ASSERT_TRUE(store.append(fresh, Message::user("fresh")).has_value());

    clock.advance(std::chrono::minutes(6));
    EXPECT_EQ(store.purge_expired(), 1u);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get(fresh).size(), 1u);
}

TEST_F(HistoryStoreTest, LockRunsOpportunisticSweep) {
    store.set_sweep_interval(std::chrono::minutes(1));
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(store.append(ConversationId::generate(), Message::user("x")).has_value());
    }
    EXPECT_EQ(store.size(), 5u);

    clock.advance(std::chrono::minutes(11));
    ASSERT_TRUE(store.append(id, Message::user("trigger")).has_value());

    EXPECT_EQ(store.size(), 1u);
}

// ============================================================================
// Conversation Lock
// ============================================================================

TEST_F(HistoryStoreTest, RestoreRollsBackToSnapshot) {
    ASSERT_TRUE(store.append(id, Message::system("sys")).has_value());
    {
        auto conversation = store.lock(id);
        auto snapshot = conversation.messages();
        ASSERT_TRUE(conversation.append(Message::user("pending")).has_value());
        EXPECT_EQ(conversation.messages().size(), 2u);
        conversation.restore(std::move(snapshot));
    }

    auto messages = store.get(id);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].content, "sys");
}

TEST_F(HistoryStoreTest, LockSerializesSameConversation) {
    auto conversation = std::make_unique<HistoryStore::ConversationLock>(store.lock(id));
    std::atomic<bool> appended{false};

    std::thread writer([&]() {
        ASSERT_TRUE(store.append(id, Message::user("second")).has_value());
        appended = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(appended.load());

    ASSERT_TRUE(conversation->append(Message::user("first")).has_value());
    conversation.reset();

    writer.join();
    EXPECT_TRUE(appended.load());

    auto messages = store.get(id);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].content, "first");
    EXPECT_EQ(messages[1].content, "second");
}

TEST_F(HistoryStoreTest, LockDoesNotBlockOtherConversations) {
    auto conversation = store.lock(id);
    auto other = ConversationId::generate();

    std::atomic<bool> done{false};
    std::thread writer([&]() {
        ASSERT_TRUE(store.append(other, Message::user("independent")).has_value());
        EXPECT_EQ(store.get(other).size(), 1u);
        done = true;
    });

    writer.join();
    EXPECT_TRUE(done.load());
}

TEST_F(HistoryStoreTest, GetDoesNotWaitForTurnInProgress) {
    ASSERT_TRUE(store.append(id, Message::system("sys")).has_value());
    auto conversation = store.lock(id);
    ASSERT_TRUE(conversation.append(Message::user("pending")).has_value());

    auto reader = std::async(std::launch::async, [&]() { return store.get(id); });
    ASSERT_EQ(reader.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    auto messages = reader.get();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[1], Message::user("pending"));
}

TEST_F(HistoryStoreTest, RemoveDuringTurnDropsLaterWrites) {
    auto conversation = std::make_unique<HistoryStore::ConversationLock>(store.lock(id));
    auto snapshot = conversation->messages();
    ASSERT_TRUE(conversation->append(Message::user("in flight")).has_value());

    auto remover = std::async(std::launch::async, [&]() { store.remove(id); });
    ASSERT_EQ(remover.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(store.get(id).empty());

    ASSERT_TRUE(conversation->append(Message::assistant("reply")).has_value());
    conversation->restore(std::move(snapshot));
    conversation.reset();

    EXPECT_TRUE(store.get(id).empty());

    // The id is usable again afterwards
    ASSERT_TRUE(store.append(id, Message::user("again")).has_value());
    EXPECT_EQ(store.get(id).size(), 1u);
}

TEST_F(HistoryStoreTest, ResetDuringTurnIsNotOverwritten) {
    ASSERT_TRUE(store.append(id, Message::system("old")).has_value());
    {
        auto conversation = store.lock(id);
        auto snapshot = conversation.messages();
        ASSERT_TRUE(conversation.append(Message::user("in flight")).has_value());

        store.reset(id, Message::system("new"));

        ASSERT_TRUE(conversation.append(Message::assistant("reply")).has_value());
        conversation.restore(std::move(snapshot));
    }

    auto messages = store.get(id);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], Message::system("new"));
}

TEST_F(HistoryStoreTest, ConversationInTurnIsNeverExpired) {
    ASSERT_TRUE(store.append(id, Message::user("a")).has_value());
    auto conversation = store.lock(id);

    clock.advance(std::chrono::minutes(30));
    EXPECT_EQ(store.purge_expired(), 0u);
    EXPECT_EQ(store.get(id).size(), 1u);
}

// ============================================================================
// Invariant Violations
// ============================================================================

/**
 * Trimming policy that never evicts, so the bound check always trips.
 */
class NoEvictionTrimmer : public HistoryTrimmer {
public:
    using HistoryTrimmer::HistoryTrimmer;

    size_t trim(std::vector<Message>&) const override { return 0; }
};

TEST_F(HistoryStoreTest, InvariantViolationResetsEntry) {
    HistoryStore broken(std::make_shared<NoEvictionTrimmer>(2), std::chrono::hours(1), Logger(LogLevel::Off));

    ASSERT_TRUE(broken.append(id, Message::user("a")).has_value());
    ASSERT_TRUE(broken.append(id, Message::assistant("A")).has_value());

    auto result = broken.append(id, Message::user("b"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::CacheStateError);
    EXPECT_TRUE(broken.get(id).empty());

    // The reset entry accepts new messages
    ASSERT_TRUE(broken.append(id, Message::user("c")).has_value());
    EXPECT_EQ(broken.get(id).size(), 1u);
}

TEST_F(HistoryStoreTest, ConcurrentAppendsAcrossConversations) {
    constexpr int num_threads = 8;
    constexpr int appends_per_thread = 50;

    HistoryStore big(1000, std::chrono::hours(1), Logger(LogLevel::Off));
    std::vector<ConversationId> ids;
    for (int t = 0; t < num_threads; ++t) {
        ids.push_back(ConversationId::generate());
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < appends_per_thread; ++i) {
                (void)big.append(ids[t], Message::user(std::to_string(i)));
                (void)big.append(ids[(t + 1) % num_threads], Message::assistant(std::to_string(i)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& cid : ids) {
        EXPECT_EQ(big.get(cid).size(), static_cast<size_t>(2 * appends_per_thread));
    }
}
