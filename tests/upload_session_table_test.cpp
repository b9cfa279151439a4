#include "test_framework.h"
#include "../src/server/upload_session_table.h"
#include <atomic>
#include <chrono>
#include <thread>

namespace chunkpost {
namespace test {

class UploadSessionTableTest : public ChunkpostTestBase {
protected:
    void SetUp() override {
        ChunkpostTestBase::SetUp();
        table_ = std::make_unique<UploadSessionTable>(kTtlMs, [this] { return clock_.now(); });
    }

    std::shared_ptr<UploadSession> makeSession(const std::string& id, int64_t chunks = 3) {
        auto session = std::make_shared<UploadSession>();
        session->upload_id = id;
        session->total_chunks = chunks;
        session->chunk_slots.resize(static_cast<size_t>(chunks));
        session->slot_digests.resize(static_cast<size_t>(chunks));
        return session;
    }

    static constexpr int64_t kTtlMs = 60 * 60 * 1000;
    FakeClock clock_;
    std::unique_ptr<UploadSessionTable> table_;
};

TEST_F(UploadSessionTableTest, InsertStampsTimes) {
    auto session = makeSession("a");
    ASSERT_TRUE(table_->insert(session));
    EXPECT_EQ(session->created_at, clock_.now());
    EXPECT_EQ(session->last_updated.load(), clock_.now());
    EXPECT_EQ(table_->find("a"), session);
    EXPECT_EQ(table_->size(), 1u);
}

TEST_F(UploadSessionTableTest, DuplicateIdRejected) {
    ASSERT_TRUE(table_->insert(makeSession("a")));
    EXPECT_FALSE(table_->insert(makeSession("a")));
}

TEST_F(UploadSessionTableTest, EraseMarksClosed) {
    auto session = makeSession("a");
    ASSERT_TRUE(table_->insert(session));
    EXPECT_TRUE(table_->erase("a"));
    EXPECT_TRUE(session->closed.load());
    EXPECT_EQ(table_->find("a"), nullptr);
    EXPECT_FALSE(table_->erase("a"));
}

TEST_F(UploadSessionTableTest, MissingSlots) {
    auto session = makeSession("a", 4);
    session->slot_digests[1] = "d1";
    session->slot_digests[3] = "d3";
    EXPECT_EQ(session->missingSlots(), (std::vector<int64_t>{0, 2}));
    EXPECT_TRUE(session->slotFilled(1));
    EXPECT_FALSE(session->slotFilled(0));
}

TEST_F(UploadSessionTableTest, SweepEvictsOnlyIdleSessions) {
    auto idle = makeSession("idle");
    auto active = makeSession("active");
    ASSERT_TRUE(table_->insert(idle));
    ASSERT_TRUE(table_->insert(active));

    clock_.advance(kTtlMs - 1000);
    table_->touch(*active);
    EXPECT_EQ(table_->sweepExpired(), 0u);

    // Exactly at the TTL is not yet expired
    clock_.advance(1000);
    EXPECT_EQ(table_->sweepExpired(), 0u);

    clock_.advance(1);
    EXPECT_EQ(table_->sweepExpired(), 1u);
    EXPECT_EQ(table_->find("idle"), nullptr);
    EXPECT_TRUE(idle->closed.load());
    EXPECT_NE(table_->find("active"), nullptr);

    clock_.advance(kTtlMs);
    EXPECT_EQ(table_->sweepExpired(), 1u);
    EXPECT_EQ(table_->size(), 0u);
}

TEST_F(UploadSessionTableTest, SweepWaitsForInFlightChunk) {
    auto session = makeSession("busy");
    ASSERT_TRUE(table_->insert(session));
    clock_.advance(kTtlMs + 1);

    std::atomic<bool> swept{false};
    size_t evicted = 99;
    std::thread sweeper;
    {
        // A chunk write holds the session lock and refreshes the session
        std::lock_guard<std::mutex> lock(session->mutex);
        sweeper = std::thread([&] {
            evicted = table_->sweepExpired();
            swept = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        EXPECT_FALSE(swept.load());
        EXPECT_FALSE(session->closed.load());
        EXPECT_EQ(table_->find("busy"), session);
        table_->touch(*session);
    }
    sweeper.join();

    EXPECT_EQ(evicted, 0u);
    EXPECT_FALSE(session->closed.load());
    EXPECT_EQ(table_->find("busy"), session);
}

TEST_F(UploadSessionTableTest, SweepSkipsErasedSession) {
    auto session = makeSession("done");
    ASSERT_TRUE(table_->insert(session));
    clock_.advance(kTtlMs + 1);
    ASSERT_TRUE(table_->erase("done"));
    EXPECT_EQ(table_->sweepExpired(), 0u);
}

TEST_F(UploadSessionTableTest, ConcurrentInsertsAndLookups) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 100; ++i) {
                std::string id = std::to_string(t) + "-" + std::to_string(i);
                EXPECT_TRUE(table_->insert(makeSession(id)));
                EXPECT_NE(table_->find(id), nullptr);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(table_->size(), 400u);
}

} // namespace test
} // namespace chunkpost
