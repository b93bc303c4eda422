/**
 * @file InMemoryIdempotencyRepositoryTest.cpp
 * @brief Unit tests for InMemoryIdempotencyRepository (с подменёнными часами)
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryIdempotencyRepository.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace ordercore;
using namespace ordercore::adapters::secondary;
using namespace std::chrono_literals;

class InMemoryIdempotencyRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = std::make_shared<domain::Timestamp>(domain::Timestamp::fromMillis(1700000000000));
        auto now = now_;
        repo_ = std::make_unique<InMemoryIdempotencyRepository>([now] { return *now; });
    }

    void advance(std::chrono::milliseconds d) {
        *now_ = now_->plus(d);
    }

    domain::IdempotencyRecord claim(const std::string& key, std::chrono::seconds ttl = 30s,
                                    const std::string& token = "owner-a") {
        domain::IdempotencyRecord r;
        r.key = key;
        r.resourceType = "order";
        r.claimToken = token;
        r.expiresAt = now_->plus(ttl);
        return r;
    }

    std::shared_ptr<domain::Timestamp> now_;
    std::unique_ptr<InMemoryIdempotencyRepository> repo_;
};

TEST_F(InMemoryIdempotencyRepositoryTest, Lookup_Missing) {
    EXPECT_FALSE(repo_->lookup("k1").has_value());
}

TEST_F(InMemoryIdempotencyRepositoryTest, Register_ThenConflict) {
    auto first = repo_->registerKey(claim("k1"));
    EXPECT_TRUE(first.registered);
    EXPECT_FALSE(first.existing.has_value());

    auto second = repo_->registerKey(claim("k1"));
    EXPECT_FALSE(second.registered);
    ASSERT_TRUE(second.existing.has_value());
    EXPECT_TRUE(second.existing->isPending());
}

TEST_F(InMemoryIdempotencyRepositoryTest, Complete_SetsResourceAndTtl) {
    repo_->registerKey(claim("k1"));

    EXPECT_TRUE(repo_->complete("k1", "owner-a", "42", 86400s));

    auto record = repo_->lookup("k1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->resourceId, "42");
    EXPECT_FALSE(record->isPending());
    EXPECT_EQ(record->expiresAt, now_->plus(86400s));
}

TEST_F(InMemoryIdempotencyRepositoryTest, Complete_OnlyPendingClaims) {
    EXPECT_FALSE(repo_->complete("missing", "owner-a", "1", 60s));

    repo_->registerKey(claim("k1"));
    EXPECT_TRUE(repo_->complete("k1", "owner-a", "1", 60s));
    EXPECT_FALSE(repo_->complete("k1", "owner-a", "2", 60s));
    EXPECT_EQ(repo_->lookup("k1")->resourceId, "1");
}

TEST_F(InMemoryIdempotencyRepositoryTest, Complete_ExpiredClaim_Fails) {
    repo_->registerKey(claim("k1", 30s));
    advance(30s);

    EXPECT_FALSE(repo_->complete("k1", "owner-a", "1", 60s));
}

TEST_F(InMemoryIdempotencyRepositoryTest, Complete_ForeignToken_Fails) {
    repo_->registerKey(claim("k1"));

    EXPECT_FALSE(repo_->complete("k1", "owner-b", "1", 60s));
    EXPECT_TRUE(repo_->lookup("k1")->isPending());
}

// Claim A истёк, ключ перехватил B: поздний complete от A не должен попасть в claim B
TEST_F(InMemoryIdempotencyRepositoryTest, Complete_AfterReclaim_OnlyNewOwnerWins) {
    repo_->registerKey(claim("k1", 30s, "owner-a"));
    advance(31s);
    ASSERT_TRUE(repo_->registerKey(claim("k1", 30s, "owner-b")).registered);

    EXPECT_FALSE(repo_->complete("k1", "owner-a", "1", 60s));
    EXPECT_TRUE(repo_->lookup("k1")->isPending());

    EXPECT_TRUE(repo_->complete("k1", "owner-b", "2", 60s));
    EXPECT_EQ(repo_->lookup("k1")->resourceId, "2");
}

TEST_F(InMemoryIdempotencyRepositoryTest, ExpiredRecord_IsAbsent) {
    repo_->registerKey(claim("k1"));
    repo_->complete("k1", "owner-a", "1", 86400s);

    advance(86399s);
    EXPECT_TRUE(repo_->lookup("k1").has_value());

    advance(1s);
    EXPECT_FALSE(repo_->lookup("k1").has_value());

    // Просроченный ключ можно занять заново
    EXPECT_TRUE(repo_->registerKey(claim("k1")).registered);
    EXPECT_TRUE(repo_->lookup("k1")->isPending());
}

TEST_F(InMemoryIdempotencyRepositoryTest, Release_RemovesOnlyPending) {
    repo_->registerKey(claim("pending"));
    repo_->registerKey(claim("foreign", 30s, "owner-b"));
    repo_->registerKey(claim("done"));
    repo_->complete("done", "owner-a", "7", 60s);

    repo_->release("pending", "owner-a");
    repo_->release("foreign", "owner-a");
    repo_->release("done", "owner-a");
    repo_->release("missing", "owner-a");

    EXPECT_FALSE(repo_->lookup("pending").has_value());
    EXPECT_TRUE(repo_->lookup("foreign").has_value());
    EXPECT_EQ(repo_->lookup("done")->resourceId, "7");
}

TEST_F(InMemoryIdempotencyRepositoryTest, PurgeExpired) {
    repo_->registerKey(claim("short", 10s));
    repo_->registerKey(claim("long", 100s));
    EXPECT_EQ(repo_->size(), 2u);

    advance(10s);

    EXPECT_EQ(repo_->size(), 2u);
    EXPECT_EQ(repo_->purgeExpired(), 1u);
    EXPECT_EQ(repo_->size(), 1u);
    EXPECT_TRUE(repo_->lookup("long").has_value());
    EXPECT_EQ(repo_->purgeExpired(), 0u);
}

TEST_F(InMemoryIdempotencyRepositoryTest, ConcurrentRegister_ExactlyOneWinner) {
    auto realRepo = std::make_shared<InMemoryIdempotencyRepository>();
    const int NUM_THREADS = 16;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&]() {
            domain::IdempotencyRecord r;
            r.key = "race";
            r.resourceType = "order";
            r.expiresAt = domain::Timestamp::now().plus(30s);
            if (realRepo->registerKey(r).registered) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
}
