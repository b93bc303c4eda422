/**
 * @file InMemoryOrderRepositoryTest.cpp
 * @brief Unit tests for InMemoryOrderRepository
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace ordercore;
using namespace ordercore::adapters::secondary;

class InMemoryOrderRepositoryTest : public ::testing::Test {
protected:
    InMemoryOrderRepository repo_;
};

TEST_F(InMemoryOrderRepositoryTest, Save_AssignsIdAndTimestamps) {
    auto saved = repo_.save(domain::Order("ORD-1", 1));

    EXPECT_EQ(saved.id, 1);
    EXPECT_EQ(saved.createdAt, saved.updatedAt);
    EXPECT_EQ(repo_.count(), 1u);

    auto second = repo_.save(domain::Order("ORD-2", 1));
    EXPECT_EQ(second.id, 2);
}

TEST_F(InMemoryOrderRepositoryTest, Save_DuplicateNumber_Throws) {
    repo_.save(domain::Order("ORD-1", 1));

    EXPECT_THROW(repo_.save(domain::Order("ORD-1", 2)), domain::PersistenceError);
    EXPECT_EQ(repo_.count(), 1u);
}

TEST_F(InMemoryOrderRepositoryTest, FindByIdAndNumber) {
    auto saved = repo_.save(domain::Order("ORD-1", 1));

    EXPECT_EQ(repo_.findById(saved.id)->orderNumber, "ORD-1");
    EXPECT_EQ(repo_.findByOrderNumber("ORD-1")->id, saved.id);
    EXPECT_FALSE(repo_.findById(99).has_value());
    EXPECT_FALSE(repo_.findByOrderNumber("ORD-X").has_value());
}

TEST_F(InMemoryOrderRepositoryTest, Update_KeepsCreatedAt) {
    auto saved = repo_.save(domain::Order("ORD-1", 1));
    auto originalCreatedAt = saved.createdAt;

    saved.transitionTo(domain::OrderStatus::PAID);
    saved.paymentId = "txn-1";
    saved.createdAt = domain::Timestamp::fromMillis(0);
    auto updated = repo_.update(saved);

    EXPECT_EQ(updated.status, domain::OrderStatus::PAID);
    EXPECT_EQ(repo_.findById(saved.id)->paymentId, "txn-1");
    EXPECT_EQ(updated.createdAt, originalCreatedAt);
    EXPECT_EQ(repo_.findById(saved.id)->createdAt, originalCreatedAt);
}

TEST_F(InMemoryOrderRepositoryTest, Update_Unknown_Throws) {
    domain::Order ghost("ORD-GHOST", 1);
    ghost.id = 42;

    EXPECT_THROW(repo_.update(ghost), domain::OrderNotFoundError);
}

TEST_F(InMemoryOrderRepositoryTest, FindByUserId_NewestFirst) {
    auto a = repo_.save(domain::Order("ORD-A", 1));
    auto b = repo_.save(domain::Order("ORD-B", 1));
    repo_.save(domain::Order("ORD-C", 2));

    auto orders = repo_.findByUserId(1);

    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].id, b.id);
    EXPECT_EQ(orders[1].id, a.id);
    EXPECT_TRUE(repo_.findByUserId(3).empty());
}

TEST_F(InMemoryOrderRepositoryTest, FindByStatus) {
    auto a = repo_.save(domain::Order("ORD-A", 1));
    repo_.save(domain::Order("ORD-B", 1));

    a.transitionTo(domain::OrderStatus::CANCELLED);
    repo_.update(a);

    EXPECT_EQ(repo_.findByStatus(domain::OrderStatus::PENDING).size(), 1u);
    EXPECT_EQ(repo_.findByStatus(domain::OrderStatus::CANCELLED).size(), 1u);
    EXPECT_TRUE(repo_.findByStatus(domain::OrderStatus::PAID).empty());
}

TEST_F(InMemoryOrderRepositoryTest, ConcurrentSaves_UniqueIds) {
    const int NUM_THREADS = 8;
    const int PER_THREAD = 50;
    std::vector<std::thread> threads;
    std::mutex idsMutex;
    std::set<int64_t> ids;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                auto saved = repo_.save(domain::Order(
                    "ORD-" + std::to_string(t) + "-" + std::to_string(i), t + 1));
                std::lock_guard<std::mutex> lock(idsMutex);
                ids.insert(saved.id);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(ids.size(), static_cast<size_t>(NUM_THREADS * PER_THREAD));
    EXPECT_EQ(repo_.count(), static_cast<size_t>(NUM_THREADS * PER_THREAD));
}

TEST_F(InMemoryOrderRepositoryTest, Clear) {
    repo_.save(domain::Order("ORD-1", 1));
    repo_.clear();

    EXPECT_EQ(repo_.count(), 0u);
    EXPECT_FALSE(repo_.findByOrderNumber("ORD-1").has_value());
    EXPECT_NO_THROW(repo_.save(domain::Order("ORD-1", 1)));
}
