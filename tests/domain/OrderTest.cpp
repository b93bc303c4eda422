/**
 * @file OrderTest.cpp
 * @brief Unit tests for Order lifecycle and Money
 */

#include <gtest/gtest.h>
#include "domain/Order.hpp"
#include "utils/OrderNumberGenerator.hpp"
#include <regex>

using namespace ordercore::domain;

// ============================================================================
// ORDER LIFECYCLE
// ============================================================================

TEST(OrderTest, NewOrder_IsPendingAndUnpersisted) {
    Order order("ORD-00000001-000001", 7);

    EXPECT_EQ(order.status, OrderStatus::PENDING);
    EXPECT_EQ(order.userId, 7);
    EXPECT_FALSE(order.isPersisted());
    EXPECT_FALSE(order.isPaid());
    EXPECT_TRUE(order.total.isZero());
}

TEST(OrderTest, PendingToPaidToShipped) {
    Order order("ORD-1", 1);

    order.transitionTo(OrderStatus::PAID);
    EXPECT_TRUE(order.isPaid());

    order.transitionTo(OrderStatus::SHIPPED);
    EXPECT_EQ(order.status, OrderStatus::SHIPPED);
    EXPECT_TRUE(order.isPaid());
}

TEST(OrderTest, FailedOrder_CanBePaidAgain) {
    Order order("ORD-1", 1);
    order.transitionTo(OrderStatus::FAILED);

    EXPECT_NO_THROW(order.transitionTo(OrderStatus::PAID));
    EXPECT_EQ(order.status, OrderStatus::PAID);
}

TEST(OrderTest, IllegalTransitions_Throw) {
    Order pending("ORD-1", 1);
    EXPECT_THROW(pending.transitionTo(OrderStatus::SHIPPED), ValidationError);

    Order cancelled("ORD-2", 1);
    cancelled.transitionTo(OrderStatus::CANCELLED);
    EXPECT_THROW(cancelled.transitionTo(OrderStatus::PAID), ValidationError);
    EXPECT_THROW(cancelled.transitionTo(OrderStatus::PENDING), ValidationError);

    Order paid("ORD-3", 1);
    paid.transitionTo(OrderStatus::PAID);
    EXPECT_THROW(paid.transitionTo(OrderStatus::CANCELLED), ValidationError);
    EXPECT_THROW(paid.transitionTo(OrderStatus::FAILED), ValidationError);
}

TEST(OrderTest, SetAmounts_ComputesTotal) {
    Order order("ORD-1", 1);
    order.setAmounts(Money(10, 500000000), Money(5, 0), Money(1, 750000000));

    EXPECT_EQ(order.total.units, 17);
    EXPECT_EQ(order.total.nano, 250000000);
    EXPECT_GE(order.total, order.subtotal);
    EXPECT_EQ(order.total.toString(), "17.25");
}

TEST(OrderTest, SetAmounts_RejectsNegative) {
    Order order("ORD-1", 1);
    EXPECT_THROW(order.setAmounts(Money(-1, 0), Money::zero(), Money::zero()), ValidationError);
}

TEST(OrderTest, StatusStrings_RoundTrip) {
    for (auto s : {OrderStatus::PENDING, OrderStatus::PAID, OrderStatus::FAILED,
                   OrderStatus::CANCELLED, OrderStatus::SHIPPED}) {
        EXPECT_EQ(parseOrderStatus(toString(s)), s);
    }
    EXPECT_THROW(parseOrderStatus("DELIVERED_TWICE"), ValidationError);
}

// ============================================================================
// MONEY
// ============================================================================

TEST(MoneyTest, FromDouble_SplitsUnitsAndNano) {
    auto m = Money::fromDouble(12.5);
    EXPECT_EQ(m.units, 12);
    EXPECT_EQ(m.nano, 500000000);
    EXPECT_EQ(m.currency, "USD");
}

TEST(MoneyTest, Subtraction_NormalizesSign) {
    auto m = Money(1, 0) - Money(0, 250000000);
    EXPECT_EQ(m.units, 0);
    EXPECT_EQ(m.nano, 750000000);
    EXPECT_FALSE(m.isNegative());

    auto negative = Money(0, 0) - Money(1, 0);
    EXPECT_TRUE(negative.isNegative());
}

// ============================================================================
// ORDER NUMBER
// ============================================================================

TEST(OrderNumberGeneratorTest, Format) {
    auto number = ordercore::utils::OrderNumberGenerator::generate();
    EXPECT_TRUE(std::regex_match(number, std::regex("ORD-[0-9]{8}-[0-9]{6}"))) << number;
}
