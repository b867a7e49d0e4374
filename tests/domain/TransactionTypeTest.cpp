#include <gtest/gtest.h>

#include "domain/TransactionRecord.hpp"
#include "domain/References.hpp"

using namespace ledger::domain;

TEST(TransactionTypeTest, TagsRoundTrip) {
    for (auto type : {TransactionType::DEBIT, TransactionType::CREDIT_FOR_GOODS,
                      TransactionType::DEBIT_FOR_DELIVERY, TransactionType::DELIVERY_EARNING,
                      TransactionType::DEPOSIT, TransactionType::WITHDRAW}) {
        EXPECT_EQ(transactionTypeFromString(toString(type)), type);
    }
}

TEST(TransactionTypeTest, StorageTags) {
    EXPECT_EQ(toString(TransactionType::DEBIT), "debit");
    EXPECT_EQ(toString(TransactionType::CREDIT_FOR_GOODS), "credit_for_goods");
    EXPECT_EQ(toString(TransactionType::DEBIT_FOR_DELIVERY), "debit_for_delivery");
    EXPECT_EQ(toString(TransactionType::DELIVERY_EARNING), "delivery_earning");
    EXPECT_EQ(toString(TransactionType::DEPOSIT), "deposit");
}

TEST(TransactionTypeTest, UnknownTagThrows) {
    EXPECT_THROW(transactionTypeFromString("credit"), std::invalid_argument);
}

TEST(TransactionTypeTest, SignImpliedByType) {
    TransactionRecord record;
    record.amount = Money::fromString("50");

    record.type = TransactionType::DEBIT_FOR_DELIVERY;
    EXPECT_EQ(record.signedAmount(), Money::fromString("-50"));

    record.type = TransactionType::DELIVERY_EARNING;
    EXPECT_EQ(record.signedAmount(), Money::fromString("50"));

    EXPECT_TRUE(isDebit(TransactionType::DEBIT));
    EXPECT_TRUE(isDebit(TransactionType::WITHDRAW));
    EXPECT_FALSE(isDebit(TransactionType::DEPOSIT));
    EXPECT_FALSE(isDebit(TransactionType::CREDIT_FOR_GOODS));
}

TEST(TransactionTypeTest, ReferenceConventions) {
    EXPECT_EQ(references::order("7"), "ORDER:7");
    EXPECT_EQ(references::delivery("3"), "DELIVERY:3");
    EXPECT_EQ(references::deposit("1"), "DEP:1");
}
