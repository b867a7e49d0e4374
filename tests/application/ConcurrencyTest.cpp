#include <gtest/gtest.h>

#include "application/TransferOrchestrator.hpp"
#include "adapters/secondary/InMemoryLedgerRepository.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace ledger;
using domain::Money;

class ConcurrencyTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<adapters::secondary::InMemoryLedgerRepository>();
        service_ = std::make_shared<application::TransferOrchestrator>(
            repository_,
            std::make_shared<application::WalletStore>(repository_),
            std::make_shared<application::BalanceAdjuster>(),
            std::make_shared<application::TransactionLog>(repository_));
    }

    template <typename Body>
    void runThreads(int count, Body body) {
        std::vector<std::thread> threads;
        for (int i = 0; i < count; ++i) {
            threads.emplace_back([&body, i]() { body(i); });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerRepository> repository_;
    std::shared_ptr<application::TransferOrchestrator> service_;
};

TEST_F(ConcurrencyTest, ParallelDeposits_NoLostUpdates) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;
    std::atomic<int> failures{0};

    runThreads(kThreads, [&](int t) {
        for (int i = 0; i < kPerThread; ++i) {
            try {
                service_->deposit("alice", Money::fromString("0.01"),
                                  "DEP:" + std::to_string(t) + "-" + std::to_string(i));
            } catch (const std::exception&) {
                ++failures;
            }
        }
    });

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(service_->getBalance("alice"), Money::fromMinor(kThreads * kPerThread));
    EXPECT_EQ(service_->listTransactions("alice").size(), kThreads * kPerThread);
    EXPECT_TRUE(service_->auditWallet("alice").consistent());
}

TEST_F(ConcurrencyTest, ParallelDebits_NeverNegative) {
    service_->deposit("alice", Money::fromString("100"), "DEP:1");
    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};

    runThreads(20, [&](int i) {
        try {
            service_->debitForOrder("alice", Money::fromString("10"), "ORDER:" + std::to_string(i));
            ++succeeded;
        } catch (const domain::InsufficientFundsException&) {
            ++rejected;
        }
    });

    EXPECT_EQ(succeeded.load(), 10);
    EXPECT_EQ(rejected.load(), 10);
    EXPECT_TRUE(service_->getBalance("alice").isZero());
    EXPECT_TRUE(service_->auditWallet("alice").consistent());
}

TEST_F(ConcurrencyTest, OppositeTransfers_NoDeadlock) {
    service_->deposit("owner", Money::fromString("1000"), "DEP:1");
    service_->deposit("agent", Money::fromString("1000"), "DEP:2");
    constexpr int kTransfers = 100;
    std::atomic<int> failures{0};

    runThreads(4, [&](int t) {
        const bool forward = t % 2 == 0;
        for (int i = 0; i < kTransfers; ++i) {
            try {
                service_->transferDeliveryFee(
                    forward ? "owner" : "agent",
                    forward ? "agent" : "owner",
                    Money::fromString("1.00"),
                    "DELIVERY:" + std::to_string(t) + "-" + std::to_string(i));
            } catch (const std::exception&) {
                ++failures;
            }
        }
    });

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(service_->getBalance("owner") + service_->getBalance("agent"), Money::fromString("2000"));
    EXPECT_EQ(service_->getBalance("owner"), Money::fromString("1000"));
    EXPECT_TRUE(service_->auditWallet("owner").consistent());
    EXPECT_TRUE(service_->auditWallet("agent").consistent());
}

TEST_F(ConcurrencyTest, MixedOperations_ConserveMoney) {
    service_->deposit("customer", Money::fromString("500"), "DEP:1");
    std::atomic<int> debits{0};
    std::atomic<int> rejected{0};

    runThreads(6, [&](int t) {
        for (int i = 0; i < 20; ++i) {
            const auto ref = std::to_string(t) + "-" + std::to_string(i);
            try {
                service_->debitForOrder("customer", Money::fromString("5"), "ORDER:" + ref);
                ++debits;
                service_->creditOwnerForOrder("owner", Money::fromString("5"), "ORDER:" + ref);
            } catch (const domain::InsufficientFundsException&) {
                ++rejected;
            }
        }
    });

    EXPECT_EQ(debits.load(), 100);
    EXPECT_EQ(rejected.load(), 20);
    EXPECT_TRUE(service_->getBalance("customer").isZero());
    EXPECT_EQ(service_->getBalance("owner"), Money::fromString("500"));
}
