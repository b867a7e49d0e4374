#include <gtest/gtest.h>

#include "application/WalletStore.hpp"
#include "adapters/secondary/InMemoryLedgerRepository.hpp"
#include <set>
#include <thread>
#include <vector>

using namespace ledger;

class WalletStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<adapters::secondary::InMemoryLedgerRepository>();
        store_ = std::make_shared<application::WalletStore>(repository_);
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerRepository> repository_;
    std::shared_ptr<application::WalletStore> store_;
};

TEST_F(WalletStoreTest, Read_CreatesWalletWithZeroBalance) {
    auto wallet = store_->read("alice");

    EXPECT_EQ(wallet.userId, "alice");
    EXPECT_TRUE(wallet.balance.isZero());
    EXPECT_EQ(repository_->walletCount(), 1);
}

TEST_F(WalletStoreTest, GetOrCreate_ReturnsSameWallet) {
    auto first = store_->getOrCreate("alice");
    auto second = store_->getOrCreate("alice");
    auto viaRead = store_->read("alice");

    EXPECT_EQ(first.walletId, second.walletId);
    EXPECT_EQ(first.walletId, viaRead.walletId);
    EXPECT_EQ(repository_->walletCount(), 1);
}

TEST_F(WalletStoreTest, DifferentUsers_DifferentWallets) {
    auto alice = store_->getOrCreate("alice");
    auto bob = store_->getOrCreate("bob");

    EXPECT_NE(alice.walletId, bob.walletId);
    EXPECT_EQ(repository_->walletCount(), 2);
}

TEST_F(WalletStoreTest, ConcurrentFirstAccess_OneWallet) {
    constexpr int kThreads = 16;
    std::vector<int64_t> ids(kThreads);
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([this, &ids, i]() {
            ids[i] = store_->getOrCreate("shared").walletId;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(std::set<int64_t>(ids.begin(), ids.end()).size(), 1);
    EXPECT_EQ(repository_->walletCount(), 1);
}
