#include <gtest/gtest.h>

#include "adapters/primary/LedgerCommandHandler.hpp"
#include "adapters/secondary/InMemoryLedgerRepository.hpp"
#include "application/TransferOrchestrator.hpp"

using namespace ledger;
using adapters::primary::LedgerCommandHandler;

class LedgerCommandHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto repository = std::make_shared<adapters::secondary::InMemoryLedgerRepository>();
        auto service = std::make_shared<application::TransferOrchestrator>(
            repository,
            std::make_shared<application::WalletStore>(repository),
            std::make_shared<application::BalanceAdjuster>(),
            std::make_shared<application::TransactionLog>(repository));

        handler_ = std::make_unique<LedgerCommandHandler>(
            service, std::make_shared<settings::LedgerSettings>());
    }

    std::unique_ptr<LedgerCommandHandler> handler_;
};

TEST_F(LedgerCommandHandlerTest, Deposit_ReturnsBalance) {
    auto result = handler_->handle({"deposit", "alice", "500", "DEP:1"});

    EXPECT_EQ(result.exitCode, LedgerCommandHandler::EXIT_OK);
    EXPECT_EQ(result.body["user"], "alice");
    EXPECT_EQ(result.body["balance"], "500.00");
}

TEST_F(LedgerCommandHandlerTest, DebitOrder_InsufficientFunds) {
    handler_->handle({"deposit", "alice", "200"});

    auto result = handler_->handle({"debit-order", "alice", "250", "8"});

    EXPECT_EQ(result.exitCode, LedgerCommandHandler::EXIT_INSUFFICIENT_FUNDS);
    EXPECT_EQ(result.body["error"], "insufficient_funds");
    EXPECT_EQ(result.body["available"], "200.00");
    EXPECT_EQ(result.body["requested"], "250.00");
}

TEST_F(LedgerCommandHandlerTest, DebitOrder_UsesOrderReference) {
    handler_->handle({"deposit", "alice", "500"});
    handler_->handle({"debit-order", "alice", "300", "7"});

    auto result = handler_->handle({"transactions", "alice"});

    ASSERT_EQ(result.exitCode, LedgerCommandHandler::EXIT_OK);
    auto items = result.body["transactions"];
    ASSERT_EQ(items.size(), 2);
    EXPECT_EQ(items[0]["txn_type"], "debit");
    EXPECT_EQ(items[0]["amount"], "300.00");
    EXPECT_EQ(items[0]["reference"], "ORDER:7");
    EXPECT_EQ(items[1]["txn_type"], "deposit");
    EXPECT_EQ(items[1]["reference"], "Added to Wallet");
}

TEST_F(LedgerCommandHandlerTest, TransferFee_DefaultsToConfiguredFee) {
    handler_->handle({"deposit", "owner", "100"});

    auto result = handler_->handle({"transfer-fee", "owner", "agent", "3"});

    ASSERT_EQ(result.exitCode, LedgerCommandHandler::EXIT_OK);
    EXPECT_EQ(result.body["fee"], "10.00");
    EXPECT_EQ(result.body["owner"]["balance"], "90.00");
    EXPECT_EQ(result.body["agent"]["balance"], "10.00");
}

TEST_F(LedgerCommandHandlerTest, TransferFee_ExplicitFee) {
    handler_->handle({"deposit", "owner", "100"});

    auto result = handler_->handle({"transfer-fee", "owner", "agent", "3", "50"});

    ASSERT_EQ(result.exitCode, LedgerCommandHandler::EXIT_OK);
    EXPECT_EQ(result.body["owner"]["balance"], "50.00");
    EXPECT_EQ(result.body["agent"]["balance"], "50.00");
}

TEST_F(LedgerCommandHandlerTest, CreditOwnerAndWithdraw) {
    handler_->handle({"credit-owner", "owner", "120.50", "7"});

    auto result = handler_->handle({"withdraw", "owner", "20.50"});

    ASSERT_EQ(result.exitCode, LedgerCommandHandler::EXIT_OK);
    EXPECT_EQ(result.body["balance"], "100.00");
}

TEST_F(LedgerCommandHandlerTest, Audit_Consistent) {
    handler_->handle({"deposit", "alice", "500"});
    handler_->handle({"debit-order", "alice", "300", "7"});

    auto result = handler_->handle({"audit", "alice"});

    EXPECT_EQ(result.exitCode, LedgerCommandHandler::EXIT_OK);
    EXPECT_EQ(result.body["consistent"], true);
    EXPECT_EQ(result.body["ledger_total"], "200.00");
    EXPECT_EQ(result.body["records"], 2);
}

TEST_F(LedgerCommandHandlerTest, Balance_NewUserIsZero) {
    auto result = handler_->handle({"balance", "newbie"});

    EXPECT_EQ(result.exitCode, LedgerCommandHandler::EXIT_OK);
    EXPECT_EQ(result.body["balance"], "0.00");
}

TEST_F(LedgerCommandHandlerTest, InvalidAmount) {
    auto garbage = handler_->handle({"deposit", "alice", "ten"});
    auto negative = handler_->handle({"deposit", "alice", "-5"});

    EXPECT_EQ(garbage.exitCode, LedgerCommandHandler::EXIT_INVALID);
    EXPECT_EQ(garbage.body["error"], "invalid_request");
    EXPECT_EQ(negative.exitCode, LedgerCommandHandler::EXIT_INVALID);
    EXPECT_EQ(negative.body["error"], "invalid_request");
}

TEST_F(LedgerCommandHandlerTest, OversizedAmount) {
    auto huge = handler_->handle({"deposit", "alice", "99999999999999999999"});
    auto aboveColumn = handler_->handle({"deposit", "alice", "10000000000.00"});

    EXPECT_EQ(huge.exitCode, LedgerCommandHandler::EXIT_INVALID);
    EXPECT_EQ(huge.body["error"], "invalid_request");
    EXPECT_EQ(aboveColumn.exitCode, LedgerCommandHandler::EXIT_INVALID);
    EXPECT_EQ(aboveColumn.body["error"], "invalid_request");
    EXPECT_EQ(handler_->handle({"balance", "alice"}).body["balance"], "0.00");
}

TEST_F(LedgerCommandHandlerTest, DepositBeyondBalanceLimit) {
    ASSERT_EQ(handler_->handle({"deposit", "alice", "9999999999.99"}).exitCode,
              LedgerCommandHandler::EXIT_OK);

    auto result = handler_->handle({"deposit", "alice", "0.01"});

    EXPECT_EQ(result.exitCode, LedgerCommandHandler::EXIT_INVALID);
    EXPECT_EQ(result.body["error"], "invalid_request");
    EXPECT_EQ(handler_->handle({"balance", "alice"}).body["balance"], "9999999999.99");
}

TEST_F(LedgerCommandHandlerTest, StdoutStaysClean) {
    ::testing::internal::CaptureStdout();

    handler_->handle({"deposit", "alice", "50"});
    handler_->handle({"debit-order", "alice", "80", "1"});
    handler_->handle({"transfer-fee", "alice", "bob", "2"});
    handler_->handle({"explode"});

    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "");
}

TEST_F(LedgerCommandHandlerTest, Usage) {
    EXPECT_EQ(handler_->handle({}).exitCode, LedgerCommandHandler::EXIT_INVALID);
    EXPECT_EQ(handler_->handle({"explode"}).body["error"], "usage");
    EXPECT_EQ(handler_->handle({"balance"}).body["error"], "usage");
}
