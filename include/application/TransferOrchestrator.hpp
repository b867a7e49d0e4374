// include/application/TransferOrchestrator.hpp
#pragma once

#include "ports/input/IWalletLedgerService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "application/WalletStore.hpp"
#include "application/BalanceAdjuster.hpp"
#include "application/TransactionLog.hpp"
#include "domain/LedgerErrors.hpp"
#include <algorithm>
#include <memory>
#include <type_traits>
#include <iostream>

namespace ledger::application {

/**
 * @brief Оркестратор движения средств между кошельками
 *
 * Каждая операция выполняется в одной единице работы:
 * 1. кошельки создаются заранее (WalletStore, отдельная короткая транзакция)
 * 2. begin() → блокировки строк → проверка баланса → изменения + записи → commit()
 * 3. любое исключение → rollback (деструктор ILedgerTransaction) и проброс наверх
 *
 * Повторов внутри нет: повтор денежной операции решает вызывающий.
 *
 * Блокировки для перевода между двумя кошельками берутся по возрастанию
 * walletId, независимо от направления перевода.
 *
 * @example
 * ```
 * deposit("alice", 500, "DEP:1")             → 500.00, запись deposit
 * debitForOrder("alice", 300, "ORDER:7")     → 200.00, запись debit
 * debitForOrder("alice", 250, "ORDER:8")     → InsufficientFundsException, баланс 200.00
 * ```
 */
class TransferOrchestrator : public ports::input::IWalletLedgerService {
public:
    TransferOrchestrator(
        std::shared_ptr<ports::output::ILedgerRepository> repository,
        std::shared_ptr<WalletStore> walletStore,
        std::shared_ptr<BalanceAdjuster> adjuster,
        std::shared_ptr<TransactionLog> transactionLog
    ) : repository_(std::move(repository))
      , walletStore_(std::move(walletStore))
      , adjuster_(std::move(adjuster))
      , transactionLog_(std::move(transactionLog))
    {
        std::clog << "[TransferOrchestrator] Created" << std::endl;
    }

    domain::Money deposit(
        const std::string& userId,
        const domain::Money& amount,
        const std::string& reference) override
    {
        requirePositive(amount, "Deposit amount");
        auto wallet = walletStore_->getOrCreate(userId);

        auto balance = inUnitOfWork("deposit", [&](ports::output::ILedgerTransaction& tx) {
            return post(tx, wallet.walletId, domain::TransactionType::DEPOSIT, amount, reference);
        });

        std::clog << "[TransferOrchestrator] Deposit " << amount.toString()
                  << " to " << userId << ", balance " << balance.toString() << std::endl;
        return balance;
    }

    domain::Money debitForOrder(
        const std::string& customerId,
        const domain::Money& amount,
        const std::string& orderReference) override
    {
        return debitForOrder(customerId, amount, [&orderReference](ports::output::ILedgerTransaction&) {
            return orderReference;
        });
    }

    domain::Money debitForOrder(
        const std::string& customerId,
        const domain::Money& amount,
        const ports::input::OrderCreator& createOrder) override
    {
        requirePositive(amount, "Order amount");
        if (!createOrder) {
            throw domain::InvalidRequestException("Order creator is not set");
        }
        auto wallet = walletStore_->getOrCreate(customerId);

        auto balance = inUnitOfWork("debitForOrder", [&](ports::output::ILedgerTransaction& tx) {
            requireFunds(tx, wallet.walletId, amount);
            auto reference = createOrder(tx);
            return post(tx, wallet.walletId, domain::TransactionType::DEBIT, amount, reference);
        });

        std::clog << "[TransferOrchestrator] Order debit " << amount.toString()
                  << " from " << customerId << ", balance " << balance.toString() << std::endl;
        return balance;
    }

    domain::Money creditOwnerForOrder(
        const std::string& ownerId,
        const domain::Money& amount,
        const std::string& orderReference) override
    {
        requirePositive(amount, "Order amount");
        auto wallet = walletStore_->getOrCreate(ownerId);

        auto balance = inUnitOfWork("creditOwnerForOrder", [&](ports::output::ILedgerTransaction& tx) {
            return post(tx, wallet.walletId, domain::TransactionType::CREDIT_FOR_GOODS, amount, orderReference);
        });

        std::clog << "[TransferOrchestrator] Owner credit " << amount.toString()
                  << " to " << ownerId << ", balance " << balance.toString() << std::endl;
        return balance;
    }

    domain::TransferResult transferDeliveryFee(
        const std::string& ownerId,
        const std::string& agentId,
        const domain::Money& fee,
        const std::string& deliveryReference) override
    {
        requirePositive(fee, "Delivery fee");
        if (ownerId == agentId) {
            throw domain::InvalidRequestException("Delivery fee owner and agent must differ: " + ownerId);
        }

        auto owner = walletStore_->getOrCreate(ownerId);
        auto agent = walletStore_->getOrCreate(agentId);

        auto result = inUnitOfWork("transferDeliveryFee", [&](ports::output::ILedgerTransaction& tx) {
            adjuster_->lock(tx, std::min(owner.walletId, agent.walletId));
            adjuster_->lock(tx, std::max(owner.walletId, agent.walletId));

            requireFunds(tx, owner.walletId, fee);

            domain::TransferResult transfer;
            transfer.ownerBalance = post(
                tx, owner.walletId, domain::TransactionType::DEBIT_FOR_DELIVERY, fee, deliveryReference);
            transfer.agentBalance = post(
                tx, agent.walletId, domain::TransactionType::DELIVERY_EARNING, fee, deliveryReference);
            return transfer;
        });

        std::clog << "[TransferOrchestrator] Delivery fee " << fee.toString()
                  << " " << ownerId << " -> " << agentId
                  << " ref=" << deliveryReference << std::endl;
        return result;
    }

    domain::Money withdraw(
        const std::string& userId,
        const domain::Money& amount,
        const std::string& reference) override
    {
        requirePositive(amount, "Withdrawal amount");
        auto wallet = walletStore_->getOrCreate(userId);

        auto balance = inUnitOfWork("withdraw", [&](ports::output::ILedgerTransaction& tx) {
            requireFunds(tx, wallet.walletId, amount);
            return post(tx, wallet.walletId, domain::TransactionType::WITHDRAW, amount, reference);
        });

        std::clog << "[TransferOrchestrator] Withdraw " << amount.toString()
                  << " from " << userId << ", balance " << balance.toString() << std::endl;
        return balance;
    }

    domain::Money getBalance(const std::string& userId) override {
        return walletStore_->read(userId).balance;
    }

    std::vector<domain::TransactionRecord> listTransactions(const std::string& userId) override {
        auto wallet = walletStore_->read(userId);
        return transactionLog_->list(wallet.walletId);
    }

    domain::AuditReport auditWallet(const std::string& userId) override {
        auto wallet = walletStore_->getOrCreate(userId);

        auto report = inUnitOfWork("auditWallet", [&](ports::output::ILedgerTransaction& tx) {
            auto locked = adjuster_->lock(tx, wallet.walletId);
            auto records = tx.listTransactions(wallet.walletId);

            domain::AuditReport audit;
            audit.userId = userId;
            audit.walletId = locked.walletId;
            audit.balance = locked.balance;
            audit.recordCount = records.size();
            for (const auto& record : records) {
                audit.ledgerTotal += record.signedAmount();
            }
            return audit;
        });

        if (!report.consistent()) {
            std::cerr << "[TransferOrchestrator] Audit mismatch for wallet " << report.walletId
                      << ": balance " << report.balance.toString()
                      << ", ledger " << report.ledgerTotal.toString() << std::endl;
        }
        return report;
    }

private:
    std::shared_ptr<ports::output::ILedgerRepository> repository_;
    std::shared_ptr<WalletStore> walletStore_;
    std::shared_ptr<BalanceAdjuster> adjuster_;
    std::shared_ptr<TransactionLog> transactionLog_;

    /**
     * @brief Выполнить operation в одной единице работы и зафиксировать
     *
     * При исключении ILedgerTransaction откатывается в деструкторе.
     */
    template <typename Operation>
    auto inUnitOfWork(const char* name, Operation&& operation)
        -> std::invoke_result_t<Operation&, ports::output::ILedgerTransaction&>
    {
        auto tx = repository_->begin();
        try {
            auto result = operation(*tx);
            tx->commit();
            return result;
        } catch (const domain::InsufficientFundsException& e) {
            std::clog << "[TransferOrchestrator] " << name << " rejected: " << e.what() << std::endl;
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[TransferOrchestrator] " << name << " aborted: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Изменить баланс и добавить парную запись журнала
     */
    domain::Money post(
        ports::output::ILedgerTransaction& tx,
        int64_t walletId,
        domain::TransactionType type,
        const domain::Money& amount,
        const std::string& reference)
    {
        auto delta = domain::isDebit(type) ? -amount : amount;
        auto balance = adjuster_->adjust(tx, walletId, delta);
        auto record = transactionLog_->append(tx, walletId, type, amount, reference);

        if (record.walletId != walletId || record.type != type ||
            record.amount != amount || record.signedAmount() != delta) {
            throw domain::InvariantViolationException(
                "Appended " + domain::toString(record.type) + " record for wallet " +
                std::to_string(record.walletId) + " does not match adjustment " +
                delta.toString() + " of wallet " + std::to_string(walletId));
        }
        return balance;
    }

    void requireFunds(ports::output::ILedgerTransaction& tx, int64_t walletId, const domain::Money& amount) {
        auto wallet = adjuster_->lock(tx, walletId);
        if (wallet.balance < amount) {
            throw domain::InsufficientFundsException(walletId, wallet.balance, amount);
        }
    }

    static void requirePositive(const domain::Money& amount, const std::string& what) {
        if (!amount.isPositive()) {
            throw domain::InvalidRequestException(what + " must be positive, got " + amount.toString());
        }
    }
};

} // namespace ledger::application
