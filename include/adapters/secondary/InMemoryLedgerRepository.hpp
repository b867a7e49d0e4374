// include/adapters/secondary/InMemoryLedgerRepository.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "domain/LedgerErrors.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory реализация хранилища кошельков
 *
 * Повторяет семантику PostgreSQL-адаптера:
 * - блокировка строки = std::timed_mutex кошелька, держится до commit/rollback
 * - изменения буферизуются в единице работы и применяются в commit()
 * - читатели без блокировки видят последнее зафиксированное состояние
 *
 * Кошелёк, созданный getOrCreateWallet(), виден сразу (нулевой баланс
 * не нарушает инвариант журнала).
 *
 * Участники (enlist) публикуются в commit() под тем же мьютексом, что и
 * изменения балансов, так что читатель не увидит одно без другого.
 */
class InMemoryLedgerRepository : public ports::output::ILedgerRepository {
public:
    explicit InMemoryLedgerRepository(std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(5000))
        : state_(std::make_shared<State>())
    {
        state_->lockTimeout = lockTimeout;
        std::clog << "[InMemoryLedgerRepository] Created, lock timeout "
                  << lockTimeout.count() << "ms" << std::endl;
    }

    std::unique_ptr<ports::output::ILedgerTransaction> begin() override {
        return std::make_unique<Transaction>(state_);
    }

    // Test helpers
    size_t walletCount() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->byId.size();
    }

    size_t transactionCount() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->transactions.size();
    }

private:
    struct WalletRow {
        domain::Wallet wallet;
        std::timed_mutex lock;
    };

    struct State {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<WalletRow>> byUser;
        std::unordered_map<int64_t, std::shared_ptr<WalletRow>> byId;
        std::vector<domain::TransactionRecord> transactions;
        int64_t nextWalletId = 1;
        int64_t nextTransactionId = 1;
        std::chrono::milliseconds lockTimeout{5000};
    };

    class Transaction : public ports::output::ILedgerTransaction {
    public:
        explicit Transaction(std::shared_ptr<State> state) : state_(std::move(state)) {}

        ~Transaction() override {
            rollback();
        }

        std::optional<domain::Wallet> findWalletByUser(const std::string& userId) override {
            ensureActive();
            std::lock_guard<std::mutex> lock(state_->mutex);
            auto it = state_->byUser.find(userId);
            if (it == state_->byUser.end()) return std::nullopt;
            return snapshot(*it->second);
        }

        domain::Wallet getOrCreateWallet(const std::string& userId) override {
            ensureActive();
            std::lock_guard<std::mutex> lock(state_->mutex);
            auto it = state_->byUser.find(userId);
            if (it != state_->byUser.end()) {
                return snapshot(*it->second);
            }

            auto row = std::make_shared<WalletRow>();
            row->wallet.walletId = state_->nextWalletId++;
            row->wallet.userId = userId;
            row->wallet.updatedAt = domain::Timestamp::now();
            state_->byUser[userId] = row;
            state_->byId[row->wallet.walletId] = row;
            return row->wallet;
        }

        domain::Wallet lockWallet(int64_t walletId) override {
            ensureActive();
            auto row = findRow(walletId);

            if (locks_.find(walletId) == locks_.end()) {
                std::unique_lock<std::timed_mutex> rowLock(row->lock, std::defer_lock);
                if (!rowLock.try_lock_for(state_->lockTimeout)) {
                    throw domain::StorageUnavailableException(
                        "Lock timeout on wallet " + std::to_string(walletId));
                }
                locks_.emplace(walletId, std::move(rowLock));
            }

            std::lock_guard<std::mutex> lock(state_->mutex);
            return snapshot(*row);
        }

        void updateWalletBalance(int64_t walletId, const domain::Money& balance) override {
            ensureActive();
            if (locks_.find(walletId) == locks_.end()) {
                throw domain::InvariantViolationException(
                    "Wallet " + std::to_string(walletId) + " updated without row lock");
            }
            if (balance.isNegative()) {
                throw domain::InvariantViolationException(
                    "Wallet " + std::to_string(walletId) + " balance would become " + balance.toString());
            }
            pendingBalances_[walletId] = {balance, domain::Timestamp::now()};
        }

        domain::TransactionRecord insertTransaction(
            int64_t walletId,
            domain::TransactionType type,
            const domain::Money& amount,
            const std::string& reference) override
        {
            ensureActive();
            findRow(walletId);

            domain::TransactionRecord record;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                record.transactionId = state_->nextTransactionId++;
            }
            record.walletId = walletId;
            record.type = type;
            record.amount = amount;
            record.reference = reference;
            record.createdAt = domain::Timestamp::now();

            pendingRecords_.push_back(record);
            return record;
        }

        std::vector<domain::TransactionRecord> listTransactions(int64_t walletId) override {
            ensureActive();
            std::vector<domain::TransactionRecord> result;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                for (const auto& record : state_->transactions) {
                    if (record.walletId == walletId) result.push_back(record);
                }
            }
            for (const auto& record : pendingRecords_) {
                if (record.walletId == walletId) result.push_back(record);
            }

            std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
                if (a.createdAt == b.createdAt) return a.transactionId > b.transactionId;
                return a.createdAt > b.createdAt;
            });
            return result;
        }

        void enlist(std::shared_ptr<ports::output::ITransactionParticipant> participant) override {
            ensureActive();
            participants_.push_back(std::move(participant));
        }

        void commit() override {
            ensureActive();
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                for (const auto& [walletId, pending] : pendingBalances_) {
                    auto& wallet = state_->byId.at(walletId)->wallet;
                    wallet.balance = pending.first;
                    wallet.updatedAt = pending.second;
                }
                state_->transactions.insert(
                    state_->transactions.end(), pendingRecords_.begin(), pendingRecords_.end());

                for (const auto& participant : participants_) {
                    participant->commit();
                }
            }
            participants_.clear();
            finish();
        }

        void rollback() override {
            if (finished_) return;
            for (const auto& participant : participants_) {
                participant->rollback();
            }
            participants_.clear();
            finish();
        }

    private:
        std::shared_ptr<State> state_;
        std::map<int64_t, std::unique_lock<std::timed_mutex>> locks_;
        std::map<int64_t, std::pair<domain::Money, domain::Timestamp>> pendingBalances_;
        std::vector<domain::TransactionRecord> pendingRecords_;
        std::vector<std::shared_ptr<ports::output::ITransactionParticipant>> participants_;
        bool finished_ = false;

        void ensureActive() const {
            if (finished_) {
                throw domain::InvariantViolationException("Unit of work already finished");
            }
        }

        void finish() {
            pendingBalances_.clear();
            pendingRecords_.clear();
            locks_.clear();
            finished_ = true;
        }

        std::shared_ptr<WalletRow> findRow(int64_t walletId) const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            auto it = state_->byId.find(walletId);
            if (it == state_->byId.end()) {
                throw domain::InvariantViolationException("Wallet not found: " + std::to_string(walletId));
            }
            return it->second;
        }

        // Вызывать под state_->mutex
        domain::Wallet snapshot(const WalletRow& row) const {
            auto wallet = row.wallet;
            auto pending = pendingBalances_.find(wallet.walletId);
            if (pending != pendingBalances_.end()) {
                wallet.balance = pending->second.first;
                wallet.updatedAt = pending->second.second;
            }
            return wallet;
        }
    };

    std::shared_ptr<State> state_;
};

} // namespace ledger::adapters::secondary
