// include/application/TransactionLog.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/TransactionRecord.hpp"
#include <memory>
#include <vector>
#include <iostream>

namespace ledger::application {

/**
 * @brief Журнал транзакций (только добавление)
 */
class TransactionLog {
public:
    explicit TransactionLog(std::shared_ptr<ports::output::ILedgerRepository> repository)
        : repository_(std::move(repository))
    {}

    /**
     * @brief Добавить запись в единице работы вызывающего
     *
     * Ошибка добавления пробрасывается и прерывает всю единицу работы.
     *
     * @throws domain::InvariantViolationException если amount <= 0
     */
    domain::TransactionRecord append(
        ports::output::ILedgerTransaction& tx,
        int64_t walletId,
        domain::TransactionType type,
        const domain::Money& amount,
        const std::string& reference) const
    {
        if (!amount.isPositive()) {
            throw domain::InvariantViolationException(
                "Transaction amount must be positive, got " + amount.toString());
        }

        auto record = tx.insertTransaction(walletId, type, amount, reference);
        std::clog << "[TransactionLog] Appended " << domain::toString(type) << " "
                  << amount.toString() << " to wallet " << walletId
                  << " ref=" << reference << std::endl;
        return record;
    }

    /**
     * @brief Записи кошелька, новые первыми
     */
    std::vector<domain::TransactionRecord> list(int64_t walletId) const {
        auto tx = repository_->begin();
        auto records = tx->listTransactions(walletId);
        tx->commit();
        return records;
    }

private:
    std::shared_ptr<ports::output::ILedgerRepository> repository_;
};

} // namespace ledger::application
