#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/TransactionType.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Неизменяемая запись журнала транзакций
 *
 * Одна запись на каждое изменение баланса.
 * amount всегда > 0, знак задаётся типом.
 */
struct TransactionRecord {
    int64_t transactionId = 0;
    int64_t walletId = 0;
    TransactionType type = TransactionType::DEPOSIT;
    Money amount;
    std::string reference;  ///< Связь с бизнес-событием ("ORDER:7", "DELIVERY:3")
    Timestamp createdAt;

    /**
     * @brief Вклад записи в баланс кошелька со знаком
     */
    Money signedAmount() const {
        return isDebit(type) ? -amount : amount;
    }
};

} // namespace ledger::domain
