#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>
#include <cstddef>

namespace ledger::domain {

/**
 * @brief Результат сверки баланса кошелька с журналом
 *
 * Инвариант: balance == сумма signedAmount() всех записей кошелька.
 */
struct AuditReport {
    std::string userId;
    int64_t walletId = 0;
    Money balance;
    Money ledgerTotal;
    size_t recordCount = 0;

    bool consistent() const { return balance == ledgerTotal; }
};

} // namespace ledger::domain
