#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Кошелёк пользователя
 *
 * Ровно один на пользователя, создаётся лениво при первом обращении.
 * Баланс меняется только через BalanceAdjuster под блокировкой строки.
 */
struct Wallet {
    int64_t walletId = 0;   ///< Суррогатный ключ (порядок захвата блокировок)
    std::string userId;     ///< Владелец кошелька
    Money balance;          ///< Текущий баланс, никогда не < 0 после commit
    Timestamp updatedAt;    ///< Момент последнего изменения баланса
};

} // namespace ledger::domain
