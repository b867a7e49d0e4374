// include/application/BalanceAdjuster.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/Wallet.hpp"
#include <stdexcept>
#include <string>

namespace ledger::application {

/**
 * @brief Единственный путь записи баланса кошелька
 *
 * Работает внутри единицы работы вызывающего: захватывает блокировку строки,
 * читает актуальный баланс, применяет delta и сохраняет результат.
 * Запись в журнал делает оркестратор.
 */
class BalanceAdjuster {
public:
    /**
     * @brief Захватить блокировку кошелька и вернуть актуальное состояние
     */
    domain::Wallet lock(ports::output::ILedgerTransaction& tx, int64_t walletId) const {
        return tx.lockWallet(walletId);
    }

    /**
     * @brief Применить delta к балансу
     *
     * @return Новый баланс
     * @throws domain::InsufficientFundsException если баланс стал бы < 0 (ничего не записано)
     * @throws domain::InvalidRequestException если баланс превысил бы Money::max()
     */
    domain::Money adjust(ports::output::ILedgerTransaction& tx, int64_t walletId, const domain::Money& delta) const {
        auto wallet = tx.lockWallet(walletId);

        domain::Money newBalance;
        try {
            newBalance = wallet.balance + delta;
        } catch (const std::overflow_error&) {
            throw domain::InvalidRequestException(
                "Wallet " + std::to_string(walletId) + " balance limit " + domain::Money::max().toString() +
                " exceeded: " + wallet.balance.toString() + " + " + delta.toString());
        }

        if (newBalance.isNegative()) {
            throw domain::InsufficientFundsException(walletId, wallet.balance, -delta);
        }

        tx.updateWalletBalance(walletId, newBalance);
        return newBalance;
    }
};

} // namespace ledger::application
