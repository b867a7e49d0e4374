// include/application/WalletStore.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "domain/Wallet.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Доступ к кошелькам пользователей
 *
 * Кошелёк создаётся лениво при первом обращении. Каждый вызов
 * выполняется в отдельной короткой единице работы, чтобы вставка новой строки
 * не держала блокировок во время денежных операций.
 *
 * Значение баланса из read() нельзя использовать для решения о списании:
 * проверка и изменение выполняются только под блокировкой в BalanceAdjuster.
 */
class WalletStore {
public:
    explicit WalletStore(std::shared_ptr<ports::output::ILedgerRepository> repository)
        : repository_(std::move(repository))
    {
        std::clog << "[WalletStore] Created" << std::endl;
    }

    domain::Wallet getOrCreate(const std::string& userId) {
        auto tx = repository_->begin();
        auto wallet = tx->getOrCreateWallet(userId);
        tx->commit();
        return wallet;
    }

    /**
     * @brief Текущее состояние кошелька (создаёт при отсутствии)
     */
    domain::Wallet read(const std::string& userId) {
        auto tx = repository_->begin();
        auto existing = tx->findWalletByUser(userId);
        if (existing) {
            tx->commit();
            return *existing;
        }

        auto wallet = tx->getOrCreateWallet(userId);
        tx->commit();
        std::clog << "[WalletStore] Created wallet " << wallet.walletId
                  << " for user " << userId << std::endl;
        return wallet;
    }

private:
    std::shared_ptr<ports::output::ILedgerRepository> repository_;
};

} // namespace ledger::application
