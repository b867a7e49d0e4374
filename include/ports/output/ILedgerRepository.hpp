// include/ports/output/ILedgerRepository.hpp
#pragma once

#include "domain/Wallet.hpp"
#include "domain/TransactionRecord.hpp"
#include "domain/enums/TransactionType.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Участник единицы работы вне таблиц кошельков (например, хранилище заказов)
 *
 * Участник готовит свои изменения заранее, не публикуя их, и подключается
 * через ILedgerTransaction::enlist(). Хранилище кошельков вызывает ровно
 * один из методов: commit() после успешной фиксации, rollback() при откате
 * или неудачной фиксации. Оба метода не бросают и не обращаются
 * к хранилищу кошельков.
 */
class ITransactionParticipant {
public:
    virtual ~ITransactionParticipant() = default;

    virtual void commit() noexcept = 0;
    virtual void rollback() noexcept = 0;
};

/**
 * @brief Единица работы с хранилищем кошельков
 *
 * Всё, что сделано через один объект, фиксируется вместе в commit()
 * или не фиксируется вовсе. Деструктор без commit() выполняет rollback().
 *
 * Блокировка строки кошелька (lockWallet) удерживается до commit/rollback.
 *
 * @example
 * ```cpp
 * auto tx = repository->begin();
 * auto wallet = tx->lockWallet(walletId);
 * tx->updateWalletBalance(walletId, wallet.balance + amount);
 * tx->insertTransaction(walletId, TransactionType::DEPOSIT, amount, "DEP:1");
 * tx->commit();
 * ```
 */
class ILedgerTransaction {
public:
    virtual ~ILedgerTransaction() = default;

    /**
     * @brief Найти кошелёк пользователя без создания
     */
    virtual std::optional<domain::Wallet> findWalletByUser(const std::string& userId) = 0;

    /**
     * @brief Найти или создать кошелёк с нулевым балансом
     *
     * Параллельные вызовы для одного пользователя сходятся на одной строке.
     */
    virtual domain::Wallet getOrCreateWallet(const std::string& userId) = 0;

    /**
     * @brief Захватить блокировку строки кошелька и прочитать актуальное состояние
     *
     * Повторный вызов в той же единице работы не блокирует.
     *
     * @throws domain::StorageUnavailableException по таймауту блокировки
     * @throws domain::InvariantViolationException если кошелька нет
     */
    virtual domain::Wallet lockWallet(int64_t walletId) = 0;

    /**
     * @brief Записать новый баланс (требует lockWallet)
     *
     * Обновляет updatedAt.
     */
    virtual void updateWalletBalance(int64_t walletId, const domain::Money& balance) = 0;

    /**
     * @brief Добавить запись в журнал
     */
    virtual domain::TransactionRecord insertTransaction(
        int64_t walletId,
        domain::TransactionType type,
        const domain::Money& amount,
        const std::string& reference) = 0;

    /**
     * @brief Записи кошелька, новые первыми (createdAt desc, id desc)
     */
    virtual std::vector<domain::TransactionRecord> listTransactions(int64_t walletId) = 0;

    /**
     * @brief Подключить участника к исходу этой единицы работы
     */
    virtual void enlist(std::shared_ptr<ITransactionParticipant> participant) = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;
};

/**
 * @brief Хранилище кошельков и журнала транзакций
 */
class ILedgerRepository {
public:
    virtual ~ILedgerRepository() = default;

    /**
     * @brief Открыть единицу работы
     * @throws domain::StorageUnavailableException если хранилище недоступно
     */
    virtual std::unique_ptr<ILedgerTransaction> begin() = 0;
};

} // namespace ledger::ports::output
