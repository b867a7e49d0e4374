// include/ports/input/IWalletLedgerService.hpp
#pragma once

#include "domain/Money.hpp"
#include "domain/TransactionRecord.hpp"
#include "domain/TransferResult.hpp"
#include "domain/AuditReport.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include <functional>
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Создание заказа внутри единицы работы списания
 *
 * Заказ не публикуется сам: хранилище заказов подключается к переданной
 * единице работы через ILedgerTransaction::enlist() и становится видимым
 * только вместе со списанием.
 *
 * Возвращает reference для записи debit (обычно "ORDER:<id>").
 */
using OrderCreator = std::function<std::string(ports::output::ILedgerTransaction&)>;

/**
 * @brief Входной порт движка кошельков
 *
 * Единственные точки входа для движения денег. Каждая операция атомарна:
 * все изменения балансов и записи журнала фиксируются вместе или никакие.
 *
 * Ошибки:
 * - domain::InsufficientFundsException: бизнес-отказ, состояние не изменено
 * - domain::StorageUnavailableException: сбой хранилища, состояние не изменено
 * - domain::InvariantViolationException: нарушение инварианта, операция прервана
 * - domain::InvalidRequestException: некорректные аргументы
 */
class IWalletLedgerService {
public:
    virtual ~IWalletLedgerService() = default;

    /**
     * @brief Пополнить кошелёк
     * @return Новый баланс
     */
    virtual domain::Money deposit(
        const std::string& userId,
        const domain::Money& amount,
        const std::string& reference) = 0;

    /**
     * @brief Списать с покупателя стоимость заказа
     * @return Новый баланс покупателя
     */
    virtual domain::Money debitForOrder(
        const std::string& customerId,
        const domain::Money& amount,
        const std::string& orderReference) = 0;

    /**
     * @brief Создать заказ и списать его стоимость в одной единице работы
     *
     * createOrder вызывается только после успешной проверки баланса.
     */
    virtual domain::Money debitForOrder(
        const std::string& customerId,
        const domain::Money& amount,
        const OrderCreator& createOrder) = 0;

    /**
     * @brief Зачислить владельцу оплату за заказ
     */
    virtual domain::Money creditOwnerForOrder(
        const std::string& ownerId,
        const domain::Money& amount,
        const std::string& orderReference) = 0;

    /**
     * @brief Перевести плату за доставку от владельца курьеру
     */
    virtual domain::TransferResult transferDeliveryFee(
        const std::string& ownerId,
        const std::string& agentId,
        const domain::Money& fee,
        const std::string& deliveryReference) = 0;

    /**
     * @brief Вывести средства на банковский счёт
     */
    virtual domain::Money withdraw(
        const std::string& userId,
        const domain::Money& amount,
        const std::string& reference) = 0;

    virtual domain::Money getBalance(const std::string& userId) = 0;

    /**
     * @brief История транзакций, новые первыми
     */
    virtual std::vector<domain::TransactionRecord> listTransactions(const std::string& userId) = 0;

    /**
     * @brief Сверить баланс с суммой записей журнала
     */
    virtual domain::AuditReport auditWallet(const std::string& userId) = 0;
};

} // namespace ledger::ports::input
