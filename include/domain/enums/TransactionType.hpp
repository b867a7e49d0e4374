#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Тип записи в журнале транзакций
 *
 * Знак суммы не хранится, он определяется типом (см. isDebit()).
 */
enum class TransactionType {
    DEBIT,              ///< Оплата заказа покупателем
    CREDIT_FOR_GOODS,   ///< Зачисление владельцу за исполненный заказ
    DEBIT_FOR_DELIVERY, ///< Списание с владельца платы за доставку
    DELIVERY_EARNING,   ///< Зачисление курьеру платы за доставку
    DEPOSIT,            ///< Пополнение кошелька
    WITHDRAW            ///< Вывод средств на банковский счёт
};

/**
 * @brief Преобразовать в строковый тег (так тип хранится в БД)
 */
inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::DEBIT:              return "debit";
        case TransactionType::CREDIT_FOR_GOODS:   return "credit_for_goods";
        case TransactionType::DEBIT_FOR_DELIVERY: return "debit_for_delivery";
        case TransactionType::DELIVERY_EARNING:   return "delivery_earning";
        case TransactionType::DEPOSIT:            return "deposit";
        case TransactionType::WITHDRAW:           return "withdraw";
    }
    return "unknown";
}

/**
 * @brief Создать из строкового тега
 * @throws std::invalid_argument если тег не распознан
 */
inline TransactionType transactionTypeFromString(const std::string& str) {
    if (str == "debit")              return TransactionType::DEBIT;
    if (str == "credit_for_goods")   return TransactionType::CREDIT_FOR_GOODS;
    if (str == "debit_for_delivery") return TransactionType::DEBIT_FOR_DELIVERY;
    if (str == "delivery_earning")   return TransactionType::DELIVERY_EARNING;
    if (str == "deposit")            return TransactionType::DEPOSIT;
    if (str == "withdraw")           return TransactionType::WITHDRAW;
    throw std::invalid_argument("Unknown TransactionType: " + str);
}

/**
 * @brief Уменьшает ли запись данного типа баланс кошелька
 */
inline bool isDebit(TransactionType type) {
    return type == TransactionType::DEBIT ||
           type == TransactionType::DEBIT_FOR_DELIVERY ||
           type == TransactionType::WITHDRAW;
}

} // namespace ledger::domain
