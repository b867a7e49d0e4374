#pragma once

#include "Money.hpp"
#include <stdexcept>
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Базовое исключение движка кошельков
 *
 * Любое исключение прерывает единицу работы целиком:
 * ни одно изменение баланса и ни одна запись журнала не фиксируются.
 */
class LedgerException : public std::runtime_error {
public:
    explicit LedgerException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Недостаточно средств для списания
 *
 * Бизнес-отказ, а не сбой системы. Состояние не изменено.
 */
class InsufficientFundsException : public LedgerException {
public:
    InsufficientFundsException(int64_t walletId, const Money& available, const Money& requested)
        : LedgerException("Insufficient funds in wallet " + std::to_string(walletId) +
                          ": available " + available.toString() +
                          ", requested " + requested.toString())
        , walletId_(walletId)
        , available_(available)
        , requested_(requested)
    {}

    int64_t walletId() const { return walletId_; }
    const Money& available() const { return available_; }
    const Money& requested() const { return requested_; }

private:
    int64_t walletId_;
    Money available_;
    Money requested_;
};

/**
 * @brief Хранилище недоступно (соединение, таймаут блокировки, deadlock, commit)
 *
 * retryable() == false только когда исход commit неизвестен:
 * повтор такой операции может применить её дважды.
 */
class StorageUnavailableException : public LedgerException {
public:
    explicit StorageUnavailableException(const std::string& message, bool retryable = true)
        : LedgerException(message)
        , retryable_(retryable)
    {}

    bool retryable() const { return retryable_; }

private:
    bool retryable_;
};

/**
 * @brief Нарушение инварианта движка (в корректной работе не возникает)
 */
class InvariantViolationException : public LedgerException {
public:
    explicit InvariantViolationException(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Некорректный запрос к оркестратору (сумма <= 0, перевод самому себе)
 */
class InvalidRequestException : public LedgerException {
public:
    explicit InvalidRequestException(const std::string& message)
        : LedgerException(message) {}
};

} // namespace ledger::domain
