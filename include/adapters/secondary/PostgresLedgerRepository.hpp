// include/adapters/secondary/PostgresLedgerRepository.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища кошельков
 *
 * Таблица: wallets
 * - id BIGSERIAL PRIMARY KEY
 * - user_id VARCHAR(64) NOT NULL UNIQUE
 * - balance NUMERIC(12,2) NOT NULL DEFAULT 0 CHECK (balance >= 0)
 * - updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
 *
 * Таблица: wallet_transactions
 * - id BIGSERIAL PRIMARY KEY
 * - wallet_id BIGINT NOT NULL REFERENCES wallets(id)
 * - txn_type VARCHAR(20) NOT NULL
 * - amount NUMERIC(12,2) NOT NULL CHECK (amount > 0)
 * - reference VARCHAR(100) NOT NULL DEFAULT ''
 * - created_at TIMESTAMPTZ NOT NULL DEFAULT clock_timestamp()
 *
 * Одна единица работы = одно соединение + pqxx::work.
 * Блокировка строки: SELECT ... FOR UPDATE, ожидание ограничено
 * SET LOCAL lock_timeout.
 *
 * Ошибки libpqxx переводятся в domain::StorageUnavailableException /
 * domain::InvariantViolationException по SQLSTATE.
 */
class PostgresLedgerRepository : public ports::output::ILedgerRepository {
public:
    PostgresLedgerRepository(
        std::shared_ptr<settings::DbSettings> dbSettings,
        std::shared_ptr<settings::LedgerSettings> ledgerSettings);

    PostgresLedgerRepository(std::string connectionString, std::chrono::milliseconds lockTimeout);

    std::unique_ptr<ports::output::ILedgerTransaction> begin() override;

private:
    std::string connectionString_;
    std::chrono::milliseconds lockTimeout_;

    void initSchema();
};

} // namespace ledger::adapters::secondary
