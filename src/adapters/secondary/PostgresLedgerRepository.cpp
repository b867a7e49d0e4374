#include "adapters/secondary/PostgresLedgerRepository.hpp"

#include "domain/LedgerErrors.hpp"
#include <pqxx/pqxx>
#include <set>
#include <vector>
#include <iostream>

namespace ledger::adapters::secondary {

namespace {

constexpr const char* WALLET_COLUMNS =
    "id, user_id, balance::text AS balance, "
    "(EXTRACT(EPOCH FROM updated_at) * 1000000)::BIGINT AS updated_at_us";

constexpr const char* TRANSACTION_COLUMNS =
    "id, wallet_id, txn_type, amount::text AS amount, reference, "
    "(EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_at_us";

/**
 * @brief Перевести текущее исключение libpqxx в доменное и выбросить
 *
 * Вызывать только из catch-блока.
 */
[[noreturn]] void rethrowTranslated(const std::string& operation) {
    try {
        throw;
    } catch (const domain::LedgerException&) {
        throw;
    } catch (const pqxx::in_doubt_error& e) {
        std::cerr << "[PostgresLedgerRepository] " << operation << ": commit outcome unknown: " << e.what() << std::endl;
        throw domain::StorageUnavailableException(
            operation + ": commit outcome unknown: " + e.what(), false);
    } catch (const pqxx::broken_connection& e) {
        std::cerr << "[PostgresLedgerRepository] " << operation << ": connection failed: " << e.what() << std::endl;
        throw domain::StorageUnavailableException(operation + ": connection failed: " + e.what());
    } catch (const pqxx::sql_error& e) {
        const std::string& state = e.sqlstate();
        std::cerr << "[PostgresLedgerRepository] " << operation << " failed [" << state << "]: " << e.what() << std::endl;

        // lock_not_available, deadlock_detected, serialization_failure, query_canceled
        if (state == "55P03" || state == "40P01" || state == "40001" || state == "57014") {
            throw domain::StorageUnavailableException(operation + ": transient failure [" + state + "]");
        }
        // check_violation: balance >= 0 / amount > 0
        if (state == "23514") {
            throw domain::InvariantViolationException(operation + ": check constraint violated: " + e.what());
        }
        throw domain::StorageUnavailableException(
            operation + " failed [" + state + "]: " + e.what(), false);
    }
}

domain::Wallet rowToWallet(const pqxx::row& row) {
    domain::Wallet wallet;
    wallet.walletId = row["id"].as<int64_t>();
    wallet.userId = row["user_id"].as<std::string>();
    wallet.balance = domain::Money::fromString(row["balance"].as<std::string>());
    wallet.updatedAt = domain::Timestamp::fromMicros(row["updated_at_us"].as<int64_t>());
    return wallet;
}

domain::TransactionRecord rowToTransaction(const pqxx::row& row) {
    domain::TransactionRecord record;
    record.transactionId = row["id"].as<int64_t>();
    record.walletId = row["wallet_id"].as<int64_t>();
    record.type = domain::transactionTypeFromString(row["txn_type"].as<std::string>());
    record.amount = domain::Money::fromString(row["amount"].as<std::string>());
    record.reference = row["reference"].as<std::string>();
    record.createdAt = domain::Timestamp::fromMicros(row["created_at_us"].as<int64_t>());
    return record;
}

class PostgresLedgerTransaction : public ports::output::ILedgerTransaction {
public:
    PostgresLedgerTransaction(const std::string& connectionString, std::chrono::milliseconds lockTimeout)
        : connection_(connectionString)
        , work_(connection_)
    {
        work_.exec("SET LOCAL lock_timeout = " + work_.quote(std::to_string(lockTimeout.count()) + "ms"));
    }

    ~PostgresLedgerTransaction() override {
        if (finished_) return;
        settleParticipants(false);
        try {
            work_.abort();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] abort failed: " << e.what() << std::endl;
        }
    }

    std::optional<domain::Wallet> findWalletByUser(const std::string& userId) override {
        try {
            auto result = work_.exec_params(
                std::string("SELECT ") + WALLET_COLUMNS + " FROM wallets WHERE user_id = $1",
                userId);
            if (result.empty()) return std::nullopt;
            return rowToWallet(result[0]);
        } catch (...) {
            rethrowTranslated("findWalletByUser");
        }
    }

    domain::Wallet getOrCreateWallet(const std::string& userId) override {
        try {
            work_.exec_params(
                "INSERT INTO wallets (user_id) VALUES ($1) ON CONFLICT (user_id) DO NOTHING",
                userId);
        } catch (...) {
            rethrowTranslated("getOrCreateWallet");
        }

        auto wallet = findWalletByUser(userId);
        if (!wallet) {
            throw domain::InvariantViolationException("Wallet for " + userId + " missing after insert");
        }
        return *wallet;
    }

    domain::Wallet lockWallet(int64_t walletId) override {
        try {
            auto result = work_.exec_params(
                std::string("SELECT ") + WALLET_COLUMNS + " FROM wallets WHERE id = $1 FOR UPDATE",
                walletId);
            if (result.empty()) {
                throw domain::InvariantViolationException("Wallet not found: " + std::to_string(walletId));
            }
            locked_.insert(walletId);
            return rowToWallet(result[0]);
        } catch (...) {
            rethrowTranslated("lockWallet");
        }
    }

    void updateWalletBalance(int64_t walletId, const domain::Money& balance) override {
        if (locked_.find(walletId) == locked_.end()) {
            throw domain::InvariantViolationException(
                "Wallet " + std::to_string(walletId) + " updated without row lock");
        }

        try {
            auto result = work_.exec_params(
                "UPDATE wallets SET balance = $2::numeric, updated_at = NOW() WHERE id = $1",
                walletId,
                balance.toString());
            if (result.affected_rows() != 1) {
                throw domain::InvariantViolationException(
                    "Wallet balance update touched " + std::to_string(result.affected_rows()) + " rows");
            }
        } catch (...) {
            rethrowTranslated("updateWalletBalance");
        }
    }

    domain::TransactionRecord insertTransaction(
        int64_t walletId,
        domain::TransactionType type,
        const domain::Money& amount,
        const std::string& reference) override
    {
        try {
            auto result = work_.exec_params(
                std::string("INSERT INTO wallet_transactions (wallet_id, txn_type, amount, reference) "
                            "VALUES ($1, $2, $3::numeric, $4) RETURNING ") + TRANSACTION_COLUMNS,
                walletId,
                domain::toString(type),
                amount.toString(),
                reference);
            return rowToTransaction(result[0]);
        } catch (...) {
            rethrowTranslated("insertTransaction");
        }
    }

    std::vector<domain::TransactionRecord> listTransactions(int64_t walletId) override {
        try {
            auto result = work_.exec_params(
                std::string("SELECT ") + TRANSACTION_COLUMNS +
                " FROM wallet_transactions WHERE wallet_id = $1 ORDER BY created_at DESC, id DESC",
                walletId);

            std::vector<domain::TransactionRecord> records;
            records.reserve(result.size());
            for (const auto& row : result) {
                records.push_back(rowToTransaction(row));
            }
            return records;
        } catch (...) {
            rethrowTranslated("listTransactions");
        }
    }

    void enlist(std::shared_ptr<ports::output::ITransactionParticipant> participant) override {
        participants_.push_back(std::move(participant));
    }

    // При in_doubt_error участники откатываются: исход неизвестен,
    // операция помечается как неповторяемая и требует сверки (auditWallet)
    void commit() override {
        try {
            work_.commit();
            finished_ = true;
        } catch (...) {
            finished_ = true;
            settleParticipants(false);
            rethrowTranslated("commit");
        }
        settleParticipants(true);
    }

    void rollback() override {
        if (finished_) return;
        finished_ = true;
        settleParticipants(false);
        try {
            work_.abort();
        } catch (...) {
            rethrowTranslated("rollback");
        }
    }

private:
    pqxx::connection connection_;
    pqxx::work work_;
    std::set<int64_t> locked_;
    std::vector<std::shared_ptr<ports::output::ITransactionParticipant>> participants_;
    bool finished_ = false;

    void settleParticipants(bool committed) noexcept {
        for (const auto& participant : participants_) {
            if (committed) {
                participant->commit();
            } else {
                participant->rollback();
            }
        }
        participants_.clear();
    }
};

} // namespace

PostgresLedgerRepository::PostgresLedgerRepository(
    std::shared_ptr<settings::DbSettings> dbSettings,
    std::shared_ptr<settings::LedgerSettings> ledgerSettings)
    : PostgresLedgerRepository(dbSettings->getConnectionString(), ledgerSettings->getLockTimeout())
{
    std::clog << "[PostgresLedgerRepository] Using " << dbSettings->getHost()
              << ":" << dbSettings->getPort() << "/" << dbSettings->getName() << std::endl;
}

PostgresLedgerRepository::PostgresLedgerRepository(std::string connectionString, std::chrono::milliseconds lockTimeout)
    : connectionString_(std::move(connectionString))
    , lockTimeout_(lockTimeout)
{
    initSchema();
}

std::unique_ptr<ports::output::ILedgerTransaction> PostgresLedgerRepository::begin() {
    try {
        return std::make_unique<PostgresLedgerTransaction>(connectionString_, lockTimeout_);
    } catch (...) {
        rethrowTranslated("begin");
    }
}

void PostgresLedgerRepository::initSchema() {
    try {
        pqxx::connection conn(connectionString_);
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS wallets (
                id BIGSERIAL PRIMARY KEY,
                user_id VARCHAR(64) NOT NULL UNIQUE,
                balance NUMERIC(12, 2) NOT NULL DEFAULT 0 CHECK (balance >= 0),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            );

            CREATE TABLE IF NOT EXISTS wallet_transactions (
                id BIGSERIAL PRIMARY KEY,
                wallet_id BIGINT NOT NULL REFERENCES wallets(id),
                txn_type VARCHAR(20) NOT NULL,
                amount NUMERIC(12, 2) NOT NULL CHECK (amount > 0),
                reference VARCHAR(100) NOT NULL DEFAULT '',
                created_at TIMESTAMPTZ NOT NULL DEFAULT clock_timestamp()
            );

            CREATE INDEX IF NOT EXISTS idx_wallet_transactions_wallet
                ON wallet_transactions (wallet_id, created_at DESC, id DESC);
        )");

        txn.commit();
        std::clog << "[PostgresLedgerRepository] Schema initialized" << std::endl;

    } catch (...) {
        rethrowTranslated("initSchema");
    }
}

} // namespace ledger::adapters::secondary
