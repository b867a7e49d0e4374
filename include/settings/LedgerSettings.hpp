// include/settings/LedgerSettings.hpp
#pragma once

#include "domain/Money.hpp"
#include <string>
#include <cstdlib>
#include <chrono>
#include <stdexcept>

namespace ledger::settings {

/**
 * @brief Настройки движка кошельков
 *
 * Переменные окружения:
 * - LEDGER_STORAGE: postgres | memory (по умолчанию postgres)
 * - LEDGER_LOCK_TIMEOUT_MS: таймаут ожидания блокировки кошелька
 * - LEDGER_DELIVERY_FEE: плата за доставку по умолчанию
 *
 * @example K8s ConfigMap:
 * ```yaml
 * data:
 *   LEDGER_STORAGE: "postgres"
 *   LEDGER_LOCK_TIMEOUT_MS: "5000"
 *   LEDGER_DELIVERY_FEE: "10.00"
 * ```
 */
class LedgerSettings {
public:
    enum class Storage { POSTGRES, MEMORY };

    /**
     * @throws std::invalid_argument при неверных значениях
     */
    LedgerSettings() {
        auto storage = getEnvOrDefault("LEDGER_STORAGE", "postgres");
        if (storage == "postgres") {
            storage_ = Storage::POSTGRES;
        } else if (storage == "memory") {
            storage_ = Storage::MEMORY;
        } else {
            throw std::invalid_argument("Unknown LEDGER_STORAGE: " + storage);
        }

        auto timeoutMs = std::stol(getEnvOrDefault("LEDGER_LOCK_TIMEOUT_MS", "5000"));
        if (timeoutMs <= 0) {
            throw std::invalid_argument("LEDGER_LOCK_TIMEOUT_MS must be positive");
        }
        lockTimeout_ = std::chrono::milliseconds(timeoutMs);

        deliveryFee_ = domain::Money::fromString(getEnvOrDefault("LEDGER_DELIVERY_FEE", "10.00"));
        if (!deliveryFee_.isPositive()) {
            throw std::invalid_argument("LEDGER_DELIVERY_FEE must be positive");
        }
    }

    Storage getStorage() const { return storage_; }
    std::chrono::milliseconds getLockTimeout() const { return lockTimeout_; }
    domain::Money getDeliveryFee() const { return deliveryFee_; }

private:
    Storage storage_ = Storage::POSTGRES;
    std::chrono::milliseconds lockTimeout_{5000};
    domain::Money deliveryFee_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace ledger::settings
