#pragma once

#include "Money.hpp"

namespace ledger::domain {

/**
 * @brief Балансы обеих сторон после перевода платы за доставку
 */
struct TransferResult {
    Money ownerBalance;
    Money agentBalance;
};

} // namespace ledger::domain
