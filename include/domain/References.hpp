#pragma once

#include <string>

namespace ledger::domain::references {

inline std::string order(const std::string& orderId) {
    return "ORDER:" + orderId;
}

inline std::string delivery(const std::string& deliveryId) {
    return "DELIVERY:" + deliveryId;
}

inline std::string deposit(const std::string& depositId) {
    return "DEP:" + depositId;
}

} // namespace ledger::domain::references
