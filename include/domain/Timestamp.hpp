#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace ledger::domain {

/**
 * @brief Временная метка (UTC)
 *
 * В БД хранится как TIMESTAMPTZ, между адаптером и доменом
 * передаётся в микросекундах от epoch.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromMicros(int64_t micros) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::microseconds(micros))));
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }
};

} // namespace ledger::domain
