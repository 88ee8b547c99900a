#pragma once

#include <chrono>
#include <cstdint>

namespace issuer::domain {

/**
 * @brief Временная метка (UTC) с наносекундной точностью system_clock
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    /**
     * @brief Создать Timestamp с текущим временем
     */
    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Микросекунды с 1970 (точность timestamptz в PostgreSQL)
     */
    int64_t toUnixMicros() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixMicros(int64_t micros) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::microseconds(micros))
        ));
    }

    /**
     * @brief Добавить секунды
     */
    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace issuer::domain
