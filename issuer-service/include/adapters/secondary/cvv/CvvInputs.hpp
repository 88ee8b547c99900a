#pragma once

#include "domain/ExpiryCalculator.hpp"
#include "domain/PanGenerator.hpp"
#include "domain/Exceptions.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

/**
 * @file CvvInputs.hpp
 * @brief Общая для CVV-провайдеров валидация и нормализация входов
 */
namespace issuer::adapters::secondary::cvv {

/// Источник текущего времени (подменяется в тестах)
using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

/**
 * @brief panNoCD / YYMM / service code
 * @throws domain::ValidationException
 */
inline void validateInputs(const std::string& panNoCD,
                           const std::string& expiryYymm,
                           const std::string& serviceCode) {
    domain::ExpiryCalculator::validateYymm(expiryYymm);

    if (serviceCode.size() != 3 || !domain::pan::isDigits(serviceCode)) {
        throw domain::ValidationException("service code must be 3 digits");
    }
    if (panNoCD.empty() || !domain::pan::isDigits(panNoCD)) {
        throw domain::ValidationException("panNoCD must be digits only");
    }
    if (panNoCD.size() < 12 || panNoCD.size() > 18) {
        throw domain::ValidationException(
            "panNoCD length must be 12..18 (got " + std::to_string(panNoCD.size()) + ")");
    }
}

inline int normalizeWidth(int width) {
    return width == 4 ? 4 : 3;
}

inline int normalizeStep(int stepSeconds) {
    return stepSeconds < 1 ? 1 : stepSeconds;
}

/**
 * @brief Окно времени: floor(unix / step)
 */
inline uint64_t windowCounter(int64_t unixSeconds, int stepSeconds) {
    return static_cast<uint64_t>(unixSeconds / stepSeconds);
}

/**
 * @brief Счётчик окна в 8 байтах big-endian
 */
inline std::array<uint8_t, 8> windowBytes(uint64_t counter) {
    std::array<uint8_t, 8> out{};
    for (int i = 0; i < 8; ++i) {
        out[7 - i] = static_cast<uint8_t>(counter >> (8 * i));
    }
    return out;
}

/**
 * @brief Сколько секунд осталось до смены окна (step, если ровно на границе)
 */
inline int ttlSeconds(int64_t unixSeconds, int stepSeconds) {
    int ttl = static_cast<int>(stepSeconds - (unixSeconds % stepSeconds));
    return ttl <= 0 ? stepSeconds : ttl;
}

inline int64_t toUnixSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace issuer::adapters::secondary::cvv
