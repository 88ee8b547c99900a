#pragma once

#include <string>
#include <cstdlib>

namespace issuer::settings {

/**
 * @brief Настройки фонового снятия просроченных холдов
 *
 * Переменные окружения:
 * - ISSUER_SWEEP_INTERVAL_MS: период между проходами (5000)
 * - ISSUER_SWEEP_BATCH_SIZE: максимум холдов за проход (500)
 */
class SweeperSettings {
public:
    SweeperSettings() {
        intervalMs_ = std::stoi(getEnvOrDefault("ISSUER_SWEEP_INTERVAL_MS", "5000"));
        batchSize_ = std::stoi(getEnvOrDefault("ISSUER_SWEEP_BATCH_SIZE", "500"));
        if (intervalMs_ < 1) intervalMs_ = 1;
        if (batchSize_ < 1) batchSize_ = 1;
    }

    int getIntervalMs() const { return intervalMs_; }
    int getBatchSize() const { return batchSize_; }

private:
    int intervalMs_;
    int batchSize_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace issuer::settings
