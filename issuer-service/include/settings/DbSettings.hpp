#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace issuer::settings {

/**
 * @brief Настройки подключения к PostgreSQL из ENV
 *
 * Создаётся только для backend=pg, поэтому пароль обязателен.
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("ISSUER_DB_HOST", "localhost");
        port_ = std::stoi(getEnvOrDefault("ISSUER_DB_PORT", "5432"));
        name_ = getEnvOrDefault("ISSUER_DB_NAME", "issuer_db");
        user_ = getEnvOrDefault("ISSUER_DB_USER", "issuer_user");
        password_ = getEnvOrThrow("ISSUER_DB_PASSWORD");
    }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value) {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace issuer::settings
