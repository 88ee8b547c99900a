#pragma once

#include "domain/ExpiryCalculator.hpp"
#include "domain/IssuerConfig.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <stdexcept>
#include <string>

namespace issuer::settings {

/**
 * @brief Настройки выпуска карт и обработки авторизаций
 *
 * Читает параметры из переменных окружения.
 *
 * Переменные окружения:
 * - ISSUER_REPO_BACKEND: pg | mem
 * - ISSUER_ALLOW_MEM_BACKEND: true разрешает mem вне тестов
 * - ISSUER_BIN_PREFIX: BIN выпускаемых карт (421234)
 * - ISSUER_CARD_PRODUCT: продукт для выпуска (debit)
 * - ISSUER_PRODUCT_YEARS: JSON продукт → годы ({"credit":3,"debit":5})
 * - ISSUER_EXPIRY_TZ: POSIX TZ для срока действия (UTC0, MSK+3; восток положительный)
 * - ISSUER_HOLD_TTL_SECONDS: время жизни холда (604800)
 * - ISSUER_CVV_PROVIDER: hmac | hsm
 * - ISSUER_DCVV_STEP_SECONDS: окно динамического CVV (30)
 *
 * @example
 * ```bash
 * ISSUER_PRODUCT_YEARS='{"credit":3,"debit":5,"prepaid":2}' ./issuer-service
 * ```
 */
class IssuerSettings {
public:
    IssuerSettings() {
        backend_ = toLower(getEnvOrDefault("ISSUER_REPO_BACKEND", "pg"));
        allowMemBackend_ = toLower(getEnvOrDefault("ISSUER_ALLOW_MEM_BACKEND", "false")) == "true";
        binPrefix_ = getEnvOrDefault("ISSUER_BIN_PREFIX", "421234");
        cardProduct_ = getEnvOrDefault("ISSUER_CARD_PRODUCT", "debit");
        productYears_ = parseProductYears(
            getEnvOrDefault("ISSUER_PRODUCT_YEARS", R"({"credit":3,"debit":5})"));
        expiryTz_ = getEnvOrDefault("ISSUER_EXPIRY_TZ", "UTC0");
        holdTtlSeconds_ = std::stoll(getEnvOrDefault("ISSUER_HOLD_TTL_SECONDS", "604800"));
        cvvProvider_ = toLower(getEnvOrDefault("ISSUER_CVV_PROVIDER", "hmac"));
        dcvvStepSeconds_ = std::stoi(getEnvOrDefault("ISSUER_DCVV_STEP_SECONDS", "30"));
    }

    std::string getBackend() const { return backend_; }
    bool isMemBackendAllowed() const { return allowMemBackend_; }

    /**
     * @brief BIN из окружения; некорректность проверяет сервис
     */
    std::string getBinPrefix() const { return binPrefix_; }
    std::string getCardProduct() const { return cardProduct_; }
    const std::map<std::string, int>& getProductYears() const { return productYears_; }
    std::string getExpiryTz() const { return expiryTz_; }
    int64_t getHoldTtlSeconds() const { return holdTtlSeconds_; }
    std::string getCvvProvider() const { return cvvProvider_; }
    int getDcvvStepSeconds() const { return dcvvStepSeconds_; }

    /**
     * @brief Конфигурация калькулятора сроков
     * @throws domain::ValidationException при некорректном ISSUER_EXPIRY_TZ
     */
    domain::ExpirySettings toExpirySettings() const {
        domain::ExpirySettings expiry;
        expiry.zone = domain::TimeZone(expiryTz_);
        expiry.productYears = productYears_;
        return expiry;
    }

    domain::IssuerConfig toIssuerConfig() const {
        domain::IssuerConfig config;
        config.binPrefix = binPrefix_;
        config.cardProduct = cardProduct_;
        config.holdTtlSeconds = holdTtlSeconds_;
        config.dcvvStepSeconds = dcvvStepSeconds_;
        return config;
    }

    /**
     * @brief Разбор JSON-объекта продукт → годы
     *
     * Неположительные значения игнорируются.
     * @throws std::invalid_argument если это не JSON-объект с целыми значениями
     */
    static std::map<std::string, int> parseProductYears(const std::string& json) {
        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(json);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::invalid_argument(std::string("ISSUER_PRODUCT_YEARS is not valid JSON: ") + e.what());
        }
        if (!parsed.is_object()) {
            throw std::invalid_argument("ISSUER_PRODUCT_YEARS must be a JSON object");
        }

        std::map<std::string, int> result;
        for (auto it = parsed.begin(); it != parsed.end(); ++it) {
            if (!it.value().is_number_integer()) {
                throw std::invalid_argument("ISSUER_PRODUCT_YEARS: years for '" + it.key() + "' must be an integer");
            }
            int years = it.value().get<int>();
            if (years > 0) {
                result[toLower(it.key())] = years;
            }
        }
        return result;
    }

private:
    std::string backend_;
    bool allowMemBackend_;
    std::string binPrefix_;
    std::string cardProduct_;
    std::map<std::string, int> productYears_;
    std::string expiryTz_;
    int64_t holdTtlSeconds_;
    std::string cvvProvider_;
    int dcvvStepSeconds_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
};

} // namespace issuer::settings
