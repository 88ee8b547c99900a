#pragma once

#include "domain/Exceptions.hpp"
#include "utils/SecureKey.hpp"
#include <openssl/crypto.h>
#include <cstdlib>
#include <iostream>
#include <string>

namespace issuer::settings {

/**
 * @brief Ключевой материал сервиса из ENV
 *
 * Встроенные демо-ключи разрешены только при ISSUER_DEMO_MODE=true.
 * Без демо-режима отсутствующий ключ считается фатальной ошибкой конфигурации.
 *
 * Переменные окружения:
 * - ISSUER_DEMO_MODE
 * - ISSUER_PAN_HASH_KEY: pepper для pan_hash
 * - ISSUER_CVK_KEY: ключ HMAC CVV-провайдера
 * - ISSUER_HSM_CVK_HEX: 3DES ключ (16/24 байта hex) программного MAC-устройства
 */
class SecuritySettings {
public:
    SecuritySettings() {
        demoMode_ = getEnvOrDefault("ISSUER_DEMO_MODE", "false") == "true";
        panHashKey_ = getEnvOrDefault("ISSUER_PAN_HASH_KEY", "");
        cvkKey_ = getEnvOrDefault("ISSUER_CVK_KEY", "");
        hsmCvkHex_ = getEnvOrDefault("ISSUER_HSM_CVK_HEX", "");
    }

    ~SecuritySettings() {
        cleanse(panHashKey_);
        cleanse(cvkKey_);
        cleanse(hsmCvkHex_);
    }

    SecuritySettings(const SecuritySettings&) = delete;
    SecuritySettings& operator=(const SecuritySettings&) = delete;

    bool isDemoMode() const { return demoMode_; }

    /**
     * @throws domain::ProviderConfigException
     */
    utils::SecureKey panHashKey() const {
        return keyOrDemo(panHashKey_, "ISSUER_PAN_HASH_KEY", kDemoPanHashKey);
    }

    /**
     * @throws domain::ProviderConfigException
     */
    utils::SecureKey cvkKey() const {
        return keyOrDemo(cvkKey_, "ISSUER_CVK_KEY", kDemoCvkKey);
    }

    /**
     * @throws domain::ProviderConfigException
     */
    utils::SecureKey hsmCvkKey() const {
        std::string hex = hsmCvkHex_;
        if (hex.empty()) {
            if (!demoMode_) {
                throw domain::ProviderConfigException(
                    "ISSUER_HSM_CVK_HEX is required (set ISSUER_DEMO_MODE=true for the demo key)");
            }
            std::cerr << "[SecuritySettings] DEMO MODE: using built-in HSM CVK, not for production" << std::endl;
            hex = kDemoHsmCvkHex;
        }
        try {
            return utils::SecureKey::fromHex(hex);
        } catch (const domain::ValidationException& e) {
            throw domain::ProviderConfigException(std::string("ISSUER_HSM_CVK_HEX: ") + e.what());
        }
    }

private:
    static constexpr const char* kDemoPanHashKey = "demo-pan-hash-key-not-for-production";
    static constexpr const char* kDemoCvkKey = "demo-cvk-not-for-production";
    static constexpr const char* kDemoHsmCvkHex = "0123456789ABCDEFFEDCBA9876543210";

    bool demoMode_;
    std::string panHashKey_;
    std::string cvkKey_;
    std::string hsmCvkHex_;

    utils::SecureKey keyOrDemo(const std::string& value, const char* name, const char* demo) const {
        if (!value.empty()) {
            return utils::SecureKey(value);
        }
        if (!demoMode_) {
            throw domain::ProviderConfigException(
                std::string(name) + " is required (set ISSUER_DEMO_MODE=true for the demo key)");
        }
        std::cerr << "[SecuritySettings] DEMO MODE: using built-in " << name
                  << ", not for production" << std::endl;
        return utils::SecureKey(std::string(demo));
    }

    static void cleanse(std::string& s) {
        if (!s.empty()) {
            OPENSSL_cleanse(&s[0], s.size());
        }
    }

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace issuer::settings
