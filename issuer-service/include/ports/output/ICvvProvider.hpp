#pragma once

#include <string>

namespace issuer::ports::output {

/**
 * @brief Динамический CVV и оставшееся время жизни окна
 */
struct DynamicCvv {
    std::string code;
    int ttlSeconds = 0;
};

/**
 * @brief Провайдер кодов проверки карты (CVV2 / dCVV)
 *
 * Реализации взаимозаменяемы: HMAC (эталон) и HSM (3DES MAC в модуле).
 *
 * Общая валидация:
 * - panNoCD: только цифры, 12..18 (PAN без контрольной цифры)
 * - expiryYymm: 4 цифры, месяц 01..12
 * - serviceCode: ровно 3 цифры
 * - width: 4 только если явно 4, иначе 3
 */
class ICvvProvider {
public:
    virtual ~ICvvProvider() = default;

    /**
     * @brief Статический CVV2
     * @throws domain::ValidationException
     */
    virtual std::string computeCvv2(
        const std::string& panNoCD,
        const std::string& expiryYymm,
        const std::string& serviceCode,
        int width) = 0;

    /**
     * @brief Динамический CVV для окна floor(unix / step)
     *
     * step < 1 с приводится к 1 с.
     * @throws domain::ValidationException
     */
    virtual DynamicCvv computeDisplayDcvv(
        const std::string& panNoCD,
        const std::string& expiryYymm,
        const std::string& serviceCode,
        int stepSeconds,
        int width) = 0;
};

} // namespace issuer::ports::output
