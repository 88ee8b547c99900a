#pragma once

#include "adapters/secondary/cvv/CvvInputs.hpp"
#include "ports/output/ICvvProvider.hpp"
#include "utils/SecureKey.hpp"

namespace issuer::adapters::secondary::cvv {

/**
 * @brief Эталонный CVV-провайдер на HMAC-SHA256
 *
 * Сообщение: panNoCD|YYMM|serviceCode|static-v1 (или dynamic-v1 + 8 байт
 * счётчика окна). Код: динамическое усечение RFC 4226 (31 бит) по модулю
 * 10^width с ведущими нулями.
 *
 * Ключ затирается при разрушении провайдера.
 */
class HmacCvvProvider : public ports::output::ICvvProvider {
public:
    /**
     * @throws domain::ProviderConfigException если ключ пустой
     */
    explicit HmacCvvProvider(utils::SecureKey key, Clock clock = systemClock());

    HmacCvvProvider(const HmacCvvProvider&) = delete;
    HmacCvvProvider& operator=(const HmacCvvProvider&) = delete;

    std::string computeCvv2(
        const std::string& panNoCD,
        const std::string& expiryYymm,
        const std::string& serviceCode,
        int width) override;

    ports::output::DynamicCvv computeDisplayDcvv(
        const std::string& panNoCD,
        const std::string& expiryYymm,
        const std::string& serviceCode,
        int stepSeconds,
        int width) override;

    /**
     * @brief Динамический CVV на заданный момент времени
     */
    ports::output::DynamicCvv computeDisplayDcvvAt(
        const std::string& panNoCD,
        const std::string& expiryYymm,
        const std::string& serviceCode,
        std::chrono::system_clock::time_point now,
        int stepSeconds,
        int width) const;

private:
    std::string truncatedDecimal(const std::vector<uint8_t>& message, int width) const;

    utils::SecureKey key_;
    Clock clock_;
};

} // namespace issuer::adapters::secondary::cvv
