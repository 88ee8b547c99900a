#pragma once

#include "adapters/secondary/cvv/CvvInputs.hpp"
#include "ports/output/ICvvProvider.hpp"
#include "ports/output/IMacDevice.hpp"
#include <memory>

namespace issuer::adapters::secondary::cvv {

/**
 * @brief CVV-провайдер поверх криптомодуля (3DES MAC + децимализация)
 *
 * Данные: panNoCD ‖ YYMM ‖ serviceCode [‖ hex 8 байт счётчика окна].
 * Hex MAC децимализуется (a..f → (v - 10) % 10) и обрезается до width.
 * Если hex-цифр не хватило, хвост добивается случайными цифрами.
 */
class HsmCvvProvider : public ports::output::ICvvProvider {
public:
    /**
     * @throws domain::ProviderConfigException если device == nullptr
     */
    explicit HsmCvvProvider(std::shared_ptr<ports::output::IMacDevice> device,
                            Clock clock = systemClock());

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
     * @brief Децимализация hex-представления MAC
     */
    static std::string decimalize(const std::vector<uint8_t>& mac, int width);

private:
    std::shared_ptr<ports::output::IMacDevice> device_;
    Clock clock_;
};

} // namespace issuer::adapters::secondary::cvv
