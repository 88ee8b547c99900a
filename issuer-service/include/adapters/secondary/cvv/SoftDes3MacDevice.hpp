#pragma once

#include "ports/output/IMacDevice.hpp"
#include "utils/SecureKey.hpp"
#include <mutex>

namespace issuer::adapters::secondary::cvv {

/**
 * @brief Программная замена криптомодуля: ISO 9797-1 MAC algorithm 1
 * (DES-EDE3-CBC, нулевой IV, дополнение нулями) через OpenSSL
 *
 * Ключ 16 байт (K1K2, раскрывается в K1K2K1) или 24 байта.
 */
class SoftDes3MacDevice : public ports::output::IMacDevice {
public:
    /**
     * @throws domain::ProviderConfigException при неверной длине ключа
     */
    explicit SoftDes3MacDevice(utils::SecureKey key);

    SoftDes3MacDevice(const SoftDes3MacDevice&) = delete;
    SoftDes3MacDevice& operator=(const SoftDes3MacDevice&) = delete;

    std::vector<uint8_t> mac(const std::vector<uint8_t>& data) override;

private:
    utils::SecureKey key_;   ///< всегда 24 байта
    std::mutex mutex_;
};

} // namespace issuer::adapters::secondary::cvv
