#pragma once

#include <cstdint>
#include <vector>

namespace issuer::ports::output {

/**
 * @brief Примитив криптомодуля: 3DES MAC над данными ключом CVK
 *
 * Ключ живёт внутри устройства и наружу не выдаётся.
 */
class IMacDevice {
public:
    virtual ~IMacDevice() = default;

    /**
     * @return 8 байт MAC
     */
    virtual std::vector<uint8_t> mac(const std::vector<uint8_t>& data) = 0;
};

} // namespace issuer::ports::output
