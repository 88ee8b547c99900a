#pragma once

#include "utils/SecureRandom.hpp"
#include <array>
#include <string>
#include <sstream>
#include <iomanip>

namespace issuer::utils {

/**
 * @brief Генератор UUID v4
 *
 * Байты берутся из общего SecureRandom, поэтому thread-safe.
 */
class UuidGenerator {
public:
    /**
     * @brief Генерирует UUID v4
     *
     * Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     * где x - hex digit, y - один из [8, 9, a, b]
     */
    static std::string generate() {
        std::array<uint8_t, 16> bytes{};
        SecureRandom::instance().fill(bytes.data(), bytes.size());

        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // variant

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << "-";
            }
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }
};

} // namespace issuer::utils
