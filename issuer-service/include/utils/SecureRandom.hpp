#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace issuer::utils {

/**
 * @brief Единый на процесс криптостойкий генератор (OpenSSL RAND_bytes)
 *
 * Не пересевается на каждый вызов. Доступ сериализован мьютексом.
 *
 * @example
 * ```cpp
 * auto cvv = utils::SecureRandom::instance().digits(3);
 * ```
 */
class SecureRandom {
public:
    static SecureRandom& instance();

    SecureRandom(const SecureRandom&) = delete;
    SecureRandom& operator=(const SecureRandom&) = delete;

    /**
     * @brief Заполнить буфер случайными байтами
     * @throws std::runtime_error если RAND_bytes не смог выдать энтропию
     */
    void fill(uint8_t* buffer, size_t length);

    /**
     * @brief Строка из count десятичных цифр без модульного смещения
     *
     * Принимаются только байты < 250 (наибольшее кратное 10, не больше 256),
     * цифра = байт % 10. Остальные байты отбрасываются.
     */
    std::string digits(size_t count);

private:
    SecureRandom() = default;

    std::mutex mutex_;
};

} // namespace issuer::utils
