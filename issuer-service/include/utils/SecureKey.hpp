#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace issuer::utils {

/**
 * @brief Владелец секретного ключа: затирает байты в деструкторе (OPENSSL_cleanse)
 *
 * Затирание best-effort: копии, сделанные до передачи ключа сюда,
 * остаются на совести вызывающего.
 */
class SecureKey {
public:
    SecureKey() = default;
    explicit SecureKey(const std::string& material);
    explicit SecureKey(std::vector<uint8_t> material);

    ~SecureKey();

    SecureKey(const SecureKey&) = delete;
    SecureKey& operator=(const SecureKey&) = delete;

    SecureKey(SecureKey&& other) noexcept;
    SecureKey& operator=(SecureKey&& other) noexcept;

    /**
     * @brief Ключ из hex-строки
     * @throws domain::ValidationException при некорректном hex
     */
    static SecureKey fromHex(const std::string& hex);

    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    /**
     * @brief Явно затереть ключ до разрушения объекта
     */
    void wipe();

private:
    std::vector<uint8_t> bytes_;
};

} // namespace issuer::utils
