#pragma once

#include "utils/SecureKey.hpp"
#include <string>

namespace issuer::utils {

/**
 * @brief Keyed-хэш PAN: HMAC-SHA256(pepper, normalizePan(pan)) в hex
 *
 * Репозитории хранят только этот хэш, поэтому поиск карты по PAN
 * идёт через него же.
 */
class PanHasher {
public:
    /**
     * @throws domain::ProviderConfigException если pepper пустой
     */
    explicit PanHasher(SecureKey pepper);

    PanHasher(const PanHasher&) = delete;
    PanHasher& operator=(const PanHasher&) = delete;

    std::string hash(const std::string& pan) const;

private:
    SecureKey pepper_;
};

} // namespace issuer::utils
