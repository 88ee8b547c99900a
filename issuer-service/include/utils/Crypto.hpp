#pragma once

#include "utils/SecureKey.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace issuer::utils {

/**
 * @brief HMAC-SHA256(key, message)
 */
std::vector<uint8_t> hmacSha256(const SecureKey& key, const std::vector<uint8_t>& message);

std::vector<uint8_t> hmacSha256(const SecureKey& key, const std::string& message);

std::string toHex(const std::vector<uint8_t>& bytes);

/**
 * @throws domain::ValidationException если строка не hex или нечётной длины
 */
std::vector<uint8_t> fromHex(const std::string& hex);

} // namespace issuer::utils
