#include "utils/Crypto.hpp"
#include "utils/SecureKey.hpp"
#include "domain/Exceptions.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <climits>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace issuer::utils {

// ----------------------------------------------------------------------------
// SecureKey
// ----------------------------------------------------------------------------

SecureKey::SecureKey(const std::string& material)
    : bytes_(material.begin(), material.end())
{}

SecureKey::SecureKey(std::vector<uint8_t> material)
    : bytes_(std::move(material))
{}

SecureKey::~SecureKey() {
    wipe();
}

SecureKey::SecureKey(SecureKey&& other) noexcept
    : bytes_(std::move(other.bytes_))
{
    other.bytes_.clear();
}

SecureKey& SecureKey::operator=(SecureKey&& other) noexcept {
    if (this != &other) {
        wipe();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

SecureKey SecureKey::fromHex(const std::string& hex) {
    return SecureKey(utils::fromHex(hex));
}

void SecureKey::wipe() {
    if (!bytes_.empty()) {
        OPENSSL_cleanse(bytes_.data(), bytes_.size());
        bytes_.clear();
    }
}

// ----------------------------------------------------------------------------
// HMAC / hex
// ----------------------------------------------------------------------------

std::vector<uint8_t> hmacSha256(const SecureKey& key, const std::vector<uint8_t>& message) {
    if (key.size() > static_cast<size_t>(INT_MAX)) {
        throw std::invalid_argument("hmacSha256: key too large");
    }

    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;

    // Пустой ключ допустим для HMAC, но провайдеры его отсекают раньше
    static const uint8_t kEmpty = 0;
    const uint8_t* keyData = key.empty() ? &kEmpty : key.data();

    if (HMAC(EVP_sha256(), keyData, static_cast<int>(key.size()),
             message.data(), message.size(), digest.data(), &length) == nullptr) {
        throw std::runtime_error("hmacSha256: HMAC failed");
    }
    digest.resize(length);
    return digest;
}

std::vector<uint8_t> hmacSha256(const SecureKey& key, const std::string& message) {
    return hmacSha256(key, std::vector<uint8_t>(message.begin(), message.end()));
}

std::string toHex(const std::vector<uint8_t>& bytes) {
    std::stringstream ss;
    for (uint8_t b : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

std::vector<uint8_t> fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw domain::ValidationException("hex string must have even length");
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw domain::ValidationException("hex string contains non-hex characters");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace issuer::utils
