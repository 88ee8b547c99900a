#include "adapters/secondary/cvv/SoftDes3MacDevice.hpp"
#include "domain/Exceptions.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <climits>
#include <memory>
#include <stdexcept>

namespace issuer::adapters::secondary::cvv {

namespace {

constexpr size_t kBlockSize = 8;

utils::SecureKey expandKey(utils::SecureKey key) {
    if (key.size() == 24) {
        return key;
    }
    if (key.size() != 16) {
        throw domain::ProviderConfigException(
            "3DES key must be 16 or 24 bytes (got " + std::to_string(key.size()) + ")");
    }
    // K1K2 -> K1K2K1
    std::vector<uint8_t> full(key.data(), key.data() + 16);
    full.insert(full.end(), key.data(), key.data() + 8);
    utils::SecureKey expanded(std::move(full));
    return expanded;
}

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

} // namespace

SoftDes3MacDevice::SoftDes3MacDevice(utils::SecureKey key)
    : key_(expandKey(std::move(key)))
{}

std::vector<uint8_t> SoftDes3MacDevice::mac(const std::vector<uint8_t>& data) {
    // Padding method 1: нули до границы блока, пустые данные = один нулевой блок
    std::vector<uint8_t> padded(data);
    if (padded.empty() || padded.size() % kBlockSize != 0) {
        padded.resize((padded.size() / kBlockSize + 1) * kBlockSize, 0);
    }
    if (padded.size() > static_cast<size_t>(INT_MAX)) {
        throw std::invalid_argument("SoftDes3MacDevice: data too large");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("SoftDes3MacDevice: EVP_CIPHER_CTX_new failed");
    }

    const uint8_t iv[kBlockSize] = {0};
    if (EVP_EncryptInit_ex(ctx.get(), EVP_des_ede3_cbc(), nullptr, key_.data(), iv) != 1) {
        throw std::runtime_error("SoftDes3MacDevice: EncryptInit failed");
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    std::vector<uint8_t> out(padded.size() + kBlockSize);
    int outLen = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &outLen,
                          padded.data(), static_cast<int>(padded.size())) != 1) {
        throw std::runtime_error("SoftDes3MacDevice: EncryptUpdate failed");
    }
    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + outLen, &finalLen) != 1) {
        throw std::runtime_error("SoftDes3MacDevice: EncryptFinal failed");
    }
    outLen += finalLen;

    // MAC = последний блок шифртекста CBC
    std::vector<uint8_t> result(out.begin() + (outLen - kBlockSize), out.begin() + outLen);
    OPENSSL_cleanse(out.data(), out.size());
    return result;
}

} // namespace issuer::adapters::secondary::cvv
