#include "utils/SecureRandom.hpp"

#include <openssl/rand.h>
#include <array>
#include <climits>
#include <stdexcept>

namespace issuer::utils {

namespace {

constexpr uint8_t kDigitThreshold = 250;  // 256 - (256 % 10)
constexpr size_t kBatchSize = 64;

} // namespace

SecureRandom& SecureRandom::instance() {
    static SecureRandom random;
    return random;
}

void SecureRandom::fill(uint8_t* buffer, size_t length) {
    if (length == 0) {
        return;
    }
    if (length > static_cast<size_t>(INT_MAX)) {
        throw std::invalid_argument("SecureRandom: request too large");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (RAND_bytes(buffer, static_cast<int>(length)) != 1) {
        throw std::runtime_error("SecureRandom: RAND_bytes failed");
    }
}

std::string SecureRandom::digits(size_t count) {
    std::string out;
    out.reserve(count);

    std::array<uint8_t, kBatchSize> batch{};
    while (out.size() < count) {
        // Читаем пачкой, чтобы не дёргать RAND_bytes на каждую цифру
        fill(batch.data(), batch.size());
        for (size_t i = 0; i < batch.size() && out.size() < count; ++i) {
            if (batch[i] < kDigitThreshold) {
                out.push_back(static_cast<char>('0' + batch[i] % 10));
            }
        }
    }
    return out;
}

} // namespace issuer::utils
