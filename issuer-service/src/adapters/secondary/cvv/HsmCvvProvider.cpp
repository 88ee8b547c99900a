#include "adapters/secondary/cvv/HsmCvvProvider.hpp"
#include "utils/Crypto.hpp"
#include "utils/SecureRandom.hpp"

#include <optional>

namespace issuer::adapters::secondary::cvv {

namespace {

std::vector<uint8_t> assembleData(const std::string& panNoCD,
                                  const std::string& yymm,
                                  const std::string& serviceCode,
                                  const std::optional<uint64_t>& window) {
    std::string s = panNoCD + yymm + serviceCode;
    if (window) {
        auto bytes = windowBytes(*window);
        s += utils::toHex(std::vector<uint8_t>(bytes.begin(), bytes.end()));
    }
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

HsmCvvProvider::HsmCvvProvider(std::shared_ptr<ports::output::IMacDevice> device, Clock clock)
    : device_(std::move(device))
    , clock_(std::move(clock))
{
    if (!device_) {
        throw domain::ProviderConfigException("HSM MAC device is required");
    }
    if (!clock_) {
        clock_ = systemClock();
    }
}

std::string HsmCvvProvider::computeCvv2(
    const std::string& panNoCD,
    const std::string& expiryYymm,
    const std::string& serviceCode,
    int width)
{
    validateInputs(panNoCD, expiryYymm, serviceCode);
    auto mac = device_->mac(assembleData(panNoCD, expiryYymm, serviceCode, std::nullopt));
    return decimalize(mac, normalizeWidth(width));
}

ports::output::DynamicCvv HsmCvvProvider::computeDisplayDcvv(
    const std::string& panNoCD,
    const std::string& expiryYymm,
    const std::string& serviceCode,
    int stepSeconds,
    int width)
{
    validateInputs(panNoCD, expiryYymm, serviceCode);
    const int step = normalizeStep(stepSeconds);
    const int64_t unixNow = toUnixSeconds(clock_());

    auto mac = device_->mac(assembleData(panNoCD, expiryYymm, serviceCode,
                                         windowCounter(unixNow, step)));
    return ports::output::DynamicCvv{
        decimalize(mac, normalizeWidth(width)),
        ttlSeconds(unixNow, step)
    };
}

std::string HsmCvvProvider::decimalize(const std::vector<uint8_t>& mac, int width) {
    const std::string hex = utils::toHex(mac);
    const size_t n = static_cast<size_t>(width);

    std::string out;
    out.reserve(n);
    for (size_t i = 0; i < hex.size() && out.size() < n; ++i) {
        char c = hex[i];
        if (c >= '0' && c <= '9') {
            out.push_back(c);
        } else {
            out.push_back(static_cast<char>('0' + (c - 'a' + 10) % 10));
        }
    }
    if (out.size() < n) {
        out += utils::SecureRandom::instance().digits(n - out.size());
    }
    return out;
}

} // namespace issuer::adapters::secondary::cvv
