#include "adapters/secondary/cvv/HmacCvvProvider.hpp"
#include "utils/Crypto.hpp"

#include <cstdio>

namespace issuer::adapters::secondary::cvv {

namespace {

const char* const kStaticDomain = "static-v1";
const char* const kDynamicDomain = "dynamic-v1";

std::vector<uint8_t> buildMessage(const std::string& panNoCD,
                                  const std::string& yymm,
                                  const std::string& serviceCode,
                                  const char* domainTag) {
    std::string s = panNoCD + "|" + yymm + "|" + serviceCode + "|" + domainTag;
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

HmacCvvProvider::HmacCvvProvider(utils::SecureKey key, Clock clock)
    : key_(std::move(key))
    , clock_(std::move(clock))
{
    if (key_.empty()) {
        throw domain::ProviderConfigException("CVV HMAC key is required");
    }
    if (!clock_) {
        clock_ = systemClock();
    }
}

std::string HmacCvvProvider::computeCvv2(
    const std::string& panNoCD,
    const std::string& expiryYymm,
    const std::string& serviceCode,
    int width)
{
    validateInputs(panNoCD, expiryYymm, serviceCode);
    return truncatedDecimal(buildMessage(panNoCD, expiryYymm, serviceCode, kStaticDomain),
                            normalizeWidth(width));
}

ports::output::DynamicCvv HmacCvvProvider::computeDisplayDcvv(
    const std::string& panNoCD,
    const std::string& expiryYymm,
    const std::string& serviceCode,
    int stepSeconds,
    int width)
{
    return computeDisplayDcvvAt(panNoCD, expiryYymm, serviceCode, clock_(), stepSeconds, width);
}

ports::output::DynamicCvv HmacCvvProvider::computeDisplayDcvvAt(
    const std::string& panNoCD,
    const std::string& expiryYymm,
    const std::string& serviceCode,
    std::chrono::system_clock::time_point now,
    int stepSeconds,
    int width) const
{
    validateInputs(panNoCD, expiryYymm, serviceCode);
    const int step = normalizeStep(stepSeconds);
    const int64_t unixNow = toUnixSeconds(now);

    auto message = buildMessage(panNoCD, expiryYymm, serviceCode, kDynamicDomain);
    auto window = windowBytes(windowCounter(unixNow, step));
    message.insert(message.end(), window.begin(), window.end());

    return ports::output::DynamicCvv{
        truncatedDecimal(message, normalizeWidth(width)),
        ttlSeconds(unixNow, step)
    };
}

std::string HmacCvvProvider::truncatedDecimal(const std::vector<uint8_t>& message, int width) const {
    auto sum = utils::hmacSha256(key_, message);

    // RFC 4226 dynamic truncation
    const size_t offset = sum.back() & 0x0f;
    const uint32_t code =
        (static_cast<uint32_t>(sum[offset]) & 0x7f) << 24 |
        (static_cast<uint32_t>(sum[offset + 1]) & 0xff) << 16 |
        (static_cast<uint32_t>(sum[offset + 2]) & 0xff) << 8 |
        (static_cast<uint32_t>(sum[offset + 3]) & 0xff);

    char buf[8];
    if (width == 4) {
        std::snprintf(buf, sizeof(buf), "%04u", code % 10000);
    } else {
        std::snprintf(buf, sizeof(buf), "%03u", code % 1000);
    }
    return buf;
}

} // namespace issuer::adapters::secondary::cvv
