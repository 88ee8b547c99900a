#include "utils/PanHasher.hpp"
#include "utils/Crypto.hpp"
#include "domain/PanGenerator.hpp"
#include "domain/Exceptions.hpp"

namespace issuer::utils {

PanHasher::PanHasher(SecureKey pepper)
    : pepper_(std::move(pepper))
{
    if (pepper_.empty()) {
        throw domain::ProviderConfigException("PAN hash key is empty");
    }
}

std::string PanHasher::hash(const std::string& pan) const {
    return toHex(hmacSha256(pepper_, domain::pan::normalizePan(pan)));
}

} // namespace issuer::utils
