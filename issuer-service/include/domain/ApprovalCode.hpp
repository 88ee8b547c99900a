#pragma once

#include <string>

/**
 * Коды ответа авторизации (ISO 8583, поле 39)
 */
namespace issuer::domain::approval {

inline const std::string APPROVED = "00";
inline const std::string INVALID_CARD = "14";
inline const std::string INSUFFICIENT_FUNDS = "51";
inline const std::string EXPIRED_CARD = "54";
inline const std::string RESTRICTED_CARD = "62";
inline const std::string DUPLICATE_TRANSMISSION = "94";

} // namespace issuer::domain::approval
