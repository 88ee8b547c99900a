#pragma once

#include <functional>
#include <string>

/**
 * @file PanGenerator.hpp
 * @brief Генерация и проверка PAN (Primary Account Number)
 *
 * PAN = BIN + случайные цифры (+ необязательная последовательность в хвосте)
 * + контрольная цифра Луна. Случайные цифры берутся из SecureRandom
 * rejection sampling'ом, без смещения по модулю.
 */
namespace issuer::domain::pan {

/// Длина PAN по умолчанию
inline constexpr int kDefaultPanLength = 16;

/// maxRetries <= 0 в generateUniquePan заменяется на это значение
inline constexpr int kDefaultUniqueRetries = 5;

/**
 * @brief Проверка занятости PAN (обычно ILedgerRepository::existsCardNumber)
 *
 * Ошибки инфраструктуры сообщаются исключениями.
 */
using ExistsFn = std::function<bool(const std::string& pan)>;

/**
 * @brief BIN: только цифры, длина 6, 8 или 9
 * @throws ValidationException
 */
void validateBin(const std::string& bin);

/**
 * @brief Проверка PAN: только цифры, длина 13..19, контрольная цифра Луна
 * @throws ValidationException
 */
void validatePan(const std::string& pan);

/**
 * @brief 16-значный PAN
 */
std::string generatePan(const std::string& bin, const std::string& sequence = "");

/**
 * @brief PAN длины totalLen (13..19)
 *
 * sequence (после trim) перезаписывает последние цифры заполнения,
 * должна быть числовой и не длиннее заполнения.
 *
 * @throws ValidationException
 */
std::string generatePanWithLength(const std::string& bin, int totalLen,
                                  const std::string& sequence);

/**
 * @brief Уникальный PAN: до maxRetries+1 попыток, первый PAN, для которого
 * exists() вернул false
 *
 * Пустой exists принимает первый сгенерированный PAN.
 * Исключения из exists() пробрасываются.
 *
 * @throws RetryExhaustedException если все попытки заняты
 */
std::string generateUniquePan(const std::string& bin, int totalLen,
                              const std::string& sequence, int maxRetries,
                              const ExistsFn& exists);

/**
 * @brief Маска PAN для логов и ответов: 421234******1234
 */
std::string maskPan(const std::string& pan);

/**
 * @brief Убирает пробелы, табы и дефисы
 */
std::string normalizePan(const std::string& s);

std::string lastN(const std::string& s, size_t n);

bool isDigits(const std::string& s);

/**
 * @brief Контрольная цифра Луна для тела PAN (без контрольной цифры)
 */
char luhnCheckDigit(const std::string& body);

} // namespace issuer::domain::pan
