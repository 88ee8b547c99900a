#pragma once

#include <stdexcept>
#include <string>

/**
 * @file Exceptions.hpp
 * @brief Исключения эмитента
 */
namespace issuer::domain {

/**
 * @brief Базовое исключение сервиса эмитента
 */
class IssuerException : public std::runtime_error {
public:
    explicit IssuerException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Некорректные входные данные (BIN, PAN, срок, service code...)
 *
 * Не ретраится.
 */
class ValidationException : public IssuerException {
public:
    explicit ValidationException(const std::string& message)
        : IssuerException(message) {}
};

class NotFoundException : public IssuerException {
public:
    explicit NotFoundException(const std::string& message)
        : IssuerException(message) {}
};

/**
 * @brief Нарушение уникальности pan_hash при вставке карты
 */
class PanConflictException : public IssuerException {
public:
    explicit PanConflictException(const std::string& message)
        : IssuerException(message) {}
};

/**
 * @brief Операция недопустима в текущем состоянии авторизации
 */
class InvalidStateException : public IssuerException {
public:
    explicit InvalidStateException(const std::string& message)
        : IssuerException(message) {}
};

class RetryExhaustedException : public IssuerException {
public:
    explicit RetryExhaustedException(const std::string& message)
        : IssuerException(message) {}
};

/**
 * @brief Ошибка конфигурации криптопровайдера (нет ключа и т.п.)
 *
 * Выбрасывается в конструкторе, а не при первом использовании.
 */
class ProviderConfigException : public IssuerException {
public:
    explicit ProviderConfigException(const std::string& message)
        : IssuerException(message) {}
};

} // namespace issuer::domain
