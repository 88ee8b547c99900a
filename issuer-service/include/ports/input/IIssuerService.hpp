#pragma once

#include "domain/Account.hpp"
#include "domain/AuthorizationRequest.hpp"
#include "domain/Card.hpp"
#include "domain/Transaction.hpp"
#include "ports/output/ICvvProvider.hpp"
#include <optional>
#include <string>
#include <vector>

namespace issuer::ports::input {

/**
 * @brief Интерфейс сервиса эмитента
 *
 * Input Port для транспортных слоёв (HTTP, ISO 8583).
 * Бизнес-отказы авторизации возвращаются кодом ответа, а не исключением.
 */
class IIssuerService {
public:
    virtual ~IIssuerService() = default;

    /**
     * @brief Открыть счёт
     *
     * @param request Начальный доступный баланс и валюта
     * @return Созданный Account
     * @throws domain::ValidationException
     */
    virtual domain::Account createAccount(const domain::CreateAccountRequest& request) = 0;

    virtual std::optional<domain::Account> getAccount(const std::string& accountId) = 0;

    /**
     * @brief Выпустить карту на счёт
     *
     * @return Карта с открытым PAN, CVV и сроком MMYY (единственный раз)
     * @throws domain::NotFoundException если счёта нет
     * @throws domain::RetryExhaustedException если не удалось подобрать уникальный PAN
     */
    virtual domain::IssuedCard issueCard(const std::string& accountId) = 0;

    /**
     * @brief Авторизация: поиск карты и атомарный холд
     *
     * Коды: 00, 14, 51, 54, 62, 94.
     */
    virtual domain::AuthorizationResponse authorizeRequest(const domain::AuthorizationRequest& request) = 0;

    /**
     * @brief Списание холда, найденного по PAN + сроку + STAN
     *
     * @param amount <= 0 списывает весь остаток холда
     * @throws domain::NotFoundException, domain::InvalidStateException
     */
    virtual domain::Transaction captureByStan(
        const std::string& pan,
        const std::string& expiryYymm,
        int stan,
        int64_t amount,
        const std::string& currency
    ) = 0;

    /**
     * @brief Отмена холда, найденного по PAN + сроку + STAN
     * @throws domain::NotFoundException, domain::InvalidStateException
     */
    virtual void reverseByStan(const std::string& pan, const std::string& expiryYymm, int stan) = 0;

    /**
     * @brief Транзакции счёта, новые первыми
     */
    virtual std::vector<domain::Transaction> listTransactions(const std::string& accountId) = 0;

    /**
     * @brief Снять просроченные холды (административная операция)
     * @return Количество снятых холдов
     */
    virtual int releaseExpiredHolds(int batchSize) = 0;

    /**
     * @throws domain::NotFoundException если карты нет
     */
    virtual void updateCardStatus(const std::string& cardId, domain::CardStatus status) = 0;

    /**
     * @brief Записать имя держателя на выпущенную карту счёта
     *
     * Имя приводится к верхнему регистру; допустимы латинские буквы, пробел,
     * точка, дефис и апостроф, от 2 до 26 символов.
     *
     * @throws domain::ValidationException, domain::NotFoundException
     */
    virtual domain::EmbossedCard setCardholderName(
        const std::string& accountId, const std::string& cardId, const std::string& name) = 0;

    /**
     * @brief Статический CVV2 известной карты
     * @throws domain::ValidationException, domain::NotFoundException
     */
    virtual std::string cardVerificationCode(const std::string& pan, const std::string& expiryYymm) = 0;

    /**
     * @brief Динамический CVV известной карты и его TTL
     * @throws domain::ValidationException, domain::NotFoundException
     */
    virtual ports::output::DynamicCvv displayDynamicCvv(const std::string& pan, const std::string& expiryYymm) = 0;
};

} // namespace issuer::ports::input
