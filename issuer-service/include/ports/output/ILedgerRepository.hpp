#pragma once

#include "domain/Account.hpp"
#include "domain/Authorization.hpp"
#include "domain/Card.hpp"
#include "domain/Transaction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace issuer::ports::output {

/**
 * @brief Реестр эмитента: счета, карты, холды, транзакции
 *
 * Output Port. Владеет всеми изменениями балансов: каждая операция
 * выполняется в одной транзакции БД и либо применяется целиком, либо
 * не применяется вовсе. Инфраструктурные ошибки пробрасываются.
 */
class ILedgerRepository {
public:
    virtual ~ILedgerRepository() = default;

    /**
     * @brief Проверка доступности хранилища
     */
    virtual void ping() = 0;

    /**
     * @brief Создать счёт
     *
     * @param account Счёт (id, currency, availableBalance; hold = 0)
     */
    virtual void createAccount(const domain::Account& account) = 0;

    virtual std::optional<domain::Account> getAccount(const std::string& accountId) = 0;

    /**
     * @brief Сохранить карту; PAN хэшируется внутри, открытый PAN не хранится
     *
     * @throws domain::PanConflictException если такой pan_hash уже есть
     * @throws domain::NotFoundException если счёта нет
     */
    virtual domain::Card createCard(const domain::NewCard& card) = 0;

    /**
     * @brief Занят ли PAN (поиск по хэшу)
     */
    virtual bool existsCardNumber(const std::string& pan) = 0;

    /**
     * @brief Найти карту по PAN и сроку YYMM
     */
    virtual std::optional<domain::Card> findCardForAuthorization(
        const std::string& pan, const std::string& expiryYymm) = 0;

    /**
     * @brief Изменить статус карты
     * @return false если карты нет
     */
    virtual bool updateCardStatus(const std::string& cardId, domain::CardStatus status) = 0;

    /**
     * @brief Записать имя держателя на карту счёта
     *
     * @return Обновлённая карта
     * @throws domain::NotFoundException если карты нет или она принадлежит другому счёту
     */
    virtual domain::Card updateCardholderName(
        const std::string& accountId, const std::string& cardId, const std::string& name) = 0;

    /**
     * @brief Атомарно поставить холд
     *
     * При заданном STAN повтор с теми же amount/currency возвращает
     * сохранённые коды (DUPLICATE) без изменения балансов; с другими
     * параметрами возвращает IDEMPOTENCY_MISMATCH. Нехватка средств
     * возвращает INSUFFICIENT_FUNDS и ничего не сохраняет.
     */
    virtual domain::HoldResult createAuthAndHold(const domain::HoldRequest& request) = 0;

    virtual std::optional<domain::Authorization> findAuthByCardStan(
        const std::string& cardId, int stan) = 0;

    /**
     * @brief Списать холд полностью (amount <= 0) или частично
     *
     * Частичное списание ограничено остатком холда; после полного
     * списания статус становится CAPTURED.
     *
     * @return Созданная транзакция
     * @throws domain::NotFoundException, domain::InvalidStateException
     */
    virtual domain::Transaction captureAuth(
        const std::string& authId, int64_t amount, const std::string& currency) = 0;

    /**
     * @brief Отменить холд: остаток холда возвращается в available
     * @throws domain::NotFoundException, domain::InvalidStateException
     */
    virtual void reverseAuth(const std::string& authId) = 0;

    /**
     * @brief Снять до batchSize просроченных холдов (старые первыми)
     * @return Количество переведённых в REVERSED
     */
    virtual int releaseExpiredHolds(int batchSize) = 0;

    /**
     * @brief Транзакции счёта, новые первыми
     */
    virtual std::vector<domain::Transaction> listTransactions(const std::string& accountId) = 0;
};

} // namespace issuer::ports::output
