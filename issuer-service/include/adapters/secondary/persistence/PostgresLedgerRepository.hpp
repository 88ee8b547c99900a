#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "settings/DbSettings.hpp"
#include "domain/Exceptions.hpp"
#include "domain/ExpiryCalculator.hpp"
#include "domain/PanGenerator.hpp"
#include "utils/PanHasher.hpp"
#include "utils/UuidGenerator.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <memory>
#include <regex>

namespace issuer::adapters::secondary {

/**
 * @brief PostgreSQL реализация реестра эмитента
 *
 * Схема issuer:
 * - accounts(account_id, core_account_id, currency, available_balance >= 0, hold_balance >= 0, ...)
 * - cards(card_id, account_id, bin, last4, expiry_yymm, status, pan_hash UNIQUE, pan_token,
 *   cardholder_name, ...)
 * - auths(auth_id, ..., amount > 0, status, stan, hold_expires_at, ...)
 *   + частичный уникальный индекс (card_id, stan) WHERE stan IS NOT NULL
 * - transactions(tx_id, ..., auth_id, amount <> 0, status, posted_at, ...)
 *
 * Каждая операция открывает своё соединение и работает в одной транзакции
 * с SET LOCAL statement_timeout (3s, для sweep 5s). pqxx::work без commit()
 * откатывается в деструкторе.
 */
class PostgresLedgerRepository : public ports::output::ILedgerRepository {
public:
    PostgresLedgerRepository(std::shared_ptr<settings::DbSettings> settings,
                             std::shared_ptr<utils::PanHasher> panHasher)
        : settings_(std::move(settings))
        , panHasher_(std::move(panHasher))
    {
        initSchema();
    }

    void ping() override {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::nontransaction txn(conn);
        txn.exec("SELECT 1");
    }

    void createAccount(const domain::Account& account) override {
        if (account.availableBalance < 0 || account.holdBalance < 0) {
            throw domain::ValidationException("balances must be non-negative");
        }
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            txn.exec_params(
                "INSERT INTO issuer.accounts "
                "(account_id, core_account_id, currency, available_balance, hold_balance) "
                "VALUES ($1, $2, $3, $4, $5)",
                account.id,
                account.coreAccountId.empty() ? account.id : account.coreAccountId,
                toUpper(account.currency),
                account.availableBalance,
                account.holdBalance
            );

            txn.commit();
            std::cout << "[PostgresLedgerRepo] Created account " << account.id << std::endl;

        } catch (const pqxx::unique_violation&) {
            throw domain::ValidationException("account already exists: " + account.id);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] createAccount error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Account> getAccount(const std::string& accountId) override {
        if (!isUuid(accountId)) {
            return std::nullopt;
        }
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            auto result = txn.exec_params(
                "SELECT account_id, core_account_id, currency, available_balance, hold_balance, "
                "(EXTRACT(EPOCH FROM created_at) * 1000000)::bigint AS created_us "
                "FROM issuer.accounts WHERE account_id = $1",
                accountId
            );

            if (result.empty()) {
                return std::nullopt;
            }

            const auto& row = result[0];
            domain::Account account;
            account.id = row["account_id"].as<std::string>();
            account.coreAccountId = row["core_account_id"].as<std::string>();
            account.currency = row["currency"].as<std::string>();
            account.availableBalance = row["available_balance"].as<int64_t>();
            account.holdBalance = row["hold_balance"].as<int64_t>();
            account.createdAt = domain::Timestamp::fromUnixMicros(row["created_us"].as<int64_t>());
            return account;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] getAccount error: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Card createCard(const domain::NewCard& card) override {
        domain::ExpiryCalculator::validateYymm(card.expiryYymm);
        const std::string pan = domain::pan::normalizePan(card.pan);
        domain::Card stored;
        stored.id = card.id;
        stored.accountId = card.accountId;
        stored.bin = card.bin.empty() ? pan.substr(0, std::min<size_t>(6, pan.size())) : card.bin;
        stored.last4 = domain::pan::lastN(pan, 4);
        stored.expiryYymm = card.expiryYymm;
        stored.status = card.status;
        stored.panHash = panHasher_->hash(pan);

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            auto result = txn.exec_params(
                "INSERT INTO issuer.cards "
                "(card_id, account_id, bin, last4, expiry_yymm, status, pan_hash) "
                "VALUES ($1, $2, $3, $4, $5, $6, decode($7, 'hex')) "
                "RETURNING (EXTRACT(EPOCH FROM created_at) * 1000000)::bigint AS created_us",
                stored.id,
                stored.accountId,
                stored.bin,
                stored.last4,
                stored.expiryYymm,
                domain::toString(stored.status),
                stored.panHash
            );

            txn.commit();
            stored.createdAt = domain::Timestamp::fromUnixMicros(result[0]["created_us"].as<int64_t>());
            std::cout << "[PostgresLedgerRepo] Created card " << stored.id
                      << " (" << stored.bin << "..." << stored.last4 << ")" << std::endl;
            return stored;

        } catch (const pqxx::unique_violation&) {
            throw domain::PanConflictException("card number already exists");
        } catch (const pqxx::foreign_key_violation&) {
            throw domain::NotFoundException("account not found: " + card.accountId);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] createCard error: " << e.what() << std::endl;
            throw;
        }
    }

    bool existsCardNumber(const std::string& pan) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            auto result = txn.exec_params(
                "SELECT 1 FROM issuer.cards WHERE pan_hash = decode($1, 'hex')",
                panHasher_->hash(pan)
            );
            return !result.empty();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] existsCardNumber error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Card> findCardForAuthorization(
        const std::string& pan, const std::string& expiryYymm) override
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            auto result = txn.exec_params(
                "SELECT " + std::string(kCardColumns) + " FROM issuer.cards "
                "WHERE pan_hash = decode($1, 'hex') AND expiry_yymm = $2",
                panHasher_->hash(pan),
                expiryYymm
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return mapCard(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] findCardForAuthorization error: " << e.what() << std::endl;
            throw;
        }
    }

    bool updateCardStatus(const std::string& cardId, domain::CardStatus status) override {
        if (!isUuid(cardId)) {
            return false;
        }
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            auto result = txn.exec_params(
                "UPDATE issuer.cards SET status = $2, updated_at = now() "
                "WHERE card_id = $1 RETURNING card_id",
                cardId,
                domain::toString(status)
            );

            if (result.empty()) {
                return false;
            }
            txn.commit();
            std::cout << "[PostgresLedgerRepo] Card " << cardId << " -> " << domain::toString(status) << std::endl;
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] updateCardStatus error: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Card updateCardholderName(const std::string& accountId, const std::string& cardId,
                                      const std::string& name) override {
        if (!isUuid(accountId) || !isUuid(cardId)) {
            throw domain::NotFoundException("card not found: " + cardId);
        }
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            auto result = txn.exec_params(
                "UPDATE issuer.cards SET cardholder_name = $3, updated_at = now() "
                "WHERE card_id = $1 AND account_id = $2 "
                "RETURNING " + std::string(kCardColumns),
                cardId,
                accountId,
                name
            );

            if (result.empty()) {
                throw domain::NotFoundException("card " + cardId + " not found on account " + accountId);
            }
            txn.commit();
            std::cout << "[PostgresLedgerRepo] Cardholder name set on card " << cardId << std::endl;
            return mapCard(result[0]);

        } catch (const domain::IssuerException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] updateCardholderName error: " << e.what() << std::endl;
            throw;
        }
    }

    domain::HoldResult createAuthAndHold(const domain::HoldRequest& request) override {
        if (request.amount <= 0) {
            throw domain::ValidationException("hold amount must be positive");
        }
        const std::string currency = toUpper(request.currency);
        const std::string authId = utils::UuidGenerator::generate();

        std::optional<int64_t> expiresUs;
        if (request.holdExpiresAt) {
            expiresUs = request.holdExpiresAt->toUnixMicros();
        }

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            if (request.stan) {
                // Вставка первой: проигравший гонку по (card_id, stan) уходит в replay
                auto inserted = txn.exec_params(
                    std::string(kInsertAuthSql) +
                    " ON CONFLICT (card_id, stan) WHERE stan IS NOT NULL DO NOTHING"
                    " RETURNING auth_id",
                    authId, request.accountId, request.cardId, request.amount, currency,
                    request.approvalCode, request.authorizationCode,
                    nullIfEmpty(request.merchantName), nullIfEmpty(request.mcc),
                    request.stan, expiresUs
                );

                if (inserted.empty()) {
                    auto existing = txn.exec_params(
                        "SELECT auth_id, amount, currency, approval_code, authorization_code "
                        "FROM issuer.auths WHERE card_id = $1 AND stan = $2",
                        request.cardId,
                        *request.stan
                    );
                    if (existing.empty()) {
                        throw std::runtime_error("auth conflict on (card_id, stan) but no row found");
                    }

                    const auto& row = existing[0];
                    domain::HoldResult replay;
                    replay.authId = row["auth_id"].as<std::string>();
                    replay.approvalCode = row["approval_code"].as<std::string>("");
                    replay.authorizationCode = row["authorization_code"].as<std::string>("");

                    if (row["amount"].as<int64_t>() != request.amount ||
                        toUpper(row["currency"].as<std::string>()) != currency) {
                        replay.outcome = domain::HoldOutcome::IDEMPOTENCY_MISMATCH;
                        std::cout << "[PostgresLedgerRepo] STAN " << *request.stan
                                  << " replayed with different amount/currency" << std::endl;
                        return replay;
                    }

                    txn.commit();
                    replay.outcome = domain::HoldOutcome::DUPLICATE;
                    return replay;
                }
            }

            // Атомарное резервирование с проверкой
            auto updated = txn.exec_params(
                "UPDATE issuer.accounts "
                "SET available_balance = available_balance - $2, "
                "    hold_balance = hold_balance + $2, "
                "    updated_at = now() "
                "WHERE account_id = $1 AND available_balance >= $2 "
                "RETURNING account_id",
                request.accountId,
                request.amount
            );

            if (updated.empty()) {
                // Вставленная строка auths откатится вместе с txn
                domain::HoldResult declined;
                declined.outcome = domain::HoldOutcome::INSUFFICIENT_FUNDS;
                return declined;
            }

            if (!request.stan) {
                txn.exec_params(
                    kInsertAuthSql,
                    authId, request.accountId, request.cardId, request.amount, currency,
                    request.approvalCode, request.authorizationCode,
                    nullIfEmpty(request.merchantName), nullIfEmpty(request.mcc),
                    request.stan, expiresUs
                );
            }

            txn.commit();
            std::cout << "[PostgresLedgerRepo] Hold " << request.amount << " " << currency
                      << " on account " << request.accountId << std::endl;

            domain::HoldResult held;
            held.outcome = domain::HoldOutcome::HELD;
            held.authId = authId;
            held.approvalCode = request.approvalCode;
            held.authorizationCode = request.authorizationCode;
            return held;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] createAuthAndHold error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Authorization> findAuthByCardStan(const std::string& cardId, int stan) override {
        if (!isUuid(cardId)) {
            return std::nullopt;
        }
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            auto result = txn.exec_params(
                "SELECT " + std::string(kAuthColumns) + " FROM issuer.auths "
                "WHERE card_id = $1 AND stan = $2",
                cardId,
                stan
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return mapAuth(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] findAuthByCardStan error: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Transaction captureAuth(const std::string& authId, int64_t amount,
                                    const std::string& currency) override {
        if (!isUuid(authId)) {
            throw domain::NotFoundException("auth not found: " + authId);
        }
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            auto locked = lockAuth(txn, authId);
            const std::string cur = toUpper(currency);
            if (toUpper(locked.currency) != cur) {
                throw domain::InvalidStateException("currency mismatch");
            }

            const int64_t remaining = locked.amount - locked.captured;
            if (amount <= 0) {
                amount = remaining;
            }
            if (amount > remaining) {
                throw domain::InvalidStateException(
                    "invalid capture amount " + std::to_string(amount) +
                    " (remaining hold " + std::to_string(remaining) + ")");
            }

            txn.exec_params(
                "UPDATE issuer.accounts SET hold_balance = hold_balance - $2, updated_at = now() "
                "WHERE account_id = $1",
                locked.accountId,
                amount
            );

            domain::Transaction tx;
            tx.id = utils::UuidGenerator::generate();
            tx.accountId = locked.accountId;
            tx.cardId = locked.cardId;
            tx.authId = authId;
            tx.amount = amount;
            tx.currency = cur;
            tx.status = domain::TransactionStatus::CAPTURED;

            auto inserted = txn.exec_params(
                "INSERT INTO issuer.transactions "
                "(tx_id, account_id, card_id, auth_id, amount, currency, status, posted_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, 'CAPTURED', now()) "
                "RETURNING (EXTRACT(EPOCH FROM created_at) * 1000000)::bigint AS created_us, "
                "(EXTRACT(EPOCH FROM posted_at) * 1000000)::bigint AS posted_us",
                tx.id, tx.accountId, tx.cardId, authId, amount, cur
            );
            tx.createdAt = domain::Timestamp::fromUnixMicros(inserted[0]["created_us"].as<int64_t>());
            tx.postedAt = domain::Timestamp::fromUnixMicros(inserted[0]["posted_us"].as<int64_t>());

            const auto newStatus = amount == remaining
                ? domain::AuthStatus::CAPTURED
                : domain::AuthStatus::AUTHORIZED;
            txn.exec_params(
                "UPDATE issuer.auths SET status = $2 WHERE auth_id = $1",
                authId,
                domain::toString(newStatus)
            );

            txn.commit();
            std::cout << "[PostgresLedgerRepo] Captured " << amount << " " << cur
                      << " on auth " << authId << " -> " << domain::toString(newStatus) << std::endl;
            return tx;

        } catch (const domain::IssuerException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] captureAuth error: " << e.what() << std::endl;
            throw;
        }
    }

    void reverseAuth(const std::string& authId) override {
        if (!isUuid(authId)) {
            throw domain::NotFoundException("auth not found: " + authId);
        }
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            auto locked = lockAuth(txn, authId);
            const int64_t remaining = locked.amount - locked.captured;

            txn.exec_params(
                "UPDATE issuer.accounts "
                "SET available_balance = available_balance + $2, "
                "    hold_balance = hold_balance - $2, "
                "    updated_at = now() "
                "WHERE account_id = $1",
                locked.accountId,
                remaining
            );
            txn.exec_params(
                "UPDATE issuer.auths SET status = 'REVERSED' WHERE auth_id = $1",
                authId
            );

            txn.commit();
            std::cout << "[PostgresLedgerRepo] Reversed auth " << authId
                      << ", released " << remaining << std::endl;

        } catch (const domain::IssuerException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] reverseAuth error: " << e.what() << std::endl;
            throw;
        }
    }

    int releaseExpiredHolds(int batchSize) override {
        if (batchSize <= 0) {
            return 0;
        }
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '5s'");

            auto expired = txn.exec_params(
                "SELECT a.auth_id, a.account_id, "
                "       a.amount - COALESCE((SELECT SUM(t.amount) FROM issuer.transactions t "
                "                            WHERE t.auth_id = a.auth_id), 0) AS remaining "
                "FROM issuer.auths a "
                "WHERE a.status = 'AUTHORIZED' AND a.hold_expires_at <= now() "
                "ORDER BY a.hold_expires_at ASC "
                "LIMIT $1 "
                "FOR UPDATE OF a SKIP LOCKED",
                batchSize
            );

            if (expired.empty()) {
                txn.commit();
                return 0;
            }

            std::map<std::string, int64_t> perAccount;
            for (const auto& row : expired) {
                perAccount[row["account_id"].as<std::string>()] += row["remaining"].as<int64_t>();
            }

            for (const auto& [accountId, sum] : perAccount) {
                txn.exec_params(
                    "UPDATE issuer.accounts "
                    "SET available_balance = available_balance + $2, "
                    "    hold_balance = hold_balance - $2, "
                    "    updated_at = now() "
                    "WHERE account_id = $1",
                    accountId,
                    sum
                );
            }

            for (const auto& row : expired) {
                txn.exec_params(
                    "UPDATE issuer.auths SET status = 'REVERSED' WHERE auth_id = $1",
                    row["auth_id"].as<std::string>()
                );
            }

            txn.commit();
            const int released = static_cast<int>(expired.size());
            std::cout << "[PostgresLedgerRepo] Released " << released << " expired holds" << std::endl;
            return released;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] releaseExpiredHolds error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Transaction> listTransactions(const std::string& accountId) override {
        std::vector<domain::Transaction> transactions;
        if (!isUuid(accountId)) {
            return transactions;
        }
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = '3s'");

            auto result = txn.exec_params(
                "SELECT tx_id, account_id, card_id, auth_id, amount, currency, status, "
                "(EXTRACT(EPOCH FROM posted_at) * 1000000)::bigint AS posted_us, "
                "(EXTRACT(EPOCH FROM created_at) * 1000000)::bigint AS created_us "
                "FROM issuer.transactions WHERE account_id = $1 "
                "ORDER BY created_at DESC",
                accountId
            );

            for (const auto& row : result) {
                domain::Transaction tx;
                tx.id = row["tx_id"].as<std::string>();
                tx.accountId = row["account_id"].as<std::string>();
                tx.cardId = row["card_id"].as<std::string>();
                if (!row["auth_id"].is_null()) {
                    tx.authId = row["auth_id"].as<std::string>();
                }
                tx.amount = row["amount"].as<int64_t>();
                tx.currency = row["currency"].as<std::string>();
                tx.status = domain::transactionStatusFromString(row["status"].as<std::string>());
                if (!row["posted_us"].is_null()) {
                    tx.postedAt = domain::Timestamp::fromUnixMicros(row["posted_us"].as<int64_t>());
                }
                tx.createdAt = domain::Timestamp::fromUnixMicros(row["created_us"].as<int64_t>());
                transactions.push_back(std::move(tx));
            }
            return transactions;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] listTransactions error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::shared_ptr<utils::PanHasher> panHasher_;

    static constexpr const char* kCardColumns =
        "card_id, account_id, bin, last4, expiry_yymm, status, encode(pan_hash, 'hex') AS pan_hash, "
        "pan_token, cardholder_name, (EXTRACT(EPOCH FROM created_at) * 1000000)::bigint AS created_us";

    static constexpr const char* kAuthColumns =
        "auth_id, account_id, card_id, amount, currency, status, approval_code, authorization_code, "
        "stan, merchant_name, mcc, "
        "(EXTRACT(EPOCH FROM hold_expires_at) * 1000000)::bigint AS expires_us, "
        "(EXTRACT(EPOCH FROM created_at) * 1000000)::bigint AS created_us";

    static constexpr const char* kInsertAuthSql =
        "INSERT INTO issuer.auths "
        "(auth_id, account_id, card_id, amount, currency, status, approval_code, authorization_code, "
        " merchant_name, mcc, stan, hold_expires_at) "
        "VALUES ($1, $2, $3, $4, $5, 'AUTHORIZED', $6, $7, $8, $9, $10, "
        "        to_timestamp($11::double precision / 1000000))";

    struct LockedAuth {
        std::string accountId;
        std::string cardId;
        int64_t amount = 0;
        int64_t captured = 0;
        std::string currency;
    };

    /**
     * @brief SELECT ... FOR UPDATE открытой авторизации
     * @throws domain::NotFoundException, domain::InvalidStateException
     */
    static LockedAuth lockAuth(pqxx::work& txn, const std::string& authId) {
        auto result = txn.exec_params(
            "SELECT account_id, card_id, amount, currency, status "
            "FROM issuer.auths WHERE auth_id = $1 FOR UPDATE",
            authId
        );
        if (result.empty()) {
            throw domain::NotFoundException("auth not found: " + authId);
        }

        const auto& row = result[0];
        const std::string status = row["status"].as<std::string>();
        if (status != domain::toString(domain::AuthStatus::AUTHORIZED)) {
            throw domain::InvalidStateException("bad auth status: " + status);
        }

        LockedAuth locked;
        locked.accountId = row["account_id"].as<std::string>();
        locked.cardId = row["card_id"].as<std::string>();
        locked.amount = row["amount"].as<int64_t>();
        locked.currency = row["currency"].as<std::string>();

        auto captured = txn.exec_params(
            "SELECT COALESCE(SUM(amount), 0)::bigint AS captured "
            "FROM issuer.transactions WHERE auth_id = $1",
            authId
        );
        locked.captured = captured[0]["captured"].as<int64_t>();
        return locked;
    }

    static domain::Card mapCard(const pqxx::row& row) {
        domain::Card card;
        card.id = row["card_id"].as<std::string>();
        card.accountId = row["account_id"].as<std::string>();
        card.bin = row["bin"].as<std::string>();
        card.last4 = row["last4"].as<std::string>();
        card.expiryYymm = row["expiry_yymm"].as<std::string>();
        card.status = domain::cardStatusFromString(row["status"].as<std::string>());
        card.panHash = row["pan_hash"].as<std::string>();
        if (!row["pan_token"].is_null()) {
            card.panToken = row["pan_token"].as<std::string>();
        }
        if (!row["cardholder_name"].is_null()) {
            card.cardholderName = row["cardholder_name"].as<std::string>();
        }
        card.createdAt = domain::Timestamp::fromUnixMicros(row["created_us"].as<int64_t>());
        return card;
    }

    static domain::Authorization mapAuth(const pqxx::row& row) {
        domain::Authorization auth;
        auth.id = row["auth_id"].as<std::string>();
        auth.accountId = row["account_id"].as<std::string>();
        auth.cardId = row["card_id"].as<std::string>();
        auth.amount = row["amount"].as<int64_t>();
        auth.currency = row["currency"].as<std::string>();
        auth.status = domain::authStatusFromString(row["status"].as<std::string>());
        auth.approvalCode = row["approval_code"].as<std::string>("");
        auth.authorizationCode = row["authorization_code"].as<std::string>("");
        if (!row["stan"].is_null()) {
            auth.stan = row["stan"].as<int>();
        }
        auth.merchantName = row["merchant_name"].as<std::string>("");
        auth.mcc = row["mcc"].as<std::string>("");
        if (!row["expires_us"].is_null()) {
            auth.holdExpiresAt = domain::Timestamp::fromUnixMicros(row["expires_us"].as<int64_t>());
        }
        auth.createdAt = domain::Timestamp::fromUnixMicros(row["created_us"].as<int64_t>());
        return auth;
    }

    static std::optional<std::string> nullIfEmpty(const std::string& s) {
        if (s.empty()) {
            return std::nullopt;
        }
        return s;
    }

    static std::string toUpper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    /**
     * @brief Некорректный uuid в параметре дал бы ошибку 22P02 вместо "не найдено"
     */
    static bool isUuid(const std::string& s) {
        static const std::regex pattern(
            "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");
        return std::regex_match(s, pattern);
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec("CREATE SCHEMA IF NOT EXISTS issuer");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS issuer.accounts (
                    account_id        UUID PRIMARY KEY,
                    core_account_id   TEXT NOT NULL,
                    currency          CHAR(3) NOT NULL,
                    available_balance BIGINT NOT NULL DEFAULT 0 CHECK (available_balance >= 0),
                    hold_balance      BIGINT NOT NULL DEFAULT 0 CHECK (hold_balance >= 0),
                    created_at        TIMESTAMPTZ NOT NULL DEFAULT now(),
                    updated_at        TIMESTAMPTZ NOT NULL DEFAULT now(),
                    CONSTRAINT chk_currency_upper CHECK (currency = upper(currency))
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_accounts_core ON issuer.accounts(core_account_id)");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS issuer.cards (
                    card_id     UUID PRIMARY KEY,
                    account_id  UUID NOT NULL REFERENCES issuer.accounts(account_id) ON DELETE RESTRICT,
                    bin         VARCHAR(9) NOT NULL,
                    last4       CHAR(4) NOT NULL,
                    expiry_yymm CHAR(4) NOT NULL,
                    status      TEXT NOT NULL DEFAULT 'ISSUED',
                    pan_hash    BYTEA NOT NULL,
                    pan_token   TEXT,
                    cardholder_name TEXT,
                    created_at  TIMESTAMPTZ NOT NULL DEFAULT now(),
                    updated_at  TIMESTAMPTZ NOT NULL DEFAULT now(),
                    CONSTRAINT uq_cards_pan_hash UNIQUE (pan_hash),
                    CONSTRAINT chk_expiry_len CHECK (char_length(expiry_yymm) = 4),
                    CONSTRAINT chk_expiry_month CHECK (substring(expiry_yymm FROM 3 FOR 2) ~ '^(0[1-9]|1[0-2])$'),
                    CONSTRAINT chk_status CHECK (status IN ('ISSUED','ACTIVE','FROZEN','LOST','STOLEN','CLOSED'))
                )
            )");
            txn.exec("ALTER TABLE issuer.cards ADD COLUMN IF NOT EXISTS cardholder_name TEXT");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_cards_account ON issuer.cards(account_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_cards_status ON issuer.cards(status)");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS issuer.auths (
                    auth_id            UUID PRIMARY KEY,
                    account_id         UUID NOT NULL REFERENCES issuer.accounts(account_id) ON DELETE RESTRICT,
                    card_id            UUID NOT NULL REFERENCES issuer.cards(card_id) ON DELETE RESTRICT,
                    amount             BIGINT NOT NULL CHECK (amount > 0),
                    currency           CHAR(3) NOT NULL,
                    status             TEXT NOT NULL,
                    approval_code      VARCHAR(6),
                    authorization_code VARCHAR(6),
                    stan               INT,
                    merchant_name      TEXT,
                    mcc                VARCHAR(4),
                    hold_expires_at    TIMESTAMPTZ,
                    created_at         TIMESTAMPTZ NOT NULL DEFAULT now()
                )
            )");
            txn.exec(
                "CREATE UNIQUE INDEX IF NOT EXISTS uq_auth_card_stan "
                "ON issuer.auths(card_id, stan) WHERE stan IS NOT NULL");
            txn.exec(
                "CREATE INDEX IF NOT EXISTS idx_auths_hold_expiry "
                "ON issuer.auths(hold_expires_at) WHERE status = 'AUTHORIZED'");
            txn.exec(
                "CREATE INDEX IF NOT EXISTS idx_auths_acc_open "
                "ON issuer.auths(account_id) WHERE status = 'AUTHORIZED'");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS issuer.transactions (
                    tx_id      UUID PRIMARY KEY,
                    account_id UUID NOT NULL REFERENCES issuer.accounts(account_id) ON DELETE RESTRICT,
                    card_id    UUID NOT NULL REFERENCES issuer.cards(card_id) ON DELETE RESTRICT,
                    auth_id    UUID REFERENCES issuer.auths(auth_id),
                    amount     BIGINT NOT NULL CHECK (amount <> 0),
                    currency   CHAR(3) NOT NULL,
                    status     TEXT NOT NULL,
                    posted_at  TIMESTAMPTZ,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT now()
                )
            )");
            txn.exec(
                "CREATE INDEX IF NOT EXISTS idx_tx_acc_created "
                "ON issuer.transactions(account_id, created_at DESC)");
            txn.exec(
                "CREATE INDEX IF NOT EXISTS idx_tx_auth ON issuer.transactions(auth_id)");

            txn.commit();
            std::cout << "[PostgresLedgerRepo] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace issuer::adapters::secondary
