#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "domain/Exceptions.hpp"
#include "domain/ExpiryCalculator.hpp"
#include "domain/PanGenerator.hpp"
#include "utils/PanHasher.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace issuer::adapters::secondary {

/**
 * @brief In-memory реализация реестра
 *
 * Та же семантика, что у PostgresLedgerRepository: идемпотентность по
 * (cardId, stan), условное резервирование, частичное списание, sweep.
 * Все операции сериализованы одним мьютексом, поэтому каждая атомарна.
 *
 * В рантайме разрешена только при ISSUER_ALLOW_MEM_BACKEND=true.
 */
class InMemoryLedgerRepository : public ports::output::ILedgerRepository {
public:
    explicit InMemoryLedgerRepository(std::shared_ptr<utils::PanHasher> panHasher)
        : panHasher_(std::move(panHasher))
    {}

    void ping() override {}

    void createAccount(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accounts_.count(account.id)) {
            throw domain::ValidationException("account already exists: " + account.id);
        }
        if (account.availableBalance < 0 || account.holdBalance < 0) {
            throw domain::ValidationException("balances must be non-negative");
        }
        domain::Account stored = account;
        stored.currency = toUpper(stored.currency);
        if (stored.coreAccountId.empty()) {
            stored.coreAccountId = stored.id;
        }
        accounts_[stored.id] = stored;
    }

    std::optional<domain::Account> getAccount(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(accountId);
        if (it == accounts_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    domain::Card createCard(const domain::NewCard& card) override {
        const std::string pan = domain::pan::normalizePan(card.pan);
        const std::string hash = panHasher_->hash(pan);

        std::lock_guard<std::mutex> lock(mutex_);
        if (panIndex_.count(hash)) {
            throw domain::PanConflictException("card number already exists");
        }
        if (!accounts_.count(card.accountId)) {
            throw domain::NotFoundException("account not found: " + card.accountId);
        }
        domain::ExpiryCalculator::validateYymm(card.expiryYymm);

        domain::Card stored;
        stored.id = card.id;
        stored.accountId = card.accountId;
        stored.bin = card.bin.empty() ? pan.substr(0, std::min<size_t>(6, pan.size())) : card.bin;
        stored.last4 = domain::pan::lastN(pan, 4);
        stored.expiryYymm = card.expiryYymm;
        stored.status = card.status;
        stored.panHash = hash;
        stored.createdAt = domain::Timestamp::now();

        cards_[stored.id] = stored;
        panIndex_[hash] = stored.id;
        return stored;
    }

    bool existsCardNumber(const std::string& pan) override {
        const std::string hash = panHasher_->hash(pan);
        std::lock_guard<std::mutex> lock(mutex_);
        return panIndex_.count(hash) > 0;
    }

    std::optional<domain::Card> findCardForAuthorization(
        const std::string& pan, const std::string& expiryYymm) override
    {
        const std::string hash = panHasher_->hash(pan);
        std::lock_guard<std::mutex> lock(mutex_);
        auto idx = panIndex_.find(hash);
        if (idx == panIndex_.end()) {
            return std::nullopt;
        }
        const auto& card = cards_.at(idx->second);
        if (card.expiryYymm != expiryYymm) {
            return std::nullopt;
        }
        return card;
    }

    bool updateCardStatus(const std::string& cardId, domain::CardStatus status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cards_.find(cardId);
        if (it == cards_.end()) {
            return false;
        }
        it->second.status = status;
        return true;
    }

    domain::Card updateCardholderName(const std::string& accountId, const std::string& cardId,
                                      const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cards_.find(cardId);
        if (it == cards_.end() || it->second.accountId != accountId) {
            throw domain::NotFoundException("card " + cardId + " not found on account " + accountId);
        }
        it->second.cardholderName = name;
        return it->second;
    }

    domain::HoldResult createAuthAndHold(const domain::HoldRequest& request) override {
        if (request.amount <= 0) {
            throw domain::ValidationException("hold amount must be positive");
        }
        const std::string currency = toUpper(request.currency);

        std::lock_guard<std::mutex> lock(mutex_);

        if (request.stan) {
            auto existing = stanIndex_.find({request.cardId, *request.stan});
            if (existing != stanIndex_.end()) {
                const auto& auth = auths_.at(existing->second);
                domain::HoldResult replay;
                replay.authId = auth.id;
                replay.approvalCode = auth.approvalCode;
                replay.authorizationCode = auth.authorizationCode;
                replay.outcome = (auth.amount != request.amount || auth.currency != currency)
                    ? domain::HoldOutcome::IDEMPOTENCY_MISMATCH
                    : domain::HoldOutcome::DUPLICATE;
                return replay;
            }
        }

        auto acc = accounts_.find(request.accountId);
        if (acc == accounts_.end() || acc->second.availableBalance < request.amount) {
            domain::HoldResult declined;
            declined.outcome = domain::HoldOutcome::INSUFFICIENT_FUNDS;
            return declined;
        }
        if (!cards_.count(request.cardId)) {
            throw domain::NotFoundException("card not found: " + request.cardId);
        }

        acc->second.availableBalance -= request.amount;
        acc->second.holdBalance += request.amount;

        domain::Authorization auth;
        auth.id = utils::UuidGenerator::generate();
        auth.accountId = request.accountId;
        auth.cardId = request.cardId;
        auth.amount = request.amount;
        auth.currency = currency;
        auth.status = domain::AuthStatus::AUTHORIZED;
        auth.approvalCode = request.approvalCode;
        auth.authorizationCode = request.authorizationCode;
        auth.stan = request.stan;
        auth.merchantName = request.merchantName;
        auth.mcc = request.mcc;
        auth.holdExpiresAt = request.holdExpiresAt;
        auth.createdAt = domain::Timestamp::now();

        auths_[auth.id] = auth;
        if (request.stan) {
            stanIndex_[{request.cardId, *request.stan}] = auth.id;
        }

        domain::HoldResult held;
        held.outcome = domain::HoldOutcome::HELD;
        held.authId = auth.id;
        held.approvalCode = auth.approvalCode;
        held.authorizationCode = auth.authorizationCode;
        return held;
    }

    std::optional<domain::Authorization> findAuthByCardStan(const std::string& cardId, int stan) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stanIndex_.find({cardId, stan});
        if (it == stanIndex_.end()) {
            return std::nullopt;
        }
        return auths_.at(it->second);
    }

    domain::Transaction captureAuth(const std::string& authId, int64_t amount,
                                    const std::string& currency) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& auth = openAuth(authId);

        const std::string cur = toUpper(currency);
        if (auth.currency != cur) {
            throw domain::InvalidStateException("currency mismatch");
        }

        const int64_t remaining = auth.amount - capturedFor(authId);
        if (amount <= 0) {
            amount = remaining;
        }
        if (amount > remaining) {
            throw domain::InvalidStateException(
                "invalid capture amount " + std::to_string(amount) +
                " (remaining hold " + std::to_string(remaining) + ")");
        }

        accounts_.at(auth.accountId).holdBalance -= amount;

        domain::Transaction tx;
        tx.id = utils::UuidGenerator::generate();
        tx.accountId = auth.accountId;
        tx.cardId = auth.cardId;
        tx.authId = authId;
        tx.amount = amount;
        tx.currency = cur;
        tx.status = domain::TransactionStatus::CAPTURED;
        tx.createdAt = domain::Timestamp::now();
        tx.postedAt = tx.createdAt;
        transactions_.push_back(tx);

        if (amount == remaining) {
            auth.status = domain::AuthStatus::CAPTURED;
        }
        return tx;
    }

    void reverseAuth(const std::string& authId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& auth = openAuth(authId);
        releaseRemaining(auth);
    }

    int releaseExpiredHolds(int batchSize) override {
        if (batchSize <= 0) {
            return 0;
        }
        const auto now = domain::Timestamp::now();

        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::Authorization*> expired;
        for (auto& [id, auth] : auths_) {
            if (auth.status == domain::AuthStatus::AUTHORIZED &&
                auth.holdExpiresAt && *auth.holdExpiresAt <= now) {
                expired.push_back(&auth);
            }
        }
        std::sort(expired.begin(), expired.end(),
                  [](const domain::Authorization* a, const domain::Authorization* b) {
                      return *a->holdExpiresAt < *b->holdExpiresAt;
                  });
        if (expired.size() > static_cast<size_t>(batchSize)) {
            expired.resize(static_cast<size_t>(batchSize));
        }

        for (auto* auth : expired) {
            releaseRemaining(*auth);
        }
        return static_cast<int>(expired.size());
    }

    std::vector<domain::Transaction> listTransactions(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Transaction> result;
        for (auto it = transactions_.rbegin(); it != transactions_.rend(); ++it) {
            if (it->accountId == accountId) {
                result.push_back(*it);
            }
        }
        return result;
    }

    // ================================================================
    // Тестовые хелперы
    // ================================================================

    std::optional<domain::Authorization> findAuthById(const std::string& authId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = auths_.find(authId);
        if (it == auths_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t authCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return auths_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_.clear();
        cards_.clear();
        panIndex_.clear();
        auths_.clear();
        stanIndex_.clear();
        transactions_.clear();
    }

private:
    std::shared_ptr<utils::PanHasher> panHasher_;

    std::mutex mutex_;
    std::unordered_map<std::string, domain::Account> accounts_;
    std::unordered_map<std::string, domain::Card> cards_;
    std::unordered_map<std::string, std::string> panIndex_;               ///< panHash -> cardId
    std::unordered_map<std::string, domain::Authorization> auths_;
    std::map<std::pair<std::string, int>, std::string> stanIndex_;        ///< (cardId, stan) -> authId
    std::vector<domain::Transaction> transactions_;                       ///< в порядке создания

    // Вызывать под mutex_
    domain::Authorization& openAuth(const std::string& authId) {
        auto it = auths_.find(authId);
        if (it == auths_.end()) {
            throw domain::NotFoundException("auth not found: " + authId);
        }
        if (it->second.status != domain::AuthStatus::AUTHORIZED) {
            throw domain::InvalidStateException("bad auth status: " + domain::toString(it->second.status));
        }
        return it->second;
    }

    int64_t capturedFor(const std::string& authId) const {
        int64_t sum = 0;
        for (const auto& tx : transactions_) {
            if (tx.authId && *tx.authId == authId) {
                sum += tx.amount;
            }
        }
        return sum;
    }

    void releaseRemaining(domain::Authorization& auth) {
        const int64_t remaining = auth.amount - capturedFor(auth.id);
        auto& account = accounts_.at(auth.accountId);
        account.availableBalance += remaining;
        account.holdBalance -= remaining;
        auth.status = domain::AuthStatus::REVERSED;
    }

    static std::string toUpper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }
};

} // namespace issuer::adapters::secondary
