#pragma once

#include "ports/input/IIssuerService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "ports/output/ICvvProvider.hpp"
#include "domain/ApprovalCode.hpp"
#include "domain/Exceptions.hpp"
#include "domain/ExpiryCalculator.hpp"
#include "domain/IssuerConfig.hpp"
#include "domain/PanGenerator.hpp"
#include "utils/SecureRandom.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>

namespace issuer::application {

/**
 * @brief Сервис эмитента
 *
 * Реализует IIssuerService, координирует:
 * - ILedgerRepository (все изменения балансов и состояний)
 * - ExpiryCalculator (сроки действия)
 * - PAN-генератор (уникальные Luhn-валидные PAN)
 * - ICvvProvider (статический и динамический CVV)
 *
 * Открытые PAN в лог не попадают, только маскированные.
 */
class IssuerService : public ports::input::IIssuerService {
public:
    static constexpr const char* kDefaultBin = "421234";
    static constexpr int kPanLength = 16;
    static constexpr int kUniquePanRetries = 10;
    static constexpr int kCreateCardAttempts = 5;
    static constexpr const char* kServiceCode = "101";
    static constexpr int kCvvWidth = 3;
    static constexpr size_t kMinCardholderName = 2;
    static constexpr size_t kMaxCardholderName = 26;

    IssuerService(
        std::shared_ptr<ports::output::ILedgerRepository> repository,
        std::shared_ptr<ports::output::ICvvProvider> cvvProvider,
        std::shared_ptr<domain::ExpiryCalculator> expiry,
        std::shared_ptr<domain::IssuerConfig> config
    ) : repository_(std::move(repository))
      , cvvProvider_(std::move(cvvProvider))
      , expiry_(std::move(expiry))
      , config_(std::move(config))
    {
        bin_ = config_->binPrefix;
        try {
            domain::pan::validateBin(bin_);
        } catch (const domain::ValidationException& e) {
            std::cerr << "[IssuerService] Invalid BIN '" << bin_ << "' (" << e.what()
                      << "), falling back to " << kDefaultBin << std::endl;
            bin_ = kDefaultBin;
        }
    }

    domain::Account createAccount(const domain::CreateAccountRequest& request) override {
        if (request.balance < 0) {
            throw domain::ValidationException("balance must be non-negative");
        }
        const std::string currency = normalizeCurrency(request.currency);

        domain::Account account(utils::UuidGenerator::generate(), currency, request.balance);
        repository_->createAccount(account);

        std::cout << "[IssuerService] Account " << account.id << " created ("
                  << account.availableBalance << " " << currency << ")" << std::endl;
        return account;
    }

    std::optional<domain::Account> getAccount(const std::string& accountId) override {
        return repository_->getAccount(accountId);
    }

    domain::IssuedCard issueCard(const std::string& accountId) override {
        if (!repository_->getAccount(accountId)) {
            throw domain::NotFoundException("account not found: " + accountId);
        }

        const auto now = std::chrono::system_clock::now();
        const int years = expiry_->yearsForProduct(config_->cardProduct);
        const std::string expYymm = expiry_->yymm(now, years);

        auto exists = [this](const std::string& pan) { return repository_->existsCardNumber(pan); };

        // Уникальность на вставке: гонку между проверкой и INSERT ловит pan_hash UNIQUE
        for (int attempt = 0; attempt < kCreateCardAttempts; ++attempt) {
            const std::string pan = domain::pan::generateUniquePan(
                bin_, kPanLength, "", kUniquePanRetries, exists);

            domain::NewCard newCard;
            newCard.id = utils::UuidGenerator::generate();
            newCard.accountId = accountId;
            newCard.bin = bin_;
            newCard.pan = pan;
            newCard.expiryYymm = expYymm;
            newCard.status = domain::CardStatus::ISSUED;

            try {
                auto stored = repository_->createCard(newCard);

                domain::IssuedCard issued;
                issued.id = stored.id;
                issued.accountId = stored.accountId;
                issued.pan = pan;
                issued.maskedPan = domain::pan::maskPan(pan);
                issued.expiryMmyy = expiry_->mmyy(now, years);
                issued.cardFace = expiry_->cardFace(now, years);
                issued.cvv = utils::SecureRandom::instance().digits(3);
                issued.status = stored.status;

                std::cout << "[IssuerService] Card " << issued.maskedPan << " issued for account "
                          << accountId << ", expires " << issued.cardFace << std::endl;
                return issued;

            } catch (const domain::PanConflictException&) {
                std::cout << "[IssuerService] PAN conflict on insert, regenerating (attempt "
                          << attempt + 1 << ")" << std::endl;
            }
        }

        throw domain::RetryExhaustedException("could not create unique card after retries");
    }

    domain::AuthorizationResponse authorizeRequest(const domain::AuthorizationRequest& request) override {
        if (request.amount <= 0) {
            throw domain::ValidationException("amount must be positive");
        }
        const std::string currency = normalizeCurrency(request.currency);
        const std::string pan = domain::pan::normalizePan(request.card.pan);
        const std::string masked = domain::pan::maskPan(pan);

        auto card = repository_->findCardForAuthorization(pan, request.card.expiryYymm);
        if (!card) {
            std::cout << "[IssuerService] Card " << masked << " not found" << std::endl;
            return decline(domain::approval::INVALID_CARD);
        }

        if (!domain::canAuthorize(card->status)) {
            std::cout << "[IssuerService] Card " << masked << " is "
                      << domain::toString(card->status) << std::endl;
            return decline(domain::approval::RESTRICTED_CARD);
        }

        const auto now = domain::Timestamp::now();
        if (expiry_->isExpired(card->expiryYymm, now.value)) {
            std::cout << "[IssuerService] Card " << masked << " expired" << std::endl;
            return decline(domain::approval::EXPIRED_CARD);
        }

        domain::HoldRequest hold;
        hold.accountId = card->accountId;
        hold.cardId = card->id;
        hold.amount = request.amount;
        hold.currency = currency;
        hold.approvalCode = domain::approval::APPROVED;
        hold.authorizationCode = utils::SecureRandom::instance().digits(6);
        hold.merchantName = request.merchant.name;
        hold.mcc = request.merchant.mcc;
        hold.stan = request.stan;
        hold.holdExpiresAt = now.addSeconds(config_->holdTtlSeconds);

        auto result = repository_->createAuthAndHold(hold);

        switch (result.outcome) {
            case domain::HoldOutcome::HELD:
            case domain::HoldOutcome::DUPLICATE:
                std::cout << "[IssuerService] Authorized " << request.amount << " " << currency
                          << " on " << masked << (result.isDuplicate() ? " (replay)" : "") << std::endl;
                return domain::AuthorizationResponse{result.authorizationCode, result.approvalCode};

            case domain::HoldOutcome::INSUFFICIENT_FUNDS:
                std::cout << "[IssuerService] Insufficient funds on " << masked << std::endl;
                return decline(domain::approval::INSUFFICIENT_FUNDS);

            case domain::HoldOutcome::IDEMPOTENCY_MISMATCH:
                std::cout << "[IssuerService] STAN reused with different parameters on "
                          << masked << std::endl;
                return decline(domain::approval::DUPLICATE_TRANSMISSION);
        }
        throw std::logic_error("unhandled hold outcome");
    }

    domain::Transaction captureByStan(
        const std::string& pan,
        const std::string& expiryYymm,
        int stan,
        int64_t amount,
        const std::string& currency
    ) override {
        auto auth = findOpenAuth(pan, expiryYymm, stan);
        return repository_->captureAuth(auth.id, amount, normalizeCurrency(currency));
    }

    void reverseByStan(const std::string& pan, const std::string& expiryYymm, int stan) override {
        auto auth = findOpenAuth(pan, expiryYymm, stan);
        repository_->reverseAuth(auth.id);
    }

    std::vector<domain::Transaction> listTransactions(const std::string& accountId) override {
        return repository_->listTransactions(accountId);
    }

    int releaseExpiredHolds(int batchSize) override {
        return repository_->releaseExpiredHolds(batchSize);
    }

    void updateCardStatus(const std::string& cardId, domain::CardStatus status) override {
        if (!repository_->updateCardStatus(cardId, status)) {
            throw domain::NotFoundException("card not found: " + cardId);
        }
    }

    domain::EmbossedCard setCardholderName(
        const std::string& accountId,
        const std::string& cardId,
        const std::string& name
    ) override {
        const std::string holder = normalizeCardholderName(name);
        auto card = repository_->updateCardholderName(accountId, cardId, holder);

        domain::EmbossedCard embossed;
        embossed.cardFace = domain::ExpiryCalculator::faceImprint(card.expiryYymm, holder);
        embossed.card = std::move(card);

        std::cout << "[IssuerService] Cardholder name set on card " << cardId << std::endl;
        return embossed;
    }

    std::string cardVerificationCode(const std::string& pan, const std::string& expiryYymm) override {
        const std::string panNoCD = knownPanNoCheckDigit(pan, expiryYymm);
        return cvvProvider_->computeCvv2(panNoCD, expiryYymm, kServiceCode, kCvvWidth);
    }

    ports::output::DynamicCvv displayDynamicCvv(const std::string& pan, const std::string& expiryYymm) override {
        const std::string panNoCD = knownPanNoCheckDigit(pan, expiryYymm);
        return cvvProvider_->computeDisplayDcvv(
            panNoCD, expiryYymm, kServiceCode, config_->dcvvStepSeconds, kCvvWidth);
    }

    const std::string& bin() const { return bin_; }

private:
    std::shared_ptr<ports::output::ILedgerRepository> repository_;
    std::shared_ptr<ports::output::ICvvProvider> cvvProvider_;
    std::shared_ptr<domain::ExpiryCalculator> expiry_;
    std::shared_ptr<domain::IssuerConfig> config_;
    std::string bin_;

    static domain::AuthorizationResponse decline(const std::string& approvalCode) {
        return domain::AuthorizationResponse{"", approvalCode};
    }

    static std::string normalizeCurrency(const std::string& currency) {
        if (currency.size() != 3 ||
            !std::all_of(currency.begin(), currency.end(),
                         [](unsigned char c) { return std::isalpha(c); })) {
            throw domain::ValidationException("currency must be a 3-letter code");
        }
        std::string upper = currency;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return upper;
    }

    /**
     * @brief Обрезка пробелов по краям, схлопывание повторов, верхний регистр
     */
    static std::string normalizeCardholderName(const std::string& name) {
        std::string out;
        for (char c : name) {
            const auto uc = static_cast<unsigned char>(c);
            if (std::isspace(uc)) {
                if (!out.empty() && out.back() != ' ') {
                    out.push_back(' ');
                }
                continue;
            }
            if (!std::isalpha(uc) && c != '.' && c != '-' && c != '\'') {
                throw domain::ValidationException("cardholder name contains invalid characters");
            }
            out.push_back(static_cast<char>(std::toupper(uc)));
        }
        if (!out.empty() && out.back() == ' ') {
            out.pop_back();
        }
        if (out.size() < kMinCardholderName || out.size() > kMaxCardholderName) {
            throw domain::ValidationException("cardholder name must be 2..26 characters");
        }
        return out;
    }

    domain::Authorization findOpenAuth(const std::string& pan, const std::string& expiryYymm, int stan) {
        auto card = repository_->findCardForAuthorization(domain::pan::normalizePan(pan), expiryYymm);
        if (!card) {
            throw domain::NotFoundException("card not found: " + domain::pan::maskPan(pan));
        }
        auto auth = repository_->findAuthByCardStan(card->id, stan);
        if (!auth) {
            throw domain::NotFoundException("auth not found for STAN " + std::to_string(stan));
        }
        if (auth->status != domain::AuthStatus::AUTHORIZED) {
            throw domain::InvalidStateException("bad auth status: " + domain::toString(auth->status));
        }
        return *auth;
    }

    std::string knownPanNoCheckDigit(const std::string& pan, const std::string& expiryYymm) {
        const std::string normalized = domain::pan::normalizePan(pan);
        domain::pan::validatePan(normalized);
        domain::ExpiryCalculator::validateYymm(expiryYymm);

        if (!repository_->findCardForAuthorization(normalized, expiryYymm)) {
            throw domain::NotFoundException("card not found: " + domain::pan::maskPan(normalized));
        }
        return normalized.substr(0, normalized.size() - 1);
    }
};

} // namespace issuer::application
