/**
 * @file PostgresLedgerRepositoryTest.cpp
 * @brief Integration tests for PostgresLedgerRepository
 *
 * Запускаются только при ISSUER_IT_DB=1 и доступной БД
 * (ISSUER_DB_HOST / ISSUER_DB_PASSWORD ...).
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/PostgresLedgerRepository.hpp"
#include "domain/Exceptions.hpp"
#include "domain/PanGenerator.hpp"
#include "utils/UuidGenerator.hpp"
#include <atomic>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace issuer;
using namespace issuer::adapters::secondary;

class PostgresLedgerRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* enabled = std::getenv("ISSUER_IT_DB");
        if (!enabled || std::string(enabled) != "1") {
            GTEST_SKIP() << "ISSUER_IT_DB=1 not set, skipping PostgreSQL integration tests";
        }

        hasher_ = std::make_shared<utils::PanHasher>(utils::SecureKey(std::string("it-pepper")));
        repo_ = std::make_shared<PostgresLedgerRepository>(
            std::make_shared<settings::DbSettings>(), hasher_);

        accountId_ = utils::UuidGenerator::generate();
        repo_->createAccount(domain::Account(accountId_, "USD", 10000));

        pan_ = domain::pan::generatePan("999999");
        domain::NewCard card;
        card.id = utils::UuidGenerator::generate();
        card.accountId = accountId_;
        card.pan = pan_;
        card.expiryYymm = "3012";
        cardId_ = repo_->createCard(card).id;
    }

    domain::HoldRequest makeHold(int64_t amount, std::optional<int> stan) {
        domain::HoldRequest hold;
        hold.accountId = accountId_;
        hold.cardId = cardId_;
        hold.amount = amount;
        hold.currency = "USD";
        hold.approvalCode = "00";
        hold.authorizationCode = "654321";
        hold.merchantName = "IT Merchant";
        hold.mcc = "5411";
        hold.stan = stan;
        hold.holdExpiresAt = domain::Timestamp::now().addSeconds(3600);
        return hold;
    }

    domain::Account account() {
        return *repo_->getAccount(accountId_);
    }

    std::shared_ptr<utils::PanHasher> hasher_;
    std::shared_ptr<PostgresLedgerRepository> repo_;
    std::string accountId_;
    std::string cardId_;
    std::string pan_;
};

TEST_F(PostgresLedgerRepositoryTest, Ping) {
    EXPECT_NO_THROW(repo_->ping());
}

TEST_F(PostgresLedgerRepositoryTest, Card_LookupAndConflict) {
    EXPECT_TRUE(repo_->existsCardNumber(pan_));
    auto card = repo_->findCardForAuthorization(pan_, "3012");
    ASSERT_TRUE(card.has_value());
    EXPECT_EQ(card->id, cardId_);
    EXPECT_EQ(card->last4, domain::pan::lastN(pan_, 4));
    EXPECT_FALSE(repo_->findCardForAuthorization(pan_, "3011").has_value());

    domain::NewCard dup;
    dup.id = utils::UuidGenerator::generate();
    dup.accountId = accountId_;
    dup.pan = pan_;
    dup.expiryYymm = "3112";
    EXPECT_THROW(repo_->createCard(dup), domain::PanConflictException);
}

TEST_F(PostgresLedgerRepositoryTest, Card_UnknownAccount) {
    domain::NewCard card;
    card.id = utils::UuidGenerator::generate();
    card.accountId = utils::UuidGenerator::generate();
    card.pan = domain::pan::generatePan("999999");
    card.expiryYymm = "3012";
    EXPECT_THROW(repo_->createCard(card), domain::NotFoundException);
}

TEST_F(PostgresLedgerRepositoryTest, CardholderName_RequiresOwningAccount) {
    auto card = repo_->updateCardholderName(accountId_, cardId_, "IT HOLDER");
    EXPECT_EQ(card.cardholderName, "IT HOLDER");
    EXPECT_EQ(repo_->findCardForAuthorization(pan_, "3012")->cardholderName, "IT HOLDER");

    const std::string otherAccount = utils::UuidGenerator::generate();
    repo_->createAccount(domain::Account(otherAccount, "USD", 0));
    EXPECT_THROW(repo_->updateCardholderName(otherAccount, cardId_, "NOBODY"), domain::NotFoundException);
    EXPECT_THROW(repo_->updateCardholderName(accountId_, "not-a-uuid", "NOBODY"), domain::NotFoundException);
}

TEST_F(PostgresLedgerRepositoryTest, InvalidInput_SameErrorsAsInMemory) {
    EXPECT_THROW(repo_->createAccount(domain::Account(accountId_, "USD", 1)), domain::ValidationException);

    domain::NewCard badExpiry;
    badExpiry.id = utils::UuidGenerator::generate();
    badExpiry.accountId = accountId_;
    badExpiry.pan = domain::pan::generatePan("999999");
    badExpiry.expiryYymm = "3013";
    EXPECT_THROW(repo_->createCard(badExpiry), domain::ValidationException);

    EXPECT_THROW(repo_->createAuthAndHold(makeHold(0, std::nullopt)), domain::ValidationException);
    EXPECT_EQ(account().availableBalance, 10000);
}

TEST_F(PostgresLedgerRepositoryTest, Hold_DuplicateAndMismatch) {
    auto first = repo_->createAuthAndHold(makeHold(1000, 11));
    EXPECT_EQ(first.outcome, domain::HoldOutcome::HELD);

    auto replay = repo_->createAuthAndHold(makeHold(1000, 11));
    EXPECT_EQ(replay.outcome, domain::HoldOutcome::DUPLICATE);
    EXPECT_EQ(replay.authId, first.authId);
    EXPECT_EQ(replay.authorizationCode, "654321");

    EXPECT_EQ(repo_->createAuthAndHold(makeHold(1500, 11)).outcome,
              domain::HoldOutcome::IDEMPOTENCY_MISMATCH);

    EXPECT_EQ(account().availableBalance, 9000);
    EXPECT_EQ(account().holdBalance, 1000);
}

TEST_F(PostgresLedgerRepositoryTest, Hold_InsufficientFunds_NoRow) {
    auto result = repo_->createAuthAndHold(makeHold(20000, 12));
    EXPECT_EQ(result.outcome, domain::HoldOutcome::INSUFFICIENT_FUNDS);
    EXPECT_FALSE(repo_->findAuthByCardStan(cardId_, 12).has_value());
    EXPECT_EQ(account().availableBalance, 10000);
}

TEST_F(PostgresLedgerRepositoryTest, Hold_Concurrent_NeverOverdraws) {
    std::atomic<int> held{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([this, i, &held] {
            if (repo_->createAuthAndHold(makeHold(1000, 100 + i)).outcome == domain::HoldOutcome::HELD) {
                ++held;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(held.load(), 10);
    EXPECT_EQ(account().availableBalance, 0);
    EXPECT_EQ(account().holdBalance, 10000);
}

TEST_F(PostgresLedgerRepositoryTest, Capture_PartialAndReverse) {
    auto hold = repo_->createAuthAndHold(makeHold(1000, 21));

    auto tx = repo_->captureAuth(hold.authId, 300, "USD");
    EXPECT_EQ(tx.amount, 300);

    repo_->reverseAuth(hold.authId);
    EXPECT_EQ(account().availableBalance, 9700);
    EXPECT_EQ(account().holdBalance, 0);

    auto txs = repo_->listTransactions(accountId_);
    ASSERT_EQ(txs.size(), 1u);
    EXPECT_EQ(txs[0].id, tx.id);

    EXPECT_THROW(repo_->captureAuth(hold.authId, 0, "USD"), domain::InvalidStateException);
    EXPECT_THROW(repo_->captureAuth("not-a-uuid", 0, "USD"), domain::NotFoundException);
}

TEST_F(PostgresLedgerRepositoryTest, Sweep_ReleasesExpired) {
    auto hold = makeHold(800, 31);
    hold.holdExpiresAt = domain::Timestamp::now().addSeconds(-60);
    auto id = repo_->createAuthAndHold(hold).authId;

    // Другие тесты могли оставить свои просроченные холды
    while (repo_->releaseExpiredHolds(500) > 0) {}

    auto auth = repo_->findAuthByCardStan(cardId_, 31);
    ASSERT_TRUE(auth.has_value());
    EXPECT_EQ(auth->id, id);
    EXPECT_EQ(auth->status, domain::AuthStatus::REVERSED);
    EXPECT_EQ(account().availableBalance, 10000);
    EXPECT_EQ(account().holdBalance, 0);
}
