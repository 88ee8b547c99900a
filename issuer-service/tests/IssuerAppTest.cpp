/**
 * @file IssuerAppTest.cpp
 * @brief Composition root wiring tests (in-memory backend only)
 */

#include <gtest/gtest.h>
#include "IssuerApp.hpp"
#include <cstdlib>

using namespace issuer;

namespace {

/**
 * @brief IssuerApp без блокирующего цикла
 */
class WiringOnlyApp : public IssuerApp {
protected:
    void start() override {}
};

} // namespace

class IssuerAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("ISSUER_REPO_BACKEND", "mem", 1);
        setenv("ISSUER_ALLOW_MEM_BACKEND", "true", 1);
        setenv("ISSUER_DEMO_MODE", "true", 1);
        for (const char* name : {"ISSUER_PAN_HASH_KEY", "ISSUER_CVK_KEY", "ISSUER_HSM_CVK_HEX"}) {
            unsetenv(name);
        }
    }

    void TearDown() override {
        for (const char* name : {"ISSUER_REPO_BACKEND", "ISSUER_ALLOW_MEM_BACKEND",
                                 "ISSUER_DEMO_MODE", "ISSUER_CVV_PROVIDER"}) {
            unsetenv(name);
        }
    }

    char* argv_[1] = {nullptr};
};

TEST_F(IssuerAppTest, MemBackend_HmacProvider_EndToEnd) {
    WiringOnlyApp app;
    app.run(0, argv_);

    auto service = app.service();
    ASSERT_NE(service, nullptr);

    auto account = service->createAccount({5000, "EUR"});
    auto card = service->issueCard(account.id);
    const std::string yymm = card.expiryMmyy.substr(2, 2) + card.expiryMmyy.substr(0, 2);

    domain::AuthorizationRequest request;
    request.amount = 1200;
    request.currency = "EUR";
    request.card.pan = card.pan;
    request.card.expiryYymm = yymm;
    request.stan = 1;
    EXPECT_EQ(service->authorizeRequest(request).approvalCode, "00");

    auto tx = service->captureByStan(card.pan, yymm, 1, 0, "EUR");
    EXPECT_EQ(tx.amount, 1200);
    EXPECT_EQ(service->getAccount(account.id)->availableBalance, 3800);
    EXPECT_EQ(service->cardVerificationCode(card.pan, yymm).size(), 3u);
}

TEST_F(IssuerAppTest, HsmProvider) {
    setenv("ISSUER_CVV_PROVIDER", "hsm", 1);
    WiringOnlyApp app;
    app.run(0, argv_);

    auto service = app.service();
    auto account = service->createAccount({100, "USD"});
    auto card = service->issueCard(account.id);
    const std::string yymm = card.expiryMmyy.substr(2, 2) + card.expiryMmyy.substr(0, 2);

    EXPECT_EQ(service->displayDynamicCvv(card.pan, yymm).code.size(), 3u);
}

TEST_F(IssuerAppTest, MemBackendNotAllowed_Throws) {
    setenv("ISSUER_ALLOW_MEM_BACKEND", "false", 1);
    WiringOnlyApp app;
    EXPECT_THROW(app.run(0, argv_), std::runtime_error);
}

TEST_F(IssuerAppTest, UnknownCvvProvider_Throws) {
    setenv("ISSUER_CVV_PROVIDER", "magic", 1);
    WiringOnlyApp app;
    EXPECT_THROW(app.run(0, argv_), std::runtime_error);
}

TEST_F(IssuerAppTest, MissingKeysWithoutDemo_Throws) {
    setenv("ISSUER_DEMO_MODE", "false", 1);
    WiringOnlyApp app;
    EXPECT_THROW(app.run(0, argv_), domain::ProviderConfigException);
}
