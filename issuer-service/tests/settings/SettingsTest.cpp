/**
 * @file SettingsTest.cpp
 * @brief Unit tests for environment-driven settings
 */

#include <gtest/gtest.h>
#include "settings/IssuerSettings.hpp"
#include "settings/SecuritySettings.hpp"
#include "settings/SweeperSettings.hpp"
#include "domain/Exceptions.hpp"
#include <cstdlib>

using namespace issuer;
using namespace issuer::settings;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const char* name : {
                 "ISSUER_REPO_BACKEND", "ISSUER_ALLOW_MEM_BACKEND", "ISSUER_BIN_PREFIX",
                 "ISSUER_CARD_PRODUCT", "ISSUER_PRODUCT_YEARS", "ISSUER_EXPIRY_TZ",
                 "ISSUER_HOLD_TTL_SECONDS", "ISSUER_CVV_PROVIDER", "ISSUER_DCVV_STEP_SECONDS",
                 "ISSUER_SWEEP_INTERVAL_MS", "ISSUER_SWEEP_BATCH_SIZE", "ISSUER_DEMO_MODE",
                 "ISSUER_PAN_HASH_KEY", "ISSUER_CVK_KEY", "ISSUER_HSM_CVK_HEX"}) {
            unsetenv(name);
        }
    }
};

// ============================================================================
// PRODUCT YEARS
// ============================================================================

TEST_F(SettingsTest, ParseProductYears_Valid) {
    auto years = IssuerSettings::parseProductYears(R"({"Credit":3,"debit":5,"prepaid":2})");

    ASSERT_EQ(years.size(), 3u);
    EXPECT_EQ(years["credit"], 3);
    EXPECT_EQ(years["debit"], 5);
    EXPECT_EQ(years["prepaid"], 2);
}

TEST_F(SettingsTest, ParseProductYears_IgnoresNonPositive) {
    auto years = IssuerSettings::parseProductYears(R"({"credit":0,"debit":-2,"gift":1})");

    ASSERT_EQ(years.size(), 1u);
    EXPECT_EQ(years["gift"], 1);
}

TEST_F(SettingsTest, ParseProductYears_Invalid) {
    EXPECT_THROW(IssuerSettings::parseProductYears("not json"), std::invalid_argument);
    EXPECT_THROW(IssuerSettings::parseProductYears("[1,2]"), std::invalid_argument);
    EXPECT_THROW(IssuerSettings::parseProductYears(R"({"credit":"three"})"), std::invalid_argument);
    EXPECT_THROW(IssuerSettings::parseProductYears(R"({"credit":2.5})"), std::invalid_argument);
}

// ============================================================================
// ISSUER SETTINGS
// ============================================================================

TEST_F(SettingsTest, IssuerSettings_Defaults) {
    IssuerSettings settings;

    EXPECT_EQ(settings.getBackend(), "pg");
    EXPECT_FALSE(settings.isMemBackendAllowed());
    EXPECT_EQ(settings.getBinPrefix(), "421234");
    EXPECT_EQ(settings.getCardProduct(), "debit");
    EXPECT_EQ(settings.getExpiryTz(), "UTC0");
    EXPECT_EQ(settings.getHoldTtlSeconds(), 604800);
    EXPECT_EQ(settings.getCvvProvider(), "hmac");
    EXPECT_EQ(settings.getDcvvStepSeconds(), 30);
    EXPECT_EQ(settings.getProductYears().at("credit"), 3);
}

TEST_F(SettingsTest, IssuerSettings_FromEnv) {
    setenv("ISSUER_REPO_BACKEND", "MEM", 1);
    setenv("ISSUER_ALLOW_MEM_BACKEND", "true", 1);
    setenv("ISSUER_BIN_PREFIX", "55001234", 1);
    setenv("ISSUER_CARD_PRODUCT", "credit", 1);
    setenv("ISSUER_PRODUCT_YEARS", R"({"credit":4})", 1);
    setenv("ISSUER_EXPIRY_TZ", "MSK+3", 1);
    setenv("ISSUER_HOLD_TTL_SECONDS", "60", 1);
    setenv("ISSUER_CVV_PROVIDER", "HSM", 1);
    setenv("ISSUER_DCVV_STEP_SECONDS", "60", 1);

    IssuerSettings settings;

    EXPECT_EQ(settings.getBackend(), "mem");
    EXPECT_TRUE(settings.isMemBackendAllowed());
    EXPECT_EQ(settings.getCvvProvider(), "hsm");

    auto config = settings.toIssuerConfig();
    EXPECT_EQ(config.binPrefix, "55001234");
    EXPECT_EQ(config.cardProduct, "credit");
    EXPECT_EQ(config.holdTtlSeconds, 60);
    EXPECT_EQ(config.dcvvStepSeconds, 60);

    domain::ExpiryCalculator calc(settings.toExpirySettings());
    EXPECT_EQ(calc.yearsForProduct("credit"), 4);
    EXPECT_EQ(calc.zone().rule(), "MSK+3");
}

TEST_F(SettingsTest, IssuerSettings_BadJson_Throws) {
    setenv("ISSUER_PRODUCT_YEARS", "{", 1);
    EXPECT_THROW(IssuerSettings{}, std::invalid_argument);
}

TEST_F(SettingsTest, IssuerSettings_EmptyTz_Throws) {
    setenv("ISSUER_EXPIRY_TZ", "", 1);
    IssuerSettings settings;
    EXPECT_THROW(settings.toExpirySettings(), domain::ValidationException);
}

// ============================================================================
// SWEEPER SETTINGS
// ============================================================================

TEST_F(SettingsTest, SweeperSettings_DefaultsAndClamp) {
    {
        SweeperSettings settings;
        EXPECT_EQ(settings.getIntervalMs(), 5000);
        EXPECT_EQ(settings.getBatchSize(), 500);
    }

    setenv("ISSUER_SWEEP_INTERVAL_MS", "0", 1);
    setenv("ISSUER_SWEEP_BATCH_SIZE", "-10", 1);
    SweeperSettings clamped;
    EXPECT_EQ(clamped.getIntervalMs(), 1);
    EXPECT_EQ(clamped.getBatchSize(), 1);
}

// ============================================================================
// SECURITY SETTINGS
// ============================================================================

TEST_F(SettingsTest, Security_MissingKeyWithoutDemo_Throws) {
    SecuritySettings settings;

    EXPECT_FALSE(settings.isDemoMode());
    EXPECT_THROW(settings.panHashKey(), domain::ProviderConfigException);
    EXPECT_THROW(settings.cvkKey(), domain::ProviderConfigException);
    EXPECT_THROW(settings.hsmCvkKey(), domain::ProviderConfigException);
}

TEST_F(SettingsTest, Security_DemoKeys) {
    setenv("ISSUER_DEMO_MODE", "true", 1);
    SecuritySettings settings;

    EXPECT_FALSE(settings.panHashKey().empty());
    EXPECT_FALSE(settings.cvkKey().empty());
    EXPECT_EQ(settings.hsmCvkKey().size(), 16u);
}

TEST_F(SettingsTest, Security_ExplicitKeys) {
    setenv("ISSUER_PAN_HASH_KEY", "pepper", 1);
    setenv("ISSUER_HSM_CVK_HEX", "00112233445566778899AABBCCDDEEFF0011223344556677", 1);
    SecuritySettings settings;

    EXPECT_EQ(settings.panHashKey().size(), 6u);
    EXPECT_EQ(settings.hsmCvkKey().size(), 24u);
}

TEST_F(SettingsTest, Security_BadHsmHex_Throws) {
    setenv("ISSUER_HSM_CVK_HEX", "xyz", 1);
    SecuritySettings settings;
    EXPECT_THROW(settings.hsmCvkKey(), domain::ProviderConfigException);
}
