/**
 * @file HsmCvvProviderTest.cpp
 * @brief Unit tests for HsmCvvProvider and SoftDes3MacDevice
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/cvv/HsmCvvProvider.hpp"
#include "adapters/secondary/cvv/SoftDes3MacDevice.hpp"
#include "domain/Exceptions.hpp"
#include "utils/Crypto.hpp"
#include "../mocks/MockMacDevice.hpp"

using namespace issuer;
using namespace issuer::adapters::secondary::cvv;
using namespace issuer::tests;
using ::testing::Return;
using ::testing::_;

namespace {

const std::string kPanNoCD = "411111111111111";
const std::string kDemoCvk = "0123456789ABCDEFFEDCBA9876543210";

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

Clock fixedClock(int64_t unixSeconds) {
    return [unixSeconds] {
        return std::chrono::system_clock::time_point(std::chrono::seconds(unixSeconds));
    };
}

} // namespace

// ============================================================================
// DECIMALIZATION
// ============================================================================

TEST(HsmDecimalizeTest, HexLettersMapped) {
    EXPECT_EQ(HsmCvvProvider::decimalize({0xab, 0xcd}, 4), "0123");
    EXPECT_EQ(HsmCvvProvider::decimalize({0xef, 0x90}, 4), "4590");
    EXPECT_EQ(HsmCvvProvider::decimalize({0x12, 0x34, 0x56}, 3), "123");
}

TEST(HsmDecimalizeTest, ShortMac_PaddedWithDigits) {
    auto code = HsmCvvProvider::decimalize({0x12}, 4);
    ASSERT_EQ(code.size(), 4u);
    EXPECT_EQ(code.substr(0, 2), "12");
    EXPECT_TRUE(code[2] >= '0' && code[2] <= '9');
    EXPECT_TRUE(code[3] >= '0' && code[3] <= '9');
}

// ============================================================================
// PROVIDER WITH MOCK DEVICE
// ============================================================================

class HsmCvvProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        device_ = std::make_shared<MockMacDevice>();
    }

    std::shared_ptr<MockMacDevice> device_;
};

TEST_F(HsmCvvProviderTest, Cvv2_AssemblesDataAndDecimalizes) {
    EXPECT_CALL(*device_, mac(bytesOf("4111111111111113012101")))
        .WillOnce(Return(std::vector<uint8_t>{0x9a, 0x1b, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));

    HsmCvvProvider provider(device_);
    EXPECT_EQ(provider.computeCvv2(kPanNoCD, "3012", "101", 3), "901");
}

TEST_F(HsmCvvProviderTest, Dcvv_AppendsWindowHex) {
    // unix 1000, step 30 -> окно 33 = 0x21
    EXPECT_CALL(*device_, mac(bytesOf("41111111111111130121010000000000000021")))
        .WillOnce(Return(std::vector<uint8_t>{0x12, 0x34, 0, 0, 0, 0, 0, 0}));

    HsmCvvProvider provider(device_, fixedClock(1000));
    auto result = provider.computeDisplayDcvv(kPanNoCD, "3012", "101", 30, 4);

    EXPECT_EQ(result.code, "1234");
    EXPECT_EQ(result.ttlSeconds, 20);
}

TEST_F(HsmCvvProviderTest, InvalidInputs_DeviceNotCalled) {
    EXPECT_CALL(*device_, mac(_)).Times(0);

    HsmCvvProvider provider(device_);
    EXPECT_THROW(provider.computeCvv2("123", "3012", "101", 3), domain::ValidationException);
    EXPECT_THROW(provider.computeCvv2(kPanNoCD, "3000", "101", 3), domain::ValidationException);
    EXPECT_THROW(provider.computeDisplayDcvv(kPanNoCD, "3012", "1011", 30, 3), domain::ValidationException);
}

TEST_F(HsmCvvProviderTest, DeviceError_Propagates) {
    EXPECT_CALL(*device_, mac(_)).WillOnce(::testing::Throw(std::runtime_error("hsm offline")));

    HsmCvvProvider provider(device_);
    EXPECT_THROW(provider.computeCvv2(kPanNoCD, "3012", "101", 3), std::runtime_error);
}

TEST_F(HsmCvvProviderTest, NullDevice_Throws) {
    EXPECT_THROW(HsmCvvProvider{nullptr}, domain::ProviderConfigException);
}

// ============================================================================
// SOFTWARE 3DES DEVICE
// ============================================================================

TEST(SoftDes3MacDeviceTest, KnownAnswer_StaticData) {
    SoftDes3MacDevice device(utils::SecureKey::fromHex(kDemoCvk));
    auto mac = device.mac(bytesOf("4111111111111113012101"));

    EXPECT_EQ(utils::toHex(mac), "11264adceb11bc70");
}

TEST(SoftDes3MacDeviceTest, EmptyData_IsOneZeroBlock) {
    SoftDes3MacDevice device(utils::SecureKey::fromHex(kDemoCvk));

    EXPECT_EQ(utils::toHex(device.mac({})), "08d7b4fb629d0885");
    EXPECT_EQ(device.mac({}), device.mac(std::vector<uint8_t>(8, 0)));
}

TEST(SoftDes3MacDeviceTest, DoubleLengthKey_EqualsTripleLength) {
    SoftDes3MacDevice k16(utils::SecureKey::fromHex(kDemoCvk));
    SoftDes3MacDevice k24(utils::SecureKey::fromHex(kDemoCvk + "0123456789ABCDEF"));

    auto data = bytesOf("some card data");
    EXPECT_EQ(k16.mac(data), k24.mac(data));
}

TEST(SoftDes3MacDeviceTest, BadKeyLength_Throws) {
    EXPECT_THROW(SoftDes3MacDevice{utils::SecureKey::fromHex("0011223344556677")},
                 domain::ProviderConfigException);
}

TEST(SoftDes3MacDeviceTest, WithProvider_KnownAnswer) {
    auto device = std::make_shared<SoftDes3MacDevice>(utils::SecureKey::fromHex(kDemoCvk));
    HsmCvvProvider provider(device, fixedClock(1000));

    EXPECT_EQ(provider.computeCvv2(kPanNoCD, "3012", "101", 3), "112");
    EXPECT_EQ(provider.computeCvv2(kPanNoCD, "3012", "101", 4), "1126");
    EXPECT_EQ(provider.computeDisplayDcvv(kPanNoCD, "3012", "101", 30, 3).code, "423");
}
