/**
 * @file MqttHeaderErrorsTests.cpp
 * @brief This file contains the tests of the fixed header errors.
 * @author Hatem Nabli
 * copyright © 2025 by Hatem Nabli
 */
#include <string>
#include <gtest/gtest.h>
#include <MqttHeader/MqttHeaderErrors.hpp>

using namespace MqttHeader;

TEST(MqttHeaderErrorsTests, ErrorNames) {
    EXPECT_EQ(std::string(getErrorName(NoError)), "NoError");
    EXPECT_EQ(std::string(getErrorName(InvalidPacketType)), "InvalidPacketType");
    EXPECT_EQ(std::string(getErrorName(InvalidFlags)), "InvalidFlags");
    EXPECT_EQ(std::string(getErrorName(InvalidQoS)), "InvalidQoS");
    EXPECT_EQ(std::string(getErrorName(RemainingLengthOutOfRange)), "RemainingLengthOutOfRange");
    EXPECT_EQ(std::string(getErrorName(TruncatedMessage)), "TruncatedMessage");
    EXPECT_EQ(std::string(getErrorName(BufferTooSmall)), "BufferTooSmall");
}

TEST(MqttHeaderErrorsTests, BoolConversion) {
    HeaderError none;
    EXPECT_FALSE(none);
    EXPECT_EQ(none.code, NoError);

    HeaderError error(InvalidQoS, 3, 2);
    EXPECT_TRUE(error);
}

TEST(MqttHeaderErrorsTests, Describe) {
    EXPECT_EQ(HeaderError(InvalidPacketType, 15).describe(), "Invalid control packet type 15");
    EXPECT_EQ(HeaderError(InvalidFlags, 0, 2).describe(), "Invalid flags 0, expecting 2");
    EXPECT_EQ(HeaderError(InvalidQoS, 3, 2).describe(),
              "Invalid QoS 3 for PUBLISH packet (max 2)");
    EXPECT_EQ(HeaderError(RemainingLengthOutOfRange, 268435456, 268435455).describe(),
              "Remaining length (268435456) out of bound (max 268435455, min 0)");
    EXPECT_EQ(HeaderError(RemainingLengthOutOfRange, -1, 268435455).describe(),
              "Remaining length (-1) out of bound (max 268435455, min 0)");
    EXPECT_EQ(HeaderError(TruncatedMessage, 10, 5).describe(),
              "Remaining length (10) is greater than remaining buffer (5)");
    EXPECT_EQ(HeaderError(BufferTooSmall, 1, 2).describe(),
              "Insufficient buffer size. Expecting 2, got 1");
}
