/**
 * @file MqttHeaderErrors.cpp
 * @brief This file contains the implementation of the fixed header errors.
 * @author Hatem Nabli
 * copyright © 2025 by Hatem Nabli
 * @note This file is part of the MqttHeader library.
 */

#include "MqttHeader/MqttHeaderErrors.hpp"

#include <StringUtils/StringUtils.hpp>

namespace MqttHeader
{
    const char* getErrorName(HeaderErrorCode code) {
        switch (code)
        {
        case NoError:
            return "NoError";
        case InvalidPacketType:
            return "InvalidPacketType";
        case InvalidFlags:
            return "InvalidFlags";
        case InvalidQoS:
            return "InvalidQoS";
        case RemainingLengthOutOfRange:
            return "RemainingLengthOutOfRange";
        case TruncatedMessage:
            return "TruncatedMessage";
        case BufferTooSmall:
            return "BufferTooSmall";
        }
        return "Unknown";
    }

    std::string HeaderError::describe() const {
        const long long v = (long long)value;
        const long long b = (long long)bound;
        switch (code)
        {
        case NoError:
            return "no error";
        case InvalidPacketType:
            return StringUtils::sprintf("Invalid control packet type %lld", v);
        case InvalidFlags:
            return StringUtils::sprintf("Invalid flags %lld, expecting %lld", v, b);
        case InvalidQoS:
            return StringUtils::sprintf("Invalid QoS %lld for PUBLISH packet (max %lld)", v, b);
        case RemainingLengthOutOfRange:
            return StringUtils::sprintf("Remaining length (%lld) out of bound (max %lld, min 0)",
                                        v, b);
        case TruncatedMessage:
            return StringUtils::sprintf(
                "Remaining length (%lld) is greater than remaining buffer (%lld)", v, b);
        case BufferTooSmall:
            return StringUtils::sprintf("Insufficient buffer size. Expecting %lld, got %lld", b,
                                        v);
        }
        return StringUtils::sprintf("Unknown error %d", (int)code);
    }
}  // namespace MqttHeader
