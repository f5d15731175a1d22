#ifndef MQTTHEADER_ERRORS_HPP
#define MQTTHEADER_ERRORS_HPP
/**
 * @file MqttHeaderErrors.hpp
 * @brief This file contains the errors reported while encoding, decoding or
 *        modifying a fixed header.
 * @author Hatem Nabli
 * copyright © 2025 by Hatem Nabli
 */
#pragma once

#include <cstdint>
#include <string>

namespace MqttHeader
{
    enum HeaderErrorCode : uint8_t
    {
        NoError = 0,
        InvalidPacketType,          //!< Type nibble is 0, 15 or not a control packet type
        InvalidFlags,               //!< Flags of a fixed-flags type don't match its defaults
        InvalidQoS,                 //!< PUBLISH flags encode QoS 3
        RemainingLengthOutOfRange,  //!< Length below 0, above 268435455, or malformed varint
        TruncatedMessage,           //!< Declared length goes beyond the buffer
        BufferTooSmall,             //!< Destination buffer can't hold the encoded header
    };

    const char* getErrorName(HeaderErrorCode code);

    /**
     * @brief The error reported by a fixed header operation.
     *
     * value is the offending value, bound the expected value or limit:
     *  - InvalidPacketType: type found, 0
     *  - InvalidFlags: flags found, expected flags
     *  - InvalidQoS: QoS found, highest valid QoS
     *  - RemainingLengthOutOfRange: length found (bytes read for a malformed varint), maximum
     *  - TruncatedMessage: declared length, bytes available
     *  - BufferTooSmall: bytes available, bytes required
     */
    struct HeaderError
    {
        HeaderErrorCode code;
        int64_t value;
        int64_t bound;

        explicit operator bool() const { return code != NoError; }

        /** Build a readable diagnostic message out of the error */
        std::string describe() const;

        HeaderError(HeaderErrorCode code = NoError, int64_t value = 0, int64_t bound = 0) :
            code(code), value(value), bound(bound) {}
    };
}  // namespace MqttHeader

#endif /* MQTTHEADER_ERRORS_HPP */
