#ifndef MQTTHEADER_CONSTANTS_HPP
#define MQTTHEADER_CONSTANTS_HPP
/**
 * @file MqttHeaderConstants.hpp
 * @brief This file contains the definition of the constants for the MQTT
 *        fixed header.
 * @author Hatem Nabli
 * copyright © 2025 by Hatem Nabli
 */
#pragma once
#include <cstddef>  // for size_t
#include <cstdint>

namespace MqttHeader
{
    // ------------------------ Control Packet Types ------------------------
    enum ControlPacketType : uint8_t
    {
        RESERVED = 0x00,
        CONNECT = 0x01,
        CONNACK = 0x02,
        PUBLISH = 0x03,
        PUBACK = 0x04,
        PUBREC = 0x05,
        PUBREL = 0x06,
        PUBCOMP = 0x07,
        SUBSCRIBE = 0x08,
        SUBACK = 0x09,
        UNSUBSCRIBE = 0x0A,
        UNSUBACK = 0x0B,
        PINGREQ = 0x0C,
        PINGRESP = 0x0D,
        DISCONNECT = 0x0E,
        RESERVED2 = 0x0F,
    };

    constexpr int PacketTypesCount = 16;

    // ------------------------ Fixed header bounds ------------------------
    constexpr uint32_t MaxRemainingLength = 0x0FFFFFFF;  //!< 268,435,455
    constexpr uint32_t MaxFixedHeaderSize = 5;           //!< Type byte + 4 varint bytes
    constexpr uint32_t PacketIdentifierSize = 2;

    // PUBLISH flag bits
    constexpr uint8_t PublishDupFlag = 0x08;
    constexpr uint8_t PublishQoSMask = 0x06;
    constexpr uint8_t PublishRetainFlag = 0x01;

    /** The possible Quality Of Service values */
    enum QoSDelivery : unsigned int
    {
        AtMostOne = 0,   //!< At most one delivery (unsecure sending)
        AtLeastOne = 1,  //!< At least one delivery (could have retransmission)
        ExactlyOne = 2,  //!< Exactly one delivery (longer to send)
    };

    /**
     * @brief Check that the given 4-bit value is one of the defined control packet types.
     */
    static inline bool isValidPacketType(uint8_t type) {
        return type > RESERVED && type < RESERVED2;
    }

    static inline bool isValidQoS(uint8_t qos) { return qos <= ExactlyOne; }

    /**
     * @brief Get the flags a packet of the given type must carry in its fixed header.
     * @note PUBLISH flags are variable, its default is 0 (no DUP, QoS 0, no RETAIN).
     *       Undefined types return 0.
     */
    static inline uint8_t getDefaultFlags(uint8_t type) {
        static const uint8_t defaultFlags[PacketTypesCount] = {0, 0, 0, 0, 0, 0, 2, 0,
                                                               2, 0, 2, 0, 0, 0, 0, 0};
        if (type >= PacketTypesCount)
            return 0;
        return defaultFlags[type];
    }

    static const char* getPacketTypeName(uint8_t type) {
        static const char* typeNames[PacketTypesCount] = {
            "RESERVED", "CONNECT", "CONNACK",  "PUBLISH",     "PUBACK",   "PUBREC",
            "PUBREL",   "PUBCOMP", "SUBSCRIBE", "SUBACK",     "UNSUBSCRIBE", "UNSUBACK",
            "PINGREQ",  "PINGRESP", "DISCONNECT", "RESERVED2"};
        if (type >= PacketTypesCount)
            return "UNKNOWN";
        return typeNames[type];
    }

    static const char* getPacketTypeDescription(uint8_t type) {
        static const char* typeDescriptions[PacketTypesCount] = {
            "Reserved",
            "Client request to connect to Server",
            "Connect acknowledgement",
            "Publish message",
            "Publish acknowledgement",
            "Publish received (assured delivery part 1)",
            "Publish release (assured delivery part 2)",
            "Publish complete (assured delivery part 3)",
            "Client subscribe request",
            "Subscribe acknowledgement",
            "Unsubscribe request",
            "Unsubscribe acknowledgement",
            "PING request",
            "PING response",
            "Client is disconnecting",
            "Reserved"};
        if (type >= PacketTypesCount)
            return "UNKNOWN";
        return typeDescriptions[type];
    }
}  // namespace MqttHeader

#endif /* MQTTHEADER_CONSTANTS_HPP */
