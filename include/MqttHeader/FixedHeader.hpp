#ifndef MQTTHEADER_FIXEDHEADER_HPP
#define MQTTHEADER_FIXEDHEADER_HPP
/**
 * @file FixedHeader.hpp
 * @brief This file contains the declaration of the fixed header shared by
 *        every MQTT control packet.
 * @author Hatem Nabli
 * copyright © 2025 by Hatem Nabli
 */
#pragma once

#include <stdint.h>
#include <string>
#include <SystemUtils/DiagnosticsSender.hpp>
#include "MqttHeaderConstants.hpp"
#include "MqttHeaderErrors.hpp"
#include "MqttHeaderISerializable.hpp"
#include "MqttHeaderTypes.hpp"

namespace MqttHeader
{
    /**
     * @brief Settings applied while decoding a fixed header.
     */
    struct HeaderOptions
    {
        // This is the largest remaining length accepted by decode. It can be
        // lowered to enforce a negotiated maximum packet size, values above
        // MaxRemainingLength are capped.
        uint32_t maximumRemainingLength = MaxRemainingLength;
    };

    /**
     * @brief The fixed header of a control packet: the type and flags byte, the
     * remaining length, and the packet identifier of the packet types needing one.
     *
     * After decode() the type and flags byte refers to the decoded buffer, which must
     * outlive the header until the header is modified or decoded again. The decoded
     * buffer is never written: modifying a field copies it first and marks the header
     * dirty, so encode() knows the source bytes can't be reused anymore.
     *
     * The packet identifier is part of the variable header. The owning packet reads
     * and writes it with decodePacketIdentifier() and encodePacketIdentifier(), encode()
     * and decode() leave it alone.
     */
    class FixedHeader : public ISerializable
    {
        // Lifecycle management
    public:
        ~FixedHeader() override = default;
        FixedHeader(const FixedHeader&) = default;
        FixedHeader& operator=(const FixedHeader&) = default;

        // Public methods
    public:
        /**
         * This is the default constructor, all the fields are zero/absent.
         */
        FixedHeader();

        /**
         * @brief Get the control packet type.
         * @note A header without type and flags byte gets a zero one, which is not a valid
         * type, and is marked dirty.
         */
        ControlPacketType type();

        /**
         * @brief Set the control packet type, and its default flags.
         *
         * Any flags set before (PUBLISH DUP, QoS or RETAIN) are discarded.
         *
         * @param[in] type The new type.
         * @param[out] error Receives the failure reason, if not null.
         * @return false with InvalidPacketType if the type isn't a control packet type.
         */
        bool setType(ControlPacketType type, HeaderError* error = nullptr);

        /** Get the 4 flags bits, 0 if no type was set or decoded */
        uint8_t flags() const;

        /**
         * @brief Get write access to the type and flags byte, for the PUBLISH packet to set
         * its DUP, QoS and RETAIN bits once setType(PUBLISH) was called.
         *
         * A byte still referring to the decoded buffer is copied first.
         */
        uint8_t& mutableTypeAndFlags();

        uint32_t remainingLength() const;

        /**
         * @brief Set the length of the variable header and payload.
         * @return false with RemainingLengthOutOfRange if the length is negative or greater
         * than 268435455.
         */
        bool setRemainingLength(int64_t length, HeaderError* error = nullptr);

        /** Get the packet identifier, 0 if none was set */
        uint16_t packetIdentifier() const;

        /**
         * @brief Set the packet identifier. 0 means "no identifier" and is ignored.
         */
        void setPacketIdentifier(uint16_t id);

        /**
         * @brief Refer to the 2 bytes big endian packet identifier at the front of the buffer.
         * @return 2, or NotEnoughData with TruncatedMessage if the buffer is shorter.
         */
        uint32_t decodePacketIdentifier(const uint8_t* buffer, uint32_t bufferSize,
                                        HeaderError* error = nullptr);

        /**
         * @brief Write the packet identifier, big endian, at the front of the buffer.
         * @return 2, or NotEnoughData with BufferTooSmall if the buffer is shorter.
         */
        uint32_t encodePacketIdentifier(uint8_t* buffer, uint32_t bufferSize,
                                        HeaderError* error = nullptr) const;

        /**
         * @brief Serialize the type and flags byte followed by the remaining length.
         *
         * @param[out] buffer The destination.
         * @param[in] bufferSize The capacity of the destination.
         * @param[out] error Receives the failure reason, if not null.
         * @return The number of bytes written, NotEnoughData if the buffer is too small, or
         * BadData if the remaining length or the type is invalid.
         */
        uint32_t encode(uint8_t* buffer, uint32_t bufferSize, HeaderError* error = nullptr) const;

        /**
         * @brief Parse a fixed header from the front of a buffer holding at least a whole
         * packet.
         *
         * Checks, in order, the type, the flags (QoS for PUBLISH), the remaining length
         * encoding and the remaining length against the buffer size. On failure the header
         * is not modified.
         *
         * @param[in] buffer The source, which must outlive the header.
         * @param[in] bufferSize The number of bytes available in the source.
         * @param[out] error Receives the failure reason, if not null.
         * @return The number of header bytes consumed, NotEnoughData if the buffer doesn't
         * hold the whole packet, or BadData if the header is malformed.
         */
        uint32_t decode(const uint8_t* buffer, uint32_t bufferSize, HeaderError* error = nullptr);

        uint32_t decode(const uint8_t* buffer, uint32_t bufferSize, const HeaderOptions& options,
                        HeaderError* error = nullptr);

        /** Get the number of bytes encode() writes, from 2 to 5 */
        uint32_t length() const;

        /** Check if a field was modified since the header was constructed or decoded */
        bool isDirty() const;

        const char* name() const;         //!< Name of the packet type, e.g. "PUBLISH"
        const char* description() const;  //!< Description of the packet type

        /** Get a representation like: Type="PUBLISH", Flags=00001011, Remaining Length=10 */
        std::string toString() const;

        /** Compare type, flags and remaining length */
        bool operator==(const FixedHeader& other) const;
        bool operator!=(const FixedHeader& other) const;

        // ISerializable
    public:
        uint32_t getSerializedSize() const override;
        uint32_t serialize(uint8_t* buffer) override;
        uint32_t deserialize(const uint8_t* buffer, uint32_t bufferSize) override;
        bool checkImpl() const override;

        /**
         * @brief Subscribe to the diagnostic messages published when an operation on any
         * fixed header fails.
         *
         * @param[in] delegate The function receiving the messages.
         * @param[in] minLevel Messages below this level are not delivered.
         * @return The function to call to unsubscribe.
         */
        static SystemUtils::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemUtils::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0);

        // Private methods
    private:
        uint8_t storedTypeAndFlags() const;

        // Private properties
    private:
        Common::ByteStore<1> typeAndFlags_;
        Common::ByteStore<PacketIdentifierSize> packetId_;
        uint32_t remainingLength_;

        // The buffer of the last successful decode, and the size of its fixed header
        const uint8_t* source_;
        uint32_t sourceHeaderSize_;

        bool dirty_;
    };
}  // namespace MqttHeader

#endif /* MQTTHEADER_FIXEDHEADER_HPP */
