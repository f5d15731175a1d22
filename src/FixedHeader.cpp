/**
 * @file FixedHeader.cpp
 * @brief This file contains the implementation of the MQTT fixed header.
 * @author Hatem Nabli
 * copyright © 2025 by Hatem Nabli
 * @note This file is part of the MqttHeader library.
 */

#include "MqttHeader/FixedHeader.hpp"

#include <StringUtils/StringUtils.hpp>

namespace
{
    using namespace MqttHeader;

    // Level of the diagnostics for a destination or source buffer too short
    constexpr size_t ShortBufferLevel = 0;

    // Level of the diagnostics for malformed input or invalid values
    constexpr size_t InvalidDataLevel = 1;

    /**
     * This is the sender of the diagnostic messages of all the fixed headers.
     */
    SystemUtils::DiagnosticsSender& diagnosticSender() {
        static SystemUtils::DiagnosticsSender sender("MqttHeader::FixedHeader");
        return sender;
    }

    /**
     * Publish the error, hand it to the caller and return the matching sentinel.
     */
    uint32_t fail(const char* operation, const HeaderError& reason, HeaderError* error) {
        const bool shortBuffer = (reason.code == TruncatedMessage || reason.code == BufferTooSmall);
        diagnosticSender().SendDiagnosticInformationFormatted(
            shortBuffer ? ShortBufferLevel : InvalidDataLevel, "%s: %s", operation,
            reason.describe().c_str());
        if (error)
            *error = reason;
        return shortBuffer ? Common::NotEnoughData : Common::BadData;
    }
}  // namespace

namespace MqttHeader
{
    using namespace Common;

    FixedHeader::FixedHeader() :
        remainingLength_(0), source_(nullptr), sourceHeaderSize_(0), dirty_(false) {}

    ControlPacketType FixedHeader::type() {
        // Only an absent byte is materialized, a borrowed one is read in place
        if (typeAndFlags_.isEmpty() && typeAndFlags_.makeOwned())
            dirty_ = true;
        return (ControlPacketType)(uint8_t)TypeAndFlags(*typeAndFlags_.data()).type;
    }

    bool FixedHeader::setType(ControlPacketType type, HeaderError* error) {
        if (!isValidPacketType(type))
        {
            (void)fail("FixedHeader::setType", HeaderError(InvalidPacketType, type), error);
            return false;
        }
        // Rewriting a byte we already own doesn't make the header dirty: it only got owned
        // through an allocation, which already did.
        if (typeAndFlags_.makeOwned())
            dirty_ = true;
        *typeAndFlags_.mutableData() = (uint8_t)((type << 4) | (getDefaultFlags(type) & 0x0F));
        return true;
    }

    uint8_t FixedHeader::flags() const { return TypeAndFlags(storedTypeAndFlags()).flags; }

    uint8_t& FixedHeader::mutableTypeAndFlags() {
        if (typeAndFlags_.makeOwned())
            dirty_ = true;
        return *typeAndFlags_.mutableData();
    }

    uint32_t FixedHeader::remainingLength() const { return remainingLength_; }

    bool FixedHeader::setRemainingLength(int64_t length, HeaderError* error) {
        if (length < 0 || length > (int64_t)MaxRemainingLength)
        {
            (void)fail("FixedHeader::setRemainingLength",
                 HeaderError(RemainingLengthOutOfRange, length, MaxRemainingLength), error);
            return false;
        }
        remainingLength_ = (uint32_t)length;
        dirty_ = true;
        return true;
    }

    uint16_t FixedHeader::packetIdentifier() const {
        const uint8_t* id = packetId_.data();
        if (!id)
            return 0;
        return (uint16_t)((id[0] << 8) | id[1]);
    }

    void FixedHeader::setPacketIdentifier(uint16_t id) {
        if (id == 0)
            return;
        if (packetId_.makeOwned())
            dirty_ = true;
        uint8_t* raw = packetId_.mutableData();
        raw[0] = (uint8_t)(id >> 8);
        raw[1] = (uint8_t)(id & 0xFF);
    }

    uint32_t FixedHeader::decodePacketIdentifier(const uint8_t* buffer, uint32_t bufferSize,
                                                 HeaderError* error) {
        if (!buffer || bufferSize < PacketIdentifierSize)
        {
            return fail("FixedHeader::decodePacketIdentifier",
                        HeaderError(TruncatedMessage, PacketIdentifierSize, buffer ? bufferSize : 0),
                        error);
        }
        packetId_.borrow(buffer);
        return PacketIdentifierSize;
    }

    uint32_t FixedHeader::encodePacketIdentifier(uint8_t* buffer, uint32_t bufferSize,
                                                 HeaderError* error) const {
        if (!buffer || bufferSize < PacketIdentifierSize)
        {
            return fail("FixedHeader::encodePacketIdentifier",
                        HeaderError(BufferTooSmall, buffer ? bufferSize : 0, PacketIdentifierSize),
                        error);
        }
        const uint16_t id = packetIdentifier();
        buffer[0] = (uint8_t)(id >> 8);
        buffer[1] = (uint8_t)(id & 0xFF);
        return PacketIdentifierSize;
    }

    uint32_t FixedHeader::encode(uint8_t* buffer, uint32_t bufferSize, HeaderError* error) const {
        const uint32_t required = length();
        if (!buffer || bufferSize < required)
        {
            return fail("FixedHeader::encode",
                        HeaderError(BufferTooSmall, buffer ? bufferSize : 0, required), error);
        }

        if (remainingLength_ > MaxRemainingLength)
        {
            return fail("FixedHeader::encode",
                        HeaderError(RemainingLengthOutOfRange, remainingLength_,
                                    MaxRemainingLength),
                        error);
        }

        const TypeAndFlags typeAndFlags(storedTypeAndFlags());
        if (!isValidPacketType(typeAndFlags.type))
        {
            return fail("FixedHeader::encode",
                        HeaderError(InvalidPacketType, (uint8_t)typeAndFlags.type), error);
        }

        // Nothing changed since decode: the source bytes are still the encoding
        if (!dirty_ && typeAndFlags_.isBorrowed() && source_ && sourceHeaderSize_ == required)
        {
            memcpy(buffer, source_, required);
            return required;
        }

        buffer[0] = typeAndFlags.raw;
        VBInt encodedLength(remainingLength_);
        return 1 + encodedLength.serialize(buffer + 1);
    }

    uint32_t FixedHeader::decode(const uint8_t* buffer, uint32_t bufferSize, HeaderError* error) {
        return decode(buffer, bufferSize, HeaderOptions(), error);
    }

    uint32_t FixedHeader::decode(const uint8_t* buffer, uint32_t bufferSize,
                                 const HeaderOptions& options, HeaderError* error) {
        if (!buffer || bufferSize < 1)
            return fail("FixedHeader::decode", HeaderError(TruncatedMessage, 1, 0), error);

        const TypeAndFlags typeAndFlags(buffer[0]);
        const uint8_t type = typeAndFlags.type;
        if (!isValidPacketType(type))
            return fail("FixedHeader::decode", HeaderError(InvalidPacketType, type), error);

        if (type != PUBLISH && typeAndFlags.flags != getDefaultFlags(type))
        {
            return fail("FixedHeader::decode",
                        HeaderError(InvalidFlags, (uint8_t)typeAndFlags.flags,
                                    getDefaultFlags(type)),
                        error);
        }

        if (type == PUBLISH && !isValidQoS(typeAndFlags.qos))
        {
            return fail("FixedHeader::decode",
                        HeaderError(InvalidQoS, (uint8_t)typeAndFlags.qos, ExactlyOne), error);
        }

        const uint32_t maximum = options.maximumRemainingLength < MaxRemainingLength
                                     ? options.maximumRemainingLength
                                     : MaxRemainingLength;
        VBInt remaining;
        const uint32_t lengthSize = remaining.deserialize(buffer + 1, bufferSize - 1);
        if (lengthSize == NotEnoughData)
        {
            return fail("FixedHeader::decode",
                        HeaderError(TruncatedMessage, remaining.size + 1, bufferSize - 1), error);
        }
        if (lengthSize == BadData)
        {
            return fail("FixedHeader::decode",
                        HeaderError(RemainingLengthOutOfRange, remaining.size, maximum), error);
        }
        if ((uint32_t)remaining > maximum)
        {
            return fail("FixedHeader::decode",
                        HeaderError(RemainingLengthOutOfRange, (uint32_t)remaining, maximum), error);
        }

        const uint32_t headerSize = 1 + lengthSize;
        if ((uint32_t)remaining > bufferSize - headerSize)
        {
            return fail("FixedHeader::decode",
                        HeaderError(TruncatedMessage, (uint32_t)remaining, bufferSize - headerSize),
                        error);
        }

        typeAndFlags_.borrow(buffer);
        packetId_.reset();
        remainingLength_ = (uint32_t)remaining;
        source_ = buffer;
        sourceHeaderSize_ = headerSize;
        dirty_ = false;
        return headerSize;
    }

    uint32_t FixedHeader::length() const {
        const uint16_t lengthSize = VBInt::sizeFor(remainingLength_);
        return 1 + (lengthSize ? lengthSize : 4);
    }

    bool FixedHeader::isDirty() const { return dirty_; }

    const char* FixedHeader::name() const {
        return getPacketTypeName(TypeAndFlags(storedTypeAndFlags()).type);
    }

    const char* FixedHeader::description() const {
        return getPacketTypeDescription(TypeAndFlags(storedTypeAndFlags()).type);
    }

    std::string FixedHeader::toString() const {
        const uint8_t bits = flags();
        char binary[9];
        for (int i = 0; i < 8; ++i)
            binary[i] = (bits & (0x80 >> i)) ? '1' : '0';
        binary[8] = '\0';
        return StringUtils::sprintf("Type=\"%s\", Flags=%s, Remaining Length=%u", name(), binary,
                                    (unsigned int)remainingLength_);
    }

    bool FixedHeader::operator==(const FixedHeader& other) const {
        return storedTypeAndFlags() == other.storedTypeAndFlags() &&
               remainingLength_ == other.remainingLength_;
    }

    bool FixedHeader::operator!=(const FixedHeader& other) const { return !(*this == other); }

    uint32_t FixedHeader::getSerializedSize() const { return length(); }

    uint32_t FixedHeader::serialize(uint8_t* buffer) { return encode(buffer, length()); }

    uint32_t FixedHeader::deserialize(const uint8_t* buffer, uint32_t bufferSize) {
        return decode(buffer, bufferSize);
    }

    bool FixedHeader::checkImpl() const {
        const TypeAndFlags typeAndFlags(storedTypeAndFlags());
        const uint8_t type = typeAndFlags.type;
        if (!isValidPacketType(type) || remainingLength_ > MaxRemainingLength)
            return false;
        if (type == PUBLISH)
            return isValidQoS(typeAndFlags.qos);
        return typeAndFlags.flags == getDefaultFlags(type);
    }

    SystemUtils::DiagnosticsSender::UnsubscribeDelegate FixedHeader::SubscribeToDiagnostics(
        SystemUtils::DiagnosticsSender::DiagnosticMessageDelegate delegate, size_t minLevel) {
        return diagnosticSender().SubscribeToDiagnostics(delegate, minLevel);
    }

    uint8_t FixedHeader::storedTypeAndFlags() const {
        const uint8_t* raw = typeAndFlags_.data();
        return raw ? *raw : 0;
    }
}  // namespace MqttHeader
