#ifndef MQTTHEADER_TYPES_HPP
#define MQTTHEADER_TYPES_HPP
/**
 * @file MqttHeaderTypes.hpp
 * @brief This file contains de definition of the wire types used for
 *        encoding and decoding the MQTT fixed header.
 * @author Hatem Nabli
 * copyright © 2025 by Hatem Nabli
 */

#pragma once

#include <stdint.h>
#include <string.h>
#include <array>
#include "MqttHeaderConstants.hpp"
#include "MqttHeaderISerializable.hpp"

namespace MqttHeader
{
    namespace Common
    {
        /** This is the standard error code while reading an invalid value from source */
        enum LocalError : uint32_t
        {
            BadData = 0xFFFFFFFF,        //!< Malformed data
            NotEnoughData = 0xFFFFFFFE,  //!< Not enough data
            Shortcut = 0xFFFFFFFD,       //!< Serialization shortcut used (not necessarly an error)

            MinErrorCode = 0xFFFFFFFD,
        };

        /**
         * @brief A cross-platform bitfield class that should be used in union like this:
         *
         * @code
         *           union
         *           {
         *               T whatever;
         *               BitField<T, 0, 1> firstBit;
         *               BitField<T, 7, 1> lastBit;
         *               BitField<T, 2, 2> someBits;
         *           };
         */
        template <typename T, int Offset, int Bits>
        struct BitField
        {
            T value;

            static_assert(Offset + Bits <= (int)sizeof(T) * 8,
                          "Member exceeds bitfield boundaries");
            static_assert(Bits < (int)sizeof(T) * 8, "Can't fill entire bitfield with one member");

            static constexpr T Maximum = (T(1) << Bits) - 1;
            static constexpr T Mask = Maximum << Offset;

            inline operator T() const { return (value >> Offset) & Maximum; }
            inline BitField& operator=(T v) {
                value = (value & ~Mask) | ((v & Maximum) << Offset);
                return *this;
            }
        };

        /**
         * @brief Variable byte integer: 7 value bits per byte, least significant group first,
         * high bit set on every byte but the last. At most 4 bytes.
         */
        struct VBInt : public ISerializable
        {
            enum
            {
                MaxSizeOn1Byte = 0x7F,         //!< Maximum size of a varint on one byte
                MaxSizeOn2Bytes = 0x3FFF,      //!< Maximum size of a varint on two bytes
                MaxSizeOn3Bytes = 0x1FFFFF,    //!< Maximum size of a varint on three bytes
                MaxSizeOn4Bytes = 0x0FFFFFFF,  //!< Maximum size of a varint on four bytes
            };

            std::array<uint8_t, 4> raw;  //!< The raw data of the varint
            uint32_t value;              //!< The value of the varint
            uint16_t size;               //!< The size of the varint in bytes

            /**
             * @brief Get the number of bytes needed to encode the given value.
             * @return 1 to 4, or 0 if the value can't be encoded.
             */
            static uint16_t sizeFor(uint32_t value) {
                if (value <= MaxSizeOn1Byte)
                    return 1;
                if (value <= MaxSizeOn2Bytes)
                    return 2;
                if (value <= MaxSizeOn3Bytes)
                    return 3;
                if (value <= MaxSizeOn4Bytes)
                    return 4;
                return 0;
            }

            VBInt& operator=(const VBInt& other) {
                raw = other.raw;
                value = other.value;
                size = other.size;
                return *this;
            }

            /**
             * * @brief Converts a uint32_t to a varint.
             * * @param other The uint32_t to convert.
             * * @note size is 0 when the value exceeds MaxSizeOn4Bytes.
             */
            VBInt& operator=(uint32_t other) {
                value = other;
                size = 0;

                if (other > MaxSizeOn4Bytes)
                    return *this;

                do
                {
                    uint8_t byte = other & 0x7F;
                    other >>= 7;
                    if (other > 0)
                        byte |= 0x80;  // continuation bit
                    raw[size++] = byte;
                } while (other > 0);

                return *this;
            }

            /**
             * @brief Converts the varint to a uint32_t.
             * @return The varint as a uint32_t, 0 if the varint holds no valid encoding.
             */
            operator uint32_t() const {
                if (size == 0 || size > 4)
                    return 0;
                return value;
            }

            bool operator==(const VBInt& other) const {
                return size == other.size && (uint32_t)*this == (uint32_t)other;
            }

            bool checkImpl() const override {
                return size > 0 && size < 5 && (raw[size - 1] & 0x80) == 0;
            }

            uint32_t getSerializedSize() const override { return size; }

            uint32_t serialize(uint8_t* buffer) override {
                if (!buffer || size == 0)
                    return BadData;
                memcpy(buffer, raw.data(), size);
                return size;
            }  //!< Serialize the varint into the buffer

            /**
             * @brief Read a varint from the buffer.
             * @return The number of bytes consumed, NotEnoughData if the buffer ends before the
             * last byte, BadData if a fifth byte would be needed or the encoding is not minimal.
             */
            uint32_t deserialize(const uint8_t* buffer, uint32_t bufferSize) override {
                value = 0;
                uint32_t shift = 0;
                for (size = 0;;)
                {
                    if ((uint32_t)(size + 1) > bufferSize)
                        return NotEnoughData;
                    raw[size] = buffer[size];
                    value |= (uint32_t)(raw[size] & 0x7F) << shift;
                    if (raw[size++] < 0x80)
                        break;  // Last byte has no continuation bit
                    if (size == 4)
                        return BadData;
                    shift += 7;
                }
                // A trailing zero group means the value fits in fewer bytes
                if (size > 1 && raw[size - 1] == 0)
                    return BadData;
                return size;
            }

            /** Default  */
            VBInt(uint32_t value = 0) : raw{}, value(0), size(0) { this->operator=(value); }
            /** This is the copy constructor  */
            VBInt(const VBInt& other) : raw(other.raw), value(other.value), size(other.size) {}
        };

        /**
         * @brief Storage for N bytes of a header field, either borrowed from a buffer the
         * caller owns or owned inline.
         *
         * A borrowed store is read-only: writing goes through makeOwned() first, which copies
         * the borrowed bytes.
         */
        template <size_t N>
        struct ByteStore
        {
            enum class Kind : uint8_t
            {
                Empty,
                Borrowed,
                Owned,
            };

            Kind kind;
            const uint8_t* borrowed;
            std::array<uint8_t, N> owned;

            bool isEmpty() const { return kind == Kind::Empty; }
            bool isBorrowed() const { return kind == Kind::Borrowed; }
            bool isOwned() const { return kind == Kind::Owned; }

            const uint8_t* data() const {
                switch (kind)
                {
                case Kind::Borrowed:
                    return borrowed;
                case Kind::Owned:
                    return owned.data();
                default:
                    return nullptr;
                }
            }

            void borrow(const uint8_t* source) {
                borrowed = source;
                kind = Kind::Borrowed;
            }

            /**
             * @brief Make sure the bytes are owned, copying borrowed bytes or zero filling.
             * @return true if fresh storage had to be taken, false if it was already owned.
             */
            bool makeOwned() {
                if (kind == Kind::Owned)
                    return false;
                if (kind == Kind::Borrowed)
                    memcpy(owned.data(), borrowed, N);
                else
                    owned.fill(0);
                borrowed = nullptr;
                kind = Kind::Owned;
                return true;
            }

            /** Only valid once makeOwned() was called */
            uint8_t* mutableData() { return owned.data(); }

            void reset() {
                borrowed = nullptr;
                owned.fill(0);
                kind = Kind::Empty;
            }

            ByteStore() : kind(Kind::Empty), borrowed(nullptr), owned{} {}
        };

        /**
         * @brief View of the type and flags byte of a fixed header.
         */
        union TypeAndFlags {
            uint8_t raw;
            BitField<uint8_t, 4, 4> type;        //!< The control packet type
            BitField<uint8_t, 0, 4> flags;       //!< The whole flags nibble
            BitField<uint8_t, 3, 1> duplicated;  //!< PUBLISH DUP flag
            BitField<uint8_t, 1, 2> qos;         //!< PUBLISH QoS level
            BitField<uint8_t, 0, 1> retain;      //!< PUBLISH RETAIN flag

            TypeAndFlags(uint8_t value = 0) : raw(value) {}
        };
    }  // namespace Common
}  // namespace MqttHeader
#endif /* MQTTHEADER_TYPES_HPP */
