/**
 * @file RecordBuilder.hpp
 * @brief Test helper writing big-endian record bytes at fixed offsets.
 */

#pragma once

#include <slp/protocol/EventType.hpp>
#include <slp/core/Types.hpp>

#include <bit>
#include <initializer_list>
#include <utility>
#include <vector>

namespace slp::test {

using Bytes = std::vector<core::byte>;

// Record lengths (command byte included) declared by standardDescriptor().
inline constexpr core::usize kSessionStartLength = 0x1A0;
inline constexpr core::usize kPreFrameLength     = 0x40;
inline constexpr core::usize kPostFrameLength    = 0x69;
inline constexpr core::usize kSessionEndLength   = 0x03;
inline constexpr core::usize kFrameStartLength   = 0x09;
inline constexpr core::usize kItemLength         = 0x2C;
inline constexpr core::usize kBookendLength      = 0x09;
inline constexpr core::usize kCodeListLength     = 0x05;
inline constexpr core::usize kMenuLength         = 0x41;

class RecordBuilder {
public:
    RecordBuilder(protocol::EventType type, core::usize length)
        : _bytes(length, core::byte{0})
    {
        _bytes[0] = static_cast<core::byte>(type);
    }

    RecordBuilder &writeU8(core::usize offset, core::u8 value)
    {
        return store(offset, value, 1);
    }

    RecordBuilder &writeU16(core::usize offset, core::u16 value)
    {
        return store(offset, value, 2);
    }

    RecordBuilder &writeI32(core::usize offset, core::i32 value)
    {
        return store(offset, std::bit_cast<core::u32>(value), 4);
    }

    RecordBuilder &writeF32(core::usize offset, core::f32 value)
    {
        return store(offset, std::bit_cast<core::u32>(value), 4);
    }

    /// Drops every byte from @p length on, simulating an older layout.
    RecordBuilder &truncate(core::usize length)
    {
        _bytes.resize(length);
        return *this;
    }

    [[nodiscard]] Bytes bytes() const { return _bytes; }

private:
    RecordBuilder &store(core::usize offset, core::u32 value, core::usize width)
    {
        for (core::usize i = 0; i < width; ++i)
        {
            const auto shift = 8 * (width - 1 - i);
            _bytes.at(offset + i) = static_cast<core::byte>((value >> shift) & 0xFF);
        }
        return *this;
    }

    Bytes _bytes;
};

/// Payload descriptor declaring @p entries as (command, total length).
inline Bytes payloadDescriptor(
    std::initializer_list<std::pair<protocol::EventType, core::usize>> entries)
{
    const auto payload = static_cast<core::u8>(1 + 3 * entries.size());
    Bytes out{static_cast<core::byte>(protocol::EventType::PayloadDescriptor),
              static_cast<core::byte>(payload)};
    for (const auto &[type, length] : entries)
    {
        const auto declared = static_cast<core::u16>(length - 1);
        out.push_back(static_cast<core::byte>(type));
        out.push_back(static_cast<core::byte>(declared >> 8));
        out.push_back(static_cast<core::byte>(declared & 0xFF));
    }
    return out;
}

inline Bytes standardDescriptor()
{
    using protocol::EventType;
    return payloadDescriptor({
        {EventType::SessionStart,    kSessionStartLength},
        {EventType::PreFrameUpdate,  kPreFrameLength},
        {EventType::PostFrameUpdate, kPostFrameLength},
        {EventType::SessionEnd,      kSessionEndLength},
        {EventType::FrameStart,      kFrameStartLength},
        {EventType::ItemUpdate,      kItemLength},
        {EventType::FrameBookend,    kBookendLength},
        {EventType::CodeList,        kCodeListLength},
        {EventType::MenuFrame,       kMenuLength},
    });
}

inline Bytes sessionStart(core::u8 major, core::u8 minor, core::u8 revision, core::u16 stage = 0x1F)
{
    namespace off = protocol::offset;
    return RecordBuilder(protocol::EventType::SessionStart, kSessionStartLength)
        .writeU8(off::kVersionMajor, major)
        .writeU8(off::kVersionMinor, minor)
        .writeU8(off::kVersionRevision, revision)
        .writeU16(off::kStartStage, stage)
        .bytes();
}

/// Pre-frame update for zero-based @p portIndex with neutral sticks.
inline Bytes preFrame(core::i32 frame, core::u8 portIndex, core::u16 buttons = 0)
{
    namespace off = protocol::offset;
    return RecordBuilder(protocol::EventType::PreFrameUpdate, kPreFrameLength)
        .writeI32(off::kFrame, frame)
        .writeU8(off::kPort, portIndex)
        .writeU16(off::kButtons, buttons)
        .bytes();
}

/// Post-frame update builder for zero-based @p portIndex; callers add fields.
inline RecordBuilder postFrame(core::i32 frame, core::u8 portIndex,
                               core::u16 action = 0x0E, core::f32 x = 0.0f, core::f32 y = 0.0f)
{
    namespace off = protocol::offset;
    RecordBuilder builder(protocol::EventType::PostFrameUpdate, kPostFrameLength);
    builder.writeI32(off::kFrame, frame)
        .writeU8(off::kPort, portIndex)
        .writeU8(off::kCharacter, 0x01)
        .writeU16(off::kAction, action)
        .writeF32(off::kPositionX, x)
        .writeF32(off::kPositionY, y)
        .writeF32(off::kFacing, 1.0f)
        .writeU8(off::kStock, 4);
    return builder;
}

inline Bytes bookend(core::i32 frame)
{
    return RecordBuilder(protocol::EventType::FrameBookend, kBookendLength)
        .writeI32(protocol::offset::kFrame, frame)
        .bytes();
}

inline Bytes sessionEnd()
{
    return RecordBuilder(protocol::EventType::SessionEnd, kSessionEndLength).bytes();
}

inline Bytes item(core::u16 subtype, core::u8 ownerByte)
{
    namespace off = protocol::offset;
    return RecordBuilder(protocol::EventType::ItemUpdate, kItemLength)
        .writeU16(off::kItemSubtype, subtype)
        .writeF32(off::kItemX, 10.0f)
        .writeF32(off::kItemY, 20.0f)
        .writeU8(off::kItemOwner, ownerByte)
        .bytes();
}

/// Concatenates record byte vectors into one delivery.
inline Bytes concat(std::initializer_list<Bytes> parts)
{
    Bytes out;
    for (const auto &part : parts)
        out.insert(out.end(), part.begin(), part.end());
    return out;
}

} // namespace slp::test
