// /////////////////////////////////////////////////////////////////////////////
/// @file RecordDecoder.cpp
/// @brief RecordDecoder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/protocol/RecordDecoder.hpp>
#include <slp/protocol/ByteReader.hpp>
#include <slp/protocol/EventType.hpp>

#include <array>
#include <format>
#include <utility>

namespace slp::protocol {

namespace {

constexpr core::u8 kHitlagBit = 0x20;
constexpr core::u8 kCpuPlayerType = 1;

constexpr std::array<std::pair<core::u16, state::Button>, 12> kButtonMasks{{
    {0x0100, state::Button::A},
    {0x0200, state::Button::B},
    {0x0400, state::Button::X},
    {0x0800, state::Button::Y},
    {0x1000, state::Button::Start},
    {0x0010, state::Button::Z},
    {0x0020, state::Button::R},
    {0x0040, state::Button::L},
    {0x0001, state::Button::DLeft},
    {0x0002, state::Button::DRight},
    {0x0004, state::Button::DDown},
    {0x0008, state::Button::DUp},
}};

[[nodiscard]] core::Expected<core::u8> readPort(const ByteReader& reader)
{
    const auto raw  = SLP_TRY(reader.readU8(offset::kPort));
    const auto port = static_cast<core::i32>(raw) + 1;
    if (!state::isValidPort(port))
    {
        return core::makeError(core::ErrorCode::OutOfRange,
                               std::format("port byte {} outside 0..3", raw));
    }
    return static_cast<core::u8>(port);
}

[[nodiscard]] state::Vec2 readVec2Or(const ByteReader& reader, core::usize x, core::usize y) noexcept
{
    return {reader.readF32Or(x, 0.0f), reader.readF32Or(y, 0.0f)};
}

} // anonymous namespace

RecordDecoder::RecordDecoder(const tables::StaticTables& tables) noexcept
    : tables_{tables}
{}

core::Expected<SessionStartRecord> RecordDecoder::decodeSessionStart(
    std::span<const core::byte> record) const
{
    const ByteReader reader{record};

    SessionStartRecord out;
    out.major    = SLP_TRY(reader.readU8(offset::kVersionMajor));
    out.minor    = SLP_TRY(reader.readU8(offset::kVersionMinor));
    out.revision = SLP_TRY(reader.readU8(offset::kVersionRevision));

    if (reader.has(offset::kStartStage, 2))
        out.stage = tables_.stageFromExternal(reader.readU16Or(offset::kStartStage, 0));

    for (core::usize i = 0; i < out.ports.size(); ++i)
    {
        const core::usize block = offset::kPlayerBlockSize * i;
        auto& port = out.ports[i];

        port.isCpu    = reader.readU8Or(offset::kPlayerType + block, 0) == kCpuPlayerType;
        port.costume  = reader.readU8Or(offset::kCostume + block, 0);
        port.cpuLevel = port.isCpu ? reader.readU8Or(offset::kCpuLevel + block, 0) : 0;
    }
    return out;
}

core::Expected<PreFrameRecord> RecordDecoder::decodePreFrame(std::span<const core::byte> record) const
{
    const ByteReader reader{record};

    PreFrameRecord out;
    out.frame = SLP_TRY(reader.readI32(offset::kFrame));
    out.port  = SLP_TRY(readPort(reader));

    auto& pad = out.controller;
    pad.mainStick.x = normalizeAxis(SLP_TRY(reader.readF32(offset::kMainStickX)));
    pad.mainStick.y = normalizeAxis(SLP_TRY(reader.readF32(offset::kMainStickY)));
    pad.cStick.x    = normalizeAxis(SLP_TRY(reader.readF32(offset::kCStickX)));
    pad.cStick.y    = normalizeAxis(SLP_TRY(reader.readF32(offset::kCStickY)));

    const auto bits = SLP_TRY(reader.readU16(offset::kButtons));
    for (const auto& [mask, button] : kButtonMasks)
        pad.set(button, (bits & mask) != 0);

    pad.lShoulder = reader.readF32Or(offset::kPhysicalL, 0.0f);
    pad.rShoulder = reader.readF32Or(offset::kPhysicalR, 0.0f);
    return out;
}

core::Expected<PostFrameRecord> RecordDecoder::decodePostFrame(std::span<const core::byte> record) const
{
    const ByteReader reader{record};

    PostFrameRecord out;
    out.frame          = SLP_TRY(reader.readI32(offset::kFrame));
    out.port           = SLP_TRY(readPort(reader));
    out.character      = tables_.character(SLP_TRY(reader.readU8(offset::kCharacter)));
    out.action         = tables_.action(SLP_TRY(reader.readU16(offset::kAction)));
    out.position.x     = SLP_TRY(reader.readF32(offset::kPositionX));
    out.position.y     = SLP_TRY(reader.readF32(offset::kPositionY));
    out.facingRight    = SLP_TRY(reader.readF32(offset::kFacing)) > 0.0f;
    out.percent        = truncateToInt(SLP_TRY(reader.readF32(offset::kPercent)));
    out.shieldStrength = SLP_TRY(reader.readF32(offset::kShield));
    out.stock          = SLP_TRY(reader.readU8(offset::kStock));
    out.actionFrame    = truncateToInt(SLP_TRY(reader.readF32(offset::kActionFrame)));

    out.hitlag            = (reader.readU8Or(offset::kStateFlags2, 0) & kHitlagBit) != 0;
    out.hitstunFramesLeft = truncateToInt(reader.readF32Or(offset::kHitstun, 0.0f));
    out.onGround          = reader.has(offset::kAirborne, 1)
                          ? reader.readU8Or(offset::kAirborne, 0) == 0
                          : true;
    out.jumpsLeft         = reader.readU8Or(offset::kJumpsLeft, 1);
    out.invulnerable      = reader.readU8Or(offset::kHurtboxState, 0) != 0;

    out.speedAirXSelf    = reader.readF32Or(offset::kSpeedAirXSelf, 0.0f);
    out.speedYSelf       = reader.readF32Or(offset::kSpeedYSelf, 0.0f);
    out.speedXAttack     = reader.readF32Or(offset::kSpeedXAttack, 0.0f);
    out.speedYAttack     = reader.readF32Or(offset::kSpeedYAttack, 0.0f);
    out.speedGroundXSelf = reader.readF32Or(offset::kSpeedGroundXSelf, 0.0f);

    out.ecbTop    = readVec2Or(reader, offset::kEcbTopX, offset::kEcbTopY);
    out.ecbBottom = readVec2Or(reader, offset::kEcbBottomX, offset::kEcbBottomY);
    out.ecbLeft   = readVec2Or(reader, offset::kEcbLeftX, offset::kEcbLeftY);
    out.ecbRight  = readVec2Or(reader, offset::kEcbRightX, offset::kEcbRightY);
    return out;
}

BookendRecord RecordDecoder::decodeBookend(std::span<const core::byte> record) const noexcept
{
    const ByteReader reader{record};

    BookendRecord out;
    if (reader.has(offset::kFrame, 4))
        out.frame = reader.readI32Or(offset::kFrame, core::kFrameNotStarted);
    return out;
}

core::Expected<state::Projectile> RecordDecoder::decodeItemUpdate(std::span<const core::byte> record) const
{
    const ByteReader reader{record};

    state::Projectile out;
    out.subtype    = tables_.projectileSubtype(SLP_TRY(reader.readU16(offset::kItemSubtype)));
    out.speed.x    = SLP_TRY(reader.readF32(offset::kItemSpeedX));
    out.speed.y    = SLP_TRY(reader.readF32(offset::kItemSpeedY));
    out.position.x = SLP_TRY(reader.readF32(offset::kItemX));
    out.position.y = SLP_TRY(reader.readF32(offset::kItemY));

    out.owner = -1;
    if (reader.has(offset::kItemOwner, 1))
    {
        const auto owner = static_cast<core::i32>(reader.readU8Or(offset::kItemOwner, 0)) + 1;
        if (state::isValidPort(owner))
            out.owner = static_cast<core::i8>(owner);
    }
    return out;
}

std::optional<core::i32> RecordDecoder::peekFrame(std::span<const core::byte> record) noexcept
{
    const ByteReader reader{record};
    if (!reader.has(offset::kFrame, 4))
        return std::nullopt;
    return reader.readI32Or(offset::kFrame, core::kFrameNotStarted);
}

} // namespace slp::protocol
