/**
 * @file EventType.hpp
 * @brief Command codes of the game event stream and the fixed record
 *        offsets the decoders read.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#pragma once

#ifndef SLP_PROTOCOL_EVENT_TYPE_HPP
    #define SLP_PROTOCOL_EVENT_TYPE_HPP

#include <slp/core/Types.hpp>

#include <string_view>

namespace slp::protocol {

/**
 * @enum EventType
 * @brief One-byte command code leading every record.
 */
enum class EventType : core::u8
{
    PayloadDescriptor = 0x35,
    SessionStart      = 0x36,
    PreFrameUpdate    = 0x37,
    PostFrameUpdate   = 0x38,
    SessionEnd        = 0x39,
    FrameStart        = 0x3A,
    ItemUpdate        = 0x3B,
    FrameBookend      = 0x3C,
    CodeList          = 0x3D,
    MenuFrame         = 0x3E
};

[[nodiscard]] constexpr std::string_view toString(EventType type) noexcept
{
    switch (type)
    {
    case EventType::PayloadDescriptor: return "PayloadDescriptor";
    case EventType::SessionStart:      return "SessionStart";
    case EventType::PreFrameUpdate:    return "PreFrameUpdate";
    case EventType::PostFrameUpdate:   return "PostFrameUpdate";
    case EventType::SessionEnd:        return "SessionEnd";
    case EventType::FrameStart:        return "FrameStart";
    case EventType::ItemUpdate:        return "ItemUpdate";
    case EventType::FrameBookend:      return "FrameBookend";
    case EventType::CodeList:          return "CodeList";
    case EventType::MenuFrame:         return "MenuFrame";
    }
    return "Unknown";
}

/**
 * @brief Byte offsets inside each record, command byte at offset 0.
 */
namespace offset {

// Session start
inline constexpr core::usize kVersionMajor     = 0x01;
inline constexpr core::usize kVersionMinor     = 0x02;
inline constexpr core::usize kVersionRevision  = 0x03;
inline constexpr core::usize kStartStage       = 0x13;
inline constexpr core::usize kPlayerType       = 0x66;
inline constexpr core::usize kCostume          = 0x68;
inline constexpr core::usize kCpuLevel         = 0x74;
inline constexpr core::usize kPlayerBlockSize  = 0x24;

// Pre-frame / post-frame common header
inline constexpr core::usize kFrame            = 0x01;
inline constexpr core::usize kPort             = 0x05;

// Pre-frame
inline constexpr core::usize kMainStickX       = 0x19;
inline constexpr core::usize kMainStickY       = 0x1D;
inline constexpr core::usize kCStickX          = 0x21;
inline constexpr core::usize kCStickY          = 0x25;
inline constexpr core::usize kButtons          = 0x31;
inline constexpr core::usize kPhysicalL        = 0x33;
inline constexpr core::usize kPhysicalR        = 0x37;

// Post-frame
inline constexpr core::usize kCharacter        = 0x07;
inline constexpr core::usize kAction           = 0x08;
inline constexpr core::usize kPositionX        = 0x0A;
inline constexpr core::usize kPositionY        = 0x0E;
inline constexpr core::usize kFacing           = 0x12;
inline constexpr core::usize kPercent          = 0x16;
inline constexpr core::usize kShield           = 0x1A;
inline constexpr core::usize kStock            = 0x21;
inline constexpr core::usize kActionFrame      = 0x22;
inline constexpr core::usize kStateFlags2      = 0x27;
inline constexpr core::usize kHitstun          = 0x2B;
inline constexpr core::usize kAirborne         = 0x2F;
inline constexpr core::usize kJumpsLeft        = 0x32;
inline constexpr core::usize kHurtboxState     = 0x34;
inline constexpr core::usize kSpeedAirXSelf    = 0x35;
inline constexpr core::usize kSpeedYSelf       = 0x39;
inline constexpr core::usize kSpeedXAttack     = 0x3D;
inline constexpr core::usize kSpeedYAttack     = 0x41;
inline constexpr core::usize kSpeedGroundXSelf = 0x45;
inline constexpr core::usize kEcbTopX          = 0x49;
inline constexpr core::usize kEcbTopY          = 0x4D;
inline constexpr core::usize kEcbBottomX       = 0x51;
inline constexpr core::usize kEcbBottomY       = 0x55;
inline constexpr core::usize kEcbLeftX         = 0x59;
inline constexpr core::usize kEcbLeftY         = 0x5D;
inline constexpr core::usize kEcbRightX        = 0x61;
inline constexpr core::usize kEcbRightY        = 0x65;

// Item update
inline constexpr core::usize kItemSubtype      = 0x05;
inline constexpr core::usize kItemSpeedX       = 0x0C;
inline constexpr core::usize kItemSpeedY       = 0x10;
inline constexpr core::usize kItemX            = 0x14;
inline constexpr core::usize kItemY            = 0x18;
inline constexpr core::usize kItemOwner        = 0x2A;

// Menu frame
inline constexpr core::usize kScene            = 0x01;
inline constexpr core::usize kCursorX          = 0x03;
inline constexpr core::usize kCursorY          = 0x07;
inline constexpr core::usize kCursorStride     = 0x08;
inline constexpr core::usize kReadyToStart     = 0x23;
inline constexpr core::usize kSelectedStage    = 0x24;
inline constexpr core::usize kPortStatus       = 0x25;
inline constexpr core::usize kCharSelected     = 0x29;
inline constexpr core::usize kCoinState        = 0x2D;
inline constexpr core::usize kStageCursorX     = 0x31;
inline constexpr core::usize kStageCursorY     = 0x35;
inline constexpr core::usize kMenuFrame        = 0x39;
inline constexpr core::usize kSubmenu          = 0x3D;
inline constexpr core::usize kMenuSelection    = 0x3E;
inline constexpr core::usize kOnlineCostume    = 0x3F;
inline constexpr core::usize kNametagState     = 0x40;

} // namespace offset

} // namespace slp::protocol

#endif // SLP_PROTOCOL_EVENT_TYPE_HPP
