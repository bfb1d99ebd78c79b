/**
 * @file Records.hpp
 * @brief Typed records produced by the field decoders.
 *
 * Each record is a plain value decoded from one fixed-layout byte slice.
 * Ports are already converted to the 1-based convention and validated.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#pragma once

#ifndef SLP_PROTOCOL_RECORDS_HPP
    #define SLP_PROTOCOL_RECORDS_HPP

#include <slp/state/Snapshot.hpp>
#include <slp/core/Constants.hpp>
#include <slp/core/Types.hpp>

#include <array>
#include <optional>

namespace slp::protocol {

/**
 * @struct PortSetup
 * @brief Per-port data announced once by the session-start record.
 */
struct PortSetup
{
    core::u8 costume{0};
    core::u8 cpuLevel{0};
    bool     isCpu{false};
};

/**
 * @struct SessionStartRecord
 * @brief Protocol version, stage and per-port setup of a new session.
 */
struct SessionStartRecord
{
    core::u8     major{0};
    core::u8     minor{0};
    core::u8     revision{0};
    state::Stage stage{state::Stage::NoStage};
    std::array<PortSetup, core::kPortCount> ports{};

    /// @brief True if the declared version is at least @p major.@p minor.@p revision.
    [[nodiscard]] bool versionAtLeast(core::u8 minMajor, core::u8 minMinor,
                                      core::u8 minRevision) const noexcept
    {
        if (major != minMajor)
            return major > minMajor;
        if (minor != minMinor)
            return minor > minMinor;
        return revision >= minRevision;
    }
};

/**
 * @struct PreFrameRecord
 * @brief Controller input sampled before the engine simulates the frame.
 */
struct PreFrameRecord
{
    core::i32              frame{0};
    core::u8               port{0};
    state::ControllerState controller{};
};

/**
 * @struct PostFrameRecord
 * @brief Character state after the engine simulated the frame.
 *
 * Fields past the stock byte are optional on the wire; each one carries
 * its own default when the record is too short to contain it.
 */
struct PostFrameRecord
{
    core::i32        frame{0};
    core::u8         port{0};
    state::Character character{state::Character::UnknownCharacter};
    state::Action    action{state::Action::UnknownAnimation};
    state::Vec2      position{};
    bool             facingRight{true};
    core::i32        percent{0};
    core::f32        shieldStrength{0.0f};
    core::u8         stock{0};
    core::i32        actionFrame{0};

    bool             hitlag{false};
    core::i32        hitstunFramesLeft{0};
    bool             onGround{true};
    core::u8         jumpsLeft{1};
    bool             invulnerable{false};

    core::f32        speedAirXSelf{0.0f};
    core::f32        speedYSelf{0.0f};
    core::f32        speedXAttack{0.0f};
    core::f32        speedYAttack{0.0f};
    core::f32        speedGroundXSelf{0.0f};

    state::Vec2      ecbTop{};
    state::Vec2      ecbBottom{};
    state::Vec2      ecbLeft{};
    state::Vec2      ecbRight{};

    /// @brief Copies every decoded field onto @p player.
    void applyTo(state::PlayerState& player) const noexcept
    {
        player.character         = character;
        player.action            = action;
        player.position          = position;
        player.facingRight       = facingRight;
        player.percent           = percent;
        player.shieldStrength    = shieldStrength;
        player.stock             = stock;
        player.actionFrame       = actionFrame;
        player.hitlag            = hitlag;
        player.hitstunFramesLeft = hitstunFramesLeft;
        player.onGround          = onGround;
        player.jumpsLeft         = jumpsLeft;
        player.invulnerable      = invulnerable;
        player.speedAirXSelf     = speedAirXSelf;
        player.speedYSelf        = speedYSelf;
        player.speedXAttack      = speedXAttack;
        player.speedYAttack      = speedYAttack;
        player.speedGroundXSelf  = speedGroundXSelf;
        player.ecbTop            = ecbTop;
        player.ecbBottom         = ecbBottom;
        player.ecbLeft           = ecbLeft;
        player.ecbRight          = ecbRight;
    }
};

/**
 * @struct BookendRecord
 * @brief Terminal marker of a frame's record group.
 */
struct BookendRecord
{
    std::optional<core::i32> frame{};
};

} // namespace slp::protocol

#endif // SLP_PROTOCOL_RECORDS_HPP
