/**
 * @file Snapshot.hpp
 * @brief Decoded per-frame game state: players, projectiles, menu fields.
 *
 * A Snapshot is assembled from many records, possibly across several
 * transport deliveries, and is handed to the caller once its frame
 * completes. Players are keyed by controller port (1..4) and iterate in
 * ascending port order.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#pragma once

#ifndef SLP_STATE_SNAPSHOT_HPP
    #define SLP_STATE_SNAPSHOT_HPP

#include <slp/state/Enums.hpp>
#include <slp/core/Constants.hpp>
#include <slp/core/Types.hpp>

#include <bitset>
#include <map>
#include <vector>

namespace slp::state {

/**
 * @struct Vec2
 * @brief Plain 2D coordinate pair.
 */
struct Vec2
{
    core::f32 x{0.0f};
    core::f32 y{0.0f};

    [[nodiscard]] bool operator==(const Vec2&) const = default;
};

/**
 * @struct ControllerState
 * @brief Controller input for one port on one frame.
 *
 * Analog sticks are normalised to [0, 1] on both axes, 0.5 being neutral.
 */
struct ControllerState
{
    std::bitset<static_cast<core::usize>(Button::Count)> buttons{};
    Vec2      mainStick{0.5f, 0.5f};
    Vec2      cStick{0.5f, 0.5f};
    core::f32 lShoulder{0.0f};
    core::f32 rShoulder{0.0f};

    [[nodiscard]] bool pressed(Button b) const noexcept
    {
        return buttons.test(static_cast<core::usize>(b));
    }

    void set(Button b, bool value) noexcept
    {
        buttons.set(static_cast<core::usize>(b), value);
    }
};

/**
 * @struct PlayerState
 * @brief Everything known about one port on one frame.
 */
struct PlayerState
{
    // Gameplay
    Vec2       position{};
    bool       facingRight{true};
    Character  character{Character::UnknownCharacter};
    Action     action{Action::UnknownAnimation};
    core::i32  actionFrame{0};
    core::i32  percent{0};
    core::u8   stock{0};
    core::f32  shieldStrength{60.0f};

    Vec2       ecbTop{};
    Vec2       ecbBottom{};
    Vec2       ecbLeft{};
    Vec2       ecbRight{};

    core::f32  speedAirXSelf{0.0f};
    core::f32  speedYSelf{0.0f};
    core::f32  speedXAttack{0.0f};
    core::f32  speedYAttack{0.0f};
    core::f32  speedGroundXSelf{0.0f};

    bool       onGround{true};
    bool       invulnerable{false};
    bool       hitlag{false};
    bool       moonwalkWarning{false};
    bool       offStage{false};
    bool       interruptible{false};

    core::i32  invulnerabilityLeft{0};
    core::i32  hitstunFramesLeft{0};
    core::u8   jumpsLeft{1};
    core::u8   costume{0};
    core::u8   cpuLevel{0};

    ControllerState controller{};

    // Menus
    Vec2             cursor{};
    Character        characterSelected{Character::UnknownCharacter};
    bool             coinDown{false};
    ControllerStatus controllerStatus{ControllerStatus::Unplugged};
    bool             holdingCpuSlider{false};
};

/**
 * @struct Projectile
 * @brief An item or projectile alive on the frame.
 */
struct Projectile
{
    Vec2              position{};
    Vec2              speed{};
    core::i8          owner{-1};
    ProjectileSubtype subtype{ProjectileSubtype::Unknown};
};

/**
 * @struct Snapshot
 * @brief Fully populated state for one frame.
 */
struct Snapshot
{
    core::i32               frame{core::kFrameNotStarted};
    MenuScene               menuScene{MenuScene::Unknown};
    Stage                   stage{Stage::NoStage};
    std::map<core::u8, PlayerState> players;
    std::vector<Projectile> projectiles;
    core::f32               distance{0.0f};

    // Menus
    SubMenu   submenu{SubMenu::UnknownSubmenu};
    core::u8  menuSelection{0};
    Vec2      stageSelectCursor{};
    bool      readyToStart{false};

    /// @brief Returns the player on @p port, creating it on first use.
    /// @pre @p port is in [1, 4].
    PlayerState& player(core::u8 port);

    /// @brief Returns the player on @p port, or nullptr if absent.
    [[nodiscard]] const PlayerState* findPlayer(core::u8 port) const noexcept;

    /// @brief Euclidean distance between the two lowest-numbered ports.
    ///
    /// A missing second (or first) player counts as standing at the
    /// origin.
    [[nodiscard]] core::f32 computeDistance() const noexcept;
};

/// @brief True when @p port is a valid controller port (1..4).
[[nodiscard]] constexpr bool isValidPort(core::i32 port) noexcept
{
    return port >= core::kMinPort && port <= core::kMaxPort;
}

} // namespace slp::state

#endif // SLP_STATE_SNAPSHOT_HPP
