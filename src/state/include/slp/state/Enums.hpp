// /////////////////////////////////////////////////////////////////////////////
/// @file Enums.hpp
/// @brief Canonical enumerations used by decoded snapshots.
///
/// Enumerator values equal the raw ids the game writes on the wire, so a
/// validated raw id converts with a plain cast. Each enumeration carries
/// a sentinel standing in for unrecognised ids.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/core/Types.hpp>

#include <string_view>

namespace slp::state {

// /////////////////////////////////////////////////////////////////////////////
/// @enum Character
/// @brief Internal (in-engine) character ids.
// /////////////////////////////////////////////////////////////////////////////
enum class Character : core::u8
{
    Mario           = 0x00,
    Fox             = 0x01,
    CaptainFalcon   = 0x02,
    DonkeyKong      = 0x03,
    Kirby           = 0x04,
    Bowser          = 0x05,
    Link            = 0x06,
    Sheik           = 0x07,
    Ness            = 0x08,
    Peach           = 0x09,
    Popo            = 0x0A,
    Nana            = 0x0B,
    Pikachu         = 0x0C,
    Samus           = 0x0D,
    Yoshi           = 0x0E,
    Jigglypuff      = 0x0F,
    Mewtwo          = 0x10,
    Luigi           = 0x11,
    Marth           = 0x12,
    Zelda           = 0x13,
    YoungLink       = 0x14,
    DrMario         = 0x15,
    Falco           = 0x16,
    Pichu           = 0x17,
    GameAndWatch    = 0x18,
    Ganondorf       = 0x19,
    Roy             = 0x1A,
    WireframeMale   = 0x1D,
    WireframeFemale = 0x1E,
    GigaBowser      = 0x1F,
    Sandbag         = 0x20,

    UnknownCharacter = 0xFF
};

// /////////////////////////////////////////////////////////////////////////////
/// @enum Stage
/// @brief Internal stage ids.
// /////////////////////////////////////////////////////////////////////////////
enum class Stage : core::u8
{
    NoStage          = 0x00,
    YoshisStory      = 0x06,
    FountainOfDreams = 0x08,
    PokemonStadium   = 0x12,
    Battlefield      = 0x18,
    FinalDestination = 0x19,
    Dreamland        = 0x1A,
    RandomStage      = 0x1D
};

// /////////////////////////////////////////////////////////////////////////////
/// @enum Action
/// @brief Action-state ids.
///
/// Only the states the decoder reasons about are named; every other id
/// the action table accepts is carried through by value.
// /////////////////////////////////////////////////////////////////////////////
enum class Action : core::u16
{
    DeadDown       = 0x000,
    OnHaloDescent  = 0x00C,
    OnHaloWait     = 0x00D,
    Standing       = 0x00E,
    Turning        = 0x012,
    Dashing        = 0x014,
    Running        = 0x015,
    NeutralAttack1 = 0x02C,
    Nair           = 0x041,
    Fair           = 0x042,
    Bair           = 0x043,
    Uair           = 0x044,
    Dair           = 0x045,
    EdgeCatching   = 0x0FC,
    EdgeHanging    = 0x0FD,

    UnknownAnimation = 0xFFFF
};

// /////////////////////////////////////////////////////////////////////////////
/// @enum ProjectileSubtype
/// @brief Item/projectile kind. Named values are not needed by the
///        decoder; validated ids are carried through by value.
// /////////////////////////////////////////////////////////////////////////////
enum class ProjectileSubtype : core::u16
{
    Unknown = 0xFFFF
};

// /////////////////////////////////////////////////////////////////////////////
/// @enum Button
/// @brief Digital controller buttons, used as bit indices in
///        ControllerState::buttons.
// /////////////////////////////////////////////////////////////////////////////
enum class Button : core::u8
{
    A = 0,
    B,
    X,
    Y,
    Z,
    L,
    R,
    Start,
    DUp,
    DDown,
    DLeft,
    DRight,

    Count
};

// /////////////////////////////////////////////////////////////////////////////
/// @enum MenuScene
/// @brief Top-level scene the game is in.
// /////////////////////////////////////////////////////////////////////////////
enum class MenuScene : core::u8
{
    InGame,
    CharacterSelect,
    StageSelect,
    MainMenu,
    SlippiOnlineCss,
    PressStart,
    Unknown
};

// /////////////////////////////////////////////////////////////////////////////
/// @enum SubMenu
/// @brief Menu sub-state. Raw-coded entries match the byte the game
///        writes; NameEntry and OnlineCss are derived by the online
///        character-select refinement.
// /////////////////////////////////////////////////////////////////////////////
enum class SubMenu : core::u8
{
    MainMenu       = 0x00,
    OnePlayerMode  = 0x01,
    VsMode         = 0x02,
    Trophies       = 0x03,
    Options        = 0x04,
    Data           = 0x05,
    OnlinePlay     = 0x08,

    NameEntry      = 0xFD,
    OnlineCss      = 0xFE,
    UnknownSubmenu = 0xFF
};

// /////////////////////////////////////////////////////////////////////////////
/// @enum ControllerStatus
/// @brief Port occupancy as reported on the character-select screen.
// /////////////////////////////////////////////////////////////////////////////
enum class ControllerStatus : core::u8
{
    Human     = 0x00,
    Cpu       = 0x01,
    Unplugged = 0x03,

    Unknown   = 0xFF
};

[[nodiscard]] std::string_view toString(MenuScene scene) noexcept;
[[nodiscard]] std::string_view toString(Stage stage) noexcept;

} // namespace slp::state
