// /////////////////////////////////////////////////////////////////////////////
/// @file MenuDecoder.cpp
/// @brief MenuDecoder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/protocol/MenuDecoder.hpp>
#include <slp/protocol/ByteReader.hpp>
#include <slp/protocol/EventType.hpp>

#include <algorithm>

namespace slp::protocol {

namespace {

constexpr core::u8  kCoinDown          = 2;
constexpr core::u8  kNametagEntry      = 0x05;
constexpr core::u8  kNametagIdle       = 0x00;

// CPU slider geometry: the slider for port i starts at
// kSliderOrigin + kSliderStride * i and every kSliderStep units is one level.
constexpr core::f32 kSliderOrigin      = -30.9f;
constexpr core::f32 kSliderStride      = 15.4f;
constexpr core::f32 kSliderStep        = 1.2f;
constexpr core::i32 kMaxCpuLevel       = 9;

[[nodiscard]] state::ControllerStatus controllerStatus(core::u8 raw) noexcept
{
    switch (raw)
    {
    case 0x00: return state::ControllerStatus::Human;
    case 0x01: return state::ControllerStatus::Cpu;
    case 0x03: return state::ControllerStatus::Unplugged;
    default:   return state::ControllerStatus::Unknown;
    }
}

[[nodiscard]] bool isCharacterSelect(state::MenuScene scene) noexcept
{
    return scene == state::MenuScene::CharacterSelect
        || scene == state::MenuScene::SlippiOnlineCss;
}

} // anonymous namespace

MenuDecoder::MenuDecoder(const tables::StaticTables& tables) noexcept
    : tables_{tables}
{}

state::MenuScene MenuDecoder::sceneFromRaw(core::u16 raw) noexcept
{
    switch (raw)
    {
    case 0x0002: return state::MenuScene::CharacterSelect;
    case 0x0102:
    case 0x0108: return state::MenuScene::StageSelect;
    case 0x0202: return state::MenuScene::InGame;
    case 0x0001: return state::MenuScene::MainMenu;
    case 0x0008: return state::MenuScene::SlippiOnlineCss;
    case 0x0000: return state::MenuScene::PressStart;
    default:     return state::MenuScene::Unknown;
    }
}

core::Expected<void> MenuDecoder::decode(std::span<const core::byte> record,
                                         state::Snapshot& snapshot) const
{
    const ByteReader reader{record};

    const auto scene   = SLP_TRY(reader.readU16(offset::kScene));
    snapshot.menuScene = sceneFromRaw(scene);

    if (isCharacterSelect(snapshot.menuScene))
    {
        snapshot.readyToStart = reader.readU8Or(offset::kReadyToStart, 0) != 0;

        for (core::u8 i = 0; i < core::kPortCount; ++i)
        {
            auto& player = snapshot.player(static_cast<core::u8>(i + 1));
            const core::usize cursor = offset::kCursorStride * i;

            player.cursor.x = reader.readF32Or(offset::kCursorX + cursor, 0.0f);
            player.cursor.y = reader.readF32Or(offset::kCursorY + cursor, 0.0f);

            player.controllerStatus = reader.has(offset::kPortStatus + i, 1)
                ? controllerStatus(reader.readU8Or(offset::kPortStatus + i, 0))
                : state::ControllerStatus::Unknown;

            player.characterSelected = reader.has(offset::kCharSelected + i, 1)
                ? tables_.characterFromCss(reader.readU8Or(offset::kCharSelected + i, 0))
                : state::Character::UnknownCharacter;

            player.coinDown = reader.readU8Or(offset::kCoinState + i, 0) == kCoinDown;
        }
    }
    else if (snapshot.menuScene == state::MenuScene::StageSelect)
    {
        snapshot.stage = reader.has(offset::kSelectedStage, 1)
            ? tables_.stageFromInternal(reader.readU8Or(offset::kSelectedStage, 0))
            : state::Stage::NoStage;
        snapshot.stageSelectCursor.x = reader.readF32Or(offset::kStageCursorX, 0.0f);
        snapshot.stageSelectCursor.y = reader.readF32Or(offset::kStageCursorY, 0.0f);
    }

    snapshot.frame = reader.readI32Or(offset::kMenuFrame, core::kFrameNotStarted);
    snapshot.submenu = reader.has(offset::kSubmenu, 1)
        ? tables_.submenu(reader.readU8Or(offset::kSubmenu, 0))
        : state::SubMenu::UnknownSubmenu;
    snapshot.menuSelection = reader.readU8Or(offset::kMenuSelection, 0);

    if (snapshot.menuScene != state::MenuScene::SlippiOnlineCss)
        return {};

    if (reader.has(offset::kOnlineCostume, 1))
    {
        const auto costume = reader.readU8Or(offset::kOnlineCostume, 0);
        for (auto& [port, player] : snapshot.players)
            player.costume = costume;
    }

    if (reader.has(offset::kNametagState, 1))
    {
        const auto nametag = reader.readU8Or(offset::kNametagState, 0);
        if (nametag == kNametagEntry)
            snapshot.submenu = state::SubMenu::NameEntry;
        else if (nametag == kNametagIdle)
            snapshot.submenu = state::SubMenu::OnlineCss;
    }

    for (core::u8 i = 0; i < core::kPortCount; ++i)
    {
        auto& player = snapshot.player(static_cast<core::u8>(i + 1));

        player.holdingCpuSlider = player.cursor.y < 0.0f
                               && reader.readU8Or(offset::kCoinState + i, 0) != 0;
        if (player.holdingCpuSlider)
        {
            const core::f32 sliderStart = kSliderOrigin + kSliderStride * static_cast<core::f32>(i);
            const core::i32 steps = truncateToInt((player.cursor.x - sliderStart) / kSliderStep);
            player.cpuLevel = static_cast<core::u8>(1 + std::clamp(steps, 0, kMaxCpuLevel - 1));
        }
        else
        {
            player.cpuLevel = 1;
        }

        if (player.controllerStatus != state::ControllerStatus::Cpu)
            player.cpuLevel = 0;
    }
    return {};
}

} // namespace slp::protocol
