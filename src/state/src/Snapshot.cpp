// /////////////////////////////////////////////////////////////////////////////
/// @file Snapshot.cpp
/// @brief Snapshot helpers and enum names.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/state/Snapshot.hpp>
#include <slp/core/Assert.hpp>

#include <cmath>

namespace slp::state {

PlayerState& Snapshot::player(core::u8 port)
{
    SLP_ASSERT(isValidPort(port));
    return players[port];
}

const PlayerState* Snapshot::findPlayer(core::u8 port) const noexcept
{
    auto it = players.find(port);
    return (it != players.end()) ? &it->second : nullptr;
}

core::f32 Snapshot::computeDistance() const noexcept
{
    Vec2 first{};
    Vec2 second{};
    core::u32 seen = 0;

    for (const auto& [port, ps] : players)
    {
        if (seen == 0)
            first = ps.position;
        else if (seen == 1)
            second = ps.position;
        else
            break;
        ++seen;
    }

    const core::f32 dx = first.x - second.x;
    const core::f32 dy = first.y - second.y;
    return std::sqrt(dx * dx + dy * dy);
}

std::string_view toString(MenuScene scene) noexcept
{
    switch (scene)
    {
    case MenuScene::InGame:          return "InGame";
    case MenuScene::CharacterSelect: return "CharacterSelect";
    case MenuScene::StageSelect:     return "StageSelect";
    case MenuScene::MainMenu:        return "MainMenu";
    case MenuScene::SlippiOnlineCss: return "SlippiOnlineCss";
    case MenuScene::PressStart:      return "PressStart";
    case MenuScene::Unknown:         return "Unknown";
    }
    return "Unknown";
}

std::string_view toString(Stage stage) noexcept
{
    switch (stage)
    {
    case Stage::NoStage:          return "NoStage";
    case Stage::YoshisStory:      return "YoshisStory";
    case Stage::FountainOfDreams: return "FountainOfDreams";
    case Stage::PokemonStadium:   return "PokemonStadium";
    case Stage::Battlefield:      return "Battlefield";
    case Stage::FinalDestination: return "FinalDestination";
    case Stage::Dreamland:        return "Dreamland";
    case Stage::RandomStage:      return "RandomStage";
    }
    return "NoStage";
}

} // namespace slp::state
