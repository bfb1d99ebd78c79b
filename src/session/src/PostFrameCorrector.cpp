// /////////////////////////////////////////////////////////////////////////////
/// @file PostFrameCorrector.cpp
/// @brief PostFrameCorrector implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/session/PostFrameCorrector.hpp>
#include <slp/core/Constants.hpp>

#include <algorithm>
#include <cmath>

namespace slp::session {

namespace {

using state::Action;

[[nodiscard]] core::i32 invulnerabilityLeft(const state::PlayerState& player,
                                            const state::PlayerState* previous,
                                            core::i32 frame) noexcept
{
    core::i32 left = previous ? std::max(0, previous->invulnerabilityLeft - 1) : 0;

    if (player.action == Action::OnHaloWait)
        left = core::kRespawnInvulnFrames;
    // The first descent of a match grants no invulnerability.
    if (player.action == Action::OnHaloDescent && frame > core::kFirstDescentFrameLimit)
        left = core::kRespawnInvulnFrames;
    if (player.action == Action::EdgeCatching && player.actionFrame == 1)
        left = core::kLedgeInvulnFrames;
    return left;
}

[[nodiscard]] bool moonwalkWarning(const state::PlayerState& player,
                                   const state::PlayerState* previous) noexcept
{
    if (player.action != Action::Dashing || previous == nullptr)
        return false;
    if (previous->action != Action::Dashing && previous->action != Action::Turning)
        return true;
    return previous->moonwalkWarning;
}

[[nodiscard]] bool isAerialOrAttack(Action action) noexcept
{
    const auto raw = static_cast<core::u16>(action);
    return raw >= static_cast<core::u16>(Action::NeutralAttack1)
        && raw <= static_cast<core::u16>(Action::Dair);
}

} // anonymous namespace

PostFrameCorrector::PostFrameCorrector(const tables::StaticTables& tables) noexcept
    : tables_{tables}
{}

void PostFrameCorrector::correctGameplay(state::Snapshot& current,
                                         const state::Snapshot* previous) const
{
    const auto edge = tables_.edgeGroundPosition(current.stage);

    for (auto& [port, player] : current.players)
    {
        const state::PlayerState* before = previous ? previous->findPlayer(port) : nullptr;

        player.invulnerabilityLeft = invulnerabilityLeft(player, before, current.frame);
        player.moonwalkWarning     = moonwalkWarning(player, before);
        player.offStage            = edge.has_value()
                                  && std::abs(player.position.x) > *edge
                                  && player.position.y < core::kOffStageHeight
                                  && !player.onGround;
    }
}

void PostFrameCorrector::applyFixups(state::Snapshot& snapshot) const
{
    for (auto& [port, player] : snapshot.players)
    {
        if (tables_.isZeroIndexed(player.character, player.action))
            ++player.actionFrame;
        if (!isAerialOrAttack(player.action))
            player.interruptible = false;
    }
}

} // namespace slp::session
