/**
 * @file TestPostFrameCorrector.cpp
 * @brief Unit tests for session::PostFrameCorrector.
 */

#include <catch2/catch_test_macros.hpp>

#include "slp/session/PostFrameCorrector.hpp"

namespace slp::session {

using state::Action;
using state::Character;
using state::Snapshot;

namespace {

const tables::StaticTables &defaultTables()
{
    static const auto instance = tables::StaticTables::defaults();
    return instance;
}

Snapshot frameWith(core::i32 frame, Action action, core::i32 actionFrame = 0)
{
    Snapshot snapshot;
    snapshot.frame = frame;
    snapshot.stage = state::Stage::FinalDestination;
    auto &player = snapshot.player(1);
    player.action = action;
    player.actionFrame = actionFrame;
    return snapshot;
}

} // namespace

TEST_CASE("Invulnerability counts down from the previous frame", "[session][corrector]")
{
    const PostFrameCorrector corrector{defaultTables()};

    auto previous = frameWith(500, Action::Standing);
    previous.player(1).invulnerabilityLeft = 50;

    auto current = frameWith(501, Action::Standing);
    corrector.correctGameplay(current, &previous);
    REQUIRE(current.player(1).invulnerabilityLeft == 49);

    auto expired = frameWith(502, Action::Standing);
    previous.player(1).invulnerabilityLeft = 0;
    corrector.correctGameplay(expired, &previous);
    REQUIRE(expired.player(1).invulnerabilityLeft == 0);
}

TEST_CASE("Invulnerability is zero without lookback", "[session][corrector]")
{
    const PostFrameCorrector corrector{defaultTables()};

    auto current = frameWith(10, Action::Standing);
    corrector.correctGameplay(current, nullptr);
    REQUIRE(current.player(1).invulnerabilityLeft == 0);

    auto previous = frameWith(9, Action::Standing);
    previous.players.clear();
    previous.player(2).invulnerabilityLeft = 80;
    corrector.correctGameplay(current, &previous);
    REQUIRE(current.player(1).invulnerabilityLeft == 0);
}

TEST_CASE("Respawn and ledge actions reset invulnerability", "[session][corrector]")
{
    const PostFrameCorrector corrector{defaultTables()};

    auto previous = frameWith(500, Action::Standing);
    previous.player(1).invulnerabilityLeft = 3;

    auto halo = frameWith(501, Action::OnHaloWait);
    corrector.correctGameplay(halo, &previous);
    REQUIRE(halo.player(1).invulnerabilityLeft == 120);

    auto descent = frameWith(501, Action::OnHaloDescent);
    corrector.correctGameplay(descent, &previous);
    REQUIRE(descent.player(1).invulnerabilityLeft == 120);

    auto firstDescent = frameWith(100, Action::OnHaloDescent);
    corrector.correctGameplay(firstDescent, &previous);
    REQUIRE(firstDescent.player(1).invulnerabilityLeft == 2);

    auto ledge = frameWith(501, Action::EdgeCatching, 1);
    corrector.correctGameplay(ledge, &previous);
    REQUIRE(ledge.player(1).invulnerabilityLeft == 36);

    auto laterLedge = frameWith(501, Action::EdgeCatching, 2);
    corrector.correctGameplay(laterLedge, &previous);
    REQUIRE(laterLedge.player(1).invulnerabilityLeft == 2);
}

TEST_CASE("Moonwalk warning tracks dash starts", "[session][corrector]")
{
    const PostFrameCorrector corrector{defaultTables()};

    SECTION("dash out of a standing state warns")
    {
        auto previous = frameWith(1, Action::Standing);
        auto current = frameWith(2, Action::Dashing);
        corrector.correctGameplay(current, &previous);
        REQUIRE(current.player(1).moonwalkWarning);
    }

    SECTION("dash out of a turn does not warn")
    {
        auto previous = frameWith(1, Action::Turning);
        auto current = frameWith(2, Action::Dashing);
        corrector.correctGameplay(current, &previous);
        REQUIRE_FALSE(current.player(1).moonwalkWarning);
    }

    SECTION("warning persists while dashing")
    {
        auto previous = frameWith(1, Action::Dashing);
        previous.player(1).moonwalkWarning = true;
        auto current = frameWith(2, Action::Dashing);
        corrector.correctGameplay(current, &previous);
        REQUIRE(current.player(1).moonwalkWarning);
    }

    SECTION("warning clears outside a dash")
    {
        auto previous = frameWith(1, Action::Dashing);
        previous.player(1).moonwalkWarning = true;
        auto current = frameWith(2, Action::Running);
        current.player(1).moonwalkWarning = true;
        corrector.correctGameplay(current, &previous);
        REQUIRE_FALSE(current.player(1).moonwalkWarning);
    }

    SECTION("no lookback means no warning")
    {
        auto current = frameWith(2, Action::Dashing);
        corrector.correctGameplay(current, nullptr);
        REQUIRE_FALSE(current.player(1).moonwalkWarning);
    }
}

TEST_CASE("Off-stage needs distance, depth and airborne", "[session][corrector]")
{
    const PostFrameCorrector corrector{defaultTables()};

    auto check = [&](core::f32 x, core::f32 y, bool onGround, state::Stage stage) {
        auto current = frameWith(10, Action::Standing);
        current.stage = stage;
        auto &player = current.player(1);
        player.position = {x, y};
        player.onGround = onGround;
        corrector.correctGameplay(current, nullptr);
        return current.player(1).offStage;
    };

    REQUIRE(check(90.0f, -10.0f, false, state::Stage::FinalDestination));
    REQUIRE(check(-90.0f, -10.0f, false, state::Stage::FinalDestination));
    REQUIRE_FALSE(check(85.0f, -10.0f, false, state::Stage::FinalDestination));
    REQUIRE_FALSE(check(90.0f, -5.0f, false, state::Stage::FinalDestination));
    REQUIRE_FALSE(check(90.0f, -10.0f, true, state::Stage::FinalDestination));
    REQUIRE_FALSE(check(90.0f, -10.0f, false, state::Stage::NoStage));
}

TEST_CASE("Fixups re-index frames and suppress interruptibility", "[session][corrector]")
{
    const auto tables = tables::StaticTables::Builder{}
        .withDefaults()
        .zeroIndexed(Character::Fox, Action::Dashing)
        .build();
    const PostFrameCorrector corrector{tables};

    Snapshot snapshot;
    auto &dasher = snapshot.player(1);
    dasher.character = Character::Fox;
    dasher.action = Action::Dashing;
    dasher.actionFrame = 0;
    dasher.interruptible = true;

    auto &attacker = snapshot.player(2);
    attacker.character = Character::Fox;
    attacker.action = Action::Nair;
    attacker.actionFrame = 4;
    attacker.interruptible = true;

    corrector.applyFixups(snapshot);

    REQUIRE(snapshot.player(1).actionFrame == 1);
    REQUIRE_FALSE(snapshot.player(1).interruptible);
    REQUIRE(snapshot.player(2).actionFrame == 4);
    REQUIRE(snapshot.player(2).interruptible);
}

} // namespace slp::session
