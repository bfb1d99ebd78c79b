// /////////////////////////////////////////////////////////////////////////////
/// @file FrameAssembler.cpp
/// @brief FrameAssembler implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/session/FrameAssembler.hpp>
#include <slp/core/Log.hpp>

#include <format>
#include <utility>

namespace slp::session {

FrameAssembler::FrameAssembler(const tables::StaticTables& tables) noexcept
    : corrector_{tables}
{}

void FrameAssembler::onSessionStart(const protocol::SessionStartRecord& record, bool legacyBookends)
{
    for (core::usize i = 0; i < record.ports.size(); ++i)
    {
        costumes_[i]  = record.ports[i].costume;
        cpuLevels_[i] = record.ports[i].cpuLevel;
    }

    session_.version        = std::format("{}.{}.{}", record.major, record.minor, record.revision);
    session_.legacyBookends = legacyBookends;
    session_.stage          = record.stage;
    session_.state          = SessionState::InProgress;

    inProgress_.reset();
    previous_.reset();
    lastDelivered_ = core::kFrameNotStarted;
    lastMenuFrame_ = core::kFrameNotStarted;

    core::Log::info("SESSION", "session start: version {} stage {}{}",
                    session_.version, state::toString(session_.stage),
                    legacyBookends ? " (legacy bookends)" : "");
}

state::Snapshot& FrameAssembler::current()
{
    if (!inProgress_)
    {
        inProgress_.emplace();
        inProgress_->menuScene = state::MenuScene::InGame;
        inProgress_->stage     = session_.stage;
    }
    return *inProgress_;
}

void FrameAssembler::onPreFrame(const protocol::PreFrameRecord& record)
{
    auto& snapshot = current();
    snapshot.frame = record.frame;

    auto& player      = snapshot.player(record.port);
    player.costume    = costumes_[record.port - 1];
    player.cpuLevel   = cpuLevels_[record.port - 1];
    player.controller = record.controller;
}

void FrameAssembler::onPostFrame(const protocol::PostFrameRecord& record)
{
    auto& snapshot = current();
    snapshot.frame = record.frame;
    snapshot.stage = session_.stage;
    record.applyTo(snapshot.player(record.port));
}

void FrameAssembler::onItem(const state::Projectile& projectile)
{
    current().projectiles.push_back(projectile);
}

bool FrameAssembler::onBookend(const protocol::BookendRecord& record)
{
    if (!inProgress_)
        return false;
    if (record.frame)
        inProgress_->frame = *record.frame;
    return finalizeGameplay();
}

bool FrameAssembler::flushLegacy()
{
    if (!inProgress_)
        return false;
    return finalizeGameplay();
}

bool FrameAssembler::finalizeGameplay()
{
    state::Snapshot snapshot = std::move(*inProgress_);
    inProgress_.reset();

    if (snapshot.frame <= lastDelivered_)
    {
        core::Log::debug("SESSION", "dropping frame {} (last delivered {})",
                         snapshot.frame, lastDelivered_);
        return false;
    }

    snapshot.distance = snapshot.computeDistance();
    corrector_.correctGameplay(snapshot, previous());
    corrector_.applyFixups(snapshot);

    lastDelivered_ = snapshot.frame;
    previous_      = snapshot;
    completed_     = std::move(snapshot);
    return true;
}

bool FrameAssembler::onMenuFrame(state::Snapshot&& snapshot)
{
    if (snapshot.frame != core::kFrameNotStarted)
    {
        if (snapshot.frame <= lastMenuFrame_)
        {
            core::Log::debug("SESSION", "dropping menu frame {} (last {})",
                             snapshot.frame, lastMenuFrame_);
            return false;
        }
        lastMenuFrame_ = snapshot.frame;
    }

    corrector_.applyFixups(snapshot);
    completed_ = std::move(snapshot);
    return true;
}

void FrameAssembler::onSessionEnd()
{
    if (inProgress_)
        core::Log::debug("SESSION", "discarding partial frame at session end");
    inProgress_.reset();
    session_.state = SessionState::Ended;
    core::Log::info("SESSION", "session end after frame {}", lastDelivered_);
}

std::optional<state::Snapshot> FrameAssembler::takeCompleted()
{
    return std::exchange(completed_, std::nullopt);
}

const state::Snapshot* FrameAssembler::previous() const noexcept
{
    return previous_ ? &*previous_ : nullptr;
}

} // namespace slp::session
