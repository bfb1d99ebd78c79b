// /////////////////////////////////////////////////////////////////////////////
/// @file FrameAssembler.hpp
/// @brief Builds snapshots across dispatcher calls and emits them in
///        strictly increasing frame order.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/session/PostFrameCorrector.hpp>
#include <slp/session/SessionInfo.hpp>
#include <slp/protocol/Records.hpp>
#include <slp/state/Snapshot.hpp>
#include <slp/tables/StaticTables.hpp>
#include <slp/core/Constants.hpp>

#include <array>
#include <optional>

namespace slp::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class FrameAssembler
/// @brief Owner of the in-progress and previous snapshots of a session.
///
/// Records mutate a lazily created in-progress snapshot. Completion runs
/// the PostFrameCorrector and moves the snapshot into the completed slot,
/// from which takeCompleted() hands it out. A gameplay frame that is not
/// strictly newer than the last emitted one is dropped. Menu frames run on
/// their own counter and are checked against the last menu frame only.
// /////////////////////////////////////////////////////////////////////////////
class FrameAssembler final
{
public:
    /// @param tables Lookup tables; must outlive the assembler.
    explicit FrameAssembler(const tables::StaticTables& tables) noexcept;

    FrameAssembler(const FrameAssembler&)            = delete;
    FrameAssembler& operator=(const FrameAssembler&) = delete;

    /// @brief Starts a new session: side tables, stage and frame guard.
    void onSessionStart(const protocol::SessionStartRecord& record, bool legacyBookends);

    void onPreFrame(const protocol::PreFrameRecord& record);
    void onPostFrame(const protocol::PostFrameRecord& record);
    void onItem(const state::Projectile& projectile);

    /// @brief Finalizes the in-progress gameplay frame.
    /// @return True if a snapshot was emitted.
    [[nodiscard]] bool onBookend(const protocol::BookendRecord& record);

    /// @brief Finalizes the in-progress frame when boundaries are synthesized.
    /// @return True if a snapshot was emitted.
    [[nodiscard]] bool flushLegacy();

    /// @brief Emits a decoded menu snapshot.
    /// @return True if the snapshot was emitted.
    [[nodiscard]] bool onMenuFrame(state::Snapshot&& snapshot);

    /// @brief Marks the session ended and discards any partial frame.
    void onSessionEnd();

    /// @brief Moves out the last completed snapshot, if any.
    [[nodiscard]] std::optional<state::Snapshot> takeCompleted();

    [[nodiscard]] bool hasInProgress() const noexcept { return inProgress_.has_value(); }
    [[nodiscard]] core::i32 lastDeliveredFrame() const noexcept { return lastDelivered_; }
    [[nodiscard]] const state::Snapshot* previous() const noexcept;
    [[nodiscard]] const SessionInfo& session() const noexcept { return session_; }

private:
    state::Snapshot& current();
    [[nodiscard]] bool finalizeGameplay();

    PostFrameCorrector                     corrector_;
    SessionInfo                            session_{};

    std::optional<state::Snapshot>         inProgress_{};
    std::optional<state::Snapshot>         previous_{};
    std::optional<state::Snapshot>         completed_{};
    core::i32                              lastDelivered_{core::kFrameNotStarted};
    core::i32                              lastMenuFrame_{core::kFrameNotStarted};

    std::array<core::u8, core::kPortCount> costumes_{};
    std::array<core::u8, core::kPortCount> cpuLevels_{};
};

} // namespace slp::session
