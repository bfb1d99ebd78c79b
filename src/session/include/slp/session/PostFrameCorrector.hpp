// /////////////////////////////////////////////////////////////////////////////
/// @file PostFrameCorrector.hpp
/// @brief Derives lookback-dependent player fields on finalized frames.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/state/Snapshot.hpp>
#include <slp/tables/StaticTables.hpp>

namespace slp::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class PostFrameCorrector
/// @brief Stateless pass run once over every finalized snapshot.
///
/// Gameplay frames get the invulnerability countdown, the moonwalk
/// warning and the off-stage flag, all computed against the previous
/// emitted frame. Every snapshot, menus included, then receives the
/// action-frame re-indexing and the interruptibility suppression.
// /////////////////////////////////////////////////////////////////////////////
class PostFrameCorrector final
{
public:
    /// @param tables Lookup tables; must outlive the corrector.
    explicit PostFrameCorrector(const tables::StaticTables& tables) noexcept;

    /// @brief Lookback-dependent fields for every player of @p current.
    /// @param previous Last emitted gameplay frame, or nullptr if none.
    void correctGameplay(state::Snapshot& current, const state::Snapshot* previous) const;

    /// @brief Frame re-indexing and interruptibility suppression.
    void applyFixups(state::Snapshot& snapshot) const;

private:
    const tables::StaticTables& tables_;
};

} // namespace slp::session
