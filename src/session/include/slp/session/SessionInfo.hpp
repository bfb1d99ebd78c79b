// /////////////////////////////////////////////////////////////////////////////
/// @file SessionInfo.hpp
/// @brief Metadata of the session being decoded.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/state/Enums.hpp>
#include <slp/core/Types.hpp>

#include <string>
#include <string_view>

namespace slp::session {

/// @brief Lifecycle of a decoded session.
enum class SessionState : core::u8
{
    Idle,
    InProgress,
    Ended
};

[[nodiscard]] constexpr std::string_view toString(SessionState state) noexcept
{
    switch (state)
    {
    case SessionState::Idle:       return "Idle";
    case SessionState::InProgress: return "InProgress";
    case SessionState::Ended:      return "Ended";
    }
    return "Unknown";
}

// /////////////////////////////////////////////////////////////////////////////
/// @struct SessionInfo
/// @brief Version, mode and stage announced by the last session-start
///        record, plus the current lifecycle state.
// /////////////////////////////////////////////////////////////////////////////
struct SessionInfo
{
    std::string  version{};
    bool         legacyBookends{false};
    state::Stage stage{state::Stage::NoStage};
    SessionState state{SessionState::Idle};
};

} // namespace slp::session
