// /////////////////////////////////////////////////////////////////////////////
/// @file MenuDecoder.hpp
/// @brief Decoder for menu-frame records (character select, stage select,
///        main menu).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/state/Snapshot.hpp>
#include <slp/tables/StaticTables.hpp>
#include <slp/core/Expected.hpp>

#include <span>

namespace slp::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class MenuDecoder
/// @brief Populates a snapshot from one menu-frame record.
///
/// Only the scene id is required; every other field tolerates a short
/// record and keeps its default. The online character-select screen
/// additionally derives costumes, the name-entry submenu and CPU levels
/// from the slider cursor.
// /////////////////////////////////////////////////////////////////////////////
class MenuDecoder final
{
public:
    /// @param tables Lookup tables; must outlive the decoder.
    explicit MenuDecoder(const tables::StaticTables& tables) noexcept;

    /// @brief Decodes @p record into @p snapshot.
    /// @return BufferUnderflow if the scene id is missing.
    [[nodiscard]] core::Expected<void> decode(std::span<const core::byte> record,
                                              state::Snapshot& snapshot) const;

    /// @brief Maps a raw scene id onto a MenuScene.
    [[nodiscard]] static state::MenuScene sceneFromRaw(core::u16 raw) noexcept;

private:
    const tables::StaticTables& tables_;
};

} // namespace slp::protocol
