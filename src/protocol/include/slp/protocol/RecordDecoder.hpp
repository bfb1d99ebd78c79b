// /////////////////////////////////////////////////////////////////////////////
/// @file RecordDecoder.hpp
/// @brief Field decoders for the gameplay record kinds.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/protocol/Records.hpp>
#include <slp/tables/StaticTables.hpp>
#include <slp/core/Expected.hpp>

#include <optional>
#include <span>

namespace slp::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class RecordDecoder
/// @brief Turns one record slice into its typed form.
///
/// Every decoder is a pure function of the slice and the lookup tables.
/// Missing required fields fail with BufferUnderflow; a port byte outside
/// 0..3 fails with OutOfRange. Optional trailing fields fall back to
/// their defaults.
// /////////////////////////////////////////////////////////////////////////////
class RecordDecoder final
{
public:
    /// @param tables Lookup tables; must outlive the decoder.
    explicit RecordDecoder(const tables::StaticTables& tables) noexcept;

    [[nodiscard]] core::Expected<SessionStartRecord> decodeSessionStart(
        std::span<const core::byte> record) const;

    [[nodiscard]] core::Expected<PreFrameRecord> decodePreFrame(
        std::span<const core::byte> record) const;

    [[nodiscard]] core::Expected<PostFrameRecord> decodePostFrame(
        std::span<const core::byte> record) const;

    [[nodiscard]] BookendRecord decodeBookend(std::span<const core::byte> record) const noexcept;

    [[nodiscard]] core::Expected<state::Projectile> decodeItemUpdate(
        std::span<const core::byte> record) const;

    /// @brief Frame index of a pre- or post-frame record, if present.
    [[nodiscard]] static std::optional<core::i32> peekFrame(
        std::span<const core::byte> record) noexcept;

    /// @brief Maps a raw stick axis in [-1, 1] onto [0, 1].
    [[nodiscard]] static constexpr core::f32 normalizeAxis(core::f32 raw) noexcept
    {
        return raw / 2.0f + 0.5f;
    }

private:
    const tables::StaticTables& tables_;
};

} // namespace slp::protocol
