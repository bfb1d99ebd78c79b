// /////////////////////////////////////////////////////////////////////////////
/// @file ByteReader.hpp
/// @brief Fixed-offset, big-endian field reader over one record.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/core/Types.hpp>
#include <slp/core/Expected.hpp>

#include <span>

namespace slp::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class ByteReader
/// @brief Read-only view decoding big-endian fields at absolute offsets.
///
/// Required fields are read through the @c readXxx accessors, which fail
/// with BufferUnderflow when the record is too short. Optional trailing
/// fields are read through the @c readXxxOr accessors, which substitute
/// the caller's fallback instead. The reader never owns the bytes.
// /////////////////////////////////////////////////////////////////////////////
class ByteReader final
{
public:
    /// @brief Wraps @p data; the span must outlive the reader.
    explicit ByteReader(std::span<const core::byte> data) noexcept;

    // --------------------------------------------------------------------- //
    //  Required                                                              //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<core::u8>  readU8(core::usize offset) const;
    [[nodiscard]] core::Expected<core::u16> readU16(core::usize offset) const;
    [[nodiscard]] core::Expected<core::u32> readU32(core::usize offset) const;
    [[nodiscard]] core::Expected<core::i32> readI32(core::usize offset) const;
    [[nodiscard]] core::Expected<core::f32> readF32(core::usize offset) const;

    // --------------------------------------------------------------------- //
    //  Optional                                                              //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::u8  readU8Or(core::usize offset, core::u8 fallback) const noexcept;
    [[nodiscard]] core::u16 readU16Or(core::usize offset, core::u16 fallback) const noexcept;
    [[nodiscard]] core::i32 readI32Or(core::usize offset, core::i32 fallback) const noexcept;
    [[nodiscard]] core::f32 readF32Or(core::usize offset, core::f32 fallback) const noexcept;

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief True if @p count bytes starting at @p offset are present.
    [[nodiscard]] bool has(core::usize offset, core::usize count) const noexcept;

    [[nodiscard]] core::usize size() const noexcept;

private:
    [[nodiscard]] core::u32 loadBigEndian(core::usize offset, core::usize width) const noexcept;

    std::span<const core::byte> data_;
};

/// @brief Truncates a wire float toward zero.
///
/// NaN, infinities and values outside the i32 range become 0, so a
/// corrupt field degrades to its default.
[[nodiscard]] core::i32 truncateToInt(core::f32 value) noexcept;

} // namespace slp::protocol
