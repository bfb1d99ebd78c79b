// /////////////////////////////////////////////////////////////////////////////
/// @file ByteReader.cpp
/// @brief ByteReader implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/protocol/ByteReader.hpp>
#include <slp/core/Assert.hpp>

#include <bit>
#include <cmath>
#include <format>

namespace slp::protocol {

namespace {

[[nodiscard]] std::unexpected<core::Error> underflow(core::usize offset, core::usize width, core::usize size)
{
    return core::makeError(core::ErrorCode::BufferUnderflow,
                           std::format("field at 0x{:X} (+{}) past end of {}-byte record",
                                       offset, width, size));
}

} // anonymous namespace

ByteReader::ByteReader(std::span<const core::byte> data) noexcept
    : data_{data}
{}

// -------------------------------------------------------------------------- //
//  Required                                                                  //
// -------------------------------------------------------------------------- //

core::Expected<core::u8> ByteReader::readU8(core::usize offset) const
{
    if (!has(offset, 1))
        return underflow(offset, 1, data_.size());
    return static_cast<core::u8>(loadBigEndian(offset, 1));
}

core::Expected<core::u16> ByteReader::readU16(core::usize offset) const
{
    if (!has(offset, 2))
        return underflow(offset, 2, data_.size());
    return static_cast<core::u16>(loadBigEndian(offset, 2));
}

core::Expected<core::u32> ByteReader::readU32(core::usize offset) const
{
    if (!has(offset, 4))
        return underflow(offset, 4, data_.size());
    return loadBigEndian(offset, 4);
}

core::Expected<core::i32> ByteReader::readI32(core::usize offset) const
{
    if (!has(offset, 4))
        return underflow(offset, 4, data_.size());
    return std::bit_cast<core::i32>(loadBigEndian(offset, 4));
}

core::Expected<core::f32> ByteReader::readF32(core::usize offset) const
{
    if (!has(offset, 4))
        return underflow(offset, 4, data_.size());
    return std::bit_cast<core::f32>(loadBigEndian(offset, 4));
}

// -------------------------------------------------------------------------- //
//  Optional                                                                  //
// -------------------------------------------------------------------------- //

core::u8 ByteReader::readU8Or(core::usize offset, core::u8 fallback) const noexcept
{
    return has(offset, 1) ? static_cast<core::u8>(loadBigEndian(offset, 1)) : fallback;
}

core::u16 ByteReader::readU16Or(core::usize offset, core::u16 fallback) const noexcept
{
    return has(offset, 2) ? static_cast<core::u16>(loadBigEndian(offset, 2)) : fallback;
}

core::i32 ByteReader::readI32Or(core::usize offset, core::i32 fallback) const noexcept
{
    return has(offset, 4) ? std::bit_cast<core::i32>(loadBigEndian(offset, 4)) : fallback;
}

core::f32 ByteReader::readF32Or(core::usize offset, core::f32 fallback) const noexcept
{
    return has(offset, 4) ? std::bit_cast<core::f32>(loadBigEndian(offset, 4)) : fallback;
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

bool ByteReader::has(core::usize offset, core::usize count) const noexcept
{
    return offset <= data_.size() && count <= data_.size() - offset;
}

core::usize ByteReader::size() const noexcept { return data_.size(); }

core::u32 ByteReader::loadBigEndian(core::usize offset, core::usize width) const noexcept
{
    SLP_ASSERT(width > 0 && width <= 4);
    SLP_ASSERT(has(offset, width));

    core::u32 value = 0;
    for (core::usize i = 0; i < width; ++i)
    {
        value = (value << 8) | static_cast<core::u8>(data_[offset + i]);
    }
    return value;
}

// -------------------------------------------------------------------------- //
//  Conversion                                                                //
// -------------------------------------------------------------------------- //

core::i32 truncateToInt(core::f32 value) noexcept
{
    // 2^31 is exact in f32; -2^31 itself still fits.
    constexpr core::f32 kLimit = 2147483648.0f;
    if (!std::isfinite(value) || value >= kLimit || value < -kLimit)
        return 0;
    return static_cast<core::i32>(value);
}

} // namespace slp::protocol
