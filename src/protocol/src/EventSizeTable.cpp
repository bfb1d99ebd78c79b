// /////////////////////////////////////////////////////////////////////////////
/// @file EventSizeTable.cpp
/// @brief EventSizeTable implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/protocol/EventSizeTable.hpp>
#include <slp/protocol/ByteReader.hpp>
#include <slp/core/Log.hpp>

#include <format>

namespace slp::protocol {

namespace {

constexpr core::usize kDescriptorHeader = 2;
constexpr core::usize kEntrySize        = 3;

} // anonymous namespace

std::optional<core::usize> EventSizeTable::descriptorLength(std::span<const core::byte> buffer) noexcept
{
    if (buffer.size() < kDescriptorHeader)
        return std::nullopt;
    return static_cast<core::usize>(static_cast<core::u8>(buffer[1])) + 1;
}

core::Expected<core::u32> EventSizeTable::applyDescriptor(std::span<const core::byte> record)
{
    const auto total = descriptorLength(record);
    if (!total || record.size() < *total)
    {
        return core::makeError(core::ErrorCode::CorruptedData,
                               "payload descriptor shorter than its declared size");
    }

    const ByteReader reader{record.first(*total)};
    const core::usize payloadSize = *total - 1;
    const core::usize entries     = payloadSize > 0 ? (payloadSize - 1) / kEntrySize : 0;

    core::usize cursor = kDescriptorHeader;
    for (core::usize i = 0; i < entries; ++i)
    {
        const auto command = SLP_TRY(reader.readU8(cursor));
        const auto length  = SLP_TRY(reader.readU16(cursor + 1));
        set(command, static_cast<core::u32>(length) + 1);
        cursor += kEntrySize;
    }

    core::Log::debug("PROTO", "payload descriptor registered {} commands", entries);
    return static_cast<core::u32>(entries);
}

void EventSizeTable::set(core::u8 command, core::u32 length) noexcept
{
    if (lengths_[command] == 0 && length != 0)
        ++registered_;
    lengths_[command] = length;
}

std::optional<core::u32> EventSizeTable::sizeOf(core::u8 command) const noexcept
{
    if (lengths_[command] == 0)
        return std::nullopt;
    return lengths_[command];
}

bool EventSizeTable::populated() const noexcept
{
    return registered_ != 0;
}

void EventSizeTable::clear() noexcept
{
    lengths_.fill(0);
    registered_ = 0;
}

} // namespace slp::protocol
