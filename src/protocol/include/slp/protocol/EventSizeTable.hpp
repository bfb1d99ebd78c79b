// /////////////////////////////////////////////////////////////////////////////
/// @file EventSizeTable.hpp
/// @brief Command code to record length map, filled by the payload
///        descriptor at stream start.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/core/Types.hpp>
#include <slp/core/Expected.hpp>

#include <array>
#include <optional>
#include <span>

namespace slp::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class EventSizeTable
/// @brief Declared length (command byte included) of every record kind.
///
/// The payload-descriptor record is self-sized: byte 1 holds its payload
/// size P and the record spans P + 1 bytes. Its body is a run of
/// (command:u8, length:u16) triples; each length excludes the command
/// byte, so it is stored plus one.
// /////////////////////////////////////////////////////////////////////////////
class EventSizeTable final
{
public:
    EventSizeTable() = default;

    /// @brief Length of the descriptor record at the front of @p buffer.
    /// @return std::nullopt when fewer than two bytes are available.
    [[nodiscard]] static std::optional<core::usize> descriptorLength(
        std::span<const core::byte> buffer) noexcept;

    /// @brief Registers every (command, length) pair of a descriptor.
    /// @param record The complete descriptor record, command byte included.
    /// @return Number of commands registered, or CorruptedData when the
    ///         record is shorter than its declared payload.
    [[nodiscard]] core::Expected<core::u32> applyDescriptor(std::span<const core::byte> record);

    /// @brief Registers @p command with a total length of @p length bytes.
    void set(core::u8 command, core::u32 length) noexcept;

    /// @brief Total declared length of @p command, if registered.
    [[nodiscard]] std::optional<core::u32> sizeOf(core::u8 command) const noexcept;

    /// @brief True once any command has been registered.
    [[nodiscard]] bool populated() const noexcept;

    /// @brief Forgets every registration.
    void clear() noexcept;

private:
    std::array<core::u32, 0x100> lengths_{};
    core::u32                    registered_{0};
};

} // namespace slp::protocol
