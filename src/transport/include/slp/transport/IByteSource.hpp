// /////////////////////////////////////////////////////////////////////////////
/// @file IByteSource.hpp
/// @brief Abstract byte-stream source (Strategy pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/core/Types.hpp>
#include <slp/core/Expected.hpp>

#include <span>

namespace slp::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class IByteSource
/// @brief Strategy interface for the transport feeding the decoder.
///
/// Concrete implementations:
///   - @c FileByteSource   : recorded raw event stream on disk.
///   - @c MemoryByteSource : caller-provided chunks, one per receive.
///
/// Deliveries carry no framing: a chunk may end in the middle of a record
/// or hold several records.
// /////////////////////////////////////////////////////////////////////////////
class IByteSource
{
public:
    virtual ~IByteSource() = default;

    /// @brief Opens the source.
    /// @return OK on success.
    [[nodiscard]] virtual core::Expected<void> open() = 0;

    /// @brief Releases the source.
    virtual void close() = 0;

    /// @brief Reads the next available bytes.
    /// @param buffer   Destination buffer.
    /// @param blocking Wait for data or end of stream when nothing is
    ///                 buffered; otherwise return 0 at once.
    /// @return Number of bytes read (0 if nothing available), or error.
    [[nodiscard]] virtual core::Expected<core::u32> receive(std::span<core::byte> buffer,
                                                            bool blocking) = 0;

    /// @brief True once every byte of the stream has been delivered.
    [[nodiscard]] virtual bool exhausted() const noexcept = 0;

    /// @brief Returns a human-readable name for this source.
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace slp::transport
