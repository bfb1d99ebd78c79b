// /////////////////////////////////////////////////////////////////////////////
/// @file MemoryByteSource.hpp
/// @brief In-memory byte source delivering caller-provided chunks.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/transport/IByteSource.hpp>

#include <deque>
#include <vector>

namespace slp::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class MemoryByteSource
/// @brief Queue of byte chunks handed out one per receive().
///
/// Chunk boundaries are preserved; a chunk larger than the destination
/// buffer is split and its tail kept at the front of the queue. The
/// source is exhausted once finish() has been called and the queue has
/// drained. Constructing it from a chunk list finishes it immediately.
// /////////////////////////////////////////////////////////////////////////////
class MemoryByteSource final : public IByteSource
{
public:
    /// @brief Open-ended source; feed it with push() and finish().
    MemoryByteSource() = default;

    /// @brief Source delivering exactly @p chunks, then end of stream.
    explicit MemoryByteSource(std::vector<std::vector<core::byte>> chunks);

    /// @brief Queues one more delivery.
    void push(std::vector<core::byte> chunk);

    /// @brief Declares that no more chunks will be pushed.
    void finish() noexcept;

    [[nodiscard]] core::Expected<void> open() override;
    void close() override;

    [[nodiscard]] core::Expected<core::u32> receive(std::span<core::byte> buffer,
                                                    bool blocking) override;

    [[nodiscard]] bool exhausted() const noexcept override;
    [[nodiscard]] const char* name() const noexcept override;

private:
    std::deque<std::vector<core::byte>> chunks_;
    bool                                finished_{false};
    bool                                open_{false};
};

} // namespace slp::transport
