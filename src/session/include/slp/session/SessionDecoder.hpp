// /////////////////////////////////////////////////////////////////////////////
/// @file SessionDecoder.hpp
/// @brief Pull-based decoder turning a byte source into snapshots.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/session/DecoderConfig.hpp>
#include <slp/session/SessionInfo.hpp>
#include <slp/state/Snapshot.hpp>
#include <slp/tables/StaticTables.hpp>
#include <slp/transport/IByteSource.hpp>
#include <slp/core/Expected.hpp>

#include <memory>
#include <optional>
#include <span>

namespace slp::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class SessionDecoder
/// @brief Session-scoped owner of all decoding state.
///
/// Holds the size table, the per-port side tables, the previous and
/// in-progress snapshots and the unconsumed byte remainder. Each
/// nextFrame() call reads from the byte source until one snapshot is
/// complete. Single-threaded: one instance per stream.
// /////////////////////////////////////////////////////////////////////////////
class SessionDecoder final
{
public:
    /// @param tables Shared read-only lookup tables.
    /// @param source Byte source; ownership is taken.
    SessionDecoder(DecoderConfig config,
                   std::shared_ptr<const tables::StaticTables> tables,
                   std::unique_ptr<transport::IByteSource> source);
    ~SessionDecoder();

    SessionDecoder(const SessionDecoder&)            = delete;
    SessionDecoder& operator=(const SessionDecoder&) = delete;

    /// @brief Opens the byte source.
    [[nodiscard]] core::Expected<void> open();

    /// @brief Closes the byte source. Buffered bytes are kept.
    void close();

    /// @brief Decodes until the next snapshot is complete.
    ///
    /// @return The snapshot; std::nullopt at end of stream, or in polling
    ///         mode when the source has nothing buffered; an error on a
    ///         fatal protocol or transport condition.
    [[nodiscard]] core::Expected<std::optional<state::Snapshot>> nextFrame();

    /// @brief Appends @p bytes to the pending buffer without reading the
    ///        source. Useful for callers that receive bytes themselves.
    void feed(std::span<const core::byte> bytes);

    /// @brief True once the source is exhausted and no complete frame
    ///        remains buffered.
    [[nodiscard]] bool endOfStream() const noexcept;

    /// @brief Bytes received but not yet consumed by the dispatcher.
    [[nodiscard]] core::usize pendingBytes() const noexcept;

    [[nodiscard]] const SessionInfo& session() const noexcept;
    [[nodiscard]] const DecoderConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace slp::session
