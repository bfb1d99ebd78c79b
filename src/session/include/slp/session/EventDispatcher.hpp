// /////////////////////////////////////////////////////////////////////////////
/// @file EventDispatcher.hpp
/// @brief Slices a byte buffer into records and routes them to the
///        decoders and the frame assembler.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/session/DecoderConfig.hpp>
#include <slp/session/FrameAssembler.hpp>
#include <slp/protocol/EventSizeTable.hpp>
#include <slp/protocol/EventType.hpp>
#include <slp/protocol/MenuDecoder.hpp>
#include <slp/protocol/RecordDecoder.hpp>
#include <slp/core/Expected.hpp>

#include <optional>
#include <span>

namespace slp::session {

/// @brief Why a dispatch() call returned.
enum class DispatchStatus : core::u8
{
    NeedMoreInput,
    Exhausted,
    FrameComplete
};

/// @brief Outcome of one dispatch() call.
struct DispatchResult
{
    core::usize    consumed{0};
    DispatchStatus status{DispatchStatus::Exhausted};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class EventDispatcher
/// @brief Record router for one stream.
///
/// Records are sliced with the lengths declared by the payload descriptor.
/// Dispatch stops at the first completed frame so that the caller collects
/// exactly one snapshot per call; trailing bytes stay unconsumed. A record
/// cut short by the end of the buffer is left unconsumed as well.
///
/// Streams older than the configured minimum version carry no frame
/// bookends. When the configuration allows them, frames are closed on the
/// first pre- or post-frame record whose frame index differs from the last
/// one seen; that record is left in the buffer to open the next frame.
// /////////////////////////////////////////////////////////////////////////////
class EventDispatcher final
{
public:
    /// @param tables Lookup tables; must outlive the dispatcher.
    EventDispatcher(const DecoderConfig& config, const tables::StaticTables& tables) noexcept;

    /// @brief Consumes records from the front of @p buffer.
    /// @return Bytes consumed and the stop reason, or UnknownCommand for
    ///         a command without a declared length, or VersionTooLow for
    ///         a refused old stream.
    [[nodiscard]] core::Expected<DispatchResult> dispatch(std::span<const core::byte> buffer,
                                                          FrameAssembler& assembler);

    [[nodiscard]] const protocol::EventSizeTable& sizes() const noexcept { return sizes_; }
    [[nodiscard]] bool legacyBookends() const noexcept { return legacy_; }

private:
    [[nodiscard]] core::Expected<bool> handle(protocol::EventType type,
                                              std::span<const core::byte> record,
                                              FrameAssembler& assembler);

    [[nodiscard]] core::Expected<bool> handleSessionStart(std::span<const core::byte> record,
                                                          FrameAssembler& assembler);

    DecoderConfig             config_;
    protocol::EventSizeTable  sizes_{};
    protocol::RecordDecoder   records_;
    protocol::MenuDecoder     menus_;
    bool                      legacy_{false};
    std::optional<core::i32>  lastFrame_{};
};

} // namespace slp::session
