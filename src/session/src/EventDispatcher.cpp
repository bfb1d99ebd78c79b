// /////////////////////////////////////////////////////////////////////////////
/// @file EventDispatcher.cpp
/// @brief EventDispatcher implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/session/EventDispatcher.hpp>
#include <slp/core/Log.hpp>

#include <format>
#include <utility>

namespace slp::session {

namespace {

using protocol::EventType;

/// Logs and reports a record whose decoding failed; such records are skipped.
template <typename T>
[[nodiscard]] bool decoded(const core::Expected<T>& result, EventType type)
{
    if (result.has_value())
        return true;
    core::Log::warn("PROTO", "skipping {} record: {}", protocol::toString(type),
                    core::describe(result.error()));
    return false;
}

[[nodiscard]] bool isFrameUpdate(EventType type) noexcept
{
    return type == EventType::PreFrameUpdate || type == EventType::PostFrameUpdate;
}

} // anonymous namespace

EventDispatcher::EventDispatcher(const DecoderConfig& config, const tables::StaticTables& tables) noexcept
    : config_{config}
    , records_{tables}
    , menus_{tables}
{}

core::Expected<DispatchResult> EventDispatcher::dispatch(std::span<const core::byte> buffer,
                                                         FrameAssembler& assembler)
{
    core::usize cursor = 0;

    while (cursor < buffer.size())
    {
        const auto rest    = buffer.subspan(cursor);
        const auto command = static_cast<core::u8>(rest[0]);
        const auto type    = static_cast<EventType>(command);

        if (type == EventType::PayloadDescriptor)
        {
            const auto length = protocol::EventSizeTable::descriptorLength(rest);
            if (!length || rest.size() < *length)
                return DispatchResult{cursor, DispatchStatus::NeedMoreInput};

            SLP_TRY(sizes_.applyDescriptor(rest.first(*length)));
            cursor += *length;
            continue;
        }

        const auto length = sizes_.sizeOf(command);
        if (!length)
        {
            core::Log::error("PROTO", "no declared length for command 0x{:02X}", command);
            return core::makeError(core::ErrorCode::UnknownCommand,
                                   std::format("command 0x{:02X} has no declared length", command));
        }
        if (rest.size() < *length)
            return DispatchResult{cursor, DispatchStatus::NeedMoreInput};

        const auto record = rest.first(*length);

        if (legacy_ && isFrameUpdate(type))
        {
            const auto frame = protocol::RecordDecoder::peekFrame(record);
            if (frame && lastFrame_ && *frame != *lastFrame_)
            {
                lastFrame_ = frame;
                if (assembler.flushLegacy())
                    return DispatchResult{cursor, DispatchStatus::FrameComplete};
            }
            else if (frame)
            {
                lastFrame_ = frame;
            }
        }

        const bool complete = SLP_TRY(handle(type, record, assembler));
        cursor += *length;

        if (complete)
            return DispatchResult{cursor, DispatchStatus::FrameComplete};
    }

    return DispatchResult{cursor, DispatchStatus::Exhausted};
}

core::Expected<bool> EventDispatcher::handle(EventType type,
                                             std::span<const core::byte> record,
                                             FrameAssembler& assembler)
{
    switch (type)
    {
    case EventType::SessionStart:
        return handleSessionStart(record, assembler);

    case EventType::PreFrameUpdate:
    {
        const auto pre = records_.decodePreFrame(record);
        if (decoded(pre, type))
            assembler.onPreFrame(*pre);
        return false;
    }

    case EventType::PostFrameUpdate:
    {
        const auto post = records_.decodePostFrame(record);
        if (decoded(post, type))
            assembler.onPostFrame(*post);
        return false;
    }

    case EventType::ItemUpdate:
    {
        const auto item = records_.decodeItemUpdate(record);
        if (decoded(item, type))
            assembler.onItem(*item);
        return false;
    }

    case EventType::FrameBookend:
        return assembler.onBookend(records_.decodeBookend(record));

    case EventType::SessionEnd:
    {
        const bool flushed = legacy_ && assembler.flushLegacy();
        assembler.onSessionEnd();
        lastFrame_.reset();
        return flushed;
    }

    case EventType::MenuFrame:
    {
        state::Snapshot menu;
        const auto result = menus_.decode(record, menu);
        if (!decoded(result, type))
            return false;
        return assembler.onMenuFrame(std::move(menu));
    }

    case EventType::FrameStart:
    case EventType::CodeList:
        return false;

    case EventType::PayloadDescriptor:
        break;
    }

    core::Log::debug("PROTO", "skipping unhandled command 0x{:02X} ({} bytes)",
                     static_cast<core::u8>(type), record.size());
    return false;
}

core::Expected<bool> EventDispatcher::handleSessionStart(std::span<const core::byte> record,
                                                         FrameAssembler& assembler)
{
    // A record too short for its version triple counts as version 0.0.0,
    // so the minimum-version gate below still applies.
    auto start = records_.decodeSessionStart(record);
    if (!start)
    {
        core::Log::warn("PROTO", "session start without a version: {}", core::describe(start.error()));
        start = protocol::SessionStartRecord{};
    }

    const auto minimum = config_.minimumVersion();
    legacy_ = !start->versionAtLeast(minimum.major, minimum.minor, minimum.revision);
    lastFrame_.reset();

    if (legacy_)
    {
        if (!config_.allowOldVersion())
        {
            core::Log::error("PROTO", "stream version {}.{}.{} is below {}",
                             start->major, start->minor, start->revision, minimum.toString());
            return core::makeError(core::ErrorCode::VersionTooLow,
                                   std::format("stream version {}.{}.{} is older than {}",
                                               start->major, start->minor, start->revision,
                                               minimum.toString()));
        }
        core::Log::warn("PROTO", "old stream version, synthesizing frame boundaries");
    }

    assembler.onSessionStart(*start, legacy_);
    return false;
}

} // namespace slp::session
