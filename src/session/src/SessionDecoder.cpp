// /////////////////////////////////////////////////////////////////////////////
/// @file SessionDecoder.cpp
/// @brief SessionDecoder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/session/SessionDecoder.hpp>
#include <slp/session/EventDispatcher.hpp>
#include <slp/session/FrameAssembler.hpp>
#include <slp/core/Log.hpp>

#include <cstddef>
#include <format>
#include <utility>
#include <vector>

namespace slp::session {

namespace {

[[nodiscard]] std::shared_ptr<const tables::StaticTables> orDefaults(
    std::shared_ptr<const tables::StaticTables> tables)
{
    if (tables)
        return tables;
    return std::make_shared<const tables::StaticTables>(tables::StaticTables::defaults());
}

} // anonymous namespace

struct SessionDecoder::Impl
{
    DecoderConfig                               config;
    std::shared_ptr<const tables::StaticTables> tables;
    std::unique_ptr<transport::IByteSource>     source;
    EventDispatcher                             dispatcher;
    FrameAssembler                              assembler;
    std::vector<core::byte>                     pending;
    std::vector<core::byte>                     chunk;
    bool                                        endOfStream{false};

    Impl(DecoderConfig cfg,
         std::shared_ptr<const tables::StaticTables> t,
         std::unique_ptr<transport::IByteSource> s)
        : config{cfg}
        , tables{orDefaults(std::move(t))}
        , source{std::move(s)}
        , dispatcher{config, *tables}
        , assembler{*tables}
        , chunk(config.readChunkSize())
    {}
};

SessionDecoder::SessionDecoder(DecoderConfig config,
                               std::shared_ptr<const tables::StaticTables> tables,
                               std::unique_ptr<transport::IByteSource> source)
    : impl_{std::make_unique<Impl>(config, std::move(tables), std::move(source))}
{}

SessionDecoder::~SessionDecoder()
{
    close();
}

core::Expected<void> SessionDecoder::open()
{
    if (!impl_->source)
    {
        return core::makeError(core::ErrorCode::InvalidState, "SessionDecoder has no byte source");
    }
    SLP_TRY_VOID(impl_->source->open());
    impl_->endOfStream = false;
    core::Log::info("SESSION", "decoding from {}", impl_->source->name());
    return {};
}

void SessionDecoder::close()
{
    if (impl_ && impl_->source)
        impl_->source->close();
}

void SessionDecoder::feed(std::span<const core::byte> bytes)
{
    impl_->pending.insert(impl_->pending.end(), bytes.begin(), bytes.end());
}

core::Expected<std::optional<state::Snapshot>> SessionDecoder::nextFrame()
{
    auto& pending = impl_->pending;

    for (;;)
    {
        if (!pending.empty())
        {
            const auto result = SLP_TRY(impl_->dispatcher.dispatch(pending, impl_->assembler));
            pending.erase(pending.begin(),
                          pending.begin() + static_cast<std::ptrdiff_t>(result.consumed));

            if (result.status == DispatchStatus::FrameComplete)
            {
                if (auto snapshot = impl_->assembler.takeCompleted())
                    return std::move(snapshot);
                continue;
            }
        }

        if (!impl_->source)
            return std::nullopt;

        if (impl_->source->exhausted())
        {
            if (!impl_->endOfStream && !pending.empty())
            {
                core::Log::debug("SESSION", "discarding {} trailing bytes at end of stream",
                                 pending.size());
                pending.clear();
            }
            impl_->endOfStream = true;
            return std::nullopt;
        }

        const auto received = SLP_TRY(impl_->source->receive(impl_->chunk,
                                                             !impl_->config.pollingMode()));
        if (received == 0)
        {
            if (!impl_->source->exhausted())
                return std::nullopt;
            continue;
        }

        pending.insert(pending.end(), impl_->chunk.begin(),
                       impl_->chunk.begin() + static_cast<std::ptrdiff_t>(received));
    }
}

bool SessionDecoder::endOfStream() const noexcept
{
    return impl_->endOfStream;
}

core::usize SessionDecoder::pendingBytes() const noexcept
{
    return impl_->pending.size();
}

const SessionInfo& SessionDecoder::session() const noexcept
{
    return impl_->assembler.session();
}

const DecoderConfig& SessionDecoder::config() const noexcept
{
    return impl_->config;
}

} // namespace slp::session
