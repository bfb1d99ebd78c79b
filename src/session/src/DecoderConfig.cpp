// /////////////////////////////////////////////////////////////////////////////
/// @file DecoderConfig.cpp
/// @brief DecoderConfig::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/session/DecoderConfig.hpp>

#include <format>

namespace slp::session {

std::string ProtocolVersion::toString() const
{
    return std::format("{}.{}.{}", major, minor, revision);
}

DecoderConfig::Builder& DecoderConfig::Builder::allowOldVersion(bool enabled) noexcept
{
    allowOldVersion_ = enabled;
    return *this;
}

DecoderConfig::Builder& DecoderConfig::Builder::pollingMode(bool enabled) noexcept
{
    pollingMode_ = enabled;
    return *this;
}

DecoderConfig::Builder& DecoderConfig::Builder::readChunkSize(core::usize bytes) noexcept
{
    readChunkSize_ = bytes == 0 ? core::kDefaultReadChunkSize : bytes;
    return *this;
}

DecoderConfig::Builder& DecoderConfig::Builder::minimumVersion(core::u8 major, core::u8 minor,
                                                               core::u8 revision) noexcept
{
    minimumVersion_ = {major, minor, revision};
    return *this;
}

DecoderConfig DecoderConfig::Builder::build() const noexcept
{
    DecoderConfig cfg;
    cfg.allowOldVersion_ = allowOldVersion_;
    cfg.pollingMode_     = pollingMode_;
    cfg.readChunkSize_   = readChunkSize_;
    cfg.minimumVersion_  = minimumVersion_;
    return cfg;
}

} // namespace slp::session
