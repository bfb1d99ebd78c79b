// /////////////////////////////////////////////////////////////////////////////
/// @file DecoderConfig.hpp
/// @brief Session decoder configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <slp/core/Types.hpp>
#include <slp/core/Constants.hpp>

#include <string>

namespace slp::session {

/// @brief Major.minor.revision triple declared by a session-start record.
struct ProtocolVersion
{
    core::u8 major{core::kMinimumMajorVersion};
    core::u8 minor{core::kMinimumMinorVersion};
    core::u8 revision{core::kMinimumRevision};

    [[nodiscard]] std::string toString() const;
};

/// @brief Immutable decoder configuration.
class DecoderConfig
{
public:
    /// @brief Fluent builder for DecoderConfig.
    class Builder
    {
    public:
        /// @brief Accept streams older than the minimum version, synthesizing
        ///        frame boundaries from frame-index transitions.
        Builder& allowOldVersion(bool enabled) noexcept;

        /// @brief Return immediately from nextFrame() when the byte source
        ///        has nothing buffered.
        Builder& pollingMode(bool enabled) noexcept;

        Builder& readChunkSize(core::usize bytes) noexcept;
        Builder& minimumVersion(core::u8 major, core::u8 minor, core::u8 revision) noexcept;

        [[nodiscard]] DecoderConfig build() const noexcept;

    private:
        bool            allowOldVersion_{false};
        bool            pollingMode_{false};
        core::usize     readChunkSize_{core::kDefaultReadChunkSize};
        ProtocolVersion minimumVersion_{};
    };

    [[nodiscard]] bool            allowOldVersion() const noexcept { return allowOldVersion_; }
    [[nodiscard]] bool            pollingMode()     const noexcept { return pollingMode_; }
    [[nodiscard]] core::usize     readChunkSize()   const noexcept { return readChunkSize_; }
    [[nodiscard]] ProtocolVersion minimumVersion()  const noexcept { return minimumVersion_; }

private:
    friend class Builder;

    bool            allowOldVersion_{false};
    bool            pollingMode_{false};
    core::usize     readChunkSize_{core::kDefaultReadChunkSize};
    ProtocolVersion minimumVersion_{};
};

} // namespace slp::session
