// /////////////////////////////////////////////////////////////////////////////
/// @file FileByteSource.hpp
/// @brief Recorded event stream read from a file.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <slp/transport/IByteSource.hpp>

#include <memory>
#include <string>

namespace slp::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class FileByteSource
/// @brief POSIX file-descriptor source over a raw event dump.
///
/// Opens the file read-only on @ref open and hands out its bytes with
/// @c read. The stream is exhausted once @c read reports end of file.
// /////////////////////////////////////////////////////////////////////////////
class FileByteSource final : public IByteSource
{
public:
    /// @brief Constructs a source over the file at @p path.
    explicit FileByteSource(std::string path);
    ~FileByteSource() override;

    FileByteSource(const FileByteSource&)            = delete;
    FileByteSource& operator=(const FileByteSource&) = delete;

    [[nodiscard]] core::Expected<void> open() override;
    void close() override;

    [[nodiscard]] core::Expected<core::u32> receive(std::span<core::byte> buffer,
                                                    bool blocking) override;

    [[nodiscard]] bool exhausted() const noexcept override;
    [[nodiscard]] const char* name() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace slp::transport
