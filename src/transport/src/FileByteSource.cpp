// /////////////////////////////////////////////////////////////////////////////
/// @file FileByteSource.cpp
/// @brief POSIX file byte source implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/transport/FileByteSource.hpp>
#include <slp/core/Log.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <unistd.h>
#include <utility>

namespace slp::transport {

struct FileByteSource::Impl
{
    std::string path;
    int         fd{-1};
    bool        eof{false};

    explicit Impl(std::string p) : path{std::move(p)} {}
};

FileByteSource::FileByteSource(std::string path)
    : impl_{std::make_unique<Impl>(std::move(path))}
{}

FileByteSource::~FileByteSource()
{
    close();
}

core::Expected<void> FileByteSource::open()
{
    if (impl_->fd >= 0)
        return {};

    impl_->fd = ::open(impl_->path.c_str(), O_RDONLY | O_CLOEXEC);
    if (impl_->fd < 0)
    {
        return core::makeError(core::ErrorCode::IoError,
                               std::format("open({}) failed: {}", impl_->path, std::strerror(errno)));
    }

    impl_->eof = false;
    core::Log::info("TRANSPORT", "FileByteSource: opened {}", impl_->path);
    return {};
}

void FileByteSource::close()
{
    if (impl_->fd >= 0)
    {
        ::close(impl_->fd);
        impl_->fd = -1;
        core::Log::info("TRANSPORT", "FileByteSource: closed {}", impl_->path);
    }
}

core::Expected<core::u32> FileByteSource::receive(std::span<core::byte> buffer, bool /*blocking*/)
{
    if (impl_->fd < 0)
    {
        return core::makeError(core::ErrorCode::InvalidState, "File not open");
    }
    if (impl_->eof || buffer.empty())
    {
        return core::u32{0};
    }

    ssize_t received = 0;
    do
    {
        received = ::read(impl_->fd, buffer.data(), buffer.size());
    } while (received < 0 && errno == EINTR);

    if (received < 0)
    {
        if (errno == EWOULDBLOCK || errno == EAGAIN)
        {
            return core::u32{0};
        }
        return core::makeError(core::ErrorCode::IoError,
                               std::format("read({}) failed: {}", impl_->path, std::strerror(errno)));
    }

    if (received == 0)
    {
        impl_->eof = true;
    }
    return static_cast<core::u32>(received);
}

bool FileByteSource::exhausted() const noexcept
{
    return impl_->eof;
}

const char* FileByteSource::name() const noexcept
{
    return "FileByteSource";
}

} // namespace slp::transport
