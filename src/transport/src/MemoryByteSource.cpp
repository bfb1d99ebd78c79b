// /////////////////////////////////////////////////////////////////////////////
/// @file MemoryByteSource.cpp
/// @brief MemoryByteSource implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/transport/MemoryByteSource.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace slp::transport {

MemoryByteSource::MemoryByteSource(std::vector<std::vector<core::byte>> chunks)
    : finished_{true}
{
    for (auto& chunk : chunks)
        push(std::move(chunk));
}

void MemoryByteSource::push(std::vector<core::byte> chunk)
{
    if (!chunk.empty())
        chunks_.push_back(std::move(chunk));
}

void MemoryByteSource::finish() noexcept
{
    finished_ = true;
}

core::Expected<void> MemoryByteSource::open()
{
    open_ = true;
    return {};
}

void MemoryByteSource::close()
{
    open_ = false;
}

core::Expected<core::u32> MemoryByteSource::receive(std::span<core::byte> buffer, bool /*blocking*/)
{
    if (!open_)
    {
        return core::makeError(core::ErrorCode::InvalidState, "Source not open");
    }
    if (chunks_.empty() || buffer.empty())
    {
        return core::u32{0};
    }

    auto& front = chunks_.front();
    const auto count = std::min(front.size(), buffer.size());
    std::copy_n(front.begin(), count, buffer.begin());

    if (count == front.size())
        chunks_.pop_front();
    else
        front.erase(front.begin(), front.begin() + static_cast<std::ptrdiff_t>(count));

    return static_cast<core::u32>(count);
}

bool MemoryByteSource::exhausted() const noexcept
{
    return finished_ && chunks_.empty();
}

const char* MemoryByteSource::name() const noexcept
{
    return "MemoryByteSource";
}

} // namespace slp::transport
