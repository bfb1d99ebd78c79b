/**
 * @file TestByteSources.cpp
 * @brief Unit tests for transport::MemoryByteSource and
 *        transport::FileByteSource.
 */

#include <catch2/catch_test_macros.hpp>

#include "slp/transport/FileByteSource.hpp"
#include "slp/transport/MemoryByteSource.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

namespace slp::transport {

namespace {

using Bytes = std::vector<core::byte>;

Bytes bytesOf(std::initializer_list<int> values)
{
    Bytes out;
    for (int v : values)
        out.push_back(static_cast<core::byte>(v));
    return out;
}

class TempBinaryFile {
public:
    explicit TempBinaryFile(const Bytes& content)
        : _path(std::filesystem::temp_directory_path() / "slp_transport_test.bin")
    {
        std::ofstream ofs(_path, std::ios::binary);
        ofs.write(reinterpret_cast<const char*>(content.data()),
                  static_cast<std::streamsize>(content.size()));
    }

    ~TempBinaryFile() { std::filesystem::remove(_path); }

    [[nodiscard]] std::string path() const { return _path.string(); }

private:
    std::filesystem::path _path;
};

} // namespace

TEST_CASE("MemoryByteSource preserves chunk boundaries", "[transport][memory]")
{
    MemoryByteSource source{{bytesOf({1, 2, 3}), bytesOf({4, 5})}};
    REQUIRE(source.open().has_value());
    REQUIRE_FALSE(source.exhausted());

    std::array<core::byte, 16> buffer{};

    auto first = source.receive(buffer, true);
    REQUIRE(first.has_value());
    REQUIRE(*first == 3);
    REQUIRE(buffer[2] == core::byte{3});

    auto second = source.receive(buffer, true);
    REQUIRE(second.has_value());
    REQUIRE(*second == 2);
    REQUIRE(buffer[0] == core::byte{4});
    REQUIRE(source.exhausted());

    auto none = source.receive(buffer, true);
    REQUIRE(none.has_value());
    REQUIRE(*none == 0);
}

TEST_CASE("MemoryByteSource splits chunks larger than the buffer", "[transport][memory]")
{
    MemoryByteSource source{{bytesOf({1, 2, 3, 4, 5})}};
    REQUIRE(source.open().has_value());

    std::array<core::byte, 2> buffer{};
    REQUIRE(*source.receive(buffer, false) == 2);
    REQUIRE(*source.receive(buffer, false) == 2);
    REQUIRE(buffer[1] == core::byte{4});
    REQUIRE(*source.receive(buffer, false) == 1);
    REQUIRE(buffer[0] == core::byte{5});
    REQUIRE(source.exhausted());
}

TEST_CASE("Open-ended MemoryByteSource ends only after finish", "[transport][memory]")
{
    MemoryByteSource source;
    REQUIRE(source.open().has_value());

    std::array<core::byte, 4> buffer{};
    REQUIRE(*source.receive(buffer, false) == 0);
    REQUIRE_FALSE(source.exhausted());

    source.push(bytesOf({9}));
    source.push({});
    REQUIRE(*source.receive(buffer, false) == 1);
    REQUIRE_FALSE(source.exhausted());

    source.finish();
    REQUIRE(source.exhausted());
}

TEST_CASE("MemoryByteSource refuses reads while closed", "[transport][memory]")
{
    MemoryByteSource source{{bytesOf({1})}};
    std::array<core::byte, 4> buffer{};

    auto result = source.receive(buffer, true);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::InvalidState);
    REQUIRE(std::string{source.name()} == "MemoryByteSource");
}

TEST_CASE("FileByteSource reads a file in chunks", "[transport][file]")
{
    TempBinaryFile file(bytesOf({10, 20, 30, 40, 50}));

    FileByteSource source{file.path()};
    REQUIRE(source.open().has_value());

    std::array<core::byte, 3> buffer{};
    auto first = source.receive(buffer, true);
    REQUIRE(first.has_value());
    REQUIRE(*first == 3);
    REQUIRE(buffer[0] == core::byte{10});

    auto second = source.receive(buffer, true);
    REQUIRE(second.has_value());
    REQUIRE(*second == 2);
    REQUIRE(buffer[1] == core::byte{50});
    REQUIRE_FALSE(source.exhausted());

    auto end = source.receive(buffer, true);
    REQUIRE(end.has_value());
    REQUIRE(*end == 0);
    REQUIRE(source.exhausted());

    source.close();
}

TEST_CASE("FileByteSource reports a missing file", "[transport][file]")
{
    FileByteSource source{"/nonexistent/slp/stream.bin"};

    auto result = source.open();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::IoError);
}

TEST_CASE("FileByteSource refuses reads before open", "[transport][file]")
{
    FileByteSource source{"/dev/null"};
    std::array<core::byte, 4> buffer{};

    auto result = source.receive(buffer, false);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::InvalidState);
    REQUIRE(std::string{source.name()} == "FileByteSource");
}

} // namespace slp::transport
