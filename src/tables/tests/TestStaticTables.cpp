/**
 * @file TestStaticTables.cpp
 * @brief Unit tests for tables::StaticTables and its Builder.
 */

#include <catch2/catch_test_macros.hpp>

#include "slp/tables/StaticTables.hpp"

#include <filesystem>
#include <fstream>

namespace slp::tables {

using state::Action;
using state::Character;
using state::Stage;

namespace {

class TempCsvFile {
public:
    explicit TempCsvFile(const std::string& content)
        : _path(std::filesystem::temp_directory_path() / "slp_tables_test.csv")
    {
        std::ofstream ofs(_path);
        ofs << content;
    }

    ~TempCsvFile() { std::filesystem::remove(_path); }

    [[nodiscard]] std::string path() const { return _path.string(); }

private:
    std::filesystem::path _path;
};

} // namespace

TEST_CASE("Empty tables resolve every lookup to its sentinel", "[tables]")
{
    const StaticTables tables;

    REQUIRE(tables.stageFromExternal(0x1F) == Stage::NoStage);
    REQUIRE_FALSE(tables.edgeGroundPosition(Stage::Battlefield).has_value());
    REQUIRE(tables.action(0x14) == Action::UnknownAnimation);
    REQUIRE(tables.character(0x00) == Character::UnknownCharacter);
    REQUIRE(tables.characterFromCss(0x00) == Character::UnknownCharacter);
    REQUIRE(tables.submenu(0x02) == state::SubMenu::UnknownSubmenu);
}

TEST_CASE("Default tables carry the stock stage data", "[tables]")
{
    const auto tables = StaticTables::defaults();

    REQUIRE(tables.stageFromExternal(0x02) == Stage::FountainOfDreams);
    REQUIRE(tables.stageFromExternal(0x03) == Stage::PokemonStadium);
    REQUIRE(tables.stageFromExternal(0x08) == Stage::YoshisStory);
    REQUIRE(tables.stageFromExternal(0x1C) == Stage::Dreamland);
    REQUIRE(tables.stageFromExternal(0x1F) == Stage::Battlefield);
    REQUIRE(tables.stageFromExternal(0x20) == Stage::FinalDestination);
    REQUIRE(tables.stageFromExternal(0x04) == Stage::NoStage);

    REQUIRE(tables.stageFromInternal(0x19) == Stage::FinalDestination);
    REQUIRE(tables.stageFromInternal(0x55) == Stage::NoStage);

    REQUIRE(tables.edgeGroundPosition(Stage::Battlefield) == 68.4f);
    REQUIRE(tables.edgeGroundPosition(Stage::YoshisStory) == 56.0f);
    REQUIRE_FALSE(tables.edgeGroundPosition(Stage::RandomStage).has_value());
}

TEST_CASE("Default tables validate character, action and projectile ids", "[tables]")
{
    const auto tables = StaticTables::defaults();

    REQUIRE(tables.character(0x01) == Character::Fox);
    REQUIRE(tables.character(0x1B) == Character::UnknownCharacter);
    REQUIRE(tables.character(0x20) == Character::Sandbag);

    REQUIRE(tables.characterFromCss(0x00) == Character::CaptainFalcon);
    REQUIRE(tables.characterFromCss(0x19) == Character::Ganondorf);
    REQUIRE(tables.characterFromCss(0x1A) == Character::UnknownCharacter);

    REQUIRE(tables.action(0x14) == Action::Dashing);
    REQUIRE(tables.action(0x17E) == static_cast<Action>(0x17E));
    REQUIRE(tables.action(0x17F) == Action::UnknownAnimation);

    REQUIRE(tables.projectileSubtype(0xEC) == static_cast<state::ProjectileSubtype>(0xEC));
    REQUIRE(tables.projectileSubtype(0xED) == state::ProjectileSubtype::Unknown);

    REQUIRE(tables.submenu(0x08) == state::SubMenu::OnlinePlay);
    REQUIRE(tables.submenu(0x06) == state::SubMenu::UnknownSubmenu);
}

TEST_CASE("Builder registers zero-indexed actions", "[tables]")
{
    const auto tables = StaticTables::Builder{}
        .withDefaults()
        .zeroIndexed(Character::Fox, Action::Dashing)
        .build();

    REQUIRE(tables.isZeroIndexed(Character::Fox, Action::Dashing));
    REQUIRE_FALSE(tables.isZeroIndexed(Character::Marth, Action::Dashing));
    REQUIRE_FALSE(tables.isZeroIndexed(Character::Fox, Action::Running));
}

TEST_CASE("Zero-index CSV registers rows marked True", "[tables][csv]")
{
    TempCsvFile csv("character,action,zeroindex\n"
                    "1,20,True\n"
                    "1,21,False\n"
                    "\n"
                    "18,252,True\n");

    StaticTables::Builder builder;
    builder.withDefaults();
    auto result = builder.loadZeroIndexCsv(csv.path());
    REQUIRE(result.has_value());

    const auto tables = builder.build();
    REQUIRE(tables.isZeroIndexed(Character::Fox, Action::Dashing));
    REQUIRE_FALSE(tables.isZeroIndexed(Character::Fox, Action::Running));
    REQUIRE(tables.isZeroIndexed(Character::Marth, Action::EdgeCatching));
}

TEST_CASE("Zero-index CSV columns may appear in any order", "[tables][csv]")
{
    StaticTables::Builder builder;
    auto result = builder.parseZeroIndexCsv("zeroindex,frames,action,character\n"
                                            "True,3,20,1\n");
    REQUIRE(result.has_value());
    REQUIRE(builder.build().isZeroIndexed(Character::Fox, Action::Dashing));
}

TEST_CASE("Zero-index CSV errors", "[tables][csv]")
{
    StaticTables::Builder builder;

    SECTION("missing file")
    {
        auto result = builder.loadZeroIndexCsv("/nonexistent/slp/actiondata.csv");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::IoError);
    }

    SECTION("missing header column")
    {
        auto result = builder.parseZeroIndexCsv("character,action\n1,20\n");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::CorruptedData);
    }

    SECTION("truncated row")
    {
        auto result = builder.parseZeroIndexCsv("character,action,zeroindex\n1,20\n");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::CorruptedData);
    }

    SECTION("non-numeric id")
    {
        auto result = builder.parseZeroIndexCsv("character,action,zeroindex\nFOX,20,True\n");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::CorruptedData);
    }
}

} // namespace slp::tables
