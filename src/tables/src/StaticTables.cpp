// /////////////////////////////////////////////////////////////////////////////
/// @file StaticTables.cpp
/// @brief StaticTables and StaticTables::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <slp/tables/StaticTables.hpp>
#include <slp/core/Log.hpp>

#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace slp::tables {

namespace {

using state::Character;
using state::Stage;

[[nodiscard]] constexpr core::u32 zeroIndexKey(Character c, state::Action a) noexcept
{
    return (static_cast<core::u32>(c) << 16) | static_cast<core::u32>(a);
}

// Character-select screen order, indexed by the raw id the menu reports.
constexpr Character kCssOrder[] = {
    Character::CaptainFalcon, Character::DonkeyKong,  Character::Fox,
    Character::GameAndWatch,  Character::Kirby,       Character::Bowser,
    Character::Link,          Character::Luigi,       Character::Mario,
    Character::Marth,         Character::Mewtwo,      Character::Ness,
    Character::Peach,         Character::Pikachu,     Character::Popo,
    Character::Jigglypuff,    Character::Samus,       Character::Yoshi,
    Character::Zelda,         Character::Sheik,       Character::Falco,
    Character::YoungLink,     Character::DrMario,     Character::Roy,
    Character::Pichu,         Character::Ganondorf,
};

constexpr Character kInternalCharacters[] = {
    Character::Mario,         Character::Fox,             Character::CaptainFalcon,
    Character::DonkeyKong,    Character::Kirby,           Character::Bowser,
    Character::Link,          Character::Sheik,           Character::Ness,
    Character::Peach,         Character::Popo,            Character::Nana,
    Character::Pikachu,       Character::Samus,           Character::Yoshi,
    Character::Jigglypuff,    Character::Mewtwo,          Character::Luigi,
    Character::Marth,         Character::Zelda,           Character::YoungLink,
    Character::DrMario,       Character::Falco,           Character::Pichu,
    Character::GameAndWatch,  Character::Ganondorf,       Character::Roy,
    Character::WireframeMale, Character::WireframeFemale, Character::GigaBowser,
    Character::Sandbag,
};

constexpr core::u16 kLastCommonAction     = 0x17E;
constexpr core::u16 kLastProjectileSubtype = 0xEC;

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
        s.remove_suffix(1);
    return s;
}

[[nodiscard]] std::vector<std::string_view> splitFields(std::string_view line)
{
    std::vector<std::string_view> fields;
    core::usize start = 0;
    while (true)
    {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos)
        {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

template <typename T>
[[nodiscard]] bool parseInt(std::string_view text, T& out) noexcept
{
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc{} && ptr == end;
}

} // anonymous namespace

// -------------------------------------------------------------------------- //
//  Builder                                                                   //
// -------------------------------------------------------------------------- //

StaticTables::Builder::Builder()
{
    css_.fill(Character::UnknownCharacter);
}

StaticTables::Builder& StaticTables::Builder::withDefaults()
{
    stage(0x02, Stage::FountainOfDreams);
    stage(0x03, Stage::PokemonStadium);
    stage(0x08, Stage::YoshisStory);
    stage(0x1C, Stage::Dreamland);
    stage(0x1F, Stage::Battlefield);
    stage(0x20, Stage::FinalDestination);

    edgeGroundPosition(Stage::Battlefield,      68.4f);
    edgeGroundPosition(Stage::FinalDestination, 85.5657f);
    edgeGroundPosition(Stage::Dreamland,        77.2713f);
    edgeGroundPosition(Stage::FountainOfDreams, 63.3475f);
    edgeGroundPosition(Stage::PokemonStadium,   87.75f);
    edgeGroundPosition(Stage::YoshisStory,      56.0f);

    knownActions(0x000, kLastCommonAction);
    knownProjectiles(0x00, kLastProjectileSubtype);

    for (auto c : kInternalCharacters)
        knownCharacter(c);

    core::u8 cssId = 0;
    for (auto c : kCssOrder)
        cssCharacter(cssId++, c);

    for (auto s : {state::SubMenu::MainMenu, state::SubMenu::OnePlayerMode,
                   state::SubMenu::VsMode,   state::SubMenu::Trophies,
                   state::SubMenu::Options,  state::SubMenu::Data,
                   state::SubMenu::OnlinePlay})
    {
        knownSubmenu(s);
    }

    return *this;
}

StaticTables::Builder& StaticTables::Builder::stage(core::u16 externalId, state::Stage stage)
{
    stages_[externalId] = stage;
    return *this;
}

StaticTables::Builder& StaticTables::Builder::edgeGroundPosition(state::Stage stage, core::f32 bound)
{
    edges_[static_cast<core::u8>(stage)] = bound;
    return *this;
}

StaticTables::Builder& StaticTables::Builder::knownActions(core::u16 first, core::u16 last) noexcept
{
    for (core::u32 id = first; id <= last; ++id)
        actions_.set(id);
    return *this;
}

StaticTables::Builder& StaticTables::Builder::knownCharacter(state::Character character) noexcept
{
    characters_.set(static_cast<core::u8>(character));
    return *this;
}

StaticTables::Builder& StaticTables::Builder::cssCharacter(core::u8 cssId, state::Character character) noexcept
{
    css_[cssId] = character;
    return *this;
}

StaticTables::Builder& StaticTables::Builder::knownProjectiles(core::u16 first, core::u16 last) noexcept
{
    for (core::u32 id = first; id <= last; ++id)
        projectiles_.set(id);
    return *this;
}

StaticTables::Builder& StaticTables::Builder::knownSubmenu(state::SubMenu submenu) noexcept
{
    submenus_.set(static_cast<core::u8>(submenu));
    return *this;
}

StaticTables::Builder& StaticTables::Builder::zeroIndexed(state::Character character, state::Action action)
{
    zeroIndexed_.insert(zeroIndexKey(character, action));
    return *this;
}

core::Expected<void> StaticTables::Builder::loadZeroIndexCsv(std::string_view path)
{
    std::ifstream in{std::string{path}};
    if (!in)
    {
        return core::makeError(core::ErrorCode::IoError,
                               std::format("cannot open action data '{}'", path));
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    return parseZeroIndexCsv(contents.str());
}

core::Expected<void> StaticTables::Builder::parseZeroIndexCsv(std::string_view text)
{
    std::istringstream lines{std::string{text}};
    std::string line;

    if (!std::getline(lines, line))
    {
        return core::makeError(core::ErrorCode::CorruptedData, "action data has no header row");
    }

    const auto header = splitFields(line);
    core::usize characterCol = header.size();
    core::usize actionCol    = header.size();
    core::usize zeroCol      = header.size();
    for (core::usize i = 0; i < header.size(); ++i)
    {
        if (header[i] == "character")      characterCol = i;
        else if (header[i] == "action")    actionCol = i;
        else if (header[i] == "zeroindex") zeroCol = i;
    }

    if (characterCol == header.size() || actionCol == header.size() || zeroCol == header.size())
    {
        return core::makeError(core::ErrorCode::CorruptedData,
                               "action data header lacks character/action/zeroindex");
    }

    core::u32 row = 1;
    core::u32 registered = 0;
    while (std::getline(lines, line))
    {
        ++row;
        if (trim(line).empty())
            continue;

        const auto fields = splitFields(line);
        if (fields.size() <= std::max({characterCol, actionCol, zeroCol}))
        {
            return core::makeError(core::ErrorCode::CorruptedData,
                                   std::format("action data row {} is truncated", row));
        }

        if (fields[zeroCol] != "True")
            continue;

        core::u8  character = 0;
        core::u16 action    = 0;
        if (!parseInt(fields[characterCol], character) || !parseInt(fields[actionCol], action))
        {
            return core::makeError(core::ErrorCode::CorruptedData,
                                   std::format("action data row {} has a non-numeric id", row));
        }

        zeroIndexed(static_cast<Character>(character), static_cast<state::Action>(action));
        ++registered;
    }

    core::Log::debug("TABLES", "registered {} zero-indexed actions", registered);
    return {};
}

StaticTables StaticTables::Builder::build() const
{
    StaticTables tables;
    tables.stages_      = stages_;
    tables.edges_       = edges_;
    tables.actions_     = actions_;
    tables.characters_  = characters_;
    tables.css_         = css_;
    tables.projectiles_ = projectiles_;
    tables.submenus_    = submenus_;
    tables.zeroIndexed_ = zeroIndexed_;
    return tables;
}

// -------------------------------------------------------------------------- //
//  Lookups                                                                   //
// -------------------------------------------------------------------------- //

StaticTables::StaticTables()
{
    css_.fill(Character::UnknownCharacter);
}

StaticTables StaticTables::defaults()
{
    return Builder{}.withDefaults().build();
}

state::Stage StaticTables::stageFromExternal(core::u16 externalId) const noexcept
{
    auto it = stages_.find(externalId);
    return (it != stages_.end()) ? it->second : Stage::NoStage;
}

state::Stage StaticTables::stageFromInternal(core::u8 internalId) const noexcept
{
    switch (static_cast<Stage>(internalId))
    {
    case Stage::NoStage:
    case Stage::YoshisStory:
    case Stage::FountainOfDreams:
    case Stage::PokemonStadium:
    case Stage::Battlefield:
    case Stage::FinalDestination:
    case Stage::Dreamland:
    case Stage::RandomStage:
        return static_cast<Stage>(internalId);
    }
    return Stage::NoStage;
}

std::optional<core::f32> StaticTables::edgeGroundPosition(state::Stage stage) const noexcept
{
    auto it = edges_.find(static_cast<core::u8>(stage));
    if (it == edges_.end())
        return std::nullopt;
    return it->second;
}

state::Action StaticTables::action(core::u16 rawId) const noexcept
{
    return actions_.test(rawId) ? static_cast<state::Action>(rawId)
                                : state::Action::UnknownAnimation;
}

state::Character StaticTables::character(core::u8 internalId) const noexcept
{
    return characters_.test(internalId) ? static_cast<Character>(internalId)
                                        : Character::UnknownCharacter;
}

state::Character StaticTables::characterFromCss(core::u8 cssId) const noexcept
{
    return css_[cssId];
}

state::ProjectileSubtype StaticTables::projectileSubtype(core::u16 rawId) const noexcept
{
    return projectiles_.test(rawId) ? static_cast<state::ProjectileSubtype>(rawId)
                                    : state::ProjectileSubtype::Unknown;
}

state::SubMenu StaticTables::submenu(core::u8 rawId) const noexcept
{
    return submenus_.test(rawId) ? static_cast<state::SubMenu>(rawId)
                                 : state::SubMenu::UnknownSubmenu;
}

bool StaticTables::isZeroIndexed(state::Character character, state::Action action) const noexcept
{
    return zeroIndexed_.contains(zeroIndexKey(character, action));
}

} // namespace slp::tables
