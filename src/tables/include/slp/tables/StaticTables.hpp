// /////////////////////////////////////////////////////////////////////////////
/// @file StaticTables.hpp
/// @brief Read-only lookup tables consulted by the decoders (Builder
///        pattern).
///
/// Stage, action, character, projectile and submenu id validation, stage
/// ground-edge bounds, and the per-character set of zero-indexed actions.
/// Tables are immutable once built and are shared between sessions.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <slp/state/Enums.hpp>
#include <slp/core/Expected.hpp>
#include <slp/core/Types.hpp>

#include <array>
#include <bitset>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace slp::tables {

/// @brief Immutable lookup tables.
class StaticTables
{
public:
    /// @brief Fluent builder for StaticTables.
    class Builder
    {
    public:
        Builder();

        /// @brief Populates every table with the stock game data.
        Builder& withDefaults();

        /// @brief Maps a session-start (external) stage id to a stage.
        Builder& stage(core::u16 externalId, state::Stage stage);

        /// @brief Sets the ground-edge x bound of a stage.
        Builder& edgeGroundPosition(state::Stage stage, core::f32 bound);

        /// @brief Marks every action id in [first, last] as known.
        Builder& knownActions(core::u16 first, core::u16 last) noexcept;

        /// @brief Marks an internal character id as known.
        Builder& knownCharacter(state::Character character) noexcept;

        /// @brief Maps a character-select (external) id to a character.
        Builder& cssCharacter(core::u8 cssId, state::Character character) noexcept;

        /// @brief Marks every projectile subtype in [first, last] as known.
        Builder& knownProjectiles(core::u16 first, core::u16 last) noexcept;

        /// @brief Marks a raw submenu byte as known.
        Builder& knownSubmenu(state::SubMenu submenu) noexcept;

        /// @brief Registers a (character, action) pair whose frame counter
        ///        starts at zero.
        Builder& zeroIndexed(state::Character character, state::Action action);

        /// @brief Reads zero-indexed pairs from a CSV file.
        ///
        /// The file needs a header row naming at least the columns
        /// @c character, @c action and @c zeroindex; rows whose
        /// @c zeroindex is @c True are registered.
        [[nodiscard]] core::Expected<void> loadZeroIndexCsv(std::string_view path);

        /// @brief Same as loadZeroIndexCsv() on in-memory CSV text.
        [[nodiscard]] core::Expected<void> parseZeroIndexCsv(std::string_view text);

        [[nodiscard]] StaticTables build() const;

    private:
        std::unordered_map<core::u16, state::Stage> stages_;
        std::unordered_map<core::u8, core::f32>     edges_;
        std::bitset<0x10000>                        actions_;
        std::bitset<0x100>                          characters_;
        std::array<state::Character, 0x100>        css_{};
        std::bitset<0x10000>                        projectiles_;
        std::bitset<0x100>                          submenus_;
        std::unordered_set<core::u32>               zeroIndexed_;
    };

    /// @brief Empty tables: every lookup resolves to its sentinel.
    StaticTables();

    /// @brief Tables populated with the stock game data.
    [[nodiscard]] static StaticTables defaults();

    /// @brief Stage named by a session-start stage id; NoStage if unmapped.
    [[nodiscard]] state::Stage stageFromExternal(core::u16 externalId) const noexcept;

    /// @brief Stage named by an internal stage id; NoStage if invalid.
    [[nodiscard]] state::Stage stageFromInternal(core::u8 internalId) const noexcept;

    /// @brief Ground-edge bound of @p stage, if known.
    [[nodiscard]] std::optional<core::f32> edgeGroundPosition(state::Stage stage) const noexcept;

    /// @brief Action for a raw id; UnknownAnimation if unmapped.
    [[nodiscard]] state::Action action(core::u16 rawId) const noexcept;

    /// @brief Character for an internal id; UnknownCharacter if unmapped.
    [[nodiscard]] state::Character character(core::u8 internalId) const noexcept;

    /// @brief Character for a character-select id; UnknownCharacter if
    ///        unmapped.
    [[nodiscard]] state::Character characterFromCss(core::u8 cssId) const noexcept;

    /// @brief Projectile subtype for a raw id; Unknown if unmapped.
    [[nodiscard]] state::ProjectileSubtype projectileSubtype(core::u16 rawId) const noexcept;

    /// @brief Submenu for a raw byte; UnknownSubmenu if unmapped.
    [[nodiscard]] state::SubMenu submenu(core::u8 rawId) const noexcept;

    /// @brief True if @p action's frame counter starts at zero for
    ///        @p character.
    [[nodiscard]] bool isZeroIndexed(state::Character character,
                                     state::Action action) const noexcept;

private:
    friend class Builder;

    std::unordered_map<core::u16, state::Stage> stages_;
    std::unordered_map<core::u8, core::f32>     edges_;
    std::bitset<0x10000>                        actions_;
    std::bitset<0x100>                          characters_;
    std::array<state::Character, 0x100>        css_{};
    std::bitset<0x10000>                        projectiles_;
    std::bitset<0x100>                          submenus_;
    std::unordered_set<core::u32>               zeroIndexed_;
};

} // namespace slp::tables
