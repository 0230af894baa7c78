#pragma once

/// @file game_state.hpp
/// Game-over detection: checkmate, stalemate and the draw rules.

#include <termchess/position.hpp>

#include <optional>
#include <string_view>

namespace termchess {

enum class GameStatus : std::uint8_t {
    Ongoing,
    Checkmate,                 ///< Side to move is mated; the opponent wins.
    Stalemate,
    DrawInsufficientMaterial,  ///< K v K, K+minor v K, K+B v K+B on same-coloured squares.
    DrawFiftyMoveRule,         ///< Halfmove clock >= 100 (claimable).
    DrawSeventyFiveMoveRule,   ///< Halfmove clock >= 150 (automatic).
    DrawThreefoldRepetition,   ///< Position seen 3 times (claimable).
    DrawFivefoldRepetition,    ///< Position seen 5 times (automatic).
};

/// Status of `pos`. Checked in priority order: no legal moves (mate or
/// stalemate), insufficient material, fivefold, seventy-five move,
/// threefold, fifty move.
[[nodiscard]] GameStatus status(const Position& pos);

[[nodiscard]] inline bool is_game_over(const Position& pos) {
    return status(pos) != GameStatus::Ongoing;
}

[[nodiscard]] constexpr bool is_draw(GameStatus s) noexcept {
    return s != GameStatus::Ongoing && s != GameStatus::Checkmate;
}

/// The winner when the side to move is checkmated, otherwise std::nullopt.
[[nodiscard]] std::optional<Color> winner(const Position& pos);

[[nodiscard]] bool is_insufficient_material(const Board& board) noexcept;

[[nodiscard]] std::string_view to_string(GameStatus s) noexcept;

}  // namespace termchess
