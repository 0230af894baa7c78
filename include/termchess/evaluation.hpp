#pragma once

/// @file evaluation.hpp
/// Static evaluation in pawn units, always from White's point of view.
///
/// Layers are additive and switched on by difficulty tier:
///   Easy   - material
///   Medium - + piece-square tables (phase-blended king), passed pawns, mobility
///   Hard   - + king safety
/// Terminal positions short-circuit: mate is +/-kMateScore, any draw is 0.

#include <termchess/game_state.hpp>
#include <termchess/position.hpp>

#include <cstdint>
#include <string_view>

namespace termchess {

/// Difficulty tier of a built-in engine. Ordered: a higher tier evaluates more.
enum class Difficulty : std::uint8_t { Easy = 0, Medium = 1, Hard = 2 };

[[nodiscard]] constexpr std::string_view to_string(Difficulty d) noexcept {
    switch (d) {
        case Difficulty::Easy:
            return "Easy";
        case Difficulty::Medium:
            return "Medium";
        case Difficulty::Hard:
            return "Hard";
    }
    return "Unknown";
}

/// Multiplicative scale applied to each evaluation layer.
struct EvalWeights {
    double material = 1.0;
    double piece_square = 1.0;  ///< Also scales the passed-pawn bonus.
    double mobility = 1.0;
    double king_safety = 1.0;

    [[nodiscard]] constexpr bool operator==(const EvalWeights&) const noexcept = default;
};

namespace eval {

inline constexpr double kMateScore = 10'000.0;

/// Mobility counts one legal move as this many pawns.
inline constexpr double kMobilityScale = 0.1;

/// Non-pawn, non-king material of both sides in the initial position.
inline constexpr double kStartingPieceMaterial = 63.0;

/// Static score of `pos` from White's perspective.
[[nodiscard]] double evaluate(const Position& pos, Difficulty difficulty,
                              const EvalWeights& weights = {});

/// Standard value of a piece type in pawns (king = 0).
[[nodiscard]] double piece_value(PieceType pt) noexcept;

/// Material balance, White minus Black.
[[nodiscard]] double material(const Board& board) noexcept;

/// 1.0 with all pieces on the board, 0.0 with only kings and pawns.
[[nodiscard]] double game_phase(const Board& board) noexcept;

/// Piece-square bonuses, White minus Black. The king blends its middlegame
/// and endgame tables by game_phase().
[[nodiscard]] double piece_square(const Board& board) noexcept;

/// True when no enemy pawn stands ahead of the `c` pawn on `sq` on its own
/// file or an adjacent one.
[[nodiscard]] bool is_passed_pawn(const Board& board, Color c, Square sq) noexcept;

/// Passed-pawn bonus, White minus Black, growing towards the endgame.
[[nodiscard]] double passed_pawns(const Board& board) noexcept;

/// Legal move count of the side to move, positive when White is to move.
[[nodiscard]] double mobility(const Position& pos);

/// King safety, White's minus Black's, where each side's safety is minus
/// its shield, open-file and attacked-zone penalties.
[[nodiscard]] double king_safety(const Board& board) noexcept;

}  // namespace eval
}  // namespace termchess
