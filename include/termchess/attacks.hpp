#pragma once

/// @file attacks.hpp
/// Sliding-piece attacks and square-attack queries.
///
/// Sliders are resolved by walking rays against the occupancy, which keeps
/// the rules service table-free (no start-up initialisation step).

#include <termchess/board.hpp>

namespace termchess::attacks {

/// Bishop attack set from `sq` given the board occupancy.
[[nodiscard]] Bitboard bishop(Square sq, Bitboard occupancy) noexcept;

/// Rook attack set from `sq` given the board occupancy.
[[nodiscard]] Bitboard rook(Square sq, Bitboard occupancy) noexcept;

[[nodiscard]] inline Bitboard queen(Square sq, Bitboard occupancy) noexcept {
    return bishop(sq, occupancy) | rook(sq, occupancy);
}

/// Is `sq` attacked by any piece of colour `by` on `board`?
[[nodiscard]] bool is_square_attacked(const Board& board, Square sq, Color by) noexcept;

}  // namespace termchess::attacks
