#pragma once

/// @file move_order.hpp
/// Captures-first move ordering for alpha-beta search.

#include <termchess/position.hpp>

namespace termchess {

/// Does `m` land on an occupied square?
[[nodiscard]] inline bool is_capture(const Position& pos, Move m) noexcept {
    return !pos.piece_at(m.to_sq).is_empty();
}

/// Stable partition of `moves`: captures first, then quiet moves, each group
/// in its original order. No move is dropped or duplicated.
[[nodiscard]] MoveList order_moves(const Position& pos, const MoveList& moves);

}  // namespace termchess
