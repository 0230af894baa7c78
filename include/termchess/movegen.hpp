#pragma once

/// @file movegen.hpp
/// Legal and pseudo-legal move generation, move lookup, perft.

#include <termchess/position.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace termchess::movegen {

/// All pseudo-legal moves for the side to move (may leave the king in check).
[[nodiscard]] MoveList pseudo_legal(const Position& pos);

/// All strictly legal moves for the side to move.
[[nodiscard]] MoveList legal(const Position& pos);

/// Does the side to move have at least one legal move?
[[nodiscard]] bool has_legal_move(const Position& pos);

/// Resolve a UCI string ("e1g1", "e7e8q") into the matching legal move,
/// flags included. std::nullopt when no legal move matches.
[[nodiscard]] std::optional<Move> find_move(const Position& pos, std::string_view uci);

/// Leaf-node count at `depth` plies.
[[nodiscard]] std::uint64_t perft(const Position& pos, int depth);

}  // namespace termchess::movegen
