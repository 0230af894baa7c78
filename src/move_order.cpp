/// @file move_order.cpp
/// Captures-first ordering.

#include <termchess/move_order.hpp>

#include <algorithm>

namespace termchess {

MoveList order_moves(const Position& pos, const MoveList& moves) {
    MoveList ordered = moves;
    std::stable_partition(ordered.begin(), ordered.end(),
                          [&pos](const Move& m) { return is_capture(pos, m); });
    return ordered;
}

}  // namespace termchess
