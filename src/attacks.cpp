/// @file attacks.cpp
/// Ray-walking slider attacks and attack detection.

#include <termchess/attacks.hpp>

#include <cstddef>

namespace termchess::attacks {

namespace {

struct Direction {
    int df;
    int dr;
};

constexpr Direction kDiagonals[] = {{1, 1}, {-1, 1}, {1, -1}, {-1, -1}};
constexpr Direction kOrthogonals[] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

/// Union of rays from `sq`, each stopping on (and including) the first blocker.
template <std::size_t N>
Bitboard ray_attacks(Square sq, Bitboard occupancy, const Direction (&dirs)[N]) noexcept {
    Bitboard result = kEmptyBB;
    for (const Direction& d : dirs) {
        int f = file_of(sq) + d.df;
        int r = rank_of(sq) + d.dr;
        while (on_board(f, r)) {
            Square to = make_square(f, r);
            set_bit(result, to);
            if (test_bit(occupancy, to))
                break;
            f += d.df;
            r += d.dr;
        }
    }
    return result;
}

}  // namespace

Bitboard bishop(Square sq, Bitboard occupancy) noexcept {
    return ray_attacks(sq, occupancy, kDiagonals);
}

Bitboard rook(Square sq, Bitboard occupancy) noexcept {
    return ray_attacks(sq, occupancy, kOrthogonals);
}

bool is_square_attacked(const Board& board, Square sq, Color by) noexcept {
    // A `by` pawn attacks `sq` iff it stands where a pawn of the other colour
    // on `sq` would attack.
    if (pawn_attacks(opposite(by), sq) & board.pieces(by, PieceType::Pawn))
        return true;
    if (knight_attacks(sq) & board.pieces(by, PieceType::Knight))
        return true;
    if (king_attacks(sq) & board.pieces(by, PieceType::King))
        return true;

    const Bitboard occ = board.occupied_all();
    const Bitboard queens = board.pieces(by, PieceType::Queen);
    if (bishop(sq, occ) & (board.pieces(by, PieceType::Bishop) | queens))
        return true;
    if (rook(sq, occ) & (board.pieces(by, PieceType::Rook) | queens))
        return true;
    return false;
}

}  // namespace termchess::attacks
