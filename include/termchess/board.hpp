#pragma once

/// @file board.hpp
/// Bitboard piece placement with a mailbox for O(1) square lookups.

#include <termchess/bitboard.hpp>
#include <termchess/piece.hpp>
#include <termchess/types.hpp>

namespace termchess {

/// 12 piece bitboards (2 colors × 6 piece types), per-colour occupancy and a
/// 64-entry mailbox. Trivially copyable: a copy is a full, independent board.
class Board {
   public:
    Board() noexcept = default;

    /// Place a piece on an empty square.
    void put_piece(Square sq, Piece p) noexcept {
        set_bit(pieces_[color_index(p.color)][piece_index(p.type)], sq);
        set_bit(occupied_[color_index(p.color)], sq);
        mailbox_[sq] = p;
    }

    /// Remove the piece standing on `sq` (no-op when empty).
    void remove_piece(Square sq) noexcept {
        Piece p = mailbox_[sq];
        if (p.is_empty())
            return;
        clear_bit(pieces_[color_index(p.color)][piece_index(p.type)], sq);
        clear_bit(occupied_[color_index(p.color)], sq);
        mailbox_[sq] = kNoPiece;
    }

    /// Move a piece to an empty square.
    void move_piece(Square from, Square to) noexcept {
        Piece p = mailbox_[from];
        remove_piece(from);
        put_piece(to, p);
    }

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] Piece piece_at(Square sq) const noexcept { return mailbox_[sq]; }

    [[nodiscard]] bool is_empty(Square sq) const noexcept { return mailbox_[sq].is_empty(); }

    [[nodiscard]] Bitboard pieces(Color c, PieceType pt) const noexcept {
        return pieces_[color_index(c)][piece_index(pt)];
    }

    /// Pieces of type `pt` of both colours.
    [[nodiscard]] Bitboard pieces(PieceType pt) const noexcept {
        return pieces(Color::White, pt) | pieces(Color::Black, pt);
    }

    [[nodiscard]] Bitboard occupied(Color c) const noexcept { return occupied_[color_index(c)]; }

    [[nodiscard]] Bitboard occupied_all() const noexcept { return occupied_[0] | occupied_[1]; }

    [[nodiscard]] int count(Color c, PieceType pt) const noexcept { return popcount(pieces(c, pt)); }

    /// Square of `c`'s king, or kNoSquare on a board without one.
    [[nodiscard]] Square king_square(Color c) const noexcept {
        Bitboard k = pieces(c, PieceType::King);
        return k ? lsb(k) : kNoSquare;
    }

    [[nodiscard]] bool operator==(const Board& other) const noexcept {
        for (int sq = 0; sq < 64; ++sq) {
            if (mailbox_[sq] != other.mailbox_[sq])
                return false;
        }
        return true;
    }

   private:
    Bitboard pieces_[2][kNumPieceTypes]{};
    Bitboard occupied_[2]{};
    Piece mailbox_[64] = {};
};

}  // namespace termchess
