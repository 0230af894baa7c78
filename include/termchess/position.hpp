#pragma once

/// @file position.hpp
/// Complete chess position: board + side-to-move + castling + en passant +
/// clocks + repetition history.
///
/// Position is a value type. Search code copies it before every trial move
/// and mutates only the copy; there is no unmake.

#include <termchess/board.hpp>
#include <termchess/move.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace termchess {

// ── Castling rights ─────────────────────────────────────────────────────────
// One bit per side and wing; a right is lost for good once the king or that
// rook moves, or the rook is captured on its home square.

using CastlingRights = std::uint8_t;

inline constexpr CastlingRights kCastlingNone = 0;
inline constexpr CastlingRights kWhiteKingside = 1 << 0;
inline constexpr CastlingRights kWhiteQueenside = 1 << 1;
inline constexpr CastlingRights kBlackKingside = 1 << 2;
inline constexpr CastlingRights kBlackQueenside = 1 << 3;
inline constexpr CastlingRights kWhiteBoth = kWhiteKingside | kWhiteQueenside;
inline constexpr CastlingRights kBlackBoth = kBlackKingside | kBlackQueenside;
inline constexpr CastlingRights kCastlingAll = kWhiteBoth | kBlackBoth;

inline constexpr std::string_view kStartingFen =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

class Position {
   public:
    /// Construct from explicit fields. Computes the Zobrist key.
    Position(const Board& board, Color side, CastlingRights castling, Square ep, int halfmove,
             int fullmove);

    /// Empty board, white to move, no castling, no EP.
    Position();

    // ── Factory ─────────────────────────────────────────────────────────

    [[nodiscard]] static Position initial();

    /// Parse a FEN string. Throws std::invalid_argument on bad input.
    [[nodiscard]] static Position from_fen(std::string_view fen);

    [[nodiscard]] std::string to_fen() const;

    // ── Move operations ─────────────────────────────────────────────────

    /// Apply a move without validating it. The move must come from movegen.
    void make_move(Move m);

    /// Apply a move after checking that it is legal here.
    /// Throws std::invalid_argument (position unchanged) when it is not.
    void play(Move m);

    /// Piece placement after `m`, without touching clocks, rights or history.
    [[nodiscard]] Board board_after(Move m) const;

    // ── Accessors ───────────────────────────────────────────────────────

    [[nodiscard]] const Board& board() const noexcept { return board_; }
    [[nodiscard]] Piece piece_at(Square sq) const noexcept { return board_.piece_at(sq); }
    [[nodiscard]] Color side_to_move() const noexcept { return side_to_move_; }
    [[nodiscard]] CastlingRights castling() const noexcept { return castling_; }
    [[nodiscard]] Square en_passant() const noexcept { return en_passant_; }
    [[nodiscard]] int halfmove_clock() const noexcept { return halfmove_clock_; }
    [[nodiscard]] int fullmove_number() const noexcept { return fullmove_number_; }
    [[nodiscard]] std::uint64_t key() const noexcept { return key_; }

    // ── Attack queries ──────────────────────────────────────────────────

    [[nodiscard]] bool is_square_attacked(Square sq, Color by) const noexcept;

    /// Is the side-to-move's king in check?
    [[nodiscard]] bool is_in_check() const noexcept;

    /// Is `c`'s king in check? False when `c` has no king.
    [[nodiscard]] bool is_in_check(Color c) const noexcept;

    // ── Repetition ──────────────────────────────────────────────────────

    /// How many times the current key occurs in the history (current included).
    [[nodiscard]] int repetition_count() const;

    /// Keys of every position since the history began, oldest first.
    [[nodiscard]] const std::vector<std::uint64_t>& key_history() const noexcept {
        return key_history_;
    }

    /// Prepend keys of earlier positions (oldest first) so repetitions that
    /// started before this position was constructed are recognised.
    void seed_history(const std::vector<std::uint64_t>& earlier_keys);

   private:
    void compute_key();
    void move_and_hash(Square from, Square to);
    void remove_and_hash(Square sq);
    void put_and_hash(Square sq, Piece p);

    Board board_;
    Color side_to_move_ = Color::White;
    CastlingRights castling_ = kCastlingNone;
    Square en_passant_ = kNoSquare;
    int halfmove_clock_ = 0;
    int fullmove_number_ = 1;
    std::uint64_t key_ = 0;
    std::vector<std::uint64_t> key_history_;
};

}  // namespace termchess
