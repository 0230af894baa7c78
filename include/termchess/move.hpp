#pragma once

/// @file move.hpp
/// Moves as produced by the generator, and the list that holds them.
///
/// A Move always comes out of movegen fully flagged. Text input goes through
/// movegen::find_move(), which resolves a UCI string against a position.

#include <termchess/piece.hpp>
#include <termchess/types.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>

namespace termchess {

/// What make_move() has to do beyond lifting and dropping the piece.
enum class MoveFlag : std::uint8_t {
    Normal,
    DoublePawn,       ///< sets the en-passant square
    EnPassant,        ///< removes the pawn behind the target
    CastleKingside,   ///< also moves the h-file rook
    CastleQueenside,  ///< also moves the a-file rook
    Promotion,        ///< replaces the pawn with `promotion`
};

struct Move {
    Square from_sq = A1;
    Square to_sq = A1;
    MoveFlag flag = MoveFlag::Normal;
    PieceType promotion = PieceType::None;

    [[nodiscard]] constexpr bool operator==(const Move&) const noexcept = default;

    /// No legal move starts and ends on the same square, so a default Move
    /// doubles as "no move" (a search root without legal moves).
    [[nodiscard]] constexpr bool is_null() const noexcept { return from_sq == to_sq; }

    /// Long algebraic form: "e2e4", "e7e8q".
    [[nodiscard]] std::string uci() const;
};

/// Moves of one position, in generation order. 256 slots bound the
/// pseudo-legal count of any reachable position.
class MoveList {
   public:
    void push(Move m) noexcept { slots_[size_++] = m; }

    [[nodiscard]] int size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] Move& operator[](int i) noexcept { return slots_[i]; }
    [[nodiscard]] const Move& operator[](int i) const noexcept { return slots_[i]; }

    [[nodiscard]] Move* begin() noexcept { return slots_.data(); }
    [[nodiscard]] Move* end() noexcept { return slots_.data() + size_; }
    [[nodiscard]] const Move* begin() const noexcept { return slots_.data(); }
    [[nodiscard]] const Move* end() const noexcept { return slots_.data() + size_; }

    [[nodiscard]] bool contains(const Move& m) const noexcept {
        return std::find(begin(), end(), m) != end();
    }

   private:
    std::array<Move, 256> slots_{};
    int size_ = 0;
};

}  // namespace termchess
