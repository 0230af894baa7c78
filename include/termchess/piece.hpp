#pragma once

/// @file piece.hpp
/// Piece kinds and the coloured Piece value stored on the board.

#include <termchess/types.hpp>

#include <cstdint>
#include <string_view>

namespace termchess {

enum class PieceType : std::uint8_t { None, Pawn, Knight, Bishop, Rook, Queen, King };

inline constexpr int kNumPieceTypes = 6;

/// Column of per-type arrays: Pawn 0 .. King 5. Undefined for None.
[[nodiscard]] constexpr int piece_index(PieceType pt) noexcept {
    return static_cast<int>(pt) - 1;
}

/// FEN letters indexed by PieceType; lowercase is Black.
inline constexpr std::string_view kPieceLetters = " pnbrqk";

struct Piece {
    Color color;
    PieceType type;

    [[nodiscard]] constexpr bool operator==(const Piece&) const noexcept = default;

    [[nodiscard]] constexpr bool is_empty() const noexcept { return type == PieceType::None; }

    /// FEN letter, or ' ' for an empty square.
    [[nodiscard]] constexpr char fen_char() const noexcept {
        const char lower = kPieceLetters[static_cast<int>(type)];
        return color == Color::White && !is_empty() ? static_cast<char>(lower - 'a' + 'A') : lower;
    }

    /// Inverse of fen_char(). Anything that is not a piece letter gives an
    /// empty piece.
    [[nodiscard]] static constexpr Piece from_fen_char(char ch) noexcept {
        const bool white = 'A' <= ch && ch <= 'Z';
        const char lower = white ? static_cast<char>(ch - 'A' + 'a') : ch;
        const auto at = kPieceLetters.find(lower, 1);
        if (at == std::string_view::npos)
            return {Color::White, PieceType::None};
        return {white ? Color::White : Color::Black, static_cast<PieceType>(at)};
    }
};

inline constexpr Piece kNoPiece{Color::White, PieceType::None};

}  // namespace termchess
