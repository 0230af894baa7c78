#pragma once

/// @file types.hpp
/// Board geometry: squares and colours.
///
/// Squares are numbered a1=0 .. h1=7, a2=8 .. h8=63, so file and rank are
/// the low and high three bits.

#include <cstdint>
#include <string_view>

namespace termchess {

// ── Square ──────────────────────────────────────────────────────────────────

using Square = std::uint8_t;

/// Sentinel for "no square" (empty en-passant target, missing king).
inline constexpr Square kNoSquare = 64;

[[nodiscard]] constexpr int file_of(Square sq) noexcept {
    return sq % 8;
}
[[nodiscard]] constexpr int rank_of(Square sq) noexcept {
    return sq / 8;
}
[[nodiscard]] constexpr bool on_board(int file, int rank) noexcept {
    return 0 <= file && file <= 7 && 0 <= rank && rank <= 7;
}
[[nodiscard]] constexpr Square make_square(int file, int rank) noexcept {
    return static_cast<Square>(8 * rank + file);
}

/// Same file, mirrored rank (e2 <-> e7). White-oriented tables read
/// through it for Black.
[[nodiscard]] constexpr Square flip_rank(Square sq) noexcept {
    return make_square(file_of(sq), 7 - rank_of(sq));
}

// clang-format off
enum SquareConstants : Square {
    A1, B1, C1, D1, E1, F1, G1, H1,
    A2, B2, C2, D2, E2, F2, G2, H2,
    A3, B3, C3, D3, E3, F3, G3, H3,
    A4, B4, C4, D4, E4, F4, G4, H4,
    A5, B5, C5, D5, E5, F5, G5, H5,
    A6, B6, C6, D6, E6, F6, G6, H6,
    A7, B7, C7, D7, E7, F7, G7, H7,
    A8, B8, C8, D8, E8, F8, G8, H8,
};
// clang-format on

// ── Color ───────────────────────────────────────────────────────────────────

enum class Color : std::uint8_t { White, Black };

[[nodiscard]] constexpr Color opposite(Color c) noexcept {
    return c == Color::White ? Color::Black : Color::White;
}

/// Row of per-colour arrays (White 0, Black 1).
[[nodiscard]] constexpr int color_index(Color c) noexcept {
    return c == Color::White ? 0 : 1;
}

/// Scores are White-positive; multiplying by this gives `c`'s view.
[[nodiscard]] constexpr int color_sign(Color c) noexcept {
    return c == Color::White ? 1 : -1;
}

/// 0 on `c`'s own back rank, 7 on the opponent's.
[[nodiscard]] constexpr int relative_rank(Color c, Square sq) noexcept {
    return c == Color::White ? rank_of(sq) : 7 - rank_of(sq);
}

[[nodiscard]] constexpr std::string_view color_name(Color c) noexcept {
    return c == Color::White ? "white" : "black";
}

}  // namespace termchess
