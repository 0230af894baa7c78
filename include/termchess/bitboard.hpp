#pragma once

/// @file bitboard.hpp
/// Bitboard type, bit helpers, masks and leaper attack tables.

#include <termchess/types.hpp>

#include <bit>
#include <cstdint>

namespace termchess {

using Bitboard = std::uint64_t;

inline constexpr Bitboard kEmptyBB = 0ULL;

// ── Bit manipulation ────────────────────────────────────────────────────────

[[nodiscard]] constexpr Bitboard square_bb(Square sq) noexcept {
    return 1ULL << sq;
}

[[nodiscard]] constexpr int popcount(Bitboard b) noexcept {
    return std::popcount(b);
}

/// Index of the least significant set bit. Undefined for an empty board.
[[nodiscard]] constexpr Square lsb(Bitboard b) noexcept {
    return static_cast<Square>(std::countr_zero(b));
}

/// Return and clear the least significant set bit.
[[nodiscard]] constexpr Square pop_lsb(Bitboard& b) noexcept {
    Square sq = lsb(b);
    b &= b - 1;
    return sq;
}

[[nodiscard]] constexpr bool test_bit(Bitboard b, Square sq) noexcept {
    return (b >> sq) & 1;
}

constexpr void set_bit(Bitboard& b, Square sq) noexcept {
    b |= square_bb(sq);
}

constexpr void clear_bit(Bitboard& b, Square sq) noexcept {
    b &= ~square_bb(sq);
}

// ── Rank / File masks ───────────────────────────────────────────────────────

inline constexpr Bitboard kFileA = 0x0101010101010101ULL;
inline constexpr Bitboard kFileH = kFileA << 7;
inline constexpr Bitboard kRank1 = 0x00000000000000FFULL;
inline constexpr Bitboard kRank8 = kRank1 << 56;

/// Squares where (file + rank) is odd: b1, d1, ..., a2, ...
inline constexpr Bitboard kLightSquares = 0x55AA55AA55AA55AAULL;

[[nodiscard]] constexpr Bitboard file_bb(int f) noexcept {
    return kFileA << f;
}
[[nodiscard]] constexpr Bitboard rank_bb(int r) noexcept {
    return kRank1 << (r * 8);
}

/// The file of `sq` plus its neighbours (those that exist).
[[nodiscard]] constexpr Bitboard file_and_adjacent_bb(Square sq) noexcept {
    const int f = file_of(sq);
    Bitboard b = file_bb(f);
    if (f > 0)
        b |= file_bb(f - 1);
    if (f < 7)
        b |= file_bb(f + 1);
    return b;
}

/// All ranks strictly in front of `sq` from `c`'s point of view.
[[nodiscard]] constexpr Bitboard ranks_ahead_bb(Color c, Square sq) noexcept {
    const int r = rank_of(sq);
    if (c == Color::White)
        return r == 7 ? kEmptyBB : ~0ULL << ((r + 1) * 8);
    return r == 0 ? kEmptyBB : ~0ULL >> ((8 - r) * 8);
}

/// Squares an enemy pawn must occupy to stop a `c` pawn on `sq` from being passed.
[[nodiscard]] constexpr Bitboard passed_pawn_span(Color c, Square sq) noexcept {
    return file_and_adjacent_bb(sq) & ranks_ahead_bb(c, sq);
}

// ── Leaper attack tables ────────────────────────────────────────────────────

namespace detail {

struct LeaperTables {
    Bitboard knight[64]{};
    Bitboard king[64]{};
    Bitboard pawn[2][64]{};
};

constexpr Bitboard leaper_targets(int sq, const int (*deltas)[2], int count) noexcept {
    Bitboard targets = kEmptyBB;
    for (int i = 0; i < count; ++i) {
        const int f = file_of(static_cast<Square>(sq)) + deltas[i][0];
        const int r = rank_of(static_cast<Square>(sq)) + deltas[i][1];
        if (on_board(f, r))
            targets |= square_bb(make_square(f, r));
    }
    return targets;
}

constexpr LeaperTables compute_leaper_tables() noexcept {
    constexpr int kKnight[8][2] = {{1, 2}, {2, 1}, {2, -1}, {1, -2},
                                   {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
    constexpr int kKing[8][2] = {{1, 0}, {1, 1}, {0, 1}, {-1, 1},
                                 {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
    constexpr int kWhitePawn[2][2] = {{-1, 1}, {1, 1}};
    constexpr int kBlackPawn[2][2] = {{-1, -1}, {1, -1}};

    LeaperTables t{};
    for (int sq = 0; sq < 64; ++sq) {
        t.knight[sq] = leaper_targets(sq, kKnight, 8);
        t.king[sq] = leaper_targets(sq, kKing, 8);
        t.pawn[0][sq] = leaper_targets(sq, kWhitePawn, 2);
        t.pawn[1][sq] = leaper_targets(sq, kBlackPawn, 2);
    }
    return t;
}

inline constexpr LeaperTables kLeapers = compute_leaper_tables();

}  // namespace detail

[[nodiscard]] constexpr Bitboard knight_attacks(Square sq) noexcept {
    return detail::kLeapers.knight[sq];
}

[[nodiscard]] constexpr Bitboard king_attacks(Square sq) noexcept {
    return detail::kLeapers.king[sq];
}

/// Squares attacked by a pawn of colour `c` standing on `sq`.
[[nodiscard]] constexpr Bitboard pawn_attacks(Color c, Square sq) noexcept {
    return detail::kLeapers.pawn[color_index(c)][sq];
}

}  // namespace termchess
