/// @file test_bitboard.cpp
/// Tests for bitboard.hpp and attacks.hpp: bit ops, masks, leaper tables, sliders.

#include <termchess/attacks.hpp>
#include <termchess/bitboard.hpp>

#include <gtest/gtest.h>

namespace termchess {

// ── Basic bit operations ────────────────────────────────────────────────────

TEST(Bitboard, SquareBB) {
    EXPECT_EQ(square_bb(A1), 1ULL);
    EXPECT_EQ(square_bb(H8), 1ULL << 63);
    EXPECT_EQ(square_bb(E4), 1ULL << 28);
}

TEST(Bitboard, PopLsb) {
    Bitboard bb = square_bb(A1) | square_bb(C3) | square_bb(H8);
    EXPECT_EQ(pop_lsb(bb), A1);
    EXPECT_EQ(pop_lsb(bb), C3);
    EXPECT_EQ(popcount(bb), 1);
    EXPECT_EQ(pop_lsb(bb), H8);
    EXPECT_EQ(bb, kEmptyBB);
}

TEST(Bitboard, TestSetClearBit) {
    Bitboard bb = kEmptyBB;
    set_bit(bb, E4);
    EXPECT_TRUE(test_bit(bb, E4));
    clear_bit(bb, E4);
    EXPECT_FALSE(test_bit(bb, E4));
}

TEST(Bitboard, LightSquares) {
    EXPECT_FALSE(test_bit(kLightSquares, A1));
    EXPECT_TRUE(test_bit(kLightSquares, H1));
    EXPECT_TRUE(test_bit(kLightSquares, A8));
    EXPECT_FALSE(test_bit(kLightSquares, H8));
    EXPECT_EQ(popcount(kLightSquares), 32);
}

// ── Masks ───────────────────────────────────────────────────────────────────

TEST(Bitboard, FileAndRankMasks) {
    EXPECT_EQ(file_bb(0), kFileA);
    EXPECT_EQ(file_bb(7), kFileH);
    EXPECT_EQ(rank_bb(0), kRank1);
    EXPECT_EQ(rank_bb(7), kRank8);
}

TEST(Bitboard, FileAndAdjacentAtEdge) {
    EXPECT_EQ(file_and_adjacent_bb(A4), kFileA | file_bb(1));
    EXPECT_EQ(popcount(file_and_adjacent_bb(E4)), 24);
}

TEST(Bitboard, PassedPawnSpanWhite) {
    Bitboard span = passed_pawn_span(Color::White, E4);
    EXPECT_TRUE(test_bit(span, D5));
    EXPECT_TRUE(test_bit(span, E8));
    EXPECT_TRUE(test_bit(span, F7));
    EXPECT_FALSE(test_bit(span, E4));
    EXPECT_FALSE(test_bit(span, D3));
    EXPECT_EQ(popcount(span), 12);
}

TEST(Bitboard, PassedPawnSpanBlack) {
    Bitboard span = passed_pawn_span(Color::Black, E4);
    EXPECT_TRUE(test_bit(span, D3));
    EXPECT_TRUE(test_bit(span, F1));
    EXPECT_FALSE(test_bit(span, E5));
    EXPECT_EQ(popcount(span), 9);
}

// ── Leaper tables ───────────────────────────────────────────────────────────

TEST(Bitboard, KnightAttacks) {
    EXPECT_EQ(popcount(knight_attacks(E4)), 8);
    Bitboard corner = knight_attacks(A1);
    EXPECT_EQ(popcount(corner), 2);
    EXPECT_TRUE(test_bit(corner, B3));
    EXPECT_TRUE(test_bit(corner, C2));
}

TEST(Bitboard, KingAttacks) {
    EXPECT_EQ(popcount(king_attacks(E4)), 8);
    EXPECT_EQ(popcount(king_attacks(H8)), 3);
}

TEST(Bitboard, PawnAttacks) {
    Bitboard white = pawn_attacks(Color::White, E4);
    EXPECT_TRUE(test_bit(white, D5));
    EXPECT_TRUE(test_bit(white, F5));
    EXPECT_EQ(popcount(white), 2);

    Bitboard black_edge = pawn_attacks(Color::Black, H7);
    EXPECT_EQ(popcount(black_edge), 1);
    EXPECT_TRUE(test_bit(black_edge, G6));
}

// ── Sliders ─────────────────────────────────────────────────────────────────

TEST(Attacks, RookEmptyBoard) {
    EXPECT_EQ(popcount(attacks::rook(A1, kEmptyBB)), 14);
    EXPECT_EQ(popcount(attacks::rook(E4, kEmptyBB)), 14);
}

TEST(Attacks, RookStopsAtBlocker) {
    Bitboard occ = square_bb(E6) | square_bb(C4);
    Bitboard a = attacks::rook(E4, occ);
    EXPECT_TRUE(test_bit(a, E5));
    EXPECT_TRUE(test_bit(a, E6));  // blocker itself is attacked
    EXPECT_FALSE(test_bit(a, E7));
    EXPECT_TRUE(test_bit(a, C4));
    EXPECT_FALSE(test_bit(a, B4));
}

TEST(Attacks, BishopCornerAndCenter) {
    EXPECT_EQ(popcount(attacks::bishop(A1, kEmptyBB)), 7);
    EXPECT_EQ(popcount(attacks::bishop(D4, kEmptyBB)), 13);
    Bitboard blocked = attacks::bishop(A1, square_bb(C3));
    EXPECT_TRUE(test_bit(blocked, B2));
    EXPECT_TRUE(test_bit(blocked, C3));
    EXPECT_FALSE(test_bit(blocked, D4));
}

TEST(Attacks, QueenIsRookPlusBishop) {
    Bitboard occ = square_bb(D6) | square_bb(F2);
    EXPECT_EQ(attacks::queen(D4, occ), attacks::rook(D4, occ) | attacks::bishop(D4, occ));
}

TEST(Attacks, SquareAttackedByEachPieceType) {
    Board board;
    board.put_piece(E1, Piece{Color::White, PieceType::King});
    board.put_piece(D4, Piece{Color::Black, PieceType::Knight});
    board.put_piece(A8, Piece{Color::Black, PieceType::Rook});
    board.put_piece(D2, Piece{Color::Black, PieceType::Pawn});

    EXPECT_TRUE(attacks::is_square_attacked(board, E2, Color::Black));   // knight
    EXPECT_TRUE(attacks::is_square_attacked(board, A1, Color::Black));   // rook along the file
    EXPECT_TRUE(attacks::is_square_attacked(board, E1, Color::Black));   // pawn d2
    EXPECT_FALSE(attacks::is_square_attacked(board, H5, Color::Black));
    EXPECT_TRUE(attacks::is_square_attacked(board, D2, Color::White));   // king
}

}  // namespace termchess
