/// @file test_perft.cpp
/// Perft validation of the move generator against known node counts.
///
/// If perft matches published values, make_move and legal move generation
/// agree with the rules, castling, en passant and promotion included.

#include <termchess/movegen.hpp>
#include <termchess/position.hpp>

#include <gtest/gtest.h>

using namespace termchess;

class PerftTest : public ::testing::Test {};

// ── Starting position ───────────────────────────────────────────────────────

TEST_F(PerftTest, StartingDepth1) {
    EXPECT_EQ(movegen::perft(Position::initial(), 1), 20ULL);
}

TEST_F(PerftTest, StartingDepth2) {
    EXPECT_EQ(movegen::perft(Position::initial(), 2), 400ULL);
}

TEST_F(PerftTest, StartingDepth3) {
    EXPECT_EQ(movegen::perft(Position::initial(), 3), 8902ULL);
}

TEST_F(PerftTest, StartingDepth4) {
    EXPECT_EQ(movegen::perft(Position::initial(), 4), 197281ULL);
}

// ── Kiwipete ────────────────────────────────────────────────────────────────
// r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq -

static constexpr const char* kKiwipete =
    "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1";

TEST_F(PerftTest, KiwipeteDepth1) {
    EXPECT_EQ(movegen::perft(Position::from_fen(kKiwipete), 1), 48ULL);
}

TEST_F(PerftTest, KiwipeteDepth2) {
    EXPECT_EQ(movegen::perft(Position::from_fen(kKiwipete), 2), 2039ULL);
}

TEST_F(PerftTest, KiwipeteDepth3) {
    EXPECT_EQ(movegen::perft(Position::from_fen(kKiwipete), 3), 97862ULL);
}

// ── Position 3: en-passant and rook endgame ─────────────────────────────────
// 8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - -

static constexpr const char* kPosition3 = "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1";

TEST_F(PerftTest, Position3Depth1) {
    EXPECT_EQ(movegen::perft(Position::from_fen(kPosition3), 1), 14ULL);
}

TEST_F(PerftTest, Position3Depth2) {
    EXPECT_EQ(movegen::perft(Position::from_fen(kPosition3), 2), 191ULL);
}

TEST_F(PerftTest, Position3Depth3) {
    EXPECT_EQ(movegen::perft(Position::from_fen(kPosition3), 3), 2812ULL);
}

TEST_F(PerftTest, Position3Depth4) {
    EXPECT_EQ(movegen::perft(Position::from_fen(kPosition3), 4), 43238ULL);
}

// ── Position 4: promotions and castling under check ─────────────────────────

static constexpr const char* kPosition4 =
    "r3k2r/Pppp1ppp/1b3nbN/nP6/BBP1P3/q4N2/Pp1P2PP/R2Q1RK1 w kq - 0 1";

TEST_F(PerftTest, Position4Depth1) {
    EXPECT_EQ(movegen::perft(Position::from_fen(kPosition4), 1), 6ULL);
}

TEST_F(PerftTest, Position4Depth2) {
    EXPECT_EQ(movegen::perft(Position::from_fen(kPosition4), 2), 264ULL);
}

TEST_F(PerftTest, Position4Depth3) {
    EXPECT_EQ(movegen::perft(Position::from_fen(kPosition4), 3), 9467ULL);
}

// ── Edge cases ──────────────────────────────────────────────────────────────

TEST_F(PerftTest, DepthZeroIsOne) {
    EXPECT_EQ(movegen::perft(Position::initial(), 0), 1ULL);
}

TEST_F(PerftTest, CheckmatedSideHasNoNodes) {
    EXPECT_EQ(movegen::perft(Position::from_fen("7k/6Q1/5K2/8/8/8/8/8 b - - 0 1"), 1), 0ULL);
}
