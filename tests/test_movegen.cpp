/// @file test_movegen.cpp
/// Unit tests for move generation and UCI move lookup.

#include <termchess/movegen.hpp>
#include <termchess/position.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace termchess;

class MoveGenTest : public ::testing::Test {
   protected:
    // Helper: is the UCI move among the legal moves of `fen`?
    static bool has_move(const std::string& fen, const std::string& uci) {
        for (const Move& m : movegen::legal(Position::from_fen(fen))) {
            if (m.uci() == uci)
                return true;
        }
        return false;
    }
};

// ── Starting position ───────────────────────────────────────────────────────

TEST_F(MoveGenTest, StartingPositionHas20Moves) {
    auto pos = Position::initial();
    EXPECT_EQ(movegen::legal(pos).size(), 20);
    EXPECT_EQ(movegen::pseudo_legal(pos).size(), 20);
    EXPECT_TRUE(movegen::has_legal_move(pos));
}

// ── Pawns ───────────────────────────────────────────────────────────────────

TEST_F(MoveGenTest, PawnPushesAndDoublePush) {
    const std::string fen = std::string(kStartingFen);
    EXPECT_TRUE(has_move(fen, "e2e3"));
    EXPECT_TRUE(has_move(fen, "e2e4"));
    EXPECT_FALSE(has_move(fen, "e2e5"));
}

TEST_F(MoveGenTest, BlockedPawnCannotPush) {
    const std::string fen = "4k3/8/8/8/8/4p3/4P3/4K3 w - - 0 1";
    EXPECT_FALSE(has_move(fen, "e2e3"));
    EXPECT_FALSE(has_move(fen, "e2e4"));
}

TEST_F(MoveGenTest, EnPassantBothColours) {
    EXPECT_TRUE(has_move("4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 1", "e5d6"));
    EXPECT_TRUE(has_move("4k3/8/8/8/3pP3/8/8/4K3 b - e3 0 1", "d4e3"));
}

TEST_F(MoveGenTest, PromotionGeneratesFourPieces) {
    auto pos = Position::from_fen("8/P6k/8/8/8/8/8/K7 w - - 0 1");
    int promotions = 0;
    for (const Move& m : movegen::legal(pos)) {
        if (m.flag == MoveFlag::Promotion)
            ++promotions;
    }
    EXPECT_EQ(promotions, 4);
}

TEST_F(MoveGenTest, PromotionOrderQueenFirst) {
    auto pos = Position::from_fen("8/P6k/8/8/8/8/8/K7 w - - 0 1");
    MoveList ml = movegen::legal(pos);
    ASSERT_GT(ml.size(), 0);
    EXPECT_EQ(ml[0].uci(), "a7a8q");
}

// ── Castling ────────────────────────────────────────────────────────────────

TEST_F(MoveGenTest, CastlingBothSides) {
    const std::string fen = "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1";
    EXPECT_TRUE(has_move(fen, "e1g1"));
    EXPECT_TRUE(has_move(fen, "e1c1"));
}

TEST_F(MoveGenTest, CastlingBlockedByPiece) {
    EXPECT_FALSE(has_move("r3k2r/8/8/8/8/8/8/R3KB1R w KQkq - 0 1", "e1g1"));
    EXPECT_FALSE(has_move("r3k2r/8/8/8/8/8/8/RN2K2R w KQkq - 0 1", "e1c1"));
}

TEST_F(MoveGenTest, CastlingOutOfOrThroughCheck) {
    // Rook on e8 checks the king: no castling at all.
    EXPECT_FALSE(has_move("4r1k1/8/8/8/8/8/8/R3K2R w KQ - 0 1", "e1g1"));
    // Rook on f8 covers f1.
    EXPECT_FALSE(has_move("5rk1/8/8/8/8/8/8/R3K2R w KQ - 0 1", "e1g1"));
    EXPECT_TRUE(has_move("5rk1/8/8/8/8/8/8/R3K2R w KQ - 0 1", "e1c1"));
    // b1 attacked does not stop queenside castling.
    EXPECT_TRUE(has_move("1r4k1/8/8/8/8/8/8/R3K2R w KQ - 0 1", "e1c1"));
}

TEST_F(MoveGenTest, CastlingNeedsRight) {
    EXPECT_FALSE(has_move("r3k2r/8/8/8/8/8/8/R3K2R w Qkq - 0 1", "e1g1"));
}

// ── Legality ────────────────────────────────────────────────────────────────

TEST_F(MoveGenTest, PinnedPieceCannotLeaveLine) {
    // Knight on e2 pinned by the rook on e8.
    const std::string fen = "4r1k1/8/8/8/8/8/4N3/4K3 w - - 0 1";
    EXPECT_FALSE(has_move(fen, "e2c3"));
    EXPECT_FALSE(has_move(fen, "e2g3"));
}

TEST_F(MoveGenTest, CheckEvasionsOnly) {
    auto pos = Position::from_fen("4k3/8/8/8/8/8/8/r3K3 w - - 0 1");
    for (const Move& m : movegen::legal(pos)) {
        Position child = pos;
        child.make_move(m);
        EXPECT_FALSE(child.is_in_check(Color::White)) << m.uci();
    }
}

TEST_F(MoveGenTest, CheckmateAndStalemateHaveNoMoves) {
    EXPECT_EQ(movegen::legal(Position::from_fen("7k/6Q1/5K2/8/8/8/8/8 b - - 0 1")).size(), 0);
    EXPECT_EQ(movegen::legal(Position::from_fen("7k/5Q2/5K2/8/8/8/8/8 b - - 0 1")).size(), 0);
    EXPECT_FALSE(movegen::has_legal_move(Position::from_fen("7k/5Q2/5K2/8/8/8/8/8 b - - 0 1")));
}

// ── find_move ───────────────────────────────────────────────────────────────

TEST_F(MoveGenTest, FindMoveRestoresFlags) {
    auto pos = Position::from_fen("r3k2r/8/8/8/8/8/4P3/R3K2R w KQkq - 0 1");

    auto castle = movegen::find_move(pos, "e1g1");
    ASSERT_TRUE(castle.has_value());
    EXPECT_EQ(castle->flag, MoveFlag::CastleKingside);

    auto push = movegen::find_move(pos, "e2e4");
    ASSERT_TRUE(push.has_value());
    EXPECT_EQ(push->flag, MoveFlag::DoublePawn);
}

TEST_F(MoveGenTest, FindMoveRejectsIllegalOrMalformed) {
    auto pos = Position::initial();
    EXPECT_FALSE(movegen::find_move(pos, "e2e5").has_value());
    EXPECT_FALSE(movegen::find_move(pos, "zz").has_value());
    EXPECT_FALSE(movegen::find_move(pos, "e7e8x").has_value());
}

TEST_F(MoveGenTest, FindMoveMatchesPromotionPiece) {
    auto pos = Position::from_fen("8/P6k/8/8/8/8/8/K7 w - - 0 1");
    auto rook = movegen::find_move(pos, "a7a8r");
    ASSERT_TRUE(rook.has_value());
    EXPECT_EQ(rook->promotion, PieceType::Rook);
    // A bare pawn move to the last rank is not a legal move.
    EXPECT_FALSE(movegen::find_move(pos, "a7a8").has_value());
}
