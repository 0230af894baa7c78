/// @file test_game_state.cpp
/// Tests for game status detection: mate, stalemate and every draw rule.

#include <termchess/game_state.hpp>
#include <termchess/movegen.hpp>

#include <gtest/gtest.h>

#include <string_view>

using namespace termchess;

class GameStateTest : public ::testing::Test {
   protected:
    static GameStatus status_of(std::string_view fen) { return status(Position::from_fen(fen)); }

    // Helper: play the knight shuffle g1f3 g8f6 f3g1 f6g8 `rounds` times.
    static Position shuffle_knights(int rounds) {
        Position pos = Position::initial();
        for (int i = 0; i < rounds; ++i) {
            for (std::string_view uci : {"g1f3", "g8f6", "f3g1", "f6g8"}) {
                pos.play(*movegen::find_move(pos, uci));
            }
        }
        return pos;
    }
};

// ── Decisive and blocked ────────────────────────────────────────────────────

TEST_F(GameStateTest, StartingPositionIsOngoing) {
    Position pos = Position::initial();
    EXPECT_EQ(status(pos), GameStatus::Ongoing);
    EXPECT_FALSE(is_game_over(pos));
    EXPECT_FALSE(winner(pos).has_value());
}

TEST_F(GameStateTest, Checkmate) {
    Position pos = Position::from_fen("7k/6Q1/5K2/8/8/8/8/8 b - - 0 1");
    EXPECT_EQ(status(pos), GameStatus::Checkmate);
    ASSERT_TRUE(winner(pos).has_value());
    EXPECT_EQ(*winner(pos), Color::White);
}

TEST_F(GameStateTest, CheckmateOfWhite) {
    Position pos = Position::from_fen("8/8/8/8/8/5k2/6q1/7K w - - 0 1");
    EXPECT_EQ(status(pos), GameStatus::Checkmate);
    EXPECT_EQ(winner(pos).value_or(Color::White), Color::Black);
}

TEST_F(GameStateTest, Stalemate) {
    Position pos = Position::from_fen("7k/5Q2/5K2/8/8/8/8/8 b - - 0 1");
    EXPECT_EQ(status(pos), GameStatus::Stalemate);
    EXPECT_TRUE(is_draw(status(pos)));
    EXPECT_FALSE(winner(pos).has_value());
}

// ── Insufficient material ───────────────────────────────────────────────────

TEST_F(GameStateTest, InsufficientMaterial) {
    EXPECT_EQ(status_of("8/8/8/8/8/4k3/8/4K3 w - - 0 1"), GameStatus::DrawInsufficientMaterial);
    EXPECT_EQ(status_of("8/8/8/8/8/4k3/8/3BK3 w - - 0 1"), GameStatus::DrawInsufficientMaterial);
    EXPECT_EQ(status_of("8/8/8/8/8/4k3/8/1N2K3 w - - 0 1"), GameStatus::DrawInsufficientMaterial);
}

TEST_F(GameStateTest, SameColouredBishopsAreInsufficient) {
    // c1 and f8 are both dark squares.
    EXPECT_EQ(status_of("5b2/8/8/8/8/4k3/8/2B1K3 w - - 0 1"),
              GameStatus::DrawInsufficientMaterial);
}

TEST_F(GameStateTest, OppositeColouredBishopsCanStillMate) {
    // c1 is dark, c8 is light.
    EXPECT_EQ(status_of("2b5/8/8/8/8/4k3/8/2B1K3 w - - 0 1"), GameStatus::Ongoing);
}

TEST_F(GameStateTest, MatingMaterialIsSufficient) {
    EXPECT_EQ(status_of("8/8/8/8/8/4k3/8/3RK3 w - - 0 1"), GameStatus::Ongoing);
    EXPECT_EQ(status_of("8/8/8/8/8/4k3/4P3/4K3 w - - 0 1"), GameStatus::Ongoing);
    EXPECT_EQ(status_of("8/8/8/8/8/4k3/8/NN2K3 w - - 0 1"), GameStatus::Ongoing);
}

// ── Move-count rules ────────────────────────────────────────────────────────

TEST_F(GameStateTest, FiftyMoveRule) {
    EXPECT_EQ(status_of("8/8/4k3/8/8/4K3/4R3/8 w - - 99 80"), GameStatus::Ongoing);
    EXPECT_EQ(status_of("8/8/4k3/8/8/4K3/4R3/8 w - - 100 80"), GameStatus::DrawFiftyMoveRule);
}

TEST_F(GameStateTest, SeventyFiveMoveRule) {
    EXPECT_EQ(status_of("8/8/4k3/8/8/4K3/4R3/8 w - - 150 120"),
              GameStatus::DrawSeventyFiveMoveRule);
}

TEST_F(GameStateTest, CheckmateBeatsMoveCountRules) {
    EXPECT_EQ(status_of("7k/6Q1/5K2/8/8/8/8/8 b - - 150 120"), GameStatus::Checkmate);
}

// ── Repetition ──────────────────────────────────────────────────────────────

TEST_F(GameStateTest, ThreefoldRepetition) {
    EXPECT_EQ(status(shuffle_knights(1)), GameStatus::Ongoing);
    EXPECT_EQ(status(shuffle_knights(2)), GameStatus::DrawThreefoldRepetition);
}

TEST_F(GameStateTest, FivefoldRepetition) {
    EXPECT_EQ(status(shuffle_knights(3)), GameStatus::DrawThreefoldRepetition);
    EXPECT_EQ(status(shuffle_knights(4)), GameStatus::DrawFivefoldRepetition);
}

TEST_F(GameStateTest, SeededHistoryCountsTowardsRepetition) {
    Position pos = Position::initial();
    pos.seed_history({pos.key(), pos.key()});
    EXPECT_EQ(status(pos), GameStatus::DrawThreefoldRepetition);
}

// ── Names ───────────────────────────────────────────────────────────────────

TEST_F(GameStateTest, StatusNames) {
    EXPECT_EQ(to_string(GameStatus::Ongoing), "ongoing");
    EXPECT_EQ(to_string(GameStatus::Checkmate), "checkmate");
    EXPECT_EQ(to_string(GameStatus::DrawFivefoldRepetition), "draw (fivefold repetition)");
}
