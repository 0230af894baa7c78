/// @file game_state.cpp
/// Game status, winner and insufficient-material detection.

#include <termchess/game_state.hpp>

#include <termchess/movegen.hpp>

namespace termchess {

GameStatus status(const Position& pos) {
    if (!movegen::has_legal_move(pos)) {
        return pos.is_in_check() ? GameStatus::Checkmate : GameStatus::Stalemate;
    }

    if (is_insufficient_material(pos.board()))
        return GameStatus::DrawInsufficientMaterial;

    const int repetitions = pos.repetition_count();
    if (repetitions >= 5)
        return GameStatus::DrawFivefoldRepetition;
    if (pos.halfmove_clock() >= 150)
        return GameStatus::DrawSeventyFiveMoveRule;
    if (repetitions >= 3)
        return GameStatus::DrawThreefoldRepetition;
    if (pos.halfmove_clock() >= 100)
        return GameStatus::DrawFiftyMoveRule;

    return GameStatus::Ongoing;
}

std::optional<Color> winner(const Position& pos) {
    if (status(pos) == GameStatus::Checkmate)
        return opposite(pos.side_to_move());
    return std::nullopt;
}

bool is_insufficient_material(const Board& board) noexcept {
    if (board.pieces(PieceType::Pawn) | board.pieces(PieceType::Rook) |
        board.pieces(PieceType::Queen)) {
        return false;
    }

    const Bitboard knights = board.pieces(PieceType::Knight);
    const Bitboard bishops = board.pieces(PieceType::Bishop);
    const int minors = popcount(knights | bishops);

    if (minors <= 1)
        return true;

    // K+B v K+B with both bishops on the same square colour.
    if (minors == 2 && knights == kEmptyBB && board.count(Color::White, PieceType::Bishop) == 1) {
        const bool white_light = (board.pieces(Color::White, PieceType::Bishop) & kLightSquares) != 0;
        const bool black_light = (board.pieces(Color::Black, PieceType::Bishop) & kLightSquares) != 0;
        return white_light == black_light;
    }
    return false;
}

std::string_view to_string(GameStatus s) noexcept {
    switch (s) {
        case GameStatus::Ongoing:
            return "ongoing";
        case GameStatus::Checkmate:
            return "checkmate";
        case GameStatus::Stalemate:
            return "stalemate";
        case GameStatus::DrawInsufficientMaterial:
            return "draw (insufficient material)";
        case GameStatus::DrawFiftyMoveRule:
            return "draw (fifty-move rule)";
        case GameStatus::DrawSeventyFiveMoveRule:
            return "draw (seventy-five-move rule)";
        case GameStatus::DrawThreefoldRepetition:
            return "draw (threefold repetition)";
        case GameStatus::DrawFivefoldRepetition:
            return "draw (fivefold repetition)";
    }
    return "unknown";
}

}  // namespace termchess
