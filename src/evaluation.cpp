/// @file evaluation.cpp
/// Layered static evaluation: material, piece-square tables, passed pawns,
/// mobility and king safety, blended by game phase.

#include <termchess/evaluation.hpp>

#include <termchess/attacks.hpp>
#include <termchess/movegen.hpp>

#include <algorithm>
#include <array>

namespace termchess::eval {

namespace {

using Table = std::array<double, 64>;

// Tables are laid out from White's side: index 0 = a1, index 63 = h8.
// Black pieces read them through flip_rank().

// clang-format off
constexpr Table kPawnTable = {
     0.00,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00,
     0.00,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00,
     0.10,  0.10,  0.20,  0.30,  0.30,  0.20,  0.10,  0.10,
     0.15,  0.15,  0.20,  0.35,  0.35,  0.20,  0.15,  0.15,
     0.20,  0.20,  0.30,  0.40,  0.40,  0.30,  0.20,  0.20,
     0.30,  0.30,  0.40,  0.50,  0.50,  0.40,  0.30,  0.30,
     0.50,  0.50,  0.60,  0.70,  0.70,  0.60,  0.50,  0.50,
     0.00,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00,
};

constexpr Table kKnightTable = {
    -0.50, -0.40, -0.30, -0.30, -0.30, -0.30, -0.40, -0.50,
    -0.40, -0.20,  0.00,  0.00,  0.00,  0.00, -0.20, -0.40,
    -0.30,  0.00,  0.10,  0.15,  0.15,  0.10,  0.00, -0.30,
    -0.30,  0.05,  0.15,  0.20,  0.20,  0.15,  0.05, -0.30,
    -0.30,  0.00,  0.15,  0.20,  0.20,  0.15,  0.00, -0.30,
    -0.30,  0.05,  0.10,  0.15,  0.15,  0.10,  0.05, -0.30,
    -0.40, -0.20,  0.00,  0.05,  0.05,  0.00, -0.20, -0.40,
    -0.50, -0.40, -0.30, -0.30, -0.30, -0.30, -0.40, -0.50,
};

constexpr Table kBishopTable = {
    -0.20, -0.10, -0.10, -0.10, -0.10, -0.10, -0.10, -0.20,
    -0.10,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00, -0.10,
    -0.10,  0.00,  0.05,  0.10,  0.10,  0.05,  0.00, -0.10,
    -0.10,  0.05,  0.05,  0.10,  0.10,  0.05,  0.05, -0.10,
    -0.10,  0.00,  0.10,  0.10,  0.10,  0.10,  0.00, -0.10,
    -0.10,  0.10,  0.10,  0.10,  0.10,  0.10,  0.10, -0.10,
    -0.10,  0.05,  0.00,  0.00,  0.00,  0.00,  0.05, -0.10,
    -0.20, -0.10, -0.10, -0.10, -0.10, -0.10, -0.10, -0.20,
};

constexpr Table kRookTable = {
     0.00,  0.00,  0.00,  0.05,  0.05,  0.00,  0.00,  0.00,
     0.05,  0.10,  0.10,  0.10,  0.10,  0.10,  0.10,  0.05,
    -0.05,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00, -0.05,
    -0.05,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00, -0.05,
    -0.05,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00, -0.05,
    -0.05,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00, -0.05,
     0.25,  0.25,  0.25,  0.25,  0.25,  0.25,  0.25,  0.25,
     0.00,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00,  0.00,
};

// Sheltered, castled king while pieces remain.
constexpr Table kKingMiddlegameTable = {
     0.20,  0.30,  0.10,  0.00,  0.00,  0.10,  0.30,  0.20,
     0.20,  0.20,  0.00,  0.00,  0.00,  0.00,  0.20,  0.20,
    -0.10, -0.20, -0.20, -0.20, -0.20, -0.20, -0.20, -0.10,
    -0.20, -0.30, -0.30, -0.40, -0.40, -0.30, -0.30, -0.20,
    -0.30, -0.40, -0.40, -0.50, -0.50, -0.40, -0.40, -0.30,
    -0.30, -0.40, -0.40, -0.50, -0.50, -0.40, -0.40, -0.30,
    -0.30, -0.40, -0.40, -0.50, -0.50, -0.40, -0.40, -0.30,
    -0.30, -0.40, -0.40, -0.50, -0.50, -0.40, -0.40, -0.30,
};

// Active, central king once the pieces are traded.
constexpr Table kKingEndgameTable = {
    -0.50, -0.30, -0.30, -0.30, -0.30, -0.30, -0.30, -0.50,
    -0.30, -0.30,  0.00,  0.00,  0.00,  0.00, -0.30, -0.30,
    -0.30, -0.10,  0.20,  0.30,  0.30,  0.20, -0.10, -0.30,
    -0.30, -0.10,  0.30,  0.40,  0.40,  0.30, -0.10, -0.30,
    -0.30, -0.10,  0.30,  0.40,  0.40,  0.30, -0.10, -0.30,
    -0.30, -0.10,  0.20,  0.30,  0.30,  0.20, -0.10, -0.30,
    -0.30, -0.20, -0.10,  0.00,  0.00, -0.10, -0.20, -0.30,
    -0.50, -0.40, -0.30, -0.20, -0.20, -0.30, -0.40, -0.50,
};
// clang-format on

// Indexed by relative rank (own back rank = 0).
constexpr std::array<double, 8> kPassedPawnBonus = {0.00, 0.05, 0.10, 0.20, 0.35, 0.60, 0.90, 0.00};

constexpr double kShieldPawnPenalty = 0.30;
constexpr double kOpenFilePenalty = 0.25;
constexpr double kAttackedZonePenalty = 0.10;

/// Table entry for a piece of colour `c` on `sq`, read from White's side.
double table_bonus(const Table& table, Color c, Square sq) noexcept {
    return table[c == Color::White ? sq : flip_rank(sq)];
}

/// Sum of `c`'s pieces of type `pt` over `table`.
double table_sum(const Board& board, Color c, PieceType pt, const Table& table) noexcept {
    double sum = 0.0;
    Bitboard pieces = board.pieces(c, pt);
    while (pieces) sum += table_bonus(table, c, pop_lsb(pieces));
    return sum;
}

/// Penalty points against `c`'s king standing on `king`.
double king_danger(const Board& board, Color c, Square king) noexcept {
    const int kf = file_of(king);
    const int kr = rank_of(king);
    const int shield_rank = kr + (c == Color::White ? 1 : -1);
    const Bitboard all_pawns = board.pieces(PieceType::Pawn);
    const Piece own_pawn{c, PieceType::Pawn};

    int shield_pawns = 0;
    int open_files = 0;
    for (int f = kf - 1; f <= kf + 1; ++f) {
        if (f < 0 || f > 7)
            continue;
        if (on_board(f, shield_rank) && board.piece_at(make_square(f, shield_rank)) == own_pawn)
            ++shield_pawns;
        if ((all_pawns & file_bb(f)) == kEmptyBB)
            ++open_files;
    }

    int attacked = 0;
    const Color them = opposite(c);
    for (int r = kr - 1; r <= kr + 1; ++r) {
        for (int f = kf - 1; f <= kf + 1; ++f) {
            if (on_board(f, r) && attacks::is_square_attacked(board, make_square(f, r), them))
                ++attacked;
        }
    }

    return (3 - shield_pawns) * kShieldPawnPenalty + open_files * kOpenFilePenalty +
           attacked * kAttackedZonePenalty;
}

}  // namespace

// ── Public API ──────────────────────────────────────────────────────────────

double piece_value(PieceType pt) noexcept {
    switch (pt) {
        case PieceType::Pawn:
            return 1.0;
        case PieceType::Knight:
            return 3.0;
        case PieceType::Bishop:
            return 3.25;
        case PieceType::Rook:
            return 5.0;
        case PieceType::Queen:
            return 9.0;
        default:
            return 0.0;
    }
}

double material(const Board& board) noexcept {
    double score = 0.0;
    for (PieceType pt : {PieceType::Pawn, PieceType::Knight, PieceType::Bishop, PieceType::Rook,
                         PieceType::Queen}) {
        score += piece_value(pt) * (board.count(Color::White, pt) - board.count(Color::Black, pt));
    }
    return score;
}

double game_phase(const Board& board) noexcept {
    double remaining = 0.0;
    for (PieceType pt :
         {PieceType::Knight, PieceType::Bishop, PieceType::Rook, PieceType::Queen}) {
        remaining += piece_value(pt) * popcount(board.pieces(pt));
    }
    return std::clamp(remaining / kStartingPieceMaterial, 0.0, 1.0);
}

double piece_square(const Board& board) noexcept {
    const double phase = game_phase(board);
    double score = 0.0;
    for (Color c : {Color::White, Color::Black}) {
        double side = table_sum(board, c, PieceType::Pawn, kPawnTable) +
                      table_sum(board, c, PieceType::Knight, kKnightTable) +
                      table_sum(board, c, PieceType::Bishop, kBishopTable) +
                      table_sum(board, c, PieceType::Rook, kRookTable);

        const Square king = board.king_square(c);
        if (king != kNoSquare) {
            side += phase * table_bonus(kKingMiddlegameTable, c, king) +
                    (1.0 - phase) * table_bonus(kKingEndgameTable, c, king);
        }
        score += color_sign(c) * side;
    }
    return score;
}

bool is_passed_pawn(const Board& board, Color c, Square sq) noexcept {
    return (board.pieces(opposite(c), PieceType::Pawn) & passed_pawn_span(c, sq)) == kEmptyBB;
}

double passed_pawns(const Board& board) noexcept {
    const double endgame_scale = 1.0 + (1.0 - game_phase(board));
    double score = 0.0;
    for (Color c : {Color::White, Color::Black}) {
        Bitboard pawns = board.pieces(c, PieceType::Pawn);
        while (pawns) {
            const Square sq = pop_lsb(pawns);
            if (is_passed_pawn(board, c, sq))
                score += color_sign(c) * kPassedPawnBonus[relative_rank(c, sq)];
        }
    }
    return score * endgame_scale;
}

double mobility(const Position& pos) {
    return color_sign(pos.side_to_move()) * static_cast<double>(movegen::legal(pos).size());
}

double king_safety(const Board& board) noexcept {
    double score = 0.0;
    for (Color c : {Color::White, Color::Black}) {
        const Square king = board.king_square(c);
        if (king != kNoSquare)
            score -= color_sign(c) * king_danger(board, c, king);
    }
    return score;
}

double evaluate(const Position& pos, Difficulty difficulty, const EvalWeights& weights) {
    const GameStatus s = status(pos);
    if (s == GameStatus::Checkmate) {
        // The side to move is mated.
        return pos.side_to_move() == Color::White ? -kMateScore : kMateScore;
    }
    if (is_draw(s))
        return 0.0;

    const Board& board = pos.board();
    double score = weights.material * material(board);

    if (difficulty >= Difficulty::Medium) {
        score += weights.piece_square * (piece_square(board) + passed_pawns(board));
        score += weights.mobility * kMobilityScale * mobility(pos);
    }

    if (difficulty >= Difficulty::Hard)
        score += weights.king_safety * king_safety(board);

    return score;
}

}  // namespace termchess::eval
