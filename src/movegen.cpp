/// @file movegen.cpp
/// Move generation over the bitboard board.

#include <termchess/movegen.hpp>

#include <termchess/attacks.hpp>
#include <termchess/notation.hpp>

namespace termchess::movegen {

namespace {

constexpr PieceType kPromotions[] = {PieceType::Queen, PieceType::Rook, PieceType::Bishop,
                                     PieceType::Knight};

void push_pawn_move(MoveList& ml, Color us, Square from, Square to) {
    if (relative_rank(us, to) == 7) {
        for (PieceType pt : kPromotions) ml.push({from, to, MoveFlag::Promotion, pt});
    } else {
        ml.push({from, to});
    }
}

// ── Pawns ───────────────────────────────────────────────────────────────────

void gen_pawn_moves(const Position& pos, MoveList& ml) {
    const Color us = pos.side_to_move();
    const Board& board = pos.board();
    const Bitboard enemy = board.occupied(opposite(us));
    const int forward = us == Color::White ? 8 : -8;

    Bitboard pawns = board.pieces(us, PieceType::Pawn);
    while (pawns) {
        const Square from = pop_lsb(pawns);

        // Pushes
        const int one = from + forward;
        if (one >= 0 && one < 64 && board.is_empty(static_cast<Square>(one))) {
            push_pawn_move(ml, us, from, static_cast<Square>(one));
            const int two = one + forward;
            if (relative_rank(us, from) == 1 && board.is_empty(static_cast<Square>(two))) {
                ml.push({from, static_cast<Square>(two), MoveFlag::DoublePawn});
            }
        }

        // Captures
        Bitboard targets = pawn_attacks(us, from) & enemy;
        while (targets) {
            push_pawn_move(ml, us, from, pop_lsb(targets));
        }

        if (pos.en_passant() != kNoSquare && test_bit(pawn_attacks(us, from), pos.en_passant())) {
            ml.push({from, pos.en_passant(), MoveFlag::EnPassant});
        }
    }
}

// ── Knights, sliders, king ──────────────────────────────────────────────────

Bitboard piece_targets(PieceType pt, Square from, Bitboard occ) noexcept {
    switch (pt) {
        case PieceType::Knight:
            return knight_attacks(from);
        case PieceType::Bishop:
            return attacks::bishop(from, occ);
        case PieceType::Rook:
            return attacks::rook(from, occ);
        case PieceType::Queen:
            return attacks::queen(from, occ);
        case PieceType::King:
            return king_attacks(from);
        default:
            return kEmptyBB;
    }
}

void gen_piece_moves(const Position& pos, MoveList& ml) {
    const Color us = pos.side_to_move();
    const Board& board = pos.board();
    const Bitboard occ = board.occupied_all();
    const Bitboard own = board.occupied(us);

    for (PieceType pt : {PieceType::Knight, PieceType::Bishop, PieceType::Rook, PieceType::Queen,
                         PieceType::King}) {
        Bitboard pieces = board.pieces(us, pt);
        while (pieces) {
            const Square from = pop_lsb(pieces);
            Bitboard targets = piece_targets(pt, from, occ) & ~own;
            while (targets) {
                ml.push({from, pop_lsb(targets)});
            }
        }
    }
}

// ── Castling ────────────────────────────────────────────────────────────────

void gen_castling(const Position& pos, MoveList& ml) {
    const Color us = pos.side_to_move();
    const Color them = opposite(us);
    const Board& board = pos.board();
    const int rank = us == Color::White ? 0 : 7;
    const Square king_sq = make_square(4, rank);

    if (board.piece_at(king_sq) != Piece{us, PieceType::King})
        return;
    if (pos.is_square_attacked(king_sq, them))
        return;

    const Piece rook{us, PieceType::Rook};
    const CastlingRights ks = us == Color::White ? kWhiteKingside : kBlackKingside;
    if ((pos.castling() & ks) && board.piece_at(make_square(7, rank)) == rook) {
        const Square f = make_square(5, rank);
        const Square g = make_square(6, rank);
        if (board.is_empty(f) && board.is_empty(g) && !pos.is_square_attacked(f, them) &&
            !pos.is_square_attacked(g, them)) {
            ml.push({king_sq, g, MoveFlag::CastleKingside});
        }
    }

    const CastlingRights qs = us == Color::White ? kWhiteQueenside : kBlackQueenside;
    if ((pos.castling() & qs) && board.piece_at(make_square(0, rank)) == rook) {
        const Square b = make_square(1, rank);
        const Square c = make_square(2, rank);
        const Square d = make_square(3, rank);
        if (board.is_empty(b) && board.is_empty(c) && board.is_empty(d) &&
            !pos.is_square_attacked(c, them) && !pos.is_square_attacked(d, them)) {
            ml.push({king_sq, c, MoveFlag::CastleQueenside});
        }
    }
}

bool leaves_king_safe(const Position& pos, Move m) {
    const Color us = pos.side_to_move();
    const Board after = pos.board_after(m);
    const Square king = after.king_square(us);
    return king == kNoSquare || !attacks::is_square_attacked(after, king, opposite(us));
}

}  // namespace

// ── Public API ──────────────────────────────────────────────────────────────

MoveList pseudo_legal(const Position& pos) {
    MoveList ml;
    gen_pawn_moves(pos, ml);
    gen_piece_moves(pos, ml);
    gen_castling(pos, ml);
    return ml;
}

MoveList legal(const Position& pos) {
    MoveList result;
    for (const Move& m : pseudo_legal(pos)) {
        if (leaves_king_safe(pos, m))
            result.push(m);
    }
    return result;
}

bool has_legal_move(const Position& pos) {
    for (const Move& m : pseudo_legal(pos)) {
        if (leaves_king_safe(pos, m))
            return true;
    }
    return false;
}

std::optional<Move> find_move(const Position& pos, std::string_view uci) {
    const auto wanted = parse_uci(uci);
    if (!wanted)
        return std::nullopt;
    for (const Move& m : legal(pos)) {
        if (m.from_sq == wanted->from_sq && m.to_sq == wanted->to_sq &&
            m.promotion == wanted->promotion) {
            return m;
        }
    }
    return std::nullopt;
}

std::uint64_t perft(const Position& pos, int depth) {
    if (depth == 0)
        return 1;

    MoveList moves = legal(pos);
    if (depth == 1)
        return static_cast<std::uint64_t>(moves.size());

    std::uint64_t nodes = 0;
    for (const Move& m : moves) {
        Position child = pos;
        child.make_move(m);
        nodes += perft(child, depth - 1);
    }
    return nodes;
}

}  // namespace termchess::movegen
