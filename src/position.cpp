/// @file position.cpp
/// Position implementation: constructors, FEN, make_move, attacks, hashing.

#include <termchess/position.hpp>

#include <termchess/attacks.hpp>
#include <termchess/movegen.hpp>
#include <termchess/notation.hpp>

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string>
#include <vector>

namespace termchess {

// ── Zobrist keys ────────────────────────────────────────────────────────────

namespace {

struct ZobristKeys {
    std::uint64_t piece[2][kNumPieceTypes][64]{};
    std::uint64_t castling[16]{};
    std::uint64_t en_passant_file[8]{};
    std::uint64_t black_to_move = 0;
};

/// xorshift64* stream; any fixed seed gives a usable key set.
constexpr ZobristKeys generate_keys() noexcept {
    std::uint64_t state = 0x9D39247E33776D41ULL;
    auto next = [&state]() {
        state ^= state >> 12;
        state ^= state << 25;
        state ^= state >> 27;
        return state * 0x2545F4914F6CDD1DULL;
    };

    ZobristKeys k{};
    for (auto& by_color : k.piece)
        for (auto& by_type : by_color)
            for (auto& key : by_type) key = next();
    for (auto& key : k.castling) key = next();
    for (auto& key : k.en_passant_file) key = next();
    k.black_to_move = next();
    return k;
}

constexpr ZobristKeys kZobrist = generate_keys();

std::uint64_t piece_key(Piece p, Square sq) noexcept {
    return kZobrist.piece[color_index(p.color)][piece_index(p.type)][sq];
}

std::uint64_t state_key(Color side, CastlingRights castling, Square ep) noexcept {
    std::uint64_t key = kZobrist.castling[castling & 0xF];
    if (ep != kNoSquare)
        key ^= kZobrist.en_passant_file[file_of(ep)];
    if (side == Color::Black)
        key ^= kZobrist.black_to_move;
    return key;
}

/// Castling rights that survive a move touching `sq` (as origin or target).
constexpr CastlingRights rights_kept(Square sq) noexcept {
    switch (sq) {
        case A1:
            return static_cast<CastlingRights>(kCastlingAll ^ kWhiteQueenside);
        case H1:
            return static_cast<CastlingRights>(kCastlingAll ^ kWhiteKingside);
        case E1:
            return static_cast<CastlingRights>(kCastlingAll ^ kWhiteBoth);
        case A8:
            return static_cast<CastlingRights>(kCastlingAll ^ kBlackQueenside);
        case H8:
            return static_cast<CastlingRights>(kCastlingAll ^ kBlackKingside);
        case E8:
            return static_cast<CastlingRights>(kCastlingAll ^ kBlackBoth);
        default:
            return kCastlingAll;
    }
}

/// Square of the pawn removed by an en-passant capture.
constexpr Square en_passant_victim(Move m) noexcept {
    return make_square(file_of(m.to_sq), rank_of(m.from_sq));
}

/// Rook origin and destination for a castling move.
struct RookHop {
    Square from;
    Square to;
};

constexpr RookHop castling_rook(Move m) noexcept {
    const int r = rank_of(m.from_sq);
    if (m.flag == MoveFlag::CastleKingside)
        return {make_square(7, r), make_square(5, r)};
    return {make_square(0, r), make_square(3, r)};
}

std::vector<std::string_view> split_fields(std::string_view sv) {
    std::vector<std::string_view> fields;
    std::size_t i = 0;
    while (i < sv.size()) {
        while (i < sv.size() && sv[i] == ' ') ++i;
        if (i >= sv.size())
            break;
        std::size_t start = i;
        while (i < sv.size() && sv[i] != ' ') ++i;
        fields.push_back(sv.substr(start, i - start));
    }
    return fields;
}

int parse_clock(std::string_view sv, int min_val) {
    int val = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), val);
    if (ec != std::errc{} || ptr != sv.data() + sv.size() || val < min_val) {
        throw std::invalid_argument("Invalid clock in FEN: " + std::string(sv));
    }
    return val;
}

Board parse_placement(std::string_view placement) {
    Board board;
    int rank = 7;
    int file = 0;
    for (char ch : placement) {
        if (ch == '/') {
            if (file != 8 || rank == 0)
                throw std::invalid_argument("Invalid FEN rank layout: " + std::string(placement));
            --rank;
            file = 0;
        } else if (ch >= '1' && ch <= '8') {
            file += ch - '0';
            if (file > 8)
                throw std::invalid_argument("Invalid FEN rank width: " + std::string(placement));
        } else {
            Piece p = Piece::from_fen_char(ch);
            if (p.is_empty() || file >= 8)
                throw std::invalid_argument(std::string("Invalid FEN piece char: ") + ch);
            board.put_piece(make_square(file, rank), p);
            ++file;
        }
    }
    if (rank != 0 || file != 8)
        throw std::invalid_argument("Invalid FEN board placement: " + std::string(placement));
    return board;
}

}  // namespace

// ── Constructors ────────────────────────────────────────────────────────────

Position::Position(const Board& board, Color side, CastlingRights castling, Square ep,
                   int halfmove, int fullmove)
    : board_(board),
      side_to_move_(side),
      castling_(castling),
      en_passant_(ep),
      halfmove_clock_(halfmove),
      fullmove_number_(fullmove) {
    compute_key();
}

Position::Position() {
    compute_key();
}

// ── Factory ─────────────────────────────────────────────────────────────────

Position Position::initial() {
    return from_fen(kStartingFen);
}

Position Position::from_fen(std::string_view fen) {
    auto fields = split_fields(fen);
    if (fields.size() < 4 || fields.size() > 6) {
        throw std::invalid_argument("Invalid FEN (need 4-6 fields): " + std::string(fen));
    }

    Board board = parse_placement(fields[0]);

    Color side = Color::White;
    if (fields[1] == "b") {
        side = Color::Black;
    } else if (fields[1] != "w") {
        throw std::invalid_argument("Invalid FEN side-to-move: " + std::string(fields[1]));
    }

    CastlingRights castling = kCastlingNone;
    if (fields[2] != "-") {
        for (char ch : fields[2]) {
            switch (ch) {
                case 'K':
                    castling |= kWhiteKingside;
                    break;
                case 'Q':
                    castling |= kWhiteQueenside;
                    break;
                case 'k':
                    castling |= kBlackKingside;
                    break;
                case 'q':
                    castling |= kBlackQueenside;
                    break;
                default:
                    throw std::invalid_argument(std::string("Invalid castling char in FEN: ") +
                                                ch);
            }
        }
    }

    Square ep = kNoSquare;
    if (fields[3] != "-") {
        ep = parse_square(fields[3]);
        if (ep == kNoSquare) {
            throw std::invalid_argument("Invalid FEN en-passant square: " +
                                        std::string(fields[3]));
        }
    }

    int halfmove = fields.size() > 4 ? parse_clock(fields[4], 0) : 0;
    int fullmove = fields.size() > 5 ? parse_clock(fields[5], 1) : 1;

    return Position(board, side, castling, ep, halfmove, fullmove);
}

std::string Position::to_fen() const {
    std::string fen;
    fen.reserve(90);

    for (int rank = 7; rank >= 0; --rank) {
        int empty = 0;
        for (int file = 0; file < 8; ++file) {
            Piece p = board_.piece_at(make_square(file, rank));
            if (p.is_empty()) {
                ++empty;
                continue;
            }
            if (empty > 0) {
                fen += static_cast<char>('0' + empty);
                empty = 0;
            }
            fen += p.fen_char();
        }
        if (empty > 0)
            fen += static_cast<char>('0' + empty);
        if (rank > 0)
            fen += '/';
    }

    fen += side_to_move_ == Color::White ? " w " : " b ";

    if (castling_ == kCastlingNone) {
        fen += '-';
    } else {
        if (castling_ & kWhiteKingside) fen += 'K';
        if (castling_ & kWhiteQueenside) fen += 'Q';
        if (castling_ & kBlackKingside) fen += 'k';
        if (castling_ & kBlackQueenside) fen += 'q';
    }

    fen += ' ';
    fen += en_passant_ == kNoSquare ? std::string("-") : square_name(en_passant_);
    fen += ' ' + std::to_string(halfmove_clock_) + ' ' + std::to_string(fullmove_number_);
    return fen;
}

// ── Move operations ─────────────────────────────────────────────────────────

void Position::make_move(Move m) {
    const Piece moving = board_.piece_at(m.from_sq);
    bool resets_clock = moving.type == PieceType::Pawn;

    key_ ^= state_key(side_to_move_, castling_, en_passant_);

    if (m.flag == MoveFlag::EnPassant) {
        remove_and_hash(en_passant_victim(m));
        resets_clock = true;
    } else if (!board_.is_empty(m.to_sq)) {
        remove_and_hash(m.to_sq);
        resets_clock = true;
    }

    if (m.flag == MoveFlag::Promotion && m.promotion != PieceType::None) {
        remove_and_hash(m.from_sq);
        put_and_hash(m.to_sq, Piece{moving.color, m.promotion});
    } else {
        move_and_hash(m.from_sq, m.to_sq);
    }

    if (m.flag == MoveFlag::CastleKingside || m.flag == MoveFlag::CastleQueenside) {
        RookHop hop = castling_rook(m);
        move_and_hash(hop.from, hop.to);
    }

    en_passant_ = kNoSquare;
    if (m.flag == MoveFlag::DoublePawn) {
        en_passant_ = make_square(file_of(m.from_sq), (rank_of(m.from_sq) + rank_of(m.to_sq)) / 2);
    }
    castling_ = castling_ & rights_kept(m.from_sq) & rights_kept(m.to_sq);

    halfmove_clock_ = resets_clock ? 0 : halfmove_clock_ + 1;
    if (side_to_move_ == Color::Black)
        ++fullmove_number_;
    side_to_move_ = opposite(side_to_move_);

    key_ ^= state_key(side_to_move_, castling_, en_passant_);
    key_history_.push_back(key_);
}

void Position::play(Move m) {
    MoveList legal = movegen::legal(*this);
    if (!legal.contains(m)) {
        throw std::invalid_argument("Illegal move in position " + to_fen() + ": " + m.uci());
    }
    make_move(m);
}

Board Position::board_after(Move m) const {
    Board b = board_;
    const Piece moving = b.piece_at(m.from_sq);
    if (m.flag == MoveFlag::EnPassant)
        b.remove_piece(en_passant_victim(m));
    b.remove_piece(m.to_sq);
    b.remove_piece(m.from_sq);
    b.put_piece(m.to_sq, m.flag == MoveFlag::Promotion ? Piece{moving.color, m.promotion} : moving);
    if (m.flag == MoveFlag::CastleKingside || m.flag == MoveFlag::CastleQueenside) {
        RookHop hop = castling_rook(m);
        b.move_piece(hop.from, hop.to);
    }
    return b;
}

// ── Attack queries ──────────────────────────────────────────────────────────

bool Position::is_square_attacked(Square sq, Color by) const noexcept {
    return attacks::is_square_attacked(board_, sq, by);
}

bool Position::is_in_check() const noexcept {
    return is_in_check(side_to_move_);
}

bool Position::is_in_check(Color c) const noexcept {
    Square king = board_.king_square(c);
    return king != kNoSquare && is_square_attacked(king, opposite(c));
}

// ── Repetition ──────────────────────────────────────────────────────────────

int Position::repetition_count() const {
    return static_cast<int>(std::count(key_history_.begin(), key_history_.end(), key_));
}

void Position::seed_history(const std::vector<std::uint64_t>& earlier_keys) {
    key_history_.insert(key_history_.begin(), earlier_keys.begin(), earlier_keys.end());
}

// ── Private helpers ─────────────────────────────────────────────────────────

void Position::compute_key() {
    key_ = state_key(side_to_move_, castling_, en_passant_);
    for (int sq = 0; sq < 64; ++sq) {
        Piece p = board_.piece_at(static_cast<Square>(sq));
        if (!p.is_empty())
            key_ ^= piece_key(p, static_cast<Square>(sq));
    }
    key_history_.assign(1, key_);
}

void Position::move_and_hash(Square from, Square to) {
    Piece p = board_.piece_at(from);
    key_ ^= piece_key(p, from) ^ piece_key(p, to);
    board_.move_piece(from, to);
}

void Position::remove_and_hash(Square sq) {
    key_ ^= piece_key(board_.piece_at(sq), sq);
    board_.remove_piece(sq);
}

void Position::put_and_hash(Square sq, Piece p) {
    key_ ^= piece_key(p, sq);
    board_.put_piece(sq, p);
}

}  // namespace termchess
