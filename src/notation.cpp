/// @file notation.cpp
/// Square names and UCI move text.

#include <termchess/notation.hpp>

namespace termchess {

std::string square_name(Square sq) {
    std::string name(2, ' ');
    name[0] = static_cast<char>('a' + file_of(sq));
    name[1] = static_cast<char>('1' + rank_of(sq));
    return name;
}

Square parse_square(std::string_view name) {
    if (name.size() != 2)
        return kNoSquare;
    const int file = name[0] - 'a';
    const int rank = name[1] - '1';
    return on_board(file, rank) ? make_square(file, rank) : kNoSquare;
}

std::string Move::uci() const {
    std::string text = square_name(from_sq) + square_name(to_sq);
    if (promotion != PieceType::None)
        text += kPieceLetters[static_cast<int>(promotion)];
    return text;
}

std::optional<UciMove> parse_uci(std::string_view text) {
    if (text.size() != 4 && text.size() != 5)
        return std::nullopt;

    const Square from = parse_square(text.substr(0, 2));
    const Square to = parse_square(text.substr(2, 2));
    if (from == kNoSquare || to == kNoSquare)
        return std::nullopt;

    UciMove parsed{from, to, PieceType::None};
    if (text.size() == 5) {
        switch (text[4]) {
                // clang-format off
            case 'n': parsed.promotion = PieceType::Knight; break;
            case 'b': parsed.promotion = PieceType::Bishop; break;
            case 'r': parsed.promotion = PieceType::Rook; break;
            case 'q': parsed.promotion = PieceType::Queen; break;
            default:  return std::nullopt;
                // clang-format on
        }
    }
    return parsed;
}

}  // namespace termchess
