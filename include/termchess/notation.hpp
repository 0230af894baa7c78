#pragma once

/// @file notation.hpp
/// Text forms at the rules boundary: square names for FEN, UCI move strings.

#include <termchess/move.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace termchess {

/// "a1" .. "h8".
[[nodiscard]] std::string square_name(Square sq);

/// kNoSquare unless `name` is exactly a file letter and a rank digit.
[[nodiscard]] Square parse_square(std::string_view name);

/// The squares and promotion piece a UCI string names. It carries no
/// MoveFlag: only a position can tell a castle or an en-passant capture
/// apart, see movegen::find_move().
struct UciMove {
    Square from_sq;
    Square to_sq;
    PieceType promotion;
};

/// std::nullopt for anything but four or five characters of the form
/// <square><square>[n|b|r|q].
[[nodiscard]] std::optional<UciMove> parse_uci(std::string_view text);

}  // namespace termchess
