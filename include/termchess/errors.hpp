#pragma once

/// @file errors.hpp
/// Error type thrown by engines and the engine factory.

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace termchess {

enum class EngineErrc : std::uint8_t {
    Closed,                ///< select_move()/configure() on a closed engine.
    NoLegalMoves,          ///< Position is already checkmate or stalemate.
    InvalidConfiguration,  ///< Out-of-range depth, time limit or difficulty.
};

[[nodiscard]] constexpr std::string_view to_string(EngineErrc code) noexcept {
    switch (code) {
        case EngineErrc::Closed:
            return "engine is closed";
        case EngineErrc::NoLegalMoves:
            return "no legal moves available";
        case EngineErrc::InvalidConfiguration:
            return "invalid configuration";
    }
    return "unknown engine error";
}

class EngineError : public std::runtime_error {
   public:
    explicit EngineError(EngineErrc code)
        : std::runtime_error(std::string(to_string(code))), code_(code) {}

    EngineError(EngineErrc code, const std::string& detail)
        : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code) {}

    [[nodiscard]] EngineErrc code() const noexcept { return code_; }

   private:
    EngineErrc code_;
};

}  // namespace termchess
