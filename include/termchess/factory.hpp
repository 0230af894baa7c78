#pragma once

/// @file factory.hpp
/// Engine construction with validated options.

#include <termchess/minimax_engine.hpp>
#include <termchess/random_engine.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace termchess {

/// Construction-time options. Unset fields take the difficulty's defaults.
struct EngineOptions {
    std::optional<std::chrono::milliseconds> time_limit;
    std::optional<int> search_depth;  ///< Ignored by the random engine.
    std::optional<std::uint64_t> seed;  ///< Random engine only; unset = nondeterministic.
};

/// Throws EngineError{InvalidConfiguration} on a non-positive time limit or
/// a depth outside 1..20.
void validate(const EngineOptions& options);

[[nodiscard]] std::unique_ptr<RandomEngine> make_random_engine(const EngineOptions& options = {});

/// `difficulty` must be Medium or Hard.
[[nodiscard]] std::unique_ptr<MinimaxEngine> make_minimax_engine(Difficulty difficulty,
                                                                 const EngineOptions& options = {});

/// Easy builds a RandomEngine, Medium and Hard a MinimaxEngine.
[[nodiscard]] std::unique_ptr<Engine> make_engine(Difficulty difficulty,
                                                  const EngineOptions& options = {});

}  // namespace termchess
