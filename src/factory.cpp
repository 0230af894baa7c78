/// @file factory.cpp
/// Engine factory functions.

#include <termchess/factory.hpp>

#include <random>
#include <string>

namespace termchess {

void validate(const EngineOptions& options) {
    if (options.time_limit && options.time_limit->count() <= 0) {
        throw EngineError(EngineErrc::InvalidConfiguration,
                          "time limit must be positive, got " +
                              std::to_string(options.time_limit->count()) + "ms");
    }
    if (options.search_depth &&
        (*options.search_depth < kMinSearchDepth || *options.search_depth > kMaxSearchDepth)) {
        throw EngineError(EngineErrc::InvalidConfiguration,
                          "search depth must be between 1 and 20, got " +
                              std::to_string(*options.search_depth));
    }
}

std::unique_ptr<RandomEngine> make_random_engine(const EngineOptions& options) {
    validate(options);
    const std::uint64_t seed = options.seed ? *options.seed : std::random_device{}();
    return std::make_unique<RandomEngine>(seed,
                                          options.time_limit.value_or(RandomEngine::kDefaultTimeLimit));
}

std::unique_ptr<MinimaxEngine> make_minimax_engine(Difficulty difficulty,
                                                   const EngineOptions& options) {
    validate(options);
    auto engine = std::make_unique<MinimaxEngine>(difficulty);

    EngineConfig config;
    config.search_depth = options.search_depth;
    config.time_limit = options.time_limit;
    engine->configure(config);
    return engine;
}

std::unique_ptr<Engine> make_engine(Difficulty difficulty, const EngineOptions& options) {
    if (difficulty == Difficulty::Easy)
        return make_random_engine(options);
    return make_minimax_engine(difficulty, options);
}

}  // namespace termchess
