/// @file minimax_engine.cpp
/// Minimax engine: deadline resolution, configuration, search bookkeeping.

#include <termchess/minimax_engine.hpp>

#include <algorithm>
#include <string>

namespace termchess {

MinimaxEngine::MinimaxEngine(Difficulty difficulty)
    : difficulty_(difficulty),
      depth_(default_depth(difficulty)),
      time_limit_(default_time_limit(difficulty)) {
    if (difficulty != Difficulty::Medium && difficulty != Difficulty::Hard) {
        throw EngineError(EngineErrc::InvalidConfiguration,
                          "minimax engine needs Medium or Hard difficulty, got " +
                              std::string(to_string(difficulty)));
    }
}

int MinimaxEngine::default_depth(Difficulty difficulty) noexcept {
    return difficulty == Difficulty::Hard ? 6 : 4;
}

std::chrono::milliseconds MinimaxEngine::default_time_limit(Difficulty difficulty) noexcept {
    using namespace std::chrono_literals;
    return difficulty == Difficulty::Hard ? 8000ms : 4000ms;
}

std::string MinimaxEngine::name() const {
    return difficulty_ == Difficulty::Hard ? "Hard Bot" : "Medium Bot";
}

// ── Search ──────────────────────────────────────────────────────────────────

Move MinimaxEngine::select_move(Deadline deadline, const Position& pos) {
    if (is_closed())
        throw EngineError(EngineErrc::Closed);
    if (!movegen::has_legal_move(pos))
        throw EngineError(EngineErrc::NoLegalMoves);

    const Deadline effective = std::min(deadline, deadline_after(Clock::now(), time_limit_));

    Position root = pos;
    if (!history_keys_.empty())
        root.seed_history(history_keys_);

    Searcher searcher(difficulty_, weights_, effective);
    if (on_info_)
        searcher.set_info_callback(on_info_);

    last_search_ = searcher.iterate(root, depth_);
    return last_search_.best_move;
}

// ── Configuration ───────────────────────────────────────────────────────────

void MinimaxEngine::configure(const EngineConfig& config) {
    if (is_closed())
        throw EngineError(EngineErrc::Closed);

    if (config.search_depth &&
        (*config.search_depth < kMinSearchDepth || *config.search_depth > kMaxSearchDepth)) {
        throw EngineError(EngineErrc::InvalidConfiguration,
                          "search depth must be between 1 and 20, got " +
                              std::to_string(*config.search_depth));
    }
    if (config.time_limit && config.time_limit->count() <= 0) {
        throw EngineError(EngineErrc::InvalidConfiguration,
                          "time limit must be positive, got " +
                              std::to_string(config.time_limit->count()) + "ms");
    }

    if (config.search_depth)
        depth_ = *config.search_depth;
    if (config.time_limit)
        time_limit_ = *config.time_limit;
    if (config.material_weight)
        weights_.material = *config.material_weight;
    if (config.piece_square_weight)
        weights_.piece_square = *config.piece_square_weight;
    if (config.mobility_weight)
        weights_.mobility = *config.mobility_weight;
    if (config.king_safety_weight)
        weights_.king_safety = *config.king_safety_weight;
}

void MinimaxEngine::set_position_history(const std::vector<Position>& history) {
    history_keys_.clear();
    history_keys_.reserve(history.size());
    for (const Position& p : history) history_keys_.push_back(p.key());
}

// ── Introspection ───────────────────────────────────────────────────────────

EngineInfo MinimaxEngine::info() const {
    const bool positional = difficulty_ >= Difficulty::Medium;
    return EngineInfo{
        name(),
        "TermChess",
        "1.0",
        EngineType::Internal,
        difficulty_,
        {
            {"alpha_beta", true},
            {"iterative_deepening", true},
            {"move_ordering", true},
            {"configurable", true},
            {"piece_square_tables", positional},
            {"mobility", positional},
            {"passed_pawns", positional},
            {"king_safety", difficulty_ >= Difficulty::Hard},
        },
    };
}

}  // namespace termchess
