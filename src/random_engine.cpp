/// @file random_engine.cpp
/// Category-weighted random move selection.

#include <termchess/random_engine.hpp>

#include <termchess/move_order.hpp>

#include <algorithm>

namespace termchess {

RandomEngine::RandomEngine(std::uint64_t seed, std::chrono::milliseconds time_limit)
    : rng_(seed), time_limit_(time_limit) {}

Move RandomEngine::select_move(Deadline deadline, const Position& pos) {
    if (is_closed())
        throw EngineError(EngineErrc::Closed);

    const MoveList moves = movegen::legal(pos);
    if (moves.empty())
        throw EngineError(EngineErrc::NoLegalMoves);
    if (moves.size() == 1)
        return moves[0];

    const Deadline effective = std::min(deadline, deadline_after(Clock::now(), time_limit_));

    // Classifying checks plays every move; once out of time the pick is uniform.
    MoveList captures;
    MoveList checks;
    for (const Move& m : moves) {
        if (Clock::now() >= effective)
            return pick(moves);
        if (is_capture(pos, m))
            captures.push(m);
        Position child = pos;
        child.make_move(m);
        if (child.is_in_check())
            checks.push(m);
    }

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng_) < kCaptureBias && !captures.empty())
        return pick(captures);
    if (coin(rng_) < kCheckBias && !checks.empty())
        return pick(checks);
    return pick(moves);
}

Move RandomEngine::pick(const MoveList& moves) {
    std::uniform_int_distribution<int> index(0, moves.size() - 1);
    return moves[index(rng_)];
}

EngineInfo RandomEngine::info() const {
    return EngineInfo{
        name(),
        "TermChess",
        "1.0",
        EngineType::Internal,
        Difficulty::Easy,
        {
            {"random_selection", true},
            {"tactical_awareness", true},
            {"weighted_selection", true},
        },
    };
}

}  // namespace termchess
