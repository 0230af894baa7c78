/// @file search.cpp
/// Negamax alpha-beta and the iterative-deepening driver.

#include <termchess/search.hpp>

#include <termchess/move_order.hpp>

#include <limits>
#include <utility>

namespace termchess {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

}  // namespace

Searcher::Searcher(Difficulty difficulty, const EvalWeights& weights, Deadline deadline)
    : difficulty_(difficulty), weights_(weights), deadline_(deadline) {}

// ── Iterative deepening ─────────────────────────────────────────────────────

SearchResult Searcher::iterate(const Position& pos, int max_depth) {
    const auto start = Clock::now();
    SearchResult result;

    const MoveList moves = movegen::legal(pos);
    if (moves.empty())
        return result;

    // Last-resort answer until a depth completes.
    result.best_move = moves[0];
    if (moves.size() == 1)
        return result;

    for (int depth = 1; depth <= max_depth; ++depth) {
        if (deadline_passed()) {
            result.timed_out = true;
            break;
        }

        RootResult root = search_root(pos, depth);
        if (!root.completed) {
            // Scores in an interrupted depth are placeholders; keep the previous answer.
            result.timed_out = true;
            break;
        }

        result.best_move = root.best_move;
        result.score = root.score;
        result.depth = depth;

        if (on_info_) {
            on_info_({depth, root.score, nodes_,
                      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start),
                      root.best_move});
        }
    }

    result.nodes = nodes_;
    return result;
}

// ── Root search ─────────────────────────────────────────────────────────────

RootResult Searcher::search_root(const Position& pos, int depth) {
    RootResult result;
    const MoveList moves = order_moves(pos, movegen::legal(pos));

    double alpha = -kInfinity;
    const double beta = kInfinity;
    double best_score = -kInfinity;

    for (const Move& m : moves) {
        if (deadline_passed())
            return result;

        Position child = pos;
        child.make_move(m);
        const double score = -alpha_beta(child, depth - 1, -beta, -alpha, 1);

        if (score > best_score) {
            best_score = score;
            result.best_move = m;
        }
        if (score > alpha)
            alpha = score;
        if (alpha >= beta)
            break;
    }

    result.score = best_score;
    result.completed = !stopped_;
    return result;
}

// ── Negamax with alpha-beta ─────────────────────────────────────────────────

double Searcher::alpha_beta(const Position& pos, int depth, double alpha, double beta, int ply) {
    if (deadline_passed())
        return 0.0;

    ++nodes_;

    if (depth == 0)
        return leaf_score(pos, ply);

    const MoveList moves = movegen::legal(pos);
    if (moves.empty() || is_game_over(pos))
        return leaf_score(pos, ply);

    double best_score = -kInfinity;
    for (const Move& m : order_moves(pos, moves)) {
        Position child = pos;
        child.make_move(m);
        const double score = -alpha_beta(child, depth - 1, -beta, -alpha, ply + 1);

        if (score > best_score)
            best_score = score;
        if (score > alpha)
            alpha = score;
        if (alpha >= beta)
            break;
    }
    return best_score;
}

double Searcher::leaf_score(const Position& pos, int ply) const {
    double white_score = eval::evaluate(pos, difficulty_, weights_);
    if (white_score >= eval::kMateScore) {
        white_score -= ply;
    } else if (white_score <= -eval::kMateScore) {
        white_score += ply;
    }
    return pos.side_to_move() == Color::White ? white_score : -white_score;
}

bool Searcher::deadline_passed() {
    if (!stopped_ && Clock::now() >= deadline_)
        stopped_ = true;
    return stopped_;
}

}  // namespace termchess
