#pragma once

/// @file search.hpp
/// Negamax alpha-beta search with deadline-bounded iterative deepening.
///
/// Scores are pawn units. The evaluator speaks from White's side; the search
/// folds that into side-to-move form at the leaves.

#include <termchess/evaluation.hpp>
#include <termchess/movegen.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

namespace termchess {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

/// `now + budget`, saturating at Deadline::max(). Time budgets are only
/// bounded below, and a large one would overflow the clock's nanosecond
/// count. A non-positive budget gives `now`.
[[nodiscard]] inline Deadline deadline_after(Deadline now, std::chrono::milliseconds budget) noexcept {
    if (budget.count() <= 0)
        return now;
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Deadline::max() - now);
    if (budget >= headroom)
        return Deadline::max();
    return now + budget;
}

// ── Search result ───────────────────────────────────────────────────────────

/// Outcome of one iterative-deepening run.
struct SearchResult {
    Move best_move{};
    double score = 0.0;      ///< Side-to-move score of the last completed depth.
    int depth = 0;           ///< Last completed depth (0 = no search ran).
    std::uint64_t nodes = 0;
    bool timed_out = false;  ///< The deadline cut the run short.
};

/// Progress report after each completed depth.
struct SearchInfo {
    int depth = 0;
    double score = 0.0;
    std::uint64_t nodes = 0;
    std::chrono::milliseconds elapsed{0};
    Move best_move{};
};

using SearchInfoCallback = std::function<void(const SearchInfo&)>;

/// Root-level search outcome: best move and its score at one depth.
struct RootResult {
    Move best_move{};
    double score = 0.0;
    bool completed = false;  ///< False when the deadline expired mid-run.
};

// ── Searcher ────────────────────────────────────────────────────────────────

/// One search over one position snapshot. Never mutates the caller's
/// Position: every trial move is made on a private copy.
class Searcher {
   public:
    Searcher(Difficulty difficulty, const EvalWeights& weights, Deadline deadline);

    /// Invoked after every completed depth of iterate().
    void set_info_callback(SearchInfoCallback cb) { on_info_ = std::move(cb); }

    /// Iterative deepening, depth 1..max_depth, under the deadline.
    ///
    /// A single legal move is returned without searching. A depth that the
    /// deadline interrupts is discarded; if no depth completes, the first
    /// legal move is returned. best_move is null only when `pos` has no
    /// legal moves.
    [[nodiscard]] SearchResult iterate(const Position& pos, int max_depth);

    /// Root variant of alpha_beta(): full window, reports the best move.
    [[nodiscard]] RootResult search_root(const Position& pos, int depth);

    /// Negamax with alpha-beta pruning. Returns a side-to-move score.
    /// After the deadline passes every node returns 0 and stopped() is set.
    [[nodiscard]] double alpha_beta(const Position& pos, int depth, double alpha, double beta,
                                    int ply);

    /// Static score of `pos` in side-to-move form, mate scores pulled
    /// towards zero by `ply` so nearer mates rank higher.
    [[nodiscard]] double leaf_score(const Position& pos, int ply) const;

    [[nodiscard]] std::uint64_t nodes() const noexcept { return nodes_; }
    [[nodiscard]] bool stopped() const noexcept { return stopped_; }

   private:
    [[nodiscard]] bool deadline_passed();

    Difficulty difficulty_;
    EvalWeights weights_;
    Deadline deadline_;
    SearchInfoCallback on_info_;

    std::uint64_t nodes_ = 0;
    bool stopped_ = false;
};

}  // namespace termchess
