#pragma once

/// @file minimax_engine.hpp
/// Medium and Hard tier engine: iterative-deepening alpha-beta search.

#include <termchess/engine.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace termchess {

class MinimaxEngine final : public Engine, public Configurable, public Stateful, public Inspectable {
   public:
    /// Engine with the tier's default depth and time limit. Only Medium and
    /// Hard are accepted; anything else throws EngineError{InvalidConfiguration}.
    explicit MinimaxEngine(Difficulty difficulty);

    [[nodiscard]] static int default_depth(Difficulty difficulty) noexcept;
    [[nodiscard]] static std::chrono::milliseconds default_time_limit(Difficulty difficulty) noexcept;

    // Engine
    [[nodiscard]] Move select_move(Deadline deadline, const Position& pos) override;
    [[nodiscard]] std::string name() const override;
    void close() noexcept override { closed_.store(true); }
    [[nodiscard]] bool is_closed() const noexcept override { return closed_.load(); }

    // Configurable
    void configure(const EngineConfig& config) override;

    // Stateful
    void set_position_history(const std::vector<Position>& history) override;

    // Inspectable
    [[nodiscard]] EngineInfo info() const override;

    /// Called after every completed depth of the next searches.
    void set_info_callback(SearchInfoCallback cb) { on_info_ = std::move(cb); }

    /// Statistics of the most recent select_move() search.
    [[nodiscard]] const SearchResult& last_search() const noexcept { return last_search_; }

    [[nodiscard]] Difficulty difficulty() const noexcept { return difficulty_; }
    [[nodiscard]] int search_depth() const noexcept { return depth_; }
    [[nodiscard]] std::chrono::milliseconds time_limit() const noexcept { return time_limit_; }
    [[nodiscard]] const EvalWeights& weights() const noexcept { return weights_; }

   private:
    Difficulty difficulty_;
    int depth_;
    std::chrono::milliseconds time_limit_;
    EvalWeights weights_;

    std::vector<std::uint64_t> history_keys_;
    SearchInfoCallback on_info_;
    SearchResult last_search_;
    std::atomic<bool> closed_{false};
};

}  // namespace termchess
