#pragma once

/// @file random_engine.hpp
/// Easy-tier engine: random legal moves, biased towards captures and checks.

#include <termchess/engine.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>

namespace termchess {

class RandomEngine final : public Engine, public Inspectable {
   public:
    static constexpr std::chrono::milliseconds kDefaultTimeLimit{2000};

    /// Probability of playing a capture when one exists.
    static constexpr double kCaptureBias = 0.7;
    /// Probability of playing a checking move, tried after captures.
    static constexpr double kCheckBias = 0.5;

    explicit RandomEngine(std::uint64_t seed = std::random_device{}(),
                          std::chrono::milliseconds time_limit = kDefaultTimeLimit);

    /// Stops classifying captures and checks at min(deadline, now + time
    /// limit) and then picks uniformly among all legal moves.
    [[nodiscard]] Move select_move(Deadline deadline, const Position& pos) override;
    [[nodiscard]] std::string name() const override { return "Easy Bot"; }
    void close() noexcept override { closed_.store(true); }
    [[nodiscard]] bool is_closed() const noexcept override { return closed_.load(); }

    [[nodiscard]] EngineInfo info() const override;

    [[nodiscard]] std::chrono::milliseconds time_limit() const noexcept { return time_limit_; }

   private:
    Move pick(const MoveList& moves);

    std::mt19937_64 rng_;
    std::chrono::milliseconds time_limit_;
    std::atomic<bool> closed_{false};
};

}  // namespace termchess
