#pragma once

/// @file engine.hpp
/// Engine capabilities. Every engine implements Engine; the others are
/// optional and probed at runtime with as_configurable() and friends.

#include <termchess/errors.hpp>
#include <termchess/evaluation.hpp>
#include <termchess/search.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termchess {

enum class EngineType : std::uint8_t { Internal, UCI, RL };

[[nodiscard]] constexpr std::string_view to_string(EngineType t) noexcept {
    switch (t) {
        case EngineType::Internal:
            return "internal";
        case EngineType::UCI:
            return "uci";
        case EngineType::RL:
            return "rl";
    }
    return "unknown";
}

/// Static description of an engine.
struct EngineInfo {
    std::string name;
    std::string author;
    std::string version;
    EngineType type = EngineType::Internal;
    Difficulty difficulty = Difficulty::Easy;
    std::map<std::string, bool> features;
};

/// Runtime reconfiguration. Unset fields are left as they are.
struct EngineConfig {
    std::optional<int> search_depth;                    ///< 1..20
    std::optional<std::chrono::milliseconds> time_limit;  ///< > 0
    std::optional<double> material_weight;
    std::optional<double> piece_square_weight;
    std::optional<double> mobility_weight;
    std::optional<double> king_safety_weight;
};

inline constexpr int kMinSearchDepth = 1;
inline constexpr int kMaxSearchDepth = 20;

// ── Capabilities ────────────────────────────────────────────────────────────

class Engine {
   public:
    virtual ~Engine() = default;

    /// Pick a legal move for the side to move in `pos`.
    ///
    /// Throws EngineError{Closed} after close() and EngineError{NoLegalMoves}
    /// when `pos` is already decided. Running past `deadline` is not an
    /// error: the best move found so far is returned.
    [[nodiscard]] virtual Move select_move(Deadline deadline, const Position& pos) = 0;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Release the engine. Idempotent.
    virtual void close() noexcept = 0;

    [[nodiscard]] virtual bool is_closed() const noexcept = 0;
};

class Configurable {
   public:
    virtual ~Configurable() = default;

    /// Validate every set field, then apply them all. On failure throws
    /// EngineError{InvalidConfiguration} and changes nothing.
    virtual void configure(const EngineConfig& config) = 0;
};

class Stateful {
   public:
    virtual ~Stateful() = default;

    /// Positions played before the next select_move() position, oldest
    /// first. Used for repetition detection inside the search.
    virtual void set_position_history(const std::vector<Position>& history) = 0;
};

class Inspectable {
   public:
    virtual ~Inspectable() = default;

    [[nodiscard]] virtual EngineInfo info() const = 0;
};

[[nodiscard]] inline Configurable* as_configurable(Engine& e) noexcept {
    return dynamic_cast<Configurable*>(&e);
}

[[nodiscard]] inline Stateful* as_stateful(Engine& e) noexcept {
    return dynamic_cast<Stateful*>(&e);
}

[[nodiscard]] inline const Inspectable* as_inspectable(const Engine& e) noexcept {
    return dynamic_cast<const Inspectable*>(&e);
}

}  // namespace termchess
