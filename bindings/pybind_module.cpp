/// @file pybind_module.cpp
/// pybind11 bindings for the termchess engines.
///
/// Exposes the `_termchess_engine` Python module. Positions cross the
/// boundary as FEN strings and moves as UCI strings.

#include <termchess/factory.hpp>
#include <termchess/game_state.hpp>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

/// Python-side engine handle: one engine picked by difficulty.
class PyEngine {
   public:
    PyEngine(termchess::Difficulty difficulty, std::optional<int> search_depth,
             std::optional<std::int64_t> time_limit_ms, std::optional<std::uint64_t> seed) {
        termchess::EngineOptions options;
        options.search_depth = search_depth;
        if (time_limit_ms)
            options.time_limit = std::chrono::milliseconds(*time_limit_ms);
        options.seed = seed;
        engine_ = termchess::make_engine(difficulty, options);
    }

    std::string select_move(const std::string& fen, std::optional<std::int64_t> deadline_ms) {
        const termchess::Position pos = termchess::Position::from_fen(fen);
        const termchess::Deadline deadline =
            deadline_ms ? termchess::deadline_after(termchess::Clock::now(),
                                                    std::chrono::milliseconds(*deadline_ms))
                        : termchess::Deadline::max();

        termchess::Move move;
        {
            // Search without the GIL so other Python threads (e.g. one that
            // calls close()) keep running.
            py::gil_scoped_release release;
            move = engine_->select_move(deadline, pos);
        }
        return move.uci();
    }

    std::string name() const { return engine_->name(); }
    void close() noexcept { engine_->close(); }
    bool is_closed() const noexcept { return engine_->is_closed(); }

    void configure(const py::kwargs& kwargs) {
        termchess::Configurable* target = termchess::as_configurable(*engine_);
        if (target == nullptr) {
            throw termchess::EngineError(termchess::EngineErrc::InvalidConfiguration,
                                         engine_->name() + " is not configurable");
        }

        termchess::EngineConfig config;
        for (const auto& [key, value] : kwargs) {
            const auto field = key.cast<std::string>();
            if (field == "search_depth") {
                config.search_depth = value.cast<int>();
            } else if (field == "time_limit_ms") {
                config.time_limit = std::chrono::milliseconds(value.cast<std::int64_t>());
            } else if (field == "material_weight") {
                config.material_weight = value.cast<double>();
            } else if (field == "piece_square_weight") {
                config.piece_square_weight = value.cast<double>();
            } else if (field == "mobility_weight") {
                config.mobility_weight = value.cast<double>();
            } else if (field == "king_safety_weight") {
                config.king_safety_weight = value.cast<double>();
            } else {
                throw py::value_error("unknown configuration key: " + field);
            }
        }
        target->configure(config);
    }

    void set_position_history(const std::vector<std::string>& fens) {
        termchess::Stateful* target = termchess::as_stateful(*engine_);
        if (target == nullptr)
            return;
        std::vector<termchess::Position> history;
        history.reserve(fens.size());
        for (const auto& fen : fens) history.push_back(termchess::Position::from_fen(fen));
        target->set_position_history(history);
    }

    py::dict info() const {
        py::dict d;
        const termchess::Inspectable* inspectable = termchess::as_inspectable(*engine_);
        if (inspectable == nullptr)
            return d;

        const termchess::EngineInfo info = inspectable->info();
        d["name"] = info.name;
        d["author"] = info.author;
        d["version"] = info.version;
        d["type"] = std::string(termchess::to_string(info.type));
        d["difficulty"] = info.difficulty;
        d["features"] = info.features;
        return d;
    }

    /// (uci_move, score, depth, nodes, timed_out) of the last search, or
    /// None for engines that do not search.
    py::object last_search() const {
        const auto* minimax = dynamic_cast<const termchess::MinimaxEngine*>(engine_.get());
        if (minimax == nullptr)
            return py::none();

        const termchess::SearchResult& r = minimax->last_search();
        const std::string uci = r.best_move.is_null() ? std::string() : r.best_move.uci();
        return py::make_tuple(uci, r.score, r.depth, static_cast<std::int64_t>(r.nodes),
                              r.timed_out);
    }

   private:
    std::unique_ptr<termchess::Engine> engine_;
};

}  // namespace

PYBIND11_MODULE(_termchess_engine, m) {
    m.doc() = "TermChess computer opponents (pybind11)";

    py::register_exception<termchess::EngineError>(m, "EngineError", PyExc_RuntimeError);

    py::enum_<termchess::Difficulty>(m, "Difficulty")
        .value("EASY", termchess::Difficulty::Easy)
        .value("MEDIUM", termchess::Difficulty::Medium)
        .value("HARD", termchess::Difficulty::Hard);

    // ── Engine class ────────────────────────────────────────────────────
    py::class_<PyEngine>(m, "Engine")
        .def(py::init<termchess::Difficulty, std::optional<int>, std::optional<std::int64_t>,
                      std::optional<std::uint64_t>>(),
             py::arg("difficulty"), py::arg("search_depth") = py::none(),
             py::arg("time_limit_ms") = py::none(), py::arg("seed") = py::none(),
             "Create the engine for *difficulty*; unset options take its defaults.")

        .def("select_move", &PyEngine::select_move, py::arg("fen"),
             py::arg("deadline_ms") = py::none(),
             R"doc(Pick a move for the position given by *fen* and return it in UCI form.

*deadline_ms* bounds the search from now; the engine's own time limit
applies as well.)doc")

        .def("name", &PyEngine::name)
        .def("close", &PyEngine::close, "Close the engine. Further searches raise EngineError.")
        .def("is_closed", &PyEngine::is_closed)
        .def("configure", &PyEngine::configure,
             "Reconfigure with keyword arguments: search_depth, time_limit_ms, material_weight, "
             "piece_square_weight, mobility_weight, king_safety_weight.")
        .def("set_position_history", &PyEngine::set_position_history, py::arg("fens"),
             "Positions played before the next search, oldest first.")
        .def("info", &PyEngine::info)
        .def("last_search", &PyEngine::last_search);

    m.def(
        "evaluate",
        [](const std::string& fen, termchess::Difficulty difficulty) {
            return termchess::eval::evaluate(termchess::Position::from_fen(fen), difficulty);
        },
        py::arg("fen"), py::arg("difficulty"),
        "Static evaluation in pawns from White's point of view.");

    m.def(
        "status",
        [](const std::string& fen) {
            const termchess::Position pos = termchess::Position::from_fen(fen);
            return std::string(termchess::to_string(termchess::status(pos)));
        },
        py::arg("fen"), "Game status of the position given by *fen*.");

    m.def(
        "winner",
        [](const std::string& fen) -> std::optional<std::string> {
            const auto side = termchess::winner(termchess::Position::from_fen(fen));
            if (!side)
                return std::nullopt;
            return std::string(termchess::color_name(*side));
        },
        py::arg("fen"), "\"white\" or \"black\" when *fen* is checkmate, otherwise None.");
}
