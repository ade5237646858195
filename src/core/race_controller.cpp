#include "racetrack/core/race_controller.hpp"
#include "racetrack/utils/logging.hpp"
#include <stdexcept>
#include <utility>

namespace racetrack {

namespace {
    const char* LOG_CATEGORY = "race";
}

const char* to_string(RaceStatus status) {
    switch (status) {
        case RaceStatus::Won:              return "Won";
        case RaceStatus::AllCrashed:       return "AllCrashed";
        case RaceStatus::Terminated:       return "Terminated";
        case RaceStatus::TurnLimitReached: return "TurnLimitReached";
    }
    return "Unknown";
}

RaceController::RaceController(TurnEngine engine)
    : engine_(std::move(engine)),
      sources_(engine_.vehicle_count()),
      planned_waypoints_(engine_.vehicle_count()),
      turns_executed_(0), terminated_(false) {
    stats_["searches"] = 0.0;
    stats_["search_failures"] = 0.0;
    stats_["search_time_ms"] = 0.0;
    stats_["states_explored"] = 0.0;
}

void RaceController::set_move_source(std::size_t vehicle_index, std::unique_ptr<MoveSource> source) {
    if (vehicle_index >= sources_.size()) {
        throw std::out_of_range("Invalid vehicle index: " + std::to_string(vehicle_index));
    }
    sources_[vehicle_index] = std::move(source);
}

SearchResult RaceController::assign_path_search(std::size_t vehicle_index, const SearchLimits& limits) {
    PathSearch search(engine_.grid(), limits);
    SearchResult result = search.search_for(engine_, vehicle_index);

    stats_["searches"] += 1.0;
    stats_["search_time_ms"] += result.elapsed_ms;
    stats_["states_explored"] += static_cast<double>(result.states_explored);

    const Vehicle& vehicle = engine_.vehicle(vehicle_index);
    if (result.found()) {
        planned_waypoints_[vehicle_index] =
            plan_waypoints(vehicle.position(), vehicle.velocity(), result.plan);
        set_move_source(vehicle_index, std::make_unique<PlanMoveSource>(result.plan));
    } else {
        stats_["search_failures"] += 1.0;
        planned_waypoints_[vehicle_index].clear();
        RACETRACK_LOG_WARN(LOG_CATEGORY, logging::format_string(
            "Search failed for vehicle %c (%s), vehicle will hold still",
            vehicle.id(), to_string(result.status)));
        set_move_source(vehicle_index, std::make_unique<HoldStillMoveSource>());
    }
    return result;
}

const std::vector<Vector>& RaceController::planned_waypoints(std::size_t vehicle_index) const {
    if (vehicle_index >= planned_waypoints_.size()) {
        throw std::out_of_range("Invalid vehicle index: " + std::to_string(vehicle_index));
    }
    return planned_waypoints_[vehicle_index];
}

bool RaceController::execute_turn() {
    if (engine_.is_finished() || terminated_ || !engine_.has_active_vehicle()) {
        return false;
    }

    const std::size_t index = engine_.active_index();
    if (!sources_[index]) {
        throw std::logic_error("No move source for vehicle index " + std::to_string(index));
    }

    const std::optional<Vector> acceleration = sources_[index]->next_acceleration();
    if (!acceleration) {
        terminated_ = true;
        RACETRACK_LOG_INFO(LOG_CATEGORY, logging::format_string(
            "Move source of vehicle %c requested termination", engine_.vehicle(index).id()));
        return false;
    }

    const TurnOutcome outcome = engine_.take_turn(index, acceleration);
    ++turns_executed_;
    RACETRACK_LOG_DEBUG(LOG_CATEGORY, logging::format_string(
        "Turn %d: vehicle %c accelerates %s -> %s", turns_executed_,
        engine_.vehicle(index).id(), acceleration->to_string().c_str(), to_string(outcome)));

    if (engine_.is_finished()) {
        return false;
    }
    engine_.advance_active();
    return engine_.has_active_vehicle();
}

RaceResult RaceController::run(int max_turns) {
    while (turns_executed_ < max_turns && execute_turn()) {
    }

    RaceResult race_result = result();
    if (race_result.winner) {
        RACETRACK_LOG_INFO(LOG_CATEGORY, logging::format_string(
            "Race finished after %d turns, winner: %c", race_result.turns,
            engine_.vehicle(*race_result.winner).id()));
    } else {
        RACETRACK_LOG_INFO(LOG_CATEGORY, logging::format_string(
            "Race stopped after %d turns without winner (%s)", race_result.turns,
            to_string(race_result.status)));
    }
    return race_result;
}

RaceResult RaceController::result() const {
    RaceResult race_result;
    race_result.turns = turns_executed_;
    race_result.winner = engine_.winner();

    if (race_result.winner) {
        race_result.status = RaceStatus::Won;
    } else if (!engine_.has_active_vehicle()) {
        race_result.status = RaceStatus::AllCrashed;
    } else if (terminated_) {
        race_result.status = RaceStatus::Terminated;
    } else {
        race_result.status = RaceStatus::TurnLimitReached;
    }
    return race_result;
}

std::unordered_map<std::string, double> RaceController::get_stats() const {
    auto stats = stats_;
    stats["turns_executed"] = static_cast<double>(turns_executed_);
    return stats;
}

} // namespace racetrack
