#include "racetrack/core/path_search.hpp"
#include "racetrack/core/move_rules.hpp"
#include "racetrack/core/rasterizer.hpp"
#include "racetrack/core/turn_engine.hpp"
#include "racetrack/utils/logging.hpp"
#include "racetrack/utils/time_utils.hpp"
#include <algorithm>
#include <queue>
#include <utility>

namespace racetrack {

namespace {
    const char* LOG_CATEGORY = "search";

    // 進捗ログの出力間隔（展開状態数）
    constexpr std::size_t PROGRESS_LOG_INTERVAL = 10000;
}

const char* to_string(SearchStatus status) {
    switch (status) {
        case SearchStatus::Found:             return "Found";
        case SearchStatus::DepthLimitReached: return "DepthLimitReached";
        case SearchStatus::StateLimitReached: return "StateLimitReached";
        case SearchStatus::Unreachable:       return "Unreachable";
    }
    return "Unknown";
}

PathSearch::PathSearch(Grid grid, const SearchLimits& limits)
    : grid_(std::move(grid)), limits_(limits) {}

SearchResult PathSearch::search_for(const TurnEngine& engine, std::size_t vehicle_index) const {
    const Vehicle& vehicle = engine.vehicle(vehicle_index);
    RACETRACK_LOG_INFO(LOG_CATEGORY, logging::format_string(
        "Planning for vehicle %c from %s", vehicle.id(), vehicle.position().to_string().c_str()));
    return search(vehicle.position(), vehicle.velocity(), engine.occupied_by_others(vehicle_index));
}

SearchResult PathSearch::search(const Vector& position, const Vector& velocity,
                                const std::vector<Vector>& occupied) const {
    time_utils::Timer timer;
    timer.start();

    const std::unordered_set<Vector, VectorHash> occupied_set(occupied.begin(), occupied.end());

    SearchResult result;
    std::queue<std::shared_ptr<SearchNode>> frontier;
    std::unordered_set<SearchKey, SearchKeyHash> visited;
    bool depth_limited = false;

    frontier.push(std::make_shared<SearchNode>(position, velocity, Vector(0, 0), 0));
    visited.insert(SearchKey{position, velocity});

    while (!frontier.empty()) {
        if (result.states_explored >= limits_.max_states) {
            result.status = SearchStatus::StateLimitReached;
            break;
        }

        auto current = frontier.front();
        frontier.pop();
        ++result.states_explored;

        if (result.states_explored % PROGRESS_LOG_INTERVAL == 0) {
            RACETRACK_LOG_DEBUG(LOG_CATEGORY, logging::format_string(
                "Explored %zu states, frontier size %zu, depth %d",
                result.states_explored, frontier.size(), current->depth));
        }

        // ゴール判定は深さ判定より先に行う
        if (is_goal(*current)) {
            result.status = SearchStatus::Found;
            result.plan = reconstruct_plan(current);
            break;
        }

        if (current->depth >= limits_.max_depth) {
            depth_limited = true;
            continue;
        }

        for (const auto& acceleration : ACCELERATIONS) {
            const Vector next_velocity = current->velocity + acceleration;
            const Vector next_position = current->position + next_velocity;

            if (!is_valid_move(current->position, next_position, next_velocity, occupied_set)) {
                continue;
            }
            if (!visited.insert(SearchKey{next_position, next_velocity}).second) {
                continue;
            }
            frontier.push(std::make_shared<SearchNode>(
                next_position, next_velocity, acceleration, current->depth + 1, current));
        }
    }

    if (result.status != SearchStatus::Found && result.status != SearchStatus::StateLimitReached) {
        result.status = depth_limited ? SearchStatus::DepthLimitReached : SearchStatus::Unreachable;
    }

    result.elapsed_ms = timer.stop() * 1000.0;

    if (result.found()) {
        RACETRACK_LOG_INFO(LOG_CATEGORY, logging::format_string(
            "Plan found: %zu moves, %zu states explored in %s",
            result.plan.size(), result.states_explored,
            time_utils::format_duration(result.elapsed_ms / 1000.0).c_str()));
    } else {
        RACETRACK_LOG_WARN(LOG_CATEGORY, logging::format_string(
            "No plan found (%s): %zu states explored in %s",
            to_string(result.status), result.states_explored,
            time_utils::format_duration(result.elapsed_ms / 1000.0).c_str()));
    }
    return result;
}

bool PathSearch::is_goal(const SearchNode& node) const {
    const CellKind kind = grid_.kind_at(node.position);
    return is_finish(kind) && is_correct_crossing(kind, node.velocity);
}

bool PathSearch::is_valid_move(const Vector& from, const Vector& to, const Vector& velocity,
                               const std::unordered_set<Vector, VectorHash>& occupied) const {
    const std::vector<Vector> cells = rasterize(from, to);
    for (std::size_t i = 1; i < cells.size(); ++i) {
        const bool occupied_by_other = occupied.count(cells[i]) > 0;
        const CellEvent event = classify_cell(grid_.kind_at(cells[i]), occupied_by_other, velocity);
        if (event == CellEvent::Collision || event == CellEvent::IncorrectCrossing) {
            return false;
        }
    }
    return true;
}

Plan PathSearch::reconstruct_plan(std::shared_ptr<SearchNode> goal_node) const {
    Plan plan;
    auto current_node = goal_node;

    // ルート以外のノードの加速度を逆順にたどる
    while (current_node != nullptr && current_node->parent != nullptr) {
        plan.push_back(current_node->acceleration);
        current_node = current_node->parent;
    }

    std::reverse(plan.begin(), plan.end());
    return plan;
}

std::vector<Vector> plan_waypoints(const Vector& position, const Vector& velocity,
                                   const Plan& plan) {
    std::vector<Vector> waypoints;
    waypoints.reserve(plan.size() + 1);
    waypoints.push_back(position);

    Vector current_position = position;
    Vector current_velocity = velocity;
    for (const auto& acceleration : plan) {
        current_velocity = current_velocity + acceleration;
        current_position = current_position + current_velocity;
        waypoints.push_back(current_position);
    }
    return waypoints;
}

} // namespace racetrack
