#include "racetrack/core/turn_engine.hpp"
#include "racetrack/core/move_rules.hpp"
#include "racetrack/core/rasterizer.hpp"
#include "racetrack/utils/logging.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace racetrack {

namespace {
    const char* LOG_CATEGORY = "turn";

    // 勝利に必要な連続正方向通過数（逆方向通過の後）
    constexpr int REQUIRED_CONSECUTIVE_CROSSINGS = 2;
}

const char* to_string(TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::Ignored: return "Ignored";
        case TurnOutcome::Moved:   return "Moved";
        case TurnOutcome::Crashed: return "Crashed";
        case TurnOutcome::Won:     return "Won";
    }
    return "Unknown";
}

TurnEngine::TurnEngine(Grid grid, std::vector<Vehicle> vehicles)
    : grid_(std::move(grid)), active_index_(0) {
    if (vehicles.empty()) {
        throw std::invalid_argument("TurnEngine requires at least one vehicle");
    }
    entries_.reserve(vehicles.size());
    for (auto& vehicle : vehicles) {
        entries_.push_back(RaceEntry{std::move(vehicle), CrossingRecord()});
    }
}

bool TurnEngine::has_active_vehicle() const {
    for (const auto& entry : entries_) {
        if (!entry.vehicle.is_crashed()) {
            return true;
        }
    }
    return false;
}

const Vehicle& TurnEngine::vehicle(std::size_t index) const {
    return entry_at(index).vehicle;
}

std::vector<Vehicle> TurnEngine::vehicles() const {
    std::vector<Vehicle> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.vehicle);
    }
    return result;
}

const CrossingRecord& TurnEngine::crossing_record(std::size_t index) const {
    return entry_at(index).crossing;
}

std::vector<Vector> TurnEngine::occupied_by_others(std::size_t self) const {
    std::vector<Vector> positions;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (i == self || entries_[i].vehicle.is_crashed()) {
            continue;
        }
        positions.push_back(entries_[i].vehicle.position());
    }
    return positions;
}

TurnOutcome TurnEngine::take_turn(const std::optional<Vector>& acceleration) {
    return take_turn(active_index_, acceleration);
}

TurnOutcome TurnEngine::take_turn(std::size_t vehicle_index,
                                  const std::optional<Vector>& acceleration) {
    // 状態を変更する前に全ての引数を検証
    if (!acceleration.has_value()) {
        throw std::invalid_argument("Acceleration must be set");
    }
    RaceEntry& entry = entry_at(vehicle_index);
    Vehicle& vehicle = entry.vehicle;

    if (winner_.has_value() || vehicle.is_crashed()) {
        return TurnOutcome::Ignored;
    }

    vehicle.accelerate(*acceleration);
    const Vector start = vehicle.position();
    const Vector target = vehicle.next_position();
    const Vector velocity = vehicle.velocity();
    const std::vector<Vector> path = rasterize(start, target);

    // 開始セルを除いて経路を順に判定
    for (std::size_t i = 1; i < path.size(); ++i) {
        const Vector& cell = path[i];
        const CellEvent event = classify_cell(grid_.kind_at(cell),
                                              is_occupied_by_other(cell, vehicle_index),
                                              velocity);
        switch (event) {
            case CellEvent::Collision:
                vehicle.crash(cell);
                RACETRACK_LOG_INFO(LOG_CATEGORY, logging::format_string(
                    "Vehicle %c crashed at %s", vehicle.id(), cell.to_string().c_str()));
                check_sole_survivor();
                return TurnOutcome::Crashed;
            case CellEvent::CorrectCrossing:
                if (process_finish_crossing(entry, true)) {
                    vehicle.move();
                    winner_ = vehicle_index;
                    RACETRACK_LOG_INFO(LOG_CATEGORY, logging::format_string(
                        "Vehicle %c won at %s after %d moves", vehicle.id(),
                        vehicle.position().to_string().c_str(), vehicle.move_count()));
                    return TurnOutcome::Won;
                }
                break;
            case CellEvent::IncorrectCrossing:
                process_finish_crossing(entry, false);
                break;
            case CellEvent::Pass:
                break;
        }
    }

    vehicle.move();
    RACETRACK_LOG_DEBUG(LOG_CATEGORY, logging::format_string(
        "Vehicle %c moved to %s with velocity %s", vehicle.id(),
        vehicle.position().to_string().c_str(), velocity.to_string().c_str()));
    return TurnOutcome::Moved;
}

void TurnEngine::advance_active() {
    const std::size_t count = entries_.size();
    for (std::size_t i = 1; i <= count; ++i) {
        const std::size_t index = (active_index_ + i) % count;
        if (!entries_[index].vehicle.is_crashed()) {
            active_index_ = index;
            return;
        }
    }
}

bool TurnEngine::is_occupied_by_other(const Vector& cell, std::size_t self) const {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (i == self) {
            continue;
        }
        const Vehicle& other = entries_[i].vehicle;
        if (!other.is_crashed() && other.position() == cell) {
            return true;
        }
    }
    return false;
}

bool TurnEngine::process_finish_crossing(RaceEntry& entry, bool correct_direction) {
    CrossingRecord& record = entry.crossing;

    if (!correct_direction) {
        record.has_incorrect_crossing = true;
        record.consecutive_correct = 0;
        RACETRACK_LOG_DEBUG(LOG_CATEGORY, logging::format_string(
            "Vehicle %c crossed the finish line in the wrong direction", entry.vehicle.id()));
        return false;
    }

    if (!record.has_incorrect_crossing) {
        return true;
    }
    ++record.consecutive_correct;
    return record.consecutive_correct >= REQUIRED_CONSECUTIVE_CROSSINGS;
}

void TurnEngine::check_sole_survivor() {
    std::size_t remaining = 0;
    std::size_t last_index = 0;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (!entries_[i].vehicle.is_crashed()) {
            ++remaining;
            last_index = i;
        }
    }
    if (remaining == 1) {
        winner_ = last_index;
        RACETRACK_LOG_INFO(LOG_CATEGORY, logging::format_string(
            "Vehicle %c is the last one racing and wins", entries_[last_index].vehicle.id()));
    }
}

TurnEngine::RaceEntry& TurnEngine::entry_at(std::size_t index) {
    if (index >= entries_.size()) {
        throw std::out_of_range("Invalid vehicle index: " + std::to_string(index));
    }
    return entries_[index];
}

const TurnEngine::RaceEntry& TurnEngine::entry_at(std::size_t index) const {
    if (index >= entries_.size()) {
        throw std::out_of_range("Invalid vehicle index: " + std::to_string(index));
    }
    return entries_[index];
}

} // namespace racetrack
