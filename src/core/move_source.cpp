#include "racetrack/core/move_source.hpp"
#include <utility>

namespace racetrack {

PlanMoveSource::PlanMoveSource(Plan plan)
    : plan_(std::move(plan)), next_index_(0) {}

std::optional<Vector> PlanMoveSource::next_acceleration() {
    if (next_index_ >= plan_.size()) {
        return Vector(0, 0);
    }
    return plan_[next_index_++];
}

std::size_t PlanMoveSource::remaining() const {
    return next_index_ < plan_.size() ? plan_.size() - next_index_ : 0;
}

std::optional<Vector> HoldStillMoveSource::next_acceleration() {
    return Vector(0, 0);
}

} // namespace racetrack
