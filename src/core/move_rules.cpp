#include "racetrack/core/move_rules.hpp"

namespace racetrack {

CellEvent classify_cell(CellKind kind, bool occupied_by_other, const Vector& velocity) {
    if (kind == CellKind::Wall) {
        return CellEvent::Collision;
    }
    if (kind == CellKind::Open) {
        return occupied_by_other ? CellEvent::Collision : CellEvent::Pass;
    }
    return is_correct_crossing(kind, velocity) ? CellEvent::CorrectCrossing
                                               : CellEvent::IncorrectCrossing;
}

} // namespace racetrack
