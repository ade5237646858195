#include "racetrack/core/vehicle.hpp"

namespace racetrack {

Vehicle::Vehicle(char id, const Vector& start_position)
    : id_(id), position_(start_position), velocity_(0, 0),
      crashed_(false), move_count_(0) {}

Vector Vehicle::next_position() const {
    return position_ + velocity_;
}

void Vehicle::accelerate(const Vector& acceleration) {
    velocity_ = velocity_ + acceleration;
}

void Vehicle::move() {
    position_ = next_position();
    ++move_count_;
}

void Vehicle::crash(const Vector& crash_position) {
    position_ = crash_position;
    crashed_ = true;
}

} // namespace racetrack
