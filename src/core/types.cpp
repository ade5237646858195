#include "racetrack/core/types.hpp"
#include <cstdlib>
#include <sstream>

namespace racetrack {

namespace {
    int sign_of(int value) {
        return (value > 0) - (value < 0);
    }
}

// Vector implementations
Vector Vector::operator+(const Vector& other) const {
    return Vector(x + other.x, y + other.y);
}

Vector Vector::operator-(const Vector& other) const {
    return Vector(x - other.x, y - other.y);
}

Vector Vector::abs() const {
    return Vector(std::abs(x), std::abs(y));
}

Vector Vector::signum() const {
    return Vector(sign_of(x), sign_of(y));
}

int Vector::dot(const Vector& other) const {
    return x * other.x + y * other.y;
}

bool Vector::operator==(const Vector& other) const {
    return x == other.x && y == other.y;
}

bool Vector::operator!=(const Vector& other) const {
    return !(*this == other);
}

bool Vector::operator<(const Vector& other) const {
    return x < other.x || (x == other.x && y < other.y);
}

std::string Vector::to_string() const {
    std::ostringstream oss;
    oss << "(X:" << x << ", Y:" << y << ")";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Vector& v) {
    return os << v.to_string();
}

// CellKind implementations
std::optional<CellKind> cell_kind_from_char(char c) {
    switch (c) {
        case '#': return CellKind::Wall;
        case ' ': return CellKind::Open;
        case '<': return CellKind::FinishLeft;
        case '>': return CellKind::FinishRight;
        case '^': return CellKind::FinishUp;
        case 'v': return CellKind::FinishDown;
        default: return std::nullopt;
    }
}

char to_char(CellKind kind) {
    return static_cast<char>(kind);
}

bool is_finish(CellKind kind) {
    return kind == CellKind::FinishLeft || kind == CellKind::FinishRight ||
           kind == CellKind::FinishUp || kind == CellKind::FinishDown;
}

bool is_correct_crossing(CellKind kind, const Vector& velocity) {
    const Vector sign = velocity.signum();
    switch (kind) {
        case CellKind::FinishLeft:  return sign.x == -1;
        case CellKind::FinishRight: return sign.x == 1;
        case CellKind::FinishUp:    return sign.y == -1;
        case CellKind::FinishDown:  return sign.y == 1;
        default: return false;
    }
}

} // namespace racetrack
