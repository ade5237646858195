#include "racetrack/core/grid.hpp"
#include <stdexcept>
#include <utility>

namespace racetrack {

Grid::Grid(int width, int height, std::vector<CellKind> cells)
    : width_(width), height_(height), cells_(std::move(cells)) {
    if (width_ <= 0 || height_ <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive");
    }
    if (cells_.size() != static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_)) {
        throw std::invalid_argument("Grid cell count does not match width * height");
    }
}

bool Grid::in_bounds(const Vector& position) const {
    return position.x >= 0 && position.x < width_ &&
           position.y >= 0 && position.y < height_;
}

CellKind Grid::kind_at(const Vector& position) const {
    if (!in_bounds(position)) {
        return CellKind::Wall;
    }
    return cells_[static_cast<std::size_t>(position.y) * width_ + position.x];
}

} // namespace racetrack
