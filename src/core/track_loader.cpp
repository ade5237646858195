#include "racetrack/core/track_loader.hpp"
#include "racetrack/utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace racetrack {

namespace {
    const char* LOG_CATEGORY = "track";

    bool is_blank(const std::string& line) {
        return std::all_of(line.begin(), line.end(),
                           [](unsigned char c) { return std::isspace(c) != 0; });
    }

    std::string strip_carriage_return(const std::string& line) {
        if (!line.empty() && line.back() == '\r') {
            return line.substr(0, line.size() - 1);
        }
        return line;
    }

    // 先頭の空行を飛ばし、次の空行までをトラックブロックとして切り出す
    std::vector<std::string> extract_track_block(const std::vector<std::string>& lines) {
        std::vector<std::string> block;
        auto it = lines.begin();
        while (it != lines.end() && is_blank(strip_carriage_return(*it))) {
            ++it;
        }
        for (; it != lines.end(); ++it) {
            std::string line = strip_carriage_return(*it);
            if (is_blank(line)) {
                break;
            }
            block.push_back(std::move(line));
        }
        return block;
    }

    void validate_block(const std::vector<std::string>& block) {
        if (block.empty()) {
            throw TrackFormatError(TrackFormatErrorType::EmptyInput,
                                   "Track contains no track lines");
        }
        const std::size_t expected = block.front().size();
        for (std::size_t row = 1; row < block.size(); ++row) {
            if (block[row].size() != expected) {
                throw TrackFormatError(
                    TrackFormatErrorType::InconsistentLineLength,
                    logging::format_string("Line %zu has length %zu, expected %zu",
                                           row + 1, block[row].size(), expected));
            }
        }
    }
}

TrackFormatError::TrackFormatError(TrackFormatErrorType type, const std::string& message)
    : std::runtime_error(message), type_(type) {}

const char* to_string(TrackFormatErrorType type) {
    switch (type) {
        case TrackFormatErrorType::EmptyInput:             return "EmptyInput";
        case TrackFormatErrorType::InconsistentLineLength: return "InconsistentLineLength";
        case TrackFormatErrorType::NoVehicles:             return "NoVehicles";
        case TrackFormatErrorType::TooManyVehicles:        return "TooManyVehicles";
        case TrackFormatErrorType::DuplicateVehicleId:     return "DuplicateVehicleId";
        case TrackFormatErrorType::InvalidVehicleId:       return "InvalidVehicleId";
    }
    return "Unknown";
}

TrackLayout parse_track_lines(const std::vector<std::string>& lines) {
    const std::vector<std::string> block = extract_track_block(lines);
    validate_block(block);

    const int width = static_cast<int>(block.front().size());
    const int height = static_cast<int>(block.size());

    std::vector<CellKind> cells;
    cells.reserve(static_cast<std::size_t>(width) * height);
    std::vector<Vehicle> vehicles;

    for (int row = 0; row < height; ++row) {
        for (int col = 0; col < width; ++col) {
            const char c = block[row][col];
            if (auto kind = cell_kind_from_char(c)) {
                cells.push_back(*kind);
                continue;
            }

            // それ以外の文字は車両のスタート記号
            if (std::isprint(static_cast<unsigned char>(c)) == 0) {
                throw TrackFormatError(
                    TrackFormatErrorType::InvalidVehicleId,
                    logging::format_string("Invalid vehicle id byte 0x%02x at line %d, column %d",
                                           static_cast<unsigned int>(static_cast<unsigned char>(c)),
                                           row + 1, col + 1));
            }
            const bool duplicate = std::any_of(vehicles.begin(), vehicles.end(),
                                               [c](const Vehicle& v) { return v.id() == c; });
            if (duplicate) {
                throw TrackFormatError(
                    TrackFormatErrorType::DuplicateVehicleId,
                    logging::format_string("Duplicate vehicle id '%c'", c));
            }
            cells.push_back(CellKind::Open);
            vehicles.emplace_back(c, Vector(col, row));
        }
    }

    if (vehicles.empty()) {
        throw TrackFormatError(TrackFormatErrorType::NoVehicles,
                               "Track contains no vehicle start markers");
    }
    if (vehicles.size() > MAX_VEHICLES) {
        throw TrackFormatError(
            TrackFormatErrorType::TooManyVehicles,
            logging::format_string("Track contains %zu vehicles, maximum is %zu",
                                   vehicles.size(), MAX_VEHICLES));
    }

    RACETRACK_LOG_DEBUG(LOG_CATEGORY, logging::format_string(
        "Track parsed: %dx%d, %zu vehicles", width, height, vehicles.size()));

    return TrackLayout{Grid(width, height, std::move(cells)), std::move(vehicles)};
}

TrackLayout parse_track(std::istream& input) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }
    return parse_track_lines(lines);
}

TrackLayout load_track_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open track file: " + path);
    }
    TrackLayout layout = parse_track(file);
    RACETRACK_LOG_INFO(LOG_CATEGORY, logging::format_string(
        "Track loaded from %s: %dx%d, %zu vehicles", path.c_str(),
        layout.grid.width(), layout.grid.height(), layout.vehicles.size()));
    return layout;
}

std::string render_race(const Grid& grid, const std::vector<Vehicle>& vehicles) {
    std::ostringstream oss;
    for (int row = 0; row < grid.height(); ++row) {
        for (int col = 0; col < grid.width(); ++col) {
            const Vector pos(col, row);
            char c = to_char(grid.kind_at(pos));
            for (const auto& vehicle : vehicles) {
                if (vehicle.position() != pos) {
                    continue;
                }
                // クラッシュ表示は車両IDより優先
                if (vehicle.is_crashed()) {
                    c = CRASH_INDICATOR;
                    break;
                }
                c = vehicle.id();
            }
            oss << c;
        }
        oss << '\n';
    }
    return oss.str();
}

} // namespace racetrack
