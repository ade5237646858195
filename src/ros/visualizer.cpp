#include "racetrack/ros/visualizer.hpp"
#include <cstdint>

namespace racetrack {

namespace {
    // 占有格子の値
    constexpr int8_t OCCUPIED_VALUE = 100;
    constexpr int8_t FREE_VALUE = 0;

    // ゴール通過方向の矢印ベクトル（トラック座標系、y軸下向き）
    Vector finish_direction(CellKind kind) {
        switch (kind) {
            case CellKind::FinishLeft:  return Vector(-1, 0);
            case CellKind::FinishRight: return Vector(1, 0);
            case CellKind::FinishUp:    return Vector(0, -1);
            case CellKind::FinishDown:  return Vector(0, 1);
            default:                    return Vector(0, 0);
        }
    }
}

RacetrackVisualizer::RacetrackVisualizer(rclcpp::Node& node, const std::string& global_frame,
                                         const Grid& grid, double cell_size)
    : node_(node), global_frame_(global_frame), grid_(grid), cell_size_(cell_size) {
}

nav_msgs::msg::OccupancyGrid RacetrackVisualizer::create_track_grid() {
    nav_msgs::msg::OccupancyGrid msg;
    msg.header.frame_id = global_frame_;
    msg.header.stamp = node_.get_clock()->now();

    msg.info.resolution = static_cast<float>(cell_size_);
    msg.info.width = static_cast<uint32_t>(grid_.width());
    msg.info.height = static_cast<uint32_t>(grid_.height());
    msg.info.origin.position.x = 0.0;
    msg.info.origin.position.y = 0.0;
    msg.info.origin.orientation.w = 1.0;

    // 占有格子は下の行から格納するため上下を反転
    msg.data.resize(static_cast<std::size_t>(grid_.width()) * grid_.height());
    for (int row = 0; row < grid_.height(); ++row) {
        const int map_row = grid_.height() - 1 - row;
        for (int col = 0; col < grid_.width(); ++col) {
            const bool wall = grid_.kind_at(Vector(col, row)) == CellKind::Wall;
            msg.data[map_row * grid_.width() + col] = wall ? OCCUPIED_VALUE : FREE_VALUE;
        }
    }
    return msg;
}

visualization_msgs::msg::MarkerArray RacetrackVisualizer::create_vehicle_markers(
    const std::vector<Vehicle>& vehicles,
    std::size_t active_index,
    int marker_id) {

    visualization_msgs::msg::MarkerArray marker_array;

    for (std::size_t i = 0; i < vehicles.size(); ++i) {
        const auto& vehicle = vehicles[i];

        std_msgs::msg::ColorRGBA color;
        if (vehicle.is_crashed()) {
            color = create_color(0.8, 0.0, 0.0, 0.8);  // 赤（クラッシュ）
        } else if (i == active_index) {
            color = create_color(1.0, 0.8, 0.0, 0.9);  // 黄（アクティブ）
        } else {
            color = create_color(0.0, 0.4, 1.0, 0.8);  // 青
        }

        const auto center = cell_to_point(vehicle.position());
        marker_array.markers.push_back(create_cylinder_marker(
            center, cell_size_ * 0.4, cell_size_ * 0.5, color, marker_id + static_cast<int>(i) * 3));

        auto label_position = cell_to_point(vehicle.position(), cell_size_);
        marker_array.markers.push_back(create_text_marker(
            label_position, std::string(1, vehicle.id()), marker_id + static_cast<int>(i) * 3 + 1));

        // 速度ベクトル
        if (!vehicle.is_crashed() && vehicle.velocity() != Vector(0, 0)) {
            const auto start = cell_to_point(vehicle.position(), 0.1);
            const auto end = cell_to_point(vehicle.next_position(), 0.1);
            marker_array.markers.push_back(create_arrow_marker(
                start, end, create_color(0.0, 1.0, 0.0, 0.8),
                marker_id + static_cast<int>(i) * 3 + 2, cell_size_ * 0.1));
        }
    }

    return marker_array;
}

visualization_msgs::msg::MarkerArray RacetrackVisualizer::create_finish_markers(int marker_id) {
    visualization_msgs::msg::MarkerArray marker_array;
    int next_id = marker_id;

    for (int row = 0; row < grid_.height(); ++row) {
        for (int col = 0; col < grid_.width(); ++col) {
            const Vector cell(col, row);
            const CellKind kind = grid_.kind_at(cell);
            if (!is_finish(kind)) {
                continue;
            }
            const Vector direction = finish_direction(kind);
            const auto start = cell_to_point(cell, 0.05);
            auto end = start;
            // トラック座標のy軸は地図のy軸と逆向き
            end.x += direction.x * cell_size_ * 0.4;
            end.y -= direction.y * cell_size_ * 0.4;

            marker_array.markers.push_back(create_arrow_marker(
                start, end, create_color(1.0, 1.0, 1.0, 0.9), next_id++, cell_size_ * 0.08));
        }
    }

    return marker_array;
}

visualization_msgs::msg::Marker RacetrackVisualizer::create_plan_marker(
    const std::vector<Vector>& waypoints,
    int marker_id) {

    auto marker = visualization_msgs::msg::Marker();
    marker.header.frame_id = global_frame_;
    marker.header.stamp = node_.get_clock()->now();
    marker.id = marker_id;
    marker.type = visualization_msgs::msg::Marker::LINE_STRIP;
    marker.action = visualization_msgs::msg::Marker::ADD;

    for (const auto& waypoint : waypoints) {
        marker.points.push_back(cell_to_point(waypoint, 0.05));
    }

    marker.scale.x = cell_size_ * 0.1;  // 線の太さ
    marker.color = create_color(0.0, 0.8, 1.0, 0.9);  // シアン
    marker.lifetime = rclcpp::Duration::from_seconds(0);  // 無限ライフタイム

    return marker;
}

visualization_msgs::msg::MarkerArray RacetrackVisualizer::create_delete_all_markers() {
    visualization_msgs::msg::MarkerArray marker_array;

    auto delete_marker = visualization_msgs::msg::Marker();
    delete_marker.header.frame_id = global_frame_;
    delete_marker.header.stamp = node_.get_clock()->now();
    delete_marker.action = visualization_msgs::msg::Marker::DELETEALL;
    delete_marker.id = 0;

    marker_array.markers.push_back(delete_marker);
    return marker_array;
}

geometry_msgs::msg::Point RacetrackVisualizer::cell_to_point(const Vector& cell, double z) const {
    geometry_msgs::msg::Point point;
    point.x = (cell.x + 0.5) * cell_size_;
    point.y = (grid_.height() - 1 - cell.y + 0.5) * cell_size_;
    point.z = z;
    return point;
}

std_msgs::msg::ColorRGBA RacetrackVisualizer::create_color(double r, double g, double b, double a) {
    std_msgs::msg::ColorRGBA color;
    color.r = r;
    color.g = g;
    color.b = b;
    color.a = a;
    return color;
}

visualization_msgs::msg::Marker RacetrackVisualizer::create_arrow_marker(
    const geometry_msgs::msg::Point& start,
    const geometry_msgs::msg::Point& end,
    const std_msgs::msg::ColorRGBA& color,
    int marker_id,
    double scale) {

    auto marker = visualization_msgs::msg::Marker();
    marker.header.frame_id = global_frame_;
    marker.header.stamp = node_.get_clock()->now();
    marker.id = marker_id;
    marker.type = visualization_msgs::msg::Marker::ARROW;
    marker.action = visualization_msgs::msg::Marker::ADD;

    marker.points.push_back(start);
    marker.points.push_back(end);

    marker.scale.x = scale;      // 軸の太さ
    marker.scale.y = scale * 2;  // 矢印の幅
    marker.scale.z = scale * 2;  // 矢印の高さ

    marker.color = color;
    marker.lifetime = rclcpp::Duration::from_seconds(0);  // 無限ライフタイム

    return marker;
}

visualization_msgs::msg::Marker RacetrackVisualizer::create_cylinder_marker(
    const geometry_msgs::msg::Point& center,
    double radius,
    double height,
    const std_msgs::msg::ColorRGBA& color,
    int marker_id) {

    auto marker = visualization_msgs::msg::Marker();
    marker.header.frame_id = global_frame_;
    marker.header.stamp = node_.get_clock()->now();
    marker.id = marker_id;
    marker.type = visualization_msgs::msg::Marker::CYLINDER;
    marker.action = visualization_msgs::msg::Marker::ADD;

    marker.pose.position = center;
    marker.pose.position.z = height / 2.0;
    marker.pose.orientation.w = 1.0;

    marker.scale.x = radius * 2;
    marker.scale.y = radius * 2;
    marker.scale.z = height;

    marker.color = color;
    marker.lifetime = rclcpp::Duration::from_seconds(0);  // 無限ライフタイム

    return marker;
}

visualization_msgs::msg::Marker RacetrackVisualizer::create_text_marker(
    const geometry_msgs::msg::Point& position,
    const std::string& text,
    int marker_id) {

    auto marker = visualization_msgs::msg::Marker();
    marker.header.frame_id = global_frame_;
    marker.header.stamp = node_.get_clock()->now();
    marker.id = marker_id;
    marker.type = visualization_msgs::msg::Marker::TEXT_VIEW_FACING;
    marker.action = visualization_msgs::msg::Marker::ADD;

    marker.pose.position = position;
    marker.pose.orientation.w = 1.0;
    marker.scale.z = cell_size_ * 0.6;  // 文字の高さ
    marker.text = text;

    marker.color = create_color(1.0, 1.0, 1.0, 1.0);
    marker.lifetime = rclcpp::Duration::from_seconds(0);  // 無限ライフタイム

    return marker;
}

} // namespace racetrack
