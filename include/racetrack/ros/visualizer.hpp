#ifndef RACETRACK_ROS_VISUALIZER_HPP_
#define RACETRACK_ROS_VISUALIZER_HPP_

#include <rclcpp/rclcpp.hpp>
#include <nav_msgs/msg/occupancy_grid.hpp>
#include <visualization_msgs/msg/marker_array.hpp>
#include <geometry_msgs/msg/point.hpp>
#include <std_msgs/msg/color_rgba.hpp>

#include "racetrack/core/grid.hpp"
#include "racetrack/core/vehicle.hpp"

#include <vector>
#include <string>

namespace racetrack {

/**
 * @brief レーストラック用RViz可視化マネージャー
 *
 * トラックの行0を地図の上端に配置し、1セルをcell_size [m] の正方形として描画する。
 */
class RacetrackVisualizer {
public:
    /**
     * @brief コンストラクタ
     * @param node ROSノード参照
     * @param global_frame グローバル座標フレーム名
     * @param grid トラックグリッド
     * @param cell_size セルの一辺 [m]
     */
    RacetrackVisualizer(rclcpp::Node& node, const std::string& global_frame,
                        const Grid& grid, double cell_size);

    /**
     * @brief トラックを占有格子地図に変換（壁100、走行可能0）
     * @return 占有格子地図
     */
    nav_msgs::msg::OccupancyGrid create_track_grid();

    /**
     * @brief 車両マーカーを作成（クラッシュ車両は赤）
     * @param vehicles 車両リスト
     * @param active_index アクティブ車両インデックス
     * @param marker_id マーカーID
     * @return 車両マーカー配列
     */
    visualization_msgs::msg::MarkerArray create_vehicle_markers(
        const std::vector<Vehicle>& vehicles,
        std::size_t active_index,
        int marker_id = 0);

    /**
     * @brief ゴールセルと通過方向の矢印マーカーを作成
     * @param marker_id マーカーID
     * @return ゴールマーカー配列
     */
    visualization_msgs::msg::MarkerArray create_finish_markers(int marker_id = 1000);

    /**
     * @brief 探索計画の通過位置を線分マーカーで作成
     * @param waypoints 通過位置
     * @param marker_id マーカーID
     * @return 計画マーカー
     */
    visualization_msgs::msg::Marker create_plan_marker(
        const std::vector<Vector>& waypoints,
        int marker_id);

    /**
     * @brief マーカー削除配列を作成
     * @return 削除マーカー配列
     */
    visualization_msgs::msg::MarkerArray create_delete_all_markers();

    /**
     * @brief セル中心の世界座標
     */
    geometry_msgs::msg::Point cell_to_point(const Vector& cell, double z = 0.0) const;

private:
    rclcpp::Node& node_;
    std::string global_frame_;
    const Grid& grid_;
    double cell_size_;

    std_msgs::msg::ColorRGBA create_color(double r, double g, double b, double a = 1.0);

    visualization_msgs::msg::Marker create_arrow_marker(
        const geometry_msgs::msg::Point& start,
        const geometry_msgs::msg::Point& end,
        const std_msgs::msg::ColorRGBA& color,
        int marker_id,
        double scale = 0.05);

    visualization_msgs::msg::Marker create_cylinder_marker(
        const geometry_msgs::msg::Point& center,
        double radius,
        double height,
        const std_msgs::msg::ColorRGBA& color,
        int marker_id);

    visualization_msgs::msg::Marker create_text_marker(
        const geometry_msgs::msg::Point& position,
        const std::string& text,
        int marker_id);
};

} // namespace racetrack

#endif // RACETRACK_ROS_VISUALIZER_HPP_
