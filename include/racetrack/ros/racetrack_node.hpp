#ifndef RACETRACK_ROS_RACETRACK_NODE_HPP_
#define RACETRACK_ROS_RACETRACK_NODE_HPP_

#include <rclcpp/rclcpp.hpp>
#include <nav_msgs/msg/occupancy_grid.hpp>
#include <visualization_msgs/msg/marker_array.hpp>

#include "racetrack/core/race_controller.hpp"
#include "racetrack/core/types.hpp"
#include "racetrack/ros/visualizer.hpp"
#include <memory>
#include <string>

namespace racetrack {

// 可視化パラメータの定数
namespace visualization_constants {
    constexpr int VEHICLE_MARKER_ID = 0;        // 車両マーカーの先頭ID
    constexpr int FINISH_MARKER_ID = 1000;      // ゴールマーカーの先頭ID
    constexpr int PLAN_MARKER_ID = 2000;        // 計画マーカーの先頭ID
}

/**
 * @brief レーストラック ROS2ノード
 *
 * トラックを読み込み、全車両に探索計画を割り当て、タイマー周期ごとに1ターンを実行する。
 */
class RacetrackNode : public rclcpp::Node {
public:
    /**
     * @brief コンストラクタ
     * @throws std::runtime_error トラックファイルを開けない場合
     * @throws TrackFormatError トラック書式エラー時
     */
    RacetrackNode();

private:
    // コア機能
    std::unique_ptr<RaceController> controller_;
    std::unique_ptr<RacetrackVisualizer> visualizer_;
    RaceConfig config_;
    std::string global_frame_;
    double cell_size_;
    int turn_period_ms_;

    // パブリッシャー
    rclcpp::Publisher<nav_msgs::msg::OccupancyGrid>::SharedPtr track_pub_;
    rclcpp::Publisher<visualization_msgs::msg::MarkerArray>::SharedPtr marker_pub_;

    // タイマー
    rclcpp::TimerBase::SharedPtr turn_timer_;

    /**
     * @brief パラメータ設定
     */
    void setup_parameters();

    /**
     * @brief ROS2パラメータからRaceConfigを作成
     * @return レース設定
     */
    RaceConfig create_config_from_parameters();

    /**
     * @brief トラックを読み込み、全車両に探索計画を割り当て
     */
    void initialize_race();

    /**
     * @brief ターン実行ループ（タイマーコールバック）
     */
    void turn_loop();

    /**
     * @brief レース終了処理
     */
    void handle_race_finished();

    /**
     * @brief トラック地図の配信
     */
    void publish_track();

    /**
     * @brief 車両・ゴール・計画マーカーの配信
     */
    void publish_markers();
};

} // namespace racetrack

#endif // RACETRACK_ROS_RACETRACK_NODE_HPP_
