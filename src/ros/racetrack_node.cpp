#include "racetrack/ros/racetrack_node.hpp"
#include "racetrack/core/track_loader.hpp"
#include "racetrack/utils/logging.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

namespace racetrack
{

  RacetrackNode::RacetrackNode() : Node("racetrack_node")
  {
    // パラメータ設定
    setup_parameters();

    // 設定初期化
    config_ = create_config_from_parameters();

    // ノード側のログレベルをコアのロガーにも反映
    if (auto level = logging::parse_level(config_.log_level))
    {
      logging::Logger::instance().set_level(*level);
    }
    else
    {
      RCLCPP_WARN(this->get_logger(), "Unknown log_level '%s', keeping default",
                  config_.log_level.c_str());
    }

    // トラック読み込みと計画割り当て
    initialize_race();

    visualizer_ = std::make_unique<RacetrackVisualizer>(
        *this, global_frame_, controller_->engine().grid(), cell_size_);

    // パブリッシャー初期化
    auto map_qos = rclcpp::QoS(1).reliable().transient_local();
    track_pub_ = this->create_publisher<nav_msgs::msg::OccupancyGrid>("track", map_qos);
    marker_pub_ = this->create_publisher<visualization_msgs::msg::MarkerArray>("racetrack_markers", 10);

    publish_track();
    publish_markers();

    // タイマー初期化（1周期1ターン）
    turn_timer_ = this->create_wall_timer(
        std::chrono::milliseconds(turn_period_ms_), std::bind(&RacetrackNode::turn_loop, this));
  }

  void RacetrackNode::setup_parameters()
  {
    // トラック
    this->declare_parameter("track_file", "");

    // レース進行
    this->declare_parameter("turn_period_ms", 500);
    this->declare_parameter("max_turns", 1000);

    // 探索
    this->declare_parameter("search_max_depth", 500);
    this->declare_parameter("search_max_states", 50000);

    // 可視化
    this->declare_parameter("global_frame", "map");
    this->declare_parameter("cell_size", 1.0);

    this->declare_parameter("log_level", "info");
  }

  RaceConfig RacetrackNode::create_config_from_parameters()
  {
    RaceConfig config;

    config.track_file = this->get_parameter("track_file").as_string();
    config.max_turns = static_cast<int>(this->get_parameter("max_turns").as_int());
    config.search.max_depth = static_cast<int>(this->get_parameter("search_max_depth").as_int());
    config.search.max_states =
        static_cast<std::size_t>(this->get_parameter("search_max_states").as_int());
    config.log_level = this->get_parameter("log_level").as_string();

    global_frame_ = this->get_parameter("global_frame").as_string();
    cell_size_ = this->get_parameter("cell_size").as_double();
    turn_period_ms_ = static_cast<int>(this->get_parameter("turn_period_ms").as_int());

    return config;
  }

  void RacetrackNode::initialize_race()
  {
    if (config_.track_file.empty())
    {
      throw std::runtime_error("Parameter 'track_file' is not set");
    }

    TrackLayout layout = load_track_file(config_.track_file);
    RCLCPP_INFO(this->get_logger(), "Track loaded: %s (%dx%d, %zu vehicles)",
                config_.track_file.c_str(), layout.grid.width(), layout.grid.height(),
                layout.vehicles.size());

    controller_ = std::make_unique<RaceController>(
        TurnEngine(std::move(layout.grid), std::move(layout.vehicles)));

    for (std::size_t i = 0; i < controller_->engine().vehicle_count(); ++i)
    {
      const SearchResult result = controller_->assign_path_search(i, config_.search);
      const char id = controller_->engine().vehicle(i).id();
      if (result.found())
      {
        RCLCPP_INFO(this->get_logger(), "Vehicle %c: plan with %zu moves (%.2f ms)",
                    id, result.plan.size(), result.elapsed_ms);
      }
      else
      {
        RCLCPP_WARN(this->get_logger(), "Vehicle %c: no plan (%s), holding still",
                    id, to_string(result.status));
      }
    }
  }

} // namespace racetrack
