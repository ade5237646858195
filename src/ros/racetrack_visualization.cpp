#include "racetrack/ros/racetrack_node.hpp"

namespace racetrack
{
  using namespace visualization_constants;

  void RacetrackNode::publish_track()
  {
    track_pub_->publish(visualizer_->create_track_grid());
  }

  void RacetrackNode::publish_markers()
  {
    try
    {
      auto marker_array = visualizer_->create_delete_all_markers();
      const TurnEngine& engine = controller_->engine();

      auto vehicle_markers = visualizer_->create_vehicle_markers(
          engine.vehicles(), engine.active_index(), VEHICLE_MARKER_ID);
      marker_array.markers.insert(marker_array.markers.end(),
                                  vehicle_markers.markers.begin(), vehicle_markers.markers.end());

      auto finish_markers = visualizer_->create_finish_markers(FINISH_MARKER_ID);
      marker_array.markers.insert(marker_array.markers.end(),
                                  finish_markers.markers.begin(), finish_markers.markers.end());

      // クラッシュしていない車両の計画のみ表示
      for (std::size_t i = 0; i < engine.vehicle_count(); ++i)
      {
        const auto& waypoints = controller_->planned_waypoints(i);
        if (waypoints.empty() || engine.vehicle(i).is_crashed())
        {
          continue;
        }
        marker_array.markers.push_back(
            visualizer_->create_plan_marker(waypoints, PLAN_MARKER_ID + static_cast<int>(i)));
      }

      marker_pub_->publish(marker_array);
    }
    catch (const std::exception &e)
    {
      RCLCPP_ERROR(this->get_logger(), "Marker visualization error: %s", e.what());
    }
  }

} // namespace racetrack
