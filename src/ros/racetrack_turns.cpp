#include "racetrack/ros/racetrack_node.hpp"
#include "racetrack/core/track_loader.hpp"
#include <chrono>

namespace racetrack
{

  void RacetrackNode::turn_loop()
  {
    // 処理時間計測開始
    auto loop_start = std::chrono::steady_clock::now();

    try
    {
      bool running = false;
      if (controller_->turns_executed() < config_.max_turns)
      {
        running = controller_->execute_turn();
      }

      publish_markers();

      auto loop_end = std::chrono::steady_clock::now();
      double total_time = std::chrono::duration<double, std::milli>(loop_end - loop_start).count();
      RCLCPP_DEBUG(this->get_logger(), "[Racetrack] Turn %d time: %.2f ms",
                   controller_->turns_executed(), total_time);

      if (!running)
      {
        handle_race_finished();
      }
    }
    catch (const std::exception &e)
    {
      RCLCPP_ERROR(this->get_logger(), "Turn loop error: %s", e.what());
      turn_timer_->cancel();
    }
  }

  void RacetrackNode::handle_race_finished()
  {
    turn_timer_->cancel();

    const RaceResult result = controller_->result();
    const TurnEngine& engine = controller_->engine();
    if (result.winner)
    {
      RCLCPP_INFO(this->get_logger(), "Race finished after %d turns, winner: %c",
                  result.turns, engine.vehicle(*result.winner).id());
    }
    else
    {
      RCLCPP_WARN(this->get_logger(), "Race stopped after %d turns without winner (%s)",
                  result.turns, to_string(result.status));
    }

    RCLCPP_INFO(this->get_logger(), "Final board:\n%s",
                render_race(engine.grid(), engine.vehicles()).c_str());
  }

} // namespace racetrack
