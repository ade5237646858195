#include <rclcpp/rclcpp.hpp>
#include <memory>
#include <iostream>

#include "racetrack/ros/racetrack_node.hpp"

int main(int argc, char** argv)
{
    // ROS2の初期化
    rclcpp::init(argc, argv);

    try {
        std::cout << "Racetrack Node starting..." << std::endl;

        // レーストラックノードの作成
        auto node = std::make_shared<racetrack::RacetrackNode>();

        std::cout << "Racetrack Node initialized successfully!" << std::endl;

        // ノード実行
        rclcpp::spin(node);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        rclcpp::shutdown();
        return 1;
    }

    rclcpp::shutdown();
    return 0;
}
