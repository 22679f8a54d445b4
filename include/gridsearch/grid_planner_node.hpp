#ifndef GRIDSEARCH_GRID_PLANNER_NODE_HPP
#define GRIDSEARCH_GRID_PLANNER_NODE_HPP

#pragma once

/**
 * @file grid_planner_node.hpp
 * @brief ROS 2 node planning over occupancy grids with the gridsearch engine
 *
 * Subscribes:
 * - /map (nav_msgs/OccupancyGrid)
 * - /start_pose (geometry_msgs/PoseStamped)
 * - /goal_pose (geometry_msgs/PoseStamped)
 *
 * Publishes:
 * - planning/path (nav_msgs/Path)
 * - planning/planner_status (std_msgs/String)
 */

#include "rclcpp/rclcpp.hpp"
#include "geometry_msgs/msg/pose.hpp"
#include "geometry_msgs/msg/pose_stamped.hpp"
#include "nav_msgs/msg/occupancy_grid.hpp"
#include "nav_msgs/msg/path.hpp"
#include "std_msgs/msg/string.hpp"

#include <memory>
#include <optional>
#include <string>

#include "gridsearch/maze.hpp"

namespace gridsearch {

/**
 * @brief Cell grid built from an OccupancyGrid message
 */
struct OccupancyModel {
    Maze maze;
    double resolution;
    double origin_x;
    double origin_y;
};

/**
 * @brief Convert an OccupancyGrid into walls and entry costs
 *
 * Cells at or above `occupied_threshold` are walls. Free cells cost
 * 1 + value / 10, so lightly occupied cells are avoided when possible.
 * Unknown cells (-1) are walls unless `allow_unknown` is set, in which
 * case they cost 1. A resolution that is not a positive finite number
 * throws OutOfBounds.
 */
OccupancyModel modelFromOccupancy(const nav_msgs::msg::OccupancyGrid& grid,
                                  int occupied_threshold, bool allow_unknown);

// Cell containing the pose's position, or empty when it lies off the map.
std::optional<Position> cellOfPose(const OccupancyModel& model, const geometry_msgs::msg::Pose& pose);

class GridPlannerNode : public rclcpp::Node {
public:
    GridPlannerNode();

private:
    enum class PlannerState {
        IDLE,
        NO_MAP,
        AWAITING_GOAL,
        SUCCESS,
        FAILURE
    };

    void mapCallback(const nav_msgs::msg::OccupancyGrid::SharedPtr msg);
    void startCallback(const geometry_msgs::msg::PoseStamped::SharedPtr msg);
    void goalCallback(const geometry_msgs::msg::PoseStamped::SharedPtr msg);

    void plan();
    Path runSearch() const;
    void publishPath(const Path& path);
    void updatePlannerState(PlannerState new_state);

    rclcpp::Subscription<nav_msgs::msg::OccupancyGrid>::SharedPtr map_sub_;
    rclcpp::Subscription<geometry_msgs::msg::PoseStamped>::SharedPtr start_sub_;
    rclcpp::Subscription<geometry_msgs::msg::PoseStamped>::SharedPtr goal_sub_;
    rclcpp::Publisher<nav_msgs::msg::Path>::SharedPtr path_pub_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr status_pub_;

    // Parameters
    std::string algorithm_;
    bool diagonal_;
    std::string storage_;
    int occupied_threshold_;
    bool allow_unknown_;
    std::string frame_id_;

    std::unique_ptr<OccupancyModel> model_;
    std::optional<geometry_msgs::msg::PoseStamped> start_pose_;
    std::optional<geometry_msgs::msg::PoseStamped> goal_pose_;
    PlannerState current_state_;
};

} // namespace gridsearch

#endif
