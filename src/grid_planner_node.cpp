#include "gridsearch/grid_planner_node.hpp"
#include "gridsearch/astar.hpp"
#include "gridsearch/breadth_first.hpp"
#include "gridsearch/error.hpp"
#include "gridsearch/ucs.hpp"

#include <cmath>

using std::placeholders::_1;

namespace gridsearch {

OccupancyModel modelFromOccupancy(const nav_msgs::msg::OccupancyGrid& grid,
                                  int occupied_threshold, bool allow_unknown) {
    if (!std::isfinite(grid.info.resolution) || grid.info.resolution <= 0.0f) {
        throw Error(ErrorCode::OutOfBounds,
                    "occupancy resolution " + std::to_string(grid.info.resolution));
    }
    const GridConfig config(static_cast<int>(grid.info.width), static_cast<int>(grid.info.height));
    if (grid.data.size() != config.size()) {
        throw Error(ErrorCode::SizeMismatch,
                    "occupancy data has " + std::to_string(grid.data.size()) + " cells");
    }

    BitsetMap walls(config);
    DenseMap<Cost> costs(config, 1);
    for (std::size_t i = 0; i < grid.data.size(); ++i) {
        const Position pos = Position::fromIndex(config, i);
        const int value = grid.data[i];
        if (value < 0) {
            if (!allow_unknown) walls.setTrue(pos);
        } else if (value >= occupied_threshold) {
            walls.setTrue(pos);
        } else {
            costs.set(pos, 1 + value / 10);
        }
    }

    return OccupancyModel{
        Maze{walls, costs, config.first(), config.last()},
        grid.info.resolution,
        grid.info.origin.position.x,
        grid.info.origin.position.y
    };
}

std::optional<Position> cellOfPose(const OccupancyModel& model, const geometry_msgs::msg::Pose& pose) {
    const GridConfig config = model.maze.config();
    const double fx = (pose.position.x - model.origin_x) / model.resolution;
    const double fy = (pose.position.y - model.origin_y) / model.resolution;
    if (!std::isfinite(fx) || !std::isfinite(fy)) {
        return std::nullopt;
    }
    if (fx < 0.0 || fx >= config.width() || fy < 0.0 || fy >= config.height()) {
        return std::nullopt;
    }
    return Position::create(config, static_cast<int>(fx), static_cast<int>(fy));
}

GridPlannerNode::GridPlannerNode()
: rclcpp::Node("grid_planner"),
  current_state_(PlannerState::IDLE)
{
    this->declare_parameter("algorithm", "astar");
    this->declare_parameter("diagonal", false);
    this->declare_parameter("storage", "dense");
    this->declare_parameter("occupied_threshold", 50);
    this->declare_parameter("allow_unknown", false);
    this->declare_parameter("frame_id", "map");

    this->get_parameter("algorithm", algorithm_);
    this->get_parameter("diagonal", diagonal_);
    this->get_parameter("storage", storage_);
    this->get_parameter("occupied_threshold", occupied_threshold_);
    this->get_parameter("allow_unknown", allow_unknown_);
    this->get_parameter("frame_id", frame_id_);

    if (algorithm_ != "bfs" && algorithm_ != "astar" && algorithm_ != "ucs") {
        RCLCPP_WARN(this->get_logger(), "Unknown algorithm '%s', using astar", algorithm_.c_str());
        algorithm_ = "astar";
    }

    map_sub_ = this->create_subscription<nav_msgs::msg::OccupancyGrid>(
        "/map", rclcpp::QoS(1).transient_local(), std::bind(&GridPlannerNode::mapCallback, this, _1));

    start_sub_ = this->create_subscription<geometry_msgs::msg::PoseStamped>(
        "/start_pose", 10, std::bind(&GridPlannerNode::startCallback, this, _1));

    goal_sub_ = this->create_subscription<geometry_msgs::msg::PoseStamped>(
        "/goal_pose", 10, std::bind(&GridPlannerNode::goalCallback, this, _1));

    path_pub_ = this->create_publisher<nav_msgs::msg::Path>("planning/path", 10);
    status_pub_ = this->create_publisher<std_msgs::msg::String>("planning/planner_status", 10);

    RCLCPP_INFO(this->get_logger(), "Grid planner ready");
    RCLCPP_INFO(this->get_logger(), "  Algorithm: %s (%s moves, %s storage)",
                algorithm_.c_str(), diagonal_ ? "8-way" : "4-way", storage_.c_str());
    RCLCPP_INFO(this->get_logger(), "  Occupied threshold: %d", occupied_threshold_);

    updatePlannerState(PlannerState::NO_MAP);
}

void GridPlannerNode::updatePlannerState(PlannerState new_state)
{
    current_state_ = new_state;

    std_msgs::msg::String status;
    switch (current_state_) {
        case PlannerState::IDLE:          status.data = "IDLE"; break;
        case PlannerState::NO_MAP:        status.data = "NO_MAP"; break;
        case PlannerState::AWAITING_GOAL: status.data = "AWAITING_GOAL"; break;
        case PlannerState::SUCCESS:       status.data = "SUCCESS"; break;
        case PlannerState::FAILURE:       status.data = "FAILURE"; break;
    }
    status_pub_->publish(status);
}

void GridPlannerNode::mapCallback(const nav_msgs::msg::OccupancyGrid::SharedPtr msg) {
    try {
        model_ = std::make_unique<OccupancyModel>(
            modelFromOccupancy(*msg, occupied_threshold_, allow_unknown_));
    } catch (const std::exception& e) {
        RCLCPP_ERROR(this->get_logger(), "Rejected map: %s", e.what());
        model_.reset();
        updatePlannerState(PlannerState::NO_MAP);
        return;
    }
    RCLCPP_INFO(this->get_logger(), "Map received: %ux%u cells at %.3f m",
                msg->info.width, msg->info.height, msg->info.resolution);
    plan();
}

void GridPlannerNode::startCallback(const geometry_msgs::msg::PoseStamped::SharedPtr msg) {
    start_pose_ = *msg;
    plan();
}

void GridPlannerNode::goalCallback(const geometry_msgs::msg::PoseStamped::SharedPtr msg) {
    goal_pose_ = *msg;
    plan();
}

Path GridPlannerNode::runSearch() const {
    SearchOptions options;
    options.diagonals = diagonal_;
    options.storage = storage_ == "sparse" ? StorageKind::Sparse : StorageKind::Dense;

    const Maze& maze = model_->maze;
    if (algorithm_ == "bfs") {
        const Position goal = maze.goal;
        return breadthFirstSearch(maze.start, maze.moveFunction(),
                                  [goal](const Position& p) { return p == goal; }, options).path;
    }
    if (algorithm_ == "ucs") {
        return uniformCostSearch(maze.costFunction(), maze.start, maze.goal, options);
    }
    return astarSearch(maze.moveFunction(), maze.start, maze.goal, options);
}

void GridPlannerNode::plan() {
    if (!model_) {
        updatePlannerState(PlannerState::NO_MAP);
        return;
    }
    if (!start_pose_ || !goal_pose_) {
        updatePlannerState(PlannerState::AWAITING_GOAL);
        return;
    }

    auto start = cellOfPose(*model_, start_pose_->pose);
    auto goal = cellOfPose(*model_, goal_pose_->pose);
    if (!start || !goal) {
        RCLCPP_WARN(this->get_logger(), "Start or goal lies outside the map");
        updatePlannerState(PlannerState::FAILURE);
        return;
    }
    model_->maze.start = *start;
    model_->maze.goal = *goal;

    try {
        Path path = runSearch();
        RCLCPP_INFO(this->get_logger(), "Path from %s to %s: %zu moves",
                    toString(*start).c_str(), toString(*goal).c_str(), path.size());
        publishPath(path);
        updatePlannerState(PlannerState::SUCCESS);
    } catch (const Error& e) {
        RCLCPP_WARN(this->get_logger(), "Planning failed: %s", e.what());
        updatePlannerState(PlannerState::FAILURE);
    }
}

void GridPlannerNode::publishPath(const Path& path) {
    nav_msgs::msg::Path path_msg;
    path_msg.header.stamp = this->now();
    path_msg.header.frame_id = frame_id_;

    auto addCell = [&](const Position& cell) {
        geometry_msgs::msg::PoseStamped pose;
        pose.header = path_msg.header;
        pose.pose.position.x = model_->origin_x + (cell.x() + 0.5) * model_->resolution;
        pose.pose.position.y = model_->origin_y + (cell.y() + 0.5) * model_->resolution;
        pose.pose.orientation.w = 1.0;
        path_msg.poses.push_back(pose);
    };

    Position cell = model_->maze.start;
    addCell(cell);
    for (Direction d : path) {
        cell = applyPath(cell, Path{d});
        addCell(cell);
    }
    path_pub_->publish(path_msg);
}

} // namespace gridsearch
