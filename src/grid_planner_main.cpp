#include "gridsearch/grid_planner_node.hpp"

int main(int argc, char * argv[]) {
    rclcpp::init(argc, argv);
    auto node = std::make_shared<gridsearch::GridPlannerNode>();
    rclcpp::spin(node);
    rclcpp::shutdown();
    return 0;
}
