#pragma once

#include "rclcpp/logger.hpp"
#include "rclcpp/logging.hpp"

namespace gridsearch {

// Library-wide logger; tools get their own child loggers.
inline rclcpp::Logger logger() { return rclcpp::get_logger("gridsearch"); }

} // namespace gridsearch
