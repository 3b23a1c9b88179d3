#ifndef ROVER_ROUTE_PLAN_FILTER_HPP_
#define ROVER_ROUTE_PLAN_FILTER_HPP_

#include <cstddef>

#include "rclcpp/time.hpp"

namespace rover_route
{
    // 收到的全局路径与当前目标的关系
    enum class PlanMatch
    {
        Reject,  // 空路径、早于目标发送时间或时钟类型不一致，属于之前被放弃的目标
        Pending, // 时间上属于当前目标，但服务端还没确认接受
        Accept   // 当前目标的规划
    };

    /*
     * @brief 判断一条全局路径是否是当前目标的规划
     * @param goal_accepted 服务端是否已接受当前目标
     * @param goal_sent 当前目标的发送时间
     * @param plan_stamp 路径 header 里的时间戳
     * @param plan_size 路径点数量
     */
    PlanMatch classifyPlan(bool goal_accepted, const rclcpp::Time &goal_sent,
                           const rclcpp::Time &plan_stamp, std::size_t plan_size);
}; // namespace rover_route

#endif // ROVER_ROUTE_PLAN_FILTER_HPP_
