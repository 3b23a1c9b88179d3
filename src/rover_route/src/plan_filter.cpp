#include "rover_route/plan_filter.hpp"

namespace rover_route
{
    PlanMatch classifyPlan(bool goal_accepted, const rclcpp::Time &goal_sent,
                           const rclcpp::Time &plan_stamp, std::size_t plan_size)
    {
        if (plan_size == 0)
            return PlanMatch::Reject;

        // 不同时钟类型的时间不能比较
        if (plan_stamp.get_clock_type() != goal_sent.get_clock_type())
            return PlanMatch::Reject;

        // 发送之前生成的路径一定来自上一个目标
        if (plan_stamp < goal_sent)
            return PlanMatch::Reject;

        return goal_accepted ? PlanMatch::Accept : PlanMatch::Pending;
    }

} // namespace rover_route
