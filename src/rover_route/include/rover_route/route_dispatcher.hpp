#ifndef ROVER_ROUTE_ROUTE_DISPATCHER_HPP_
#define ROVER_ROUTE_ROUTE_DISPATCHER_HPP_

#include <functional>
#include <memory>
#include <optional>

#include "rclcpp/clock.hpp"
#include "rclcpp/logger.hpp"
#include "geometry_msgs/msg/pose_stamped.hpp"
#include "rover_route/goal_sampler.hpp"
#include "rover_route/goal_source.hpp"
#include "rover_route/navigation_client.hpp"
#include "rover_route/route_config.hpp"
#include "rover_route/types.hpp"

namespace rover_route
{
    enum class DispatchPhase
    {
        Idle,
        Dispatching,
        ScanningForPlan,
        ExecutingPlan,
        Terminated
    };

    // 主循环结束的原因
    enum class StopReason
    {
        None,
        ConfigError,   // 模式非法、没有预设目标或采样器创建失败
        BadGoalBudget, // 坏目标数量超过上限
        NoGoalFound,   // 动态采样找不到有效目标
        InvalidGoal,   // 目标为空，无法转换
        Shutdown       // 外部关闭请求
    };

    const char *stopReasonName(StopReason reason);

    // 单次运行的可变状态，只由主循环线程修改
    struct DispatchState
    {
        int bad_goal_count = 0;
        std::optional<Pose> current_goal;
        RouteMode route_mode = RouteMode::Sequential;
        DispatchPhase phase = DispatchPhase::Idle;
    };

    class RouteDispatcher
    {
    public:
        // 只有 dynamic 模式才会调用，可能阻塞等待地图
        using SamplerFactory = std::function<std::unique_ptr<GoalSampler>()>;

        RouteDispatcher(std::shared_ptr<NavigationClient> client,
                        const RouteConfig &config,
                        SamplerFactory sampler_factory,
                        rclcpp::Clock::SharedPtr clock,
                        rclcpp::Logger logger = rclcpp::get_logger("route_dispatcher"));

        // 初始化失败时不会下发任何目标
        bool initialized() const { return initialized_; }

        /*
         * @brief 无限循环下发目标，直到出现终止条件
         * @param ok 每轮开始前检查，返回 false 表示外部请求关闭
         * @return 循环结束的原因
         */
        StopReason routeForever(const std::function<bool()> &ok);

        // 包装为规划服务的目标格式，pose 为空时抛出 std::invalid_argument
        geometry_msgs::msg::PoseStamped toNavGoal(const std::optional<Pose> &pose) const;

        const DispatchState &state() const { return state_; }

    private:
        StopReason stop(StopReason reason);

        std::shared_ptr<NavigationClient> client_;
        RouteConfig config_;
        rclcpp::Clock::SharedPtr clock_;
        rclcpp::Logger logger_;

        std::unique_ptr<GoalSource> source_;
        DispatchState state_;
        bool initialized_ = false;
    };
}; // namespace rover_route

#endif // ROVER_ROUTE_ROUTE_DISPATCHER_HPP_
