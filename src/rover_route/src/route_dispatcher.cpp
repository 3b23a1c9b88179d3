/*
route_dispatcher (目标调度)
功能：根据路线模式不断选取下一个目标并下发给导航服务。
核心逻辑：
坏目标计数超过上限后永久停止。
每轮：取目标 -> 包装 -> 异步下发 -> 限时等待全局路径 -> 等待最终结果。
规划超时只计数不取消，直接进入下一轮。
*/
#include "rover_route/route_dispatcher.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include "rclcpp/duration.hpp"
#include "rclcpp/logging.hpp"

namespace rover_route
{
    const char *stopReasonName(StopReason reason)
    {
        switch (reason)
        {
        case StopReason::None:
            return "none";
        case StopReason::ConfigError:
            return "configuration error";
        case StopReason::BadGoalBudget:
            return "too many bad goals";
        case StopReason::NoGoalFound:
            return "no valid goal found";
        case StopReason::InvalidGoal:
            return "invalid goal";
        case StopReason::Shutdown:
            return "shutdown";
        }
        return "unknown";
    }

    RouteDispatcher::RouteDispatcher(std::shared_ptr<NavigationClient> client,
                                     const RouteConfig &config,
                                     SamplerFactory sampler_factory,
                                     rclcpp::Clock::SharedPtr clock,
                                     rclcpp::Logger logger)
        : client_(std::move(client)), config_(config), clock_(std::move(clock)), logger_(std::move(logger))
    {
        client_->waitForServer();

        RouteMode mode = RouteMode::Sequential;
        if (!parseRouteMode(config_.mode, mode))
        {
            RCLCPP_ERROR(logger_, "Route mode %s unknown, exiting route manager", config_.mode.c_str());
            return;
        }
        state_.route_mode = mode;

        switch (mode)
        {
        case RouteMode::Sequential:
        case RouteMode::RandomChoice:
            if (config_.poses.empty())
            {
                RCLCPP_ERROR(logger_, "Route manager initialized no goals, unable to route");
                return;
            }
            source_ = std::make_unique<GoalSource>(
                mode == RouteMode::Sequential ? GoalSource::makeSequential(config_.poses)
                                              : GoalSource::makeRandomChoice(config_.poses));
            break;
        case RouteMode::DynamicSampling:
        {
            std::unique_ptr<GoalSampler> sampler = sampler_factory ? sampler_factory() : nullptr;
            if (!sampler)
            {
                RCLCPP_ERROR(logger_, "Goal sampler unavailable, unable to route in dynamic mode");
                return;
            }
            source_ = std::make_unique<GoalSource>(GoalSource::makeDynamic(std::move(sampler)));
            break;
        }
        }

        initialized_ = true;
        RCLCPP_INFO(logger_, "Route manager initialized in %s mode", config_.mode.c_str());
    }

    geometry_msgs::msg::PoseStamped RouteDispatcher::toNavGoal(const std::optional<Pose> &pose) const
    {
        if (!pose)
        {
            throw std::invalid_argument("Goal position cannot be NULL");
        }

        geometry_msgs::msg::PoseStamped goal;
        goal.header.stamp = clock_->now();
        goal.header.frame_id = kGoalFrame;
        goal.pose.position.x = pose->position.x();
        goal.pose.position.y = pose->position.y();
        goal.pose.position.z = pose->position.z();
        goal.pose.orientation.x = pose->orientation.x();
        goal.pose.orientation.y = pose->orientation.y();
        goal.pose.orientation.z = pose->orientation.z();
        goal.pose.orientation.w = pose->orientation.w();
        return goal;
    }

    StopReason RouteDispatcher::stop(StopReason reason)
    {
        state_.phase = DispatchPhase::Terminated;
        return reason;
    }

    StopReason RouteDispatcher::routeForever(const std::function<bool()> &ok)
    {
        if (!initialized_)
        {
            RCLCPP_ERROR(logger_, "Route manager is not initialized, nothing to route");
            return stop(StopReason::ConfigError);
        }

        const std::string mode_name = routeModeName(state_.route_mode);
        state_.phase = DispatchPhase::Dispatching;

        while (ok())
        {
            rclcpp::Time cycle_start = clock_->now();

            // 1. 坏目标太多，地图大概率有问题，不再重试
            if (state_.bad_goal_count > config_.max_bad_goals)
            {
                RCLCPP_ERROR(logger_,
                             "Stopping route manager due to too many bad goals (%d). Check that your occupancy map "
                             "has Trinary value representation and is not visually noisy/incorrect",
                             state_.bad_goal_count);
                return stop(StopReason::BadGoalBudget);
            }

            // 2. 取下一个目标并包装
            RCLCPP_INFO(logger_, "Route mode is %s, getting next goal", mode_name.c_str());
            state_.current_goal = source_->next();

            geometry_msgs::msg::PoseStamped goal;
            try
            {
                goal = toNavGoal(state_.current_goal);
            }
            catch (const std::invalid_argument &e)
            {
                if (state_.route_mode == RouteMode::DynamicSampling)
                {
                    RCLCPP_ERROR(logger_,
                                 "No valid goal was found in the map, stopping route manager due to: %s", e.what());
                    return stop(StopReason::NoGoalFound);
                }
                RCLCPP_ERROR(logger_, "Invalid goal, stopping route manager due to: %s", e.what());
                return stop(StopReason::InvalidGoal);
            }

            // 3. 异步下发
            RCLCPP_INFO(logger_, "Sending target goal: [%.2f, %.2f, %.2f] in %s",
                        goal.pose.position.x, goal.pose.position.y, goal.pose.position.z,
                        goal.header.frame_id.c_str());
            client_->sendGoal(goal);

            // 4. 限时等待全局路径，超时说明这个目标规划不出来，换下一个
            state_.phase = DispatchPhase::ScanningForPlan;
            if (!client_->waitForPlan(config_.plan_timeout))
            {
                state_.bad_goal_count++;
                state_.phase = DispatchPhase::Dispatching;
                RCLCPP_WARN(logger_, "No plan found for goal. Scanning for a new goal... (bad goals: %d)",
                            state_.bad_goal_count);
                continue;
            }

            // 5. 有路径了，等待执行结果（成功或失败都不计入坏目标）
            state_.phase = DispatchPhase::ExecutingPlan;
            if (!client_->waitForResult())
            {
                RCLCPP_ERROR(logger_, "Move server not ready, will try again...");
            }
            else if (client_->getResult())
            {
                RCLCPP_INFO(logger_, "Goal done: [%.2f, %.2f]", goal.pose.position.x, goal.pose.position.y);
            }
            else
            {
                RCLCPP_WARN(logger_, "Goal failed: [%.2f, %.2f]", goal.pose.position.x, goal.pose.position.y);
            }
            state_.phase = DispatchPhase::Dispatching;

            // 6. 控制循环频率，按节点时钟走（use_sim_time 时跟随仿真时间）
            rclcpp::Time wake_up = cycle_start + rclcpp::Duration(config_.loop_period);
            if (clock_->now() < wake_up && !clock_->sleep_until(wake_up))
            {
                RCLCPP_DEBUG(logger_, "Loop pacing interrupted");
            }
        }

        RCLCPP_INFO(logger_, "Shutdown requested, stopping route manager");
        return stop(StopReason::Shutdown);
    }

} // namespace rover_route
