#ifndef ROVER_ROUTE_NAV2_CLIENT_HPP_
#define ROVER_ROUTE_NAV2_CLIENT_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

#include "rclcpp/rclcpp.hpp"
#include "rclcpp_action/rclcpp_action.hpp"
#include "nav_msgs/msg/path.hpp"
#include "nav2_msgs/action/navigate_to_pose.hpp"
#include "rover_route/navigation_client.hpp"
#include "rover_route/plan_filter.hpp"

namespace rover_route
{
    // 基于 Nav2 navigate_to_pose 动作的导航客户端
    // 回调在后台执行器线程里执行，等待函数在主循环线程里阻塞
    class Nav2Client : public NavigationClient
    {
    public:
        using NavigateToPose = nav2_msgs::action::NavigateToPose;
        using GoalHandleNav = rclcpp_action::ClientGoalHandle<NavigateToPose>;

        Nav2Client(rclcpp::Node *node, const std::string &action_name, const std::string &plan_topic);

        void waitForServer() override;
        void sendGoal(const geometry_msgs::msg::PoseStamped &goal) override;
        bool waitForPlan(std::chrono::milliseconds timeout) override;
        bool waitForResult() override;
        bool getResult() override;

    private:
        void planCallback(const nav_msgs::msg::Path::SharedPtr msg);
        // 服务端接受了第 seq 个目标
        void acceptGoal(std::uint64_t seq);
        // 只接受当前目标的回调，丢弃被放弃目标的迟到结果
        void finishGoal(std::uint64_t seq, rclcpp_action::ResultCode code);

        rclcpp::Node *node_;
        std::string action_name_;
        rclcpp_action::Client<NavigateToPose>::SharedPtr client_;
        rclcpp::Subscription<nav_msgs::msg::Path>::SharedPtr plan_sub_;

        std::mutex mtx_;
        std::condition_variable cv_;
        std::uint64_t goal_seq_ = 0;
        bool goal_active_ = false;
        bool goal_accepted_ = false;
        bool plan_pending_ = false;     // 目标被接受前就到达的路径
        rclcpp::Time goal_sent_;
        bool plan_received_ = false;
        bool result_received_ = false;
        rclcpp_action::ResultCode result_code_ = rclcpp_action::ResultCode::UNKNOWN;
    };
}; // namespace rover_route

#endif // ROVER_ROUTE_NAV2_CLIENT_HPP_
