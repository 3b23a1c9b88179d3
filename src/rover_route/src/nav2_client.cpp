#include "rover_route/nav2_client.hpp"

using namespace std::chrono_literals;
using nav_msgs::msg::Path;
using std::placeholders::_1;

namespace rover_route
{
    Nav2Client::Nav2Client(rclcpp::Node *node, const std::string &action_name, const std::string &plan_topic)
        : node_(node), action_name_(action_name)
    {
        client_ = rclcpp_action::create_client<NavigateToPose>(node_, action_name_);
        plan_sub_ = node_->create_subscription<Path>(plan_topic, 10, std::bind(&Nav2Client::planCallback, this, _1));
    }

    void Nav2Client::waitForServer()
    {
        // 服务起来之前一直等，只在 ROS 关闭时退出
        while (!client_->wait_for_action_server(1s))
        {
            if (!rclcpp::ok())
            {
                RCLCPP_WARN(node_->get_logger(), "Interrupted while waiting for %s action server", action_name_.c_str());
                return;
            }
            RCLCPP_INFO_THROTTLE(node_->get_logger(), *node_->get_clock(), 5000,
                                 "Waiting for %s action server...", action_name_.c_str());
        }
        RCLCPP_INFO(node_->get_logger(), "%s action server is ready", action_name_.c_str());
    }

    void Nav2Client::sendGoal(const geometry_msgs::msg::PoseStamped &goal)
    {
        std::uint64_t seq;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            seq = ++goal_seq_;
            goal_active_ = true;
            goal_accepted_ = false;
            goal_sent_ = node_->now();
            plan_pending_ = false;
            plan_received_ = false;
            result_received_ = false;
            result_code_ = rclcpp_action::ResultCode::UNKNOWN;
        }

        NavigateToPose::Goal goal_msg;
        goal_msg.pose = goal;

        rclcpp_action::Client<NavigateToPose>::SendGoalOptions opts;
        opts.goal_response_callback =
            [this, seq](GoalHandleNav::SharedPtr handle)
        {
            if (!handle)
            {
                RCLCPP_WARN(node_->get_logger(), "Goal was rejected by %s", action_name_.c_str());
                finishGoal(seq, rclcpp_action::ResultCode::ABORTED);
                return;
            }
            acceptGoal(seq);
        };
        opts.feedback_callback =
            [this](GoalHandleNav::SharedPtr,
                   const std::shared_ptr<const NavigateToPose::Feedback> fb)
        {
            RCLCPP_INFO_THROTTLE(node_->get_logger(), *node_->get_clock(), 2000,
                                 "feedback: dist_remain=%.2f", fb->distance_remaining);
        };
        opts.result_callback =
            [this, seq](const GoalHandleNav::WrappedResult &result)
        {
            finishGoal(seq, result.code);
        };

        client_->async_send_goal(goal_msg, opts);
    }

    void Nav2Client::acceptGoal(std::uint64_t seq)
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (seq != goal_seq_)
                return;
            goal_accepted_ = true;
            if (!plan_pending_)
                return;
            plan_received_ = true;
        }
        cv_.notify_all();
    }

    void Nav2Client::finishGoal(std::uint64_t seq, rclcpp_action::ResultCode code)
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (seq != goal_seq_)
                return;
            result_received_ = true;
            result_code_ = code;
        }
        cv_.notify_all();
    }

    void Nav2Client::planCallback(const Path::SharedPtr msg)
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (!goal_active_)
                return;

            // 路径时间戳按节点时钟类型解释，早于发送时间的是被放弃目标的规划
            rclcpp::Time stamp(msg->header.stamp, goal_sent_.get_clock_type());
            PlanMatch match = classifyPlan(goal_accepted_, goal_sent_, stamp, msg->poses.size());
            if (match == PlanMatch::Reject)
                return;
            if (match == PlanMatch::Pending)
            {
                plan_pending_ = true;
                return;
            }
            plan_received_ = true;
        }
        cv_.notify_all();
    }

    bool Nav2Client::waitForPlan(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lk(mtx_);
        bool planned = cv_.wait_for(lk, timeout, [this]
                                    { return plan_received_; });
        if (!planned)
        {
            // 不取消目标，只是不再等待它
            goal_active_ = false;
        }
        return planned;
    }

    bool Nav2Client::waitForResult()
    {
        std::unique_lock<std::mutex> lk(mtx_);
        // 分段等待，ROS 关闭时能及时退出
        while (!result_received_)
        {
            if (!rclcpp::ok())
                return false;
            cv_.wait_for(lk, 200ms);
        }
        goal_active_ = false;
        return true;
    }

    bool Nav2Client::getResult()
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return result_received_ && result_code_ == rclcpp_action::ResultCode::SUCCEEDED;
    }

} // namespace rover_route
