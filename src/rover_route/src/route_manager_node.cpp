/*
功能：唯一与 ROS 2 交互的入口。
核心逻辑：
参数：mode（inorder/random/dynamic）、poses（预设目标）以及各项超时。
订阅：/map（只取一次快照，dynamic 模式用来构造 GoalSampler）。
逻辑控制：主线程运行 RouteDispatcher 的循环，后台线程 spin 执行器处理回调。
*/
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "rclcpp/rclcpp.hpp"
#include "nav_msgs/msg/occupancy_grid.hpp"
#include "tf2/utils.h"
#include "tf2_geometry_msgs/tf2_geometry_msgs.hpp"
#include "rover_route/goal_sampler.hpp"
#include "rover_route/nav2_client.hpp"
#include "rover_route/route_config.hpp"
#include "rover_route/route_dispatcher.hpp"

using nav_msgs::msg::OccupancyGrid;
using std::placeholders::_1;

class RouteManagerNode : public rclcpp::Node
{
public:
    RouteManagerNode() : Node("route_manager")
    {
        // 声明参数
        mode_ = this->declare_parameter<std::string>("mode", "");
        poses_flat_ = this->declare_parameter<std::vector<double>>("poses", std::vector<double>{});
        action_name_ = this->declare_parameter<std::string>("action_name", "navigate_to_pose");
        plan_topic_ = this->declare_parameter<std::string>("plan_topic", "/plan");
        map_topic_ = this->declare_parameter<std::string>("map_topic", "/map");
        plan_timeout_s_ = this->declare_parameter<double>("plan_timeout", 5.0);
        loop_rate_hz_ = this->declare_parameter<double>("loop_rate", 1.0);
        max_bad_goals_ = this->declare_parameter<int>("max_bad_goals", 10);
        RCLCPP_INFO(this->get_logger(), "mode:%s, poses:%zu values, plan_timeout:%.1fs, loop_rate:%.1fHz",
                    mode_.c_str(), poses_flat_.size(), plan_timeout_s_, loop_rate_hz_);

        // 地图是 latched 的，用 transient_local 才能拿到之前发布的那一帧
        auto qos = rclcpp::QoS(rclcpp::KeepLast(1)).transient_local();
        map_sub_ = this->create_subscription<OccupancyGrid>(map_topic_, qos, std::bind(&RouteManagerNode::mapCallback, this, _1));

        nav_client_ = std::make_shared<rover_route::Nav2Client>(this, action_name_, plan_topic_);
    }

    // 在主线程中调用，直到路线结束或 ROS 关闭才返回
    void run()
    {
        rover_route::RouteConfig config;
        if (!buildConfig(config))
        {
            RCLCPP_ERROR(this->get_logger(), "Invalid route manager configuration, unable to route");
            return;
        }

        rover_route::RouteDispatcher dispatcher(
            nav_client_, config,
            [this]()
            { return this->waitForSampler(); },
            this->get_clock(), this->get_logger());

        rover_route::StopReason reason = dispatcher.routeForever([]()
                                                                 { return rclcpp::ok(); });
        RCLCPP_INFO(this->get_logger(), "Route manager stopped (%s) after %d bad goals",
                    rover_route::stopReasonName(reason), dispatcher.state().bad_goal_count);
    }

private:
    std::string mode_;
    std::vector<double> poses_flat_;
    std::string action_name_;
    std::string plan_topic_;
    std::string map_topic_;
    double plan_timeout_s_;
    double loop_rate_hz_;
    int max_bad_goals_;

    std::shared_ptr<rover_route::Nav2Client> nav_client_;
    rclcpp::Subscription<OccupancyGrid>::SharedPtr map_sub_;

    // 地图快照，只保存第一帧
    std::mutex map_mtx_;
    std::condition_variable map_cv_;
    bool map_received_ = false;
    OccupancyGrid stored_map_;

    // map 回调函数
    void mapCallback(const OccupancyGrid::SharedPtr msg)
    {
        {
            std::lock_guard<std::mutex> lk(map_mtx_);
            if (map_received_)
                return;
            stored_map_ = *msg;
            map_received_ = true;
        }
        RCLCPP_INFO(this->get_logger(), "Map Received! %ux%u @ %.3fm", msg->info.width, msg->info.height, msg->info.resolution);
        map_cv_.notify_all();
    }

    bool buildConfig(rover_route::RouteConfig &config)
    {
        config.mode = mode_;

        // dynamic 模式不使用预设目标
        if (mode_ != "dynamic" && !rover_route::parsePoses(poses_flat_, config.poses))
        {
            RCLCPP_ERROR(this->get_logger(), "poses must be a list of [x, y, z, qx, qy, qz, qw] groups with a non-zero quaternion");
            return false;
        }
        if (plan_timeout_s_ <= 0.0 || loop_rate_hz_ <= 0.0 || max_bad_goals_ < 0)
        {
            RCLCPP_ERROR(this->get_logger(), "plan_timeout and loop_rate must be positive, max_bad_goals non-negative");
            return false;
        }

        config.plan_timeout = std::chrono::milliseconds(static_cast<int64_t>(std::lround(plan_timeout_s_ * 1000.0)));
        config.loop_period = std::chrono::milliseconds(static_cast<int64_t>(std::lround(1000.0 / loop_rate_hz_)));
        config.max_bad_goals = max_bad_goals_;
        return true;
    }

    // 阻塞等待地图，然后构造 GoalSampler
    std::unique_ptr<rover_route::GoalSampler> waitForSampler()
    {
        RCLCPP_INFO(this->get_logger(), "Waiting for map on %s ...", map_topic_.c_str());

        std::unique_lock<std::mutex> lk(map_mtx_);
        while (!map_received_)
        {
            if (!rclcpp::ok())
                return nullptr;
            map_cv_.wait_for(lk, std::chrono::milliseconds(500));
        }

        // 提取分辨率、原点、尺寸，只保留 yaw
        rover_route::MapInfo info;
        info.width = static_cast<int>(stored_map_.info.width);
        info.height = static_cast<int>(stored_map_.info.height);
        info.resolution = stored_map_.info.resolution;
        info.origin.x() = stored_map_.info.origin.position.x;
        info.origin.y() = stored_map_.info.origin.position.y;
        info.yaw = tf2::getYaw(stored_map_.info.origin.orientation);

        try
        {
            return std::make_unique<rover_route::GoalSampler>(info, stored_map_.data);
        }
        catch (const std::invalid_argument &e)
        {
            RCLCPP_ERROR(this->get_logger(), "Bad map snapshot: %s", e.what());
            return nullptr;
        }
    }
};

int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);
    auto node = std::make_shared<RouteManagerNode>();

    // 回调放到后台线程，主线程留给阻塞的调度循环
    rclcpp::executors::MultiThreadedExecutor exec(rclcpp::ExecutorOptions(), 2);
    exec.add_node(node);
    std::thread spin_thread([&exec]()
                            { exec.spin(); });

    node->run();

    rclcpp::shutdown();
    spin_thread.join();
    return 0;
}
