#ifndef ROVER_ROUTE_NAVIGATION_CLIENT_HPP_
#define ROVER_ROUTE_NAVIGATION_CLIENT_HPP_

#include <chrono>

#include "geometry_msgs/msg/pose_stamped.hpp"

namespace rover_route
{
    // 外部规划/执行服务的接口，RouteDispatcher 只通过它下发目标
    class NavigationClient
    {
    public:
        virtual ~NavigationClient() = default;

        // 阻塞直到服务就绪，不设超时
        virtual void waitForServer() = 0;
        // 异步发送目标，不阻塞
        virtual void sendGoal(const geometry_msgs::msg::PoseStamped &goal) = 0;
        // 在 timeout 内等待规划开始的通知，超时返回 false
        virtual bool waitForPlan(std::chrono::milliseconds timeout) = 0;
        // 阻塞等待最终结果，收到结果返回 true
        virtual bool waitForResult() = 0;
        // 最近一个目标是否成功
        virtual bool getResult() = 0;
    };
}; // namespace rover_route

#endif // ROVER_ROUTE_NAVIGATION_CLIENT_HPP_
