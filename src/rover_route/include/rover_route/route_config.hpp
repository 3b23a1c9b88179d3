#ifndef ROVER_ROUTE_ROUTE_CONFIG_HPP_
#define ROVER_ROUTE_ROUTE_CONFIG_HPP_

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "rover_route/types.hpp"

namespace rover_route
{
    // 每个预设位姿在参数数组里占 7 个数: x, y, z, qx, qy, qz, qw
    constexpr std::size_t kPoseStride = 7;
    // 目标位姿所在的坐标系
    constexpr const char *kGoalFrame = "map";

    struct RouteConfig
    {
        std::string mode;                                     // inorder / random / dynamic
        std::vector<Pose> poses;                              // 非 dynamic 模式必须提供
        std::chrono::milliseconds plan_timeout{5000};         // 等待全局路径发布的时间
        std::chrono::milliseconds loop_period{1000};          // 主循环周期
        int max_bad_goals = 10;                               // 坏目标超过该数量后停止
    };

    // 模式名解析，成功返回 true
    bool parseRouteMode(const std::string &name, RouteMode &mode);
    // 模式转为参数里使用的名字
    std::string routeModeName(RouteMode mode);

    /*
     * @brief 把扁平的参数数组解析为位姿列表
     * @param flat 长度必须是 kPoseStride 的整数倍
     * @param poses 输出的位姿，四元数已归一化
     * @return true 成功 false 长度不对、含非有限值或四元数为零
     */
    bool parsePoses(const std::vector<double> &flat, std::vector<Pose> &poses);
}; // namespace rover_route

#endif // ROVER_ROUTE_ROUTE_CONFIG_HPP_
