#ifndef ROVER_ROUTE_GOAL_SAMPLER_HPP_
#define ROVER_ROUTE_GOAL_SAMPLER_HPP_

#include <cstdint>
#include <optional>
#include <random>
#include <vector>
#include <Eigen/Dense>

#include "rover_route/types.hpp"

namespace rover_route
{
    class GoalSampler
    {
    public:
        // 地图快照只在构造时载入一次，之后视为静态地图
        // data 长度必须等于 width * height，否则抛出 std::invalid_argument
        GoalSampler(const MapInfo &info, const std::vector<int8_t> &data);
        ~GoalSampler() = default;

        // 二维栅格坐标按行优先展开
        int ravelIndex(int x, int y) const;
        // 栅格坐标转换为世界坐标
        Eigen::Vector2d gridToWorld(int x, int y) const;
        // 世界坐标转换为(连续的)栅格坐标
        Eigen::Vector2d worldToGrid(const Eigen::Vector2d &pos) const;
        // 判断邻域窗口内是否全部为空闲格，用于过滤地图噪点
        bool isRegionClean(int x, int y) const;
        // 随机采样一个有效目标，失败返回 std::nullopt
        std::optional<Pose> nextGoal();

        const MapInfo &info() const { return info_; }

        static constexpr int kMaxAttempts = 100;
        static constexpr double kFloorHeight = 0.0;

    private:
        // 判断是否出界
        bool isOutside(int x, int y) const;
        // 单个格子是否空闲 (值为 0)
        bool isFree(int x, int y) const;

        MapInfo info_;
        std::vector<int8_t> data_;
        std::mt19937 rng_;
    };
}; // namespace rover_route

#endif // ROVER_ROUTE_GOAL_SAMPLER_HPP_
