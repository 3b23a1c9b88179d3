/*
goal_sampler (目标采样)
功能：纯算法实现，不包含任何 ROS 2 头文件。
核心逻辑：
持有一份静态占据栅格地图快照，运行期间不刷新。
栅格坐标(x,y)到世界坐标的平面变换（旋转 yaw + 平移 origin）。
邻域检查：目标格子周围存在非空闲格则视为噪点区域，丢弃。
输出：一个随机的、无碰撞的世界坐标目标位姿，或者找不到目标。
*/
#include "rover_route/goal_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace rover_route
{
    GoalSampler::GoalSampler(const MapInfo &info, const std::vector<int8_t> &data)
        : info_(info), data_(data), rng_(std::random_device{}())
    {
        if (info_.width < 0 || info_.height < 0)
        {
            throw std::invalid_argument("map size cannot be negative");
        }
        std::size_t expected = static_cast<std::size_t>(info_.width) * static_cast<std::size_t>(info_.height);
        if (data_.size() != expected)
        {
            throw std::invalid_argument("map data size " + std::to_string(data_.size()) +
                                        " does not match " + std::to_string(info_.width) + "x" +
                                        std::to_string(info_.height));
        }
    }

    int GoalSampler::ravelIndex(int x, int y) const
    {
        return y * info_.width + x;
    }

    Eigen::Vector2d GoalSampler::gridToWorld(int x, int y) const
    {
        // 先按分辨率缩放，再旋转 yaw，最后平移到原点
        Eigen::Vector2d offset(info_.resolution * x, info_.resolution * y);
        Eigen::Vector2d pos;
        pos.x() = info_.origin.x() + std::cos(info_.yaw) * offset.x() - std::sin(info_.yaw) * offset.y();
        pos.y() = info_.origin.y() + std::sin(info_.yaw) * offset.x() + std::cos(info_.yaw) * offset.y();

        return pos;
    }

    Eigen::Vector2d GoalSampler::worldToGrid(const Eigen::Vector2d &pos) const
    {
        Eigen::Vector2d delta = pos - info_.origin;
        Eigen::Vector2d cell;
        cell.x() = (std::cos(info_.yaw) * delta.x() + std::sin(info_.yaw) * delta.y()) / info_.resolution;
        cell.y() = (-std::sin(info_.yaw) * delta.x() + std::cos(info_.yaw) * delta.y()) / info_.resolution;

        return cell;
    }

    bool GoalSampler::isOutside(int x, int y) const
    {
        return (x < 0) || (y < 0) || (x >= info_.width) || (y >= info_.height);
    }

    bool GoalSampler::isFree(int x, int y) const
    {
        return data_[ravelIndex(x, y)] == 0;
    }

    bool GoalSampler::isRegionClean(int x, int y) const
    {
        if (isOutside(x, y))
        {
            return false;
        }

        // 窗口半宽随地图尺寸变化，最小 2 格
        int delta_x = std::max(2, info_.width / 50);
        int delta_y = std::max(2, info_.height / 50);

        // 窗口裁剪到地图范围内，不做环绕
        int l_bound = std::max(0, x - delta_x);
        int r_bound = std::min(info_.width - 1, x + delta_x);
        int t_bound = std::max(0, y - delta_y);
        int b_bound = std::min(info_.height - 1, y + delta_y);

        for (int check_x = l_bound; check_x <= r_bound; check_x++)
        {
            for (int check_y = t_bound; check_y <= b_bound; check_y++)
            {
                // 占据(>0)和未知(<0)都不算干净
                if (!isFree(check_x, check_y))
                {
                    return false;
                }
            }
        }

        return true;
    }

    std::optional<Pose> GoalSampler::nextGoal()
    {
        std::cout << "[GoalSampler] Searching for a valid goal" << std::endl;

        if (info_.width == 0 || info_.height == 0)
        {
            std::cerr << "[GoalSampler] Map is empty, cannot sample a goal!" << std::endl;
            return std::nullopt;
        }

        std::uniform_int_distribution<int> dist_x(0, info_.width - 1);
        std::uniform_int_distribution<int> dist_y(0, info_.height - 1);

        for (int attempt = 0; attempt < kMaxAttempts; attempt++)
        {
            int x = dist_x(rng_);
            int y = dist_y(rng_);
            if (!isFree(x, y) || !isRegionClean(x, y))
                continue;

            Eigen::Vector2d world = gridToWorld(x, y);
            std::cout << "[GoalSampler] Valid goal found!" << std::endl;

            // 地面高度固定，姿态为零旋转
            Eigen::Quaterniond q(Eigen::AngleAxisd(0.0, Eigen::Vector3d::UnitZ()));
            return Pose(Eigen::Vector3d(world.x(), world.y(), kFloorHeight), q);
        }

        std::cerr << "[GoalSampler] Could not find a valid goal in the world. Check that your occupancy map "
                     "has Trinary value representation and is not visually noisy/incorrect"
                  << std::endl;
        return std::nullopt;
    }

} // namespace rover_route
