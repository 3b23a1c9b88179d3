#ifndef ROVER_ROUTE_TYPES_HPP_
#define ROVER_ROUTE_TYPES_HPP_

#include <Eigen/Dense>
#include <Eigen/Geometry>

namespace rover_route
{
    // 目标位姿：世界坐标位置 + 单位四元数姿态
    struct Pose
    {
        Eigen::Vector3d position;
        Eigen::Quaterniond orientation;

        Pose()
            : position(Eigen::Vector3d::Zero()),
              orientation(Eigen::Quaterniond::Identity()) {}

        // 姿态在构造时归一化，保证始终是单位四元数
        Pose(const Eigen::Vector3d &pos, const Eigen::Quaterniond &q)
            : position(pos), orientation(q.normalized()) {}
    };

    // 地图元数据，地图到世界只有平移和绕 z 轴的旋转
    struct MapInfo
    {
        int width = 0;
        int height = 0;
        double resolution = 0.0;       // 米/格
        Eigen::Vector2d origin = Eigen::Vector2d::Zero();
        double yaw = 0.0;              // 弧度
    };

    // 路线模式，启动时确定，运行期间不再改变
    enum class RouteMode
    {
        Sequential,
        RandomChoice,
        DynamicSampling
    };
}; // namespace rover_route

#endif // ROVER_ROUTE_TYPES_HPP_
