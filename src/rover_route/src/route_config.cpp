#include "rover_route/route_config.hpp"

#include <cmath>

namespace rover_route
{
    bool parseRouteMode(const std::string &name, RouteMode &mode)
    {
        if (name == "inorder")
        {
            mode = RouteMode::Sequential;
            return true;
        }
        if (name == "random")
        {
            mode = RouteMode::RandomChoice;
            return true;
        }
        if (name == "dynamic")
        {
            mode = RouteMode::DynamicSampling;
            return true;
        }
        return false;
    }

    std::string routeModeName(RouteMode mode)
    {
        switch (mode)
        {
        case RouteMode::Sequential:
            return "inorder";
        case RouteMode::RandomChoice:
            return "random";
        case RouteMode::DynamicSampling:
            return "dynamic";
        }
        return "unknown";
    }

    bool parsePoses(const std::vector<double> &flat, std::vector<Pose> &poses)
    {
        poses.clear();

        if (flat.size() % kPoseStride != 0)
        {
            return false;
        }

        for (std::size_t i = 0; i < flat.size(); i += kPoseStride)
        {
            for (std::size_t j = 0; j < kPoseStride; ++j)
            {
                if (!std::isfinite(flat[i + j]))
                {
                    poses.clear();
                    return false;
                }
            }

            Eigen::Vector3d position(flat[i], flat[i + 1], flat[i + 2]);
            // Eigen 四元数构造顺序是 (w, x, y, z)
            Eigen::Quaterniond q(flat[i + 6], flat[i + 3], flat[i + 4], flat[i + 5]);
            if (q.norm() < 1e-9)
            {
                poses.clear();
                return false;
            }
            poses.emplace_back(position, q);
        }
        return true;
    }

} // namespace rover_route
