#ifndef ROVER_ROUTE_GOAL_SOURCE_HPP_
#define ROVER_ROUTE_GOAL_SOURCE_HPP_

#include <cstddef>
#include <memory>
#include <optional>
#include <random>
#include <variant>
#include <vector>

#include "rover_route/goal_sampler.hpp"
#include "rover_route/types.hpp"

namespace rover_route
{
    // 目标来源：按路线模式选定一次，之后只通过 next() 取下一个目标
    class GoalSource
    {
    public:
        // 按顺序循环给出预设目标 A,B,C,A,B,C...
        static GoalSource makeSequential(std::vector<Pose> poses);
        // 从预设目标中有放回地均匀随机抽取
        static GoalSource makeRandomChoice(std::vector<Pose> poses);
        // 每次请求都交给 GoalSampler 在地图上采样
        static GoalSource makeDynamic(std::unique_ptr<GoalSampler> sampler);

        // 取下一个目标；动态模式下采样失败或列表为空时返回 std::nullopt
        std::optional<Pose> next();
        RouteMode mode() const;

    private:
        struct Sequential
        {
            std::vector<Pose> poses;
            std::size_t cursor = 0;
        };
        struct RandomChoice
        {
            std::vector<Pose> poses;
            std::mt19937 rng;
        };
        struct Dynamic
        {
            std::unique_ptr<GoalSampler> sampler;
        };
        using Impl = std::variant<Sequential, RandomChoice, Dynamic>;

        explicit GoalSource(Impl impl);

        Impl impl_;
    };
}; // namespace rover_route

#endif // ROVER_ROUTE_GOAL_SOURCE_HPP_
