#include "rover_route/goal_source.hpp"

#include <utility>

namespace rover_route
{
    GoalSource::GoalSource(Impl impl) : impl_(std::move(impl)) {}

    GoalSource GoalSource::makeSequential(std::vector<Pose> poses)
    {
        return GoalSource(Sequential{std::move(poses), 0});
    }

    GoalSource GoalSource::makeRandomChoice(std::vector<Pose> poses)
    {
        return GoalSource(RandomChoice{std::move(poses), std::mt19937(std::random_device{}())});
    }

    GoalSource GoalSource::makeDynamic(std::unique_ptr<GoalSampler> sampler)
    {
        return GoalSource(Dynamic{std::move(sampler)});
    }

    std::optional<Pose> GoalSource::next()
    {
        if (auto *seq = std::get_if<Sequential>(&impl_))
        {
            if (seq->poses.empty())
                return std::nullopt;
            const Pose &pose = seq->poses[seq->cursor];
            seq->cursor = (seq->cursor + 1) % seq->poses.size();
            return pose;
        }
        if (auto *rnd = std::get_if<RandomChoice>(&impl_))
        {
            if (rnd->poses.empty())
                return std::nullopt;
            std::uniform_int_distribution<std::size_t> dist(0, rnd->poses.size() - 1);
            return rnd->poses[dist(rnd->rng)];
        }

        auto &dyn = std::get<Dynamic>(impl_);
        if (!dyn.sampler)
            return std::nullopt;
        return dyn.sampler->nextGoal();
    }

    RouteMode GoalSource::mode() const
    {
        if (std::holds_alternative<Sequential>(impl_))
            return RouteMode::Sequential;
        if (std::holds_alternative<RandomChoice>(impl_))
            return RouteMode::RandomChoice;
        return RouteMode::DynamicSampling;
    }

} // namespace rover_route
