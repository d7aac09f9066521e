// CEM 规划器接口：集成模型前向 rollout + 奖励/探索联合评分 + 精英重拟合
#pragma once
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include "ensemble.hpp"
#include "measures.hpp"
#include "reward.hpp"
#include "stats.hpp"
#include "tensor.hpp"

namespace pmpc {

struct PlannerSettings {
    int action_size{1};
    int plan_horizon{12};          // H
    int optimisation_iters{10};    // CEM 迭代次数
    int n_candidates{1000};        // C
    int top_candidates{100};       // 精英数，<= C
    bool use_reward{true};
    bool use_exploration{true};
    double expl_scale{1.0};
    std::string device{"cpu"};     // 仅支持 cpu
    std::optional<unsigned> seed;  // 固定随机流（复现/测试）

    // 配置非法时抛 std::invalid_argument
    void validate() const;

    using DictMap = std::unordered_map<std::string, double>;

    // 数值字段导出（不含 device/seed）
    DictMap to_map() const;
};

// rollout 结果：均为 (H, E, C, D)，不含 t=0 的真实状态
struct Rollout {
    Tensor4 states;
    Tensor4 delta_vars;
    Tensor4 delta_means;
};

class Planner {
public:
    // 开启探索时内部构造 InformationGain
    Planner(const DynamicsEnsemble& ensemble,
            const RewardModel& reward_model,
            const PlannerSettings& cfg);

    // 注入任意探索度量（可为空，此时 use_exploration 必须为 false）
    Planner(const DynamicsEnsemble& ensemble,
            const RewardModel& reward_model,
            std::unique_ptr<ExplorationMeasure> measure,
            const PlannerSettings& cfg);

    // 返回精炼后第一个时间步的动作均值 (action_size)
    Eigen::VectorXd plan(const Eigen::VectorXd& state);

    // initial_state (E, C, D)，actions (H, C, A)
    Rollout perform_rollout(const Tensor3& initial_state, const Tensor3& actions);

    // 单次迭代的逐候选回报 (C)：探索奖励 * expl_scale + 奖励，NaN 已置零；开启奖励时追加到奖励日志
    Eigen::VectorXd evaluate(const Tensor3& initial_state, const Tensor3& actions);

    // (探索统计, 奖励统计)；自上次读取以来没有奖励评分时抛 std::logic_error
    std::pair<StatsMap, StatsMap> drain();

    void seed(unsigned s) { rng_.seed(s); }

    const PlannerSettings& settings() const { return cfg_; }
    // 最近一次 plan 结束时的动作分布 (H, 1, A)
    const Tensor3& action_mean() const { return action_mean_; }
    const Tensor3& action_std_dev() const { return action_std_dev_; }
    const RewardLog& reward_log() const { return reward_log_; }
    ExplorationMeasure* measure() const { return measure_.get(); }

private:
    Tensor3 sample_actions();

private:
    const DynamicsEnsemble& ensemble_;
    const RewardModel& reward_model_;
    PlannerSettings cfg_;
    int ensemble_size_{1};
    std::unique_ptr<ExplorationMeasure> measure_;
    RewardLog reward_log_;
    std::mt19937 rng_;
    Tensor3 action_mean_;     // (H, 1, A)
    Tensor3 action_std_dev_;  // (H, 1, A)
};

} // namespace pmpc
