// CEM 规划器实现：
// - 从 (H,1,A) 高斯分布采样 C 条动作序列
// - 经集成模型 rollout，奖励取成员平均后对时间求和，探索奖励按 expl_scale 缩放后求和
// - NaN 回报置零，取前 top_candidates 个候选重拟合均值/有偏标准差
#include "planner.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace pmpc {

namespace {

std::unique_ptr<ExplorationMeasure> default_measure(const DynamicsEnsemble& ensemble, const PlannerSettings& cfg) {
    if (!cfg.use_exploration) return nullptr;
    return std::make_unique<InformationGain>(ensemble, cfg.expl_scale);
}

} // namespace

void PlannerSettings::validate() const {
    auto require_positive = [](int v, const char* name) {
        if (v <= 0) {
            throw std::invalid_argument(std::string("PlannerSettings: ") + name +
                                        " must be positive, got " + std::to_string(v));
        }
    };
    require_positive(action_size, "action_size");
    require_positive(plan_horizon, "plan_horizon");
    require_positive(optimisation_iters, "optimisation_iters");
    require_positive(n_candidates, "n_candidates");
    require_positive(top_candidates, "top_candidates");
    if (top_candidates > n_candidates) {
        throw std::invalid_argument("PlannerSettings: top_candidates must be <= n_candidates");
    }
    if (!std::isfinite(expl_scale) || expl_scale <= 0.0) {
        throw std::invalid_argument("PlannerSettings: expl_scale must be positive and finite");
    }
    if (device != "cpu") {
        throw std::invalid_argument("PlannerSettings: unsupported device '" + device + "'");
    }
}

PlannerSettings::DictMap PlannerSettings::to_map() const {
    DictMap out;
    out["action_size"] = action_size;
    out["plan_horizon"] = plan_horizon;
    out["optimisation_iters"] = optimisation_iters;
    out["n_candidates"] = n_candidates;
    out["top_candidates"] = top_candidates;
    out["use_reward"] = use_reward ? 1.0 : 0.0;
    out["use_exploration"] = use_exploration ? 1.0 : 0.0;
    out["expl_scale"] = expl_scale;
    return out;
}

Planner::Planner(const DynamicsEnsemble& ensemble,
                 const RewardModel& reward_model,
                 const PlannerSettings& cfg)
    : Planner(ensemble, reward_model, default_measure(ensemble, cfg), cfg) {}

Planner::Planner(const DynamicsEnsemble& ensemble,
                 const RewardModel& reward_model,
                 std::unique_ptr<ExplorationMeasure> measure,
                 const PlannerSettings& cfg)
    : ensemble_(ensemble), reward_model_(reward_model), cfg_(cfg),
      ensemble_size_(ensemble.ensemble_size()), measure_(std::move(measure)) {
    cfg_.validate();
    if (cfg_.use_exploration && !measure_) {
        throw std::invalid_argument("Planner: use_exploration requires an exploration measure");
    }
    rng_.seed(cfg_.seed ? *cfg_.seed : static_cast<unsigned>(std::random_device{}()));
    action_mean_.resize(cfg_.plan_horizon, 1, cfg_.action_size);
    action_mean_.setZero();
    action_std_dev_.resize(cfg_.plan_horizon, 1, cfg_.action_size);
    action_std_dev_.setConstant(1.0);
}

Tensor3 Planner::sample_actions() {
    const int H = cfg_.plan_horizon;
    const int C = cfg_.n_candidates;
    const int A = cfg_.action_size;
    std::normal_distribution<double> nd(0.0, 1.0);
    Tensor3 actions(H, C, A);
    for (int t = 0; t < H; ++t) {
        for (int c = 0; c < C; ++c) {
            for (int a = 0; a < A; ++a) {
                actions(t, c, a) = action_mean_(t, 0, a) + action_std_dev_(t, 0, a) * nd(rng_);
            }
        }
    }
    return actions;
}

Rollout Planner::perform_rollout(const Tensor3& initial_state, const Tensor3& actions) {
    const int H = static_cast<int>(actions.dimension(0));
    const int E = static_cast<int>(initial_state.dimension(0));
    const int C = static_cast<int>(initial_state.dimension(1));
    const int D = static_cast<int>(initial_state.dimension(2));
    if (actions.dimension(1) != C) {
        throw std::invalid_argument("perform_rollout: actions have " + std::to_string(actions.dimension(1)) +
                                    " candidates, state batch has " + std::to_string(C));
    }

    Rollout out;
    out.states.resize(H, E, C, D);
    out.delta_means.resize(H, E, C, D);
    out.delta_vars.resize(H, E, C, D);

    Tensor3 state = initial_state;
    for (int t = 0; t < H; ++t) {
        const Tensor3 acts = replicate_actions(actions, t, E);
        const auto [delta_mean, delta_var] = ensemble_.predict(state, acts);
        if (!same_shape(delta_mean, state) || !same_shape(delta_var, state)) {
            throw std::invalid_argument("perform_rollout: ensemble output shape differs from state batch");
        }
        // 用采样增量推进（而非均值），保留成员间分歧
        Tensor3 next = state + ensemble_.sample(delta_mean, delta_var, rng_);
        out.states.chip(t, 0) = next;
        out.delta_means.chip(t, 0) = delta_mean;
        out.delta_vars.chip(t, 0) = delta_var;
        state = next;
    }
    return out;
}

Eigen::VectorXd Planner::evaluate(const Tensor3& initial_state, const Tensor3& actions) {
    const int H = cfg_.plan_horizon;
    const int E = ensemble_size_;
    const int C = cfg_.n_candidates;

    const Rollout r = perform_rollout(initial_state, actions);
    Eigen::VectorXd returns = Eigen::VectorXd::Zero(C);

    if (cfg_.use_exploration) {
        const Eigen::MatrixXd bonus = measure_->score(r.delta_means, r.delta_vars, rng_) * cfg_.expl_scale; // (H, C)
        returns += bonus.colwise().sum().transpose();
    }

    if (cfg_.use_reward) {
        const Eigen::MatrixXd flat_states = flatten_rows(r.states); // (H*E*C, D)
        const Eigen::VectorXd flat = reward_model_.predict(flat_states);
        if (flat.size() != flat_states.rows()) {
            throw std::invalid_argument("evaluate: reward model returned " + std::to_string(flat.size()) +
                                        " rows, expected " + std::to_string(flat_states.rows()));
        }
        // (H, E, C) -> 成员平均，时间求和 -> (C)
        Eigen::VectorXd rewards = Eigen::VectorXd::Zero(C);
        for (int t = 0; t < H; ++t) {
            for (int e = 0; e < E; ++e) {
                rewards += flat.segment((t * E + e) * C, C);
            }
        }
        rewards /= static_cast<double>(E);
        reward_log_.append(rewards);
        returns += rewards;
    }

    nan_to_zero(returns);
    return returns;
}

Eigen::VectorXd Planner::plan(const Eigen::VectorXd& state) {
    if (state.size() == 0) {
        throw std::invalid_argument("Planner::plan: empty state");
    }
    const Tensor3 initial = replicate_state(state, ensemble_size_, cfg_.n_candidates);

    action_mean_.resize(cfg_.plan_horizon, 1, cfg_.action_size);
    action_mean_.setZero();
    action_std_dev_.resize(cfg_.plan_horizon, 1, cfg_.action_size);
    action_std_dev_.setConstant(1.0);

    for (int it = 0; it < cfg_.optimisation_iters; ++it) {
        const Tensor3 actions = sample_actions(); // (H, C, A)
        const Eigen::VectorXd returns = evaluate(initial, actions);
        const std::vector<int> elite_idx = topk_indices(returns, cfg_.top_candidates);
        auto [mean, std_dev] = elite_moments(gather_candidates(actions, elite_idx));
        action_mean_ = mean;
        action_std_dev_ = std_dev;
    }

    Eigen::VectorXd first(cfg_.action_size);
    for (int a = 0; a < cfg_.action_size; ++a) first(a) = action_mean_(0, 0, a);
    return first;
}

std::pair<StatsMap, StatsMap> Planner::drain() {
    StatsMap info_stats;
    if (cfg_.use_exploration) info_stats = measure_->get_stats();
    const SummaryStats reward_stats = reward_log_.drain();
    return {info_stats, reward_stats.to_map()};
}

} // namespace pmpc
