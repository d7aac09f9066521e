// 探索度量：把集成预测分布转换为逐步逐候选的探索奖励
#pragma once
#include <random>
#include <vector>
#include "ensemble.hpp"
#include "stats.hpp"
#include "tensor.hpp"

namespace pmpc {

class ExplorationMeasure {
public:
    virtual ~ExplorationMeasure() = default;

    // delta_means/delta_vars (H, E, C, D) -> 探索奖励 (H, C)
    virtual Eigen::MatrixXd score(const Tensor4& delta_means, const Tensor4& delta_vars, std::mt19937& rng) = 0;

    // 自上次读取以来的命名统计量，读取后清空
    virtual StatsMap get_stats() = 0;
};

// 信息增益：集成平均分布的熵（kNN 估计）减去成员熵的平均
class InformationGain : public ExplorationMeasure {
public:
    // 要求 ensemble_size >= 2
    InformationGain(const DynamicsEnsemble& ensemble, double scale = 1.0);

    Eigen::MatrixXd score(const Tensor4& delta_means, const Tensor4& delta_vars, std::mt19937& rng) override;

    StatsMap get_stats() override;

    double scale() const { return scale_; }

    // samples (E, C, D) -> 每个候选的熵估计 (C)
    Eigen::VectorXd entropy_of_average(const Tensor3& samples) const;

    // delta_vars (E, C, D) -> 成员对角高斯熵的平均 (C)
    static Eigen::VectorXd average_of_entropy(const Tensor3& delta_vars);

private:
    const DynamicsEnsemble& ensemble_;
    double scale_{1.0};
    int k_{3}; // 近邻阶数

    std::vector<SummaryStats> history_;
};

} // namespace pmpc
