// 奖励模型接口
#pragma once
#include <Eigen/Dense>
#include <functional>
#include <utility>

namespace pmpc {

class RewardModel {
public:
    virtual ~RewardModel() = default;

    // states (N, D) 每行一个状态 -> 每行一个标量奖励 (N)
    virtual Eigen::VectorXd predict(const Eigen::MatrixXd& states) const = 0;
};

using RewardFn = std::function<double(const Eigen::VectorXd&)>; // state -> reward

class FunctionRewardModel : public RewardModel {
public:
    explicit FunctionRewardModel(RewardFn fn) : fn_(std::move(fn)) {}

    Eigen::VectorXd predict(const Eigen::MatrixXd& states) const override;

private:
    RewardFn fn_;
};

} // namespace pmpc
