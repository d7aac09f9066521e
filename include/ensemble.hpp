// 概率集成动力学模型接口
#pragma once
#include <functional>
#include <random>
#include <utility>
#include "tensor.hpp"

namespace pmpc {

// 集成动力学：每个成员给出状态增量的高斯分布 (delta_mean, delta_var)
class DynamicsEnsemble {
public:
    virtual ~DynamicsEnsemble() = default;

    virtual int ensemble_size() const = 0;

    // states (E, C, D), actions (E, C, A) -> (delta_mean, delta_var) 均为 (E, C, D)
    virtual std::pair<Tensor3, Tensor3> predict(const Tensor3& states, const Tensor3& actions) const = 0;

    // 重参数化采样：mean + sqrt(var) * N(0,1)，形状同输入；var 为 NaN 或负值时结果为 NaN
    virtual Tensor3 sample(const Tensor3& delta_mean, const Tensor3& delta_var, std::mt19937& rng) const;
};

// 单成员单样本预测：(state, action, member) -> (delta_mean, delta_var)
using MemberFn = std::function<std::pair<Eigen::VectorXd, Eigen::VectorXd>(
    const Eigen::VectorXd&, const Eigen::VectorXd&, int)>;

// 基于回调的集成：用于解析模型与测试
class FunctionEnsemble : public DynamicsEnsemble {
public:
    FunctionEnsemble(int ensemble_size, MemberFn member);

    int ensemble_size() const override { return ensemble_size_; }

    std::pair<Tensor3, Tensor3> predict(const Tensor3& states, const Tensor3& actions) const override;

private:
    int ensemble_size_{1};
    MemberFn member_;
};

} // namespace pmpc
