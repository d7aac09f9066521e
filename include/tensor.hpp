// 批量张量工具：固定秩容器与广播/选择/统计辅助
#pragma once
// 轴约定（全工程统一，轴顺序错误是最常见的错误来源）：
//   动作种群      Tensor3 (H, C, A)   时间 × 候选 × 动作维
//   动作分布      Tensor3 (H, 1, A)   均值/标准差，沿候选轴广播
//   状态批        Tensor3 (E, C, D)   集成成员 × 候选 × 状态维
//   轨迹          Tensor4 (H, E, C, D)
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include <utility>
#include <vector>

namespace pmpc {

using Tensor3 = Eigen::Tensor<double, 3>;
using Tensor4 = Eigen::Tensor<double, 4>;

// 真实状态广播到所有成员与候选：state (D) -> (E, C, D)
Tensor3 replicate_state(const Eigen::VectorXd& state, int ensemble_size, int n_candidates);

// 取时间片 t 并沿成员轴复制：actions (H, C, A) -> (E, C, A)
Tensor3 replicate_actions(const Tensor3& actions, int t, int ensemble_size);

// 展平为行矩阵：(H, E, C, D) -> (H*E*C, D)，行号 = (t*E + e)*C + c
Eigen::MatrixXd flatten_rows(const Tensor4& x);

bool same_shape(const Tensor3& a, const Tensor3& b);

// NaN 置零（原地）
void nan_to_zero(Eigen::VectorXd& v);

// 取最大的 k 个值的下标；返回顺序与并列次序不作保证
std::vector<int> topk_indices(const Eigen::VectorXd& values, int k);

// 按下标收集候选：(H, C, A) -> (H, k, A)
Tensor3 gather_candidates(const Tensor3& actions, const std::vector<int>& idx);

// 精英集沿候选轴的均值与有偏标准差：(H, k, A) -> ((H, 1, A), (H, 1, A))
std::pair<Tensor3, Tensor3> elite_moments(const Tensor3& elites);

} // namespace pmpc
