// 集成动力学：默认重参数化采样与回调集成
// 非法方差（NaN/负值）按原样得到 NaN 增量，由规划器的 NaN 回报策略处理
#include "ensemble.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace pmpc {

Tensor3 DynamicsEnsemble::sample(const Tensor3& delta_mean, const Tensor3& delta_var, std::mt19937& rng) const {
    std::normal_distribution<double> nd(0.0, 1.0);
    Tensor3 out(delta_mean.dimensions());
    const int E = static_cast<int>(delta_mean.dimension(0));
    const int C = static_cast<int>(delta_mean.dimension(1));
    const int D = static_cast<int>(delta_mean.dimension(2));
    for (int e = 0; e < E; ++e) {
        for (int c = 0; c < C; ++c) {
            for (int d = 0; d < D; ++d) {
                out(e, c, d) = delta_mean(e, c, d) + std::sqrt(delta_var(e, c, d)) * nd(rng);
            }
        }
    }
    return out;
}

FunctionEnsemble::FunctionEnsemble(int ensemble_size, MemberFn member)
    : ensemble_size_(ensemble_size), member_(std::move(member)) {
    if (ensemble_size_ < 1) {
        throw std::invalid_argument("FunctionEnsemble: ensemble_size must be >= 1");
    }
}

std::pair<Tensor3, Tensor3> FunctionEnsemble::predict(const Tensor3& states, const Tensor3& actions) const {
    const int E = static_cast<int>(states.dimension(0));
    const int C = static_cast<int>(states.dimension(1));
    const int D = static_cast<int>(states.dimension(2));
    const int A = static_cast<int>(actions.dimension(2));
    if (E != ensemble_size_ || actions.dimension(0) != E || actions.dimension(1) != C) {
        throw std::invalid_argument("FunctionEnsemble::predict: batch shape mismatch");
    }

    Tensor3 mean(E, C, D);
    Tensor3 var(E, C, D);
    Eigen::VectorXd s(D), u(A);
    for (int e = 0; e < E; ++e) {
        for (int c = 0; c < C; ++c) {
            for (int d = 0; d < D; ++d) s(d) = states(e, c, d);
            for (int a = 0; a < A; ++a) u(a) = actions(e, c, a);
            const auto [m, v] = member_(s, u, e);
            if (m.size() != D || v.size() != D) {
                throw std::invalid_argument("FunctionEnsemble::predict: member returned size " +
                                            std::to_string(m.size()) + ", expected state size " +
                                            std::to_string(D));
            }
            for (int d = 0; d < D; ++d) {
                mean(e, c, d) = m(d);
                var(e, c, d) = v(d);
            }
        }
    }
    return {mean, var};
}

} // namespace pmpc
