// 张量辅助实现：显式循环，索引顺序与头文件轴约定一致
#include "tensor.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace pmpc {

Tensor3 replicate_state(const Eigen::VectorXd& state, int ensemble_size, int n_candidates) {
    const int D = static_cast<int>(state.size());
    Tensor3 out(ensemble_size, n_candidates, D);
    for (int e = 0; e < ensemble_size; ++e) {
        for (int c = 0; c < n_candidates; ++c) {
            for (int d = 0; d < D; ++d) out(e, c, d) = state(d);
        }
    }
    return out;
}

Tensor3 replicate_actions(const Tensor3& actions, int t, int ensemble_size) {
    const int C = static_cast<int>(actions.dimension(1));
    const int A = static_cast<int>(actions.dimension(2));
    Tensor3 out(ensemble_size, C, A);
    for (int e = 0; e < ensemble_size; ++e) {
        for (int c = 0; c < C; ++c) {
            for (int a = 0; a < A; ++a) out(e, c, a) = actions(t, c, a);
        }
    }
    return out;
}

Eigen::MatrixXd flatten_rows(const Tensor4& x) {
    const int H = static_cast<int>(x.dimension(0));
    const int E = static_cast<int>(x.dimension(1));
    const int C = static_cast<int>(x.dimension(2));
    const int D = static_cast<int>(x.dimension(3));
    Eigen::MatrixXd out(H * E * C, D);
    for (int t = 0; t < H; ++t) {
        for (int e = 0; e < E; ++e) {
            for (int c = 0; c < C; ++c) {
                const int row = (t * E + e) * C + c;
                for (int d = 0; d < D; ++d) out(row, d) = x(t, e, c, d);
            }
        }
    }
    return out;
}

bool same_shape(const Tensor3& a, const Tensor3& b) {
    for (int i = 0; i < 3; ++i) {
        if (a.dimension(i) != b.dimension(i)) return false;
    }
    return true;
}

void nan_to_zero(Eigen::VectorXd& v) {
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        if (std::isnan(v(i))) v(i) = 0.0;
    }
}

std::vector<int> topk_indices(const Eigen::VectorXd& values, int k) {
    const int n = static_cast<int>(values.size());
    if (k < 1 || k > n) {
        throw std::invalid_argument("topk_indices: k=" + std::to_string(k) +
                                    " outside [1, " + std::to_string(n) + "]");
    }
    std::vector<int> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    // 部分选择：前 k 个即为最大者，内部次序不排序
    std::nth_element(idx.begin(), idx.begin() + (k - 1), idx.end(),
                     [&values](int a, int b) { return values(a) > values(b); });
    idx.resize(k);
    return idx;
}

Tensor3 gather_candidates(const Tensor3& actions, const std::vector<int>& idx) {
    const int H = static_cast<int>(actions.dimension(0));
    const int A = static_cast<int>(actions.dimension(2));
    const int K = static_cast<int>(idx.size());
    Tensor3 out(H, K, A);
    for (int t = 0; t < H; ++t) {
        for (int j = 0; j < K; ++j) {
            for (int a = 0; a < A; ++a) out(t, j, a) = actions(t, idx[j], a);
        }
    }
    return out;
}

std::pair<Tensor3, Tensor3> elite_moments(const Tensor3& elites) {
    const int H = static_cast<int>(elites.dimension(0));
    const int K = static_cast<int>(elites.dimension(1));
    const int A = static_cast<int>(elites.dimension(2));
    Tensor3 mean(H, 1, A);
    Tensor3 std_dev(H, 1, A);
    for (int t = 0; t < H; ++t) {
        for (int a = 0; a < A; ++a) {
            double sum = 0.0;
            for (int j = 0; j < K; ++j) sum += elites(t, j, a);
            const double mu = sum / K;
            double sq = 0.0;
            for (int j = 0; j < K; ++j) {
                const double d = elites(t, j, a) - mu;
                sq += d * d;
            }
            mean(t, 0, a) = mu;
            // 有偏估计（除以 K），精英集恒定时为 0
            std_dev(t, 0, a) = std::sqrt(sq / K);
        }
    }
    return {mean, std_dev};
}

} // namespace pmpc
