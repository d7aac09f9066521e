// 信息增益实现：
// - 集成平均的熵：按候选对成员样本做 kNN 熵估计
// - 平均熵：对角高斯熵 0.5 * sum log(2*pi*e*var) 对成员取平均
// - 增益 = 两者之差，逐时间步逐候选
#include "measures.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace pmpc {

namespace {

constexpr double kMinVariance = 1e-8;
constexpr double kMinSquaredDistance = 1e-30;
constexpr double kEulerGamma = 0.57721566490153286061;

// 整数自变量的 digamma：psi(k) = -gamma + sum_{i<k} 1/i
double digamma_int(int k) {
    double s = -kEulerGamma;
    for (int i = 1; i < k; ++i) s += 1.0 / i;
    return s;
}

// D 维单位球体积
double unit_ball_volume(int dim) {
    const double half = 0.5 * dim;
    return std::pow(M_PI, half) / std::tgamma(half + 1.0);
}

} // namespace

InformationGain::InformationGain(const DynamicsEnsemble& ensemble, double scale)
    : ensemble_(ensemble), scale_(scale) {
    const int E = ensemble_.ensemble_size();
    if (E < 2) {
        throw std::invalid_argument("InformationGain: ensemble_size must be >= 2");
    }
    // 两成员时只能取到另一个点
    k_ = std::min(3, E);
}

Eigen::VectorXd InformationGain::entropy_of_average(const Tensor3& samples) const {
    const int E = static_cast<int>(samples.dimension(0));
    const int C = static_cast<int>(samples.dimension(1));
    const int D = static_cast<int>(samples.dimension(2));
    const double const_term = std::log(static_cast<double>(E - 1)) - digamma_int(k_) +
                              std::log(unit_ball_volume(D)) + 0.5;

    Eigen::VectorXd h(C);
    #pragma omp parallel for if(C>32)
    for (int c = 0; c < C; ++c) {
        // 成员样本两两距离，平方距离下限保护避免 log(0)
        Eigen::MatrixXd dist(E, E);
        for (int i = 0; i < E; ++i) {
            for (int j = 0; j < E; ++j) {
                double sq = 0.0;
                for (int d = 0; d < D; ++d) {
                    const double diff = samples(i, c, d) - samples(j, c, d);
                    sq += diff * diff;
                }
                dist(i, j) = std::sqrt(std::max(sq, kMinSquaredDistance));
            }
        }
        // 每列第 k 小距离（含自身距离）
        double log_sum = 0.0;
        std::vector<double> col(E);
        for (int j = 0; j < E; ++j) {
            for (int i = 0; i < E; ++i) col[i] = dist(i, j);
            std::nth_element(col.begin(), col.begin() + (k_ - 1), col.end());
            log_sum += std::log(col[k_ - 1]);
        }
        h(c) = const_term + D * log_sum / E;
    }
    return h;
}

Eigen::VectorXd InformationGain::average_of_entropy(const Tensor3& delta_vars) {
    const int E = static_cast<int>(delta_vars.dimension(0));
    const int C = static_cast<int>(delta_vars.dimension(1));
    const int D = static_cast<int>(delta_vars.dimension(2));
    const double two_pi_e = 2.0 * M_PI * std::exp(1.0);
    Eigen::VectorXd out = Eigen::VectorXd::Zero(C);
    for (int c = 0; c < C; ++c) {
        double sum = 0.0;
        for (int e = 0; e < E; ++e) {
            for (int d = 0; d < D; ++d) {
                sum += 0.5 * std::log(two_pi_e * std::max(delta_vars(e, c, d), kMinVariance));
            }
        }
        out(c) = sum / E;
    }
    return out;
}

Eigen::MatrixXd InformationGain::score(const Tensor4& delta_means, const Tensor4& delta_vars, std::mt19937& rng) {
    const int H = static_cast<int>(delta_means.dimension(0));
    const int C = static_cast<int>(delta_means.dimension(2));
    Eigen::MatrixXd gains(H, C);
    for (int t = 0; t < H; ++t) {
        const Tensor3 mean_t = delta_means.chip(t, 0);
        const Tensor3 var_t = delta_vars.chip(t, 0);
        const Tensor3 samples = ensemble_.sample(mean_t, var_t, rng);
        gains.row(t) = (entropy_of_average(samples) - average_of_entropy(var_t)).transpose();
    }
    history_.push_back(summarize(Eigen::Map<const Eigen::VectorXd>(gains.data(), gains.size())));
    return gains;
}

StatsMap InformationGain::get_stats() {
    StatsMap out;
    if (history_.empty()) return out;
    SummaryStats avg;
    for (const auto& s : history_) {
        avg.max += s.max;
        avg.mean += s.mean;
        avg.min += s.min;
        avg.std_dev += s.std_dev;
    }
    const double n = static_cast<double>(history_.size());
    avg.max /= n;
    avg.mean /= n;
    avg.min /= n;
    avg.std_dev /= n;
    history_.clear();
    return avg.to_map();
}

} // namespace pmpc
