// 统计汇总实现：max/mean/min/std 与奖励日志的读取清空
#include "stats.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace pmpc {

StatsMap SummaryStats::to_map() const {
    StatsMap out;
    out["max"] = max;
    out["mean"] = mean;
    out["min"] = min;
    out["std"] = std_dev;
    return out;
}

SummaryStats summarize(const Eigen::Ref<const Eigen::VectorXd>& values, bool unbiased) {
    const Eigen::Index n = values.size();
    if (n == 0) {
        throw std::invalid_argument("summarize: empty input");
    }
    SummaryStats s;
    s.max = values.maxCoeff();
    s.min = values.minCoeff();
    s.mean = values.mean();
    const double sq = (values.array() - s.mean).square().sum();
    const Eigen::Index dof = unbiased ? n - 1 : n;
    s.std_dev = dof > 0 ? std::sqrt(sq / static_cast<double>(dof))
                        : std::numeric_limits<double>::quiet_NaN();
    return s;
}

void RewardLog::append(const Eigen::VectorXd& rewards) {
    entries_.push_back(rewards);
}

SummaryStats RewardLog::drain() {
    if (entries_.empty()) {
        throw std::logic_error("RewardLog::drain: no reward-scored iteration since last drain");
    }
    Eigen::Index total = 0;
    for (const auto& v : entries_) total += v.size();
    Eigen::VectorXd flat(total);
    Eigen::Index off = 0;
    for (const auto& v : entries_) {
        flat.segment(off, v.size()) = v;
        off += v.size();
    }
    entries_.clear();
    return summarize(flat);
}

} // namespace pmpc
