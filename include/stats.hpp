// 统计汇总：max/mean/min/std 与奖励日志
#pragma once
#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace pmpc {

// 命名标量统计表（用于外部日志）
using StatsMap = std::unordered_map<std::string, double>;

struct SummaryStats {
    double max{0.0};
    double mean{0.0};
    double min{0.0};
    double std_dev{0.0};

    // 键：max、mean、min、std
    StatsMap to_map() const;
};

// 空输入抛 std::invalid_argument；unbiased=true 时 std 为样本标准差（单值为 NaN）
SummaryStats summarize(const Eigen::Ref<const Eigen::VectorXd>& values, bool unbiased = true);

// 每次规划迭代追加一条逐候选奖励向量，读取时汇总并清空
class RewardLog {
public:
    void append(const Eigen::VectorXd& rewards);

    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }

    // 汇总全部已记录奖励并清空；空日志同样清空后抛 std::logic_error
    SummaryStats drain();

    void clear() { entries_.clear(); }

private:
    std::vector<Eigen::VectorXd> entries_;
};

} // namespace pmpc
