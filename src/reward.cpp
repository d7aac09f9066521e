// 回调奖励模型：逐行调用
#include "reward.hpp"

namespace pmpc {

Eigen::VectorXd FunctionRewardModel::predict(const Eigen::MatrixXd& states) const {
    Eigen::VectorXd out(states.rows());
    for (Eigen::Index i = 0; i < states.rows(); ++i) {
        out(i) = fn_(states.row(i).transpose());
    }
    return out;
}

} // namespace pmpc
