#pragma once

#include "scheduler/random_source.hpp"
#include "scheduler/zone_weights.hpp"

#include <optional>
#include <vector>

namespace zonelb {
namespace scheduler {

// 默认的资格判定: 所有后端都可选
struct AcceptAllBackends {
    template <typename BackendT>
    bool operator()(const BackendT&) const {
        return true;
    }
};

// 单遍加权蓄水池抽样 (容量为 1), 不构造累积权重表.
// 第 k 个候选以 w_k / (w_1 + ... + w_k) 的概率替换当前结果, 最终每个候选被选中的概率
// 为 w_i / sum(w), 与遍历顺序无关. 必须先累加总权重再抽随机数.
// 没有可选后端 (资格判定全部拒绝或乘数均为 0) 时返回 nullopt.
template <typename BackendT, typename Predicate>
std::optional<typename BackendT::id_type>
SelectWeighted(const std::vector<BackendT>& backends,
               const MultiplierMap<typename BackendT::zone_type, typename BackendT::capacity_type>& multipliers,
               Predicate&& eligible,
               RandomSource& random) {
    using Capacity = typename BackendT::capacity_type;
    std::optional<typename BackendT::id_type> current;
    Capacity total_weight{0};
    for (const auto& backend : backends) {
        if (!eligible(backend)) {
            continue;
        }
        auto it = multipliers.find(backend.zone);
        if (it == multipliers.end()) {
            continue;
        }
        const Capacity weight = it->second * backend.capacity;
        if (!(weight > Capacity{0})) {
            continue;
        }
        total_weight += weight;
        if (random.NextUniform() < static_cast<double>(weight / total_weight)) {
            current = backend.id;
        }
    }
    return current;
}

} // namespace scheduler
} // namespace zonelb
