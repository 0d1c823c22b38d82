#pragma once

#include "common/errors.hpp"
#include "common/status_or.hpp"

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace zonelb {
namespace scheduler {

// 按 zone 汇总的容量
template <typename Zone, typename Capacity>
struct ZoneCapacity {
    std::map<Zone, Capacity> per_zone; // key 恰好是注册表中出现过的 zone
    Capacity total{};
    std::size_t zone_count = 0;
};

// 一次遍历汇总每个 zone 的容量与总容量; 无副作用
template <typename BackendT>
common::StatusOr<ZoneCapacity<typename BackendT::zone_type, typename BackendT::capacity_type>>
AggregateZoneCapacity(const std::vector<BackendT>& backends) {
    using Result = ZoneCapacity<typename BackendT::zone_type, typename BackendT::capacity_type>;
    if (backends.empty()) {
        return common::FromBalancerError(common::BalancerErrorCode::kEmptyRegistry);
    }
    Result result;
    for (const auto& backend : backends) {
        result.total += backend.capacity;
        result.per_zone[backend.zone] += backend.capacity;
    }
    result.zone_count = result.per_zone.size();
    return common::StatusOr<Result>(std::move(result));
}

} // namespace scheduler
} // namespace zonelb
