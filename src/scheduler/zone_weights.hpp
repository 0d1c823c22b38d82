#pragma once

#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/status_or.hpp"
#include "scheduler/zone_capacity.hpp"

#include <map>
#include <utility>

namespace zonelb {
namespace scheduler {

// zone -> 乘数; 后端的未归一化权重 = multiplier[zone] * capacity
// 不在表中的 zone 等价于乘数 0, 不会被选中
template <typename Zone, typename Capacity>
using MultiplierMap = std::map<Zone, Capacity>;

struct ZoneWeightOptions {
    // 为 true 时客户端 zone 不在注册表中视为错误, 否则按容量 0 处理 (全部跨 zone)
    bool require_home_zone = false;
};

/**
 * 计算客户端所在 zone 的流量乘数表.
 *
 * 设 avg = total / zone_count, home = per_zone[home_zone]:
 *  - home >= avg: 全部流量留在本 zone, 结果为 {home_zone: 1 / home}.
 *  - home <  avg: 本 zone 保留 home / avg 的流量, 其余按各 zone 超出 avg 的部分
 *    (surplus) 比例分给高于平均容量的 zone; 低于或等于平均容量的 zone 不接收溢出.
 *    每个 zone 的份额再除以该 zone 的总容量, 乘以单个后端容量即得该后端的份额.
 *  - home < avg 但 surplus 为 0 时没有可溢出的 zone, 退化为只走本 zone.
 *
 * 非退化情况下满足 sum(multiplier[z] * per_zone[z]) == 1.
 */
template <typename Zone, typename Capacity>
common::StatusOr<MultiplierMap<Zone, Capacity>>
ComputeZoneMultipliers(const ZoneCapacity<Zone, Capacity>& capacity,
                       const Zone& home_zone,
                       const ZoneWeightOptions& options = ZoneWeightOptions{}) {
    using Result = MultiplierMap<Zone, Capacity>;
    if (capacity.zone_count == 0 || capacity.per_zone.empty()) {
        return common::FromBalancerError(common::BalancerErrorCode::kEmptyRegistry);
    }

    const Capacity avg = capacity.total / static_cast<Capacity>(capacity.zone_count);
    Capacity home{0};
    auto home_it = capacity.per_zone.find(home_zone);
    if (home_it != capacity.per_zone.end()) {
        home = home_it->second;
    } else if (options.require_home_zone) {
        return common::FromBalancerError(common::BalancerErrorCode::kUnknownHomeZone);
    }

    Capacity surplus{0};
    for (const auto& [zone, zone_capacity] : capacity.per_zone) {
        if (zone_capacity > avg) {
            surplus += zone_capacity - avg;
        }
    }

    Result multipliers;
    if (home >= avg) {
        // 本 zone 份额为 1, 同样除以本 zone 总容量
        multipliers.emplace(home_zone, Capacity{1} / home);
        ZONELB_LOG_DEBUG("zone weights: home capacity {} >= average {}, routing in-zone only", home, avg);
        return common::StatusOr<Result>(std::move(multipliers));
    }
    if (surplus <= Capacity{0}) {
        // 各 zone 容量相等时, 舍入可能让平均值略大于每个 zone, 本 zone 存在也会走到这里
        // 本 zone 不在注册表中时没有可归一化的容量, 乘数取 1 (实际上不会选中任何后端)
        multipliers.emplace(home_zone, home > Capacity{0} ? Capacity{1} / home : Capacity{1});
        ZONELB_LOG_DEBUG("zone weights: home capacity {} < average {} but no zone has surplus, routing in-zone only",
                         home, avg);
        return common::StatusOr<Result>(std::move(multipliers));
    }

    const Capacity in_zone = home / avg;
    const Capacity cross_zone = Capacity{1} - in_zone;
    for (const auto& [zone, zone_capacity] : capacity.per_zone) {
        Capacity zone_weight{0};
        if (zone == home_zone) {
            zone_weight = in_zone;
        } else if (zone_capacity <= avg) {
            // 低于平均容量的 zone 不接收额外的跨 zone 流量
            zone_weight = Capacity{0};
        } else {
            zone_weight = cross_zone * (zone_capacity - avg) / surplus;
        }
        multipliers.emplace(zone, zone_weight / zone_capacity);
    }
    ZONELB_LOG_DEBUG("zone weights: home capacity {} average {} surplus {}, in-zone {} cross-zone {}",
                     home, avg, surplus, in_zone, cross_zone);
    return common::StatusOr<Result>(std::move(multipliers));
}

} // namespace scheduler
} // namespace zonelb
