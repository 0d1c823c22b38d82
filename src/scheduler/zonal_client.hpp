#pragma once

#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/status_or.hpp"
#include "registry/backend.hpp"
#include "registry/registry_snapshot.hpp"
#include "scheduler/random_source.hpp"
#include "scheduler/weighted_sampler.hpp"
#include "scheduler/zone_capacity.hpp"
#include "scheduler/zone_weights.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace zonelb {
namespace scheduler {

// 位于某个 zone 的客户端, 在构造时一次性计算乘数表, 之后每次请求选出一个后端.
// SelectBackend 会推进私有随机源, 同一实例不能在多个线程上并发调用.
template <typename BackendT>
class ZonalClient {
public:
    using Id = typename BackendT::id_type;
    using Zone = typename BackendT::zone_type;
    using Capacity = typename BackendT::capacity_type;
    using Snapshot = registry::RegistrySnapshot<BackendT>;
    using SnapshotPtr = typename Snapshot::Ptr;
    using Multipliers = MultiplierMap<Zone, Capacity>;
    using Filter = std::function<bool(const BackendT&)>;

    static common::StatusOr<ZonalClient> Create(Zone home_zone,
                                                SnapshotPtr registry,
                                                std::unique_ptr<RandomSource> random,
                                                ZoneWeightOptions options = ZoneWeightOptions{});

    ZonalClient(ZonalClient&&) = default;
    ZonalClient& operator=(ZonalClient&&) = default;
    ZonalClient(const ZonalClient&) = delete;
    ZonalClient& operator=(const ZonalClient&) = delete;

    // 在全部后端中选择
    std::optional<Id> SelectBackend();
    // 只在 eligible 返回 true 的后端中选择; 空 Filter 视为全部可选
    std::optional<Id> SelectBackend(const Filter& eligible);

    // 注册表变化后由外部触发: 基于新快照重新计算乘数表, 失败时保持原状态
    common::Status Refresh(SnapshotPtr registry);

    const Zone& HomeZone() const {
        return home_zone_;
    }
    // 值已按容量归一化: zone 份额 / 该 zone 总容量, 乘以后端容量即为选取权重.
    // zone 的流量份额为 multiplier * zone 总容量
    const Multipliers& ZoneMultipliers() const {
        return multipliers_;
    }
    const SnapshotPtr& Registry() const {
        return registry_;
    }

private:
    ZonalClient(Zone home_zone, SnapshotPtr registry, Multipliers multipliers,
                std::unique_ptr<RandomSource> random, ZoneWeightOptions options)
        : home_zone_(std::move(home_zone)),
          registry_(std::move(registry)),
          multipliers_(std::move(multipliers)),
          random_(std::move(random)),
          options_(options) {}

    static common::StatusOr<Multipliers> Derive(const Zone& home_zone,
                                                const SnapshotPtr& registry,
                                                const ZoneWeightOptions& options);

    Zone home_zone_;
    SnapshotPtr registry_;
    Multipliers multipliers_;
    std::unique_ptr<RandomSource> random_;
    ZoneWeightOptions options_;
};

template <typename BackendT>
common::StatusOr<typename ZonalClient<BackendT>::Multipliers>
ZonalClient<BackendT>::Derive(const Zone& home_zone,
                              const SnapshotPtr& registry,
                              const ZoneWeightOptions& options) {
    if (!registry) {
        return common::FromBalancerError(common::BalancerErrorCode::kEmptyRegistry,
                                         "Registry snapshot is null");
    }
    auto capacity = AggregateZoneCapacity(registry->Backends());
    if (!capacity.IsOk()) {
        return capacity.GetStatus();
    }
    return ComputeZoneMultipliers(capacity.Value(), home_zone, options);
}

template <typename BackendT>
common::StatusOr<ZonalClient<BackendT>>
ZonalClient<BackendT>::Create(Zone home_zone,
                              SnapshotPtr registry,
                              std::unique_ptr<RandomSource> random,
                              ZoneWeightOptions options) {
    if (!random) {
        return common::Status::InvalidArgument("Random source is null");
    }
    auto multipliers = Derive(home_zone, registry, options);
    if (!multipliers.IsOk()) {
        ZONELB_LOG_WARN("[ZonalClient] failed to derive zone weights: {}", multipliers.GetStatus().Message());
        return multipliers.GetStatus();
    }
    return common::StatusOr<ZonalClient>(ZonalClient(std::move(home_zone), std::move(registry),
                                                     std::move(multipliers).Value(), std::move(random),
                                                     options));
}

template <typename BackendT>
std::optional<typename ZonalClient<BackendT>::Id> ZonalClient<BackendT>::SelectBackend() {
    return SelectWeighted(registry_->Backends(), multipliers_, AcceptAllBackends{}, *random_);
}

template <typename BackendT>
std::optional<typename ZonalClient<BackendT>::Id>
ZonalClient<BackendT>::SelectBackend(const Filter& eligible) {
    if (!eligible) {
        return SelectBackend();
    }
    return SelectWeighted(registry_->Backends(), multipliers_, eligible, *random_);
}

template <typename BackendT>
common::Status ZonalClient<BackendT>::Refresh(SnapshotPtr registry) {
    auto multipliers = Derive(home_zone_, registry, options_);
    if (!multipliers.IsOk()) {
        ZONELB_LOG_WARN("[ZonalClient] refresh rejected: {}", multipliers.GetStatus().Message());
        return multipliers.GetStatus();
    }
    registry_ = std::move(registry);
    multipliers_ = std::move(multipliers).Value();
    return common::Status::OK();
}

extern template class ZonalClient<registry::StringBackend>;

} // namespace scheduler
} // namespace zonelb
