#pragma once

#include "common/config.hpp"
#include "common/status_or.hpp"
#include "registry/backend.hpp"
#include "registry/registry_snapshot.hpp"
#include "scheduler/zonal_client.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace zonelb {
namespace sim {

using Backend = registry::StringBackend;
using Snapshot = registry::RegistrySnapshot<Backend>;
using Client = scheduler::ZonalClient<Backend>;

// 单个后端的命中统计
struct BackendTally {
    std::string id;
    std::string zone;
    std::uint64_t count = 0;
    double load = 0.0; // count / (总请求数 / 后端数), 1.0 表示恰好平均
};

struct SimulationReport {
    std::vector<BackendTally> backends;
    std::uint64_t total = 0;      // 成功选中的请求数
    std::uint64_t in_zone = 0;    // 落在客户端本 zone 的请求数
    std::uint64_t empty = 0;      // 没有可选后端的请求数
    double in_zone_fraction = 0.0;
    double min_load = 0.0;
    double max_load = 0.0;
};

// 按拓扑展开注册表, 后端 id 为 "<zone>-<序号>"
common::StatusOr<Snapshot::Ptr> BuildRegistry(const std::vector<common::ZoneGroupConfig>& topology);

// 每个 client zone 构造一个客户端 (种子为 seed + 序号), 各自选择 iterations 次
common::StatusOr<SimulationReport> RunSimulation(const common::SimulationConfig& config,
                                                 const scheduler::ZoneWeightOptions& options);

} // namespace sim
} // namespace zonelb
