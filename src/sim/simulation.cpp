#include "sim/simulation.hpp"

#include "common/logger.hpp"
#include "scheduler/random_source.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <utility>

namespace zonelb {
namespace sim {

common::StatusOr<Snapshot::Ptr> BuildRegistry(const std::vector<common::ZoneGroupConfig>& topology) {
    std::vector<Backend> backends;
    // 同一 zone 可出现在多个分组中, 编号按 zone 连续
    std::map<std::string, int> next_index;
    for (const auto& group : topology) {
        for (int i = 0; i < group.backends; ++i) {
            Backend backend;
            backend.id = group.zone + "-" + std::to_string(next_index[group.zone]++);
            backend.zone = group.zone;
            backend.capacity = group.capacity;
            backends.push_back(std::move(backend));
        }
    }
    return Snapshot::Create(std::move(backends));
}

common::StatusOr<SimulationReport> RunSimulation(const common::SimulationConfig& config,
                                                 const scheduler::ZoneWeightOptions& options) {
    auto registry = BuildRegistry(config.topology);
    if (!registry.IsOk()) {
        return registry.GetStatus();
    }
    const auto& snapshot = registry.Value();

    std::vector<Client> clients;
    clients.reserve(config.client_zones.size());
    for (std::size_t i = 0; i < config.client_zones.size(); ++i) {
        auto client = Client::Create(config.client_zones[i], snapshot,
                                     std::make_unique<scheduler::SeededRandomSource>(config.seed + i),
                                     options);
        if (!client.IsOk()) {
            return client.GetStatus();
        }
        clients.push_back(std::move(client).Value());
    }

    // id -> 在快照中的位置
    std::map<std::string, std::size_t> index;
    SimulationReport report;
    report.backends.reserve(snapshot->Size());
    for (const auto& backend : snapshot->Backends()) {
        index.emplace(backend.id, report.backends.size());
        BackendTally tally;
        tally.id = backend.id;
        tally.zone = backend.zone;
        report.backends.push_back(std::move(tally));
    }

    for (auto& client : clients) {
        for (std::uint64_t n = 0; n < config.iterations; ++n) {
            auto selected = client.SelectBackend();
            if (!selected) {
                ++report.empty;
                continue;
            }
            auto& tally = report.backends[index.at(*selected)];
            ++tally.count;
            ++report.total;
            if (tally.zone == client.HomeZone()) {
                ++report.in_zone;
            }
        }
    }
    if (report.empty > 0) {
        ZONELB_LOG_WARN("[Simulation] {} selections found no eligible backend", report.empty);
    }

    if (report.total > 0) {
        const double avg = static_cast<double>(report.total) / static_cast<double>(report.backends.size());
        for (auto& tally : report.backends) {
            tally.load = static_cast<double>(tally.count) / avg;
        }
        auto [min_it, max_it] = std::minmax_element(
            report.backends.begin(), report.backends.end(),
            [](const BackendTally& a, const BackendTally& b) { return a.load < b.load; });
        report.min_load = min_it->load;
        report.max_load = max_it->load;
        report.in_zone_fraction = static_cast<double>(report.in_zone) / static_cast<double>(report.total);
    }
    ZONELB_LOG_INFO("[Simulation] {} clients, {} selections, in-zone fraction {:.5f}",
                    clients.size(), report.total, report.in_zone_fraction);
    return common::StatusOr<SimulationReport>(std::move(report));
}

} // namespace sim
} // namespace zonelb
