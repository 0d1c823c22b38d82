#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "sim/command_line.hpp"
#include "sim/simulation.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char* program) {
    fmt::print(stderr, "usage: {} [config.json] [--iterations N]\n", program);
}

} // namespace

int main(int argc, char** argv) {
    auto parsed = zonelb::sim::ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    if (!parsed.IsOk()) {
        fmt::print(stderr, "{}\n", parsed.GetStatus().Message());
        PrintUsage(argv[0]);
        return EXIT_FAILURE;
    }
    const auto& cmd = parsed.Value();
    if (cmd.help) {
        PrintUsage(argv[0]);
        return EXIT_SUCCESS;
    }

    const std::string config_path =
        cmd.config_path.empty() ? zonelb::common::ConfigLoader::DefaultPath() : cmd.config_path;
    zonelb::common::AppConfig config;
    try {
        config = cmd.config_path.empty() ? zonelb::common::ConfigLoader::LoadFromEnvOrDefault()
                                         : zonelb::common::ConfigLoader::Load(cmd.config_path);
    } catch (const std::exception& ex) {
        fmt::print(stderr, "Failed to load config {}: {}\n", config_path, ex.what());
        return EXIT_FAILURE;
    }
    if (cmd.iterations) {
        config.simulation.iterations = *cmd.iterations;
    }

    zonelb::common::InitLogger(config.logging);
    ZONELB_LOG_INFO("zone_lb_sim starting with config {}", config_path);

    zonelb::scheduler::ZoneWeightOptions options;
    options.require_home_zone = config.balancer.require_home_zone;
    auto report = zonelb::sim::RunSimulation(config.simulation, options);
    if (!report.IsOk()) {
        ZONELB_LOG_ERROR("Simulation failed: {} ({})",
                         report.GetStatus().Message(),
                         zonelb::common::StatusCodeToString(report.GetStatus().Code()));
        zonelb::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    for (const auto& tally : report.Value().backends) {
        fmt::print("[{}] {:.5f}\n", tally.zone, tally.load);
    }
    fmt::print("% in-zone = {}\n", report.Value().in_zone_fraction);

    zonelb::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
