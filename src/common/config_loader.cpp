#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace zonelb {
namespace common {

namespace {

// 解析拓扑中的单个 zone 分组
ZoneGroupConfig ParseZoneGroup(const nlohmann::json& item) {
    ZoneGroupConfig group;
    group.zone = item.value("zone", group.zone);
    group.backends = item.value("backends", group.backends);
    group.capacity = item.value("capacity", group.capacity);
    if (group.zone.empty()) {
        throw std::runtime_error("simulation.topology entry is missing \"zone\"");
    }
    if (group.backends < 0) {
        throw std::runtime_error("simulation.topology entry for zone " + group.zone
                                 + " has a negative backend count");
    }
    return group;
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    return FromJson(json);
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DefaultPath());
}

std::string ConfigLoader::DefaultPath() {
    if (const char* env = std::getenv("ZONE_LB_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
    }
    // Balancer配置
    if (j.contains("balancer")) {
        const auto& balancer = j["balancer"];
        cfg.balancer.require_home_zone = balancer.value("require_home_zone", cfg.balancer.require_home_zone);
    }
    // Simulation配置
    if (j.contains("simulation")) {
        const auto& simulation = j["simulation"];
        cfg.simulation.iterations = simulation.value("iterations", cfg.simulation.iterations);
        cfg.simulation.seed = simulation.value("seed", cfg.simulation.seed);
        if (simulation.contains("topology")) {
            const auto& topology = simulation["topology"];
            if (!topology.is_array()) {
                throw std::runtime_error("simulation.topology must be an array");
            }
            cfg.simulation.topology.clear();
            for (const auto& item : topology) {
                cfg.simulation.topology.push_back(ParseZoneGroup(item));
            }
        }
        if (simulation.contains("client_zones")) {
            cfg.simulation.client_zones = simulation["client_zones"].get<std::vector<std::string>>();
        }
    }
    return cfg;
}

}
}
