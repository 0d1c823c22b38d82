#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace zonelb {
namespace common {

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
};

// 权重计算配置结构体
struct BalancerConfig {
    // 为 true 时, 客户端所在 zone 必须在注册表中出现
    bool require_home_zone = false;
};

// 一组同 zone、同容量的后端
struct ZoneGroupConfig {
    std::string zone;
    int backends = 0;
    double capacity = 1.0;
};

// 仿真配置结构体, 默认值即参考拓扑: a/b/c 三个 zone 各 1/5/9 个后端
struct SimulationConfig {
    std::uint64_t iterations = 1000;
    std::uint64_t seed = 42;
    std::vector<ZoneGroupConfig> topology = {
        {"a", 1, 1.0},
        {"b", 5, 1.0},
        {"c", 9, 1.0},
    };
    std::vector<std::string> client_zones = {"a", "b", "c"};
};

// 应用配置结构体
struct AppConfig {
    LoggingConfig logging;
    BalancerConfig balancer;
    SimulationConfig simulation;
};

}
}
