#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace zonelb {
namespace common {

class ConfigLoader {
public:
    static AppConfig Load(const std::string& path);
    // ZONE_LB_CONFIG 环境变量优先, 否则使用 config/app.example.json
    static AppConfig LoadFromEnvOrDefault();
    static std::string DefaultPath();
    static AppConfig FromJson(const nlohmann::json& j);
private:
    static nlohmann::json ReadFile(const std::string& path);
};

}
}
