#pragma once

#include "common/status_or.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zonelb {
namespace sim {

// zone_lb_sim [config.json] [--iterations N]
struct CommandLine {
    std::string config_path;                 // 为空时使用 ConfigLoader::DefaultPath()
    std::optional<std::uint64_t> iterations; // 未指定时使用配置文件中的值
    bool help = false;
};

// 参数不含程序名; 非法参数返回 kInvalidArgument
common::StatusOr<CommandLine> ParseCommandLine(const std::vector<std::string>& args);

}
}
