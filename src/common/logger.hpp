#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace zonelb {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define ZONELB_LOG_DEBUG(...) ::zonelb::common::GetLogger()->debug(__VA_ARGS__)
#define ZONELB_LOG_INFO(...)  ::zonelb::common::GetLogger()->info(__VA_ARGS__)
#define ZONELB_LOG_WARN(...)  ::zonelb::common::GetLogger()->warn(__VA_ARGS__)
#define ZONELB_LOG_ERROR(...) ::zonelb::common::GetLogger()->error(__VA_ARGS__)

}
}
