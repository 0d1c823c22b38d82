#include "common/logger.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace zonelb {
namespace common {

namespace {

constexpr const char* kLoggerName = "zone_lb";

std::shared_ptr<spdlog::logger> g_logger;

// 大小写不敏感, 接受 warning/error 别名; 无法识别时回退到 info
spdlog::level::level_enum ParseLevel(const std::string& level) {
    std::string name;
    for (unsigned char c : level) {
        name.push_back(static_cast<char>(std::tolower(c)));
    }
    if (name == "warning") {
        return spdlog::level::warn;
    }
    if (name == "error") {
        return spdlog::level::err;
    }
    // from_str 对未知名称返回 off
    auto parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off && name != "off") {
        fmt::print(stderr, "{} logger: unknown level \"{}\", using info\n", kLoggerName, level);
        return spdlog::level::info;
    }
    return parsed;
}

spdlog::sink_ptr MakeFileSink(const std::string& file) {
    std::filesystem::path path{file};
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error(fmt::format("cannot create log directory {}: {}",
                                                 path.parent_path().string(), ec.message()));
        }
    }
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
}

} // namespace

void InitLogger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file.empty()) {
        sinks.push_back(MakeFileSink(config.file));
    }
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(ParseLevel(config.level));
    logger->set_pattern(config.pattern);
    spdlog::set_default_logger(logger);
    g_logger = std::move(logger);
}

void ShutdownLogger() {
    if (g_logger) {
        g_logger->flush();
    }
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> GetLogger() {
    if (!g_logger) {
        g_logger = spdlog::default_logger();
    }
    return g_logger;
}

}
}
