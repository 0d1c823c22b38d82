#include "sim/command_line.hpp"

#include <cctype>
#include <exception>
#include <utility>

namespace zonelb {
namespace sim {

namespace {

common::StatusOr<std::uint64_t> ParseIterations(const std::string& value) {
    // stoull 会接受 "-1" 并回绕成极大值, 这里只允许纯数字
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
        return common::Status::InvalidArgument("--iterations expects a positive integer, got \"" + value + "\"");
    }
    std::size_t consumed = 0;
    std::uint64_t iterations = 0;
    try {
        iterations = std::stoull(value, &consumed);
    } catch (const std::exception& ex) {
        return common::Status::InvalidArgument("invalid --iterations value \"" + value + "\": " + ex.what());
    }
    if (consumed != value.size()) {
        return common::Status::InvalidArgument("--iterations expects a positive integer, got \"" + value + "\"");
    }
    if (iterations == 0) {
        return common::Status::InvalidArgument("--iterations must be greater than 0");
    }
    return common::StatusOr<std::uint64_t>(iterations);
}

} // namespace

common::StatusOr<CommandLine> ParseCommandLine(const std::vector<std::string>& args) {
    CommandLine cmd;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--iterations") {
            if (i + 1 >= args.size()) {
                return common::Status::InvalidArgument("--iterations requires a value");
            }
            auto iterations = ParseIterations(args[++i]);
            if (!iterations.IsOk()) {
                return iterations.GetStatus();
            }
            cmd.iterations = iterations.Value();
        } else if (arg == "-h" || arg == "--help") {
            cmd.help = true;
        } else if (cmd.config_path.empty() && !arg.empty() && arg.front() != '-') {
            cmd.config_path = arg;
        } else {
            return common::Status::InvalidArgument("unexpected argument \"" + arg + "\"");
        }
    }
    return common::StatusOr<CommandLine>(std::move(cmd));
}

}
}
