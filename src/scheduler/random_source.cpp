#include "scheduler/random_source.hpp"

namespace zonelb {
namespace scheduler {

double SeededRandomSource::NextUniform() {
    // 取高 53 位构造 double, 结果严格小于 1.0
    constexpr double kScale = 1.0 / static_cast<double>(std::uint64_t{1} << 53);
    return static_cast<double>(engine_() >> 11) * kScale;
}

std::unique_ptr<RandomSource> MakeEntropyRandomSource() {
    std::random_device device;
    const std::uint64_t seed = (static_cast<std::uint64_t>(device()) << 32) | device();
    return std::make_unique<SeededRandomSource>(seed);
}

} // namespace scheduler
} // namespace zonelb
