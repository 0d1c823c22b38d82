#pragma once

#include <cstdint>
#include <memory>
#include <random>

namespace zonelb {
namespace scheduler {

// 均匀随机数来源, 由调用方注入; 每个客户端独占一个实例
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // 返回 [0, 1) 内的均匀随机实数, 会推进内部状态
    virtual double NextUniform() = 0;
};

// 固定种子的伪随机源, 用于可复现的仿真和测试
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(std::uint64_t seed) : engine_(seed) {}

    double NextUniform() override;

private:
    std::mt19937_64 engine_;
};

// 使用 std::random_device 取种子, 生产环境使用
std::unique_ptr<RandomSource> MakeEntropyRandomSource();

} // namespace scheduler
} // namespace zonelb
