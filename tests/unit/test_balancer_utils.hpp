#pragma once

#include "registry/backend.hpp"
#include "registry/registry_snapshot.hpp"
#include "scheduler/random_source.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace testutils {

using Backend = zonelb::registry::StringBackend;
using Snapshot = zonelb::registry::RegistrySnapshot<Backend>;

// 按给定顺序返回预设的随机数, 用完后循环; 记录被调用的次数
class ScriptedRandomSource : public zonelb::scheduler::RandomSource {
public:
    explicit ScriptedRandomSource(std::vector<double> values) : values_(std::move(values)) {}

    double NextUniform() override {
        double v = values_.empty() ? 0.0 : values_[draws_ % values_.size()];
        ++draws_;
        return v;
    }

    std::size_t Draws() const {
        return draws_;
    }

private:
    std::vector<double> values_;
    std::size_t draws_ = 0;
};

inline Backend MakeBackend(std::string id, std::string zone, double capacity = 1.0) {
    Backend backend;
    backend.id = std::move(id);
    backend.zone = std::move(zone);
    backend.capacity = capacity;
    return backend;
}

// 参考拓扑: a/b/c 三个 zone 分别有 1/5/9 个容量为 1 的后端, id 依次为 0..14
inline std::vector<Backend> ReferenceBackends() {
    std::vector<Backend> backends;
    auto add = [&backends](const std::string& zone, int count) {
        for (int i = 0; i < count; ++i) {
            backends.push_back(MakeBackend(std::to_string(backends.size()), zone));
        }
    };
    add("a", 1);
    add("b", 5);
    add("c", 9);
    return backends;
}

inline Snapshot::Ptr MakeSnapshot(std::vector<Backend> backends) {
    auto snapshot = Snapshot::Create(std::move(backends));
    EXPECT_TRUE(snapshot.IsOk()) << snapshot.GetStatus().Message();
    return snapshot.IsOk() ? snapshot.Value() : nullptr;
}

} // namespace testutils
