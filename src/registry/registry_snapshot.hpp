#pragma once

#include "common/errors.hpp"
#include "common/status_or.hpp"
#include "registry/backend.hpp"

#include <cmath>
#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace zonelb {
namespace registry {

// 一个权重计算周期内的注册表快照
// 创建后只读, 以 shared_ptr<const> 在多个客户端之间共享; 拓扑变化时创建新快照
template <typename BackendT>
class RegistrySnapshot {
public:
    using BackendType = BackendT;
    using Id = typename BackendT::id_type;
    using Zone = typename BackendT::zone_type;
    using Capacity = typename BackendT::capacity_type;
    using Ptr = std::shared_ptr<const RegistrySnapshot>;

    // 校验并创建快照: 非空, 容量为正的有限值, id 不重复
    static common::StatusOr<Ptr> Create(std::vector<BackendT> backends);

    const std::vector<BackendT>& Backends() const {
        return backends_;
    }
    std::size_t Size() const {
        return backends_.size();
    }

    // 按 id 查找后端, 不存在返回 nullptr
    const BackendT* Find(const Id& id) const;

private:
    explicit RegistrySnapshot(std::vector<BackendT> backends)
        : backends_(std::move(backends)) {}

    std::vector<BackendT> backends_;
};

template <typename BackendT>
common::StatusOr<typename RegistrySnapshot<BackendT>::Ptr>
RegistrySnapshot<BackendT>::Create(std::vector<BackendT> backends) {
    using common::BalancerErrorCode;
    if (backends.empty()) {
        return common::FromBalancerError(BalancerErrorCode::kEmptyRegistry);
    }
    std::set<Id> seen;
    for (std::size_t i = 0; i < backends.size(); ++i) {
        const auto& backend = backends[i];
        if (!std::isfinite(backend.capacity) || backend.capacity <= Capacity{0}) {
            return common::FromBalancerError(
                BalancerErrorCode::kInvalidCapacity,
                "Backend at position " + std::to_string(i) + " has a non-positive capacity");
        }
        if (!seen.insert(backend.id).second) {
            return common::FromBalancerError(
                BalancerErrorCode::kDuplicateBackend,
                "Backend at position " + std::to_string(i) + " repeats an earlier id");
        }
    }
    return common::StatusOr<Ptr>(Ptr(new RegistrySnapshot(std::move(backends))));
}

template <typename BackendT>
const BackendT* RegistrySnapshot<BackendT>::Find(const Id& id) const {
    for (const auto& backend : backends_) {
        if (backend.id == id) {
            return &backend;
        }
    }
    return nullptr;
}

extern template class RegistrySnapshot<StringBackend>;

} // namespace registry
} // namespace zonelb
