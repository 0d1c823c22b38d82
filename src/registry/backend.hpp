#pragma once

#include <string>
#include <type_traits>

namespace zonelb {
namespace registry {

// 单个后端节点
// Id / Zone 只要求可比较 (operator<, operator==), Capacity 为浮点类型
template <typename Id, typename Zone, typename Capacity = double>
struct Backend {
    static_assert(std::is_floating_point_v<Capacity>, "Backend capacity must be a floating point type");

    using id_type = Id;
    using zone_type = Zone;
    using capacity_type = Capacity;

    Id id{};
    Zone zone{};
    Capacity capacity{}; // 相对服务能力, 例如并发预算
};

using StringBackend = Backend<std::string, std::string>;

} // namespace registry
} // namespace zonelb
