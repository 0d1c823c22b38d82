#pragma once

#include "common/status.hpp"

#include <string>

namespace zonelb {
namespace common {

enum class BalancerErrorCode {
    kOk = 0,
    kEmptyRegistry = 1,     // 注册表没有任何后端
    kUnknownHomeZone = 2,   // 要求客户端 zone 必须存在, 但注册表中没有
    kInvalidCapacity = 3,   // 后端容量非正数或非有限值
    kDuplicateBackend = 4,  // 同一快照内出现重复的后端 id
};

inline const char* BalancerErrorName(BalancerErrorCode error) {
    switch (error) {
        case BalancerErrorCode::kOk:
            return "Ok";
        case BalancerErrorCode::kEmptyRegistry:
            return "EmptyRegistry";
        case BalancerErrorCode::kUnknownHomeZone:
            return "UnknownHomeZone";
        case BalancerErrorCode::kInvalidCapacity:
            return "InvalidCapacity";
        case BalancerErrorCode::kDuplicateBackend:
            return "DuplicateBackend";
    }
    return "Unknown";
}

// 将 BalancerErrorCode 转换为通用 Status
inline Status FromBalancerError(BalancerErrorCode error, std::string message = "") {
    switch (error) {
        case BalancerErrorCode::kOk:
            return Status::OK();
        case BalancerErrorCode::kEmptyRegistry:
            return Status::FailedPrecondition(message.empty() ? "Registry has no backends" : message);
        case BalancerErrorCode::kUnknownHomeZone:
            return Status::NotFound(message.empty() ? "Home zone not present in registry" : message);
        case BalancerErrorCode::kInvalidCapacity:
            return Status::InvalidArgument(message.empty() ? "Backend capacity must be positive" : message);
        case BalancerErrorCode::kDuplicateBackend:
            return Status::AlreadyExists(message.empty() ? "Duplicate backend id" : message);
    }
    return Status::Internal("Unknown balancer error");
}

}
}
