#pragma once

// ============================================================================
// 错误分类
//   InvalidAddressFormat - 用户输入错误, 直接返回给用户, 不重试
//   FeedUnavailable      - 地址级, 下一轮 sweep 重试
//   FeedMalformed        - 地址级, 下一轮 sweep 重试
//   DispatchFailure      - 交易级, checkpoint 不推进, 下一轮重试
//   StoreFailure         - 命令侧返回失败; poller 侧视为交易未处理
// ============================================================================

#include <stdexcept>
#include <string>

struct InvalidAddressFormat : std::runtime_error {
  explicit InvalidAddressFormat(const std::string &address)
      : std::runtime_error("invalid address: " + address) {}
};

struct FeedUnavailable : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct FeedMalformed : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct DispatchFailure : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct StoreFailure : std::runtime_error {
  using std::runtime_error::runtime_error;
};
