#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

// ============================================================================
// TrackStore - 跟踪地址表的存储接口
//
// 所有方法失败时抛 StoreFailure。
// 对同一 (subscriber, address) 行的写入必须串行; advance_checkpoint 不得
// 重新创建已被删除的行。
// ============================================================================
class TrackStore {
public:
  virtual ~TrackStore() = default;

  // 插入或覆盖 (label + checkpoint 全部重置)
  virtual void upsert(const TrackedAddress &row) = 0;

  virtual std::vector<AddressEntry> list(const std::string &subscriber) = 0;

  // address 列等于 address 或 label 列等于 label (均为精确匹配); 返回是否删除了至少一行
  virtual bool remove(const std::string &subscriber, const std::string &address,
                      const std::string &label) = 0;

  virtual std::vector<TrackedAddress> all_tracked() = 0;

  // 行不存在时静默跳过
  virtual void advance_checkpoint(const std::string &subscriber, const std::string &address,
                                  const Checkpoint &checkpoint) = 0;

  // 不存在时返回 nullopt
  virtual std::optional<TrackedAddress> find(const std::string &subscriber,
                                             const std::string &address) = 0;
};
