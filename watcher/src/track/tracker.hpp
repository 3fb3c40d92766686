#pragma once

// ============================================================================
// Tracker - 命令侧接口: track / list / untrack
//
// track 时用 feed 的最新交易作为基线, 之后只推送基线之后的交易;
// feed 不可用或地址无交易时, 以 "none" + 当前时间作为基线。
// ============================================================================

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../core/errors.hpp"
#include "../core/track_store.hpp"
#include "../infra/feed_client.hpp"

enum class TrackStatus {
  Ok,
  InvalidAddress,
  StoreFailure,
};

struct TrackResult {
  TrackStatus status = TrackStatus::Ok;
  TrackedAddress row;
  bool retracked = false; // 覆盖了已有的行, checkpoint 重置
  std::string error;

  bool ok() const { return status == TrackStatus::Ok; }
};

inline int64_t unix_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

class Tracker {
public:
  using Clock = std::function<int64_t()>;

  Tracker(TrackStore &store, TransactionFeed &feed, Clock now = unix_now)
      : store_(store), feed_(feed), now_(std::move(now)) {}

  TrackResult track(const std::string &subscriber, const std::string &raw_address,
                    const std::optional<std::string> &label = std::nullopt) {
    TrackResult result;
    auto addr = address::normalize(raw_address);
    if (!addr) {
      result.status = TrackStatus::InvalidAddress;
      result.error = InvalidAddressFormat(raw_address).what();
      return result;
    }

    TrackedAddress &row = result.row;
    row.subscriber_id = subscriber;
    row.address = *addr;
    row.label = (label && !label->empty()) ? *label : *addr;
    row.created_at = now_();
    row.checkpoint = baseline(*addr, row.created_at);

    try {
      result.retracked = store_.find(subscriber, *addr).has_value();
      store_.upsert(row);
    } catch (const StoreFailure &e) {
      std::cerr << "[Tracker] 保存 " << *addr << " 失败: " << e.what() << std::endl;
      result.status = TrackStatus::StoreFailure;
      result.error = e.what();
      return result;
    }

    std::cout << "[Tracker] " << subscriber << (result.retracked ? " 重新跟踪 " : " 开始跟踪 ") << *addr << " (" << row.label
              << "), 基线 " << row.checkpoint.hash << std::endl;
    return result;
  }

  // 失败时抛 StoreFailure
  std::vector<AddressEntry> list(const std::string &subscriber) { return store_.list(subscriber); }

  // 地址按小写形式匹配, label 按原文精确匹配
  bool untrack(const std::string &subscriber, const std::string &identifier) {
    auto addr = address::normalize(identifier);
    try {
      bool removed = store_.remove(subscriber, addr ? *addr : identifier, identifier);
      if (removed) {
        std::cout << "[Tracker] " << subscriber << " 取消跟踪 " << identifier << std::endl;
      }
      return removed;
    } catch (const StoreFailure &e) {
      std::cerr << "[Tracker] 删除 " << identifier << " 失败: " << e.what() << std::endl;
      return false;
    }
  }

private:
  Checkpoint baseline(const std::string &addr, int64_t now) {
    try {
      auto latest = feed_.latest(addr);
      if (latest) {
        return {latest->hash, latest->timestamp};
      }
    } catch (const std::exception &e) {
      std::cerr << "[Tracker] 获取 " << addr << " 最新交易失败, 以当前时间为基线: " << e.what()
                << std::endl;
    }
    return {NO_TRANSACTION_YET, now};
  }

  TrackStore &store_;
  TransactionFeed &feed_;
  Clock now_;
};
