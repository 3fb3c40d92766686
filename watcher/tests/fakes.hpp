#pragma once

#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/track_store.hpp"
#include "infra/account_client.hpp"
#include "infra/feed_client.hpp"

namespace fake {

inline std::string addr(char c) { return "0x" + std::string(40, c); }

inline RawTransaction tx(const std::string &hash, int64_t timestamp) {
  RawTransaction t;
  t.hash = hash;
  t.from = addr('1');
  t.to = addr('2');
  t.timestamp = timestamp;
  t.kind = "transfer";
  t.amount = "1.5";
  t.fee = "0.000525";
  return t;
}

// 每个地址一份完整历史, 最新在前
class Feed : public TransactionFeed {
public:
  std::vector<RawTransaction> history(const std::string &address, int page,
                                      int page_size) override {
    ++calls[address];
    if (failing.count(address))
      throw FeedUnavailable("feed down for " + address);

    const auto &all = pages[address];
    std::vector<RawTransaction> out;
    size_t begin = static_cast<size_t>((page - 1) * page_size);
    for (size_t i = begin; i < all.size() && out.size() < static_cast<size_t>(page_size); ++i)
      out.push_back(all[i]);
    return out;
  }

  // 新交易放到最前
  void push(const std::string &address, const RawTransaction &t) {
    auto &all = pages[address];
    all.insert(all.begin(), t);
  }

  std::map<std::string, std::vector<RawTransaction>> pages;
  std::set<std::string> failing;
  std::map<std::string, int> calls;
};

struct Sent {
  std::string subscriber;
  std::string message;
};

// 记录推送; hook 可抛异常模拟推送失败
struct Channel {
  std::vector<Sent> sent;
  std::function<void(const std::string &, const std::string &)> hook;

  void operator()(const std::string &subscriber, const std::string &message) {
    if (hook)
      hook(subscriber, message);
    sent.push_back({subscriber, message});
  }

  bool mentions(size_t i, const std::string &needle) const {
    return i < sent.size() && sent[i].message.find(needle) != std::string::npos;
  }
};

// 固定返回; failing 为 true 时所有查询抛 FeedUnavailable
class Accounts : public AccountLookup {
public:
  AccountBalance balance(const std::string &address) override {
    check(address);
    return {address, balance_kaia, usd_value};
  }

  std::vector<TokenHolding> tokens(const std::string &address) override {
    check(address);
    return token_list;
  }

  NftHoldings nfts(const std::string &address) override {
    check(address);
    return nft_list;
  }

  std::string balance_kaia = "0";
  double usd_value = 0.0;
  std::vector<TokenHolding> token_list;
  NftHoldings nft_list;
  bool failing = false;
  bool broken = false; // 抛出非 Feed* 异常
  std::vector<std::string> queried;

private:
  void check(const std::string &address) {
    queried.push_back(address);
    if (failing)
      throw FeedUnavailable("lookup down for " + address);
    if (broken)
      throw std::logic_error("unexpected lookup error for " + address);
  }
};

// 包装真实存储, 按需注入 StoreFailure
class FlakyStore : public TrackStore {
public:
  explicit FlakyStore(TrackStore &inner) : inner_(inner) {}

  void upsert(const TrackedAddress &row) override {
    if (fail_upsert)
      throw StoreFailure("upsert failed");
    inner_.upsert(row);
  }

  std::vector<AddressEntry> list(const std::string &subscriber) override {
    if (fail_list)
      throw StoreFailure("list failed");
    return inner_.list(subscriber);
  }

  bool remove(const std::string &subscriber, const std::string &address,
              const std::string &label) override {
    if (fail_remove)
      throw StoreFailure("remove failed");
    return inner_.remove(subscriber, address, label);
  }

  std::vector<TrackedAddress> all_tracked() override {
    if (fail_snapshots > 0) {
      --fail_snapshots;
      throw StoreFailure("snapshot failed");
    }
    return inner_.all_tracked();
  }

  void advance_checkpoint(const std::string &subscriber, const std::string &address,
                          const Checkpoint &checkpoint) override {
    if (fail_advance > 0) {
      --fail_advance;
      throw StoreFailure("advance failed");
    }
    inner_.advance_checkpoint(subscriber, address, checkpoint);
  }

  std::optional<TrackedAddress> find(const std::string &subscriber,
                                     const std::string &address) override {
    if (fail_find)
      throw StoreFailure("find failed");
    return inner_.find(subscriber, address);
  }

  bool fail_upsert = false;
  bool fail_list = false;
  bool fail_remove = false;
  bool fail_find = false;
  int fail_snapshots = 0;
  int fail_advance = 0;

private:
  TrackStore &inner_;
};

} // namespace fake
