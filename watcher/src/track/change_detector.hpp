#pragma once

// ============================================================================
// ChangeDetector - 从一页 feed 中找出 checkpoint 之后的新交易
//
// 输入: 最新优先的一页交易 + 当前 checkpoint
// 输出: 按时间升序的新交易, 每条附带处理完它之后的 checkpoint
//
// HashAndTime  : hash != checkpoint.hash && timestamp > checkpoint.time
// HashAnchored : 在页内定位 checkpoint.hash, 其之前 (更新) 的条目都是新的,
//                但不得早于 checkpoint.time; 找不到锚点时退回 HashAndTime
// ============================================================================

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "../core/types.hpp"

namespace detect {

enum class Mode {
  HashAnchored,
  HashAndTime,
};

inline Mode mode_from_string(const std::string &s) {
  return s == "hash_and_time" ? Mode::HashAndTime : Mode::HashAnchored;
}

struct NewTransaction {
  RawTransaction tx;
  Checkpoint after;
};

inline std::vector<NewTransaction> find_new(const std::vector<RawTransaction> &page,
                                            const Checkpoint &checkpoint,
                                            Mode mode = Mode::HashAnchored) {
  // 候选, 仍是 feed 顺序 (最新优先)
  std::vector<const RawTransaction *> candidates;

  auto anchor = page.end();
  if (mode == Mode::HashAnchored && !checkpoint.is_sentinel()) {
    anchor = std::find_if(page.begin(), page.end(),
                          [&](const RawTransaction &tx) { return tx.hash == checkpoint.hash; });
  }

  if (anchor != page.end()) {
    for (auto it = page.begin(); it != anchor; ++it) {
      if (it->hash != checkpoint.hash && it->timestamp >= checkpoint.time)
        candidates.push_back(&*it);
    }
  } else {
    for (const auto &tx : page) {
      if (tx.hash != checkpoint.hash && tx.timestamp > checkpoint.time)
        candidates.push_back(&tx);
    }
  }

  // 反转成最旧优先, 同一时间戳内保持 feed 的相对先后
  std::reverse(candidates.begin(), candidates.end());
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const RawTransaction *a, const RawTransaction *b) {
                     return a->timestamp < b->timestamp;
                   });

  std::vector<NewTransaction> result;
  result.reserve(candidates.size());
  std::set<std::string> seen;
  for (const auto *tx : candidates) {
    if (!seen.insert(tx->hash).second)
      continue;
    result.push_back({*tx, Checkpoint{tx->hash, tx->timestamp}});
  }
  return result;
}

} // namespace detect
