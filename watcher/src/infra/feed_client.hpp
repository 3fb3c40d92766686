#pragma once

#include <cctype>
#include <cstdio>
#include <ctime>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "../core/errors.hpp"
#include "../core/types.hpp"
#include "http_client.hpp"

using json = nlohmann::json;

// ============================================================================
// TransactionFeed - 交易历史数据源 (只读)
// ============================================================================
class TransactionFeed {
public:
  virtual ~TransactionFeed() = default;

  // 最新优先; 失败抛 FeedUnavailable / FeedMalformed
  virtual std::vector<RawTransaction> history(const std::string &address, int page,
                                              int page_size) = 0;

  // 无任何交易时返回 nullopt
  virtual std::optional<RawTransaction> latest(const std::string &address) {
    auto page = history(address, 1, 1);
    if (page.empty())
      return std::nullopt;
    return page.front();
  }
};

namespace feed {

// "2024-11-20T10:20:30Z" / "2024-11-20T10:20:30.123+09:00" / "2024-11-20 10:20:30"
inline std::optional<int64_t> parse_iso8601(const std::string &s) {
  std::tm tm{};
  int consumed = 0;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2d%*1[T ]%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon,
                  &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
    return std::nullopt;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  int64_t ts = static_cast<int64_t>(timegm(&tm));

  size_t pos = static_cast<size_t>(consumed);
  // 小数秒
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])))
      ++pos;
  }
  if (pos >= s.size() || s[pos] == 'Z' || s[pos] == 'z')
    return ts;

  // 时区偏移 ±hh:mm 或 ±hhmm
  char sign = s[pos];
  int oh = 0, om = 0;
  if ((sign == '+' || sign == '-') &&
      (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) == 2 ||
       std::sscanf(s.c_str() + pos + 1, "%2d%2d", &oh, &om) == 2)) {
    int64_t offset = oh * 3600 + om * 60;
    return sign == '+' ? ts - offset : ts + offset;
  }
  return std::nullopt;
}

inline std::string field_str(const json &item, std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    if (!item.contains(key) || item[key].is_null())
      continue;
    const auto &v = item[key];
    if (v.is_string())
      return v.get<std::string>();
    return v.dump();
  }
  return "";
}

inline RawTransaction parse_transaction(const json &item) {
  if (!item.is_object()) {
    throw FeedMalformed("交易条目不是对象");
  }

  RawTransaction tx;
  tx.hash = field_str(item, {"transaction_hash", "hash", "tx_hash"});
  if (tx.hash.empty()) {
    throw FeedMalformed("交易条目缺少 transaction_hash");
  }
  tx.from = field_str(item, {"from", "from_address"});
  tx.to = field_str(item, {"to", "to_address"});
  tx.kind = field_str(item, {"transaction_type", "type"});
  tx.amount = field_str(item, {"amount", "value"});
  tx.fee = field_str(item, {"transaction_fee", "fee"});
  tx.method = field_str(item, {"method_id", "signature", "method"});

  if (item.contains("block_timestamp") && item["block_timestamp"].is_number_integer()) {
    tx.timestamp = item["block_timestamp"].get<int64_t>();
  } else if (item.contains("timestamp") && item["timestamp"].is_number_integer()) {
    tx.timestamp = item["timestamp"].get<int64_t>();
  } else {
    auto ts = parse_iso8601(field_str(item, {"datetime", "block_datetime"}));
    if (!ts) {
      throw FeedMalformed("交易 " + tx.hash + " 缺少可解析的时间");
    }
    tx.timestamp = *ts;
  }
  return tx;
}

// 解析一页 {"results": [...]}, 保持 feed 原顺序 (最新优先)
inline std::vector<RawTransaction> parse_page(const std::string &body) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error &) {
    throw FeedMalformed("JSON 解析失败: " + body.substr(0, 200));
  }
  if (!j.is_object() || !j.contains("results") || !j["results"].is_array()) {
    throw FeedMalformed("响应缺少 results: " + body.substr(0, 200));
  }

  std::vector<RawTransaction> page;
  page.reserve(j["results"].size());
  for (const auto &item : j["results"]) {
    page.push_back(parse_transaction(item));
  }
  return page;
}

} // namespace feed

// ============================================================================
// KaiascanFeed - GET {feed_url}/accounts/{address}/transactions?page=&size=
// ============================================================================
class KaiascanFeed : public TransactionFeed {
public:
  KaiascanFeed(const std::string &base_url, const std::string &api_key, int timeout_seconds)
      : base_url_(base_url), api_key_(api_key), http_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/')
      base_url_.pop_back();
  }

  std::vector<RawTransaction> history(const std::string &address, int page,
                                      int page_size) override {
    std::string url = base_url_ + "/accounts/" + address + "/transactions?page=" +
                      std::to_string(page) + "&size=" + std::to_string(page_size);

    HttpResponse response;
    try {
      response = http_.get(url, {"Accept: */*", "Authorization: Bearer " + api_key_});
    } catch (const std::runtime_error &e) {
      throw FeedUnavailable(e.what());
    }

    if (response.status != 200) {
      throw FeedUnavailable("HTTP " + std::to_string(response.status) + " for " + address);
    }
    return feed::parse_page(response.body);
  }

private:
  std::string base_url_;
  std::string api_key_;
  HttpClient http_;
};
