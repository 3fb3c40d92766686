#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/errors.hpp"
#include "feed_client.hpp"
#include "http_client.hpp"

using json = nlohmann::json;

struct AccountBalance {
  std::string address;
  std::string balance; // KAIA, 原样保留 API 的十进制字符串
  double usd_value = 0.0;
};

struct TokenHolding {
  std::string name;
  std::string symbol;
  std::string balance;
};

struct NftHolding {
  std::string name;
  std::string symbol;
  int64_t count = 0;
  std::string token_id; // 仅 KIP37
};

struct NftHoldings {
  std::vector<NftHolding> kip17;
  std::vector<NftHolding> kip37;

  bool empty() const { return kip17.empty() && kip37.empty(); }
};

// ============================================================================
// AccountLookup - 地址余额 / 代币 / NFT 查询 (只读)
//
// 失败抛 FeedUnavailable (传输或非 200) / FeedMalformed (响应结构不对)
// ============================================================================
class AccountLookup {
public:
  virtual ~AccountLookup() = default;

  virtual AccountBalance balance(const std::string &address) = 0;
  virtual std::vector<TokenHolding> tokens(const std::string &address) = 0;
  virtual NftHoldings nfts(const std::string &address) = 0;
};

namespace account {

// 一个 NFT 合约下的持有记录, 合约信息另查
struct NftBalanceEntry {
  std::string contract_address;
  int64_t count = 0;
  std::string token_id;
};

inline json parse_object(const std::string &body) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error &) {
    throw FeedMalformed("JSON 解析失败: " + body.substr(0, 200));
  }
  if (!j.is_object()) {
    throw FeedMalformed("响应不是对象: " + body.substr(0, 200));
  }
  return j;
}

inline const json &results_of(const json &j) {
  if (!j.contains("results") || !j["results"].is_array()) {
    throw FeedMalformed("响应缺少 results");
  }
  return j["results"];
}

inline double parse_decimal(const std::string &s, const char *what) {
  try {
    return std::stod(s);
  } catch (const std::logic_error &) {
    throw FeedMalformed(std::string("字段不是数字: ") + what + " = " + s);
  }
}

// 数字或数字字符串
inline double number_of(const json &v, const char *what) {
  if (v.is_number())
    return v.get<double>();
  if (v.is_string())
    return parse_decimal(v.get<std::string>(), what);
  throw FeedMalformed(std::string("字段不是数字: ") + what);
}

inline AccountBalance parse_balance(const std::string &body) {
  json j = parse_object(body);
  AccountBalance out;
  out.address = feed::field_str(j, {"address"});
  out.balance = feed::field_str(j, {"balance"});
  if (out.balance.empty()) {
    throw FeedMalformed("账户响应缺少 balance");
  }
  return out;
}

// GET /kaia -> {"klay_price": {"usd_price": "0.12", ...}}
inline double parse_usd_price(const std::string &body) {
  json j = parse_object(body);
  for (const char *key : {"klay_price", "kaia_price"}) {
    if (j.contains(key) && j[key].is_object() && j[key].contains("usd_price")) {
      return number_of(j[key]["usd_price"], "usd_price");
    }
  }
  throw FeedMalformed("价格响应缺少 usd_price");
}

inline std::vector<TokenHolding> parse_tokens(const std::string &body) {
  json j = parse_object(body);
  std::vector<TokenHolding> tokens;
  for (const auto &item : results_of(j)) {
    if (!item.is_object() || !item.contains("contract") || !item["contract"].is_object()) {
      throw FeedMalformed("代币条目缺少 contract");
    }
    const auto &contract = item["contract"];
    TokenHolding t;
    t.name = feed::field_str(contract, {"name", "contract_address"});
    t.symbol = feed::field_str(contract, {"symbol"});
    t.balance = feed::field_str(item, {"balance"});
    tokens.push_back(std::move(t));
  }
  return tokens;
}

inline std::vector<NftBalanceEntry> parse_nft_balances(const std::string &body) {
  json j = parse_object(body);
  std::vector<NftBalanceEntry> entries;
  for (const auto &item : results_of(j)) {
    if (!item.is_object() || !item.contains("contract") || !item["contract"].is_object()) {
      throw FeedMalformed("NFT 条目缺少 contract");
    }
    NftBalanceEntry e;
    e.contract_address = feed::field_str(item["contract"], {"contract_address"});
    if (e.contract_address.empty()) {
      throw FeedMalformed("NFT 条目缺少 contract_address");
    }
    e.count = item.contains("token_count")
                  ? static_cast<int64_t>(number_of(item["token_count"], "token_count"))
                  : 0;
    e.token_id = feed::field_str(item, {"token_id"});
    entries.push_back(std::move(e));
  }
  return entries;
}

// GET /nfts/{contract} -> {"name": ..., "symbol": ...}
inline NftHolding parse_nft_contract(const std::string &body) {
  json j = parse_object(body);
  NftHolding h;
  h.name = feed::field_str(j, {"name"});
  h.symbol = feed::field_str(j, {"symbol"});
  return h;
}

// 按持有数量降序, 数量相同保持 API 顺序
inline void sort_by_count(std::vector<NftHolding> &holdings) {
  std::stable_sort(holdings.begin(), holdings.end(),
                   [](const NftHolding &a, const NftHolding &b) { return a.count > b.count; });
}

inline std::string render_balance(const AccountBalance &b) {
  char usd[64];
  std::snprintf(usd, sizeof(usd), "%.2f", b.usd_value);
  return "🏦 [ADDRESS BALANCE] 🏦\n\nAddress: " + b.address + "\nBalance: " + b.balance +
         " KAIA ( $" + usd + " USD )";
}

inline std::string render_tokens(const std::string &address,
                                 const std::vector<TokenHolding> &tokens) {
  if (tokens.empty())
    return "🔍 No tokens found for this wallet.";

  std::ostringstream out;
  out << "💰 [TOKEN HOLDINGS] 💰\n\nAddress: " << address << "\n";
  for (const auto &t : tokens) {
    out << "\n- " << t.name << ": " << t.balance << " " << t.symbol;
  }
  return out.str();
}

inline std::string render_nfts(const std::string &address, NftHoldings holdings) {
  if (holdings.empty())
    return "🔍 No NFTs found for this address.";

  sort_by_count(holdings.kip17);
  sort_by_count(holdings.kip37);

  std::ostringstream out;
  out << "🖼️ [NFT HOLDINGS] 🖼️\n\nAddress: " << address;
  if (!holdings.kip17.empty()) {
    out << "\n\n[KIP17]";
    for (const auto &n : holdings.kip17)
      out << "\n- " << n.name << ": " << n.count;
  }
  if (!holdings.kip37.empty()) {
    out << "\n\n[KIP37]";
    for (const auto &n : holdings.kip37)
      out << "\n- " << n.name << ": " << n.count << " (" << n.token_id << ")";
  }
  return out.str();
}

} // namespace account

// ============================================================================
// KaiascanAccounts - Kaiascan open API 的账户查询
//
//   GET /accounts/{address}                       余额
//   GET /kaia                                     KAIA 美元价格
//   GET /accounts/{address}/token-details?size=   代币
//   GET /accounts/{address}/nft-balances/kip17|kip37
//   GET /nfts/{contract}                          NFT 合约名称
// ============================================================================
class KaiascanAccounts : public AccountLookup {
public:
  static constexpr int TOKEN_PAGE_SIZE = 2000;

  KaiascanAccounts(const std::string &base_url, const std::string &api_key, int timeout_seconds)
      : base_url_(base_url), api_key_(api_key), http_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/')
      base_url_.pop_back();
  }

  AccountBalance balance(const std::string &address) override {
    AccountBalance b = account::parse_balance(get_ok("/accounts/" + address));
    if (b.address.empty())
      b.address = address;
    double price = account::parse_usd_price(get_ok("/kaia"));
    b.usd_value = account::parse_decimal(b.balance, "balance") * price;
    return b;
  }

  std::vector<TokenHolding> tokens(const std::string &address) override {
    return account::parse_tokens(get_ok("/accounts/" + address +
                                        "/token-details?size=" + std::to_string(TOKEN_PAGE_SIZE)));
  }

  NftHoldings nfts(const std::string &address) override {
    auto kip17 = account::parse_nft_balances(get_ok("/accounts/" + address + "/nft-balances/kip17"));
    auto kip37 = account::parse_nft_balances(get_ok("/accounts/" + address + "/nft-balances/kip37"));

    NftHoldings holdings;
    for (const auto &e : kip17) {
      if (auto h = contract_info(e))
        holdings.kip17.push_back(std::move(*h));
    }
    for (const auto &e : kip37) {
      if (auto h = contract_info(e))
        holdings.kip37.push_back(std::move(*h));
    }
    return holdings;
  }

private:
  HttpResponse get(const std::string &path) {
    try {
      return http_.get(base_url_ + path, {"Accept: */*", "Authorization: Bearer " + api_key_});
    } catch (const std::runtime_error &e) {
      throw FeedUnavailable(e.what());
    }
  }

  std::string get_ok(const std::string &path) {
    HttpResponse response = get(path);
    if (response.status != 200) {
      throw FeedUnavailable("HTTP " + std::to_string(response.status) + " for " + path);
    }
    return response.body;
  }

  // 合约信息查不到的条目跳过
  std::optional<NftHolding> contract_info(const account::NftBalanceEntry &e) {
    HttpResponse response = get("/nfts/" + e.contract_address);
    if (response.status != 200) {
      std::cerr << "[Accounts] 合约 " << e.contract_address << " 查询失败: HTTP "
                << response.status << std::endl;
      return std::nullopt;
    }
    NftHolding h = account::parse_nft_contract(response.body);
    if (h.name.empty())
      h.name = e.contract_address;
    h.count = e.count;
    h.token_id = e.token_id;
    return h;
  }

  std::string base_url_;
  std::string api_key_;
  HttpClient http_;
};
