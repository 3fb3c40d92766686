#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

// 地址尚无任何交易时的 checkpoint hash
constexpr const char *NO_TRANSACTION_YET = "none";

// feed 返回的一笔交易 (只读)
struct RawTransaction {
  std::string hash;
  std::string from;
  std::string to;
  int64_t timestamp = 0; // unix 秒, UTC
  std::string kind;
  std::string amount;
  std::string fee;
  std::string method; // 可能为空
};

struct Checkpoint {
  std::string hash = NO_TRANSACTION_YET;
  int64_t time = 0;

  bool is_sentinel() const { return hash == NO_TRANSACTION_YET; }
  bool operator==(const Checkpoint &) const = default;
};

struct TrackedAddress {
  std::string subscriber_id;
  std::string address;
  std::string label;
  Checkpoint checkpoint;
  int64_t created_at = 0;
};

struct AddressEntry {
  std::string address;
  std::string label;
};

namespace address {

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// 0x + 40 位 hex
inline bool is_valid(const std::string &addr) {
  if (addr.size() != 42 || addr[0] != '0' || (addr[1] != 'x' && addr[1] != 'X'))
    return false;
  return std::all_of(addr.begin() + 2, addr.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; });
}

// 合法则返回小写形式
inline std::optional<std::string> normalize(const std::string &addr) {
  if (!is_valid(addr))
    return std::nullopt;
  return to_lower(addr);
}

} // namespace address
