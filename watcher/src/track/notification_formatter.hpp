#pragma once

#include <ctime>
#include <optional>
#include <sstream>
#include <string>

#include "../core/types.hpp"

namespace notify {

constexpr const char *DEFAULT_EXPLORER_TX_URL = "https://kaiascan.io/tx/";

inline std::string format_utc(int64_t unix_seconds) {
  std::time_t t = static_cast<std::time_t>(unix_seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm);
  return buf;
}

inline std::string or_unknown(const std::string &s) { return s.empty() ? "unknown" : s; }

// 纯函数, 无 I/O
inline std::string render(const RawTransaction &tx, const std::optional<std::string> &label,
                          const std::string &explorer_tx_url = DEFAULT_EXPLORER_TX_URL) {
  std::ostringstream out;
  out << "🔔 [NEW TRANSACTION] 🔔\n\n";
  if (label && !label->empty()) {
    out << "Label: " << *label << "\n";
  }
  out << "Time: " << format_utc(tx.timestamp) << "\n"
      << "Hash: " << tx.hash << "\n"
      << "From: " << or_unknown(tx.from) << "\n"
      << "To: " << or_unknown(tx.to) << "\n"
      << "Type: " << or_unknown(tx.kind) << "\n"
      << "Amount: " << (tx.amount.empty() ? "0" : tx.amount) << " KAIA\n"
      << "Fee: " << (tx.fee.empty() ? "0" : tx.fee) << " KAIA\n"
      << "Method: " << or_unknown(tx.method) << "\n\n"
      << "🔗 " << explorer_tx_url << tx.hash;
  return out.str();
}

} // namespace notify
