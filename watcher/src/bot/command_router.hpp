#pragma once

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "../core/errors.hpp"
#include "../infra/account_client.hpp"
#include "../track/tracker.hpp"

namespace commands {

constexpr const char *WELCOME = R"(👋 Welcome to Kaia Address Watch Bot!
Available Commands:
- /track 0x... [label] : Get notified of new transactions
- /list : Show tracked addresses
- /untrack <address|label> : Stop tracking
- /balance 0x... : Check Native balance
- /tokens 0x... : List Token holdings
- /nfts 0x... : List NFT holdings

Example:
/track 0x5eda3f9ab84dc831aa3c811af73f54c4ca9ec5aa cold wallet
/untrack cold wallet
/balance 0x5eda3f9ab84dc831aa3c811af73f54c4ca9ec5aa)";

constexpr const char *INVALID_ADDRESS =
    "❌ Invalid wallet address. Please provide a valid 0x... address.";

inline std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos)
    return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

struct Parsed {
  std::string name; // 不含 '/' 和 @botname
  std::string args;
};

inline std::optional<Parsed> parse(const std::string &text) {
  std::string t = trim(text);
  if (t.empty() || t[0] != '/')
    return std::nullopt;

  auto space = t.find_first_of(" \t\n");
  std::string head = t.substr(1, space == std::string::npos ? std::string::npos : space - 1);
  auto at = head.find('@');
  if (at != std::string::npos)
    head = head.substr(0, at);

  Parsed parsed;
  parsed.name = head;
  if (space != std::string::npos)
    parsed.args = trim(t.substr(space));
  return parsed;
}

} // namespace commands

// ============================================================================
// CommandRouter - 聊天文本 -> Tracker 调用 -> 回复文本
// ============================================================================
class CommandRouter {
public:
  CommandRouter(Tracker &tracker, AccountLookup &accounts)
      : tracker_(tracker), accounts_(accounts) {}

  // 非命令文本返回 nullopt (不回复)
  std::optional<std::string> handle(const std::string &subscriber, const std::string &text) {
    auto cmd = commands::parse(text);
    if (!cmd)
      return std::nullopt;

    if (cmd->name == "track")
      return on_track(subscriber, cmd->args);
    if (cmd->name == "list")
      return on_list(subscriber);
    if (cmd->name == "untrack")
      return on_untrack(subscriber, cmd->args);
    if (cmd->name == "balance" || cmd->name == "tokens" || cmd->name == "nfts")
      return on_lookup(cmd->name, cmd->args);
    return std::string(commands::WELCOME);
  }

private:
  std::string on_track(const std::string &subscriber, const std::string &args) {
    if (args.empty())
      return "❌ Please use the format: /track 0x... [label]";

    auto space = args.find_first_of(" \t");
    std::string addr = args.substr(0, space);
    std::optional<std::string> label;
    if (space != std::string::npos) {
      std::string rest = commands::trim(args.substr(space));
      if (!rest.empty())
        label = rest;
    }

    auto result = tracker_.track(subscriber, addr, label);
    switch (result.status) {
    case TrackStatus::Ok:
      if (result.retracked)
        return "🔄 Updated " + result.row.address + " (" + result.row.label +
               "), notifications restart from now";
      return "✅ Now tracking " + result.row.address + " (" + result.row.label + ")";
    case TrackStatus::InvalidAddress:
      return commands::INVALID_ADDRESS;
    case TrackStatus::StoreFailure:
      break;
    }
    return "❌ Failed to save the address. Please try again later.";
  }

  std::string on_list(const std::string &subscriber) {
    std::vector<AddressEntry> entries;
    try {
      entries = tracker_.list(subscriber);
    } catch (const StoreFailure &e) {
      std::cerr << "[Bot] 读取 " << subscriber << " 的列表失败: " << e.what() << std::endl;
      return "❌ Unable to load tracked addresses. Please try again later.";
    }
    if (entries.empty())
      return "🔍 You are not tracking any addresses.";

    std::ostringstream out;
    out << "📋 [TRACKED ADDRESSES] 📋\n";
    for (const auto &e : entries) {
      out << "\n- " << e.label;
      if (e.label != e.address)
        out << ": " << e.address;
    }
    return out.str();
  }

  std::string on_untrack(const std::string &subscriber, const std::string &args) {
    if (args.empty())
      return "❌ Please use the format: /untrack <address|label>";
    if (tracker_.untrack(subscriber, args))
      return "✅ Stopped tracking " + args;
    return "❌ Nothing tracked matches " + args;
  }

  // /balance /tokens /nfts <address>
  std::string on_lookup(const std::string &name, const std::string &args) {
    if (args.empty() || args.find_first_of(" \t") != std::string::npos)
      return "❌ Please use the format: /" + name + " 0x...";
    auto addr = address::normalize(args);
    if (!addr)
      return commands::INVALID_ADDRESS;

    try {
      if (name == "balance")
        return account::render_balance(accounts_.balance(*addr));
      if (name == "tokens")
        return account::render_tokens(*addr, accounts_.tokens(*addr));
      return account::render_nfts(*addr, accounts_.nfts(*addr));
    } catch (const FeedUnavailable &e) {
      std::cerr << "[Bot] /" << name << " " << *addr << " 查询失败: " << e.what() << std::endl;
      return "❌ Unable to fetch " + name + " right now. Please try again later.";
    } catch (const FeedMalformed &e) {
      std::cerr << "[Bot] /" << name << " " << *addr << " 响应异常: " << e.what() << std::endl;
      return "❌ Error: Unexpected API response format";
    }
  }

  Tracker &tracker_;
  AccountLookup &accounts_;
};
