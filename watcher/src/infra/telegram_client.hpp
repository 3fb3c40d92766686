#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/errors.hpp"
#include "http_client.hpp"

using json = nlohmann::json;

namespace telegram {

struct Update {
  int64_t update_id = 0;
  std::string chat_id;
  std::string text;
};

// getUpdates 响应; 没有文本的更新只保留 update_id 以推进 offset
inline std::vector<Update> parse_updates(const std::string &body) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error &) {
    throw std::runtime_error("getUpdates JSON 解析失败: " + body.substr(0, 200));
  }
  if (!j.value("ok", false) || !j.contains("result") || !j["result"].is_array()) {
    throw std::runtime_error("getUpdates 失败: " + body.substr(0, 200));
  }

  std::vector<Update> updates;
  for (const auto &u : j["result"]) {
    Update update;
    update.update_id = u.value("update_id", int64_t{0});
    if (u.contains("message") && u["message"].is_object()) {
      const auto &msg = u["message"];
      if (msg.contains("chat") && msg["chat"].contains("id")) {
        const auto &id = msg["chat"]["id"];
        update.chat_id = id.is_string() ? id.get<std::string>() : id.dump();
      }
      update.text = msg.value("text", "");
    }
    updates.push_back(std::move(update));
  }
  return updates;
}

} // namespace telegram

// 命令侧用到的 Bot API 子集
class BotApi {
public:
  virtual ~BotApi() = default;

  virtual void send_message(const std::string &chat_id, const std::string &text) = 0;
  virtual std::vector<telegram::Update> get_updates(int64_t offset, int poll_timeout) = 0;
};

// ============================================================================
// TelegramClient - Bot API: sendMessage / getUpdates
// ============================================================================
class TelegramClient : public BotApi {
public:
  TelegramClient(const std::string &api_url, const std::string &token, int timeout_seconds)
      : base_url_(api_url + "/bot" + token), http_(timeout_seconds) {}

  // 失败抛 DispatchFailure
  void send_message(const std::string &chat_id, const std::string &text) override {
    json body = {{"chat_id", chat_id}, {"text", text}, {"disable_web_page_preview", true}};

    HttpResponse response;
    try {
      response = http_.post(base_url_ + "/sendMessage", body.dump(),
                            {"Content-Type: application/json"});
    } catch (const std::runtime_error &e) {
      throw DispatchFailure(e.what());
    }
    if (response.status != 200) {
      throw DispatchFailure("sendMessage HTTP " + std::to_string(response.status) + ": " +
                            response.body.substr(0, 200));
    }
  }

  // long poll; 超时时间 = poll_timeout + 余量
  std::vector<telegram::Update> get_updates(int64_t offset, int poll_timeout) override {
    int saved = http_.timeout();
    http_.set_timeout(poll_timeout + 10);
    HttpResponse response;
    try {
      response = http_.get(base_url_ + "/getUpdates?offset=" + std::to_string(offset) +
                           "&timeout=" + std::to_string(poll_timeout));
    } catch (...) {
      http_.set_timeout(saved);
      throw;
    }
    http_.set_timeout(saved);

    if (response.status != 200) {
      throw std::runtime_error("getUpdates HTTP " + std::to_string(response.status));
    }
    return telegram::parse_updates(response.body);
  }

private:
  std::string base_url_;
  HttpClient http_;
};
