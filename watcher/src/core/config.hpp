#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

struct Config {
  std::string db_path;
  // Kaiascan open API
  std::string feed_url = "https://mainnet-oapi.kaiascan.io/api/v1";
  std::string feed_api_key;
  int feed_page_size = 25;
  int feed_timeout_seconds = 15;
  // Telegram Bot API
  std::string telegram_api_url = "https://api.telegram.org";
  std::string bot_token;
  int bot_poll_timeout_seconds = 25;
  // 轮询
  int poll_interval_seconds = 60;
  int sweep_backoff_seconds = 5;
  std::string explorer_tx_url = "https://kaiascan.io/tx/";
  std::string detect_mode = "hash_anchored";

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
      throw std::runtime_error("无法打开配置文件: " + path);
    }

    json j;
    try {
      f >> j;
    } catch (const json::parse_error &e) {
      throw std::runtime_error("配置文件格式错误: " + std::string(e.what()));
    }
    return from_json(j);
  }

  static Config from_json(const json &j) {
    auto require = [&](const char *key) -> const json & {
      if (!j.contains(key)) {
        throw std::runtime_error(std::string("配置文件缺少必填字段: ") + key);
      }
      return j[key];
    };

    Config config;
    try {
      config.db_path = require("db_path").get<std::string>();
      config.feed_api_key = require("feed_api_key").get<std::string>();
      config.bot_token = require("bot_token").get<std::string>();

      config.feed_url = j.value("feed_url", config.feed_url);
      config.feed_page_size = j.value("feed_page_size", config.feed_page_size);
      config.feed_timeout_seconds = j.value("feed_timeout_seconds", config.feed_timeout_seconds);
      config.telegram_api_url = j.value("telegram_api_url", config.telegram_api_url);
      config.bot_poll_timeout_seconds =
          j.value("bot_poll_timeout_seconds", config.bot_poll_timeout_seconds);
      config.poll_interval_seconds = j.value("poll_interval_seconds", config.poll_interval_seconds);
      config.sweep_backoff_seconds = j.value("sweep_backoff_seconds", config.sweep_backoff_seconds);
      config.explorer_tx_url = j.value("explorer_tx_url", config.explorer_tx_url);
      config.detect_mode = j.value("detect_mode", config.detect_mode);
    } catch (const json::type_error &e) {
      throw std::runtime_error("配置字段类型错误: " + std::string(e.what()));
    }

    if (config.feed_page_size <= 0 || config.poll_interval_seconds <= 0 ||
        config.feed_timeout_seconds <= 0) {
      throw std::runtime_error("feed_page_size / poll_interval_seconds / feed_timeout_seconds 必须为正数");
    }
    if (config.sweep_backoff_seconds <= 0) {
      throw std::runtime_error("sweep_backoff_seconds 必须为正数");
    }
    // 0 表示 getUpdates 短轮询
    if (config.bot_poll_timeout_seconds < 0) {
      throw std::runtime_error("bot_poll_timeout_seconds 不能为负数");
    }
    if (config.detect_mode != "hash_anchored" && config.detect_mode != "hash_and_time") {
      throw std::runtime_error("未知的 detect_mode: " + config.detect_mode);
    }
    return config;
  }
};
