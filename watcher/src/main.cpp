#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>

#include "bot/bot_loop.hpp"
#include "bot/command_router.hpp"
#include "core/config.hpp"
#include "core/database.hpp"
#include "infra/account_client.hpp"
#include "infra/feed_client.hpp"
#include "infra/telegram_client.hpp"
#include "track/tracker.hpp"
#include "track/tracking_poller.hpp"

void print_usage(const char *prog) {
  std::cout << "用法: " << prog << " --config <config.json>" << std::endl;
}

int run(const Config &config) {
  std::cout << "[Main] DB Path: " << config.db_path << std::endl;
  std::cout << "[Main] Feed: " << config.feed_url << std::endl;
  std::cout << "[Main] Poll Interval: " << config.poll_interval_seconds << "s" << std::endl;
  std::cout << "[Main] Page Size: " << config.feed_page_size << std::endl;
  std::cout << "[Main] Detect Mode: " << config.detect_mode << std::endl;

  Database db(config.db_path);
  if (!db.try_instance_lock()) {
    std::cerr << "[Main] 另一个进程正在使用 " << config.db_path << ", 退出" << std::endl;
    return 1;
  }
  db.init_schema();
  std::cout << "[Main] 已跟踪地址: " << db.count() << std::endl;

  // 每个线程独立的 HTTP 句柄
  KaiascanFeed poller_feed(config.feed_url, config.feed_api_key, config.feed_timeout_seconds);
  KaiascanFeed command_feed(config.feed_url, config.feed_api_key, config.feed_timeout_seconds);
  KaiascanAccounts accounts(config.feed_url, config.feed_api_key, config.feed_timeout_seconds);
  TelegramClient notifier(config.telegram_api_url, config.bot_token, config.feed_timeout_seconds);
  TelegramClient bot_client(config.telegram_api_url, config.bot_token, config.feed_timeout_seconds);

  TrackingPoller::Options options;
  options.interval_seconds = config.poll_interval_seconds;
  options.backoff_seconds = config.sweep_backoff_seconds;
  options.page_size = config.feed_page_size;
  options.mode = detect::mode_from_string(config.detect_mode);
  options.explorer_tx_url = config.explorer_tx_url;

  TrackingPoller poller(
      db, poller_feed,
      [&notifier](const std::string &subscriber, const std::string &message) {
        notifier.send_message(subscriber, message);
      },
      options);

  Tracker tracker(db, command_feed);
  CommandRouter router(tracker, accounts);
  BotLoop bot(bot_client, router, config.bot_poll_timeout_seconds);

  // 轮询与命令各用单独的 io_context 和线程
  boost::asio::io_context poll_ioc;
  poller.start(poll_ioc);
  std::thread poll_thread([&poll_ioc]() { poll_ioc.run(); });

  boost::asio::io_context bot_ioc;
  bot.start(bot_ioc);
  std::thread bot_thread([&bot_ioc]() { bot_ioc.run(); });

  boost::asio::io_context main_ioc;
  boost::asio::signal_set signals(main_ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &, int) {
    std::cout << "\n[Main] 正在关闭..." << std::endl;
    poller.stop();
    bot.stop();
  });

  std::cout << "[Main] 服务已启动" << std::endl;
  main_ioc.run();

  std::cout << "[Main] 等待轮询结束..." << std::endl;
  poll_thread.join();
  std::cout << "[Main] 等待命令线程结束..." << std::endl;
  bot_thread.join();

  std::cout << "[Main] 已退出" << std::endl;
  return 0;
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  std::cout << "========================================" << std::endl;
  std::cout << "    Kaia Address Watch" << std::endl;
  std::cout << "========================================" << std::endl;

  try {
    Config config = Config::load(config_path);
    return run(config);
  } catch (const std::exception &e) {
    std::cerr << "[Main] 启动失败: " << e.what() << std::endl;
    return 1;
  }
}
