#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <utility>

#include <boost/asio.hpp>

#include "../infra/telegram_client.hpp"
#include "command_router.hpp"

namespace asio = boost::asio;

// ============================================================================
// BotLoop - getUpdates long poll, 命令交给 CommandRouter, 回复原路发回
// ============================================================================
class BotLoop {
public:
  BotLoop(BotApi &telegram, CommandRouter &router, int poll_timeout_seconds)
      : telegram_(telegram), router_(router), poll_timeout_(poll_timeout_seconds) {}

  void start(asio::io_context &ioc) {
    ioc_ = &ioc;
    timer_ = std::make_unique<asio::steady_timer>(ioc);
    std::cout << "[Bot] 开始接收命令" << std::endl;
    schedule_poll(0);
  }

  // 最多等待当前一次 long poll 返回
  void stop() {
    stopping_ = true;
    if (ioc_) {
      asio::post(*ioc_, [this]() {
        if (timer_)
          timer_->cancel();
      });
    }
  }

private:
  void schedule_poll(int delay_seconds) {
    timer_->expires_after(std::chrono::seconds(delay_seconds));
    timer_->async_wait([this](boost::system::error_code ec) {
      if (!ec && !stopping_) {
        do_poll();
      }
    });
  }

  void do_poll() {
    std::vector<telegram::Update> updates;
    try {
      updates = telegram_.get_updates(offset_, poll_timeout_);
    } catch (const std::exception &e) {
      std::cerr << "[Bot] getUpdates 失败: " << e.what() << ", 5s 后重试" << std::endl;
      if (!stopping_)
        schedule_poll(5);
      return;
    }

    for (const auto &update : updates) {
      offset_ = update.update_id + 1;
      if (update.chat_id.empty() || update.text.empty())
        continue;

      handle_update(update);
    }

    if (!stopping_)
      schedule_poll(0);
  }

  // 单条更新的失败只记日志, 不影响后续更新和轮询
  void handle_update(const telegram::Update &update) {
    try {
      auto reply = router_.handle(update.chat_id, update.text);
      if (reply)
        telegram_.send_message(update.chat_id, *reply);
    } catch (const DispatchFailure &e) {
      std::cerr << "[Bot] 回复 " << update.chat_id << " 失败: " << e.what() << std::endl;
    } catch (const std::exception &e) {
      std::cerr << "[Bot] 处理 update " << update.update_id << " 异常: " << e.what() << std::endl;
    }
  }

  BotApi &telegram_;
  CommandRouter &router_;
  int poll_timeout_;
  int64_t offset_ = 0;

  asio::io_context *ioc_ = nullptr;
  std::unique_ptr<asio::steady_timer> timer_;
  std::atomic<bool> stopping_{false};
};
