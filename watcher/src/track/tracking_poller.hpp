#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

#include "../core/errors.hpp"
#include "../core/track_store.hpp"
#include "../infra/feed_client.hpp"
#include "change_detector.hpp"
#include "notification_formatter.hpp"

namespace asio = boost::asio;

struct SweepStats {
  size_t rows = 0;
  size_t addresses = 0;
  size_t notified = 0;
  size_t feed_failures = 0;
  size_t tx_failures = 0;
};

// ============================================================================
// TrackingPoller - 周期性 sweep 所有跟踪地址
//
// 容错分三层:
//   交易级 - 渲染/推送/checkpoint 写入失败: 该行本轮停止, 下一轮从失败交易重试
//   地址级 - feed 失败: 跳过该地址
//   sweep 级 - 其他异常: 记录后退避重试, 循环永不退出
// ============================================================================
class TrackingPoller {
public:
  using Dispatch = std::function<void(const std::string &subscriber, const std::string &message)>;

  struct Options {
    int interval_seconds = 60;
    int backoff_seconds = 5;
    int page_size = 25;
    detect::Mode mode = detect::Mode::HashAnchored;
    std::string explorer_tx_url = notify::DEFAULT_EXPLORER_TX_URL;
  };

  TrackingPoller(TrackStore &store, TransactionFeed &feed, Dispatch dispatch, Options options)
      : store_(store), feed_(feed), dispatch_(std::move(dispatch)), options_(std::move(options)) {}

  void start(asio::io_context &ioc) {
    ioc_ = &ioc;
    timer_ = std::make_unique<asio::steady_timer>(ioc);
    std::cout << "[Poller] 开始轮询, 间隔: " << options_.interval_seconds << " 秒" << std::endl;
    schedule_at(std::chrono::steady_clock::now());
  }

  // 当前交易提交完成后停止, 不再调度
  void stop() {
    stopping_ = true;
    if (ioc_) {
      asio::post(*ioc_, [this]() {
        if (timer_)
          timer_->cancel();
      });
    }
  }

  bool is_sweeping() const { return sweeping_; }
  int64_t sweep_count() const { return sweep_count_; }

  // 一轮完整 sweep; 只有读取快照失败会抛出
  SweepStats sweep() {
    SweepStats stats;
    sweeping_ = true;
    auto rows = store_.all_tracked();
    stats.rows = rows.size();

    // 同一地址被多人跟踪时, 本轮只拉一次
    std::map<std::string, std::optional<std::vector<RawTransaction>>> pages;

    for (const auto &row : rows) {
      if (stopping_)
        break;

      auto it = pages.find(row.address);
      if (it == pages.end()) {
        it = pages.emplace(row.address, fetch(row.address)).first;
        ++stats.addresses;
        if (!it->second)
          ++stats.feed_failures;
      }
      if (!it->second)
        continue;

      process_row(row, *it->second, stats);
    }

    sweeping_ = false;
    ++sweep_count_;
    return stats;
  }

private:
  void schedule_at(std::chrono::steady_clock::time_point when) {
    timer_->expires_at(when);
    timer_->async_wait([this](boost::system::error_code ec) {
      if (!ec && !stopping_) {
        on_tick();
      }
    });
  }

  void on_tick() {
    auto start = std::chrono::steady_clock::now();
    auto next = start + std::chrono::seconds(options_.interval_seconds);

    try {
      SweepStats stats = sweep();
      auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - start)
                            .count();
      std::cout << "[Poller] sweep 完成: rows=" << stats.rows << ", addresses=" << stats.addresses
                << ", notified=" << stats.notified << ", feed_failures=" << stats.feed_failures
                << ", tx_failures=" << stats.tx_failures << ", 耗时 " << elapsed_ms << "ms"
                << std::endl;
    } catch (const std::exception &e) {
      sweeping_ = false;
      std::cerr << "[Poller] sweep 异常: " << e.what() << ", " << options_.backoff_seconds
                << "s 后重试" << std::endl;
      next = std::chrono::steady_clock::now() + std::chrono::seconds(options_.backoff_seconds);
    }

    if (stopping_) {
      std::cout << "[Poller] 已停止" << std::endl;
      return;
    }
    schedule_at(next);
  }

  std::optional<std::vector<RawTransaction>> fetch(const std::string &address) {
    try {
      return feed_.history(address, 1, options_.page_size);
    } catch (const std::exception &e) {
      std::cerr << "[Poller] 拉取 " << address << " 失败: " << e.what() << std::endl;
      return std::nullopt;
    }
  }

  void process_row(const TrackedAddress &row, const std::vector<RawTransaction> &page,
                   SweepStats &stats) {
    auto fresh = detect::find_new(page, row.checkpoint, options_.mode);
    if (fresh.empty())
      return;

    std::optional<std::string> label;
    if (row.label != row.address)
      label = row.label;

    for (const auto &item : fresh) {
      try {
        std::string message = notify::render(item.tx, label, options_.explorer_tx_url);
        dispatch_(row.subscriber_id, message);
      } catch (const std::exception &e) {
        std::cerr << "[Poller] 推送 " << item.tx.hash << " 给 " << row.subscriber_id
                  << " 失败: " << e.what() << std::endl;
        ++stats.tx_failures;
        return;
      }

      try {
        store_.advance_checkpoint(row.subscriber_id, row.address, item.after);
      } catch (const StoreFailure &e) {
        std::cerr << "[Poller] 更新 checkpoint " << row.address << " -> " << item.tx.hash
                  << " 失败: " << e.what() << std::endl;
        ++stats.tx_failures;
        return;
      }
      ++stats.notified;

      if (stopping_)
        return;
    }
  }

  TrackStore &store_;
  TransactionFeed &feed_;
  Dispatch dispatch_;
  Options options_;

  asio::io_context *ioc_ = nullptr;
  std::unique_ptr<asio::steady_timer> timer_;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> sweeping_{false};
  std::atomic<int64_t> sweep_count_{0};
};
