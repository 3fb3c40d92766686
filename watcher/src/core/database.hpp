#pragma once

#include <duckdb.hpp>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include <vector>

#include "errors.hpp"
#include "track_store.hpp"

// ============================================================================
// Database - DuckDB 实现的 TrackStore
//
// 读写分两个连接: 写连接由 write_mutex_ 串行化, 读连接由 read_mutex_ 保护。
// 自动提交, 读连接总能看到已提交的写入。
// ============================================================================
class Database : public TrackStore {
public:
  explicit Database(const std::string &path) : db_path_(path) {
    try {
      db_ = std::make_unique<duckdb::DuckDB>(path);
      read_conn_ = std::make_unique<duckdb::Connection>(*db_);
      write_conn_ = std::make_unique<duckdb::Connection>(*db_);
    } catch (const std::exception &e) {
      throw StoreFailure("无法打开数据库 " + path + ": " + e.what());
    }

    if (path != ":memory:") {
      lock_path_ = path + ".lock";
      lock_fd_ = open(lock_path_.c_str(), O_CREAT | O_RDWR, 0666);
      if (lock_fd_ < 0) {
        throw StoreFailure("无法创建锁文件: " + lock_path_);
      }
    }
  }

  ~Database() override {
    if (has_instance_lock_) {
      flock(lock_fd_, LOCK_UN);
    }
    if (lock_fd_ >= 0) {
      close(lock_fd_);
    }
  }

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  // 同一数据库只允许一个进程轮询, 否则会重复推送
  bool try_instance_lock() {
    if (has_instance_lock_ || lock_fd_ < 0)
      return true;
    if (flock(lock_fd_, LOCK_EX | LOCK_NB) == 0) {
      has_instance_lock_ = true;
      return true;
    }
    return false;
  }

  void init_schema() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto result = write_conn_->Query(R"(
      CREATE TABLE IF NOT EXISTS tracked_address (
        subscriber_id TEXT NOT NULL,
        address TEXT NOT NULL,
        label TEXT NOT NULL,
        checkpoint_hash TEXT NOT NULL,
        checkpoint_time BIGINT NOT NULL,
        created_at BIGINT NOT NULL,
        PRIMARY KEY (subscriber_id, address)
      )
    )");
    if (result->HasError()) {
      throw StoreFailure("建表失败: " + result->GetError());
    }
    std::cout << "[DB] 数据库初始化完成: " << db_path_ << std::endl;
  }

  void upsert(const TrackedAddress &row) override {
    std::lock_guard<std::mutex> lock(write_mutex_);
    run(*write_conn_,
        "INSERT OR REPLACE INTO tracked_address "
        "(subscriber_id, address, label, checkpoint_hash, checkpoint_time, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?)",
        {duckdb::Value(row.subscriber_id), duckdb::Value(row.address), duckdb::Value(row.label),
         duckdb::Value(row.checkpoint.hash), duckdb::Value::BIGINT(row.checkpoint.time),
         duckdb::Value::BIGINT(row.created_at)});
  }

  std::vector<AddressEntry> list(const std::string &subscriber) override {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = run(*read_conn_,
                      "SELECT address, label FROM tracked_address WHERE subscriber_id = ? "
                      "ORDER BY created_at, address",
                      {duckdb::Value(subscriber)});

    std::vector<AddressEntry> entries;
    for_each_row(*result, [&](duckdb::DataChunk &chunk, duckdb::idx_t row) {
      entries.push_back({chunk.GetValue(0, row).ToString(), chunk.GetValue(1, row).ToString()});
    });
    return entries;
  }

  bool remove(const std::string &subscriber, const std::string &address,
              const std::string &label) override {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto result = run(*write_conn_,
                      "DELETE FROM tracked_address WHERE subscriber_id = ? "
                      "AND (address = ? OR label = ?)",
                      {duckdb::Value(subscriber), duckdb::Value(address), duckdb::Value(label)});
    return affected_rows(*result) > 0;
  }

  std::vector<TrackedAddress> all_tracked() override {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = run(*read_conn_,
                      "SELECT subscriber_id, address, label, checkpoint_hash, checkpoint_time, "
                      "created_at FROM tracked_address ORDER BY address, subscriber_id",
                      {});
    std::vector<TrackedAddress> rows;
    for_each_row(*result, [&](duckdb::DataChunk &chunk, duckdb::idx_t row) {
      rows.push_back(read_row(chunk, row));
    });
    return rows;
  }

  std::optional<TrackedAddress> find(const std::string &subscriber,
                                     const std::string &address) override {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = run(*read_conn_,
                      "SELECT subscriber_id, address, label, checkpoint_hash, checkpoint_time, "
                      "created_at FROM tracked_address WHERE subscriber_id = ? AND address = ?",
                      {duckdb::Value(subscriber), duckdb::Value(address)});
    std::optional<TrackedAddress> found;
    for_each_row(*result, [&](duckdb::DataChunk &chunk, duckdb::idx_t row) {
      found = read_row(chunk, row);
    });
    return found;
  }

  // UPDATE 不会插入, 行被删除后写入自然落空;
  // 比当前 checkpoint 更早的写入同样落空 (重新 track 与在途 sweep 竞争时)
  void advance_checkpoint(const std::string &subscriber, const std::string &address,
                          const Checkpoint &checkpoint) override {
    std::lock_guard<std::mutex> lock(write_mutex_);
    run(*write_conn_,
        "UPDATE tracked_address SET checkpoint_hash = ?, checkpoint_time = ? "
        "WHERE subscriber_id = ? AND address = ? AND checkpoint_time <= ?",
        {duckdb::Value(checkpoint.hash), duckdb::Value::BIGINT(checkpoint.time),
         duckdb::Value(subscriber), duckdb::Value(address),
         duckdb::Value::BIGINT(checkpoint.time)});
  }

  int64_t count() {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = run(*read_conn_, "SELECT COUNT(*) FROM tracked_address", {});
    int64_t n = 0;
    for_each_row(*result, [&](duckdb::DataChunk &chunk, duckdb::idx_t row) {
      n = chunk.GetValue(0, row).GetValue<int64_t>();
    });
    return n;
  }

private:
  // 调用方持有对应连接的锁
  static std::unique_ptr<duckdb::QueryResult> run(duckdb::Connection &conn, const std::string &sql,
                                                  duckdb::vector<duckdb::Value> params) {
    try {
      auto stmt = conn.Prepare(sql);
      if (stmt->HasError()) {
        throw StoreFailure("SQL 准备失败: " + stmt->GetError());
      }
      auto result = stmt->Execute(params, false);
      if (result->HasError()) {
        throw StoreFailure("SQL 执行失败: " + result->GetError());
      }
      return result;
    } catch (const StoreFailure &) {
      throw;
    } catch (const std::exception &e) {
      throw StoreFailure(std::string("DuckDB 异常: ") + e.what());
    }
  }

  template <typename Fn> static void for_each_row(duckdb::QueryResult &result, Fn &&fn) {
    try {
      while (auto chunk = result.Fetch()) {
        if (chunk->size() == 0)
          break;
        for (duckdb::idx_t row = 0; row < chunk->size(); ++row) {
          fn(*chunk, row);
        }
      }
    } catch (const std::exception &e) {
      throw StoreFailure(std::string("读取结果失败: ") + e.what());
    }
  }

  // DELETE/UPDATE 返回单行 Count
  static int64_t affected_rows(duckdb::QueryResult &result) {
    int64_t n = 0;
    for_each_row(result, [&](duckdb::DataChunk &chunk, duckdb::idx_t row) {
      n = chunk.GetValue(0, row).GetValue<int64_t>();
    });
    return n;
  }

  static TrackedAddress read_row(duckdb::DataChunk &chunk, duckdb::idx_t row) {
    TrackedAddress t;
    t.subscriber_id = chunk.GetValue(0, row).ToString();
    t.address = chunk.GetValue(1, row).ToString();
    t.label = chunk.GetValue(2, row).ToString();
    t.checkpoint.hash = chunk.GetValue(3, row).ToString();
    t.checkpoint.time = chunk.GetValue(4, row).GetValue<int64_t>();
    t.created_at = chunk.GetValue(5, row).GetValue<int64_t>();
    return t;
  }

  // 路径
  std::string db_path_;
  std::string lock_path_;
  // 文件锁
  int lock_fd_ = -1;
  bool has_instance_lock_ = false;
  // DuckDB
  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> read_conn_;
  std::unique_ptr<duckdb::Connection> write_conn_;
  std::mutex read_mutex_;
  std::mutex write_mutex_;
};
