#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"

namespace modstore::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection serves the whole process. TxMutex() serializes transactions
  on it; a thread must not open a second transaction while holding one.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Maps a sqlite result code to a portable one.
  static Result Translate(sqlite3* db, int rc);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
  std::mutex  tx_mutex_;
};

/*
  Prepared statement, finalized on destruction.

  Bind() indexes are 1-based like sqlite3_bind_*; column accessors are
  0-based like sqlite3_column_*.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& Bind(int idx, const std::string& v);
  Statement& Bind(int idx, int64_t v);
  Statement& Bind(int idx, uint64_t v);
  Statement& Bind(int idx, int32_t v);
  Statement& Bind(int idx, bool v);
  Statement& Bind(int idx, const std::optional<uint64_t>& v);
  Statement& Bind(int idx, const std::optional<int64_t>& v);

  template <typename... Args>
  Statement& BindAll(const Args&... args) {
    int idx = 1;
    (Bind(idx++, args), ...);
    return *this;
  }

  // True while rows remain. Throws on failure.
  bool Next();

  // Runs a statement that returns no rows.
  Result Run();

  Result Reset();

  std::string            Text(int col) const;
  int64_t                Int64(int col) const;
  uint64_t               UInt64(int col) const;
  int32_t                Int32(int col) const;
  bool                   Bool(int col) const;
  bool                   IsNull(int col) const;
  std::optional<uint64_t> OptUInt64(int col) const;
  std::optional<int64_t>  OptInt64(int col) const;

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace modstore::db::sqlite
