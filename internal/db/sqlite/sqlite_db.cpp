#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace modstore::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms)
    : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms > 0 ? busy_timeout_ms : 5000) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
      throw util::TransientStoreFailure(msg);
    }
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets readers in other processes proceed while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // cascades from modules to units and unit content rely on this
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, busy_timeout_ms_), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

Result SqliteDB::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Statement
// ------------------------------------------------------------------

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  ThrowIf(sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr), db_, "sqlite prepare");
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

Statement& Statement::Bind(int idx, const std::string& v) {
  sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
  return *this;
}

Statement& Statement::Bind(int idx, int64_t v) {
  sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
  return *this;
}

Statement& Statement::Bind(int idx, uint64_t v) {
  sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
  return *this;
}

Statement& Statement::Bind(int idx, int32_t v) {
  sqlite3_bind_int(stmt_, idx, v);
  return *this;
}

Statement& Statement::Bind(int idx, bool v) {
  sqlite3_bind_int(stmt_, idx, v ? 1 : 0);
  return *this;
}

Statement& Statement::Bind(int idx, const std::optional<uint64_t>& v) {
  if (v) return Bind(idx, *v);
  sqlite3_bind_null(stmt_, idx);
  return *this;
}

Statement& Statement::Bind(int idx, const std::optional<int64_t>& v) {
  if (v) return Bind(idx, *v);
  sqlite3_bind_null(stmt_, idx);
  return *this;
}

bool Statement::Next() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  ThrowIfError(SqliteDB::Translate(db_, rc), "sqlite step");
  return false;
}

Result Statement::Run() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return Result::Ok();
  return SqliteDB::Translate(db_, rc);
}

Result Statement::Reset() {
  const int rc = sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
  return SqliteDB::Translate(db_, rc);
}

std::string Statement::Text(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

int64_t Statement::Int64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

uint64_t Statement::UInt64(int col) const {
  return static_cast<uint64_t>(sqlite3_column_int64(stmt_, col));
}

int32_t Statement::Int32(int col) const {
  return sqlite3_column_int(stmt_, col);
}

bool Statement::Bool(int col) const {
  return sqlite3_column_int(stmt_, col) != 0;
}

bool Statement::IsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::optional<uint64_t> Statement::OptUInt64(int col) const {
  if (IsNull(col)) return std::nullopt;
  return UInt64(col);
}

std::optional<int64_t> Statement::OptInt64(int col) const {
  if (IsNull(col)) return std::nullopt;
  return Int64(col);
}

} // namespace modstore::db::sqlite
