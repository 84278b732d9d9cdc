#include "internal/db/sql/migrations.hpp"

#include "internal/observability/logging.hpp"

namespace modstore::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
  MODSTORE_LOG_DEBUG("schema migrations applied",
                     {observability::IntField("statements", static_cast<int64_t>(ordered_sql.size()))});
}

} // namespace modstore::db::sql
