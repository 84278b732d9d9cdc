#include "internal/db/sql/schema.hpp"

namespace modstore::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS paths (id INTEGER PRIMARY KEY AUTOINCREMENT, path TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS modules (id INTEGER PRIMARY KEY AUTOINCREMENT, module_path TEXT NOT NULL, version TEXT NOT NULL, "
      "sort_version TEXT NOT NULL, version_type TEXT NOT NULL, series_path TEXT NOT NULL, commit_time_ms INTEGER NOT NULL, "
      "incompatible INTEGER NOT NULL, has_manifest INTEGER NOT NULL, redistributable INTEGER NOT NULL, source_info TEXT NOT NULL, "
      "updated_at_ms INTEGER NOT NULL, UNIQUE(module_path, version));",
      "CREATE TABLE IF NOT EXISTS units (id INTEGER PRIMARY KEY AUTOINCREMENT, module_id INTEGER NOT NULL REFERENCES modules(id) ON DELETE CASCADE, "
      "path_id INTEGER NOT NULL REFERENCES paths(id), path TEXT NOT NULL, v1_path TEXT NOT NULL, name TEXT NOT NULL, "
      "redistributable INTEGER NOT NULL, license_types TEXT NOT NULL, license_paths TEXT NOT NULL, UNIQUE(module_id, path_id));",
      "CREATE TABLE IF NOT EXISTS licenses (module_id INTEGER NOT NULL REFERENCES modules(id) ON DELETE CASCADE, file_path TEXT NOT NULL, "
      "types TEXT NOT NULL, contents TEXT NOT NULL, redistributable INTEGER NOT NULL, PRIMARY KEY(module_id, file_path));",
      "CREATE TABLE IF NOT EXISTS readmes (unit_id INTEGER PRIMARY KEY REFERENCES units(id) ON DELETE CASCADE, file_path TEXT NOT NULL, "
      "contents TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS documentation (unit_id INTEGER NOT NULL REFERENCES units(id) ON DELETE CASCADE, os TEXT NOT NULL, "
      "arch TEXT NOT NULL, synopsis TEXT NOT NULL, html TEXT NOT NULL, PRIMARY KEY(unit_id, os, arch));",
      "CREATE TABLE IF NOT EXISTS package_imports (unit_id INTEGER NOT NULL REFERENCES units(id) ON DELETE CASCADE, to_path TEXT NOT NULL, "
      "PRIMARY KEY(unit_id, to_path));",
      "CREATE TABLE IF NOT EXISTS latest_module_versions (module_path TEXT PRIMARY KEY, raw_version TEXT NOT NULL, cooked_version TEXT NOT NULL, "
      "good_version TEXT NOT NULL, retractions TEXT NOT NULL, deprecated INTEGER NOT NULL, deprecation_comment TEXT NOT NULL, "
      "status INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS imports_unique (from_path TEXT NOT NULL, from_module_path TEXT NOT NULL, to_path TEXT NOT NULL, "
      "PRIMARY KEY(from_path, from_module_path, to_path));",
      "CREATE INDEX IF NOT EXISTS imports_unique_from_module_idx ON imports_unique(from_module_path);",
      "CREATE TABLE IF NOT EXISTS search_documents (package_path TEXT PRIMARY KEY, module_path TEXT NOT NULL, version TEXT NOT NULL, "
      "name TEXT NOT NULL, synopsis TEXT NOT NULL, license_types TEXT NOT NULL, redistributable INTEGER NOT NULL, "
      "commit_time_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS search_documents_module_idx ON search_documents(module_path);",
      "CREATE TABLE IF NOT EXISTS symbol_history (package_path TEXT NOT NULL, symbol_name TEXT NOT NULL, parent_name TEXT NOT NULL, "
      "os TEXT NOT NULL, arch TEXT NOT NULL, module_path TEXT NOT NULL, since_version TEXT NOT NULL, sort_version TEXT NOT NULL, "
      "kind TEXT NOT NULL, synopsis TEXT NOT NULL, PRIMARY KEY(package_path, symbol_name, parent_name, os, arch));",
      "CREATE TABLE IF NOT EXISTS module_version_states (module_path TEXT NOT NULL, version TEXT NOT NULL, sort_version TEXT NOT NULL, "
      "incompatible INTEGER NOT NULL, app_version TEXT NOT NULL, status INTEGER NOT NULL, error TEXT NOT NULL, try_count INTEGER NOT NULL, "
      "last_processed_at_ms INTEGER, next_processed_after_ms INTEGER NOT NULL, num_packages INTEGER, created_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY(module_path, version));",
      "CREATE INDEX IF NOT EXISTS module_version_states_next_idx ON module_version_states(next_processed_after_ms);",
      "CREATE TABLE IF NOT EXISTS alternative_module_paths (alternative TEXT PRIMARY KEY, canonical TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS version_map (module_path TEXT NOT NULL, requested_version TEXT NOT NULL, resolved_version TEXT NOT NULL, "
      "status INTEGER NOT NULL, manifest_path TEXT NOT NULL, error TEXT NOT NULL, sort_version TEXT NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY(module_path, requested_version));",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS paths (id BIGSERIAL PRIMARY KEY, path TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS modules (id BIGSERIAL PRIMARY KEY, module_path TEXT NOT NULL, version TEXT NOT NULL, "
      "sort_version TEXT NOT NULL COLLATE \"C\", version_type TEXT NOT NULL, series_path TEXT NOT NULL, commit_time_ms BIGINT NOT NULL, "
      "incompatible BOOLEAN NOT NULL, has_manifest BOOLEAN NOT NULL, redistributable BOOLEAN NOT NULL, source_info TEXT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL, UNIQUE(module_path, version));",
      "CREATE TABLE IF NOT EXISTS units (id BIGSERIAL PRIMARY KEY, module_id BIGINT NOT NULL REFERENCES modules(id) ON DELETE CASCADE, "
      "path_id BIGINT NOT NULL REFERENCES paths(id), path TEXT NOT NULL, v1_path TEXT NOT NULL, name TEXT NOT NULL, "
      "redistributable BOOLEAN NOT NULL, license_types TEXT NOT NULL, license_paths TEXT NOT NULL, UNIQUE(module_id, path_id));",
      "CREATE TABLE IF NOT EXISTS licenses (module_id BIGINT NOT NULL REFERENCES modules(id) ON DELETE CASCADE, file_path TEXT NOT NULL, "
      "types TEXT NOT NULL, contents TEXT NOT NULL, redistributable BOOLEAN NOT NULL, PRIMARY KEY(module_id, file_path));",
      "CREATE TABLE IF NOT EXISTS readmes (unit_id BIGINT PRIMARY KEY REFERENCES units(id) ON DELETE CASCADE, file_path TEXT NOT NULL, "
      "contents TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS documentation (unit_id BIGINT NOT NULL REFERENCES units(id) ON DELETE CASCADE, os TEXT NOT NULL, "
      "arch TEXT NOT NULL, synopsis TEXT NOT NULL, html TEXT NOT NULL, PRIMARY KEY(unit_id, os, arch));",
      "CREATE TABLE IF NOT EXISTS package_imports (unit_id BIGINT NOT NULL REFERENCES units(id) ON DELETE CASCADE, to_path TEXT NOT NULL, "
      "PRIMARY KEY(unit_id, to_path));",
      "CREATE TABLE IF NOT EXISTS latest_module_versions (module_path TEXT PRIMARY KEY, raw_version TEXT NOT NULL, cooked_version TEXT NOT NULL, "
      "good_version TEXT NOT NULL, retractions TEXT NOT NULL, deprecated BOOLEAN NOT NULL, deprecation_comment TEXT NOT NULL, "
      "status INTEGER NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS imports_unique (from_path TEXT NOT NULL, from_module_path TEXT NOT NULL, to_path TEXT NOT NULL, "
      "PRIMARY KEY(from_path, from_module_path, to_path));",
      "CREATE INDEX IF NOT EXISTS imports_unique_from_module_idx ON imports_unique(from_module_path);",
      "CREATE TABLE IF NOT EXISTS search_documents (package_path TEXT PRIMARY KEY, module_path TEXT NOT NULL, version TEXT NOT NULL, "
      "name TEXT NOT NULL, synopsis TEXT NOT NULL, license_types TEXT NOT NULL, redistributable BOOLEAN NOT NULL, "
      "commit_time_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS search_documents_module_idx ON search_documents(module_path);",
      "CREATE TABLE IF NOT EXISTS symbol_history (package_path TEXT NOT NULL, symbol_name TEXT NOT NULL, parent_name TEXT NOT NULL, "
      "os TEXT NOT NULL, arch TEXT NOT NULL, module_path TEXT NOT NULL, since_version TEXT NOT NULL, sort_version TEXT NOT NULL COLLATE \"C\", "
      "kind TEXT NOT NULL, synopsis TEXT NOT NULL, PRIMARY KEY(package_path, symbol_name, parent_name, os, arch));",
      "CREATE TABLE IF NOT EXISTS module_version_states (module_path TEXT NOT NULL, version TEXT NOT NULL, sort_version TEXT NOT NULL COLLATE \"C\", "
      "incompatible BOOLEAN NOT NULL, app_version TEXT NOT NULL, status INTEGER NOT NULL, error TEXT NOT NULL, try_count INTEGER NOT NULL, "
      "last_processed_at_ms BIGINT, next_processed_after_ms BIGINT NOT NULL, num_packages BIGINT, created_at_ms BIGINT NOT NULL, "
      "PRIMARY KEY(module_path, version));",
      "CREATE INDEX IF NOT EXISTS module_version_states_next_idx ON module_version_states(next_processed_after_ms);",
      "CREATE TABLE IF NOT EXISTS alternative_module_paths (alternative TEXT PRIMARY KEY, canonical TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS version_map (module_path TEXT NOT NULL, requested_version TEXT NOT NULL, resolved_version TEXT NOT NULL, "
      "status INTEGER NOT NULL, manifest_path TEXT NOT NULL, error TEXT NOT NULL, sort_version TEXT NOT NULL COLLATE \"C\", "
      "updated_at_ms BIGINT NOT NULL, PRIMARY KEY(module_path, requested_version));",
  };
  return kSchema;
}

} // namespace modstore::db::sql
