#include "internal/db/sql/codec.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/db/sql/schema.hpp"

namespace {

using modstore::db::sql::DecodeRetractions;
using modstore::db::sql::EncodeRetractions;
using modstore::db::sql::JoinLines;
using modstore::db::sql::SplitLines;

void TestLines() {
  assert(JoinLines({}).empty());
  assert(SplitLines("").empty());
  assert(JoinLines({"MIT", "BSD-3-Clause"}) == "MIT\nBSD-3-Clause");
  assert(SplitLines("MIT\nBSD-3-Clause") == (std::vector<std::string>{"MIT", "BSD-3-Clause"}));

  // embedded newlines cannot split an element
  auto lines = SplitLines(JoinLines({"a\nb", "c"}));
  assert(lines.size() == 2);
  assert(lines[0] == "a b");
}

void TestRetractions() {
  auto text = EncodeRetractions({{"v1.0.0", "", "tab\tin rationale"}, {"v0.1.0", "v0.2.0", ""}});
  assert(text == "v1.0.0\t\ttab in rationale\nv0.1.0\tv0.2.0\t");

  auto ranges = DecodeRetractions(text);
  assert(ranges.size() == 2);
  assert(ranges[0].low == "v1.0.0");
  assert(ranges[0].high.empty());
  assert(ranges[0].rationale == "tab in rationale");
  assert(ranges[1].high == "v0.2.0");
  assert(ranges[1].rationale.empty());

  auto bare = DecodeRetractions("v2.0.0");
  assert(bare.size() == 1);
  assert(bare[0].low == "v2.0.0");
  assert(bare[0].high.empty());
}

void TestSchemasCoverTheSameTables() {
  const std::vector<std::string> tables{"modules",  "paths",         "units",          "licenses",
                                        "readmes",  "documentation", "package_imports", "latest_module_versions",
                                        "imports_unique", "search_documents", "symbol_history", "module_version_states",
                                        "alternative_module_paths", "version_map"};
  for (const auto* schema : {&modstore::db::sql::SqliteSchema(), &modstore::db::sql::PostgresSchema()}) {
    for (const auto& table : tables) {
      bool found = false;
      for (const auto& stmt : *schema) {
        if (stmt.find("CREATE TABLE IF NOT EXISTS " + table + " ") != std::string::npos ||
            stmt.find("CREATE TABLE IF NOT EXISTS " + table + "(") != std::string::npos) {
          found = true;
        }
      }
      assert(found);
    }
  }
}

} // namespace

int main() {
  TestLines();
  TestRetractions();
  TestSchemasCoverTheSameTables();

  std::cout << "modstore_unit_sql_codec: pass\n";
  return 0;
}
