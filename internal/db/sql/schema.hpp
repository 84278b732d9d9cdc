#pragma once

#include <string>
#include <vector>

namespace modstore::db::sql {

/*
  DDL for the module store, one statement per entry.

  Both dialects share table and column names. String lists are stored as
  newline-joined TEXT (see codec.hpp).
*/

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace modstore::db::sql
