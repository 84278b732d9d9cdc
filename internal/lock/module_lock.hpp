#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

#include "internal/db/api/repository.hpp"

namespace modstore::lock {

// 64-bit FNV-1 hash of the module path, reinterpreted as signed so it fits
// a database bigint lock key. Collisions only add serialization.
int64_t ModuleLockKey(std::string_view module_path);

/*
  Runs fn while tx holds the exclusive lock for module_path.

  The lock lives as long as the transaction: it is released by Commit() or
  Rollback(), never here. Waiters block; there is no timeout.

  Throws util::NotInTransaction when tx is null or already finished.
*/
void WithModuleLock(db::Repository& repository, db::Transaction* tx, std::string_view module_path,
                    const std::function<void()>& fn);

} // namespace modstore::lock
