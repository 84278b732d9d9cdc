#include "internal/lock/module_lock.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace modstore::lock {

int64_t ModuleLockKey(std::string_view module_path) {
  constexpr uint64_t kOffsetBasis = 14695981039346656037ULL;
  constexpr uint64_t kPrime       = 1099511628211ULL;

  uint64_t hash = kOffsetBasis;
  for (unsigned char c : module_path) {
    hash *= kPrime;
    hash ^= c;
  }
  return static_cast<int64_t>(hash);
}

void WithModuleLock(db::Repository& repository, db::Transaction* tx, std::string_view module_path,
                    const std::function<void()>& fn) {
  if (tx == nullptr || !tx->IsActive()) {
    throw util::NotInTransaction("module lock for " + std::string(module_path) + ": not in a transaction");
  }

  const auto key = ModuleLockKey(module_path);
  MODSTORE_LOG_DEBUG("acquiring module lock", {observability::ModuleField(module_path),
                                                observability::IntField("key", key)});
  db::ThrowIfError(repository.AcquireAdvisoryLock(*tx, key), "acquire module lock " + std::string(module_path));
  fn();
}

} // namespace modstore::lock
