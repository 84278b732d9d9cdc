#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/status.hpp"
#include "internal/queue/backoff.hpp"
#include "internal/util/time.hpp"

namespace modstore::queue {

struct QueueOptions {
  int64_t       large_module_package_threshold = 1500;
  std::size_t   large_modules_limit            = 100;
  BackoffPolicy backoff;
  std::string   app_version;
};

struct PendingItem {
  std::string            module_path;
  std::string            version;
  int32_t                status    = 0;
  int32_t                try_count = 0;
  std::optional<int64_t> num_packages;
};

struct RecordDetail {
  std::string            error;
  std::optional<int64_t> num_packages;
  std::string            canonical_path;    // set with kAlternativePath
  std::string            requested_version; // version the caller asked for, when it differs
};

/*
  WorkQueue

  Durable per-(module, version) processing state with retry scheduling.

  Every Record reschedules the item with exponential backoff, whatever the
  status. Only status 0 and statuses >= 500 are ever dequeued again.
*/
class WorkQueue {
 public:
  WorkQueue(std::shared_ptr<db::Repository> repository, QueueOptions options, util::NowFn now = util::Now);

  // Returns false when the version is already known.
  bool Enqueue(const std::string& module_path, const std::string& version,
               std::optional<int64_t> num_packages = std::nullopt);

  void Record(const std::string& module_path, const std::string& version, model::VersionStatus status,
              const RecordDetail& detail = {});

  // Records inside the caller's transaction.
  void Record(db::Transaction& tx, const std::string& module_path, const std::string& version,
              model::VersionStatus status, const RecordDetail& detail = {});

  std::vector<PendingItem> NextBatch(std::size_t limit);

  // Returns the number of states reset.
  uint64_t ResetForReprocessing(const std::string& app_version_cutoff);

  // Throws util::NotFound.
  db::model::VersionStateRecord GetState(const std::string& module_path, const std::string& version);

  const QueueOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  QueueOptions                    options_;
  util::NowFn                     now_;
};

} // namespace modstore::queue
