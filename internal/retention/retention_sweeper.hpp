#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/ingestion_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/queue/work_queue.hpp"
#include "internal/util/time.hpp"

namespace modstore::retention {

struct RetentionOptions {
  std::chrono::hours       min_age{24 * 30};
  std::vector<std::string> pinned_versions{"master", "main"};
};

struct SweepCandidate {
  std::string module_path;
  std::string version;
};

/*
  Removes stale pseudo-versions nobody points at.

  A pseudo-version is kept while it is the good version of its module, backs
  a search row, or is what a pinned branch name last resolved to.
*/
class RetentionSweeper {
 public:
  RetentionSweeper(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::IngestionCoordinator> coordinator,
                   std::shared_ptr<queue::WorkQueue> queue, RetentionOptions options, util::NowFn now = util::Now);

  std::vector<SweepCandidate> FindCandidates(std::size_t limit);

  // Returns the number of versions removed.
  std::size_t Sweep(std::size_t limit, const std::string& reason);

  // Removes every stored version of module_path.
  std::size_t CleanModule(const std::string& module_path, const std::string& reason);

 private:
  bool Clean(const SweepCandidate& candidate, const std::string& reason);

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<core::IngestionCoordinator> coordinator_;
  std::shared_ptr<queue::WorkQueue>           queue_;
  RetentionOptions                            options_;
  util::NowFn                                 now_;
};

} // namespace modstore::retention
