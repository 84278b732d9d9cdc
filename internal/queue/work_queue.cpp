#include "internal/queue/work_queue.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/version/version.hpp"

namespace modstore::queue {
namespace {

using db::model::VersionStateRecord;

constexpr model::VersionStatus kResettable[] = {
    model::VersionStatus::kSuccess,    model::VersionStatus::kHasIncompletePackages,
    model::VersionStatus::kValidationFailure, model::VersionStatus::kBadModule,
    model::VersionStatus::kAlternativePath,
};

bool IsRelease(const std::string& v) {
  return version::ParseType(v) == version::Type::kRelease;
}

// Latest among the known states of one module: compatible first, then
// releases, then the highest sort key.
bool PreferredAsLatest(const VersionStateRecord& a, const VersionStateRecord& b) {
  return std::make_tuple(!a.incompatible, IsRelease(a.version), a.sort_version) >
         std::make_tuple(!b.incompatible, IsRelease(b.version), b.sort_version);
}

struct Candidate {
  const VersionStateRecord* state;
  int                       bucket;
};

} // namespace

WorkQueue::WorkQueue(std::shared_ptr<db::Repository> repository, QueueOptions options, util::NowFn now)
    : repository_(std::move(repository)), options_(std::move(options)), now_(std::move(now)) {
}

bool WorkQueue::Enqueue(const std::string& module_path, const std::string& version,
                        std::optional<int64_t> num_packages) {
  version::ParseType(version);

  auto tx = repository_->Begin();
  if (repository_->GetVersionState(*tx, module_path, version)) {
    tx->Rollback();
    return false;
  }

  const auto now_ms = util::ToUnixMillis(now_());

  VersionStateRecord state;
  state.module_path             = module_path;
  state.version                 = version;
  state.sort_version            = version::ForSorting(version);
  state.incompatible            = version::IsIncompatible(version);
  state.app_version             = options_.app_version;
  state.status                  = model::ToCode(model::VersionStatus::kNew);
  state.next_processed_after_ms = now_ms;
  state.num_packages            = num_packages;
  state.created_at_ms           = now_ms;

  db::ThrowIfError(repository_->UpsertVersionState(*tx, state), "enqueue " + module_path + "@" + version);
  tx->Commit();

  MODSTORE_LOG_DEBUG("version enqueued",
                     {observability::ModuleField(module_path, version)});
  return true;
}

void WorkQueue::Record(const std::string& module_path, const std::string& version, model::VersionStatus status,
                       const RecordDetail& detail) {
  auto tx = repository_->Begin();
  Record(*tx, module_path, version, status, detail);
  tx->Commit();
}

void WorkQueue::Record(db::Transaction& tx, const std::string& module_path, const std::string& version,
                       model::VersionStatus status, const RecordDetail& detail) {
  const auto now_ms  = util::ToUnixMillis(now_());
  const auto context = module_path + "@" + version;

  VersionStateRecord state;
  if (auto existing = repository_->GetVersionState(tx, module_path, version)) {
    state = std::move(*existing);
  } else {
    state.module_path   = module_path;
    state.version       = version;
    state.sort_version  = version::ForSorting(version);
    state.incompatible  = version::IsIncompatible(version);
    state.created_at_ms = now_ms;
  }

  state.next_processed_after_ms =
      NextProcessedAfter(options_.backoff, state.last_processed_at_ms, state.next_processed_after_ms, now_ms);
  state.last_processed_at_ms = now_ms;
  state.status               = model::ToCode(status);
  state.error                = detail.error;
  state.app_version          = options_.app_version;
  state.try_count += 1;
  if (detail.num_packages) {
    state.num_packages = detail.num_packages;
  }

  db::ThrowIfError(repository_->UpsertVersionState(tx, state), "record " + context);

  db::model::VersionMapRecord mapping;
  mapping.module_path       = module_path;
  mapping.requested_version = detail.requested_version.empty() ? version : detail.requested_version;
  mapping.resolved_version  = version;
  mapping.status            = state.status;
  mapping.error             = detail.error;
  mapping.sort_version      = state.sort_version;
  mapping.updated_at_ms     = now_ms;
  db::ThrowIfError(repository_->UpsertVersionMap(tx, mapping), "record version map " + context);

  if (status == model::VersionStatus::kAlternativePath) {
    db::ThrowIfError(repository_->DeleteSearchDocuments(tx, module_path), "delete search documents " + module_path);
    if (!detail.canonical_path.empty()) {
      db::ThrowIfError(repository_->UpsertAlternativeModulePath(tx, {module_path, detail.canonical_path}),
                       "record alternative path " + module_path);
    }
  }

  MODSTORE_LOG_INFO("version state recorded",
                    {observability::ModuleField(module_path, version),
                     observability::StatusField(status),
                     observability::IntField("try_count", state.try_count),
                     observability::IntField("next_processed_after_ms", static_cast<int64_t>(state.next_processed_after_ms))});
}

std::vector<PendingItem> WorkQueue::NextBatch(std::size_t limit) {
  std::vector<PendingItem> out;
  if (limit == 0) {
    return out;
  }

  const auto now_ms = util::ToUnixMillis(now_());
  auto       tx     = repository_->Begin();
  auto       states = repository_->ListEligibleVersionStates(*tx, now_ms);

  std::map<std::string, std::string> latest_by_module;
  for (const auto& s : states) {
    if (latest_by_module.count(s.module_path)) {
      continue;
    }
    auto all  = repository_->ListVersionStates(*tx, s.module_path);
    auto best = std::min_element(all.begin(), all.end(), PreferredAsLatest);
    if (best != all.end()) {
      latest_by_module[s.module_path] = best->version;
    }
  }
  tx->Commit();

  std::vector<Candidate> candidates;
  candidates.reserve(states.size());
  for (const auto& s : states) {
    if (s.next_processed_after_ms > now_ms) {
      continue;
    }
    const bool small  = s.num_packages.value_or(0) < options_.large_module_package_threshold;
    const bool latest = latest_by_module[s.module_path] == s.version;
    int        bucket = 4;
    if (small && latest && IsRelease(s.version)) {
      bucket = 1;
    } else if (small && latest) {
      bucket = 2;
    } else if (small) {
      bucket = 3;
    }
    candidates.push_back({&s, bucket});
  }

  std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    const auto an = a.state->num_packages.value_or(0);
    const auto bn = b.state->num_packages.value_or(0);
    if (a.bucket != b.bucket) return a.bucket < b.bucket;
    if (an != bn) return an < bn;
    if (a.state->sort_version != b.state->sort_version) return a.state->sort_version > b.state->sort_version;
    return a.state->module_path < b.state->module_path;
  });

  std::set<std::string> seen_modules;
  std::size_t           large = 0;

  auto take = [&](const Candidate& c) {
    if (c.bucket == 4) {
      if (large >= options_.large_modules_limit) return;
      ++large;
    }
    seen_modules.insert(c.state->module_path);
    out.push_back({c.state->module_path, c.state->version, c.state->status, c.state->try_count,
                   c.state->num_packages});
  };

  // Buckets 1-2 take each module path at most once. Once they are exhausted
  // a module may repeat, so a small non-latest version still precedes every
  // oversized one.
  for (const auto& c : candidates) {
    if (out.size() >= limit) break;
    if (c.bucket <= 2) {
      if (!seen_modules.count(c.state->module_path)) take(c);
      continue;
    }
    take(c);
  }

  observability::Metrics::Instance().ObserveQueueBatchSize(out.size());
  return out;
}

uint64_t WorkQueue::ResetForReprocessing(const std::string& app_version_cutoff) {
  const auto now_ms = util::ToUnixMillis(now_());
  uint64_t   total  = 0;

  auto tx = repository_->Begin();
  for (auto from : kResettable) {
    uint64_t affected = 0;
    db::ThrowIfError(repository_->ResetVersionStates(*tx, app_version_cutoff, model::ToCode(from),
                                                     model::ToCode(model::ToReprocessStatus(from)), now_ms, affected),
                     std::string("reset ") + model::StatusName(from));
    total += affected;
  }
  tx->Commit();

  MODSTORE_LOG_INFO("versions reset for reprocessing", {observability::StringField("app_version_cutoff", app_version_cutoff),
                                                        observability::IntField("count", static_cast<int64_t>(total))});
  return total;
}

db::model::VersionStateRecord WorkQueue::GetState(const std::string& module_path, const std::string& version) {
  auto tx    = repository_->Begin();
  auto state = repository_->GetVersionState(*tx, module_path, version);
  tx->Commit();
  if (!state) {
    throw util::NotFound("no state for " + module_path + "@" + version);
  }
  return *state;
}

} // namespace modstore::queue
