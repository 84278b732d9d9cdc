#include "internal/retention/retention_sweeper.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace modstore::retention {

RetentionSweeper::RetentionSweeper(std::shared_ptr<db::Repository>             repository,
                                   std::shared_ptr<core::IngestionCoordinator> coordinator,
                                   std::shared_ptr<queue::WorkQueue> queue, RetentionOptions options, util::NowFn now)
    : repository_(std::move(repository)),
      coordinator_(std::move(coordinator)),
      queue_(std::move(queue)),
      options_(std::move(options)),
      now_(std::move(now)) {
}

std::vector<SweepCandidate> RetentionSweeper::FindCandidates(std::size_t limit) {
  std::vector<SweepCandidate> out;
  const auto                  cutoff = util::ToUnixMillis(now_() - options_.min_age);

  auto tx = repository_->Begin();
  for (const auto& m : repository_->ListPseudoVersionsUpdatedBefore(*tx, cutoff)) {
    if (out.size() >= limit) break;

    auto latest = repository_->GetLatestModuleVersions(*tx, m.module_path);
    if (latest && latest->good_version == m.version) continue;

    auto docs = repository_->ListSearchDocuments(*tx, m.module_path);
    if (std::any_of(docs.begin(), docs.end(), [&](const auto& d) { return d.version == m.version; })) continue;

    bool pinned = false;
    for (const auto& requested : options_.pinned_versions) {
      auto mapped = repository_->GetVersionMap(*tx, m.module_path, requested);
      if (mapped && mapped->resolved_version == m.version) {
        pinned = true;
        break;
      }
    }
    if (pinned) continue;

    out.push_back({m.module_path, m.version});
  }
  tx->Commit();
  return out;
}

bool RetentionSweeper::Clean(const SweepCandidate& c, const std::string& reason) {
  try {
    auto tx = repository_->Begin();
    queue_->Record(*tx, c.module_path, c.version, model::VersionStatus::kCleaned, {reason});
    coordinator_->DeleteModuleVersion(*tx, c.module_path, c.version);
    tx->Commit();
  } catch (const util::TransientStoreFailure& e) {
    MODSTORE_LOG_WARN("clean deferred", {observability::ModuleField(c.module_path, c.version),
                                         observability::ErrorField(e.what())});
    return false;
  } catch (const util::NotFound& e) {
    MODSTORE_LOG_WARN("clean skipped, version already gone", {observability::ModuleField(c.module_path, c.version),
                                                              observability::ErrorField(e.what())});
    return false;
  }
  coordinator_->InvalidateCached(c.module_path);
  return true;
}

std::size_t RetentionSweeper::Sweep(std::size_t limit, const std::string& reason) {
  observability::SpanScope span("modstore.retention.sweep");

  std::size_t cleaned = 0;
  for (const auto& c : FindCandidates(limit)) {
    if (Clean(c, reason)) ++cleaned;
  }

  observability::Metrics::Instance().RecordCleanedVersions(cleaned);
  MODSTORE_LOG_INFO("retention sweep finished", {observability::StringField("reason", reason),
                                                 observability::IntField("cleaned", static_cast<int64_t>(cleaned))});
  return cleaned;
}

std::size_t RetentionSweeper::CleanModule(const std::string& module_path, const std::string& reason) {
  std::vector<db::model::ModuleRecord> versions;
  {
    auto tx  = repository_->Begin();
    versions = repository_->ListModuleVersions(*tx, module_path);
    tx->Commit();
  }

  std::size_t cleaned = 0;
  for (const auto& m : versions) {
    if (Clean({m.module_path, m.version}, reason)) ++cleaned;
  }

  observability::Metrics::Instance().RecordCleanedVersions(cleaned);
  MODSTORE_LOG_INFO("module cleaned", {observability::ModuleField(module_path),
                                       observability::StringField("reason", reason),
                                       observability::IntField("cleaned", static_cast<int64_t>(cleaned))});
  return cleaned;
}

} // namespace modstore::retention
