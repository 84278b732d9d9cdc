#include "ingest_worker_pool.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace modstore::worker {

namespace {

std::string Key(const std::string& module_path, const std::string& version) {
  return module_path + "@" + version;
}

bool MissingDocumentation(const model::ModuleGraph& graph) {
  return std::any_of(graph.units.begin(), graph.units.end(),
                     [](const model::Unit& u) { return u.IsPackage() && u.documentation.empty(); });
}

} // namespace

IngestWorkerPool::IngestWorkerPool(std::shared_ptr<queue::WorkQueue>           queue,
                                   std::shared_ptr<core::IngestionCoordinator> coordinator,
                                   std::shared_ptr<fetch::ModuleSource> source, WorkerPoolOptions options)
    : queue_(std::move(queue)),
      coordinator_(std::move(coordinator)),
      source_(std::move(source)),
      options_(options) {
  if (!source_) {
    throw std::invalid_argument("ingest workers need a module source");
  }
  options_.threads    = std::max<std::size_t>(options_.threads, 1);
  options_.batch_size = std::max<std::size_t>(options_.batch_size, 1);
}

IngestWorkerPool::~IngestWorkerPool() {
  Stop();
}

void IngestWorkerPool::Start() {
  if (running_.exchange(true)) return;

  for (std::size_t i = 0; i < options_.threads; ++i) {
    workers_.emplace_back(&IngestWorkerPool::RunWorker, this);
  }
  dispatcher_thread_ = std::thread(&IngestWorkerPool::RunDispatcher, this);

  MODSTORE_LOG_INFO("ingest workers started",
                    {observability::IntField("threads", static_cast<int64_t>(options_.threads)),
                     observability::IntField("batch_size", static_cast<int64_t>(options_.batch_size))});
}

void IngestWorkerPool::Stop() {
  if (!running_.exchange(false)) return;

  {
    std::lock_guard lock(poll_mutex_);
  }
  poll_cv_.notify_all();
  if (dispatcher_thread_.joinable()) dispatcher_thread_.join();

  // workers drain what was already dispatched
  dispatcher_.Shutdown();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();

  MODSTORE_LOG_INFO("ingest workers stopped");
}

model::VersionStatus IngestWorkerPool::ProcessOne(const std::string& module_path, const std::string& version) {
  observability::SpanScope span("modstore.worker.process");
  span.SetAttribute("module_path", module_path);
  span.SetAttribute("version", version);
  observability::ScopedModuleContext log_context(module_path, version);

  model::VersionStatus status = model::VersionStatus::kSuccess;
  queue::RecordDetail  detail;

  try {
    model::ModuleGraph graph;
    bool               fetched = false;
    try {
      graph   = source_->Fetch(module_path, version);
      fetched = true;
    } catch (const util::InvalidModule& e) {
      // the source could not decode what it holds
      status       = model::VersionStatus::kBadModule;
      detail.error = e.what();
    }

    if (fetched) {
      detail.num_packages   = static_cast<int64_t>(graph.PackageCount());
      const bool incomplete = MissingDocumentation(graph);
      coordinator_->Ingest(std::move(graph));
      if (incomplete) status = model::VersionStatus::kHasIncompletePackages;
    }
  } catch (const util::AlternativeModule& e) {
    status                = model::VersionStatus::kAlternativePath;
    detail.error          = e.what();
    detail.canonical_path = e.CanonicalPath();
  } catch (const util::NotFound& e) {
    status       = model::VersionStatus::kNotFound;
    detail.error = e.what();
  } catch (const util::InvalidModule& e) {
    status       = model::VersionStatus::kValidationFailure;
    detail.error = e.what();
  } catch (const util::TransientStoreFailure& e) {
    status       = model::VersionStatus::kSoftFailure;
    detail.error = e.what();
  } catch (const util::NotInTransaction& e) {
    // contract error: nothing is recorded and the caller decides
    span.RecordException(e.what());
    MODSTORE_LOG_ERROR("ingest aborted on contract error", {observability::ErrorField(e.what())});
    throw;
  } catch (const std::exception& e) {
    status       = model::VersionStatus::kSoftFailure;
    detail.error = e.what();
    MODSTORE_LOG_ERROR("ingest failed",
                       {observability::ModuleField(module_path, version), observability::ErrorField(e.what())});
  }

  if (!detail.error.empty()) {
    span.RecordException(detail.error);
  }

  try {
    queue_->Record(module_path, version, status, detail);
  } catch (const std::exception& e) {
    MODSTORE_LOG_ERROR("failed to record version status",
                       {observability::ModuleField(module_path, version),
                        observability::StatusField(status),
                        observability::ErrorField(e.what())});
  }

  observability::Metrics::Instance().RecordIngest(model::StatusName(status));
  return status;
}

std::size_t IngestWorkerPool::PollOnce() {
  std::vector<queue::PendingItem> batch;
  try {
    batch = queue_->NextBatch(options_.batch_size);
  } catch (const util::TransientStoreFailure& e) {
    MODSTORE_LOG_WARN("work queue poll failed", {observability::ErrorField(e.what())});
    return 0;
  }

  std::size_t dispatched = 0;
  for (const auto& item : batch) {
    if (!MarkInFlight(Key(item.module_path, item.version))) continue;
    dispatcher_.Enqueue(item);
    ++dispatched;
  }
  return dispatched;
}

void IngestWorkerPool::RunDispatcher() {
  while (running_) {
    if (dispatcher_.Size() < options_.batch_size) {
      PollOnce();
    }

    std::unique_lock lock(poll_mutex_);
    poll_cv_.wait_for(lock, options_.poll_interval, [&] { return !running_; });
  }
}

void IngestWorkerPool::RunWorker() {
  while (true) {
    auto item = dispatcher_.Dequeue();
    if (!item) break;

    const auto key = Key(item->module_path, item->version);
    try {
      ProcessOne(item->module_path, item->version);
    } catch (const util::NotInTransaction& e) {
      // stays marked in flight so this process never dispatches it again
      MODSTORE_LOG_ERROR("version quarantined", {observability::ModuleField(item->module_path, item->version),
                                                 observability::ErrorField(e.what())});
      continue;
    }
    ClearInFlight(key);
  }
}

bool IngestWorkerPool::MarkInFlight(const std::string& key) {
  std::lock_guard lock(in_flight_mutex_);
  return in_flight_.insert(key).second;
}

void IngestWorkerPool::ClearInFlight(const std::string& key) {
  std::lock_guard lock(in_flight_mutex_);
  in_flight_.erase(key);
}

} // namespace modstore::worker
