#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/ingestion_coordinator.hpp"
#include "internal/core/latest_version_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fetch/module_source.hpp"
#include "internal/queue/work_queue.hpp"
#include "internal/retention/retention_sweeper.hpp"
#include "internal/symbols/symbol_history.hpp"

namespace modstore::factory {

/*
  Runtime

  Owns the long-lived components shared by the worker daemon and the CLI.
  source is null when no source directory is configured.
*/
struct Runtime {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<core::LatestVersionCache>     cache;
  std::shared_ptr<core::IngestionCoordinator>   coordinator;
  std::shared_ptr<queue::WorkQueue>             queue;
  std::shared_ptr<retention::RetentionSweeper>  sweeper;
  std::shared_ptr<symbols::SymbolHistoryLedger> ledger;
  std::shared_ptr<fetch::ModuleSource>          source;
};

// Opens the configured backend and bootstraps its schema.
// Memory when no backend is set.
std::shared_ptr<db::Repository> BuildRepository(const modstore::runtime::config::RuntimeConfig& config);

queue::QueueOptions         QueueOptionsFrom(const modstore::runtime::config::RuntimeConfig& config);
retention::RetentionOptions RetentionOptionsFrom(const modstore::runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Composition root. The only place that knows concrete backend types.
*/
Runtime BuildRuntime(const modstore::runtime::config::RuntimeConfig& config);

} // namespace modstore::factory
