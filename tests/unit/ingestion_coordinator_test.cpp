#include "internal/core/ingestion_coordinator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/work_queue.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/module_fixtures.hpp"

namespace {

using modstore::core::IngestionCoordinator;
using modstore::core::IngestOptions;
using modstore::core::LatestVersionCache;
using modstore::db::memory::MemoryRepository;
using modstore::db::model::LatestModuleVersionsRecord;
using modstore::testing::Graph;
using modstore::testing::Package;
using modstore::testing::Sym;

constexpr const char* kModule = "example.com/lib";

struct Fixture {
  std::shared_ptr<MemoryRepository>     repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<LatestVersionCache>   cache = std::make_shared<LatestVersionCache>();
  IngestionCoordinator                  coordinator{repo, IngestOptions{}, cache};

  std::string GoodVersion(const std::string& module_path = kModule) {
    auto latest = coordinator.ResolveLatest(module_path);
    return latest ? latest->good_version : std::string("<none>");
  }

  std::vector<modstore::db::model::SearchDocumentRecord> SearchDocs(const std::string& module_path = kModule) {
    auto tx   = repo->Begin();
    auto docs = repo->ListSearchDocuments(*tx, module_path);
    tx->Commit();
    return docs;
  }
};

template <typename E, typename F>
bool Throws(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestIngestWritesGraphAndDerivedRows() {
  Fixture f;
  assert(f.coordinator.Ingest(Graph(kModule, "v1.0.0")));
  assert(f.GoodVersion() == "v1.0.0");

  auto tx     = f.repo->Begin();
  auto module = f.repo->GetModule(*tx, kModule, "v1.0.0");
  assert(module.has_value());
  assert(module->version_type == "release");
  assert(module->sort_version == "1,0,0~");

  auto units = f.repo->ListUnits(*tx, module->id);
  assert(units.size() == 1);
  assert(units[0].name == "lib");
  assert(units[0].license_types == std::vector<std::string>{"MIT"});
  assert(f.repo->ListPackageImports(*tx, units[0].id) == std::vector<std::string>{"fmt"});
  assert(f.repo->ListDocumentation(*tx, units[0].id).size() == 1);
  assert(f.repo->GetReadme(*tx, units[0].id).has_value());

  auto edges = f.repo->ListImportsUnique(*tx, kModule);
  assert(edges.size() == 1);
  assert(edges[0].to_path == "fmt");
  assert(f.repo->ListSymbolHistory(*tx, kModule, kModule).size() == 1);
  tx->Commit();

  auto docs = f.SearchDocs();
  assert(docs.size() == 1);
  assert(docs[0].version == "v1.0.0");
  assert(docs[0].synopsis == "Package lib does things.");
}

void TestIngestIsIdempotent() {
  Fixture f;
  assert(f.coordinator.Ingest(Graph(kModule, "v1.0.0")));
  assert(f.coordinator.Ingest(Graph(kModule, "v1.0.0")));

  auto tx       = f.repo->Begin();
  auto versions = f.repo->ListModuleVersions(*tx, kModule);
  assert(versions.size() == 1);
  assert(f.repo->ListUnits(*tx, versions[0].id).size() == 1);
  assert(f.repo->ListLicenses(*tx, versions[0].id).size() == 1);
  tx->Commit();
  assert(f.SearchDocs().size() == 1);
}

void TestResolutionPrefersCompatibleReleases() {
  Fixture f;
  assert(f.coordinator.Ingest(Graph(kModule, "v1.0.0")));
  assert(f.coordinator.Ingest(Graph(kModule, "v1.1.0")));
  assert(!f.coordinator.Ingest(Graph(kModule, "v1.2.0-rc.1")));
  assert(!f.coordinator.Ingest(Graph(kModule, "v0.0.0-20230101000000-abcdef123456")));
  assert(!f.coordinator.Ingest(Graph(kModule, "v2.0.0+incompatible")));
  assert(!f.coordinator.Ingest(Graph(kModule, "v1.0.5")));
  assert(f.GoodVersion() == "v1.1.0");
  assert(f.SearchDocs()[0].version == "v1.1.0");
}

void TestPrereleaseWinsWithoutReleases() {
  Fixture f;
  assert(f.coordinator.Ingest(Graph(kModule, "v0.0.0-20230101000000-abcdef123456")));
  assert(f.coordinator.Ingest(Graph(kModule, "v0.1.0-beta.1")));
  assert(f.GoodVersion() == "v0.1.0-beta.1");
}

void TestRetractionsMoveGoodVersion() {
  Fixture f;
  f.coordinator.Ingest(Graph(kModule, "v1.0.0"));
  f.coordinator.Ingest(Graph(kModule, "v1.1.0"));

  LatestModuleVersionsRecord info;
  info.module_path    = kModule;
  info.raw_version    = "v1.1.0";
  info.cooked_version = "v1.0.0";
  info.retractions    = {{"v1.1.0", "", "broken build"}};

  auto stored = f.coordinator.UpdateLatestModuleVersions(info);
  assert(stored.raw_version == "v1.1.0");
  assert(stored.good_version == "v1.0.0");
  assert(stored.retractions.size() == 1);
  assert(stored.retractions[0].rationale == "broken build");
  assert(f.GoodVersion() == "v1.0.0");

  // an older raw version does not replace what is held
  LatestModuleVersionsRecord older = info;
  older.raw_version                = "v1.0.0";
  older.retractions.clear();
  stored = f.coordinator.UpdateLatestModuleVersions(older);
  assert(stored.raw_version == "v1.1.0");
  assert(stored.good_version == "v1.0.0");

  LatestModuleVersionsRecord all = info;
  all.raw_version                = "v1.2.0";
  all.retractions                = {{"v1.0.0", "v1.2.0", "abandoned"}};
  stored = f.coordinator.UpdateLatestModuleVersions(all);
  assert(stored.good_version.empty());

  // an ingest under full retraction is never the good version
  assert(!f.coordinator.Ingest(Graph(kModule, "v1.1.1")));
}

void TestAlternativePathSuppressesSearchRows() {
  Fixture                   f;
  modstore::queue::WorkQueue queue(f.repo, {});

  modstore::queue::RecordDetail detail;
  detail.canonical_path = "example.com/canonical";
  queue.Record(kModule, "v1.0.0", modstore::model::VersionStatus::kAlternativePath, detail);

  assert(f.coordinator.Ingest(Graph(kModule, "v1.0.0")));
  assert(f.GoodVersion() == "v1.0.0");
  assert(f.SearchDocs().empty());

  auto tx = f.repo->Begin();
  assert(f.repo->ListImportsUnique(*tx, kModule).size() == 1);
  tx->Commit();
}

void TestIncompleteResubmissionIsRejected() {
  Fixture f;
  const std::string sub = std::string(kModule) + "/sub";
  f.coordinator.Ingest(Graph(kModule, "v1.0.0", {Package(kModule, "lib"), Package(sub, "sub")}));

  assert(Throws<modstore::util::IncompleteResubmission>(
      [&] { f.coordinator.Ingest(Graph(kModule, "v1.0.0", {Package(kModule, "lib")})); }));

  auto no_license = Graph(kModule, "v1.0.0", {Package(kModule, "lib"), Package(sub, "sub")});
  no_license.licenses.clear();
  assert(Throws<modstore::util::IncompleteResubmission>([&] { f.coordinator.Ingest(no_license); }));

  // a superset is accepted
  assert(f.coordinator.Ingest(Graph(
      kModule, "v1.0.0", {Package(kModule, "lib"), Package(sub, "sub"), Package(std::string(kModule) + "/extra", "extra")})));
}

void TestValidationRejectsBeforeWriting() {
  Fixture f;

  auto no_units = Graph(kModule, "v1.0.0");
  no_units.units.clear();
  assert(Throws<modstore::util::InvalidModule>([&] { f.coordinator.Ingest(no_units); }));

  assert(Throws<modstore::util::InvalidModule>([&] { f.coordinator.Ingest(Graph(kModule, "1.0")); }));

  auto outside = Graph(kModule, "v1.0.0", {Package("example.com/other", "other")});
  assert(Throws<modstore::util::InvalidModule>([&] { f.coordinator.Ingest(outside); }));

  auto no_time        = Graph(kModule, "v1.0.0");
  no_time.commit_time = {};
  assert(Throws<modstore::util::InvalidModule>([&] { f.coordinator.Ingest(no_time); }));

  auto tx = f.repo->Begin();
  assert(f.repo->ListModuleVersions(*tx, kModule).empty());
  tx->Commit();
  assert(f.GoodVersion() == "<none>");
}

void TestStdlibSkipsPathChecks() {
  Fixture f;
  auto    graph = Graph("std", "v1.21.0", {Package("net/http", "http"), Package("fmt", "fmt")});
  assert(f.coordinator.Ingest(graph));
  assert(f.GoodVersion("std") == "v1.21.0");
}

void TestStdlibTagsAreStoredAsSemver() {
  Fixture f;
  assert(f.coordinator.Ingest(Graph("std", "go1.21.0", {Package("fmt", "fmt")})));
  assert(f.coordinator.Ingest(Graph("std", "go1.22rc1", {Package("fmt", "fmt")})) == false);
  assert(f.GoodVersion("std") == "v1.21.0");

  auto tx       = f.repo->Begin();
  auto versions = f.repo->ListModuleVersions(*tx, "std");
  tx->Commit();
  assert(versions.size() == 2);
  for (const auto& m : versions) {
    assert(m.version == "v1.21.0" || m.version == "v1.22.0-rc.1");
  }

  assert(Throws<modstore::util::InvalidModule>(
      [&] { f.coordinator.Ingest(Graph("std", "weekly.2011-01-01", {Package("fmt", "fmt")})); }));
  assert(Throws<modstore::util::InvalidModule>([&] { f.coordinator.Ingest(Graph(kModule, "go1.21.0")); }));
}

void TestNonRedistributableContentIsStripped() {
  Fixture f;
  auto    unit    = Package(kModule, "lib", {Sym("New")});
  unit.redistributable = false;
  auto graph            = Graph(kModule, "v1.0.0", {unit});
  graph.licenses[0].redistributable = false;
  f.coordinator.Ingest(graph);

  auto tx     = f.repo->Begin();
  auto module = f.repo->GetModule(*tx, kModule, "v1.0.0");
  auto units  = f.repo->ListUnits(*tx, module->id);
  auto docs   = f.repo->ListDocumentation(*tx, units[0].id);
  assert(docs.size() == 1);
  assert(docs[0].html.empty());
  assert(docs[0].synopsis.empty());
  assert(f.repo->GetReadme(*tx, units[0].id)->contents.empty());
  assert(f.repo->ListLicenses(*tx, module->id)[0].contents.empty());
  tx->Commit();

  auto                 repo = std::make_shared<MemoryRepository>();
  IngestionCoordinator bypass(repo, IngestOptions{true});
  bypass.Ingest(graph);
  auto tx2 = repo->Begin();
  auto m2  = repo->GetModule(*tx2, kModule, "v1.0.0");
  auto u2  = repo->ListUnits(*tx2, m2->id);
  assert(!repo->ListDocumentation(*tx2, u2[0].id)[0].html.empty());
  tx2->Commit();
}

void TestDeleteModuleVersion() {
  Fixture f;
  f.coordinator.Ingest(Graph(kModule, "v1.0.0"));
  f.coordinator.Ingest(Graph(kModule, "v1.1.0"));

  f.coordinator.DeleteModuleVersion(kModule, "v1.1.0");
  assert(f.GoodVersion() == "v1.0.0");
  assert(f.SearchDocs().empty());

  assert(Throws<modstore::util::NotFound>([&] { f.coordinator.DeleteModuleVersion(kModule, "v1.1.0"); }));

  f.coordinator.DeleteModuleVersion(kModule, "v1.0.0");
  assert(f.GoodVersion().empty());

  auto tx = f.repo->Begin();
  assert(f.repo->ListModuleVersions(*tx, kModule).empty());
  assert(f.repo->ListImportsUnique(*tx, kModule).empty());
  tx->Commit();
}

void TestDeletePseudoVersionsExcept() {
  Fixture                    f;
  modstore::queue::WorkQueue queue(f.repo, {});

  const std::string older = "v0.0.0-20230101000000-abcdef123456";
  const std::string keep  = "v0.0.0-20230201000000-bcdef1234567";
  const std::string newer = "v0.0.0-20230301000000-cdef12345678";
  for (const auto& v : {older, keep, newer}) {
    f.coordinator.Ingest(Graph(kModule, v));
  }
  f.coordinator.Ingest(Graph(kModule, "v0.1.0"));

  modstore::queue::RecordDetail detail;
  detail.requested_version = "master";
  queue.Record(kModule, newer, modstore::model::VersionStatus::kSuccess, detail);

  assert(f.coordinator.DeletePseudoVersionsExcept(kModule, keep) == 2);

  auto tx       = f.repo->Begin();
  auto versions = f.repo->ListModuleVersions(*tx, kModule);
  assert(versions.size() == 2);
  for (const auto& m : versions) {
    assert(m.version == keep || m.version == "v0.1.0");
  }
  assert(!f.repo->GetVersionMap(*tx, kModule, "master").has_value());
  tx->Commit();
  assert(f.GoodVersion() == "v0.1.0");

  assert(f.coordinator.DeletePseudoVersionsExcept(kModule, keep) == 0);
}

void TestResolveLatestIsCachedUntilWrite() {
  Fixture f;
  assert(!f.coordinator.ResolveLatest(kModule).has_value());
  assert(f.cache->Size() == 0);

  f.coordinator.Ingest(Graph(kModule, "v1.0.0"));
  assert(f.GoodVersion() == "v1.0.0");
  assert(f.cache->Size() == 1);

  f.coordinator.Ingest(Graph(kModule, "v1.1.0"));
  assert(f.cache->Size() == 0);
  assert(f.GoodVersion() == "v1.1.0");
}

} // namespace

int main() {
  TestIngestWritesGraphAndDerivedRows();
  TestIngestIsIdempotent();
  TestResolutionPrefersCompatibleReleases();
  TestPrereleaseWinsWithoutReleases();
  TestRetractionsMoveGoodVersion();
  TestAlternativePathSuppressesSearchRows();
  TestIncompleteResubmissionIsRejected();
  TestValidationRejectsBeforeWriting();
  TestStdlibSkipsPathChecks();
  TestStdlibTagsAreStoredAsSemver();
  TestNonRedistributableContentIsStripped();
  TestDeleteModuleVersion();
  TestDeletePseudoVersionsExcept();
  TestResolveLatestIsCachedUntilWrite();

  std::cout << "modstore_unit_ingestion_coordinator: pass\n";
  return 0;
}
