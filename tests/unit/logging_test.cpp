#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>

namespace {

using namespace modstore::observability;
using modstore::model::VersionStatus;

void TestFieldHelpers() {
  assert(ModuleField("example.com/lib", "v1.2.0").value == "example.com/lib@v1.2.0");
  assert(ModuleField("example.com/lib").value == "example.com/lib");
  assert(StatusField(VersionStatus::kValidationFailure).value == "validation_failure/480");
  assert(DurationMsField("duration", 4.2101).value == "4.210ms");
}

void TestValuesAreQuotedWhenNeeded() {
  auto line = FormatRecord("ingest failed", {ModuleField("example.com/lib", "v1.0.0"),
                                             ErrorField("example.com/lib@v1.0.0: module has no units; missing \"time\""),
                                             BoolField("is_latest", false), StringField("note", "")});
  assert(line == "ingest failed module=example.com/lib@v1.0.0 "
                 "error=\"example.com/lib@v1.0.0: module has no units; missing \\\"time\\\"\" is_latest=false note=\"\"");

  assert(FormatRecord("workers stopped", {}) == "workers stopped");
  assert(FormatRecord("multi", {StringField("k", "a=b\nc")}) == "multi k=\"a=b\\nc\"");
}

void TestModuleContextScopes() {
  assert(FormatRecord("poll", {}) == "poll");
  {
    ScopedModuleContext outer("example.com/a", "v1.0.0");
    assert(FormatRecord("merged", {IntField("records", 3)}) == "merged module=example.com/a@v1.0.0 records=3");
    {
      ScopedModuleContext inner("example.com/b", "v2.0.0");
      assert(FormatRecord("x", {}) == "x module=example.com/b@v2.0.0");
    }
    assert(FormatRecord("x", {}) == "x module=example.com/a@v1.0.0");

    // an explicit module field is not duplicated
    assert(FormatRecord("x", {ModuleField("example.com/c")}) == "x module=example.com/c");

    // the context is per thread
    std::string other;
    std::thread t([&] { other = FormatRecord("y", {}); });
    t.join();
    assert(other == "y");
  }
  assert(FormatRecord("poll", {}) == "poll");
}

} // namespace

int main() {
  TestFieldHelpers();
  TestValuesAreQuotedWhenNeeded();
  TestModuleContextScopes();

  std::cout << "modstore_unit_logging: pass\n";
  return 0;
}
