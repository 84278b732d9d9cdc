#include "graph_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace modstore::fetch {

namespace {

template <typename Message>
Message ParseJson(const std::string& json, const char* what) {
  Message message;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw util::InvalidModule(std::string("malformed ") + what + ": " + std::string(status.message()));
  }
  return message;
}

model::License ToModel(const modstore::v1::License& wire) {
  model::License l;
  l.file_path = wire.file_path();
  l.types.assign(wire.types().begin(), wire.types().end());
  l.contents        = wire.contents();
  l.redistributable = wire.redistributable();
  return l;
}

model::Documentation ToModel(const modstore::v1::Documentation& wire) {
  model::Documentation d;
  d.build_context = {wire.build_context().os(), wire.build_context().arch()};
  d.synopsis      = wire.synopsis();
  d.html          = wire.html();
  d.symbols.reserve(wire.symbols_size());
  for (const auto& s : wire.symbols()) {
    d.symbols.push_back({s.name(), s.parent_name(), s.kind(), s.synopsis(), s.section()});
  }
  return d;
}

model::Unit ToModel(const modstore::v1::Unit& wire) {
  model::Unit u;
  u.path            = wire.path();
  u.name            = wire.name();
  u.redistributable = wire.redistributable();
  for (const auto& l : wire.licenses()) u.licenses.push_back(ToModel(l));
  if (wire.has_readme()) {
    u.readme = model::Readme{wire.readme().file_path(), wire.readme().contents()};
  }
  for (const auto& d : wire.documentation()) u.documentation.push_back(ToModel(d));
  u.imports.assign(wire.imports().begin(), wire.imports().end());
  return u;
}

} // namespace

model::ModuleGraph ToModel(const modstore::v1::ModuleGraph& wire) {
  model::ModuleGraph g;
  g.module_path     = wire.module_path();
  g.version         = wire.version();
  g.commit_time     = util::FromProto(wire.commit_time());
  g.has_manifest    = wire.has_manifest();
  g.redistributable = wire.redistributable();
  g.source_info     = wire.source_info();
  for (const auto& l : wire.licenses()) g.licenses.push_back(ToModel(l));
  g.units.reserve(wire.units_size());
  for (const auto& u : wire.units()) g.units.push_back(ToModel(u));
  return g;
}

db::model::LatestModuleVersionsRecord ToModel(const modstore::v1::LatestVersions& wire) {
  db::model::LatestModuleVersionsRecord r;
  r.module_path    = wire.module_path();
  r.raw_version    = wire.raw_version();
  r.cooked_version = wire.cooked_version();
  for (const auto& rr : wire.retractions()) {
    r.retractions.push_back({rr.low(), rr.high(), rr.rationale()});
  }
  r.deprecated          = wire.deprecated();
  r.deprecation_comment = wire.deprecation_comment();
  return r;
}

model::ModuleGraph ParseModuleGraphJson(const std::string& json) {
  return ToModel(ParseJson<modstore::v1::ModuleGraph>(json, "module graph"));
}

db::model::LatestModuleVersionsRecord ParseLatestVersionsJson(const std::string& json) {
  return ToModel(ParseJson<modstore::v1::LatestVersions>(json, "latest versions"));
}

} // namespace modstore::fetch
