#include "directory_module_source.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

#include "graph_codec.hpp"
#include "internal/util/errors.hpp"

namespace modstore::fetch {

namespace {

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::string Trim(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
  std::size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  return s.substr(start);
}

} // namespace

DirectoryModuleSource::DirectoryModuleSource(std::filesystem::path root) : root_(std::move(root)) {
}

std::string DirectoryModuleSource::EscapePath(const std::string& module_path) {
  std::string out;
  out.reserve(module_path.size());
  for (char c : module_path) {
    if (std::isupper(static_cast<unsigned char>(c))) {
      out.push_back('!');
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

model::ModuleGraph DirectoryModuleSource::Fetch(const std::string& module_path, const std::string& version) {
  const auto dir = root_ / EscapePath(module_path) / "@v";

  const auto alternative = dir / (version + ".alternative");
  if (std::filesystem::exists(alternative)) {
    auto canonical = Trim(ReadFile(alternative));
    throw util::AlternativeModule(module_path + " is an alternative path of " + canonical, canonical);
  }

  const auto graph_file = dir / (version + ".json");
  if (!std::filesystem::exists(graph_file)) {
    throw util::NotFound(module_path + "@" + version);
  }

  auto graph = ParseModuleGraphJson(ReadFile(graph_file));
  if (graph.module_path != module_path || graph.version != version) {
    throw util::InvalidModule(graph_file.string() + " holds " + graph.module_path + "@" + graph.version);
  }
  return graph;
}

} // namespace modstore::fetch
