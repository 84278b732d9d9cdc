#include "internal/version/module_path.hpp"

#include <cctype>

namespace modstore::version {
namespace {

bool IsPathChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '.' || c == '_' || c == '~' ||
         c == '/' || c == '+';
}

// Length of a trailing "/vN" (N >= 2) suffix, or 0.
std::size_t MajorSuffixLength(std::string_view path) {
  auto slash = path.rfind('/');
  if (slash == std::string_view::npos) {
    return 0;
  }
  auto elem = path.substr(slash + 1);
  if (elem.size() < 2 || elem.front() != 'v' || elem[1] == '0') {
    return 0;
  }
  for (std::size_t i = 1; i < elem.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(elem[i]))) {
      return 0;
    }
  }
  if (elem == "v1") {
    return 0;
  }
  return elem.size() + 1;
}

} // namespace

std::optional<std::string> CheckModulePath(std::string_view module_path) {
  if (module_path.empty()) {
    return "empty module path";
  }
  if (module_path == kStdlibModulePath) {
    return std::nullopt;
  }
  if (module_path.front() == '/' || module_path.back() == '/') {
    return "leading or trailing slash";
  }
  for (char c : module_path) {
    if (!IsPathChar(c)) {
      return std::string("invalid character ") + c;
    }
  }

  std::size_t start = 0;
  bool        first = true;
  while (start <= module_path.size()) {
    auto end = module_path.find('/', start);
    if (end == std::string_view::npos) end = module_path.size();
    auto elem = module_path.substr(start, end - start);
    if (elem.empty()) {
      return "empty path element";
    }
    if (elem == "." || elem == "..") {
      return "relative path element";
    }
    if (elem.front() == '.' || elem.back() == '.') {
      return "path element begins or ends with a dot";
    }
    if (first) {
      if (elem.find('.') == std::string_view::npos) {
        return "missing dot in first path element";
      }
      if (elem.front() == '-') {
        return "leading dash in first path element";
      }
      first = false;
    }
    start = end + 1;
  }

  auto slash = module_path.rfind('/');
  if (slash != std::string_view::npos) {
    auto last = module_path.substr(slash + 1);
    if (last == "v0" || last == "v1") {
      return "invalid major version suffix " + std::string(last);
    }
  }
  return std::nullopt;
}

bool IsWithinModule(std::string_view unit_path, std::string_view module_path) {
  if (unit_path == module_path) {
    return true;
  }
  if (module_path == kStdlibModulePath) {
    return !unit_path.empty() && unit_path.front() != '/';
  }
  return unit_path.size() > module_path.size() && unit_path.substr(0, module_path.size()) == module_path &&
         unit_path[module_path.size()] == '/';
}

std::string SeriesPath(std::string_view module_path) {
  return std::string(module_path.substr(0, module_path.size() - MajorSuffixLength(module_path)));
}

std::string V1Path(std::string_view unit_path, std::string_view module_path) {
  if (module_path == kStdlibModulePath) {
    return std::string(unit_path);
  }
  std::string out = SeriesPath(module_path);
  if (unit_path.size() > module_path.size()) {
    out.append(unit_path.substr(module_path.size()));
  }
  return out;
}

} // namespace modstore::version
