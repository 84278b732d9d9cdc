#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace modstore::version {

// Module path of the standard library. Its versions are not semver checked.
inline constexpr std::string_view kStdlibModulePath = "std";

// Returns a description of the problem, or nullopt when the path is valid.
std::optional<std::string> CheckModulePath(std::string_view module_path);

// True when unit_path equals module_path or lies beneath it.
bool IsWithinModule(std::string_view unit_path, std::string_view module_path);

// Module path without its major-version suffix: "a.com/m/v2" -> "a.com/m".
std::string SeriesPath(std::string_view module_path);

// Unit path as it would appear in the v1 module of the series.
std::string V1Path(std::string_view unit_path, std::string_view module_path);

} // namespace modstore::version
