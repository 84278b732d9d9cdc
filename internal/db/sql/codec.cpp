#include "internal/db/sql/codec.hpp"

#include <sstream>

namespace modstore::db::sql {
namespace {

std::string Flatten(std::string s, char bad) {
  for (auto& c : s) {
    if (c == '\n' || c == bad) c = ' ';
  }
  return s;
}

} // namespace

std::string JoinLines(const std::vector<std::string>& items) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) out.push_back('\n');
    out.append(Flatten(items[i], '\n'));
  }
  return out;
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> out;
  if (text.empty()) return out;

  std::istringstream in(text);
  std::string        line;
  while (std::getline(in, line)) {
    out.push_back(line);
  }
  return out;
}

std::string EncodeRetractions(const std::vector<version::RetractionRange>& ranges) {
  std::vector<std::string> lines;
  for (const auto& r : ranges) {
    lines.push_back(Flatten(r.low, '\t') + "\t" + Flatten(r.high, '\t') + "\t" + Flatten(r.rationale, '\t'));
  }
  return JoinLines(lines);
}

std::vector<version::RetractionRange> DecodeRetractions(const std::string& text) {
  std::vector<version::RetractionRange> out;
  for (const auto& line : SplitLines(text)) {
    version::RetractionRange r;
    const auto               first  = line.find('\t');
    const auto               second = first == std::string::npos ? std::string::npos : line.find('\t', first + 1);
    r.low = line.substr(0, first);
    if (first != std::string::npos) {
      r.high = line.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
    }
    if (second != std::string::npos) {
      r.rationale = line.substr(second + 1);
    }
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace modstore::db::sql
