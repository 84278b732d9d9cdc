#include "internal/version/semver.hpp"

#include <cctype>

namespace modstore::version::semver {
namespace {

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool IsIdentChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-';
}

// Consumes a decimal number without leading zeros.
bool ParseInt(std::string_view& v, std::string& out) {
  if (v.empty() || !IsDigit(v.front())) {
    return false;
  }
  std::size_t i = 1;
  while (i < v.size() && IsDigit(v[i])) {
    ++i;
  }
  if (v.front() == '0' && i != 1) {
    return false;
  }
  out.assign(v.substr(0, i));
  v.remove_prefix(i);
  return true;
}

bool IsBadNumeric(std::string_view ident) {
  for (char c : ident) {
    if (!IsDigit(c)) {
      return false;
    }
  }
  return ident.size() > 1 && ident.front() == '0';
}

// Consumes "-ident(.ident)*" up to an optional '+'.
bool ParsePrerelease(std::string_view& v, std::string& out) {
  if (v.empty() || v.front() != '-') {
    return false;
  }
  std::size_t i     = 1;
  std::size_t start = 1;
  while (i < v.size() && v[i] != '+') {
    if (!IsIdentChar(v[i]) && v[i] != '.') {
      return false;
    }
    if (v[i] == '.') {
      if (start == i || IsBadNumeric(v.substr(start, i - start))) {
        return false;
      }
      start = i + 1;
    }
    ++i;
  }
  if (start == i || IsBadNumeric(v.substr(start, i - start))) {
    return false;
  }
  out.assign(v.substr(0, i));
  v.remove_prefix(i);
  return true;
}

bool ParseBuild(std::string_view& v, std::string& out) {
  if (v.empty() || v.front() != '+') {
    return false;
  }
  std::size_t i     = 1;
  std::size_t start = 1;
  while (i < v.size()) {
    if (!IsIdentChar(v[i]) && v[i] != '.') {
      return false;
    }
    if (v[i] == '.') {
      if (start == i) {
        return false;
      }
      start = i + 1;
    }
    ++i;
  }
  if (start == i) {
    return false;
  }
  out.assign(v);
  v.remove_prefix(i);
  return true;
}

int CompareInt(std::string_view x, std::string_view y) {
  if (x == y) {
    return 0;
  }
  if (x.size() != y.size()) {
    return x.size() < y.size() ? -1 : 1;
  }
  return x < y ? -1 : 1;
}

bool IsNumeric(std::string_view s) {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (!IsDigit(c)) {
      return false;
    }
  }
  return true;
}

std::string_view NextIdent(std::string_view& x) {
  std::size_t i = 0;
  while (i < x.size() && x[i] != '.') {
    ++i;
  }
  auto ident = x.substr(0, i);
  x.remove_prefix(i);
  return ident;
}

int ComparePrerelease(std::string_view x, std::string_view y) {
  // "" > "-anything"
  if (x == y) {
    return 0;
  }
  if (x.empty()) {
    return 1;
  }
  if (y.empty()) {
    return -1;
  }
  while (!x.empty() && !y.empty()) {
    x.remove_prefix(1); // '-' or '.'
    y.remove_prefix(1);
    auto dx = NextIdent(x);
    auto dy = NextIdent(y);
    if (dx == dy) {
      continue;
    }
    const bool ix = IsNumeric(dx);
    const bool iy = IsNumeric(dy);
    if (ix != iy) {
      return ix ? -1 : 1;
    }
    if (ix) {
      return CompareInt(dx, dy);
    }
    return dx < dy ? -1 : 1;
  }
  if (x.empty()) {
    return y.empty() ? 0 : -1;
  }
  return 1;
}

} // namespace

std::optional<Parsed> Parse(std::string_view v) {
  if (v.empty() || v.front() != 'v') {
    return std::nullopt;
  }
  v.remove_prefix(1);

  Parsed p;
  if (!ParseInt(v, p.major)) {
    return std::nullopt;
  }
  if (v.empty()) {
    p.minor        = "0";
    p.patch        = "0";
    p.short_suffix = ".0.0";
    return p;
  }
  if (v.front() != '.') {
    return std::nullopt;
  }
  v.remove_prefix(1);
  if (!ParseInt(v, p.minor)) {
    return std::nullopt;
  }
  if (v.empty()) {
    p.patch        = "0";
    p.short_suffix = ".0";
    return p;
  }
  if (v.front() != '.') {
    return std::nullopt;
  }
  v.remove_prefix(1);
  if (!ParseInt(v, p.patch)) {
    return std::nullopt;
  }
  if (!v.empty() && v.front() == '-') {
    if (!ParsePrerelease(v, p.prerelease)) {
      return std::nullopt;
    }
  }
  if (!v.empty() && v.front() == '+') {
    if (!ParseBuild(v, p.build)) {
      return std::nullopt;
    }
  }
  if (!v.empty()) {
    return std::nullopt;
  }
  return p;
}

bool IsValid(std::string_view v) {
  return Parse(v).has_value();
}

std::string Canonical(std::string_view v) {
  auto p = Parse(v);
  if (!p) {
    return {};
  }
  return "v" + p->major + "." + p->minor + "." + p->patch + p->prerelease;
}

std::string Major(std::string_view v) {
  auto p = Parse(v);
  if (!p) {
    return {};
  }
  return "v" + p->major;
}

std::string Prerelease(std::string_view v) {
  auto p = Parse(v);
  return p ? p->prerelease : std::string{};
}

std::string Build(std::string_view v) {
  auto p = Parse(v);
  return p ? p->build : std::string{};
}

int Compare(std::string_view v, std::string_view w) {
  auto pv = Parse(v);
  auto pw = Parse(w);
  if (!pv) {
    return pw ? -1 : 0;
  }
  if (!pw) {
    return 1;
  }
  if (int c = CompareInt(pv->major, pw->major); c != 0) {
    return c;
  }
  if (int c = CompareInt(pv->minor, pw->minor); c != 0) {
    return c;
  }
  if (int c = CompareInt(pv->patch, pw->patch); c != 0) {
    return c;
  }
  return ComparePrerelease(pv->prerelease, pw->prerelease);
}

} // namespace modstore::version::semver
