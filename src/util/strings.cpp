#include "gatewatch/util/strings.h"

#include <algorithm>
#include <cctype>

namespace gatewatch {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool istarts_with(const std::string& s, const std::string& prefix) {
  if (prefix.size() > s.size()) return false;
  return iequals(s.substr(0, prefix.size()), prefix);
}

bool icontains(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) return true;
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> split_nonempty(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == delim) {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

} // namespace gatewatch
