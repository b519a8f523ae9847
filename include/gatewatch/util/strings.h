#pragma once

#include <string>
#include <vector>

namespace gatewatch {

std::string to_lower(std::string s);

// ASCII case-insensitive comparisons. Content authored in the data files is
// expected to be plain ASCII identifiers ("imperium", "SK-", ...).
bool iequals(const std::string& a, const std::string& b);
bool istarts_with(const std::string& s, const std::string& prefix);
bool icontains(const std::string& haystack, const std::string& needle);

// Splits on a single delimiter character. Empty pieces are dropped.
std::vector<std::string> split_nonempty(const std::string& s, char delim);

// Joins with ", " (used by reports).
std::string join(const std::vector<std::string>& parts, const std::string& sep = ", ");

} // namespace gatewatch
