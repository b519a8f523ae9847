#include "gatewatch/core/faction_policy.h"

#include <algorithm>

#include "gatewatch/util/strings.h"

namespace gatewatch {
namespace {

bool contains_ci(const std::vector<std::string>& set, const std::string& value) {
  return std::any_of(set.begin(), set.end(), [&](const std::string& f) { return iequals(f, value); });
}

} // namespace

bool FactionPolicy::is_faction_associated(const std::string& faction) const {
  if (associated_factions.empty()) return false;
  return contains_ci(associated_factions, faction);
}

bool FactionPolicy::is_captain_compatible(const std::string& captain_faction) const {
  if (compatible_captain_factions.empty()) return is_faction_associated(captain_faction);
  return contains_ci(compatible_captain_factions, captain_faction);
}

bool FactionPolicy::is_access_code_valid(const std::string& code) const {
  if (code.empty() || valid_access_code_prefixes.empty()) return false;
  return std::any_of(valid_access_code_prefixes.begin(), valid_access_code_prefixes.end(),
                     [&](const std::string& prefix) { return istarts_with(code, prefix); });
}

std::string FactionPolicy::primary_faction() const {
  if (!associated_factions.empty()) return associated_factions.front();
  return to_lower(category_name);
}

} // namespace gatewatch
