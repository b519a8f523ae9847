#pragma once

#include <string>
#include <vector>

namespace gatewatch {

// Static compatibility rules for one ship category.
//
// All comparisons are ASCII case-insensitive. A category with no configured
// captain factions is treated as accepting exactly its associated factions.
struct FactionPolicy {
  std::string category_name;
  std::string description;

  std::vector<std::string> associated_factions;
  std::vector<std::string> compatible_captain_factions;
  std::vector<std::string> valid_access_code_prefixes;

  // 0..1
  double suspicion_base_level{0.0};
  bool requires_special_clearance{false};
  bool priority_access{false};
  bool contraband_exempt{false};

  // Exact (case-insensitive) membership. Empty set => false.
  bool is_faction_associated(const std::string& faction) const;

  // Membership in compatible_captain_factions; falls back to
  // is_faction_associated() when that list is empty.
  bool is_captain_compatible(const std::string& captain_faction) const;

  // Case-insensitive prefix match. Empty code or no prefixes => false.
  bool is_access_code_valid(const std::string& code) const;

  // First associated faction, else the lower-cased category name.
  std::string primary_faction() const;
};

} // namespace gatewatch
