#pragma once

#include <string>
#include <vector>

#include "gatewatch/core/entities.h"

namespace gatewatch {

// Highest manifest clearance a credential of the given level may carry.
// Monotonic in the access level; Unrestricted maps to the top of the scale.
ClearanceLevel max_clearance_for(AccessLevel level);

// True when a ship holding `code` (nullptr = no access-code record) may carry
// cargo that requires `required`. Without a record only Standard is permitted.
bool clearance_permitted(const AccessCode* code, ClearanceLevel required);

// --- The four manifest checks ---
//
// Each check is independent and side-effect free so that callers (and tests)
// can evaluate them one at a time.

bool manifest_authorizes_faction(const CargoManifest& manifest, const std::string& faction);
bool manifest_valid_for_day(const CargoManifest& manifest, int day);
bool manifest_has_sufficient_clearance(const CargoManifest& manifest, const AccessCode* code);
bool manifest_complies_with_day_rules(const CargoManifest& manifest, const std::vector<DayRule>& rules);

// Keywords scanned against a manifest: every active rule description,
// lower-cased and split on spaces.
std::vector<std::string> extract_rule_keywords(const std::vector<DayRule>& rules);

// Rules posted for `day` (rules with day <= 0 apply every day).
std::vector<DayRule> rules_active_on(const std::vector<DayRule>& all_rules, int day);

struct ManifestVerdict {
  bool valid{false};
  FailedCheck failed_check{FailedCheck::None};
  std::string reason;
};

// Runs the checks in fixed priority order (faction, day, clearance, day rule)
// and stops at the first failure. A missing manifest is a failed verdict, not
// an error.
ManifestVerdict evaluate_manifest(const CargoManifest* manifest, const Encounter& encounter, int day,
                                  const std::vector<DayRule>& active_rules);

// Conjunction of the four checks. false means "deny".
bool validate_manifest(const CargoManifest* manifest, const Encounter& encounter, int day,
                       const std::vector<DayRule>& active_rules);

} // namespace gatewatch
