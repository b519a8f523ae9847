#include "gatewatch/core/manifest_policy.h"

#include "gatewatch/core/enum_strings.h"
#include "gatewatch/util/strings.h"

namespace gatewatch {

ClearanceLevel max_clearance_for(AccessLevel level) {
  switch (level) {
    case AccessLevel::Low: return ClearanceLevel::Standard;
    case AccessLevel::Medium: return ClearanceLevel::Restricted;
    case AccessLevel::High: return ClearanceLevel::Classified;
    case AccessLevel::Unrestricted: return ClearanceLevel::Classified;
  }
  return ClearanceLevel::Standard;
}

bool clearance_permitted(const AccessCode* code, ClearanceLevel required) {
  const ClearanceLevel ceiling = code ? max_clearance_for(code->level) : ClearanceLevel::Standard;
  return static_cast<int>(required) <= static_cast<int>(ceiling);
}

bool manifest_authorizes_faction(const CargoManifest& manifest, const std::string& faction) {
  if (manifest.faction_restriction == FactionRestriction::Universal) return true;
  for (const auto& allowed : manifest.allowed_factions) {
    if (iequals(allowed, faction)) return true;
  }
  return false;
}

bool manifest_valid_for_day(const CargoManifest& manifest, int day) {
  if (day < manifest.first_day) return false;
  if (manifest.last_day > 0 && day > manifest.last_day) return false;
  return true;
}

bool manifest_has_sufficient_clearance(const CargoManifest& manifest, const AccessCode* code) {
  return clearance_permitted(code, manifest.required_clearance);
}

std::vector<std::string> extract_rule_keywords(const std::vector<DayRule>& rules) {
  std::vector<std::string> words;
  for (const auto& rule : rules) {
    if (rule.description.empty()) continue;
    for (auto& w : split_nonempty(to_lower(rule.description), ' ')) words.push_back(std::move(w));
  }
  return words;
}

std::vector<DayRule> rules_active_on(const std::vector<DayRule>& all_rules, int day) {
  std::vector<DayRule> out;
  for (const auto& r : all_rules) {
    if (r.day <= 0 || r.day == day) out.push_back(r);
  }
  return out;
}

bool manifest_complies_with_day_rules(const CargoManifest& manifest, const std::vector<DayRule>& rules) {
  if (rules.empty()) return true;

  for (const auto& rule : rules) {
    switch (rule.type) {
      case DayRuleType::CheckForContraband:
        if (manifest.has_contraband) return false;
        break;
      case DayRuleType::VerifyManifest:
        if (manifest.has_false_entries) return false;
        break;
      case DayRuleType::ForceInspection:
        if (manifest.has_contraband && manifest.is_easily_detectable) return false;
        break;
      default:
        break;
    }
  }

  const std::vector<std::string> keywords = extract_rule_keywords(rules);
  for (const auto& suspicious : manifest.suspicious_keywords) {
    for (const auto& kw : keywords) {
      if (iequals(suspicious, kw)) return false;
    }
  }
  return true;
}

ManifestVerdict evaluate_manifest(const CargoManifest* manifest, const Encounter& encounter, int day,
                                  const std::vector<DayRule>& active_rules) {
  ManifestVerdict v;
  if (!manifest) {
    v.failed_check = FailedCheck::MissingManifest;
    v.reason = "No cargo manifest presented";
    return v;
  }

  const AccessCode* code = encounter.access_code_data ? &*encounter.access_code_data : nullptr;

  if (!manifest_authorizes_faction(*manifest, encounter.faction)) {
    v.failed_check = FailedCheck::Faction;
    v.reason = "Manifest not authorized for faction '" + encounter.faction + "'";
  } else if (!manifest_valid_for_day(*manifest, day)) {
    v.failed_check = FailedCheck::Day;
    v.reason = "Manifest not valid on day " + std::to_string(day);
  } else if (!manifest_has_sufficient_clearance(*manifest, code)) {
    v.failed_check = FailedCheck::Clearance;
    v.reason = "Insufficient clearance for " + clearance_level_to_string(manifest->required_clearance) +
               " cargo";
  } else if (!manifest_complies_with_day_rules(*manifest, active_rules)) {
    v.failed_check = FailedCheck::DayRule;
    v.reason = "Manifest violates today's rules";
  } else {
    v.valid = true;
  }
  return v;
}

bool validate_manifest(const CargoManifest* manifest, const Encounter& encounter, int day,
                       const std::vector<DayRule>& active_rules) {
  return evaluate_manifest(manifest, encounter, day, active_rules).valid;
}

} // namespace gatewatch
