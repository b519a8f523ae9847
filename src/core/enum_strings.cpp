#include "gatewatch/core/enum_strings.h"

#include "gatewatch/util/strings.h"

namespace gatewatch {

std::string access_level_to_string(AccessLevel l) {
  switch (l) {
    case AccessLevel::Low: return "low";
    case AccessLevel::Medium: return "medium";
    case AccessLevel::High: return "high";
    case AccessLevel::Unrestricted: return "unrestricted";
  }
  return "low";
}

AccessLevel access_level_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "medium") return AccessLevel::Medium;
  if (s == "high") return AccessLevel::High;
  if (s == "unrestricted") return AccessLevel::Unrestricted;
  return AccessLevel::Low;
}

std::string clearance_level_to_string(ClearanceLevel c) {
  switch (c) {
    case ClearanceLevel::Standard: return "standard";
    case ClearanceLevel::Restricted: return "restricted";
    case ClearanceLevel::Classified: return "classified";
  }
  return "standard";
}

ClearanceLevel clearance_level_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "restricted") return ClearanceLevel::Restricted;
  if (s == "classified") return ClearanceLevel::Classified;
  return ClearanceLevel::Standard;
}

std::string faction_restriction_to_string(FactionRestriction r) {
  switch (r) {
    case FactionRestriction::Universal: return "universal";
    case FactionRestriction::FactionSpecific: return "faction_specific";
  }
  return "universal";
}

FactionRestriction faction_restriction_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "faction_specific" || s == "specific") return FactionRestriction::FactionSpecific;
  return FactionRestriction::Universal;
}

std::string day_rule_type_to_string(DayRuleType t) {
  switch (t) {
    case DayRuleType::VerifyOrigin: return "verify_origin";
    case DayRuleType::VerifyManifest: return "verify_manifest";
    case DayRuleType::CheckForContraband: return "check_for_contraband";
    case DayRuleType::CheckForIntelligence: return "check_for_intelligence";
    case DayRuleType::ForceInspection: return "force_inspection";
    case DayRuleType::AccessCodeChange: return "access_code_change";
  }
  return "verify_manifest";
}

bool day_rule_type_from_string(const std::string& raw, DayRuleType& out) {
  const std::string s = to_lower(raw);
  if (s == "verify_origin") {
    out = DayRuleType::VerifyOrigin;
  } else if (s == "verify_manifest") {
    out = DayRuleType::VerifyManifest;
  } else if (s == "check_for_contraband" || s == "contraband") {
    out = DayRuleType::CheckForContraband;
  } else if (s == "check_for_intelligence") {
    out = DayRuleType::CheckForIntelligence;
  } else if (s == "force_inspection") {
    out = DayRuleType::ForceInspection;
  } else if (s == "access_code_change") {
    out = DayRuleType::AccessCodeChange;
  } else {
    return false;
  }
  return true;
}

std::string failed_check_to_string(FailedCheck c) {
  switch (c) {
    case FailedCheck::None: return "none";
    case FailedCheck::MissingManifest: return "missing_manifest";
    case FailedCheck::Faction: return "faction";
    case FailedCheck::Day: return "day";
    case FailedCheck::Clearance: return "clearance";
    case FailedCheck::DayRule: return "day_rule";
    case FailedCheck::AccessCode: return "access_code";
  }
  return "none";
}

std::string decision_category_to_string(DecisionCategory c) {
  switch (c) {
    case DecisionCategory::Tactical: return "tactical";
    case DecisionCategory::Financial: return "financial";
    case DecisionCategory::Political: return "political";
    case DecisionCategory::Moral: return "moral";
  }
  return "tactical";
}

DecisionCategory decision_category_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "financial") return DecisionCategory::Financial;
  if (s == "political") return DecisionCategory::Political;
  if (s == "moral") return DecisionCategory::Moral;
  return DecisionCategory::Tactical;
}

std::string decision_pressure_to_string(DecisionPressure p) {
  switch (p) {
    case DecisionPressure::Low: return "low";
    case DecisionPressure::Medium: return "medium";
    case DecisionPressure::High: return "high";
    case DecisionPressure::Critical: return "critical";
  }
  return "low";
}

DecisionPressure decision_pressure_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "medium") return DecisionPressure::Medium;
  if (s == "high") return DecisionPressure::High;
  if (s == "critical") return DecisionPressure::Critical;
  return DecisionPressure::Low;
}

std::string narrative_branch_to_string(NarrativeBranch b) {
  switch (b) {
    case NarrativeBranch::Neutral: return "neutral";
    case NarrativeBranch::ImperiumPath: return "imperium_path";
    case NarrativeBranch::InsurgentPath: return "insurgent_path";
    case NarrativeBranch::ComplexResistance: return "complex_resistance";
    case NarrativeBranch::DoubleCross: return "double_cross";
    case NarrativeBranch::SilentDefiance: return "silent_defiance";
  }
  return "neutral";
}

NarrativeBranch narrative_branch_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "imperium_path") return NarrativeBranch::ImperiumPath;
  if (s == "insurgent_path") return NarrativeBranch::InsurgentPath;
  if (s == "complex_resistance") return NarrativeBranch::ComplexResistance;
  if (s == "double_cross") return NarrativeBranch::DoubleCross;
  if (s == "silent_defiance") return NarrativeBranch::SilentDefiance;
  return NarrativeBranch::Neutral;
}

std::string ending_path_to_string(EndingPath p) {
  switch (p) {
    case EndingPath::None: return "none";
    case EndingPath::Imperial: return "imperial";
    case EndingPath::Rebel: return "rebel";
    case EndingPath::Neutral: return "neutral";
    case EndingPath::Corrupt: return "corrupt";
  }
  return "none";
}

EndingPath ending_path_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "imperial") return EndingPath::Imperial;
  if (s == "rebel") return EndingPath::Rebel;
  if (s == "neutral") return EndingPath::Neutral;
  if (s == "corrupt") return EndingPath::Corrupt;
  return EndingPath::None;
}

std::string ending_type_to_string(EndingType t) {
  switch (t) {
    case EndingType::FreedomFighter: return "freedom_fighter";
    case EndingType::Martyr: return "martyr";
    case EndingType::Refugee: return "refugee";
    case EndingType::Underground: return "underground";
    case EndingType::GrayMan: return "gray_man";
    case EndingType::Compromised: return "compromised";
    case EndingType::GoodSoldier: return "good_soldier";
    case EndingType::TrueBeliever: return "true_believer";
    case EndingType::BridgeCommander: return "bridge_commander";
    case EndingType::ImperialHero: return "imperial_hero";
  }
  return "gray_man";
}

} // namespace gatewatch
