#include <iostream>
#include <string>
#include <vector>

#include "gatewatch/core/manifest_policy.h"

#define GW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

gatewatch::AccessCode code_with(gatewatch::AccessLevel level) {
  gatewatch::AccessCode c;
  c.code = "SK-1000";
  c.level = level;
  return c;
}

} // namespace

int test_manifest_policy() {
  using gatewatch::AccessLevel;
  using gatewatch::ClearanceLevel;

  // --- Clearance mapping ---
  GW_ASSERT(gatewatch::max_clearance_for(AccessLevel::Low) == ClearanceLevel::Standard);
  GW_ASSERT(gatewatch::max_clearance_for(AccessLevel::Medium) == ClearanceLevel::Restricted);
  GW_ASSERT(gatewatch::max_clearance_for(AccessLevel::High) == ClearanceLevel::Classified);
  GW_ASSERT(gatewatch::max_clearance_for(AccessLevel::Unrestricted) == ClearanceLevel::Classified);

  // Permission sets are nested: anything a lower level permits, every higher level permits.
  {
    const std::vector<AccessLevel> levels = {AccessLevel::Low, AccessLevel::Medium, AccessLevel::High,
                                             AccessLevel::Unrestricted};
    const std::vector<ClearanceLevel> clearances = {ClearanceLevel::Standard, ClearanceLevel::Restricted,
                                                    ClearanceLevel::Classified};
    for (std::size_t i = 0; i + 1 < levels.size(); ++i) {
      const auto lo = code_with(levels[i]);
      const auto hi = code_with(levels[i + 1]);
      for (const auto c : clearances) {
        if (gatewatch::clearance_permitted(&lo, c)) GW_ASSERT(gatewatch::clearance_permitted(&hi, c));
      }
    }
    const auto unrestricted = code_with(AccessLevel::Unrestricted);
    for (const auto c : clearances) GW_ASSERT(gatewatch::clearance_permitted(&unrestricted, c));

    // No access-code record: Standard only.
    GW_ASSERT(gatewatch::clearance_permitted(nullptr, ClearanceLevel::Standard));
    GW_ASSERT(!gatewatch::clearance_permitted(nullptr, ClearanceLevel::Restricted));
    GW_ASSERT(!gatewatch::clearance_permitted(nullptr, ClearanceLevel::Classified));
  }

  // --- Baseline: every check passes ---
  gatewatch::CargoManifest m;
  m.code = "MAN-1";
  m.name = "Fuel";
  m.required_clearance = ClearanceLevel::Restricted;
  m.faction_restriction = gatewatch::FactionRestriction::FactionSpecific;
  m.allowed_factions = {"Merchant_Guild"};
  m.first_day = 2;
  m.last_day = 6;
  m.suspicious_keywords = {"Spice"};

  gatewatch::Encounter e;
  e.faction = "merchant_guild";
  e.access_code = "SK-1000";
  e.access_code_data = code_with(AccessLevel::Medium);

  std::vector<gatewatch::DayRule> rules;
  {
    gatewatch::DayRule r;
    r.type = gatewatch::DayRuleType::VerifyOrigin;
    r.description = "Confirm origin for ships from Kessel";
    rules.push_back(r);
  }

  GW_ASSERT(gatewatch::validate_manifest(&m, e, 4, rules));
  {
    const auto v = gatewatch::evaluate_manifest(&m, e, 4, rules);
    GW_ASSERT(v.valid);
    GW_ASSERT(v.failed_check == gatewatch::FailedCheck::None);
  }

  // Missing manifest: deny, not an error.
  GW_ASSERT(!gatewatch::validate_manifest(nullptr, e, 4, rules));
  GW_ASSERT(gatewatch::evaluate_manifest(nullptr, e, 4, rules).failed_check ==
            gatewatch::FailedCheck::MissingManifest);

  // --- Flipping each check on its own flips the result ---
  {
    gatewatch::Encounter other = e;
    other.faction = "belt_union";
    GW_ASSERT(!gatewatch::manifest_authorizes_faction(m, other.faction));
    const auto v = gatewatch::evaluate_manifest(&m, other, 4, rules);
    GW_ASSERT(!v.valid);
    GW_ASSERT(v.failed_check == gatewatch::FailedCheck::Faction);

    // Universal accepts everyone.
    gatewatch::CargoManifest universal = m;
    universal.faction_restriction = gatewatch::FactionRestriction::Universal;
    GW_ASSERT(gatewatch::validate_manifest(&universal, other, 4, rules));
  }
  {
    GW_ASSERT(!gatewatch::manifest_valid_for_day(m, 1));
    GW_ASSERT(gatewatch::manifest_valid_for_day(m, 2));
    GW_ASSERT(gatewatch::manifest_valid_for_day(m, 6));
    GW_ASSERT(!gatewatch::manifest_valid_for_day(m, 7));
    const auto v = gatewatch::evaluate_manifest(&m, e, 7, rules);
    GW_ASSERT(!v.valid);
    GW_ASSERT(v.failed_check == gatewatch::FailedCheck::Day);

    gatewatch::CargoManifest open_ended = m;
    open_ended.last_day = 0;
    GW_ASSERT(gatewatch::manifest_valid_for_day(open_ended, 500));
  }
  {
    gatewatch::Encounter low = e;
    low.access_code_data = code_with(AccessLevel::Low);
    const auto v = gatewatch::evaluate_manifest(&m, low, 4, rules);
    GW_ASSERT(!v.valid);
    GW_ASSERT(v.failed_check == gatewatch::FailedCheck::Clearance);

    gatewatch::Encounter forged = e;
    forged.access_code_data.reset();
    GW_ASSERT(!gatewatch::validate_manifest(&m, forged, 4, rules));
  }
  {
    std::vector<gatewatch::DayRule> spice_rules = rules;
    gatewatch::DayRule r;
    r.type = gatewatch::DayRuleType::CheckForIntelligence;
    r.description = "Search every hold for SPICE";
    spice_rules.push_back(r);
    const auto v = gatewatch::evaluate_manifest(&m, e, 4, spice_rules);
    GW_ASSERT(!v.valid);
    GW_ASSERT(v.failed_check == gatewatch::FailedCheck::DayRule);
  }

  // Priority order: faction before day before clearance.
  {
    gatewatch::Encounter bad = e;
    bad.faction = "belt_union";
    bad.access_code_data.reset();
    GW_ASSERT(gatewatch::evaluate_manifest(&m, bad, 9, rules).failed_check == gatewatch::FailedCheck::Faction);
    bad.faction = e.faction;
    GW_ASSERT(gatewatch::evaluate_manifest(&m, bad, 9, rules).failed_check == gatewatch::FailedCheck::Day);
  }

  // --- Day-rule flag checks ---
  {
    gatewatch::CargoManifest c;
    c.has_contraband = true;
    c.is_easily_detectable = false;

    gatewatch::DayRule contraband;
    contraband.type = gatewatch::DayRuleType::CheckForContraband;
    gatewatch::DayRule inspect;
    inspect.type = gatewatch::DayRuleType::ForceInspection;
    gatewatch::DayRule verify;
    verify.type = gatewatch::DayRuleType::VerifyManifest;

    GW_ASSERT(gatewatch::manifest_complies_with_day_rules(c, {}));
    GW_ASSERT(!gatewatch::manifest_complies_with_day_rules(c, {contraband}));
    // Well-hidden contraband survives a forced inspection.
    GW_ASSERT(gatewatch::manifest_complies_with_day_rules(c, {inspect}));
    c.is_easily_detectable = true;
    GW_ASSERT(!gatewatch::manifest_complies_with_day_rules(c, {inspect}));
    GW_ASSERT(gatewatch::manifest_complies_with_day_rules(c, {verify}));

    gatewatch::CargoManifest f;
    f.has_false_entries = true;
    GW_ASSERT(!gatewatch::manifest_complies_with_day_rules(f, {verify}));
    GW_ASSERT(gatewatch::manifest_complies_with_day_rules(f, {contraband}));
  }

  // --- Keyword extraction ---
  {
    gatewatch::DayRule a;
    a.description = "Watch  for Transmitters";
    gatewatch::DayRule b;
    b.description = "";
    const auto words = gatewatch::extract_rule_keywords({a, b});
    GW_ASSERT(words.size() == 3);
    GW_ASSERT(words[0] == "watch");
    GW_ASSERT(words[2] == "transmitters");
  }

  // --- Active rule filtering ---
  {
    gatewatch::DayRule every;
    every.day = 0;
    gatewatch::DayRule day3;
    day3.day = 3;
    const std::vector<gatewatch::DayRule> all = {every, day3};
    GW_ASSERT(gatewatch::rules_active_on(all, 2).size() == 1);
    GW_ASSERT(gatewatch::rules_active_on(all, 3).size() == 2);
  }

  return 0;
}
