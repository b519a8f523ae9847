#include "gatewatch/core/encounter_classifier.h"

#include <algorithm>
#include <stdexcept>

#include "gatewatch/core/enum_strings.h"
#include "gatewatch/core/manifest_policy.h"
#include "gatewatch/util/log.h"
#include "gatewatch/util/strings.h"

namespace gatewatch {
namespace {

// Prefixes used for forged credentials. None of them appear in the shipped
// content.
const std::vector<std::string> kForgedPrefixes = {"XX-", "FK-", "NV-", "ZR-"};

bool code_usable_by(const AccessCode& code, const std::string& faction) {
  if (code.authorized_factions.empty()) return true;
  for (const auto& f : code.authorized_factions) {
    if (iequals(f, faction)) return true;
  }
  return false;
}

} // namespace

void classify_encounter(Encounter& e, const ContentDB& content) {
  const std::vector<DayRule> rules = content.rules_for_day(e.day);
  const CargoManifest* manifest = e.manifest ? &*e.manifest : nullptr;
  const ManifestVerdict verdict = evaluate_manifest(manifest, e, e.day, rules);

  const FactionPolicy* policy = content.find_category(e.category);
  const bool code_ok = policy && policy->is_access_code_valid(e.access_code);

  e.should_approve = verdict.valid && code_ok;
  if (!verdict.valid) {
    e.failed_check = verdict.failed_check;
    e.invalid_reason = verdict.reason;
  } else if (!code_ok) {
    e.failed_check = FailedCheck::AccessCode;
    e.invalid_reason = "Access code '" + e.access_code + "' not valid for " + e.category;
  } else {
    e.failed_check = FailedCheck::None;
    e.invalid_reason.clear();
  }
}

EncounterClassifier::EncounterClassifier(const ContentDB& content, util::HashRng& rng)
    : EncounterClassifier(content, rng, content.classifier) {}

EncounterClassifier::EncounterClassifier(const ContentDB& content, util::HashRng& rng, ClassifierConfig cfg)
    : content_(content), rng_(rng), cfg_(cfg) {}

Encounter EncounterClassifier::generate(int day, int imperial_loyalty, int insurgent_sympathy) {
  return generate_impl(day, std::string(), imperial_loyalty, insurgent_sympathy);
}

Encounter EncounterClassifier::generate_story_encounter(const std::string& tag, int day) {
  return generate_impl(day, tag, 0, 0);
}

Encounter EncounterClassifier::generate_impl(int day, const std::string& forced_tag, int imperial_loyalty,
                                             int insurgent_sympathy) {
  if (content_.ship_types.empty()) throw std::runtime_error("Cannot generate encounter: no ship types defined");

  Encounter e;
  e.day = day;

  const bool valid_intent = rng_.chance(cfg_.valid_ship_chance);

  const ShipType& ship = pick_ship_type();
  e.ship_type = ship.name;
  e.ship_name = ship.specific_names.empty() ? ship.name + " " + std::to_string(rng_.range_int(100, 999))
                                            : pick(ship.specific_names);
  e.origin = ship.common_origins.empty() ? std::string("Unknown") : pick(ship.common_origins);

  const FactionPolicy& policy = resolve_category(ship.category);
  e.category = policy.category_name;
  assign_captain(e, policy);

  // A degraded match swaps in the default category.
  const FactionPolicy& effective = resolve_category(e.category);
  e.faction = effective.primary_faction();

  assign_access_code(e, effective, valid_intent);
  assign_manifest(e, valid_intent);

  if (!forced_tag.empty()) {
    e.is_story_ship = true;
    e.story_tag = forced_tag;
  } else if (rng_.chance(cfg_.story_ship_chance)) {
    e.is_story_ship = true;
    e.story_tag = story_tag_for(imperial_loyalty, insurgent_sympathy);
  }

  classify_encounter(e, content_);

  log::debug("Generated " + e.ship_name + " (" + e.category + ", " + e.faction + ") day " + std::to_string(day) +
             ": " + (e.should_approve ? "approve" : "deny [" + failed_check_to_string(e.failed_check) + "]"));
  return e;
}

const ShipType& EncounterClassifier::pick_ship_type() {
  const int memory = std::max(0, cfg_.recent_ship_memory);

  std::vector<const ShipType*> fresh;
  for (const auto& s : content_.ship_types) {
    if (std::find(recent_.begin(), recent_.end(), s.name) == recent_.end()) fresh.push_back(&s);
  }

  const ShipType* chosen = nullptr;
  if (fresh.size() > 3) {
    chosen = fresh[rng_.index(fresh.size())];
  } else {
    chosen = &pick(content_.ship_types);
  }

  if (memory > 0) {
    recent_.push_back(chosen->name);
    while (static_cast<int>(recent_.size()) > memory) recent_.pop_front();
  }
  return *chosen;
}

const FactionPolicy& EncounterClassifier::resolve_category(const std::string& name) const {
  if (const FactionPolicy* p = content_.find_category(name)) return *p;
  if (const FactionPolicy* d = content_.find_category(content_.default_category)) {
    log::debug("Unknown ship category '" + name + "', using '" + d->category_name + "'");
    return *d;
  }
  throw std::runtime_error("Unknown ship category '" + name + "' and no default category");
}

void EncounterClassifier::assign_captain(Encounter& e, const FactionPolicy& policy) {
  const CaptainType* captain = nullptr;
  std::string captain_faction;

  for (const auto& c : content_.captain_types) {
    for (const auto& f : c.factions) {
      if (policy.is_captain_compatible(f)) {
        captain = &c;
        captain_faction = f;
        break;
      }
    }
    if (captain) break;
  }

  if (!captain) {
    e.degraded_match = true;
    captain = content_.find_captain_type(content_.default_captain);
    const FactionPolicy* fallback = content_.find_category(content_.default_category);
    log::warn("No captain compatible with category '" + policy.category_name + "'; using default pairing (" +
              content_.default_category + " / " + content_.default_captain + ")");
    if (fallback) e.category = fallback->category_name;
    if (!captain) {
      e.captain_name = "Unknown Captain";
      e.captain_faction = fallback ? fallback->primary_faction() : policy.primary_faction();
      return;
    }
    captain_faction = captain->factions.empty() ? std::string() : captain->factions.front();
  }

  e.captain_faction = captain_faction;
  e.captain_rank = captain->ranks.empty() ? std::string("Captain") : pick(captain->ranks);
  const std::string first = captain->first_names.empty() ? std::string() : pick(captain->first_names);
  const std::string last = captain->last_names.empty() ? captain->name : pick(captain->last_names);
  e.captain_name = first.empty() ? last : first + " " + last;
}

void EncounterClassifier::assign_access_code(Encounter& e, const FactionPolicy& policy, bool valid_intent) {
  if (valid_intent) {
    std::vector<const AccessCode*> candidates;
    for (const auto& a : content_.access_codes) {
      if (!a.active_on(e.day)) continue;
      if (!policy.is_access_code_valid(a.code)) continue;
      if (!code_usable_by(a, e.faction)) continue;
      candidates.push_back(&a);
    }
    if (!candidates.empty()) {
      const AccessCode* chosen = candidates[rng_.index(candidates.size())];
      e.access_code = chosen->code;
      e.access_code_data = *chosen;
      return;
    }
    // No issued code carries the category prefix: the ship presents a
    // well-formed code with no record behind it.
    if (!policy.valid_access_code_prefixes.empty()) {
      e.access_code = pick(policy.valid_access_code_prefixes) + std::to_string(rng_.range_int(1000, 9999));
      return;
    }
  }

  e.access_code = pick(kForgedPrefixes) + std::to_string(rng_.range_int(1000, 9999));
  e.access_code_data.reset();
}

void EncounterClassifier::assign_manifest(Encounter& e, bool valid_intent) {
  if (content_.manifests.empty()) {
    e.manifest.reset();
    return;
  }

  if (valid_intent) {
    const AccessCode* code = e.access_code_data ? &*e.access_code_data : nullptr;
    const std::vector<DayRule> rules = content_.rules_for_day(e.day);
    std::vector<const CargoManifest*> clean;
    for (const auto& m : content_.manifests) {
      if (m.has_contraband || m.has_false_entries) continue;
      if (!manifest_authorizes_faction(m, e.faction)) continue;
      if (!manifest_valid_for_day(m, e.day)) continue;
      if (!manifest_has_sufficient_clearance(m, code)) continue;
      if (!manifest_complies_with_day_rules(m, rules)) continue;
      clean.push_back(&m);
    }
    if (!clean.empty()) {
      e.manifest = *clean[rng_.index(clean.size())];
      return;
    }
  }

  e.manifest = pick(content_.manifests);
}

std::string EncounterClassifier::story_tag_for(int imperial_loyalty, int insurgent_sympathy) {
  // Lean toward the side the player currently favours less.
  double p_insurgent = 0.5;
  if (imperial_loyalty > insurgent_sympathy) {
    p_insurgent = 0.7;
  } else if (insurgent_sympathy > imperial_loyalty) {
    p_insurgent = 0.3;
  }
  return rng_.chance(p_insurgent) ? kStoryTagInsurgent : kStoryTagImperium;
}

} // namespace gatewatch
