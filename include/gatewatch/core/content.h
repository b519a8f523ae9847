#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "gatewatch/core/entities.h"
#include "gatewatch/core/faction_policy.h"

namespace gatewatch {

// Encounter generation tunables.
struct ClassifierConfig {
  // Probability that a generated ship is meant to be legitimate.
  double valid_ship_chance{0.7};
  // Probability that a generated ship carries a story tag.
  double story_ship_chance{0.2};
  // How many recent ship types to avoid re-picking.
  int recent_ship_memory{5};
};

// Branch classification bands. Overlapping bands are resolved by evaluation
// order, not rejected.
struct NarrativeThresholds {
  int imperial_threshold{50};
  int insurgent_threshold{-50};
  int complex_resistance_threshold{25};
};

// Per-session settings.
struct CampaignConfig {
  std::uint64_t seed{1};
  int start_day{1};
  int encounters_per_day{6};

  // Consequence scheduled when the operator approves a ship that should have
  // been denied (or the other way round).
  int mistake_delay_days{2};
  int wrong_approval_suspicion{10};
  int wrong_approval_loyalty{-5};
  int wrong_denial_suspicion{3};
  int wrong_denial_loyalty{-2};
};

// Immutable content for one campaign.
//
// Loaded once from JSON (see data/content/*.json) and then only read.
struct ContentDB {
  // Keyed by category name.
  std::map<std::string, FactionPolicy> categories;
  std::vector<ShipType> ship_types;
  std::vector<CaptainType> captain_types;
  std::vector<CargoManifest> manifests;
  std::vector<AccessCode> access_codes;
  std::vector<DayRule> day_rules;

  // Fallback pairing used when no captain matches a ship category.
  std::string default_category;
  std::string default_captain;

  ClassifierConfig classifier;
  NarrativeThresholds thresholds;
  CampaignConfig campaign;

  // nullptr when the category is unknown.
  const FactionPolicy* find_category(const std::string& name) const;
  const CaptainType* find_captain_type(const std::string& name) const;
  const CargoManifest* find_manifest(const std::string& code) const;
  const AccessCode* find_access_code(const std::string& code) const;

  // Rules posted for `day` (rules with day <= 0 apply every day).
  std::vector<DayRule> rules_for_day(int day) const;
};

} // namespace gatewatch
