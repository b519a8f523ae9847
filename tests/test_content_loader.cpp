#include <iostream>
#include <stdexcept>
#include <string>

#include "gatewatch/core/content_loader.h"
#include "gatewatch/util/json.h"
#include "gatewatch/util/log.h"

#define GW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool load_throws(const std::string& text) {
  try {
    (void)gatewatch::load_content_db_from_json(gatewatch::json::parse(text));
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

bool has_error_containing(const std::vector<std::string>& errors, const std::string& needle) {
  for (const auto& e : errors) {
    if (e.find(needle) != std::string::npos) return true;
  }
  return false;
}

} // namespace

int test_content_loader() {
  gatewatch::log::set_level(gatewatch::log::Level::Error);

  // --- Shipped content loads and validates ---
  {
    const auto db = gatewatch::load_content_db_from_file("data/content/default_content.json");
    GW_ASSERT(!db.categories.empty());
    GW_ASSERT(db.ship_types.size() >= 4);
    GW_ASSERT(!db.captain_types.empty());
    GW_ASSERT(!db.manifests.empty());
    GW_ASSERT(!db.access_codes.empty());
    GW_ASSERT(db.find_category(db.default_category) != nullptr);
    GW_ASSERT(db.find_captain_type(db.default_captain) != nullptr);

    const auto errors = gatewatch::validate_content_db(db);
    for (const auto& e : errors) std::cerr << "content error: " << e << "\n";
    GW_ASSERT(errors.empty());
  }

  // --- Seeds wider than int survive loading ---
  {
    const auto db = gatewatch::load_content_db_from_json(gatewatch::json::parse(R"({"campaign": {"seed": 5000000000}})"));
    GW_ASSERT(db.campaign.seed == 5000000000ULL);
  }

  // --- Field mapping ---
  {
    const std::string text = R"({
      "defaults": {"category": "Commercial", "captain": "Trader"},
      "classifier": {"valid_ship_chance": 0.5},
      "thresholds": {"imperial": 40, "complex_resistance": 20},
      "campaign": {"seed": 77, "mistake_delay_days": 3},
      "categories": {
        "Commercial": {
          "factions": ["merchant_guild"],
          "access_code_prefixes": ["MG-"],
          "suspicion_base_level": 0.3,
          "priority_access": true
        }
      },
      "ship_types": [{"name": "Bulk Freighter", "category": "Commercial", "origins": ["Kessel"], "names": ["Iron Mule"]}],
      "captain_types": [{"name": "Trader", "factions": ["merchant_guild"], "last_names": ["Voss"]}],
      "access_codes": [{"code": "MG-1", "level": "High", "valid_from_day": 2, "valid_until_day": 4, "revoked": false}],
      "manifests": [
        {"code": "M1", "name": "Ore", "allowed_factions": ["belt_union"], "required_clearance": "restricted",
         "first_day": 2, "last_day": 9, "has_contraband": true, "is_easily_detectable": false,
         "suspicious_keywords": ["spice"]},
        {"code": "M2", "name": "Food"}
      ],
      "day_rules": [
        {"type": "check_for_contraband", "day": 2, "description": "Search for spice"},
        {"type": "VERIFY_MANIFEST", "description": "Every day"}
      ]
    })";
    const auto db = gatewatch::load_content_db_from_json(gatewatch::json::parse(text));

    GW_ASSERT(db.default_category == "Commercial");
    GW_ASSERT(db.classifier.valid_ship_chance == 0.5);
    GW_ASSERT(db.classifier.story_ship_chance == 0.2);
    GW_ASSERT(db.thresholds.imperial_threshold == 40);
    GW_ASSERT(db.thresholds.insurgent_threshold == -50);
    GW_ASSERT(db.thresholds.complex_resistance_threshold == 20);
    GW_ASSERT(db.campaign.seed == 77u);
    GW_ASSERT(db.campaign.mistake_delay_days == 3);

    const auto* cat = db.find_category("commercial");
    GW_ASSERT(cat != nullptr);
    GW_ASSERT(cat->category_name == "Commercial");
    GW_ASSERT(cat->priority_access);
    GW_ASSERT(!cat->contraband_exempt);
    GW_ASSERT(cat->suspicion_base_level == 0.3);

    GW_ASSERT(db.ship_types[0].specific_names.size() == 1);
    const auto* code = db.find_access_code("mg-1");
    GW_ASSERT(code != nullptr);
    GW_ASSERT(code->level == gatewatch::AccessLevel::High);
    GW_ASSERT(!code->active_on(1));
    GW_ASSERT(code->active_on(4));
    GW_ASSERT(!code->active_on(5));

    const auto* m1 = db.find_manifest("M1");
    GW_ASSERT(m1 != nullptr);
    GW_ASSERT(m1->faction_restriction == gatewatch::FactionRestriction::FactionSpecific);
    GW_ASSERT(m1->required_clearance == gatewatch::ClearanceLevel::Restricted);
    GW_ASSERT(m1->first_day == 2);
    GW_ASSERT(m1->last_day == 9);
    GW_ASSERT(m1->has_contraband);
    GW_ASSERT(!m1->is_easily_detectable);
    GW_ASSERT(m1->suspicious_keywords.size() == 1);

    const auto* m2 = db.find_manifest("M2");
    GW_ASSERT(m2->faction_restriction == gatewatch::FactionRestriction::Universal);
    GW_ASSERT(m2->last_day == -1);
    GW_ASSERT(m2->is_easily_detectable);

    GW_ASSERT(db.rules_for_day(1).size() == 1);
    GW_ASSERT(db.rules_for_day(2).size() == 2);
    GW_ASSERT(db.day_rules[1].type == gatewatch::DayRuleType::VerifyManifest);

    GW_ASSERT(gatewatch::validate_content_db(db).empty());
  }

  // --- Structural errors throw ---
  GW_ASSERT(load_throws(R"({"day_rules": [{"type": "bribe_everyone", "day": 1}]})"));
  GW_ASSERT(load_throws(R"({"categories": []})"));
  GW_ASSERT(load_throws(R"({"ship_types": [{"name": "x", "origins": [1, 2]}]})"));
  GW_ASSERT(load_throws(R"([1, 2, 3])"));
  GW_ASSERT(!load_throws("{}"));

  // --- Validation reports consistency problems ---
  {
    gatewatch::ContentDB db;
    db.default_category = "Missing";

    gatewatch::FactionPolicy p;
    p.category_name = "Bare";
    p.suspicion_base_level = 1.5;
    db.categories[p.category_name] = p;

    gatewatch::ShipType s;
    s.name = "Orphan";
    s.category = "Nowhere";
    db.ship_types.push_back(s);

    gatewatch::CargoManifest m;
    m.code = "DUP";
    m.faction_restriction = gatewatch::FactionRestriction::FactionSpecific;
    m.first_day = 5;
    m.last_day = 2;
    db.manifests.push_back(m);
    db.manifests.push_back(m);

    gatewatch::AccessCode a;
    a.code = "SK-1";
    a.valid_from_day = 5;
    a.valid_until_day = 3;
    db.access_codes.push_back(a);

    db.classifier.valid_ship_chance = 1.5;

    const auto errors = gatewatch::validate_content_db(db);
    GW_ASSERT(has_error_containing(errors, "No captain types"));
    GW_ASSERT(has_error_containing(errors, "Default category 'Missing'"));
    GW_ASSERT(has_error_containing(errors, "No default captain"));
    GW_ASSERT(has_error_containing(errors, "'Bare' has no associated factions"));
    GW_ASSERT(has_error_containing(errors, "suspicion_base_level"));
    GW_ASSERT(has_error_containing(errors, "unknown category 'Nowhere'"));
    GW_ASSERT(has_error_containing(errors, "Duplicate manifest code 'DUP'"));
    GW_ASSERT(has_error_containing(errors, "lists no factions"));
    GW_ASSERT(has_error_containing(errors, "last_day before first_day"));
    GW_ASSERT(has_error_containing(errors, "expires before"));
    GW_ASSERT(has_error_containing(errors, "valid_ship_chance"));
  }

  // --- Missing file ---
  {
    bool threw = false;
    try {
      (void)gatewatch::load_content_db_from_file("data/content/does_not_exist.json");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    GW_ASSERT(threw);
  }

  gatewatch::log::set_level(gatewatch::log::Level::Info);
  return 0;
}
