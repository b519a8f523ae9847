#include "gatewatch/core/content_loader.h"

#include <set>
#include <stdexcept>

#include "gatewatch/core/enum_strings.h"
#include "gatewatch/util/file_io.h"
#include "gatewatch/util/log.h"
#include "gatewatch/util/strings.h"

namespace gatewatch {
namespace {

const json::Value* find_key(const json::Object& o, const std::string& k) {
  auto it = o.find(k);
  return it == o.end() ? nullptr : &it->second;
}

std::string get_string(const json::Object& o, const std::string& k, const std::string& def = "") {
  const auto* v = find_key(o, k);
  return v ? v->string_value(def) : def;
}

int get_int(const json::Object& o, const std::string& k, int def) {
  const auto* v = find_key(o, k);
  return v ? static_cast<int>(v->int_value(def)) : def;
}

double get_double(const json::Object& o, const std::string& k, double def) {
  const auto* v = find_key(o, k);
  return v ? v->number_value(def) : def;
}

bool get_bool(const json::Object& o, const std::string& k, bool def) {
  const auto* v = find_key(o, k);
  return v ? v->bool_value(def) : def;
}

std::vector<std::string> get_strings(const json::Object& o, const std::string& k) {
  std::vector<std::string> out;
  const auto* v = find_key(o, k);
  if (!v || v->is_null()) return out;
  for (const auto& e : v->array()) {
    if (!e.is_string()) throw std::runtime_error("Expected an array of strings for '" + k + "'");
    out.push_back(e.string_value());
  }
  return out;
}

FactionPolicy parse_category(const std::string& name, const json::Object& cj) {
  FactionPolicy p;
  p.category_name = name;
  p.description = get_string(cj, "description");
  p.associated_factions = get_strings(cj, "factions");
  p.compatible_captain_factions = get_strings(cj, "captain_factions");
  p.valid_access_code_prefixes = get_strings(cj, "access_code_prefixes");
  p.suspicion_base_level = get_double(cj, "suspicion_base_level", 0.0);
  p.requires_special_clearance = get_bool(cj, "requires_special_clearance", false);
  p.priority_access = get_bool(cj, "priority_access", false);
  p.contraband_exempt = get_bool(cj, "contraband_exempt", false);
  return p;
}

CargoManifest parse_manifest(const json::Object& mj) {
  CargoManifest m;
  m.name = get_string(mj, "name");
  m.code = get_string(mj, "code", m.name);
  m.description = get_string(mj, "description");
  m.declared_items = get_strings(mj, "items");
  m.required_clearance = clearance_level_from_string(get_string(mj, "required_clearance", "standard"));
  m.allowed_factions = get_strings(mj, "allowed_factions");
  // A manifest listing factions but no explicit restriction is faction-specific.
  const std::string restriction =
      get_string(mj, "faction_restriction", m.allowed_factions.empty() ? "universal" : "faction_specific");
  m.faction_restriction = faction_restriction_from_string(restriction);
  m.first_day = get_int(mj, "first_day", 1);
  m.last_day = get_int(mj, "last_day", -1);
  m.has_contraband = get_bool(mj, "has_contraband", false);
  m.has_false_entries = get_bool(mj, "has_false_entries", false);
  m.is_easily_detectable = get_bool(mj, "is_easily_detectable", true);
  m.suspicious_keywords = get_strings(mj, "suspicious_keywords");
  return m;
}

AccessCode parse_access_code(const json::Object& aj) {
  AccessCode a;
  a.code = get_string(aj, "code");
  a.name = get_string(aj, "name", a.code);
  a.level = access_level_from_string(get_string(aj, "level", "low"));
  a.valid_from_day = get_int(aj, "valid_from_day", 1);
  a.valid_until_day = get_int(aj, "valid_until_day", -1);
  a.revoked = get_bool(aj, "revoked", false);
  a.authorized_factions = get_strings(aj, "authorized_factions");
  return a;
}

DayRule parse_day_rule(const json::Object& rj) {
  DayRule r;
  const std::string type = get_string(rj, "type");
  if (!day_rule_type_from_string(type, r.type)) {
    throw std::runtime_error("Unknown day rule type: '" + type + "'");
  }
  r.day = get_int(rj, "day", 0);
  r.description = get_string(rj, "description");
  return r;
}

} // namespace

ContentDB load_content_db_from_json(const json::Value& root_value) {
  const auto& root = root_value.object();
  ContentDB db;

  // --- Categories ---
  if (const auto* cats = find_key(root, "categories")) {
    for (const auto& [name, v] : cats->object()) {
      db.categories[name] = parse_category(name, v.object());
    }
  }

  // --- Ships and captains ---
  if (const auto* ships = find_key(root, "ship_types")) {
    for (const auto& v : ships->array()) {
      const auto& sj = v.object();
      ShipType s;
      s.name = get_string(sj, "name");
      s.category = get_string(sj, "category");
      s.common_origins = get_strings(sj, "origins");
      s.specific_names = get_strings(sj, "names");
      db.ship_types.push_back(std::move(s));
    }
  }

  if (const auto* caps = find_key(root, "captain_types")) {
    for (const auto& v : caps->array()) {
      const auto& cj = v.object();
      CaptainType c;
      c.name = get_string(cj, "name");
      c.factions = get_strings(cj, "factions");
      c.ranks = get_strings(cj, "ranks");
      c.first_names = get_strings(cj, "first_names");
      c.last_names = get_strings(cj, "last_names");
      db.captain_types.push_back(std::move(c));
    }
  }

  // --- Paperwork ---
  if (const auto* mans = find_key(root, "manifests")) {
    for (const auto& v : mans->array()) db.manifests.push_back(parse_manifest(v.object()));
  }
  if (const auto* codes = find_key(root, "access_codes")) {
    for (const auto& v : codes->array()) db.access_codes.push_back(parse_access_code(v.object()));
  }
  if (const auto* rules = find_key(root, "day_rules")) {
    for (const auto& v : rules->array()) db.day_rules.push_back(parse_day_rule(v.object()));
  }

  if (const auto* d = find_key(root, "defaults")) {
    const auto& dj = d->object();
    db.default_category = get_string(dj, "category");
    db.default_captain = get_string(dj, "captain");
  }

  // --- Tunables (all optional) ---
  if (const auto* c = find_key(root, "classifier")) {
    const auto& cj = c->object();
    db.classifier.valid_ship_chance = get_double(cj, "valid_ship_chance", db.classifier.valid_ship_chance);
    db.classifier.story_ship_chance = get_double(cj, "story_ship_chance", db.classifier.story_ship_chance);
    db.classifier.recent_ship_memory = get_int(cj, "recent_ship_memory", db.classifier.recent_ship_memory);
  }
  if (const auto* t = find_key(root, "thresholds")) {
    const auto& tj = t->object();
    db.thresholds.imperial_threshold = get_int(tj, "imperial", db.thresholds.imperial_threshold);
    db.thresholds.insurgent_threshold = get_int(tj, "insurgent", db.thresholds.insurgent_threshold);
    db.thresholds.complex_resistance_threshold =
        get_int(tj, "complex_resistance", db.thresholds.complex_resistance_threshold);
  }
  if (const auto* c = find_key(root, "campaign")) {
    const auto& cj = c->object();
    auto& cc = db.campaign;
    if (const auto* s = find_key(cj, "seed")) cc.seed = static_cast<std::uint64_t>(s->int_value(1));
    cc.start_day = get_int(cj, "start_day", cc.start_day);
    cc.encounters_per_day = get_int(cj, "encounters_per_day", cc.encounters_per_day);
    cc.mistake_delay_days = get_int(cj, "mistake_delay_days", cc.mistake_delay_days);
    cc.wrong_approval_suspicion = get_int(cj, "wrong_approval_suspicion", cc.wrong_approval_suspicion);
    cc.wrong_approval_loyalty = get_int(cj, "wrong_approval_loyalty", cc.wrong_approval_loyalty);
    cc.wrong_denial_suspicion = get_int(cj, "wrong_denial_suspicion", cc.wrong_denial_suspicion);
    cc.wrong_denial_loyalty = get_int(cj, "wrong_denial_loyalty", cc.wrong_denial_loyalty);
  }

  return db;
}

ContentDB load_content_db_from_file(const std::string& path) {
  const auto txt = read_text_file(path);
  ContentDB db = load_content_db_from_json(json::parse(txt));
  log::info("Loaded content from " + path + ": " + std::to_string(db.categories.size()) + " categories, " +
            std::to_string(db.ship_types.size()) + " ship types, " + std::to_string(db.manifests.size()) +
            " manifests");
  return db;
}

std::vector<std::string> validate_content_db(const ContentDB& db) {
  std::vector<std::string> errors;

  if (db.categories.empty()) errors.push_back("No ship categories defined");
  if (db.ship_types.empty()) errors.push_back("No ship types defined");
  if (db.captain_types.empty()) errors.push_back("No captain types defined");

  if (db.default_category.empty()) {
    errors.push_back("No default category defined");
  } else if (!db.find_category(db.default_category)) {
    errors.push_back("Default category '" + db.default_category + "' is not a defined category");
  }
  if (db.default_captain.empty()) {
    errors.push_back("No default captain defined");
  } else if (!db.find_captain_type(db.default_captain)) {
    errors.push_back("Default captain '" + db.default_captain + "' is not a defined captain type");
  }

  for (const auto& [name, p] : db.categories) {
    if (p.associated_factions.empty()) errors.push_back("Category '" + name + "' has no associated factions");
    if (p.valid_access_code_prefixes.empty()) {
      errors.push_back("Category '" + name + "' has no valid access code prefixes");
    }
    if (p.suspicion_base_level < 0.0 || p.suspicion_base_level > 1.0) {
      errors.push_back("Category '" + name + "' has suspicion_base_level outside [0,1]");
    }
  }

  for (const auto& s : db.ship_types) {
    if (s.name.empty()) errors.push_back("Ship type with empty name");
    if (!db.find_category(s.category)) {
      errors.push_back("Ship type '" + s.name + "' references unknown category '" + s.category + "'");
    }
  }

  for (const auto& c : db.captain_types) {
    if (c.factions.empty()) errors.push_back("Captain type '" + c.name + "' has no factions");
    if (c.last_names.empty()) errors.push_back("Captain type '" + c.name + "' has no last names");
  }

  std::set<std::string> manifest_codes;
  for (const auto& m : db.manifests) {
    if (m.code.empty()) {
      errors.push_back("Manifest '" + m.name + "' has an empty code");
    } else if (!manifest_codes.insert(to_lower(m.code)).second) {
      errors.push_back("Duplicate manifest code '" + m.code + "'");
    }
    if (m.faction_restriction == FactionRestriction::FactionSpecific && m.allowed_factions.empty()) {
      errors.push_back("Manifest '" + m.code + "' is faction-specific but lists no factions");
    }
    if (m.last_day > 0 && m.last_day < m.first_day) {
      errors.push_back("Manifest '" + m.code + "' has last_day before first_day");
    }
  }

  std::set<std::string> codes;
  for (const auto& a : db.access_codes) {
    if (a.code.empty()) {
      errors.push_back("Access code '" + a.name + "' has an empty code");
    } else if (!codes.insert(to_lower(a.code)).second) {
      errors.push_back("Duplicate access code '" + a.code + "'");
    }
    if (a.valid_until_day >= 0 && a.valid_until_day < a.valid_from_day) {
      errors.push_back("Access code '" + a.code + "' expires before it becomes valid");
    }
  }

  const auto& cc = db.classifier;
  if (cc.valid_ship_chance < 0.0 || cc.valid_ship_chance > 1.0) {
    errors.push_back("classifier.valid_ship_chance outside [0,1]");
  }
  if (cc.story_ship_chance < 0.0 || cc.story_ship_chance > 1.0) {
    errors.push_back("classifier.story_ship_chance outside [0,1]");
  }
  if (db.campaign.mistake_delay_days < 0) errors.push_back("campaign.mistake_delay_days is negative");

  return errors;
}

} // namespace gatewatch
