#include "gatewatch/core/serialization.h"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include "gatewatch/core/enum_strings.h"
#include "gatewatch/util/log.h"

namespace gatewatch {
namespace {

using json::Array;
using json::Object;
using json::Value;

constexpr int kCurrentSaveVersion = 1;

// The RNG state uses all 64 bits, more than a JSON number can hold exactly.
std::string u64_to_hex(std::uint64_t v) {
  char buf[19];
  std::snprintf(buf, sizeof(buf), "0x%016llx", static_cast<unsigned long long>(v));
  return buf;
}

std::uint64_t u64_from_hex(const std::string& s) {
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s.c_str(), &end, 16);
  if (s.empty() || !end || *end != '\0') throw std::runtime_error("Invalid rng_state: '" + s + "'");
  return static_cast<std::uint64_t>(v);
}

Value strings_to_json(const std::vector<std::string>& v) {
  Array a;
  for (const auto& s : v) a.push_back(s);
  return a;
}

std::vector<std::string> strings_from_json(const Value& v) {
  std::vector<std::string> out;
  for (const auto& e : v.array()) out.push_back(e.string_value());
  return out;
}

int int_or(const Object& o, const char* key, int def) {
  auto it = o.find(key);
  return it == o.end() ? def : static_cast<int>(it->second.int_value(def));
}

Value decision_to_json(const DecisionRecord& d) {
  Object o;
  o["id"] = d.id;
  o["timestamp_ms"] = d.timestamp_ms;
  o["imperial_points"] = d.imperial_points;
  o["insurgent_points"] = d.insurgent_points;
  o["category"] = decision_category_to_string(d.category);
  o["pressure"] = decision_pressure_to_string(d.pressure);
  o["context"] = d.context;
  if (d.chain_parent_id) o["chain_parent_id"] = *d.chain_parent_id;
  return o;
}

DecisionRecord decision_from_json(const Value& v) {
  const auto& o = v.object();
  DecisionRecord d;
  d.id = o.at("id").string_value();
  if (auto it = o.find("timestamp_ms"); it != o.end()) d.timestamp_ms = it->second.int_value(0);
  d.imperial_points = int_or(o, "imperial_points", 0);
  d.insurgent_points = int_or(o, "insurgent_points", 0);
  if (auto it = o.find("category"); it != o.end()) d.category = decision_category_from_string(it->second.string_value());
  if (auto it = o.find("pressure"); it != o.end()) d.pressure = decision_pressure_from_string(it->second.string_value());
  if (auto it = o.find("context"); it != o.end()) d.context = it->second.string_value();
  if (auto it = o.find("chain_parent_id"); it != o.end() && it->second.is_string()) {
    d.chain_parent_id = it->second.string_value();
  }
  return d;
}

Value token_to_json(const ConsequenceToken& t) {
  Object p;
  p["scenario"] = t.payload.scenario;
  p["news_headline"] = t.payload.news_headline;
  p["loyalty_impact"] = t.payload.loyalty_impact;
  p["suspicion_increase"] = t.payload.suspicion_increase;
  p["affects_family"] = t.payload.affects_family;

  Object o;
  o["id"] = t.id;
  o["source_decision"] = t.source_decision;
  o["day_created"] = t.day_created;
  o["trigger_day"] = t.trigger_day;
  o["has_triggered"] = t.has_triggered;
  o["payload"] = Value(std::move(p));
  return o;
}

ConsequenceToken token_from_json(const Value& v) {
  const auto& o = v.object();
  ConsequenceToken t;
  t.id = o.at("id").string_value();
  if (auto it = o.find("source_decision"); it != o.end()) t.source_decision = it->second.string_value();
  t.day_created = int_or(o, "day_created", 0);
  t.trigger_day = int_or(o, "trigger_day", t.day_created);
  if (auto it = o.find("has_triggered"); it != o.end()) t.has_triggered = it->second.bool_value(false);
  if (auto it = o.find("payload"); it != o.end()) {
    const auto& p = it->second.object();
    if (auto pi = p.find("scenario"); pi != p.end()) t.payload.scenario = pi->second.string_value();
    if (auto pi = p.find("news_headline"); pi != p.end()) t.payload.news_headline = pi->second.string_value();
    t.payload.loyalty_impact = int_or(p, "loyalty_impact", 0);
    t.payload.suspicion_increase = int_or(p, "suspicion_increase", 0);
    if (auto pi = p.find("affects_family"); pi != p.end()) t.payload.affects_family = pi->second.bool_value(false);
  }
  return t;
}

Value chain_to_json(const DecisionChain& c) {
  Object o;
  o["id"] = c.id;
  o["length"] = c.length;
  o["decision_ids"] = strings_to_json(c.decision_ids);
  return o;
}

DecisionChain chain_from_json(const Value& v) {
  const auto& o = v.object();
  DecisionChain c;
  c.id = o.at("id").string_value();
  c.length = int_or(o, "length", 0);
  if (auto it = o.find("decision_ids"); it != o.end()) c.decision_ids = strings_from_json(it->second);
  return c;
}

} // namespace

json::Value serialize_campaign_to_json_value(const CampaignState& s) {
  Object root;
  root["save_version"] = kCurrentSaveVersion;
  root["day"] = s.day;
  root["rng_state"] = u64_to_hex(s.rng_state);
  root["encounters_decided"] = s.encounters_decided;
  root["mistakes"] = s.mistakes;

  // --- Narrative ---
  Object n;
  n["imperial_loyalty"] = s.narrative.imperial_loyalty;
  n["insurgent_sympathy"] = s.narrative.insurgent_sympathy;
  if (s.narrative.current_branch) {
    n["current_branch"] = narrative_branch_to_string(*s.narrative.current_branch);
  } else {
    n["current_branch"] = nullptr;
  }
  n["progression_level"] = s.narrative.progression_level;
  n["unlocked_story_tags"] =
      strings_to_json(std::vector<std::string>(s.narrative.unlocked_story_tags.begin(),
                                               s.narrative.unlocked_story_tags.end()));
  Array decisions;
  for (const auto& d : s.narrative.decisions) decisions.push_back(decision_to_json(d));
  n["decisions"] = Value(std::move(decisions));
  root["narrative"] = Value(std::move(n));

  // --- Chains ---
  Object chains;
  if (s.active_chain) {
    chains["active"] = chain_to_json(*s.active_chain);
  } else {
    chains["active"] = nullptr;
  }
  Array history;
  for (const auto& c : s.chain_history) history.push_back(chain_to_json(c));
  chains["history"] = Value(std::move(history));
  root["chains"] = Value(std::move(chains));

  // --- Ledger ---
  Object ledger;
  ledger["next_id"] = s.next_token_id;
  Array tokens;
  for (const auto& t : s.tokens) tokens.push_back(token_to_json(t));
  ledger["tokens"] = Value(std::move(tokens));
  root["ledger"] = Value(std::move(ledger));

  // --- Ending ---
  Object e;
  e["corruption_level"] = s.ending.corruption_level;
  e["suspicion_level"] = s.ending.suspicion_level;
  e["loyalty_adjustment"] = s.ending.loyalty_adjustment;
  e["family_incidents"] = s.ending.family_incidents;
  e["point_of_no_return_reached"] = s.ending.point_of_no_return_reached;
  e["locked_path"] = ending_path_to_string(s.ending.locked_path);
  e["completed_story_beats"] = strings_to_json(s.ending.completed_story_beats);
  root["ending"] = Value(std::move(e));

  return root;
}

std::string serialize_campaign_to_json(const CampaignState& s) {
  return json::stringify(serialize_campaign_to_json_value(s), 2);
}

CampaignState deserialize_campaign_from_json(const std::string& json_text) {
  const auto root_value = json::parse(json_text);
  const auto& root = root_value.object();

  CampaignState s;
  const int version = int_or(root, "save_version", kCurrentSaveVersion);
  if (version > kCurrentSaveVersion) {
    log::warn("Save version " + std::to_string(version) + " is newer than supported (" +
              std::to_string(kCurrentSaveVersion) + ")");
  }

  s.day = int_or(root, "day", 1);
  if (auto it = root.find("rng_state"); it != root.end()) s.rng_state = u64_from_hex(it->second.string_value());
  s.encounters_decided = int_or(root, "encounters_decided", 0);
  s.mistakes = int_or(root, "mistakes", 0);

  if (auto it = root.find("narrative"); it != root.end()) {
    const auto& n = it->second.object();
    s.narrative.imperial_loyalty = int_or(n, "imperial_loyalty", 0);
    s.narrative.insurgent_sympathy = int_or(n, "insurgent_sympathy", 0);
    if (auto b = n.find("current_branch"); b != n.end() && b->second.is_string()) {
      s.narrative.current_branch = narrative_branch_from_string(b->second.string_value());
    }
    s.narrative.progression_level = int_or(n, "progression_level", 0);
    if (auto t = n.find("unlocked_story_tags"); t != n.end()) {
      for (auto& tag : strings_from_json(t->second)) s.narrative.unlocked_story_tags.insert(std::move(tag));
    }
    if (auto d = n.find("decisions"); d != n.end()) {
      for (const auto& v : d->second.array()) s.narrative.decisions.push_back(decision_from_json(v));
    }
  }

  if (auto it = root.find("chains"); it != root.end()) {
    const auto& c = it->second.object();
    if (auto a = c.find("active"); a != c.end() && a->second.is_object()) s.active_chain = chain_from_json(a->second);
    if (auto h = c.find("history"); h != c.end()) {
      for (const auto& v : h->second.array()) s.chain_history.push_back(chain_from_json(v));
    }
  }

  if (auto it = root.find("ledger"); it != root.end()) {
    const auto& l = it->second.object();
    if (auto t = l.find("tokens"); t != l.end()) {
      for (const auto& v : t->second.array()) s.tokens.push_back(token_from_json(v));
    }
    s.next_token_id = int_or(l, "next_id", static_cast<int>(s.tokens.size()) + 1);
  }

  if (auto it = root.find("ending"); it != root.end()) {
    const auto& e = it->second.object();
    s.ending.corruption_level = int_or(e, "corruption_level", 0);
    s.ending.suspicion_level = int_or(e, "suspicion_level", 0);
    s.ending.loyalty_adjustment = int_or(e, "loyalty_adjustment", 0);
    s.ending.family_incidents = int_or(e, "family_incidents", 0);
    if (auto p = e.find("point_of_no_return_reached"); p != e.end()) {
      s.ending.point_of_no_return_reached = p->second.bool_value(false);
    }
    if (auto p = e.find("locked_path"); p != e.end()) {
      s.ending.locked_path = ending_path_from_string(p->second.string_value());
    }
    if (auto b = e.find("completed_story_beats"); b != e.end()) {
      s.ending.completed_story_beats = strings_from_json(b->second);
    }
  }

  return s;
}

} // namespace gatewatch
