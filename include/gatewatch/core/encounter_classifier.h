#pragma once

#include <deque>
#include <string>

#include "gatewatch/core/content.h"
#include "gatewatch/core/entities.h"
#include "gatewatch/util/hash_rng.h"

namespace gatewatch {

// Story tags carried by story ships.
inline constexpr const char* kStoryTagImperium = "imperium";
inline constexpr const char* kStoryTagInsurgent = "insurgent";

// Fills in should_approve / failed_check / invalid_reason for an encounter
// from its manifest, access code and category, using the rules posted for
// encounter.day.
//
// should_approve = manifest verdict AND category access-code prefix check.
// The reason names the first failing check in the order: faction, day,
// clearance, day rule, access code.
void classify_encounter(Encounter& encounter, const ContentDB& content);

// Composes FactionPolicy and ManifestPolicy into generated encounters.
//
// The classifier borrows the content and the session RNG; both must outlive
// it. It keeps a short memory of recently generated ship types so the same
// hull does not show up twice in a row.
class EncounterClassifier {
 public:
  EncounterClassifier(const ContentDB& content, util::HashRng& rng);
  EncounterClassifier(const ContentDB& content, util::HashRng& rng, ClassifierConfig cfg);

  // Throws std::runtime_error when the content has no ship types or the
  // default category is missing.
  Encounter generate(int day, int imperial_loyalty, int insurgent_sympathy);

  // Same as generate() but always produces a story ship carrying `tag`.
  Encounter generate_story_encounter(const std::string& tag, int day);

  const ClassifierConfig& config() const { return cfg_; }
  const std::deque<std::string>& recent_ship_types() const { return recent_; }
  void clear_history() { recent_.clear(); }

 private:
  Encounter generate_impl(int day, const std::string& forced_tag, int imperial_loyalty, int insurgent_sympathy);

  const ShipType& pick_ship_type();
  const FactionPolicy& resolve_category(const std::string& name) const;
  void assign_captain(Encounter& e, const FactionPolicy& policy);
  void assign_access_code(Encounter& e, const FactionPolicy& policy, bool valid_intent);
  void assign_manifest(Encounter& e, bool valid_intent);
  std::string story_tag_for(int imperial_loyalty, int insurgent_sympathy);

  template <typename T>
  const T& pick(const std::vector<T>& v) {
    return v[rng_.index(v.size())];
  }

  const ContentDB& content_;
  util::HashRng& rng_;
  ClassifierConfig cfg_;
  std::deque<std::string> recent_;
};

} // namespace gatewatch
