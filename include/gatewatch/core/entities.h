#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace gatewatch {

// --- Credentials and cargo ---

// Permission tier carried by a ship's credential.
enum class AccessLevel { Low, Medium, High, Unrestricted };

// Ordinal restriction on a cargo manifest. The order is total and fixed:
// Standard < Restricted < Classified.
enum class ClearanceLevel { Standard = 0, Restricted = 1, Classified = 2 };

struct AccessCode {
  std::string name;
  std::string code;
  AccessLevel level{AccessLevel::Low};

  // Inclusive validity window in campaign days. valid_until_day < 0 means the
  // code never expires.
  int valid_from_day{1};
  int valid_until_day{-1};
  bool revoked{false};

  // Factions allowed to present this code. Empty = any faction.
  std::vector<std::string> authorized_factions;

  bool active_on(int day) const {
    if (revoked) return false;
    if (day < valid_from_day) return false;
    if (valid_until_day >= 0 && day > valid_until_day) return false;
    return true;
  }
};

enum class FactionRestriction { Universal, FactionSpecific };

struct CargoManifest {
  std::string name;
  std::string code;
  std::string description;
  std::vector<std::string> declared_items;

  ClearanceLevel required_clearance{ClearanceLevel::Standard};

  FactionRestriction faction_restriction{FactionRestriction::Universal};
  std::vector<std::string> allowed_factions;

  // Day window. last_day <= 0 means no upper bound.
  int first_day{1};
  int last_day{-1};

  bool has_contraband{false};
  bool has_false_entries{false};
  bool is_easily_detectable{true};

  // Words an inspector would flag; matched against keywords pulled from the
  // active day rules.
  std::vector<std::string> suspicious_keywords;
};

enum class DayRuleType {
  VerifyOrigin,
  VerifyManifest,
  CheckForContraband,
  CheckForIntelligence,
  ForceInspection,
  AccessCodeChange,
};

struct DayRule {
  DayRuleType type{DayRuleType::VerifyManifest};
  // Campaign day the rule is posted for. <= 0 = posted every day.
  int day{0};
  std::string description;
};

// --- Ships and crews ---

struct ShipType {
  std::string name;
  std::string category;
  std::vector<std::string> common_origins;
  std::vector<std::string> specific_names;
};

struct CaptainType {
  std::string name;
  // Declaration order matters: encounter generation takes the first faction
  // that the ship category accepts.
  std::vector<std::string> factions;
  std::vector<std::string> ranks;
  std::vector<std::string> first_names;
  std::vector<std::string> last_names;
};

// Which of the four manifest checks rejected an encounter (or the access-code
// prefix check that follows them).
enum class FailedCheck {
  None,
  MissingManifest,
  Faction,
  Day,
  Clearance,
  DayRule,
  AccessCode,
};

struct Encounter {
  int day{1};

  std::string ship_type;
  std::string ship_name;
  std::string category;
  std::string faction;
  std::string origin;

  std::string captain_name;
  std::string captain_rank;
  std::string captain_faction;

  std::string access_code;
  // Absent for forged codes; validation then treats the ship as cleared for
  // Standard cargo only.
  std::optional<AccessCode> access_code_data;

  std::optional<CargoManifest> manifest;

  bool is_story_ship{false};
  std::string story_tag;

  // Ground truth computed at generation time.
  bool should_approve{false};
  FailedCheck failed_check{FailedCheck::None};
  std::string invalid_reason;

  // Set when no captain matched the ship category and the default pairing was used.
  bool degraded_match{false};
};

// --- Decisions and narrative ---

enum class DecisionCategory { Tactical, Financial, Political, Moral };

enum class DecisionPressure { Low = 0, Medium = 1, High = 2, Critical = 3 };

// Immutable once appended to the history.
struct DecisionRecord {
  std::string id;
  // Wall-clock milliseconds since the Unix epoch. Informational only.
  std::int64_t timestamp_ms{0};
  int imperial_points{0};
  int insurgent_points{0};
  DecisionCategory category{DecisionCategory::Tactical};
  DecisionPressure pressure{DecisionPressure::Low};
  std::string context;
  // Id of the decision chain this record extends, if any.
  std::optional<std::string> chain_parent_id;
};

enum class NarrativeBranch {
  Neutral,
  ImperiumPath,
  InsurgentPath,
  ComplexResistance,
  DoubleCross,
  SilentDefiance,
};

struct NarrativeState {
  int imperial_loyalty{0};
  int insurgent_sympathy{0};

  // Unset until the first decision has been classified.
  std::optional<NarrativeBranch> current_branch;
  int progression_level{0};

  std::set<std::string> unlocked_story_tags;
  std::vector<DecisionRecord> decisions;
};

// --- Delayed consequences ---

struct ConsequencePayload {
  // Scenario the encounter system should queue. Not checked here.
  std::string scenario;
  std::string news_headline;
  int loyalty_impact{0};
  int suspicion_increase{0};
  bool affects_family{false};
};

struct ConsequenceToken {
  std::string id;
  std::string source_decision;
  int day_created{0};
  int trigger_day{0};
  bool has_triggered{false};
  ConsequencePayload payload;
};

// --- Endings ---

enum class EndingPath { None, Imperial, Rebel, Neutral, Corrupt };

enum class EndingType {
  FreedomFighter,
  Martyr,
  Refugee,
  Underground,
  GrayMan,
  Compromised,
  GoodSoldier,
  TrueBeliever,
  BridgeCommander,
  ImperialHero,
};

// Campaign-level inputs to the ending beyond the loyalty totals.
struct EndingState {
  // 0..100 each.
  int corruption_level{0};
  int suspicion_level{0};

  // Running adjustment from delivered consequences; folded into the alignment
  // score but never into the narrative branch.
  int loyalty_adjustment{0};

  // Consequences that touched the family (lowers the family score).
  int family_incidents{0};

  bool point_of_no_return_reached{false};
  EndingPath locked_path{EndingPath::None};

  std::vector<std::string> completed_story_beats;
};

} // namespace gatewatch
