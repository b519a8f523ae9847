#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gatewatch/core/consequence_ledger.h"
#include "gatewatch/core/content.h"
#include "gatewatch/core/decision_recorder.h"
#include "gatewatch/core/encounter_classifier.h"
#include "gatewatch/core/entities.h"
#include "gatewatch/core/narrative_classifier.h"
#include "gatewatch/util/hash_rng.h"

namespace gatewatch {

// Everything a save needs to resume a campaign.
struct CampaignState {
  int day{1};
  std::uint64_t rng_state{0};

  NarrativeState narrative;
  EndingState ending;

  std::vector<ConsequenceToken> tokens;
  int next_token_id{1};

  std::optional<DecisionChain> active_chain;
  std::vector<DecisionChain> chain_history;

  int encounters_decided{0};
  int mistakes{0};
};

struct DecisionOutcome {
  std::string decision_id;
  bool correct{false};
  // Set when the decision scheduled a consequence.
  std::optional<std::string> token_id;
};

struct DayReport {
  // The day that was just entered.
  int day{0};
  std::vector<ConsequenceToken> delivered;
};

// One checkpoint campaign.
//
// The campaign is the single owner of the session RNG, the narrative state,
// the ending state and the consequence ledger; the classifier and recorder
// hold references into it, so a Campaign is neither copyable nor movable.
class Campaign {
 public:
  explicit Campaign(ContentDB content);
  Campaign(ContentDB content, CampaignConfig cfg);

  Campaign(const Campaign&) = delete;
  Campaign& operator=(const Campaign&) = delete;

  const ContentDB& content() const { return content_; }
  const CampaignConfig& cfg() const { return cfg_; }

  int day() const { return day_; }
  const NarrativeState& narrative() const { return narrative_; }
  const EndingState& ending() const { return ending_; }
  const ConsequenceTokenLedger& ledger() const { return ledger_; }
  const DecisionRecorder& recorder() const { return recorder_; }
  const NarrativeClassifier& classifier() const { return classifier_; }

  int encounters_decided() const { return encounters_decided_; }
  int mistakes() const { return mistakes_; }

  std::vector<DayRule> active_rules() const { return content_.rules_for_day(day_); }

  Encounter generate_encounter();
  Encounter generate_story_encounter(const std::string& tag);

  // Records the operator's call. An incorrect call schedules a consequence
  // cfg().mistake_delay_days out.
  DecisionOutcome decide(const Encounter& encounter, bool approved);

  // Records a free-form decision (inferred category and pressure).
  const DecisionRecord& record_decision(const std::string& id, int imperial_points, int insurgent_points,
                                        const std::string& context);

  // Accepting a bribe: a Financial decision plus corruption.
  void accept_bribe(const std::string& source, int credits);

  bool record_story_beat(const std::string& beat_id);
  bool lock_ending_path(EndingPath path);

  // Moves to the next day and delivers every consequence that is due,
  // folding each payload into the ending state. A day with no deliveries
  // lowers suspicion by one (floor 0).
  DayReport advance_day();

  // Narrative notifications queued since the last drain.
  std::vector<NarrativeEvent> drain_events() { return classifier_.drain_events(); }

  EndingType determine_ending() const;
  EndingPath suggested_ending_path() const;

  // Debug summary: narrative report, ledger, ending projection.
  std::string generate_report() const;

  // Resets every piece of per-session state. The seed defaults to cfg().seed.
  void new_game();
  void new_game(std::uint64_t seed);

  CampaignState snapshot() const;

  // Throws std::invalid_argument on an inconsistent state (day < 1, tokens
  // triggering before they were created, negative counters).
  void restore(CampaignState state);

 private:
  ContentDB content_;
  CampaignConfig cfg_;
  util::HashRng rng_;

  int day_{1};
  NarrativeState narrative_;
  EndingState ending_;

  NarrativeClassifier classifier_;
  DecisionRecorder recorder_;
  ConsequenceTokenLedger ledger_;
  EncounterClassifier encounters_;

  int encounters_decided_{0};
  int mistakes_{0};
};

} // namespace gatewatch
