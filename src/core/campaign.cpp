#include "gatewatch/core/campaign.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "gatewatch/core/ending.h"
#include "gatewatch/core/enum_strings.h"
#include "gatewatch/util/log.h"

namespace gatewatch {

Campaign::Campaign(ContentDB content) : Campaign(content, content.campaign) {}

Campaign::Campaign(ContentDB content, CampaignConfig cfg)
    : content_(std::move(content)),
      cfg_(cfg),
      rng_(cfg.seed),
      classifier_(content_.thresholds),
      recorder_(narrative_, classifier_),
      encounters_(content_, rng_, content_.classifier) {
  new_game(cfg_.seed);
}

Encounter Campaign::generate_encounter() {
  return encounters_.generate(day_, narrative_.imperial_loyalty, narrative_.insurgent_sympathy);
}

Encounter Campaign::generate_story_encounter(const std::string& tag) {
  return encounters_.generate_story_encounter(tag, day_);
}

DecisionOutcome Campaign::decide(const Encounter& e, bool approved) {
  DecisionOutcome out;
  out.correct = approved == e.should_approve;

  const DecisionRecord& rec = recorder_.record_ship_decision(e, approved);
  out.decision_id = rec.id;
  ++encounters_decided_;

  if (!out.correct) {
    ++mistakes_;
    ConsequencePayload p;
    if (approved) {
      p.scenario = "SECURITY_BREACH";
      p.news_headline = "Unauthorized vessel " + e.ship_name + " cleared at checkpoint";
      p.loyalty_impact = cfg_.wrong_approval_loyalty;
      p.suspicion_increase = cfg_.wrong_approval_suspicion;
    } else {
      p.scenario = "CAPTAIN_COMPLAINT";
      p.news_headline = "Captain of " + e.ship_name + " files complaint over denied clearance";
      p.loyalty_impact = cfg_.wrong_denial_loyalty;
      p.suspicion_increase = cfg_.wrong_denial_suspicion;
    }
    out.token_id = ledger_.add_token(out.decision_id, cfg_.mistake_delay_days, std::move(p)).id;
  }
  return out;
}

const DecisionRecord& Campaign::record_decision(const std::string& id, int imperial_points, int insurgent_points,
                                                const std::string& context) {
  return recorder_.record(id, imperial_points, insurgent_points, context);
}

void Campaign::accept_bribe(const std::string& source, int credits) {
  const int amount = std::max(0, credits);
  recorder_.record("bribe_" + source, 0, 2, "Accepted " + std::to_string(amount) + " credits from " + source,
                   DecisionCategory::Financial, DecisionPressure::Medium);
  update_corruption(ending_, std::max(1, amount / 100));
}

bool Campaign::record_story_beat(const std::string& beat_id) {
  return gatewatch::record_story_beat(beat_id, ending_, recorder_, ledger_);
}

bool Campaign::lock_ending_path(EndingPath path) { return gatewatch::lock_ending_path(ending_, path, ledger_); }

DayReport Campaign::advance_day() {
  ++day_;
  DayReport report;
  report.day = day_;
  report.delivered = ledger_.process_day(day_);
  for (const auto& t : report.delivered) {
    apply_consequence(ending_, t.payload);
    if (!t.payload.news_headline.empty()) log::info("News: " + t.payload.news_headline);
  }
  // Suspicion cools off by one on a day without incidents.
  if (report.delivered.empty()) update_suspicion(ending_, -1);
  return report;
}

EndingType Campaign::determine_ending() const { return gatewatch::determine_ending(narrative_, ending_); }

EndingPath Campaign::suggested_ending_path() const { return gatewatch::suggested_ending_path(narrative_, ending_); }

std::string Campaign::generate_report() const {
  std::ostringstream ss;
  ss << generate_narrative_report(narrative_);

  ss << "=== Campaign ===\n";
  ss << "Day:                " << day_ << "\n";
  ss << "Encounters decided: " << encounters_decided_ << " (" << mistakes_ << " mistakes)\n";
  ss << "Suspicion:          " << ending_.suspicion_level << "\n";
  ss << "Corruption:         " << ending_.corruption_level << "\n";
  ss << "Family score:       " << family_status_score(ending_) << "\n";
  ss << "Locked path:        " << ending_path_to_string(ending_.locked_path) << "\n";
  ss << "Suggested path:     " << ending_path_to_string(suggested_ending_path()) << "\n";
  ss << "Projected ending:   " << ending_type_to_string(determine_ending()) << "\n";

  const auto& tokens = ledger_.tokens();
  const auto pending = ledger_.active_tokens();
  ss << "=== Consequences ===\n";
  ss << "Scheduled: " << tokens.size() << ", pending: " << pending.size() << ", due within 3 days: "
     << ledger_.upcoming_token_count(3) << "\n";
  for (const auto& t : pending) {
    ss << "  - " << t.id << " day " << t.trigger_day << ": " << t.payload.scenario << "\n";
  }
  return ss.str();
}

void Campaign::new_game() { new_game(cfg_.seed); }

void Campaign::new_game(std::uint64_t seed) {
  rng_.set_state(seed);
  day_ = std::max(1, cfg_.start_day);
  narrative_ = NarrativeState{};
  ending_ = EndingState{};
  classifier_.drain_events();
  recorder_.reset();
  ledger_.reset(day_);
  encounters_.clear_history();
  encounters_decided_ = 0;
  mistakes_ = 0;
}

CampaignState Campaign::snapshot() const {
  CampaignState s;
  s.day = day_;
  s.rng_state = rng_.state();
  s.narrative = narrative_;
  s.ending = ending_;
  s.tokens = ledger_.tokens();
  s.next_token_id = ledger_.next_id();
  s.active_chain = recorder_.active_chain();
  s.chain_history = recorder_.chain_history();
  s.encounters_decided = encounters_decided_;
  s.mistakes = mistakes_;
  return s;
}

void Campaign::restore(CampaignState s) {
  if (s.day < 1) throw std::invalid_argument("Campaign state has day < 1");
  if (s.encounters_decided < 0 || s.mistakes < 0) throw std::invalid_argument("Campaign state has negative counters");
  if (s.narrative.progression_level < 0) throw std::invalid_argument("Campaign state has negative progression");
  for (const auto& t : s.tokens) {
    if (t.trigger_day < t.day_created) {
      throw std::invalid_argument("Consequence token " + t.id + " triggers before it was created");
    }
  }

  day_ = s.day;
  rng_.set_state(s.rng_state);
  narrative_ = std::move(s.narrative);
  ending_ = std::move(s.ending);
  classifier_.drain_events();
  recorder_.restore_chains(std::move(s.active_chain), std::move(s.chain_history));
  ledger_.restore(std::move(s.tokens), day_, s.next_token_id);
  encounters_.clear_history();
  encounters_decided_ = s.encounters_decided;
  mistakes_ = s.mistakes;
}

} // namespace gatewatch
