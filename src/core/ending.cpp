#include "gatewatch/core/ending.h"

#include <algorithm>

#include "gatewatch/core/enum_strings.h"
#include "gatewatch/util/log.h"

namespace gatewatch {
namespace {

constexpr int kPathConsequenceDelayDays = 2;

int clamp_level(int v) { return std::clamp(v, 0, 100); }

} // namespace

const std::vector<StoryBeat>& story_beats() {
  static const std::vector<StoryBeat> beats = {
      {"THE_DEFECTOR", "Let an Imperial defector through the gate", -2, 5, EndingPath::None},
      {"THE_PURGE_ORDER", "Carried out the purge order", 5, -2, EndingPath::None},
      {"THE_CHILD_TRANSPORT", "Cleared a transport of refugee children", -1, 3, EndingPath::None},
      {"THE_WEAPONS_INSPECTOR", "Passed the weapons inspector's loyalty test", 3, -1, EndingPath::None},
      {"THE_SPY_EXTRACTION", "Covered an insurgent spy extraction", -5, 8, EndingPath::Rebel},
      {"THE_FAMILY_BETRAYAL", "Turned a family member over to Imperial security", 8, -5, EndingPath::Imperial},
  };
  return beats;
}

const StoryBeat* find_story_beat(const std::string& id) {
  for (const auto& b : story_beats()) {
    if (b.id == id) return &b;
  }
  return nullptr;
}

void update_suspicion(EndingState& s, int change) { s.suspicion_level = clamp_level(s.suspicion_level + change); }

void update_corruption(EndingState& s, int change) {
  s.corruption_level = clamp_level(s.corruption_level + change);
  if (s.corruption_level > 50) update_suspicion(s, 1);
}

void apply_consequence(EndingState& s, const ConsequencePayload& payload) {
  update_suspicion(s, payload.suspicion_increase);
  s.loyalty_adjustment += payload.loyalty_impact;
  if (payload.affects_family) s.family_incidents += 1;
}

double family_status_score(const EndingState& s) {
  return std::max(0.0, 1.0 - 0.2 * static_cast<double>(s.family_incidents));
}

double alignment_score(const NarrativeState& n, const EndingState& s) {
  const double a = static_cast<double>(n.imperial_loyalty + s.loyalty_adjustment - n.insurgent_sympathy) / 200.0;
  return std::clamp(a, -1.0, 1.0);
}

ConsequencePayload ending_path_consequence(EndingPath path) {
  ConsequencePayload p;
  switch (path) {
    case EndingPath::Rebel:
      p.scenario = "ENDING_PATH_REBEL";
      p.news_headline = "Security Alert: Increased Rebel Activity Detected";
      p.loyalty_impact = -3;
      p.suspicion_increase = 10;
      p.affects_family = true;
      break;
    case EndingPath::Imperial:
      p.scenario = "ENDING_PATH_IMPERIAL";
      p.news_headline = "Command Commends Loyalty: Exemplary Service Recognized";
      p.loyalty_impact = 3;
      break;
    case EndingPath::Neutral:
      p.scenario = "ENDING_PATH_NEUTRAL";
      p.news_headline = "Personnel Review: Standard Performance Evaluation";
      p.suspicion_increase = 2;
      break;
    case EndingPath::Corrupt:
      p.scenario = "ENDING_PATH_CORRUPT";
      p.news_headline = "Internal Affairs: Random Audit Procedures Implemented";
      p.loyalty_impact = -1;
      p.suspicion_increase = 15;
      p.affects_family = true;
      break;
    case EndingPath::None:
      break;
  }
  return p;
}

bool lock_ending_path(EndingState& s, EndingPath path, ConsequenceTokenLedger& ledger) {
  if (s.point_of_no_return_reached || path == EndingPath::None) return false;

  s.locked_path = path;
  s.point_of_no_return_reached = true;
  log::info("Ending path locked: " + ending_path_to_string(path));

  ConsequencePayload payload = ending_path_consequence(path);
  const std::string source = payload.scenario;
  ledger.add_token(source, kPathConsequenceDelayDays, std::move(payload));
  return true;
}

bool record_story_beat(const std::string& beat_id, EndingState& s, DecisionRecorder& recorder,
                       ConsequenceTokenLedger& ledger) {
  const StoryBeat* beat = find_story_beat(beat_id);
  if (!beat) {
    log::warn("Unknown story beat: " + beat_id);
    return false;
  }
  if (std::find(s.completed_story_beats.begin(), s.completed_story_beats.end(), beat_id) !=
      s.completed_story_beats.end()) {
    return false;
  }

  s.completed_story_beats.push_back(beat_id);
  recorder.record(beat->id, beat->imperial_points, beat->insurgent_points, beat->context, DecisionCategory::Political,
                  infer_decision_pressure(beat->imperial_points, beat->insurgent_points));
  if (beat->locks != EndingPath::None) lock_ending_path(s, beat->locks, ledger);
  log::info("Story beat completed: " + beat_id);
  return true;
}

EndingType ending_for_locked_path(EndingPath path, const EndingState& s) {
  switch (path) {
    case EndingPath::Rebel:
      return family_status_score(s) > 0.7 ? EndingType::FreedomFighter : EndingType::Martyr;
    case EndingPath::Imperial:
      return s.corruption_level < 30 ? EndingType::ImperialHero : EndingType::BridgeCommander;
    case EndingPath::Neutral:
      return s.suspicion_level < 50 ? EndingType::GrayMan : EndingType::Compromised;
    case EndingPath::Corrupt:
      return EndingType::Compromised;
    case EndingPath::None:
      break;
  }
  return EndingType::GrayMan;
}

EndingType ending_from_scores(double alignment, double corruption, double family, int suspicion) {
  // High corruption overrides everything else.
  if (corruption > 0.7) return EndingType::Compromised;

  if (alignment < -0.6) {
    if (family > 0.8) return EndingType::FreedomFighter;
    if (family > 0.4) return EndingType::Underground;
    return EndingType::Refugee;
  }
  if (alignment > 0.6) {
    if (corruption < 0.2 && family > 0.6) return EndingType::GoodSoldier;
    if (corruption < 0.3) return EndingType::TrueBeliever;
    return EndingType::BridgeCommander;
  }
  if (alignment < -0.2) return family > 0.5 ? EndingType::Refugee : EndingType::Underground;
  if (alignment > 0.2) return family > 0.5 ? EndingType::GoodSoldier : EndingType::TrueBeliever;

  return suspicion > 50 ? EndingType::Compromised : EndingType::GrayMan;
}

EndingType determine_ending(const NarrativeState& n, const EndingState& s) {
  if (s.point_of_no_return_reached && s.locked_path != EndingPath::None) {
    return ending_for_locked_path(s.locked_path, s);
  }
  return ending_from_scores(alignment_score(n, s), static_cast<double>(s.corruption_level) / 100.0,
                            family_status_score(s), s.suspicion_level);
}

EndingPath suggested_ending_path(const NarrativeState& n, const EndingState& s) {
  const double a = alignment_score(n, s);
  if (s.corruption_level > 60) return EndingPath::Corrupt;
  if (a < -0.5) return EndingPath::Rebel;
  if (a > 0.5) return EndingPath::Imperial;
  return EndingPath::Neutral;
}

} // namespace gatewatch
