#include "gatewatch/core/narrative_classifier.h"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "gatewatch/core/enum_strings.h"
#include "gatewatch/util/log.h"
#include "gatewatch/util/strings.h"

namespace gatewatch {

bool has_double_cross_signal(const std::vector<DecisionRecord>& decisions) {
  const std::size_t n = std::min<std::size_t>(decisions.size(), kRecentContextWindow);
  for (std::size_t i = decisions.size() - n; i < decisions.size(); ++i) {
    const std::string& ctx = decisions[i].context;
    if (icontains(ctx, "betrayal") || icontains(ctx, "manipulation")) return true;
  }
  return false;
}

NarrativeBranch classify_branch(const NarrativeState& state, const NarrativeThresholds& t) {
  const int diff = state.imperial_loyalty - state.insurgent_sympathy;

  if (std::abs(diff) < kNeutralBand) return NarrativeBranch::Neutral;
  if (diff > t.imperial_threshold) return NarrativeBranch::ImperiumPath;
  if (diff < t.insurgent_threshold) return NarrativeBranch::InsurgentPath;
  if (std::abs(diff) < t.complex_resistance_threshold) {
    return has_double_cross_signal(state.decisions) ? NarrativeBranch::DoubleCross
                                                    : NarrativeBranch::ComplexResistance;
  }
  return NarrativeBranch::SilentDefiance;
}

NarrativeBranch NarrativeClassifier::determine_branch(const NarrativeState& state) const {
  return classify_branch(state, thresholds_);
}

bool NarrativeClassifier::update_progression(NarrativeState& state) {
  const NarrativeBranch next = determine_branch(state);
  if (state.current_branch && *state.current_branch == next) return false;

  state.current_branch = next;
  state.progression_level += 1;

  NarrativeEvent ev;
  ev.kind = NarrativeEventKind::BranchChanged;
  ev.branch = next;
  ev.progression_level = state.progression_level;
  events_.push_back(ev);

  log::info("Narrative branch -> " + narrative_branch_to_string(next) + " (level " +
            std::to_string(state.progression_level) + ")");
  return true;
}

bool NarrativeClassifier::unlock_story_tag(NarrativeState& state, const std::string& tag) {
  if (!state.unlocked_story_tags.insert(tag).second) return false;

  NarrativeEvent ev;
  ev.kind = NarrativeEventKind::TagUnlocked;
  ev.branch = state.current_branch.value_or(NarrativeBranch::Neutral);
  ev.tag = tag;
  ev.progression_level = state.progression_level;
  events_.push_back(std::move(ev));

  log::debug("Story tag unlocked: " + tag);
  return true;
}

bool NarrativeClassifier::is_story_tag_unlocked(const NarrativeState& state, const std::string& tag) const {
  return state.unlocked_story_tags.count(tag) > 0;
}

std::vector<NarrativeEvent> NarrativeClassifier::drain_events() {
  std::vector<NarrativeEvent> out;
  out.swap(events_);
  return out;
}

std::string generate_narrative_report(const NarrativeState& state) {
  std::ostringstream ss;
  ss << "=== Narrative report ===\n";
  ss << "Imperial loyalty:   " << state.imperial_loyalty << "\n";
  ss << "Insurgent sympathy: " << state.insurgent_sympathy << "\n";
  ss << "Branch:             "
     << (state.current_branch ? narrative_branch_to_string(*state.current_branch) : std::string("(unset)")) << "\n";
  ss << "Progression level:  " << state.progression_level << "\n";
  ss << "Decisions:          " << state.decisions.size() << "\n";

  std::vector<std::string> tags(state.unlocked_story_tags.begin(), state.unlocked_story_tags.end());
  ss << "Story tags:         " << (tags.empty() ? std::string("(none)") : join(tags)) << "\n";

  if (!state.decisions.empty()) {
    ss << "Recent decisions:\n";
    const std::size_t n = std::min<std::size_t>(state.decisions.size(), kRecentContextWindow);
    for (std::size_t i = state.decisions.size() - n; i < state.decisions.size(); ++i) {
      const auto& d = state.decisions[i];
      ss << "  - " << d.id << " [" << decision_category_to_string(d.category) << "/"
         << decision_pressure_to_string(d.pressure) << "] imp " << d.imperial_points << ", ins " << d.insurgent_points;
      if (d.chain_parent_id) ss << " (chain " << *d.chain_parent_id << ")";
      if (!d.context.empty()) ss << ": " << d.context;
      ss << "\n";
    }
  }
  return ss.str();
}

} // namespace gatewatch
