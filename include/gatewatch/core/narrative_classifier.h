#pragma once

#include <string>
#include <vector>

#include "gatewatch/core/content.h"
#include "gatewatch/core/entities.h"

namespace gatewatch {

// Differences with |imperial - insurgent| below this are always Neutral.
inline constexpr int kNeutralBand = 10;

// Number of most recent decisions scanned for double-cross signals.
inline constexpr int kRecentContextWindow = 5;

enum class NarrativeEventKind { BranchChanged, TagUnlocked };

struct NarrativeEvent {
  NarrativeEventKind kind{NarrativeEventKind::BranchChanged};
  NarrativeBranch branch{NarrativeBranch::Neutral};
  std::string tag;
  int progression_level{0};
};

// True when any of the last kRecentContextWindow decision contexts mentions
// "betrayal" or "manipulation" (case-insensitive substring).
bool has_double_cross_signal(const std::vector<DecisionRecord>& decisions);

// Pure branch function of the totals and the recent decision window.
NarrativeBranch classify_branch(const NarrativeState& state, const NarrativeThresholds& thresholds);

// Derives the story branch and manages story tags.
//
// Notifications are queued and handed out by drain_events(); nothing calls
// back into the caller while a decision is being processed.
class NarrativeClassifier {
 public:
  NarrativeClassifier() = default;
  explicit NarrativeClassifier(NarrativeThresholds thresholds) : thresholds_(thresholds) {}

  NarrativeBranch determine_branch(const NarrativeState& state) const;

  // Re-evaluates the branch. On a change: stores the new branch, increments
  // progression_level by one, queues one BranchChanged event and returns true.
  bool update_progression(NarrativeState& state);

  // Idempotent. Queues a TagUnlocked event only on first insertion.
  bool unlock_story_tag(NarrativeState& state, const std::string& tag);
  bool is_story_tag_unlocked(const NarrativeState& state, const std::string& tag) const;

  std::vector<NarrativeEvent> drain_events();
  std::size_t pending_event_count() const { return events_.size(); }

  const NarrativeThresholds& thresholds() const { return thresholds_; }

 private:
  NarrativeThresholds thresholds_;
  std::vector<NarrativeEvent> events_;
};

// Multi-line diagnostic summary (totals, branch, tags, recent decisions).
std::string generate_narrative_report(const NarrativeState& state);

} // namespace gatewatch
