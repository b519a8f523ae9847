#pragma once

#include <string>
#include <vector>

#include "gatewatch/core/consequence_ledger.h"
#include "gatewatch/core/decision_recorder.h"
#include "gatewatch/core/entities.h"

namespace gatewatch {

// A scripted narrative moment. Recorded at most once per campaign.
struct StoryBeat {
  std::string id;
  std::string context;
  int imperial_points{0};
  int insurgent_points{0};
  // Path locked when the beat is recorded (None = no lock).
  EndingPath locks{EndingPath::None};
};

const std::vector<StoryBeat>& story_beats();
const StoryBeat* find_story_beat(const std::string& id);

// Both levels are clamped to 0..100. Corruption above 50 also raises
// suspicion by one.
void update_corruption(EndingState& s, int change);
void update_suspicion(EndingState& s, int change);

// Folds a delivered consequence into the ending inputs.
void apply_consequence(EndingState& s, const ConsequencePayload& payload);

// 1.0 for an untouched family, lowered by each family incident (floor 0).
double family_status_score(const EndingState& s);

// (loyalty + adjustment - sympathy) / 200, clamped to [-1, 1].
double alignment_score(const NarrativeState& n, const EndingState& s);

// Consequence scheduled when a path is locked.
ConsequencePayload ending_path_consequence(EndingPath path);

// First lock wins: once the point of no return is reached later calls are
// ignored and return false. A successful lock schedules the path's
// consequence two days out.
bool lock_ending_path(EndingState& s, EndingPath path, ConsequenceTokenLedger& ledger);

// Records a story beat: a Political decision with the beat's points, and the
// beat's path lock if it has one. Returns false for unknown or repeated beats.
bool record_story_beat(const std::string& beat_id, EndingState& s, DecisionRecorder& recorder,
                       ConsequenceTokenLedger& ledger);

EndingType ending_for_locked_path(EndingPath path, const EndingState& s);
EndingType ending_from_scores(double alignment, double corruption, double family, int suspicion);

// A locked path decides first; otherwise the scores do.
EndingType determine_ending(const NarrativeState& n, const EndingState& s);

// Path the player is drifting toward, for reports.
EndingPath suggested_ending_path(const NarrativeState& n, const EndingState& s);

} // namespace gatewatch
