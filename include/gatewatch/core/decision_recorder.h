#pragma once

#include <optional>
#include <string>
#include <vector>

#include "gatewatch/core/entities.h"
#include "gatewatch/core/narrative_classifier.h"

namespace gatewatch {

// Maximum number of linked decisions in one chain.
inline constexpr int kMaxChainLength = 5;

// A run of decisions opened by a High/Critical pressure decision.
struct DecisionChain {
  // Id of the decision that opened the chain.
  std::string id;
  int length{0};
  std::vector<std::string> decision_ids;
};

// Infers a category from keywords: "bribe", "moral", "imperium",
// "insurgent" and "rebel" are looked up in the id; "credits" and "family" in
// the context.
DecisionCategory infer_decision_category(const std::string& id, const std::string& context);

// Infers pressure from the combined magnitude of the points.
DecisionPressure infer_decision_pressure(int imperial_points, int insurgent_points);

// Appends decisions to the narrative history and keeps the branch current.
//
// The recorder borrows the state and the classifier; it does not own them.
// Every record() call re-evaluates the branch before returning, so any
// BranchChanged event is already queued on the classifier when it returns.
class DecisionRecorder {
 public:
  DecisionRecorder(NarrativeState& state, NarrativeClassifier& classifier)
      : state_(state), classifier_(classifier) {}

  const DecisionRecord& record(const std::string& id, int imperial_points, int insurgent_points,
                               const std::string& context, DecisionCategory category, DecisionPressure pressure);

  // Category and pressure are inferred from the id, context and points.
  const DecisionRecord& record(const std::string& id, int imperial_points, int insurgent_points,
                               const std::string& context);

  // Scores a checkpoint decision. Story ships are Political/High: approving
  // one gives its side +10 and the other -5, denying it gives its side -5 and
  // the other +5. Ordinary ships are Tactical/Medium and carry no points.
  const DecisionRecord& record_ship_decision(const Encounter& encounter, bool approved);

  const std::optional<DecisionChain>& active_chain() const { return chain_; }
  const std::vector<DecisionChain>& chain_history() const { return closed_chains_; }

  // Restores chain bookkeeping (used when loading a save).
  void restore_chains(std::optional<DecisionChain> active, std::vector<DecisionChain> history);

  // Clears chain bookkeeping. The narrative state itself is reset by its owner.
  void reset();

 private:
  void close_chain();

  NarrativeState& state_;
  NarrativeClassifier& classifier_;
  std::optional<DecisionChain> chain_;
  std::vector<DecisionChain> closed_chains_;
};

} // namespace gatewatch
