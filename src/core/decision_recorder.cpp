#include "gatewatch/core/decision_recorder.h"

#include <chrono>
#include <cstdint>
#include <cstdlib>

#include "gatewatch/core/encounter_classifier.h"
#include "gatewatch/core/enum_strings.h"
#include "gatewatch/util/log.h"
#include "gatewatch/util/strings.h"

namespace gatewatch {
namespace {

std::int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

DecisionCategory infer_decision_category(const std::string& id, const std::string& context) {
  if (icontains(id, "bribe") || icontains(context, "credits")) return DecisionCategory::Financial;
  if (icontains(id, "moral") || icontains(context, "family")) return DecisionCategory::Moral;
  if (icontains(id, "imperium") || icontains(id, "insurgent") || icontains(id, "rebel")) {
    return DecisionCategory::Political;
  }
  return DecisionCategory::Tactical;
}

DecisionPressure infer_decision_pressure(int imperial_points, int insurgent_points) {
  const int magnitude = std::abs(imperial_points) + std::abs(insurgent_points);
  if (magnitude >= 20) return DecisionPressure::Critical;
  if (magnitude >= 10) return DecisionPressure::High;
  if (magnitude >= 5) return DecisionPressure::Medium;
  return DecisionPressure::Low;
}

const DecisionRecord& DecisionRecorder::record(const std::string& id, int imperial_points, int insurgent_points,
                                               const std::string& context, DecisionCategory category,
                                               DecisionPressure pressure) {
  DecisionRecord rec;
  rec.id = id;
  rec.timestamp_ms = now_ms();
  rec.imperial_points = imperial_points;
  rec.insurgent_points = insurgent_points;
  rec.category = category;
  rec.pressure = pressure;
  rec.context = context;

  state_.imperial_loyalty += imperial_points;
  state_.insurgent_sympathy += insurgent_points;
  state_.decisions.push_back(std::move(rec));
  DecisionRecord& stored = state_.decisions.back();

  // The branch is settled before chain bookkeeping: reaching an outer branch
  // ends the running chain, and this decision may then open a fresh one.
  if (classifier_.update_progression(state_) && chain_) {
    const NarrativeBranch b = *state_.current_branch;
    if (b == NarrativeBranch::ImperiumPath || b == NarrativeBranch::InsurgentPath) close_chain();
  }

  if (pressure >= DecisionPressure::High) {
    if (chain_) close_chain();
    DecisionChain c;
    c.id = id;
    c.length = 1;
    c.decision_ids.push_back(id);
    chain_ = std::move(c);
  } else if (chain_) {
    stored.chain_parent_id = chain_->id;
    chain_->length += 1;
    chain_->decision_ids.push_back(id);
    if (chain_->length >= kMaxChainLength) close_chain();
  }

  log::debug("Decision " + id + " [" + decision_category_to_string(category) + "/" +
             decision_pressure_to_string(pressure) + "] imp " + std::to_string(imperial_points) + ", ins " +
             std::to_string(insurgent_points));
  return stored;
}

const DecisionRecord& DecisionRecorder::record(const std::string& id, int imperial_points, int insurgent_points,
                                               const std::string& context) {
  return record(id, imperial_points, insurgent_points, context, infer_decision_category(id, context),
                infer_decision_pressure(imperial_points, insurgent_points));
}

const DecisionRecord& DecisionRecorder::record_ship_decision(const Encounter& e, bool approved) {
  const std::string id = "ship_d" + std::to_string(e.day) + "_" + std::to_string(state_.decisions.size() + 1);

  std::string context = std::string(approved ? "Approved " : "Denied ") + e.ship_name + " (" + e.faction + ")";
  if (e.is_story_ship) context += " story:" + e.story_tag;
  if (approved && !e.should_approve && !e.invalid_reason.empty()) context += " despite: " + e.invalid_reason;

  int imperial = 0;
  int insurgent = 0;
  DecisionCategory category = DecisionCategory::Tactical;
  DecisionPressure pressure = DecisionPressure::Medium;

  if (e.is_story_ship) {
    category = DecisionCategory::Political;
    pressure = DecisionPressure::High;
    if (iequals(e.story_tag, kStoryTagImperium)) {
      imperial = approved ? 10 : -5;
      insurgent = approved ? -5 : 5;
    } else if (iequals(e.story_tag, kStoryTagInsurgent)) {
      imperial = approved ? -5 : 10;
      insurgent = approved ? 10 : -5;
    }
  }

  const DecisionRecord& rec = record(id, imperial, insurgent, context, category, pressure);
  if (e.is_story_ship && approved && !e.story_tag.empty()) classifier_.unlock_story_tag(state_, e.story_tag);
  return rec;
}

void DecisionRecorder::restore_chains(std::optional<DecisionChain> active, std::vector<DecisionChain> history) {
  chain_ = std::move(active);
  closed_chains_ = std::move(history);
}

void DecisionRecorder::reset() {
  chain_.reset();
  closed_chains_.clear();
}

void DecisionRecorder::close_chain() {
  if (!chain_) return;
  closed_chains_.push_back(std::move(*chain_));
  chain_.reset();
}

} // namespace gatewatch
