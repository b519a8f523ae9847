#include "gatewatch/core/consequence_ledger.h"

#include <algorithm>

#include "gatewatch/util/log.h"
#include "gatewatch/util/strings.h"

namespace gatewatch {

const ConsequenceToken& ConsequenceTokenLedger::add_token(const std::string& source_decision, int delay_days,
                                                         ConsequencePayload payload) {
  ConsequenceToken t;
  t.id = "tok_" + std::to_string(next_id_++);
  t.source_decision = source_decision;
  t.day_created = current_day_;
  t.trigger_day = current_day_ + std::max(0, delay_days);
  t.payload = std::move(payload);
  tokens_.push_back(std::move(t));

  const auto& stored = tokens_.back();
  log::debug("Scheduled " + stored.id + " (" + stored.payload.scenario + ") for day " +
             std::to_string(stored.trigger_day));
  return stored;
}

std::vector<ConsequenceToken> ConsequenceTokenLedger::process_day(int day) {
  current_day_ = day;
  std::vector<ConsequenceToken> delivered;
  for (auto& t : tokens_) {
    if (t.has_triggered || t.trigger_day > day) continue;
    t.has_triggered = true;
    delivered.push_back(t);
  }
  if (!delivered.empty()) {
    log::info("Day " + std::to_string(day) + ": delivered " + std::to_string(delivered.size()) + " consequence(s)");
  }
  return delivered;
}

std::vector<ConsequenceToken> ConsequenceTokenLedger::active_tokens() const {
  std::vector<ConsequenceToken> out;
  for (const auto& t : tokens_) {
    if (!t.has_triggered) out.push_back(t);
  }
  return out;
}

bool ConsequenceTokenLedger::has_token_of_type(const std::string& fragment) const {
  return std::any_of(tokens_.begin(), tokens_.end(), [&](const ConsequenceToken& t) {
    return !t.has_triggered && (icontains(t.payload.scenario, fragment) || icontains(t.payload.news_headline, fragment));
  });
}

int ConsequenceTokenLedger::upcoming_token_count(int days) const {
  const int horizon = current_day_ + days;
  int n = 0;
  for (const auto& t : tokens_) {
    if (!t.has_triggered && t.trigger_day <= horizon) ++n;
  }
  return n;
}

void ConsequenceTokenLedger::restore(std::vector<ConsequenceToken> tokens, int current_day, int next_id) {
  tokens_ = std::move(tokens);
  current_day_ = current_day;
  next_id_ = std::max(1, next_id);
}

void ConsequenceTokenLedger::reset(int current_day) {
  tokens_.clear();
  current_day_ = current_day;
  next_id_ = 1;
}

} // namespace gatewatch
