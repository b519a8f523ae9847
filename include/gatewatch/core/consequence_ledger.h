#pragma once

#include <string>
#include <vector>

#include "gatewatch/core/entities.h"

namespace gatewatch {

// Append-only schedule of delayed effects.
//
// Tokens are never removed: delivered tokens stay in the ledger with
// has_triggered set so the history can be audited and saved.
class ConsequenceTokenLedger {
 public:
  // Schedules a token for current_day() + delay_days (negative delays are
  // treated as 0). Returns the stored token.
  const ConsequenceToken& add_token(const std::string& source_decision, int delay_days, ConsequencePayload payload);

  void set_current_day(int day) { current_day_ = day; }
  int current_day() const { return current_day_; }

  // Advances to `day` and delivers every untriggered token whose trigger day
  // has been reached. Each token is delivered exactly once.
  std::vector<ConsequenceToken> process_day(int day);

  // Untriggered tokens, in scheduling order.
  std::vector<ConsequenceToken> active_tokens() const;

  // True when an untriggered token's scenario or headline contains `fragment`
  // (case-insensitive).
  bool has_token_of_type(const std::string& fragment) const;

  // Untriggered tokens due within the next `days` days.
  int upcoming_token_count(int days) const;

  const std::vector<ConsequenceToken>& tokens() const { return tokens_; }
  int next_id() const { return next_id_; }

  // Replaces the ledger contents (used when loading a save).
  void restore(std::vector<ConsequenceToken> tokens, int current_day, int next_id);
  void reset(int current_day = 1);

 private:
  std::vector<ConsequenceToken> tokens_;
  int current_day_{1};
  int next_id_{1};
};

} // namespace gatewatch
