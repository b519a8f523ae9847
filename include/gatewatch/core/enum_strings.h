#pragma once

#include <string>

#include "gatewatch/core/entities.h"

namespace gatewatch {

// Shared string <-> enum conversion helpers.
//
// Used by the content loader, save serialization and the reports, so the
// strings in data files, saves and logs never drift apart. Parsing is
// case-insensitive; unknown strings map to the documented default.

std::string access_level_to_string(AccessLevel l);
AccessLevel access_level_from_string(const std::string& s);  // default Low

std::string clearance_level_to_string(ClearanceLevel c);
ClearanceLevel clearance_level_from_string(const std::string& s);  // default Standard

std::string faction_restriction_to_string(FactionRestriction r);
FactionRestriction faction_restriction_from_string(const std::string& s);  // default Universal

std::string day_rule_type_to_string(DayRuleType t);
// Returns false for unknown rule types so the loader can report them.
bool day_rule_type_from_string(const std::string& s, DayRuleType& out);

std::string failed_check_to_string(FailedCheck c);

std::string decision_category_to_string(DecisionCategory c);
DecisionCategory decision_category_from_string(const std::string& s);  // default Tactical

std::string decision_pressure_to_string(DecisionPressure p);
DecisionPressure decision_pressure_from_string(const std::string& s);  // default Low

std::string narrative_branch_to_string(NarrativeBranch b);
NarrativeBranch narrative_branch_from_string(const std::string& s);  // default Neutral

std::string ending_path_to_string(EndingPath p);
EndingPath ending_path_from_string(const std::string& s);  // default None

std::string ending_type_to_string(EndingType t);

} // namespace gatewatch
