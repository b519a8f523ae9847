#include "gatewatch/core/content.h"

#include "gatewatch/core/manifest_policy.h"
#include "gatewatch/util/strings.h"

namespace gatewatch {

const FactionPolicy* ContentDB::find_category(const std::string& name) const {
  if (auto it = categories.find(name); it != categories.end()) return &it->second;
  for (const auto& [key, policy] : categories) {
    if (iequals(key, name)) return &policy;
  }
  return nullptr;
}

const CaptainType* ContentDB::find_captain_type(const std::string& name) const {
  for (const auto& c : captain_types) {
    if (iequals(c.name, name)) return &c;
  }
  return nullptr;
}

const CargoManifest* ContentDB::find_manifest(const std::string& code) const {
  for (const auto& m : manifests) {
    if (iequals(m.code, code)) return &m;
  }
  return nullptr;
}

const AccessCode* ContentDB::find_access_code(const std::string& code) const {
  for (const auto& a : access_codes) {
    if (iequals(a.code, code)) return &a;
  }
  return nullptr;
}

std::vector<DayRule> ContentDB::rules_for_day(int day) const { return rules_active_on(day_rules, day); }

} // namespace gatewatch
