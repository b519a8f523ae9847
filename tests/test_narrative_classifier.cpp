#include <iostream>
#include <string>

#include "gatewatch/core/narrative_classifier.h"
#include "gatewatch/util/log.h"

#define GW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

gatewatch::NarrativeState totals(int imperial, int insurgent) {
  gatewatch::NarrativeState s;
  s.imperial_loyalty = imperial;
  s.insurgent_sympathy = insurgent;
  return s;
}

void add_context(gatewatch::NarrativeState& s, const std::string& context) {
  gatewatch::DecisionRecord d;
  d.id = "d" + std::to_string(s.decisions.size());
  d.context = context;
  s.decisions.push_back(d);
}

} // namespace

int test_narrative_classifier() {
  using gatewatch::NarrativeBranch;
  gatewatch::log::set_level(gatewatch::log::Level::Error);

  gatewatch::NarrativeClassifier c;

  // --- Band evaluation order ---
  GW_ASSERT(c.determine_branch(totals(0, 0)) == NarrativeBranch::Neutral);
  GW_ASSERT(c.determine_branch(totals(9, 0)) == NarrativeBranch::Neutral);
  GW_ASSERT(c.determine_branch(totals(0, 9)) == NarrativeBranch::Neutral);
  GW_ASSERT(c.determine_branch(totals(60, 0)) == NarrativeBranch::ImperiumPath);
  GW_ASSERT(c.determine_branch(totals(0, 60)) == NarrativeBranch::InsurgentPath);
  GW_ASSERT(c.determine_branch(totals(50, 0)) == NarrativeBranch::SilentDefiance);
  GW_ASSERT(c.determine_branch(totals(0, 50)) == NarrativeBranch::SilentDefiance);
  GW_ASSERT(c.determine_branch(totals(30, 0)) == NarrativeBranch::SilentDefiance);
  GW_ASSERT(c.determine_branch(totals(10, 0)) == NarrativeBranch::ComplexResistance);
  GW_ASSERT(c.determine_branch(totals(0, 24)) == NarrativeBranch::ComplexResistance);
  GW_ASSERT(c.determine_branch(totals(25, 0)) == NarrativeBranch::SilentDefiance);

  // --- Double-cross signal only looks at the last five contexts ---
  {
    auto s = totals(15, 0);
    add_context(s, "A clear BETRAYAL of the checkpoint");
    GW_ASSERT(c.determine_branch(s) == NarrativeBranch::DoubleCross);
    for (int i = 0; i < 4; ++i) add_context(s, "routine");
    GW_ASSERT(c.determine_branch(s) == NarrativeBranch::DoubleCross);
    add_context(s, "routine");
    GW_ASSERT(!gatewatch::has_double_cross_signal(s.decisions));
    GW_ASSERT(c.determine_branch(s) == NarrativeBranch::ComplexResistance);
    add_context(s, "Suspected manipulation of records");
    GW_ASSERT(c.determine_branch(s) == NarrativeBranch::DoubleCross);

    // The signal never overrides the outer bands.
    s.imperial_loyalty = 80;
    GW_ASSERT(c.determine_branch(s) == NarrativeBranch::ImperiumPath);
  }

  // --- Custom thresholds ---
  {
    gatewatch::NarrativeThresholds t;
    t.imperial_threshold = 20;
    t.insurgent_threshold = -20;
    t.complex_resistance_threshold = 15;
    gatewatch::NarrativeClassifier tight(t);
    GW_ASSERT(tight.determine_branch(totals(21, 0)) == NarrativeBranch::ImperiumPath);
    GW_ASSERT(tight.determine_branch(totals(20, 0)) == NarrativeBranch::SilentDefiance);
    GW_ASSERT(tight.determine_branch(totals(0, 12)) == NarrativeBranch::ComplexResistance);
  }

  // --- Progression: one event per actual change ---
  {
    gatewatch::NarrativeClassifier nc;
    auto s = totals(0, 0);
    GW_ASSERT(!s.current_branch.has_value());

    GW_ASSERT(nc.update_progression(s));
    GW_ASSERT(s.current_branch == NarrativeBranch::Neutral);
    GW_ASSERT(s.progression_level == 1);

    GW_ASSERT(!nc.update_progression(s));
    s.imperial_loyalty = 5;
    GW_ASSERT(!nc.update_progression(s));
    GW_ASSERT(s.progression_level == 1);

    s.imperial_loyalty = 70;
    GW_ASSERT(nc.update_progression(s));
    GW_ASSERT(s.progression_level == 2);

    const auto events = nc.drain_events();
    GW_ASSERT(events.size() == 2);
    GW_ASSERT(events[0].kind == gatewatch::NarrativeEventKind::BranchChanged);
    GW_ASSERT(events[0].branch == NarrativeBranch::Neutral);
    GW_ASSERT(events[1].branch == NarrativeBranch::ImperiumPath);
    GW_ASSERT(events[1].progression_level == 2);
    GW_ASSERT(nc.drain_events().empty());
  }

  // --- Story tags ---
  {
    gatewatch::NarrativeClassifier nc;
    auto s = totals(0, 0);
    GW_ASSERT(!nc.is_story_tag_unlocked(s, "insurgent"));
    GW_ASSERT(nc.unlock_story_tag(s, "insurgent"));
    GW_ASSERT(!nc.unlock_story_tag(s, "insurgent"));
    GW_ASSERT(nc.is_story_tag_unlocked(s, "insurgent"));
    GW_ASSERT(s.unlocked_story_tags.size() == 1);
    const auto events = nc.drain_events();
    GW_ASSERT(events.size() == 1);
    GW_ASSERT(events[0].kind == gatewatch::NarrativeEventKind::TagUnlocked);
    GW_ASSERT(events[0].tag == "insurgent");
  }

  // --- Report ---
  {
    auto s = totals(12, 3);
    s.current_branch = NarrativeBranch::ComplexResistance;
    s.unlocked_story_tags.insert("imperium");
    add_context(s, "Approved Lucky Dawn");
    const std::string report = gatewatch::generate_narrative_report(s);
    GW_ASSERT(report.find("complex_resistance") != std::string::npos);
    GW_ASSERT(report.find("imperium") != std::string::npos);
    GW_ASSERT(report.find("Approved Lucky Dawn") != std::string::npos);
    GW_ASSERT(report.find("12") != std::string::npos);
  }

  gatewatch::log::set_level(gatewatch::log::Level::Info);
  return 0;
}
