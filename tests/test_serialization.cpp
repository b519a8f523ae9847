#include <iostream>
#include <stdexcept>
#include <string>

#include "gatewatch/core/campaign.h"
#include "gatewatch/core/content_loader.h"
#include "gatewatch/core/serialization.h"
#include "gatewatch/util/json.h"
#include "gatewatch/util/log.h"

#define GW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_serialization() {
  gatewatch::log::set_level(gatewatch::log::Level::Error);

  // Hand-built state exercising every optional field.
  gatewatch::CampaignState s;
  s.day = 7;
  s.rng_state = 0xfedcba9876543210ULL;
  s.encounters_decided = 12;
  s.mistakes = 2;

  s.narrative.imperial_loyalty = 31;
  s.narrative.insurgent_sympathy = 14;
  s.narrative.current_branch = gatewatch::NarrativeBranch::SilentDefiance;
  s.narrative.progression_level = 3;
  s.narrative.unlocked_story_tags = {"imperium", "insurgent"};

  gatewatch::DecisionRecord d1;
  d1.id = "h1";
  d1.timestamp_ms = 1760000000123;
  d1.imperial_points = 5;
  d1.category = gatewatch::DecisionCategory::Political;
  d1.pressure = gatewatch::DecisionPressure::Critical;
  d1.context = "Crisis \"at\" the gate\nline two";
  s.narrative.decisions.push_back(d1);

  gatewatch::DecisionRecord d2;
  d2.id = "m1";
  d2.insurgent_points = -2;
  d2.category = gatewatch::DecisionCategory::Moral;
  d2.pressure = gatewatch::DecisionPressure::Medium;
  d2.chain_parent_id = std::string("h1");
  s.narrative.decisions.push_back(d2);

  gatewatch::DecisionChain chain;
  chain.id = "h1";
  chain.length = 2;
  chain.decision_ids = {"h1", "m1"};
  s.active_chain = chain;
  gatewatch::DecisionChain old;
  old.id = "h0";
  old.length = 5;
  s.chain_history.push_back(old);

  gatewatch::ConsequenceToken t;
  t.id = "tok_4";
  t.source_decision = "m1";
  t.day_created = 6;
  t.trigger_day = 8;
  t.payload.scenario = "CAPTAIN_COMPLAINT";
  t.payload.news_headline = "Complaint filed";
  t.payload.loyalty_impact = -2;
  t.payload.suspicion_increase = 3;
  t.payload.affects_family = true;
  s.tokens.push_back(t);
  t.id = "tok_3";
  t.has_triggered = true;
  s.tokens.push_back(t);
  s.next_token_id = 5;

  s.ending.corruption_level = 12;
  s.ending.suspicion_level = 40;
  s.ending.loyalty_adjustment = -7;
  s.ending.family_incidents = 1;
  s.ending.point_of_no_return_reached = true;
  s.ending.locked_path = gatewatch::EndingPath::Neutral;
  s.ending.completed_story_beats = {"THE_DEFECTOR"};

  const std::string text = gatewatch::serialize_campaign_to_json(s);
  const auto r = gatewatch::deserialize_campaign_from_json(text);

  GW_ASSERT(r.day == 7);
  GW_ASSERT(r.rng_state == 0xfedcba9876543210ULL);
  GW_ASSERT(r.encounters_decided == 12);
  GW_ASSERT(r.mistakes == 2);

  GW_ASSERT(r.narrative.imperial_loyalty == 31);
  GW_ASSERT(r.narrative.insurgent_sympathy == 14);
  GW_ASSERT(r.narrative.current_branch == gatewatch::NarrativeBranch::SilentDefiance);
  GW_ASSERT(r.narrative.progression_level == 3);
  GW_ASSERT(r.narrative.unlocked_story_tags == s.narrative.unlocked_story_tags);
  GW_ASSERT(r.narrative.decisions.size() == 2);
  GW_ASSERT(r.narrative.decisions[0].timestamp_ms == 1760000000123);
  GW_ASSERT(r.narrative.decisions[0].context == d1.context);
  GW_ASSERT(r.narrative.decisions[0].pressure == gatewatch::DecisionPressure::Critical);
  GW_ASSERT(!r.narrative.decisions[0].chain_parent_id.has_value());
  GW_ASSERT(r.narrative.decisions[1].insurgent_points == -2);
  GW_ASSERT(r.narrative.decisions[1].category == gatewatch::DecisionCategory::Moral);
  GW_ASSERT(r.narrative.decisions[1].chain_parent_id == std::string("h1"));

  GW_ASSERT(r.active_chain.has_value());
  GW_ASSERT(r.active_chain->decision_ids.size() == 2);
  GW_ASSERT(r.chain_history.size() == 1);
  GW_ASSERT(r.chain_history[0].length == 5);

  GW_ASSERT(r.tokens.size() == 2);
  GW_ASSERT(r.tokens[0].id == "tok_4");
  GW_ASSERT(!r.tokens[0].has_triggered);
  GW_ASSERT(r.tokens[1].has_triggered);
  GW_ASSERT(r.tokens[0].payload.affects_family);
  GW_ASSERT(r.tokens[0].payload.loyalty_impact == -2);
  GW_ASSERT(r.tokens[0].trigger_day == 8);
  GW_ASSERT(r.next_token_id == 5);

  GW_ASSERT(r.ending.loyalty_adjustment == -7);
  GW_ASSERT(r.ending.point_of_no_return_reached);
  GW_ASSERT(r.ending.locked_path == gatewatch::EndingPath::Neutral);
  GW_ASSERT(r.ending.completed_story_beats.size() == 1);

  // Output is stable: serializing the parsed state gives the same text.
  GW_ASSERT(gatewatch::serialize_campaign_to_json(r) == text);

  // An unset branch survives as null.
  {
    gatewatch::CampaignState fresh;
    const auto back = gatewatch::deserialize_campaign_from_json(gatewatch::serialize_campaign_to_json(fresh));
    GW_ASSERT(!back.narrative.current_branch.has_value());
    GW_ASSERT(!back.active_chain.has_value());
    GW_ASSERT(back.day == 1);
  }

  // A live campaign round-trips through restore().
  {
    const auto content = gatewatch::load_content_db_from_file("data/content/default_content.json");
    gatewatch::Campaign a(content);
    for (int i = 0; i < 10; ++i) {
      const auto e = a.generate_encounter();
      a.decide(e, i % 3 != 0 ? e.should_approve : !e.should_approve);
    }
    a.advance_day();

    const std::string saved = gatewatch::serialize_campaign_to_json(a.snapshot());
    gatewatch::Campaign b(content);
    b.restore(gatewatch::deserialize_campaign_from_json(saved));
    GW_ASSERT(gatewatch::serialize_campaign_to_json(b.snapshot()) == saved);
  }

  // Malformed saves throw.
  {
    bool threw = false;
    try {
      (void)gatewatch::deserialize_campaign_from_json("{\"day\": 3, \"rng_state\": \"not hex\"}");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    GW_ASSERT(threw);

    threw = false;
    try {
      (void)gatewatch::deserialize_campaign_from_json("{\"narrative\": [1]}");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    GW_ASSERT(threw);
  }

  gatewatch::log::set_level(gatewatch::log::Level::Info);
  return 0;
}
