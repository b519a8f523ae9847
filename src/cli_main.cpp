#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gatewatch/core/campaign.h"
#include "gatewatch/core/content_loader.h"
#include "gatewatch/core/ending.h"
#include "gatewatch/core/enum_strings.h"
#include "gatewatch/core/serialization.h"
#include "gatewatch/util/file_io.h"
#include "gatewatch/util/hash_rng.h"
#include "gatewatch/util/log.h"

namespace {

#ifndef GATEWATCH_VERSION
#define GATEWATCH_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::uint64_t get_u64_arg(int argc, char** argv, const std::string& key, std::uint64_t def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return static_cast<std::uint64_t>(std::stoull(argv[i + 1], nullptr, 0));
  }
  return def;
}

double get_double_arg(int argc, char** argv, const std::string& key, double def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stod(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

std::vector<std::string> get_str_args(int argc, char** argv, const std::string& key) {
  std::vector<std::string> out;
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) out.push_back(argv[i + 1]);
  }
  return out;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "Gatewatch CLI (prototype)\n\n";
  std::cout << "Usage: " << exe << " [options]\n\n";
  std::cout << "  --content PATH       Content JSON (default: data/content/default_content.json)\n";
  std::cout << "  --validate-content   Validate the content file and exit\n";
  std::cout << "  --days N             Days to simulate (default: 10)\n";
  std::cout << "  --seed N             Campaign seed, decimal or 0x hex (default: content campaign.seed)\n";
  std::cout << "  --error-rate P       Probability the simulated operator gets a call wrong (default: 0.1)\n";
  std::cout << "  --beat ID            Record a story beat on day 1 (repeatable)\n";
  std::cout << "  --load PATH          Resume from a save\n";
  std::cout << "  --save PATH          Write the campaign save when done\n";
  std::cout << "  --log-level LEVEL    debug|info|warn|error|off (default: warn)\n";
  std::cout << "  --quiet              Only print the final ending\n";
  std::cout << "  --version            Print version\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << GATEWATCH_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    gatewatch::log::Level lvl = gatewatch::log::Level::Warn;
    const std::string level_text = get_str_arg(argc, argv, "--log-level", "warn");
    if (!gatewatch::log::parse_level(level_text, lvl)) {
      std::cerr << "Unknown --log-level: '" << level_text << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }
    gatewatch::log::set_level(lvl);

    const std::string content_path = get_str_arg(argc, argv, "--content", "data/content/default_content.json");
    const std::string load_path = get_str_arg(argc, argv, "--load", "");
    const std::string save_path = get_str_arg(argc, argv, "--save", "");
    const int days = get_int_arg(argc, argv, "--days", 10);
    const double error_rate = get_double_arg(argc, argv, "--error-rate", 0.1);
    const bool quiet = has_flag(argc, argv, "--quiet");

    auto content = gatewatch::load_content_db_from_file(content_path);

    const auto errors = gatewatch::validate_content_db(content);
    if (has_flag(argc, argv, "--validate-content")) {
      if (!errors.empty()) {
        std::cerr << "Content validation failed:\n";
        for (const auto& e : errors) std::cerr << "  - " << e << "\n";
        return 1;
      }
      if (!quiet) std::cout << "Content OK\n";
      return 0;
    }
    for (const auto& e : errors) gatewatch::log::warn("Content: " + e);

    gatewatch::CampaignConfig cfg = content.campaign;
    cfg.seed = get_u64_arg(argc, argv, "--seed", cfg.seed);

    gatewatch::Campaign campaign(std::move(content), cfg);
    if (!load_path.empty()) {
      campaign.restore(gatewatch::deserialize_campaign_from_json(gatewatch::read_text_file(load_path)));
    }

    for (const auto& beat : get_str_args(argc, argv, "--beat")) {
      if (!campaign.record_story_beat(beat)) std::cerr << "Story beat not recorded: " << beat << "\n";
    }

    if (!quiet) std::cout << "Seed: " << cfg.seed << "\n";

    // The simulated operator draws from its own stream so the encounter
    // sequence depends only on the campaign seed.
    gatewatch::util::HashRng operator_rng(cfg.seed ^ 0xa5a5a5a5a5a5a5a5ULL);

    for (int d = 0; d < days; ++d) {
      const auto rules = campaign.active_rules();
      if (!quiet) {
        std::cout << "--- Day " << campaign.day() << " (" << rules.size() << " rule(s)) ---\n";
        for (const auto& r : rules) {
          std::cout << "  rule " << gatewatch::day_rule_type_to_string(r.type) << ": " << r.description << "\n";
        }
      }

      for (int i = 0; i < campaign.cfg().encounters_per_day; ++i) {
        const auto e = campaign.generate_encounter();
        const bool mistake = operator_rng.chance(error_rate);
        const bool approved = mistake ? !e.should_approve : e.should_approve;
        const auto outcome = campaign.decide(e, approved);
        if (!quiet) {
          std::cout << "  " << (approved ? "APPROVE " : "DENY    ") << e.ship_name << " [" << e.category << "/"
                    << e.faction << "] code " << e.access_code;
          if (e.is_story_ship) std::cout << " story:" << e.story_tag;
          if (!e.should_approve) std::cout << " (" << e.invalid_reason << ")";
          if (!outcome.correct) std::cout << " MISTAKE -> " << *outcome.token_id;
          std::cout << "\n";
        }
      }

      for (const auto& ev : campaign.drain_events()) {
        if (quiet) continue;
        if (ev.kind == gatewatch::NarrativeEventKind::BranchChanged) {
          std::cout << "  >> branch now " << gatewatch::narrative_branch_to_string(ev.branch) << " (level "
                    << ev.progression_level << ")\n";
        } else {
          std::cout << "  >> story tag unlocked: " << ev.tag << "\n";
        }
      }

      const auto report = campaign.advance_day();
      if (!quiet) {
        for (const auto& t : report.delivered) {
          std::cout << "  news (day " << report.day << "): " << t.payload.news_headline << "\n";
        }
      }
    }

    if (!quiet) std::cout << "\n" << campaign.generate_report();
    std::cout << "Ending: " << gatewatch::ending_type_to_string(campaign.determine_ending()) << "\n";

    if (!save_path.empty()) {
      gatewatch::write_text_file(save_path, gatewatch::serialize_campaign_to_json(campaign.snapshot()));
      if (!quiet) std::cout << "Saved to " << save_path << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
