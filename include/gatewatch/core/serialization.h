#pragma once

#include <string>

#include "gatewatch/core/campaign.h"
#include "gatewatch/util/json.h"

namespace gatewatch {

// Serialize a campaign snapshot into an in-memory JSON document.
json::Value serialize_campaign_to_json_value(const CampaignState& state);

// Serialize a campaign snapshot into a JSON text document (pretty-printed).
std::string serialize_campaign_to_json(const CampaignState& state);

// Parse a saved campaign from JSON text. Throws std::runtime_error on
// malformed input.
CampaignState deserialize_campaign_from_json(const std::string& json_text);

} // namespace gatewatch
