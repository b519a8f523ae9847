#pragma once

#include <string>
#include <vector>

#include "gatewatch/core/content.h"
#include "gatewatch/util/json.h"

namespace gatewatch {

// Builds a ContentDB from a parsed document. Throws std::runtime_error on
// structural problems (wrong types, unknown day-rule types).
ContentDB load_content_db_from_json(const json::Value& root);

// Loads content from a JSON file (see data/content/default_content.json).
ContentDB load_content_db_from_file(const std::string& path);

// Validate a ContentDB for internal consistency.
//
// Returns a list of human-readable error strings. An empty list means "valid".
std::vector<std::string> validate_content_db(const ContentDB& db);

} // namespace gatewatch
