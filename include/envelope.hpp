#pragma once

#include "catalog.hpp"
#include "extractor.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// {"Fields": {...}, "FieldOrder": [...]}
nlohmann::json recordToJson(const Record& record);

// {"success": true, "data": [records]} or {"success": false, "data": null, "error": "..."}
nlohmann::json runToJson(const ExtractionRun& run);

// {"pattern": ..., "description": ..., "field_names": [...]}
nlohmann::json descriptorToJson(const TemplateDescriptor& d);

// {"success": true, "data": descriptor}
nlohmann::json suggestionToJson(const TemplateDescriptor& d);

nlohmann::json errorToJson(const std::string& message);

// Decodes a JSON array of strings, e.g. "[\"Timestamp\",\"Level\"]".
// Throws CatalogError when the text is not such an array.
std::vector<std::string> parseFieldNamesJson(const std::string& text);

// "true" in any letter case; anything else is false.
bool parseBoolFlag(const std::string& text);
