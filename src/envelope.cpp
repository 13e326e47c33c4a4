#include "envelope.hpp"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

json recordToJson(const Record& record) {
  json j;
  j["Fields"] = record.fields;
  j["FieldOrder"] = record.fieldOrder;
  return j;
}

json runToJson(const ExtractionRun& run) {
  if (!run.success) return errorToJson(run.error);

  json data = json::array();
  for (const auto& r : run.records) data.push_back(recordToJson(r));
  return json{{"success", true}, {"data", data}, {"error", nullptr}};
}

json descriptorToJson(const TemplateDescriptor& d) {
  return json{
    {"pattern", d.pattern},
    {"description", d.description},
    {"field_names", d.fieldNames}
  };
}

json suggestionToJson(const TemplateDescriptor& d) {
  return json{{"success", true}, {"data", descriptorToJson(d)}, {"error", nullptr}};
}

json errorToJson(const std::string& message) {
  return json{{"success", false}, {"data", nullptr}, {"error", message}};
}

std::vector<std::string> parseFieldNamesJson(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error&) {
    throw CatalogError("Error: Failed to decode field names JSON argument.");
  }
  if (!j.is_array()) {
    throw CatalogError("Error: Field names argument must be a JSON array of strings.");
  }
  std::vector<std::string> names;
  for (const auto& v : j) {
    if (!v.is_string()) {
      throw CatalogError("Error: Field names argument must be a JSON array of strings.");
    }
    names.push_back(v.get<std::string>());
  }
  return names;
}

bool parseBoolFlag(const std::string& text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower == "true";
}
