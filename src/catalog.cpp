#include "catalog.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string requireString(const json& j, const char* key, const std::string& where) {
  if (!j.contains(key)) {
    throw CatalogError(where + " missing required field: " + std::string(key));
  }
  if (!j.at(key).is_string()) {
    throw CatalogError(where + "." + std::string(key) + " must be a string");
  }
  return j.at(key).get<std::string>();
}

std::vector<std::string> parseFieldNames(const json& arr, const std::string& where) {
  if (!arr.is_array()) {
    throw CatalogError(where + ".field_names must be an array");
  }
  std::vector<std::string> out;
  out.reserve(arr.size());
  for (size_t i = 0; i < arr.size(); ++i) {
    if (!arr.at(i).is_string()) {
      std::ostringstream oss;
      oss << where << ".field_names[" << i << "] must be a string";
      throw CatalogError(oss.str());
    }
    out.push_back(arr.at(i).get<std::string>());
  }
  return out;
}

TemplateDescriptor parseEntry(const json& j, const std::string& where) {
  if (!j.is_object()) {
    throw CatalogError(where + " must be an object");
  }
  TemplateDescriptor d;
  d.pattern = requireString(j, "pattern", where);
  if (j.contains("description")) d.description = requireString(j, "description", where);
  if (j.contains("field_names") && !j.at("field_names").is_null()) {
    d.fieldNames = parseFieldNames(j.at("field_names"), where);
    d.hasFieldNames = !d.fieldNames.empty();
  }
  return d;
}

} // namespace

TemplateDescriptor minimalDefaultTemplate() {
  return TemplateDescriptor{
    "{Token1} {Message}",
    "Minimal Default (File/Format Error Fallback)",
    {"Token1", "Message"},
    true
  };
}

TemplateDescriptor defaultLogTemplate() {
  return TemplateDescriptor{
    "^\\[(.*?)\\]\\s*(INFO|WARN|ERROR):\\s*(.*)$",
    "Default Pattern: Captures [Timestamp], Level (INFO|WARN|ERROR), and Message.",
    {"Timestamp", "Level", "Message"},
    true
  };
}

Catalog parseCatalogJson(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw CatalogError(std::string("catalog contains invalid JSON: ") + e.what());
  }
  if (!j.is_array()) {
    throw CatalogError("catalog must be an array of objects");
  }

  Catalog catalog;
  catalog.reserve(j.size());
  for (size_t i = 0; i < j.size(); ++i) {
    catalog.push_back(parseEntry(j.at(i), "catalog[" + std::to_string(i) + "]"));
  }
  return catalog;
}

Catalog loadCatalog(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "ERROR: pattern catalog not found at " << path << ". Using minimal default pattern.\n";
    return {minimalDefaultTemplate()};
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  try {
    Catalog catalog = parseCatalogJson(buffer.str());
    if (catalog.empty()) {
      std::cerr << "WARNING: pattern catalog " << path << " is empty. Using minimal default pattern.\n";
      return {minimalDefaultTemplate()};
    }
    return catalog;
  } catch (const CatalogError& e) {
    std::cerr << "ERROR: " << e.what() << " (" << path << "). Using minimal default pattern.\n";
    return {minimalDefaultTemplate()};
  }
}
