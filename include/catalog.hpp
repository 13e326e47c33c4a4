#pragma once

#include <stdexcept>
#include <string>
#include <vector>

class CatalogError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// One catalog entry, and the shape returned by suggestion.
struct TemplateDescriptor {
  std::string pattern;
  std::string description;
  std::vector<std::string> fieldNames;
  // False when the entry omitted field_names; they are then derived from the pattern.
  bool hasFieldNames = false;
};

using Catalog = std::vector<TemplateDescriptor>;

// "{Token1} {Message}", used whenever no usable catalog is available.
TemplateDescriptor minimalDefaultTemplate();

// Bracketed timestamp, INFO|WARN|ERROR level and message.
TemplateDescriptor defaultLogTemplate();

// Parses a JSON array of {pattern, description?, field_names?} objects.
// Throws CatalogError on malformed input.
Catalog parseCatalogJson(const std::string& text);

// Loads a catalog file. Never throws: a missing, malformed or empty catalog is
// reported on stderr and replaced by a single minimalDefaultTemplate().
Catalog loadCatalog(const std::string& path);
